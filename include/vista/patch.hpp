#pragma once

#include <vista/models.hpp>
#include <vista/result.hpp>
#include <memory>
#include <string>
#include <vector>

namespace vista {

enum class LineStatus { Added, Deleted, Unchanged, NoNewline };

const char* line_status_name(LineStatus s);

struct Line {
    LineStatus status = LineStatus::Unchanged;
    std::string text;           // without the leading origin character
    int old_line_number = -1;   // -1: no line on that side
    int new_line_number = -1;

    // '+', '-', ' ' or '\\'
    char origin() const;
    Line get_unstage_line() const;

    bool operator==(const Line& o) const {
        return status == o.status && text == o.text &&
               old_line_number == o.old_line_number &&
               new_line_number == o.new_line_number;
    }
    bool operator!=(const Line& o) const { return !(*this == o); }
};

struct Hunk {
    int old_start = 0;
    int old_line_count = 0;
    int new_start = 0;
    int new_line_count = 0;
    std::string section_heading;
    std::vector<Line> lines;

    // "@@ -1,3 +1,4 @@ heading"
    std::string header() const;
    Hunk get_unstage_hunk() const;

    bool operator==(const Hunk& o) const {
        return old_start == o.old_start && old_line_count == o.old_line_count &&
               new_start == o.new_start && new_line_count == o.new_line_count &&
               section_heading == o.section_heading && lines == o.lines;
    }
    bool operator!=(const Hunk& o) const { return !(*this == o); }
};

// One file's worth of diff. An empty path means that side does not exist
// (/dev/null): added files have no old_path, deleted files no new_path.
struct FilePatch {
    std::string old_path;
    std::string new_path;
    FileStatus status = FileStatus::Modified;
    std::vector<Hunk> hunks;

    const std::string& path() const { return new_path.empty() ? old_path : new_path; }

    // The structural inverse: applying a patch and then its unstage patch is
    // a no-op on the index.
    FilePatch get_unstage_patch() const;

    // Render in the form `git apply` consumes
    std::string to_string() const;

    bool operator==(const FilePatch& o) const {
        return old_path == o.old_path && new_path == o.new_path &&
               status == o.status && hunks == o.hunks;
    }
    bool operator!=(const FilePatch& o) const { return !(*this == o); }
};

using FilePatchPtr = std::shared_ptr<const FilePatch>;

// Parse single-file `git diff` output produced with a/ b/ prefixes.
// Empty input (no difference) yields nullptr.
Result<FilePatchPtr> parse_unified_diff(const std::string& text);

} // namespace vista
