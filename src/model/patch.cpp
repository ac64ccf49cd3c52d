#include <vista/patch.hpp>

#include <cstdlib>

namespace vista {

const char* line_status_name(LineStatus s) {
    switch (s) {
        case LineStatus::Added:     return "added";
        case LineStatus::Deleted:   return "deleted";
        case LineStatus::Unchanged: return "unchanged";
        case LineStatus::NoNewline: return "nonewline";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Line / Hunk / FilePatch
// ---------------------------------------------------------------------------

char Line::origin() const {
    switch (status) {
        case LineStatus::Added:     return '+';
        case LineStatus::Deleted:   return '-';
        case LineStatus::Unchanged: return ' ';
        case LineStatus::NoNewline: return '\\';
    }
    return ' ';
}

Line Line::get_unstage_line() const {
    Line inverted = *this;
    if (status == LineStatus::Added) inverted.status = LineStatus::Deleted;
    else if (status == LineStatus::Deleted) inverted.status = LineStatus::Added;
    inverted.old_line_number = new_line_number;
    inverted.new_line_number = old_line_number;
    return inverted;
}

std::string Hunk::header() const {
    std::string h = "@@ -" + std::to_string(old_start) + "," +
                    std::to_string(old_line_count) + " +" +
                    std::to_string(new_start) + "," +
                    std::to_string(new_line_count) + " @@";
    if (!section_heading.empty()) h += " " + section_heading;
    return h;
}

Hunk Hunk::get_unstage_hunk() const {
    Hunk inverted;
    inverted.old_start = new_start;
    inverted.old_line_count = new_line_count;
    inverted.new_start = old_start;
    inverted.new_line_count = old_line_count;
    inverted.section_heading = section_heading;
    inverted.lines.reserve(lines.size());
    for (const auto& line : lines) {
        inverted.lines.push_back(line.get_unstage_line());
    }
    return inverted;
}

FilePatch FilePatch::get_unstage_patch() const {
    FilePatch inverted;
    inverted.old_path = new_path;
    inverted.new_path = old_path;

    switch (status) {
        case FileStatus::Added:   inverted.status = FileStatus::Deleted; break;
        case FileStatus::Deleted: inverted.status = FileStatus::Added; break;
        default:                  inverted.status = status; break;
    }

    inverted.hunks.reserve(hunks.size());
    for (const auto& hunk : hunks) {
        inverted.hunks.push_back(hunk.get_unstage_hunk());
    }
    return inverted;
}

std::string FilePatch::to_string() const {
    std::string out;
    out += "--- " + (old_path.empty() ? std::string("/dev/null") : "a/" + old_path) + "\n";
    out += "+++ " + (new_path.empty() ? std::string("/dev/null") : "b/" + new_path) + "\n";
    for (const auto& hunk : hunks) {
        out += hunk.header();
        out += '\n';
        for (const auto& line : hunk.lines) {
            out += line.origin();
            out += line.text;
            out += '\n';
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

static std::vector<std::string> split_diff_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// "a/path" -> "path"; "/dev/null" -> ""
static std::string strip_side(std::string path, char side) {
    if (!path.empty() && path.back() == '\t') path.pop_back();
    if (path == "/dev/null") return "";
    if (path.size() >= 2 && path[0] == side && path[1] == '/') return path.substr(2);
    return path;
}

// "12,3" or "12" (count defaults to 1)
static bool parse_range(const std::string& s, int& start, int& count) {
    if (s.empty()) return false;
    char* end = nullptr;
    start = static_cast<int>(std::strtol(s.c_str(), &end, 10));
    if (end == s.c_str()) return false;
    if (*end == '\0') {
        count = 1;
        return true;
    }
    if (*end != ',') return false;
    const char* count_begin = end + 1;
    count = static_cast<int>(std::strtol(count_begin, &end, 10));
    return end != count_begin && *end == '\0';
}

static Result<Hunk> parse_hunk_header(const std::string& line) {
    // @@ -<old> +<new> @@[ heading]
    auto fail = [&]() {
        return VistaError{VistaError::Parse, "malformed hunk header: " + line};
    };

    if (!starts_with(line, "@@ -")) return fail();
    size_t plus = line.find(" +", 4);
    if (plus == std::string::npos) return fail();
    size_t close = line.find(" @@", plus + 2);
    if (close == std::string::npos) return fail();

    Hunk hunk;
    if (!parse_range(line.substr(4, plus - 4), hunk.old_start, hunk.old_line_count) ||
        !parse_range(line.substr(plus + 2, close - plus - 2),
                     hunk.new_start, hunk.new_line_count)) {
        return fail();
    }

    std::string rest = line.substr(close + 3);
    if (!rest.empty() && rest[0] == ' ') rest.erase(0, 1);
    hunk.section_heading = rest;
    return Result<Hunk>::ok(std::move(hunk));
}

Result<FilePatchPtr> parse_unified_diff(const std::string& text) {
    if (text.empty()) return Result<FilePatchPtr>::ok(nullptr);

    auto patch = std::make_shared<FilePatch>();
    std::string header_old, header_new;
    bool saw_old = false, saw_new = false, saw_header = false;
    bool new_file = false, deleted_file = false;

    Hunk* hunk = nullptr;
    int old_line = 0, new_line = 0;

    for (const auto& line : split_diff_lines(text)) {
        if (hunk && !starts_with(line, "@@") && !starts_with(line, "diff --git ")) {
            Line l;
            char origin = line.empty() ? ' ' : line[0];
            l.text = line.empty() ? "" : line.substr(1);
            switch (origin) {
                case '+':
                    l.status = LineStatus::Added;
                    l.new_line_number = new_line++;
                    break;
                case '-':
                    l.status = LineStatus::Deleted;
                    l.old_line_number = old_line++;
                    break;
                case ' ':
                    l.status = LineStatus::Unchanged;
                    l.old_line_number = old_line++;
                    l.new_line_number = new_line++;
                    break;
                case '\\':
                    l.status = LineStatus::NoNewline;
                    break;
                default:
                    return VistaError{VistaError::Parse, "unexpected diff line: " + line};
            }
            hunk->lines.push_back(std::move(l));
            continue;
        }

        if (starts_with(line, "diff --git ")) {
            if (saw_header) {
                return VistaError{VistaError::Parse,
                    "expected a single-file diff, found a second file header"};
            }
            saw_header = true;
            // diff --git a/<old> b/<new>
            std::string rest = line.substr(11);
            size_t split = rest.find(" b/");
            if (starts_with(rest, "a/") && split != std::string::npos) {
                header_old = rest.substr(2, split - 2);
                header_new = rest.substr(split + 3);
            }
        } else if (starts_with(line, "new file mode")) {
            new_file = true;
        } else if (starts_with(line, "deleted file mode")) {
            deleted_file = true;
        } else if (starts_with(line, "--- ")) {
            patch->old_path = strip_side(line.substr(4), 'a');
            saw_old = true;
        } else if (starts_with(line, "+++ ")) {
            patch->new_path = strip_side(line.substr(4), 'b');
            saw_new = true;
        } else if (starts_with(line, "@@")) {
            auto parsed = parse_hunk_header(line);
            if (parsed.is_err()) return std::move(parsed).error();
            patch->hunks.push_back(std::move(parsed).value());
            hunk = &patch->hunks.back();
            old_line = hunk->old_start;
            new_line = hunk->new_start;
        }
        // index, mode and similarity lines carry nothing we model
    }

    // Binary and mode-only diffs have no ---/+++ lines
    if (!saw_old) patch->old_path = new_file ? "" : header_old;
    if (!saw_new) patch->new_path = deleted_file ? "" : header_new;

    if (patch->old_path.empty() && patch->new_path.empty()) {
        return VistaError{VistaError::Parse, "diff names no file"};
    }

    if (new_file || patch->old_path.empty()) {
        patch->status = FileStatus::Added;
    } else if (deleted_file || patch->new_path.empty()) {
        patch->status = FileStatus::Deleted;
    } else if (patch->old_path != patch->new_path) {
        patch->status = FileStatus::Renamed;
    } else {
        patch->status = FileStatus::Modified;
    }

    return Result<FilePatchPtr>::ok(std::move(patch));
}

} // namespace vista
