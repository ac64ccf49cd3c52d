#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vista {

enum class FileStatus {
    Added,
    Modified,
    Deleted,
    Renamed,
    Typechange,
    Equivalent
};

const char* file_status_name(FileStatus s);

// Map a single git status letter (A, M, D, R, T, U) to a FileStatus.
// Unmerged (U) reads as modified.
std::optional<FileStatus> file_status_from_code(char code);

struct FileChange {
    std::string file_path;
    FileStatus status;

    bool operator==(const FileChange& o) const {
        return file_path == o.file_path && status == o.status;
    }
    bool operator!=(const FileChange& o) const { return !(*this == o); }
};

// One row of `git ls-files -u`: stage 1 = base, 2 = ours, 3 = theirs
struct IndexStageEntry {
    std::string path;
    std::string mode;
    std::string sha;
    int stage = 0;
};

struct ConflictStatus {
    FileStatus file;
    FileStatus ours;
    FileStatus theirs;

    bool operator==(const ConflictStatus& o) const {
        return file == o.file && ours == o.ours && theirs == o.theirs;
    }
};

struct MergeConflict {
    std::string file_path;
    ConflictStatus status;

    bool operator==(const MergeConflict& o) const {
        return file_path == o.file_path && status == o.status;
    }
};

// Whole-tree status snapshot, cached under `changed-files`
struct StatusBundle {
    std::map<std::string, FileStatus> staged_files;
    std::map<std::string, FileStatus> unstaged_files;   // untracked read as added
    std::map<std::string, ConflictStatus> merge_conflict_files;

    bool operator==(const StatusBundle& o) const {
        return staged_files == o.staged_files &&
               unstaged_files == o.unstaged_files &&
               merge_conflict_files == o.merge_conflict_files;
    }
};

struct Commit {
    std::string sha;        // empty for an unborn HEAD
    std::string message;

    bool is_present() const { return !sha.empty(); }
    bool operator==(const Commit& o) const {
        return sha == o.sha && message == o.message;
    }
    bool operator!=(const Commit& o) const { return !(*this == o); }
};

struct Branch {
    std::string name;       // short sha when detached
    bool detached = false;

    bool operator==(const Branch& o) const {
        return name == o.name && detached == o.detached;
    }
};

struct Remote {
    std::string name;
    std::string url;

    bool operator==(const Remote& o) const {
        return name == o.name && url == o.url;
    }
};

// Flatten a path -> status map into sorted FileChange rows
std::vector<FileChange> to_file_changes(const std::map<std::string, FileStatus>& files);

} // namespace vista
