#include <vista/models.hpp>

namespace vista {

const char* file_status_name(FileStatus s) {
    switch (s) {
        case FileStatus::Added:      return "added";
        case FileStatus::Modified:   return "modified";
        case FileStatus::Deleted:    return "deleted";
        case FileStatus::Renamed:    return "renamed";
        case FileStatus::Typechange: return "typechange";
        case FileStatus::Equivalent: return "equivalent";
    }
    return "unknown";
}

std::optional<FileStatus> file_status_from_code(char code) {
    switch (code) {
        case 'A': return FileStatus::Added;
        case 'M': return FileStatus::Modified;
        case 'U': return FileStatus::Modified;
        case 'D': return FileStatus::Deleted;
        case 'R': return FileStatus::Renamed;
        case 'T': return FileStatus::Typechange;
        default:  return std::nullopt;
    }
}

std::vector<FileChange> to_file_changes(const std::map<std::string, FileStatus>& files) {
    std::vector<FileChange> out;
    out.reserve(files.size());
    for (const auto& [path, status] : files) {
        out.push_back(FileChange{path, status});
    }
    return out;
}

} // namespace vista
