#include <vista/merge_conflict.hpp>

#include <cctype>

namespace vista {

static FileStatus classify_side(bool has_base, bool has_side) {
    if (!has_side) return FileStatus::Deleted;
    if (!has_base) return FileStatus::Added;
    return FileStatus::Modified;
}

ConflictStatus classify_conflict(const ConflictInput& input) {
    ConflictStatus status;
    status.ours = classify_side(input.has_base, input.has_ours);
    status.theirs = classify_side(input.has_base, input.has_theirs);

    if (!input.worktree_sha) {
        status.file = FileStatus::Deleted;
    } else if (!input.head_sha) {
        status.file = FileStatus::Added;
    } else if (*input.worktree_sha == *input.head_sha) {
        status.file = FileStatus::Equivalent;
    } else {
        status.file = FileStatus::Modified;
    }
    return status;
}

std::map<std::string, ConflictInput> group_unmerged_entries(
        const std::vector<IndexStageEntry>& entries) {
    std::map<std::string, ConflictInput> grouped;
    for (const auto& e : entries) {
        auto& input = grouped[e.path];
        switch (e.stage) {
            case 1: input.has_base = true; break;
            case 2: input.has_ours = true; break;
            case 3: input.has_theirs = true; break;
            default: break;
        }
    }
    return grouped;
}

bool is_merge_marker_line(const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (line.size() < 7) return false;
    char c = line[0];
    if (c != '<' && c != '>') return false;
    for (size_t i = 1; i < 7; ++i) {
        if (line[i] != c) return false;
    }

    if (line.size() == 7) return true;

    // " <label>"
    if (line[7] != ' ' || line.size() == 8) return false;
    for (size_t i = 8; i < line.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(line[i]))) return false;
    }
    return true;
}

bool has_merge_markers(const std::string& content) {
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = nl == std::string::npos ? content.size() : nl;
        if (is_merge_marker_line(content.substr(start, end - start))) return true;
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return false;
}

} // namespace vista
