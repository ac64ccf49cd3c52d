#pragma once

#include <vista/models.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vista {

// What is known about one unmerged path
struct ConflictInput {
    bool has_base = false;      // stage 1
    bool has_ours = false;      // stage 2
    bool has_theirs = false;    // stage 3
    std::optional<std::string> head_sha;        // blob at HEAD, if any
    std::optional<std::string> worktree_sha;    // working file's blob id, if present
};

// ours/theirs relative to the merge base; file is the working tree
// relative to HEAD
ConflictStatus classify_conflict(const ConflictInput& input);

// Collapse `git ls-files -u` rows into stage presence per path. Blob shas are
// left for the caller to fill in.
std::map<std::string, ConflictInput> group_unmerged_entries(
    const std::vector<IndexStageEntry>& entries);

// A conflict marker line: exactly seven '<' or '>' at column 0, optionally
// followed by one space and a label without whitespace.
bool is_merge_marker_line(const std::string& line);

bool has_merge_markers(const std::string& content);

} // namespace vista
