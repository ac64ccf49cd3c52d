#include <vista/cache.hpp>

namespace vista {

const char* key_group_name(KeyGroup g) {
    switch (g) {
        case KeyGroup::ChangedFiles:             return "changed-files";
        case KeyGroup::StagedChanges:            return "staged-changes";
        case KeyGroup::StagedChangesSinceParent: return "staged-changes-since-parent";
        case KeyGroup::IsPartiallyStaged:        return "is-partially-staged";
        case KeyGroup::UnstagedFilePatch:        return "file-patch:u";
        case KeyGroup::StagedFilePatch:          return "file-patch:s";
        case KeyGroup::AmendingFilePatch:        return "file-patch:s:amending";
        case KeyGroup::Index:                    return "index";
        case KeyGroup::LastCommit:               return "last-commit";
        case KeyGroup::Branches:                 return "branches";
        case KeyGroup::CurrentBranch:            return "current-branch";
        case KeyGroup::Remotes:                  return "remotes";
        case KeyGroup::AheadCount:               return "ahead-count";
        case KeyGroup::BehindCount:              return "behind-count";
        case KeyGroup::Config:                   return "config";
        case KeyGroup::ConfigLocal:              return "config";
        case KeyGroup::Commit:                   return "commit";
    }
    return "unknown";
}

bool key_group_is_scoped(KeyGroup g) {
    switch (g) {
        case KeyGroup::IsPartiallyStaged:
        case KeyGroup::UnstagedFilePatch:
        case KeyGroup::StagedFilePatch:
        case KeyGroup::AmendingFilePatch:
        case KeyGroup::Index:
        case KeyGroup::AheadCount:
        case KeyGroup::BehindCount:
        case KeyGroup::Config:
        case KeyGroup::ConfigLocal:
        case KeyGroup::Commit:
            return true;
        default:
            return false;
    }
}

const std::vector<KeyGroup>& all_key_groups() {
    static const std::vector<KeyGroup> groups = {
        KeyGroup::ChangedFiles, KeyGroup::StagedChanges,
        KeyGroup::StagedChangesSinceParent, KeyGroup::IsPartiallyStaged,
        KeyGroup::UnstagedFilePatch, KeyGroup::StagedFilePatch,
        KeyGroup::AmendingFilePatch, KeyGroup::Index, KeyGroup::LastCommit,
        KeyGroup::Branches, KeyGroup::CurrentBranch, KeyGroup::Remotes,
        KeyGroup::AheadCount, KeyGroup::BehindCount, KeyGroup::Config,
        KeyGroup::ConfigLocal, KeyGroup::Commit,
    };
    return groups;
}

std::string CacheKey::to_string() const {
    std::string s = key_group_name(group);
    if (!key_group_is_scoped(group)) return s;
    s += ':';
    s += scope;
    if (group == KeyGroup::ConfigLocal) s += ":local";
    return s;
}

namespace keys {

CacheKey changed_files() { return {KeyGroup::ChangedFiles, ""}; }
CacheKey staged_changes() { return {KeyGroup::StagedChanges, ""}; }
CacheKey staged_changes_since_parent() { return {KeyGroup::StagedChangesSinceParent, ""}; }
CacheKey is_partially_staged(const std::string& path) {
    return {KeyGroup::IsPartiallyStaged, path};
}

CacheKey file_patch(const std::string& path, bool staged, bool amending) {
    if (!staged) return {KeyGroup::UnstagedFilePatch, path};
    return {amending ? KeyGroup::AmendingFilePatch : KeyGroup::StagedFilePatch, path};
}

CacheKey index(const std::string& path) { return {KeyGroup::Index, path}; }
CacheKey last_commit() { return {KeyGroup::LastCommit, ""}; }
CacheKey branches() { return {KeyGroup::Branches, ""}; }
CacheKey current_branch() { return {KeyGroup::CurrentBranch, ""}; }
CacheKey remotes() { return {KeyGroup::Remotes, ""}; }
CacheKey ahead_count(const std::string& branch) { return {KeyGroup::AheadCount, branch}; }
CacheKey behind_count(const std::string& branch) { return {KeyGroup::BehindCount, branch}; }

CacheKey config(const std::string& key, bool local) {
    return {local ? KeyGroup::ConfigLocal : KeyGroup::Config, key};
}

CacheKey commit(const std::string& ref) { return {KeyGroup::Commit, ref}; }

} // namespace keys

void Cache::invalidate(const std::vector<CacheKey>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : keys) {
        entries_.erase(key.to_string());
    }
}

void Cache::invalidate_group(KeyGroup group) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.key.group == group) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void Cache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void Cache::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    destroyed_ = true;
}

bool Cache::is_destroyed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
}

bool Cache::contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key.to_string()) > 0;
}

size_t Cache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<CacheKey> Cache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CacheKey> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry.key);
    }
    return out;
}

void Cache::evict_failed(const std::string& id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    // A newer entry may have replaced ours after an invalidation
    if (it != entries_.end() && it->second.generation == generation) {
        entries_.erase(it);
    }
}

} // namespace vista
