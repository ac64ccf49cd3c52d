#pragma once

#include <vista/result.hpp>
#include <any>
#include <exception>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace vista {

// Every cached read belongs to exactly one group. Scoped groups carry a
// path, branch, config key or ref in CacheKey::scope.
enum class KeyGroup {
    ChangedFiles,
    StagedChanges,
    StagedChangesSinceParent,
    IsPartiallyStaged,
    UnstagedFilePatch,
    StagedFilePatch,
    AmendingFilePatch,
    Index,
    LastCommit,
    Branches,
    CurrentBranch,
    Remotes,
    AheadCount,
    BehindCount,
    Config,
    ConfigLocal,
    Commit
};

const char* key_group_name(KeyGroup g);
bool key_group_is_scoped(KeyGroup g);
const std::vector<KeyGroup>& all_key_groups();

struct CacheKey {
    KeyGroup group;
    std::string scope;

    // Stable string form, e.g. "file-patch:s:amending:a.txt"
    std::string to_string() const;

    bool operator==(const CacheKey& o) const {
        return group == o.group && scope == o.scope;
    }
    bool operator!=(const CacheKey& o) const { return !(*this == o); }
    bool operator<(const CacheKey& o) const {
        if (group != o.group) return group < o.group;
        return scope < o.scope;
    }
};

namespace keys {

CacheKey changed_files();
CacheKey staged_changes();
CacheKey staged_changes_since_parent();
CacheKey is_partially_staged(const std::string& path);
CacheKey file_patch(const std::string& path, bool staged, bool amending);
CacheKey index(const std::string& path);
CacheKey last_commit();
CacheKey branches();
CacheKey current_branch();
CacheKey remotes();
CacheKey ahead_count(const std::string& branch);
CacheKey behind_count(const std::string& branch);
CacheKey config(const std::string& key, bool local);
CacheKey commit(const std::string& ref);

} // namespace keys

// Memoizes one future per key. The first caller for a key computes the value
// on its own thread; concurrent callers share the pending future. Failed
// results, including a compute that throws, are handed to the callers that
// were waiting as VistaError but not memoized.
class Cache {
public:
    template<typename T, typename F>
    Future<T> get_or_set(const CacheKey& key, F&& compute);

    void invalidate(const std::vector<CacheKey>& keys);
    void invalidate_group(KeyGroup group);
    void clear();

    // Drop everything; later get_or_set calls fail with Destroyed
    void destroy();
    bool is_destroyed() const;

    bool contains(const CacheKey& key) const;
    size_t size() const;
    std::vector<CacheKey> keys() const;

private:
    struct Entry {
        CacheKey key;
        std::any future;        // Future<T> for the T the key was read as
        uint64_t generation;
    };

    void evict_failed(const std::string& id, uint64_t generation);

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    uint64_t next_generation_ = 0;
    bool destroyed_ = false;
};

template<typename T, typename F>
Future<T> Cache::get_or_set(const CacheKey& key, F&& compute) {
    std::string id = key.to_string();
    std::promise<Result<T>> promise;
    Future<T> future;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (destroyed_) {
            return ready_future<T>(VistaError{VistaError::Destroyed,
                "cache accessed after destroy: " + id});
        }

        auto it = entries_.find(id);
        if (it != entries_.end()) {
            return std::any_cast<Future<T>>(it->second.future);
        }

        future = promise.get_future().share();
        generation = next_generation_++;
        entries_.emplace(id, Entry{key, future, generation});
    }

    Result<T> value = VistaError{VistaError::IO, "read " + id + " did not complete"};
    try {
        value = compute();
    } catch (const std::exception& e) {
        value = VistaError{VistaError::IO, "read " + id + " threw: " + e.what()};
    }

    bool failed = value.is_err();
    promise.set_value(std::move(value));
    if (failed) evict_failed(id, generation);
    return future;
}

} // namespace vista
