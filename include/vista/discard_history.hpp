#pragma once

#include <vista/git.hpp>
#include <vista/result.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vista {

// One file's content before and after a discard. An empty sha means the
// file did not exist at that point.
struct DiscardSnapshot {
    std::string path;
    std::string before_sha;
    std::string after_sha;

    bool operator==(const DiscardSnapshot& o) const {
        return path == o.path && before_sha == o.before_sha && after_sha == o.after_sha;
    }
    bool operator!=(const DiscardSnapshot& o) const { return !(*this == o); }
};

// Snapshots taken by one discard, undone together
using DiscardEntry = std::vector<DiscardSnapshot>;

// Everything that gets persisted. Stacks grow at the back.
struct DiscardHistory {
    std::vector<DiscardEntry> whole_file;
    std::map<std::string, std::vector<DiscardEntry>> partial;   // by group key

    bool empty() const;
    bool operator==(const DiscardHistory& o) const {
        return whole_file == o.whole_file && partial == o.partial;
    }
};

// Versioned binary form; partial stacks are written in key order so equal
// histories always produce equal bytes.
std::string serialize_discard_history(const DiscardHistory& history);
Result<DiscardHistory> deserialize_discard_history(const std::string& bytes);

// Content-addressed storage the history is kept in
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Result<std::string> write_blob(const std::string& content) = 0;
    // Store a working-tree file as a blob; empty id when the file is missing
    virtual Result<std::string> store_file(const std::string& path) = 0;
    // MissingObject when the id does not resolve
    virtual Result<std::string> read_blob(const std::string& sha) = 0;

    // Working tree access, paths relative to the working directory
    virtual Result<std::optional<std::string>> read_file(const std::string& path) = 0;
    virtual Status write_file(const std::string& path, const std::string& content) = 0;
    virtual Status remove_file(const std::string& path) = 0;

    virtual Result<MergeFileResult> merge_text(const std::string& ours,
                                               const std::string& base,
                                               const std::string& theirs) = 0;

    virtual Result<std::optional<std::string>> read_metadata(const std::string& key) = 0;
    virtual Status write_metadata(const std::string& key, const std::string& value) = 0;
};

// ObjectStore over the git object database and repository-local config
class GitObjectStore : public ObjectStore {
public:
    explicit GitObjectStore(GitShellOut& git) : git_(git) {}

    Result<std::string> write_blob(const std::string& content) override;
    Result<std::string> store_file(const std::string& path) override;
    Result<std::string> read_blob(const std::string& sha) override;
    Result<std::optional<std::string>> read_file(const std::string& path) override;
    Status write_file(const std::string& path, const std::string& content) override;
    Status remove_file(const std::string& path) override;
    Result<MergeFileResult> merge_text(const std::string& ours,
                                       const std::string& base,
                                       const std::string& theirs) override;
    Result<std::optional<std::string>> read_metadata(const std::string& key) override;
    Status write_metadata(const std::string& key, const std::string& value) override;

private:
    GitShellOut& git_;
};

struct RestoreResult {
    std::vector<std::string> restored;      // written back cleanly
    std::vector<std::string> conflicted;    // merged with conflict markers
};

// LIFO history of discarded working-tree changes. An empty group key
// addresses the whole-file stack; any other key its own partial stack.
class DiscardHistoryStore {
public:
    using SafetyCheck = std::function<bool(const std::string&)>;
    using Mutation = std::function<Status()>;

    DiscardHistoryStore(ObjectStore& store,
                        std::string metadata_key = "vista.historySha",
                        size_t max_length = 60);

    // Read the history the metadata key points at. A missing key, an
    // unresolvable blob or a corrupt payload leave the history empty.
    void load();

    // Snapshot the safe paths, run mutate once, snapshot again and push one
    // entry. Returns the recorded snapshots; empty when no path was safe, in
    // which case mutate is not run.
    Result<DiscardEntry> store_before_and_after_blobs(
        const std::vector<std::string>& paths, const SafetyCheck& is_safe,
        const Mutation& mutate, const std::string& group_key = "");

    // Write the serialized history as one blob, returning its id
    Result<std::string> create_history_blob();
    // create_history_blob() and point the metadata key at it
    Result<std::string> persist();

    bool has_history(const std::string& group_key = "") const;
    std::vector<DiscardEntry> get_history(const std::string& group_key = "") const;
    std::optional<DiscardEntry> get_last_snapshots(const std::string& group_key = "") const;
    std::optional<DiscardEntry> pop(const std::string& group_key = "");
    void clear(const std::string& group_key = "");

    // Undo the newest entry: write "before" back where the file still
    // matches "after", otherwise merge current/after/before. Pops the entry.
    Result<RestoreResult> restore_last(const std::string& group_key = "");

    DiscardHistory snapshot() const;
    // Forget everything held in memory; the persisted blob is untouched
    void release();
    const std::string& metadata_key() const { return metadata_key_; }
    size_t max_length() const { return max_length_; }

private:
    // Blob id per path, empty for missing files
    Result<std::vector<std::string>> store_files(const std::vector<std::string>& paths);
    Result<std::optional<std::string>> read_optional_blob(const std::string& sha);

    ObjectStore& store_;
    std::string metadata_key_;
    size_t max_length_;

    mutable std::mutex mutex_;
    DiscardHistory history_;
};

} // namespace vista
