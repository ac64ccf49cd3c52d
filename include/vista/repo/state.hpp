#pragma once

#include <vista/discard_history.hpp>
#include <vista/git.hpp>
#include <vista/models.hpp>
#include <vista/patch.hpp>
#include <vista/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vista {

class Repository;

struct FilePatchOptions {
    bool staged = false;
    bool amending = false;
};

struct CommitOptions {
    bool amend = false;
    bool allow_empty = false;
};

using StatusBundlePtr = std::shared_ptr<const StatusBundle>;

// The operation set every lifecycle state implements. Operations run
// synchronously on a repository work queue; the Repository facade wraps
// them in futures. Any state that leaves one of them out stays abstract.
class RepositoryState {
public:
    explicit RepositoryState(Repository& repo) : repo_(repo) {}
    virtual ~RepositoryState() = default;

    RepositoryState(const RepositoryState&) = delete;
    RepositoryState& operator=(const RepositoryState&) = delete;

    virtual const char* name() const = 0;

    virtual bool is_loading() const { return false; }
    virtual bool is_loading_guess() const { return false; }
    virtual bool is_absent() const { return false; }
    virtual bool is_absent_guess() const { return false; }
    virtual bool is_present() const { return false; }
    virtual bool is_destroyed() const { return false; }
    virtual bool is_undetermined() const { return false; }
    virtual bool is_empty() const { return false; }
    virtual bool show_tab_loading() const { return false; }
    virtual bool show_tab_init() const { return false; }

    // ---- Lifecycle (called on the caller's thread) ----

    virtual Future<std::monostate> init() = 0;
    virtual Future<std::monostate> clone(const std::string& url,
                                         const std::string& dest) = 0;

    // ---- Index and working tree ----

    virtual Status stage_files(const std::vector<std::string>& paths) = 0;
    virtual Status unstage_files(const std::vector<std::string>& paths) = 0;
    virtual Status stage_files_from_parent_commit(const std::vector<std::string>& paths) = 0;
    virtual Status apply_patch_to_index(const FilePatch& patch) = 0;
    virtual Status apply_patch_to_workdir(const FilePatch& patch) = 0;
    virtual Status write_merge_conflict_to_index(const std::string& path,
                                                 const std::string& base_sha,
                                                 const std::string& ours_sha,
                                                 const std::string& theirs_sha) = 0;
    virtual Status discard_work_dir_changes_for_paths(const std::vector<std::string>& paths) = 0;

    // ---- History ----

    virtual Status commit(const std::string& message, const CommitOptions& options) = 0;
    virtual Status merge(const std::string& ref) = 0;
    virtual Status abort_merge() = 0;
    virtual Status checkout(const std::string& revision, bool create_new) = 0;
    virtual Status checkout_paths_at_revision(const std::vector<std::string>& paths,
                                              const std::string& revision) = 0;
    virtual Status checkout_side(Side side, const std::vector<std::string>& paths) = 0;

    // ---- Remotes ----

    virtual Status fetch(const std::string& branch) = 0;
    virtual Status pull(const std::string& branch) = 0;
    virtual Status push(const std::string& branch, bool set_upstream) = 0;

    // ---- Config ----

    virtual Status set_config(const std::string& key, const std::string& value) = 0;

    // ---- Discard history ----

    virtual Result<DiscardEntry> store_before_and_after_blobs(
        const std::vector<std::string>& paths,
        const DiscardHistoryStore::SafetyCheck& is_safe,
        const DiscardHistoryStore::Mutation& mutate,
        const std::string& group_key) = 0;
    virtual Result<std::string> create_discard_history_blob() = 0;
    virtual Result<std::string> update_discard_history() = 0;
    virtual Status reload_discard_history() = 0;
    virtual Result<std::optional<DiscardEntry>> pop_discard_history(const std::string& group_key) = 0;
    virtual Status clear_discard_history(const std::string& group_key) = 0;
    virtual Result<RestoreResult> restore_last_discard(const std::string& group_key) = 0;

    // ---- Reads ----

    virtual Result<bool> is_merging() = 0;
    virtual Result<StatusBundlePtr> get_statuses_for_changed_files() = 0;
    virtual Result<std::vector<FileChange>> get_unstaged_changes() = 0;
    virtual Result<std::vector<FileChange>> get_staged_changes() = 0;
    virtual Result<std::vector<FileChange>> get_staged_changes_since_parent_commit() = 0;
    virtual Result<FilePatchPtr> get_file_patch_for_path(const std::string& path,
                                                         const FilePatchOptions& options) = 0;
    virtual Result<bool> is_partially_staged(const std::string& path) = 0;
    virtual Result<std::string> read_file_from_index(const std::string& path) = 0;
    virtual Result<Commit> get_last_commit() = 0;
    virtual Result<Commit> get_commit(const std::string& ref) = 0;
    virtual Result<std::vector<std::string>> get_branches() = 0;
    virtual Result<Branch> get_current_branch() = 0;
    virtual Result<std::vector<Remote>> get_remotes() = 0;
    virtual Result<int> get_ahead_count(const std::string& branch) = 0;
    virtual Result<int> get_behind_count(const std::string& branch) = 0;
    virtual Result<std::optional<Remote>> get_remote_for_branch(const std::string& branch) = 0;
    virtual Result<std::optional<std::string>> get_config(const std::string& key, bool local) = 0;
    virtual Result<std::vector<MergeConflict>> get_merge_conflicts() = 0;
    virtual Result<bool> path_has_merge_markers(const std::string& path) = 0;
    virtual Result<bool> has_discard_history(const std::string& group_key) = 0;
    virtual Result<std::vector<DiscardEntry>> get_discard_history(const std::string& group_key) = 0;
    virtual Result<std::optional<DiscardEntry>> get_last_history_snapshots(
        const std::string& group_key) = 0;

protected:
    Repository& repo_;
};

} // namespace vista
