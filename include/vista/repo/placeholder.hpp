#pragma once

#include <vista/repo/state.hpp>

namespace vista {

// Shared behavior of the states with no repository to talk to: reads
// answer with empty values, mutations fail with NotReady.
class Placeholder : public RepositoryState {
public:
    using RepositoryState::RepositoryState;

    Future<std::monostate> init() override;
    Future<std::monostate> clone(const std::string& url,
                                 const std::string& dest) override;

    // ---- Index and working tree ----

    Status stage_files(const std::vector<std::string>& paths) override;
    Status unstage_files(const std::vector<std::string>& paths) override;
    Status stage_files_from_parent_commit(const std::vector<std::string>& paths) override;
    Status apply_patch_to_index(const FilePatch& patch) override;
    Status apply_patch_to_workdir(const FilePatch& patch) override;
    Status write_merge_conflict_to_index(const std::string& path,
                                         const std::string& base_sha,
                                         const std::string& ours_sha,
                                         const std::string& theirs_sha) override;
    Status discard_work_dir_changes_for_paths(const std::vector<std::string>& paths) override;

    // ---- History ----

    Status commit(const std::string& message, const CommitOptions& options) override;
    Status merge(const std::string& ref) override;
    Status abort_merge() override;
    Status checkout(const std::string& revision, bool create_new) override;
    Status checkout_paths_at_revision(const std::vector<std::string>& paths,
                                      const std::string& revision) override;
    Status checkout_side(Side side, const std::vector<std::string>& paths) override;

    // ---- Remotes ----

    Status fetch(const std::string& branch) override;
    Status pull(const std::string& branch) override;
    Status push(const std::string& branch, bool set_upstream) override;

    // ---- Config ----

    Status set_config(const std::string& key, const std::string& value) override;

    // ---- Discard history ----

    Result<DiscardEntry> store_before_and_after_blobs(
        const std::vector<std::string>& paths,
        const DiscardHistoryStore::SafetyCheck& is_safe,
        const DiscardHistoryStore::Mutation& mutate,
        const std::string& group_key) override;
    Result<std::string> create_discard_history_blob() override;
    Result<std::string> update_discard_history() override;
    Status reload_discard_history() override;
    Result<std::optional<DiscardEntry>> pop_discard_history(const std::string& group_key) override;
    Status clear_discard_history(const std::string& group_key) override;
    Result<RestoreResult> restore_last_discard(const std::string& group_key) override;

    // ---- Reads ----

    Result<bool> is_merging() override;
    Result<StatusBundlePtr> get_statuses_for_changed_files() override;
    Result<std::vector<FileChange>> get_unstaged_changes() override;
    Result<std::vector<FileChange>> get_staged_changes() override;
    Result<std::vector<FileChange>> get_staged_changes_since_parent_commit() override;
    Result<FilePatchPtr> get_file_patch_for_path(const std::string& path,
                                                 const FilePatchOptions& options) override;
    Result<bool> is_partially_staged(const std::string& path) override;
    Result<std::string> read_file_from_index(const std::string& path) override;
    Result<Commit> get_last_commit() override;
    Result<Commit> get_commit(const std::string& ref) override;
    Result<std::vector<std::string>> get_branches() override;
    Result<Branch> get_current_branch() override;
    Result<std::vector<Remote>> get_remotes() override;
    Result<int> get_ahead_count(const std::string& branch) override;
    Result<int> get_behind_count(const std::string& branch) override;
    Result<std::optional<Remote>> get_remote_for_branch(const std::string& branch) override;
    Result<std::optional<std::string>> get_config(const std::string& key, bool local) override;
    Result<std::vector<MergeConflict>> get_merge_conflicts() override;
    Result<bool> path_has_merge_markers(const std::string& path) override;
    Result<bool> has_discard_history(const std::string& group_key) override;
    Result<std::vector<DiscardEntry>> get_discard_history(const std::string& group_key) override;
    Result<std::optional<DiscardEntry>> get_last_history_snapshots(
        const std::string& group_key) override;

protected:
    Status not_ready(const char* operation) const;
};

// No repository at the working directory (or no working directory at all).
// init() and clone() leave it for Loading.
class Absent : public Placeholder {
public:
    using Placeholder::Placeholder;

    const char* name() const override { return "Absent"; }
    bool is_absent() const override { return true; }
    bool is_empty() const override { return true; }
    bool show_tab_init() const override { return true; }

    Future<std::monostate> init() override;
    Future<std::monostate> clone(const std::string& url,
                                 const std::string& dest) override;
};

// Probably no repository; nothing has been checked yet
class AbsentGuess : public Placeholder {
public:
    using Placeholder::Placeholder;

    const char* name() const override { return "AbsentGuess"; }
    bool is_absent_guess() const override { return true; }
    bool is_empty() const override { return true; }
    bool is_undetermined() const override { return true; }
    bool show_tab_init() const override { return true; }
};

// Probably a repository, but no path to load it from yet
class LoadingGuess : public Placeholder {
public:
    using Placeholder::Placeholder;

    const char* name() const override { return "LoadingGuess"; }
    bool is_loading_guess() const override { return true; }
    bool is_undetermined() const override { return true; }
    bool show_tab_loading() const override { return true; }
};

} // namespace vista
