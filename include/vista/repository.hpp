#pragma once

#include <vista/cache.hpp>
#include <vista/config.hpp>
#include <vista/discard_history.hpp>
#include <vista/git.hpp>
#include <vista/repo/state.hpp>
#include <vista/work_queue.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vista {

// A live, cached view of one working directory.
//
// Every operation is routed to the current lifecycle state. Mutations run
// one at a time on a serial queue and invalidate the cache before their
// future resolves; reads run concurrently on a small pool. Loading runs on
// a loader thread of its own.
class Repository {
public:
    using StateCallback = std::function<void(const std::string& from, const std::string& to)>;

    // Starts in Loading; the repository at working_dir is detected in the
    // background
    explicit Repository(std::string working_dir, Settings settings = Settings());
    ~Repository();

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    // Settings from ~/.vista/config.toml and <working_dir>/.vista.toml
    static Result<std::unique_ptr<Repository>> open(const std::string& working_dir);

    // Path-less placeholders
    static std::unique_ptr<Repository> absent(Settings settings = Settings());
    static std::unique_ptr<Repository> absent_guess(Settings settings = Settings());
    static std::unique_ptr<Repository> loading_guess(Settings settings = Settings());

    // ---- Lifecycle ----

    Future<std::monostate> init();
    // Clone into dest, or into the working directory when dest is empty
    Future<std::monostate> clone(const std::string& url, const std::string& dest = "");
    void destroy();
    // Resolves when the repository leaves Loading
    std::shared_future<void> get_load_promise() const;

    bool is_in_state(const std::string& name) const;
    std::string state_name() const;
    bool is_loading() const;
    bool is_loading_guess() const;
    bool is_absent() const;
    bool is_absent_guess() const;
    bool is_present() const;
    bool is_destroyed() const;
    bool is_empty() const;
    bool is_undetermined() const;
    bool show_tab_loading() const;
    bool show_tab_init() const;
    std::string working_directory() const;

    // Called with the old and new state names after every transition.
    // Returns an id for off_did_change_state.
    size_t on_did_change_state(StateCallback callback);
    void off_did_change_state(size_t id);

    // Drop every cached value
    void refresh();

    // ---- Index and working tree ----

    Future<std::monostate> stage_files(const std::vector<std::string>& paths);
    Future<std::monostate> unstage_files(const std::vector<std::string>& paths);
    Future<std::monostate> stage_files_from_parent_commit(const std::vector<std::string>& paths);
    Future<std::monostate> apply_patch_to_index(const FilePatch& patch);
    Future<std::monostate> apply_patch_to_workdir(const FilePatch& patch);
    Future<std::monostate> write_merge_conflict_to_index(const std::string& path,
                                                         const std::string& base_sha,
                                                         const std::string& ours_sha,
                                                         const std::string& theirs_sha);
    Future<std::monostate> discard_work_dir_changes_for_paths(const std::vector<std::string>& paths);

    // ---- History ----

    Future<std::monostate> commit(const std::string& message,
                                  const CommitOptions& options = CommitOptions());
    Future<std::monostate> merge(const std::string& ref);
    Future<std::monostate> abort_merge();
    Future<std::monostate> checkout(const std::string& revision, bool create_new = false);
    Future<std::monostate> checkout_paths_at_revision(const std::vector<std::string>& paths,
                                                      const std::string& revision = "HEAD");
    Future<std::monostate> checkout_side(Side side, const std::vector<std::string>& paths);

    // ---- Remotes ----

    Future<std::monostate> fetch(const std::string& branch);
    Future<std::monostate> pull(const std::string& branch);
    Future<std::monostate> push(const std::string& branch, bool set_upstream = false);

    // ---- Config ----

    Future<std::optional<std::string>> get_config(const std::string& key, bool local = false);
    Future<std::monostate> set_config(const std::string& key, const std::string& value);

    // ---- Discard history ----

    // mutate runs on the mutation queue; repository mutations it calls run
    // inline
    Future<DiscardEntry> store_before_and_after_blobs(
        const std::vector<std::string>& paths,
        DiscardHistoryStore::SafetyCheck is_safe,
        DiscardHistoryStore::Mutation mutate,
        const std::string& group_key = "");
    Future<std::string> create_discard_history_blob();
    // Persist the history and record its blob id in the config
    Future<std::string> update_discard_history();
    Future<std::monostate> reload_discard_history();
    Future<bool> has_discard_history(const std::string& group_key = "");
    Future<std::vector<DiscardEntry>> get_discard_history(const std::string& group_key = "");
    Future<std::optional<DiscardEntry>> get_last_history_snapshots(const std::string& group_key = "");
    Future<std::optional<DiscardEntry>> pop_discard_history(const std::string& group_key = "");
    Future<std::monostate> clear_discard_history(const std::string& group_key = "");
    Future<RestoreResult> restore_last_discard(const std::string& group_key = "");

    // ---- Reads ----

    Future<bool> is_merging();
    Future<StatusBundlePtr> get_statuses_for_changed_files();
    Future<std::vector<FileChange>> get_unstaged_changes();
    Future<std::vector<FileChange>> get_staged_changes();
    Future<std::vector<FileChange>> get_staged_changes_since_parent_commit();
    Future<FilePatchPtr> get_file_patch_for_path(const std::string& path,
                                                 const FilePatchOptions& options = FilePatchOptions());
    Future<bool> is_partially_staged(const std::string& path);
    Future<std::string> read_file_from_index(const std::string& path);
    Future<Commit> get_last_commit();
    Future<Commit> get_commit(const std::string& ref);
    Future<std::vector<std::string>> get_branches();
    Future<Branch> get_current_branch();
    Future<std::vector<Remote>> get_remotes();
    Future<int> get_ahead_count(const std::string& branch);
    Future<int> get_behind_count(const std::string& branch);
    Future<std::optional<Remote>> get_remote_for_branch(const std::string& branch);
    Future<std::vector<MergeConflict>> get_merge_conflicts();
    Future<bool> path_has_merge_markers(const std::string& path);

    // Direct access for tests and tooling
    Cache& cache() { return cache_; }
    GitShellOut& git() { return *git_; }
    const Settings& settings() const { return settings_; }

private:
    friend class Present;
    friend class Loading;
    friend class Placeholder;
    friend class Absent;
    friend class Destroyed;

    enum class Initial { Absent, AbsentGuess, LoadingGuess };
    Repository(Initial initial, Settings settings);

    void setup(const std::string& working_dir);

    std::shared_ptr<RepositoryState> current_state() const;
    void transition(std::shared_ptr<RepositoryState> next);
    // Transition only if `expected` is still the current state
    bool transition_from(const RepositoryState* expected,
                         std::shared_ptr<RepositoryState> next);

    // Enter Loading, run prelude (git init / clone) then detect the
    // repository, all on the loader thread
    Future<std::monostate> begin_load(std::function<Status()> prelude);
    Status finish_load(const RepositoryState* loading);
    void wait_for_load() const;
    void set_working_directory(const std::string& dir);
    std::string git_dir() const;

    DiscardHistoryStore& history() { return *history_; }

    template<typename T, typename F>
    Future<T> mutation(F&& f);
    template<typename T, typename F>
    Future<T> read(F&& f);

    Settings settings_;
    std::unique_ptr<GitShellOut> git_;
    std::unique_ptr<GitObjectStore> object_store_;
    std::unique_ptr<DiscardHistoryStore> history_;
    Cache cache_;
    std::unique_ptr<WorkQueue> mutations_;
    std::unique_ptr<WorkQueue> reads_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<RepositoryState> state_;
    std::string working_dir_;
    std::string git_dir_;
    std::shared_ptr<std::promise<void>> load_promise_;
    std::shared_future<void> load_future_;
    bool load_resolved_ = true;

    std::mutex loader_mutex_;
    std::thread loader_;

    std::mutex callbacks_mutex_;
    std::map<size_t, StateCallback> callbacks_;
    size_t next_callback_id_ = 0;
};

template<typename T, typename F>
Future<T> Repository::mutation(F&& f) {
    return mutations_->submit(
        [this, f = std::forward<F>(f)]() -> Result<T> { return f(*current_state()); });
}

template<typename T, typename F>
Future<T> Repository::read(F&& f) {
    return reads_->submit(
        [this, f = std::forward<F>(f)]() -> Result<T> { return f(*current_state()); });
}

} // namespace vista
