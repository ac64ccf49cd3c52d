#include <vista/repository.hpp>
#include <vista/repo/destroyed.hpp>
#include <vista/repo/loading.hpp>
#include <vista/repo/placeholder.hpp>
#include <vista/repo/present.hpp>
#include <vista/log.hpp>

namespace vista {

// ---------------------------------------------------------------------------
// Construction / lifecycle
// ---------------------------------------------------------------------------

Repository::Repository(std::string working_dir, Settings settings)
    : settings_(std::move(settings)) {
    setup(working_dir);
    begin_load(nullptr);
}

Repository::Repository(Initial initial, Settings settings)
    : settings_(std::move(settings)) {
    setup("");

    // Nothing to load: the load promise starts resolved
    load_promise_ = std::make_shared<std::promise<void>>();
    load_promise_->set_value();
    load_future_ = load_promise_->get_future().share();
    load_resolved_ = true;

    switch (initial) {
        case Initial::Absent:       state_ = std::make_shared<Absent>(*this); break;
        case Initial::AbsentGuess:  state_ = std::make_shared<AbsentGuess>(*this); break;
        case Initial::LoadingGuess: state_ = std::make_shared<LoadingGuess>(*this); break;
    }
}

Repository::~Repository() {
    destroy();
}

void Repository::setup(const std::string& working_dir) {
    working_dir_ = working_dir;
    git_ = std::make_unique<GitShellOut>(working_dir, settings_.git_binary,
                                         settings_.command_timeout);
    object_store_ = std::make_unique<GitObjectStore>(*git_);
    history_ = std::make_unique<DiscardHistoryStore>(
        *object_store_, settings_.history_config_key,
        static_cast<size_t>(settings_.max_history_length));
    mutations_ = std::make_unique<WorkQueue>(1, "mutations");
    reads_ = std::make_unique<WorkQueue>(static_cast<size_t>(settings_.read_workers), "reads");
}

Result<std::unique_ptr<Repository>> Repository::open(const std::string& working_dir) {
    auto settings = load_settings_for(working_dir);
    if (settings.is_err()) return std::move(settings).error();
    settings.value().apply_logging();
    return Result<std::unique_ptr<Repository>>::ok(
        std::make_unique<Repository>(working_dir, std::move(settings).value()));
}

std::unique_ptr<Repository> Repository::absent(Settings settings) {
    return std::unique_ptr<Repository>(new Repository(Initial::Absent, std::move(settings)));
}

std::unique_ptr<Repository> Repository::absent_guess(Settings settings) {
    return std::unique_ptr<Repository>(new Repository(Initial::AbsentGuess, std::move(settings)));
}

std::unique_ptr<Repository> Repository::loading_guess(Settings settings) {
    return std::unique_ptr<Repository>(new Repository(Initial::LoadingGuess, std::move(settings)));
}

Future<std::monostate> Repository::begin_load(std::function<Status()> prelude) {
    auto done = std::make_shared<std::promise<Status>>();
    Future<std::monostate> future = done->get_future().share();

    std::lock_guard<std::mutex> loader_lock(loader_mutex_);
    // The previous load finished when it left Loading. A state callback
    // running on that loader thread may start the next load itself.
    if (loader_.joinable()) {
        if (loader_.get_id() == std::this_thread::get_id()) {
            loader_.detach();
        } else {
            loader_.join();
        }
    }

    auto loading = std::make_shared<Loading>(*this);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ && state_->is_destroyed()) {
            return ready_future<std::monostate>(VistaError{VistaError::Destroyed,
                "repository destroyed before loading"});
        }
        load_promise_ = std::make_shared<std::promise<void>>();
        load_future_ = load_promise_->get_future().share();
        load_resolved_ = false;
    }
    // A destroy() that lands here resolves the new promise on its way to Destroyed
    if (!transition_from(nullptr, loading)) {
        return ready_future<std::monostate>(VistaError{VistaError::Destroyed,
            "repository destroyed before loading"});
    }

    bool lifecycle = static_cast<bool>(prelude);
    loader_ = std::thread([this, prelude = std::move(prelude), done, loading, lifecycle]() {
        Status status = prelude ? prelude() : ok_status();
        Status loaded = finish_load(loading.get());

        if (status.is_err()) {
            done->set_value(std::move(status));
        } else if (loaded.is_err()) {
            done->set_value(std::move(loaded));
        } else if (lifecycle && !current_state()->is_present()) {
            auto state = current_state();
            if (state->is_destroyed()) {
                done->set_value(VistaError{VistaError::Destroyed,
                    "repository destroyed while loading"});
            } else {
                done->set_value(VistaError{VistaError::NotFound,
                    "no repository at " + working_directory()});
            }
        } else {
            done->set_value(ok_status());
        }
    });
    return future;
}

Status Repository::finish_load(const RepositoryState* loading) {
    auto is_repo = git_->is_git_repository();
    if (is_repo.is_err()) {
        vista::log::warn("cannot inspect %s: %s",
                         working_directory().c_str(), is_repo.error().message.c_str());
        transition_from(loading, std::make_shared<Absent>(*this));
        return std::move(is_repo).error();
    }

    if (!is_repo.value()) {
        vista::log::debug("no repository at %s", working_directory().c_str());
        transition_from(loading, std::make_shared<Absent>(*this));
        return ok_status();
    }

    auto dir = git_->resolve_git_dir();
    if (dir.is_err()) {
        transition_from(loading, std::make_shared<Absent>(*this));
        return std::move(dir).error();
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        git_dir_ = dir.value();
    }

    history_->load();
    cache_.clear();
    transition_from(loading, std::make_shared<Present>(*this));
    return ok_status();
}

void Repository::wait_for_load() const {
    get_load_promise().wait();
}

std::shared_future<void> Repository::get_load_promise() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return load_future_;
}

Future<std::monostate> Repository::init() {
    return current_state()->init();
}

Future<std::monostate> Repository::clone(const std::string& url, const std::string& dest) {
    return current_state()->clone(url, dest);
}

void Repository::destroy() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ && state_->is_destroyed()) return;
    }
    transition(std::make_shared<Destroyed>(*this));

    // Pending work drains against Destroyed and fails fast
    mutations_->shutdown();
    reads_->shutdown();

    {
        std::lock_guard<std::mutex> loader_lock(loader_mutex_);
        if (loader_.joinable()) {
            if (loader_.get_id() == std::this_thread::get_id()) {
                loader_.detach();
            } else {
                loader_.join();
            }
        }
    }

    cache_.destroy();
    history_->release();
}

// ---------------------------------------------------------------------------
// State bookkeeping
// ---------------------------------------------------------------------------

std::shared_ptr<RepositoryState> Repository::current_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void Repository::transition(std::shared_ptr<RepositoryState> next) {
    transition_from(nullptr, std::move(next));
}

bool Repository::transition_from(const RepositoryState* expected,
                                 std::shared_ptr<RepositoryState> next) {
    std::string from;
    std::string to = next->name();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (expected && state_.get() != expected) return false;
        // Destroyed is terminal
        if (state_ && state_->is_destroyed()) return false;

        from = state_ ? state_->name() : "";
        state_ = std::move(next);
        if (!state_->is_loading() && !load_resolved_) {
            load_resolved_ = true;
            load_promise_->set_value();
        }
    }

    vista::log::debug("repository %s: %s -> %s",
                      working_directory().c_str(), from.c_str(), to.c_str());

    std::vector<StateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        for (const auto& [id, cb] : callbacks_) callbacks.push_back(cb);
    }
    for (const auto& cb : callbacks) cb(from, to);
    return true;
}

size_t Repository::on_did_change_state(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    size_t id = next_callback_id_++;
    callbacks_[id] = std::move(callback);
    return id;
}

void Repository::off_did_change_state(size_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.erase(id);
}

void Repository::set_working_directory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    working_dir_ = dir;
    git_->set_working_dir(dir);
}

std::string Repository::working_directory() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return working_dir_;
}

std::string Repository::git_dir() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return git_dir_;
}

bool Repository::is_in_state(const std::string& name) const { return state_name() == name; }
std::string Repository::state_name() const { return current_state()->name(); }
bool Repository::is_loading() const { return current_state()->is_loading(); }
bool Repository::is_loading_guess() const { return current_state()->is_loading_guess(); }
bool Repository::is_absent() const { return current_state()->is_absent(); }
bool Repository::is_absent_guess() const { return current_state()->is_absent_guess(); }
bool Repository::is_present() const { return current_state()->is_present(); }
bool Repository::is_destroyed() const { return current_state()->is_destroyed(); }
bool Repository::is_empty() const { return current_state()->is_empty(); }
bool Repository::is_undetermined() const { return current_state()->is_undetermined(); }
bool Repository::show_tab_loading() const { return current_state()->show_tab_loading(); }
bool Repository::show_tab_init() const { return current_state()->show_tab_init(); }

void Repository::refresh() {
    vista::log::debug("refresh: clearing %zu cached value(s)", cache_.size());
    cache_.clear();
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

using Paths = std::vector<std::string>;

Future<std::monostate> Repository::stage_files(const Paths& paths) {
    return mutation<std::monostate>([paths](RepositoryState& s) { return s.stage_files(paths); });
}

Future<std::monostate> Repository::unstage_files(const Paths& paths) {
    return mutation<std::monostate>([paths](RepositoryState& s) { return s.unstage_files(paths); });
}

Future<std::monostate> Repository::stage_files_from_parent_commit(const Paths& paths) {
    return mutation<std::monostate>([paths](RepositoryState& s) {
        return s.stage_files_from_parent_commit(paths);
    });
}

Future<std::monostate> Repository::apply_patch_to_index(const FilePatch& patch) {
    return mutation<std::monostate>([patch](RepositoryState& s) {
        return s.apply_patch_to_index(patch);
    });
}

Future<std::monostate> Repository::apply_patch_to_workdir(const FilePatch& patch) {
    return mutation<std::monostate>([patch](RepositoryState& s) {
        return s.apply_patch_to_workdir(patch);
    });
}

Future<std::monostate> Repository::write_merge_conflict_to_index(const std::string& path,
                                                                 const std::string& base_sha,
                                                                 const std::string& ours_sha,
                                                                 const std::string& theirs_sha) {
    return mutation<std::monostate>([=](RepositoryState& s) {
        return s.write_merge_conflict_to_index(path, base_sha, ours_sha, theirs_sha);
    });
}

Future<std::monostate> Repository::discard_work_dir_changes_for_paths(const Paths& paths) {
    return mutation<std::monostate>([paths](RepositoryState& s) {
        return s.discard_work_dir_changes_for_paths(paths);
    });
}

Future<std::monostate> Repository::commit(const std::string& message,
                                          const CommitOptions& options) {
    return mutation<std::monostate>([message, options](RepositoryState& s) {
        return s.commit(message, options);
    });
}

Future<std::monostate> Repository::merge(const std::string& ref) {
    return mutation<std::monostate>([ref](RepositoryState& s) { return s.merge(ref); });
}

Future<std::monostate> Repository::abort_merge() {
    return mutation<std::monostate>([](RepositoryState& s) { return s.abort_merge(); });
}

Future<std::monostate> Repository::checkout(const std::string& revision, bool create_new) {
    return mutation<std::monostate>([revision, create_new](RepositoryState& s) {
        return s.checkout(revision, create_new);
    });
}

Future<std::monostate> Repository::checkout_paths_at_revision(const Paths& paths,
                                                              const std::string& revision) {
    return mutation<std::monostate>([paths, revision](RepositoryState& s) {
        return s.checkout_paths_at_revision(paths, revision);
    });
}

Future<std::monostate> Repository::checkout_side(Side side, const Paths& paths) {
    return mutation<std::monostate>([side, paths](RepositoryState& s) {
        return s.checkout_side(side, paths);
    });
}

Future<std::monostate> Repository::fetch(const std::string& branch) {
    return mutation<std::monostate>([branch](RepositoryState& s) { return s.fetch(branch); });
}

Future<std::monostate> Repository::pull(const std::string& branch) {
    return mutation<std::monostate>([branch](RepositoryState& s) { return s.pull(branch); });
}

Future<std::monostate> Repository::push(const std::string& branch, bool set_upstream) {
    return mutation<std::monostate>([branch, set_upstream](RepositoryState& s) {
        return s.push(branch, set_upstream);
    });
}

Future<std::monostate> Repository::set_config(const std::string& key, const std::string& value) {
    return mutation<std::monostate>([key, value](RepositoryState& s) {
        return s.set_config(key, value);
    });
}

Future<DiscardEntry> Repository::store_before_and_after_blobs(
        const Paths& paths, DiscardHistoryStore::SafetyCheck is_safe,
        DiscardHistoryStore::Mutation mutate, const std::string& group_key) {
    return mutation<DiscardEntry>(
        [paths, is_safe = std::move(is_safe), mutate = std::move(mutate), group_key](
            RepositoryState& s) {
            return s.store_before_and_after_blobs(paths, is_safe, mutate, group_key);
        });
}

Future<std::string> Repository::create_discard_history_blob() {
    return mutation<std::string>([](RepositoryState& s) {
        return s.create_discard_history_blob();
    });
}

Future<std::string> Repository::update_discard_history() {
    return mutation<std::string>([](RepositoryState& s) { return s.update_discard_history(); });
}

Future<std::monostate> Repository::reload_discard_history() {
    return mutation<std::monostate>([](RepositoryState& s) {
        return s.reload_discard_history();
    });
}

Future<std::optional<DiscardEntry>> Repository::pop_discard_history(const std::string& group_key) {
    return mutation<std::optional<DiscardEntry>>([group_key](RepositoryState& s) {
        return s.pop_discard_history(group_key);
    });
}

Future<std::monostate> Repository::clear_discard_history(const std::string& group_key) {
    return mutation<std::monostate>([group_key](RepositoryState& s) {
        return s.clear_discard_history(group_key);
    });
}

Future<RestoreResult> Repository::restore_last_discard(const std::string& group_key) {
    return mutation<RestoreResult>([group_key](RepositoryState& s) {
        return s.restore_last_discard(group_key);
    });
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

Future<std::optional<std::string>> Repository::get_config(const std::string& key, bool local) {
    return read<std::optional<std::string>>([key, local](RepositoryState& s) {
        return s.get_config(key, local);
    });
}

Future<bool> Repository::has_discard_history(const std::string& group_key) {
    return read<bool>([group_key](RepositoryState& s) {
        return s.has_discard_history(group_key);
    });
}

Future<std::vector<DiscardEntry>> Repository::get_discard_history(const std::string& group_key) {
    return read<std::vector<DiscardEntry>>([group_key](RepositoryState& s) {
        return s.get_discard_history(group_key);
    });
}

Future<std::optional<DiscardEntry>> Repository::get_last_history_snapshots(
        const std::string& group_key) {
    return read<std::optional<DiscardEntry>>([group_key](RepositoryState& s) {
        return s.get_last_history_snapshots(group_key);
    });
}

Future<bool> Repository::is_merging() {
    return read<bool>([](RepositoryState& s) { return s.is_merging(); });
}

Future<StatusBundlePtr> Repository::get_statuses_for_changed_files() {
    return read<StatusBundlePtr>([](RepositoryState& s) {
        return s.get_statuses_for_changed_files();
    });
}

Future<std::vector<FileChange>> Repository::get_unstaged_changes() {
    return read<std::vector<FileChange>>([](RepositoryState& s) {
        return s.get_unstaged_changes();
    });
}

Future<std::vector<FileChange>> Repository::get_staged_changes() {
    return read<std::vector<FileChange>>([](RepositoryState& s) {
        return s.get_staged_changes();
    });
}

Future<std::vector<FileChange>> Repository::get_staged_changes_since_parent_commit() {
    return read<std::vector<FileChange>>([](RepositoryState& s) {
        return s.get_staged_changes_since_parent_commit();
    });
}

Future<FilePatchPtr> Repository::get_file_patch_for_path(const std::string& path,
                                                         const FilePatchOptions& options) {
    return read<FilePatchPtr>([path, options](RepositoryState& s) {
        return s.get_file_patch_for_path(path, options);
    });
}

Future<bool> Repository::is_partially_staged(const std::string& path) {
    return read<bool>([path](RepositoryState& s) { return s.is_partially_staged(path); });
}

Future<std::string> Repository::read_file_from_index(const std::string& path) {
    return read<std::string>([path](RepositoryState& s) {
        return s.read_file_from_index(path);
    });
}

Future<Commit> Repository::get_last_commit() {
    return read<Commit>([](RepositoryState& s) { return s.get_last_commit(); });
}

Future<Commit> Repository::get_commit(const std::string& ref) {
    return read<Commit>([ref](RepositoryState& s) { return s.get_commit(ref); });
}

Future<std::vector<std::string>> Repository::get_branches() {
    return read<std::vector<std::string>>([](RepositoryState& s) { return s.get_branches(); });
}

Future<Branch> Repository::get_current_branch() {
    return read<Branch>([](RepositoryState& s) { return s.get_current_branch(); });
}

Future<std::vector<Remote>> Repository::get_remotes() {
    return read<std::vector<Remote>>([](RepositoryState& s) { return s.get_remotes(); });
}

Future<int> Repository::get_ahead_count(const std::string& branch) {
    return read<int>([branch](RepositoryState& s) { return s.get_ahead_count(branch); });
}

Future<int> Repository::get_behind_count(const std::string& branch) {
    return read<int>([branch](RepositoryState& s) { return s.get_behind_count(branch); });
}

Future<std::optional<Remote>> Repository::get_remote_for_branch(const std::string& branch) {
    return read<std::optional<Remote>>([branch](RepositoryState& s) {
        return s.get_remote_for_branch(branch);
    });
}

Future<std::vector<MergeConflict>> Repository::get_merge_conflicts() {
    return read<std::vector<MergeConflict>>([](RepositoryState& s) {
        return s.get_merge_conflicts();
    });
}

Future<bool> Repository::path_has_merge_markers(const std::string& path) {
    return read<bool>([path](RepositoryState& s) { return s.path_has_merge_markers(path); });
}

} // namespace vista
