#include <vista/repo/loading.hpp>
#include <vista/repository.hpp>

namespace vista {

template<typename F>
auto Loading::after_load(F&& f) -> decltype(f(std::declval<RepositoryState&>())) {
    // Copy the reference: this state is released once loading finishes
    Repository& repo = repo_;
    repo.wait_for_load();
    return f(*repo.current_state());
}

Future<std::monostate> Loading::init() {
    Repository& repo = repo_;
    return repo.mutations_->submit([&repo]() -> Status {
        repo.wait_for_load();
        return repo.current_state()->init().get();
    });
}

Future<std::monostate> Loading::clone(const std::string& url, const std::string& dest) {
    Repository& repo = repo_;
    return repo.mutations_->submit([&repo, url, dest]() -> Status {
        repo.wait_for_load();
        return repo.current_state()->clone(url, dest).get();
    });
}

// ---- Index and working tree ----

Status Loading::stage_files(const std::vector<std::string>& paths) {
    return after_load([&](RepositoryState& s) { return s.stage_files(paths); });
}

Status Loading::unstage_files(const std::vector<std::string>& paths) {
    return after_load([&](RepositoryState& s) { return s.unstage_files(paths); });
}

Status Loading::stage_files_from_parent_commit(const std::vector<std::string>& paths) {
    return after_load([&](RepositoryState& s) { return s.stage_files_from_parent_commit(paths); });
}

Status Loading::apply_patch_to_index(const FilePatch& patch) {
    return after_load([&](RepositoryState& s) { return s.apply_patch_to_index(patch); });
}

Status Loading::apply_patch_to_workdir(const FilePatch& patch) {
    return after_load([&](RepositoryState& s) { return s.apply_patch_to_workdir(patch); });
}

Status Loading::write_merge_conflict_to_index(const std::string& path,
                                              const std::string& base_sha,
                                              const std::string& ours_sha,
                                              const std::string& theirs_sha) {
    return after_load([&](RepositoryState& s) {
        return s.write_merge_conflict_to_index(path, base_sha, ours_sha, theirs_sha);
    });
}

Status Loading::discard_work_dir_changes_for_paths(const std::vector<std::string>& paths) {
    return after_load([&](RepositoryState& s) {
        return s.discard_work_dir_changes_for_paths(paths);
    });
}

// ---- History ----

Status Loading::commit(const std::string& message, const CommitOptions& options) {
    return after_load([&](RepositoryState& s) { return s.commit(message, options); });
}

Status Loading::merge(const std::string& ref) {
    return after_load([&](RepositoryState& s) { return s.merge(ref); });
}

Status Loading::abort_merge() {
    return after_load([](RepositoryState& s) { return s.abort_merge(); });
}

Status Loading::checkout(const std::string& revision, bool create_new) {
    return after_load([&](RepositoryState& s) { return s.checkout(revision, create_new); });
}

Status Loading::checkout_paths_at_revision(const std::vector<std::string>& paths,
                                           const std::string& revision) {
    return after_load([&](RepositoryState& s) {
        return s.checkout_paths_at_revision(paths, revision);
    });
}

Status Loading::checkout_side(Side side, const std::vector<std::string>& paths) {
    return after_load([&](RepositoryState& s) { return s.checkout_side(side, paths); });
}

// ---- Remotes ----

Status Loading::fetch(const std::string& branch) {
    return after_load([&](RepositoryState& s) { return s.fetch(branch); });
}

Status Loading::pull(const std::string& branch) {
    return after_load([&](RepositoryState& s) { return s.pull(branch); });
}

Status Loading::push(const std::string& branch, bool set_upstream) {
    return after_load([&](RepositoryState& s) { return s.push(branch, set_upstream); });
}

// ---- Config ----

Status Loading::set_config(const std::string& key, const std::string& value) {
    return after_load([&](RepositoryState& s) { return s.set_config(key, value); });
}

Result<std::optional<std::string>> Loading::get_config(const std::string& key, bool local) {
    return after_load([&](RepositoryState& s) { return s.get_config(key, local); });
}

// ---- Discard history ----

Result<DiscardEntry> Loading::store_before_and_after_blobs(
        const std::vector<std::string>& paths,
        const DiscardHistoryStore::SafetyCheck& is_safe,
        const DiscardHistoryStore::Mutation& mutate,
        const std::string& group_key) {
    return after_load([&](RepositoryState& s) {
        return s.store_before_and_after_blobs(paths, is_safe, mutate, group_key);
    });
}

Result<std::string> Loading::create_discard_history_blob() {
    return after_load([](RepositoryState& s) { return s.create_discard_history_blob(); });
}

Result<std::string> Loading::update_discard_history() {
    return after_load([](RepositoryState& s) { return s.update_discard_history(); });
}

Status Loading::reload_discard_history() {
    return after_load([](RepositoryState& s) { return s.reload_discard_history(); });
}

Result<std::optional<DiscardEntry>> Loading::pop_discard_history(const std::string& group_key) {
    return after_load([&](RepositoryState& s) { return s.pop_discard_history(group_key); });
}

Status Loading::clear_discard_history(const std::string& group_key) {
    return after_load([&](RepositoryState& s) { return s.clear_discard_history(group_key); });
}

Result<RestoreResult> Loading::restore_last_discard(const std::string& group_key) {
    return after_load([&](RepositoryState& s) { return s.restore_last_discard(group_key); });
}

Result<bool> Loading::has_discard_history(const std::string& group_key) {
    return after_load([&](RepositoryState& s) { return s.has_discard_history(group_key); });
}

Result<std::vector<DiscardEntry>> Loading::get_discard_history(const std::string& group_key) {
    return after_load([&](RepositoryState& s) { return s.get_discard_history(group_key); });
}

Result<std::optional<DiscardEntry>> Loading::get_last_history_snapshots(
        const std::string& group_key) {
    return after_load([&](RepositoryState& s) { return s.get_last_history_snapshots(group_key); });
}

// ---- Reads ----

Result<bool> Loading::is_merging() {
    return after_load([](RepositoryState& s) { return s.is_merging(); });
}

Result<StatusBundlePtr> Loading::get_statuses_for_changed_files() {
    return after_load([](RepositoryState& s) { return s.get_statuses_for_changed_files(); });
}

Result<std::vector<FileChange>> Loading::get_unstaged_changes() {
    return after_load([](RepositoryState& s) { return s.get_unstaged_changes(); });
}

Result<std::vector<FileChange>> Loading::get_staged_changes() {
    return after_load([](RepositoryState& s) { return s.get_staged_changes(); });
}

Result<std::vector<FileChange>> Loading::get_staged_changes_since_parent_commit() {
    return after_load([](RepositoryState& s) {
        return s.get_staged_changes_since_parent_commit();
    });
}

Result<FilePatchPtr> Loading::get_file_patch_for_path(const std::string& path,
                                                      const FilePatchOptions& options) {
    return after_load([&](RepositoryState& s) { return s.get_file_patch_for_path(path, options); });
}

Result<bool> Loading::is_partially_staged(const std::string& path) {
    return after_load([&](RepositoryState& s) { return s.is_partially_staged(path); });
}

Result<std::string> Loading::read_file_from_index(const std::string& path) {
    return after_load([&](RepositoryState& s) { return s.read_file_from_index(path); });
}

Result<Commit> Loading::get_last_commit() {
    return after_load([](RepositoryState& s) { return s.get_last_commit(); });
}

Result<Commit> Loading::get_commit(const std::string& ref) {
    return after_load([&](RepositoryState& s) { return s.get_commit(ref); });
}

Result<std::vector<std::string>> Loading::get_branches() {
    return after_load([](RepositoryState& s) { return s.get_branches(); });
}

Result<Branch> Loading::get_current_branch() {
    return after_load([](RepositoryState& s) { return s.get_current_branch(); });
}

Result<std::vector<Remote>> Loading::get_remotes() {
    return after_load([](RepositoryState& s) { return s.get_remotes(); });
}

Result<int> Loading::get_ahead_count(const std::string& branch) {
    return after_load([&](RepositoryState& s) { return s.get_ahead_count(branch); });
}

Result<int> Loading::get_behind_count(const std::string& branch) {
    return after_load([&](RepositoryState& s) { return s.get_behind_count(branch); });
}

Result<std::optional<Remote>> Loading::get_remote_for_branch(const std::string& branch) {
    return after_load([&](RepositoryState& s) { return s.get_remote_for_branch(branch); });
}

Result<std::vector<MergeConflict>> Loading::get_merge_conflicts() {
    return after_load([](RepositoryState& s) { return s.get_merge_conflicts(); });
}

Result<bool> Loading::path_has_merge_markers(const std::string& path) {
    return after_load([&](RepositoryState& s) { return s.path_has_merge_markers(path); });
}

} // namespace vista
