#include <vista/repo/placeholder.hpp>
#include <vista/repository.hpp>

namespace vista {

Status Placeholder::not_ready(const char* operation) const {
    return VistaError{VistaError::NotReady,
        std::string(operation) + ": no repository is loaded (" + name() + ")",
        "initialize or clone a repository first"};
}

Future<std::monostate> Placeholder::init() {
    return ready_future(not_ready("init"));
}

Future<std::monostate> Placeholder::clone(const std::string&, const std::string&) {
    return ready_future(not_ready("clone"));
}

// ---- Mutations ----

Status Placeholder::stage_files(const std::vector<std::string>&) {
    return not_ready("stage_files");
}

Status Placeholder::unstage_files(const std::vector<std::string>&) {
    return not_ready("unstage_files");
}

Status Placeholder::stage_files_from_parent_commit(const std::vector<std::string>&) {
    return not_ready("stage_files_from_parent_commit");
}

Status Placeholder::apply_patch_to_index(const FilePatch&) {
    return not_ready("apply_patch_to_index");
}

Status Placeholder::apply_patch_to_workdir(const FilePatch&) {
    return not_ready("apply_patch_to_workdir");
}

Status Placeholder::write_merge_conflict_to_index(const std::string&, const std::string&,
                                                  const std::string&, const std::string&) {
    return not_ready("write_merge_conflict_to_index");
}

Status Placeholder::discard_work_dir_changes_for_paths(const std::vector<std::string>&) {
    return not_ready("discard_work_dir_changes_for_paths");
}

Status Placeholder::commit(const std::string&, const CommitOptions&) {
    return not_ready("commit");
}

Status Placeholder::merge(const std::string&) { return not_ready("merge"); }
Status Placeholder::abort_merge() { return not_ready("abort_merge"); }

Status Placeholder::checkout(const std::string&, bool) { return not_ready("checkout"); }

Status Placeholder::checkout_paths_at_revision(const std::vector<std::string>&,
                                               const std::string&) {
    return not_ready("checkout_paths_at_revision");
}

Status Placeholder::checkout_side(Side, const std::vector<std::string>&) {
    return not_ready("checkout_side");
}

Status Placeholder::fetch(const std::string&) { return not_ready("fetch"); }
Status Placeholder::pull(const std::string&) { return not_ready("pull"); }
Status Placeholder::push(const std::string&, bool) { return not_ready("push"); }

Status Placeholder::set_config(const std::string&, const std::string&) {
    return not_ready("set_config");
}

Result<DiscardEntry> Placeholder::store_before_and_after_blobs(
        const std::vector<std::string>&, const DiscardHistoryStore::SafetyCheck&,
        const DiscardHistoryStore::Mutation&, const std::string&) {
    return not_ready("store_before_and_after_blobs").error();
}

Result<std::string> Placeholder::create_discard_history_blob() {
    return not_ready("create_discard_history_blob").error();
}

Result<std::string> Placeholder::update_discard_history() {
    return not_ready("update_discard_history").error();
}

Status Placeholder::reload_discard_history() {
    return not_ready("reload_discard_history");
}

Result<std::optional<DiscardEntry>> Placeholder::pop_discard_history(const std::string&) {
    return not_ready("pop_discard_history").error();
}

Status Placeholder::clear_discard_history(const std::string&) {
    return not_ready("clear_discard_history");
}

Result<RestoreResult> Placeholder::restore_last_discard(const std::string&) {
    return not_ready("restore_last_discard").error();
}

// ---- Reads: empty defaults ----

Result<bool> Placeholder::is_merging() { return Result<bool>::ok(false); }

Result<StatusBundlePtr> Placeholder::get_statuses_for_changed_files() {
    return Result<StatusBundlePtr>::ok(std::make_shared<StatusBundle>());
}

Result<std::vector<FileChange>> Placeholder::get_unstaged_changes() {
    return Result<std::vector<FileChange>>::ok({});
}

Result<std::vector<FileChange>> Placeholder::get_staged_changes() {
    return Result<std::vector<FileChange>>::ok({});
}

Result<std::vector<FileChange>> Placeholder::get_staged_changes_since_parent_commit() {
    return Result<std::vector<FileChange>>::ok({});
}

Result<FilePatchPtr> Placeholder::get_file_patch_for_path(const std::string&,
                                                          const FilePatchOptions&) {
    return Result<FilePatchPtr>::ok(nullptr);
}

Result<bool> Placeholder::is_partially_staged(const std::string&) {
    return Result<bool>::ok(false);
}

Result<std::string> Placeholder::read_file_from_index(const std::string&) {
    return Result<std::string>::ok("");
}

Result<Commit> Placeholder::get_last_commit() { return Result<Commit>::ok(Commit{}); }
Result<Commit> Placeholder::get_commit(const std::string&) { return Result<Commit>::ok(Commit{}); }

Result<std::vector<std::string>> Placeholder::get_branches() {
    return Result<std::vector<std::string>>::ok({});
}

Result<Branch> Placeholder::get_current_branch() { return Result<Branch>::ok(Branch{}); }

Result<std::vector<Remote>> Placeholder::get_remotes() {
    return Result<std::vector<Remote>>::ok({});
}

Result<int> Placeholder::get_ahead_count(const std::string&) { return Result<int>::ok(0); }
Result<int> Placeholder::get_behind_count(const std::string&) { return Result<int>::ok(0); }

Result<std::optional<Remote>> Placeholder::get_remote_for_branch(const std::string&) {
    return Result<std::optional<Remote>>::ok(std::nullopt);
}

Result<std::optional<std::string>> Placeholder::get_config(const std::string&, bool) {
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

Result<std::vector<MergeConflict>> Placeholder::get_merge_conflicts() {
    return Result<std::vector<MergeConflict>>::ok({});
}

Result<bool> Placeholder::path_has_merge_markers(const std::string&) {
    return Result<bool>::ok(false);
}

Result<bool> Placeholder::has_discard_history(const std::string&) {
    return Result<bool>::ok(false);
}

Result<std::vector<DiscardEntry>> Placeholder::get_discard_history(const std::string&) {
    return Result<std::vector<DiscardEntry>>::ok({});
}

Result<std::optional<DiscardEntry>> Placeholder::get_last_history_snapshots(const std::string&) {
    return Result<std::optional<DiscardEntry>>::ok(std::nullopt);
}

// ---------------------------------------------------------------------------
// Absent
// ---------------------------------------------------------------------------

Future<std::monostate> Absent::init() {
    if (repo_.working_directory().empty()) {
        return ready_future<std::monostate>(VistaError{VistaError::InvalidArg,
            "init: no working directory"});
    }
    Repository& repo = repo_;
    return repo.begin_load([&repo]() { return repo.git().init(); });
}

Future<std::monostate> Absent::clone(const std::string& url, const std::string& dest) {
    std::string target = dest.empty() ? repo_.working_directory() : dest;
    if (target.empty()) {
        return ready_future<std::monostate>(VistaError{VistaError::InvalidArg,
            "clone: no destination for " + url});
    }
    Repository& repo = repo_;
    return repo.begin_load([&repo, url, target, dest]() {
        Status cloned = repo.git().clone(url, target);
        // Only a finished clone moves the repository to its new directory
        if (cloned.is_ok() && !dest.empty()) repo.set_working_directory(dest);
        return cloned;
    });
}

} // namespace vista
