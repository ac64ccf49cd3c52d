#include <vista/repo/destroyed.hpp>

namespace vista {

static VistaError destroyed_error(const char* operation) {
    return VistaError{VistaError::Destroyed,
        std::string(operation) + ": repository has been destroyed"};
}

Future<std::monostate> Destroyed::init() {
    return ready_future<std::monostate>(destroyed_error("init"));
}

Future<std::monostate> Destroyed::clone(const std::string&, const std::string&) {
    return ready_future<std::monostate>(destroyed_error("clone"));
}

Status Destroyed::stage_files(const std::vector<std::string>&) {
    return destroyed_error("stage_files");
}

Status Destroyed::unstage_files(const std::vector<std::string>&) {
    return destroyed_error("unstage_files");
}

Status Destroyed::stage_files_from_parent_commit(const std::vector<std::string>&) {
    return destroyed_error("stage_files_from_parent_commit");
}

Status Destroyed::apply_patch_to_index(const FilePatch&) {
    return destroyed_error("apply_patch_to_index");
}

Status Destroyed::apply_patch_to_workdir(const FilePatch&) {
    return destroyed_error("apply_patch_to_workdir");
}

Status Destroyed::write_merge_conflict_to_index(
        const std::string&,
        const std::string&,
        const std::string&,
        const std::string&) {
    return destroyed_error("write_merge_conflict_to_index");
}

Status Destroyed::discard_work_dir_changes_for_paths(const std::vector<std::string>&) {
    return destroyed_error("discard_work_dir_changes_for_paths");
}

Status Destroyed::commit(const std::string&, const CommitOptions&) {
    return destroyed_error("commit");
}

Status Destroyed::merge(const std::string&) {
    return destroyed_error("merge");
}

Status Destroyed::abort_merge() {
    return destroyed_error("abort_merge");
}

Status Destroyed::checkout(const std::string&, bool) {
    return destroyed_error("checkout");
}

Status Destroyed::checkout_paths_at_revision(
        const std::vector<std::string>&,
        const std::string&) {
    return destroyed_error("checkout_paths_at_revision");
}

Status Destroyed::checkout_side(Side, const std::vector<std::string>&) {
    return destroyed_error("checkout_side");
}

Status Destroyed::fetch(const std::string&) {
    return destroyed_error("fetch");
}

Status Destroyed::pull(const std::string&) {
    return destroyed_error("pull");
}

Status Destroyed::push(const std::string&, bool) {
    return destroyed_error("push");
}

Status Destroyed::set_config(const std::string&, const std::string&) {
    return destroyed_error("set_config");
}

Result<DiscardEntry> Destroyed::store_before_and_after_blobs(
        const std::vector<std::string>&,
        const DiscardHistoryStore::SafetyCheck&,
        const DiscardHistoryStore::Mutation&,
        const std::string&) {
    return destroyed_error("store_before_and_after_blobs");
}

Result<std::string> Destroyed::create_discard_history_blob() {
    return destroyed_error("create_discard_history_blob");
}

Result<std::string> Destroyed::update_discard_history() {
    return destroyed_error("update_discard_history");
}

Status Destroyed::reload_discard_history() {
    return destroyed_error("reload_discard_history");
}

Result<std::optional<DiscardEntry>> Destroyed::pop_discard_history(const std::string&) {
    return destroyed_error("pop_discard_history");
}

Status Destroyed::clear_discard_history(const std::string&) {
    return destroyed_error("clear_discard_history");
}

Result<RestoreResult> Destroyed::restore_last_discard(const std::string&) {
    return destroyed_error("restore_last_discard");
}

Result<bool> Destroyed::is_merging() {
    return destroyed_error("is_merging");
}

Result<StatusBundlePtr> Destroyed::get_statuses_for_changed_files() {
    return destroyed_error("get_statuses_for_changed_files");
}

Result<std::vector<FileChange>> Destroyed::get_unstaged_changes() {
    return destroyed_error("get_unstaged_changes");
}

Result<std::vector<FileChange>> Destroyed::get_staged_changes() {
    return destroyed_error("get_staged_changes");
}

Result<std::vector<FileChange>> Destroyed::get_staged_changes_since_parent_commit() {
    return destroyed_error("get_staged_changes_since_parent_commit");
}

Result<FilePatchPtr> Destroyed::get_file_patch_for_path(
        const std::string&,
        const FilePatchOptions&) {
    return destroyed_error("get_file_patch_for_path");
}

Result<bool> Destroyed::is_partially_staged(const std::string&) {
    return destroyed_error("is_partially_staged");
}

Result<std::string> Destroyed::read_file_from_index(const std::string&) {
    return destroyed_error("read_file_from_index");
}

Result<Commit> Destroyed::get_last_commit() {
    return destroyed_error("get_last_commit");
}

Result<Commit> Destroyed::get_commit(const std::string&) {
    return destroyed_error("get_commit");
}

Result<std::vector<std::string>> Destroyed::get_branches() {
    return destroyed_error("get_branches");
}

Result<Branch> Destroyed::get_current_branch() {
    return destroyed_error("get_current_branch");
}

Result<std::vector<Remote>> Destroyed::get_remotes() {
    return destroyed_error("get_remotes");
}

Result<int> Destroyed::get_ahead_count(const std::string&) {
    return destroyed_error("get_ahead_count");
}

Result<int> Destroyed::get_behind_count(const std::string&) {
    return destroyed_error("get_behind_count");
}

Result<std::optional<Remote>> Destroyed::get_remote_for_branch(const std::string&) {
    return destroyed_error("get_remote_for_branch");
}

Result<std::optional<std::string>> Destroyed::get_config(const std::string&, bool) {
    return destroyed_error("get_config");
}

Result<std::vector<MergeConflict>> Destroyed::get_merge_conflicts() {
    return destroyed_error("get_merge_conflicts");
}

Result<bool> Destroyed::path_has_merge_markers(const std::string&) {
    return destroyed_error("path_has_merge_markers");
}

Result<bool> Destroyed::has_discard_history(const std::string&) {
    return destroyed_error("has_discard_history");
}

Result<std::vector<DiscardEntry>> Destroyed::get_discard_history(const std::string&) {
    return destroyed_error("get_discard_history");
}

Result<std::optional<DiscardEntry>> Destroyed::get_last_history_snapshots(const std::string&) {
    return destroyed_error("get_last_history_snapshots");
}

} // namespace vista
