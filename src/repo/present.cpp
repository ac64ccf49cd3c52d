#include <vista/repo/present.hpp>
#include <vista/cache.hpp>
#include <vista/commit_message.hpp>
#include <vista/log.hpp>
#include <vista/merge_conflict.hpp>
#include <vista/repository.hpp>
#include <filesystem>

namespace fs = std::filesystem;

namespace vista {

GitShellOut& Present::git() { return *repo_.git_; }
Cache& Present::cache() { return repo_.cache_; }
DiscardHistoryStore& Present::history() { return *repo_.history_; }

template<typename R>
R Present::invalidating(Operation op, const std::vector<std::string>& scopes, R result) {
    invalidate_for(cache(), op, scopes);
    return result;
}

Result<std::string> Present::persist_history() {
    auto sha = history().persist();
    invalidate_for(cache(), Operation::PersistDiscardHistory, {history().metadata_key()});
    return sha;
}

Result<std::string> Present::head_or_empty_tree() {
    auto head = git().get_head_commit();
    if (head.is_err()) return std::move(head).error();
    return Result<std::string>::ok(head.value().is_present() ? "HEAD" : EMPTY_TREE_SHA);
}

Future<std::monostate> Present::init() {
    return ready_future<std::monostate>(VistaError{VistaError::AlreadyExists,
        "a repository already exists at " + repo_.working_directory()});
}

Future<std::monostate> Present::clone(const std::string&, const std::string&) {
    return ready_future<std::monostate>(VistaError{VistaError::AlreadyExists,
        "a repository already exists at " + repo_.working_directory()});
}

// ---------------------------------------------------------------------------
// Index and working tree
// ---------------------------------------------------------------------------

Status Present::stage_files(const std::vector<std::string>& paths) {
    return invalidating(Operation::Stage, paths, git().stage_files(paths));
}

Status Present::unstage_files(const std::vector<std::string>& paths) {
    return invalidating(Operation::Unstage, paths, git().unstage_files(paths));
}

Status Present::stage_files_from_parent_commit(const std::vector<std::string>& paths) {
    return invalidating(Operation::StageFromParent, paths,
                        git().unstage_files(paths, "HEAD~"));
}

Status Present::apply_patch_to_index(const FilePatch& patch) {
    std::vector<std::string> scopes = {patch.path()};
    if (!patch.old_path.empty() && patch.old_path != patch.path()) {
        scopes.push_back(patch.old_path);
    }
    return invalidating(Operation::ApplyPatchToIndex, scopes,
                        git().apply_patch(patch.to_string(), true));
}

Status Present::apply_patch_to_workdir(const FilePatch& patch) {
    return invalidating(Operation::ApplyPatchToWorkdir, {patch.path()},
                        git().apply_patch(patch.to_string(), false));
}

Status Present::write_merge_conflict_to_index(const std::string& path,
                                              const std::string& base_sha,
                                              const std::string& ours_sha,
                                              const std::string& theirs_sha) {
    // Drop whatever the index holds for the path, then add one entry per
    // stage that has content
    std::string info = "0 0000000000000000000000000000000000000000\t" + path + "\n";
    const std::string* shas[] = {&base_sha, &ours_sha, &theirs_sha};
    for (int stage = 1; stage <= 3; ++stage) {
        const std::string& sha = *shas[stage - 1];
        if (sha.empty()) continue;
        info += "100644 " + sha + " " + std::to_string(stage) + "\t" + path + "\n";
    }
    return invalidating(Operation::WriteMergeConflictToIndex, {path},
                        git().update_index_info(info));
}

Status Present::discard_work_dir_changes_for_paths(const std::vector<std::string>& paths) {
    std::vector<std::string> tracked;
    std::vector<std::string> untracked;
    for (const auto& path : paths) {
        auto is_tracked = git().is_tracked(path);
        if (is_tracked.is_err()) {
            return invalidating(Operation::DiscardWorkdirChanges, paths,
                                Status(std::move(is_tracked).error()));
        }
        (is_tracked.value() ? tracked : untracked).push_back(path);
    }

    // Tracked paths go back to what the index holds
    Status status = git().checkout_paths(tracked, "");
    if (status.is_ok()) {
        for (const auto& path : untracked) {
            std::error_code ec;
            fs::remove(fs::path(git().working_dir()) / path, ec);
            if (ec) {
                status = VistaError{VistaError::IO,
                    "cannot remove " + path + ": " + ec.message()};
                break;
            }
        }
    }
    return invalidating(Operation::DiscardWorkdirChanges, paths, std::move(status));
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

Status Present::commit(const std::string& message, const CommitOptions& options) {
    std::string formatted = format_commit_message(message, repo_.settings_.commit_wrap_column);
    return invalidating(Operation::Commit, {},
                        git().commit(formatted, options.amend, options.allow_empty));
}

Status Present::merge(const std::string& ref) {
    return invalidating(Operation::Merge, {}, git().merge(ref));
}

Status Present::abort_merge() {
    return invalidating(Operation::AbortMerge, {}, git().abort_merge());
}

Status Present::checkout(const std::string& revision, bool create_new) {
    return invalidating(Operation::Checkout, {}, git().checkout(revision, create_new));
}

Status Present::checkout_paths_at_revision(const std::vector<std::string>& paths,
                                           const std::string& revision) {
    return invalidating(Operation::CheckoutPaths, paths, git().checkout_paths(paths, revision));
}

Status Present::checkout_side(Side side, const std::vector<std::string>& paths) {
    return invalidating(Operation::CheckoutSide, paths, git().checkout_side(side, paths));
}

// ---------------------------------------------------------------------------
// Remotes
// ---------------------------------------------------------------------------

Status Present::fetch(const std::string& branch) {
    auto remote = get_remote_for_branch(branch);
    if (remote.is_err()) return std::move(remote).error();
    if (!remote.value()) {
        vista::log::info("fetch: branch %s has no remote", branch.c_str());
        return ok_status();
    }
    return invalidating(Operation::Fetch, {}, git().fetch(remote.value()->name, branch));
}

Status Present::pull(const std::string& branch) {
    auto remote = get_remote_for_branch(branch);
    if (remote.is_err()) return std::move(remote).error();
    if (!remote.value()) {
        vista::log::info("pull: branch %s has no remote", branch.c_str());
        return ok_status();
    }
    return invalidating(Operation::Pull, {}, git().pull(remote.value()->name, branch));
}

Status Present::push(const std::string& branch, bool set_upstream) {
    auto remote = get_remote_for_branch(branch);
    if (remote.is_err()) return std::move(remote).error();
    std::string name = remote.value() ? remote.value()->name : "origin";
    return invalidating(Operation::Push, {}, git().push(name, branch, set_upstream));
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

Status Present::set_config(const std::string& key, const std::string& value) {
    return invalidating(Operation::SetConfig, {key}, git().set_config(key, value));
}

Result<std::optional<std::string>> Present::get_config(const std::string& key, bool local) {
    return cache().get_or_set<std::optional<std::string>>(keys::config(key, local), [&]() {
        return git().get_config(key, local);
    }).get();
}

// ---------------------------------------------------------------------------
// Discard history
// ---------------------------------------------------------------------------

Result<DiscardEntry> Present::store_before_and_after_blobs(
        const std::vector<std::string>& paths,
        const DiscardHistoryStore::SafetyCheck& is_safe,
        const DiscardHistoryStore::Mutation& mutate,
        const std::string& group_key) {
    auto entry = invalidating(Operation::StoreDiscardSnapshots, paths,
                              history().store_before_and_after_blobs(
                                  paths, is_safe, mutate, group_key));
    if (entry.is_err() || entry.value().empty()) return entry;

    auto persisted = persist_history();
    if (persisted.is_err()) return std::move(persisted).error();
    return entry;
}

Result<std::string> Present::create_discard_history_blob() {
    return history().create_history_blob();
}

Result<std::string> Present::update_discard_history() {
    return persist_history();
}

Status Present::reload_discard_history() {
    history().load();
    return ok_status();
}

Result<std::optional<DiscardEntry>> Present::pop_discard_history(const std::string& group_key) {
    auto entry = history().pop(group_key);
    if (!entry) return Result<std::optional<DiscardEntry>>::ok(std::nullopt);
    VISTA_TRY(persist_history());
    return Result<std::optional<DiscardEntry>>::ok(std::move(entry));
}

Status Present::clear_discard_history(const std::string& group_key) {
    if (!history().has_history(group_key)) return ok_status();
    history().clear(group_key);
    VISTA_TRY(persist_history());
    return ok_status();
}

Result<RestoreResult> Present::restore_last_discard(const std::string& group_key) {
    std::vector<std::string> paths;
    if (auto last = history().get_last_snapshots(group_key)) {
        for (const auto& snapshot : *last) paths.push_back(snapshot.path);
    }

    auto restored = invalidating(Operation::RestoreDiscard, paths,
                                 history().restore_last(group_key));
    if (restored.is_err()) return restored;
    VISTA_TRY(persist_history());
    return restored;
}

Result<bool> Present::has_discard_history(const std::string& group_key) {
    return Result<bool>::ok(history().has_history(group_key));
}

Result<std::vector<DiscardEntry>> Present::get_discard_history(const std::string& group_key) {
    return Result<std::vector<DiscardEntry>>::ok(history().get_history(group_key));
}

Result<std::optional<DiscardEntry>> Present::get_last_history_snapshots(
        const std::string& group_key) {
    return Result<std::optional<DiscardEntry>>::ok(history().get_last_snapshots(group_key));
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

Result<bool> Present::is_merging() {
    return Result<bool>::ok(git().is_merging(repo_.git_dir()));
}

Result<StatusBundlePtr> Present::get_statuses_for_changed_files() {
    return cache().get_or_set<StatusBundlePtr>(keys::changed_files(),
                                               [this]() -> Result<StatusBundlePtr> {
        auto base = head_or_empty_tree();
        if (base.is_err()) return std::move(base).error();
        auto staged = git().diff_name_status({"--cached", base.value()});
        if (staged.is_err()) return std::move(staged).error();
        auto unstaged = git().diff_name_status({});
        if (unstaged.is_err()) return std::move(unstaged).error();
        auto untracked = git().untracked_files();
        if (untracked.is_err()) return std::move(untracked).error();
        auto unmerged = git().unmerged_entries();
        if (unmerged.is_err()) return std::move(unmerged).error();

        auto conflicts = group_unmerged_entries(unmerged.value());
        std::vector<std::string> conflict_paths;
        for (const auto& [path, input] : conflicts) conflict_paths.push_back(path);

        auto bundle = std::make_shared<StatusBundle>();
        if (!conflicts.empty()) {
            auto head_shas = git().head_blob_shas(conflict_paths);
            if (head_shas.is_err()) return std::move(head_shas).error();

            for (auto& [path, input] : conflicts) {
                auto head = head_shas.value().find(path);
                if (head != head_shas.value().end()) input.head_sha = head->second;

                auto worktree = git().hash_file(path);
                if (worktree.is_err()) return std::move(worktree).error();
                if (!worktree.value().empty()) input.worktree_sha = worktree.value();

                bundle->merge_conflict_files[path] = classify_conflict(input);
            }
        }

        for (const auto& [path, status] : staged.value()) {
            if (!conflicts.count(path)) bundle->staged_files[path] = status;
        }
        for (const auto& [path, status] : unstaged.value()) {
            if (!conflicts.count(path)) bundle->unstaged_files[path] = status;
        }
        for (const auto& path : untracked.value()) {
            bundle->unstaged_files[path] = FileStatus::Added;
        }
        return Result<StatusBundlePtr>::ok(std::move(bundle));
    }).get();
}

Result<std::vector<FileChange>> Present::get_unstaged_changes() {
    auto bundle = get_statuses_for_changed_files();
    if (bundle.is_err()) return std::move(bundle).error();
    return Result<std::vector<FileChange>>::ok(to_file_changes(bundle.value()->unstaged_files));
}

Result<std::vector<FileChange>> Present::compute_staged(const std::vector<std::string>& diff_args) {
    auto staged = git().diff_name_status(diff_args);
    if (staged.is_err()) return std::move(staged).error();
    auto unmerged = git().unmerged_entries();
    if (unmerged.is_err()) return std::move(unmerged).error();

    for (const auto& entry : unmerged.value()) staged.value().erase(entry.path);
    return Result<std::vector<FileChange>>::ok(to_file_changes(staged.value()));
}

Result<std::vector<FileChange>> Present::get_staged_changes() {
    return cache().get_or_set<std::vector<FileChange>>(keys::staged_changes(),
                                                       [this]() -> Result<std::vector<FileChange>> {
        auto base = head_or_empty_tree();
        if (base.is_err()) return std::move(base).error();
        return compute_staged({"--cached", base.value()});
    }).get();
}

Result<std::vector<FileChange>> Present::get_staged_changes_since_parent_commit() {
    return cache().get_or_set<std::vector<FileChange>>(keys::staged_changes_since_parent(),
                                                       [this]() -> Result<std::vector<FileChange>> {
        auto parent = git().has_parent_commit();
        if (parent.is_err()) return std::move(parent).error();
        // Without a parent, "since the parent" means since the empty tree
        return compute_staged({"--cached", parent.value() ? "HEAD~" : EMPTY_TREE_SHA});
    }).get();
}

Result<FilePatchPtr> Present::get_file_patch_for_path(const std::string& path,
                                                      const FilePatchOptions& options) {
    bool amending = options.staged && options.amending;
    return cache().get_or_set<FilePatchPtr>(keys::file_patch(path, options.staged, amending),
                                            [&]() -> Result<FilePatchPtr> {
        auto diff = git().diff_for_path(path, options.staged, amending);
        if (diff.is_err()) return std::move(diff).error();
        return parse_unified_diff(diff.value());
    }).get();
}

Result<bool> Present::is_partially_staged(const std::string& path) {
    return cache().get_or_set<bool>(keys::is_partially_staged(path), [&]() -> Result<bool> {
        auto status = git().porcelain_status(path);
        if (status.is_err()) return std::move(status).error();
        const std::string& xy = status.value();
        if (xy.size() < 2) return Result<bool>::ok(false);

        bool staged = std::string("MARC").find(xy[0]) != std::string::npos;
        bool unstaged = std::string("MD").find(xy[1]) != std::string::npos;
        return Result<bool>::ok(staged && unstaged);
    }).get();
}

Result<std::string> Present::read_file_from_index(const std::string& path) {
    return cache().get_or_set<std::string>(keys::index(path), [&]() {
        return git().read_file_from_index(path);
    }).get();
}

Result<Commit> Present::get_last_commit() {
    return cache().get_or_set<Commit>(keys::last_commit(), [this]() {
        return git().get_head_commit();
    }).get();
}

Result<Commit> Present::get_commit(const std::string& ref) {
    return cache().get_or_set<Commit>(keys::commit(ref), [&]() {
        return git().get_commit(ref);
    }).get();
}

Result<std::vector<std::string>> Present::get_branches() {
    return cache().get_or_set<std::vector<std::string>>(keys::branches(), [this]() {
        return git().get_branches();
    }).get();
}

Result<Branch> Present::get_current_branch() {
    return cache().get_or_set<Branch>(keys::current_branch(), [this]() {
        return git().get_current_branch();
    }).get();
}

Result<std::vector<Remote>> Present::get_remotes() {
    return cache().get_or_set<std::vector<Remote>>(keys::remotes(), [this]() {
        return git().get_remotes();
    }).get();
}

Result<int> Present::get_ahead_count(const std::string& branch) {
    return cache().get_or_set<int>(keys::ahead_count(branch), [&]() {
        return git().count_commits(branch + "@{upstream}", branch);
    }).get();
}

Result<int> Present::get_behind_count(const std::string& branch) {
    return cache().get_or_set<int>(keys::behind_count(branch), [&]() {
        return git().count_commits(branch, branch + "@{upstream}");
    }).get();
}

Result<std::optional<Remote>> Present::get_remote_for_branch(const std::string& branch) {
    using R = Result<std::optional<Remote>>;

    auto name = get_config("branch." + branch + ".remote", false);
    if (name.is_err()) return std::move(name).error();
    if (!name.value()) return R::ok(std::nullopt);

    auto remotes = get_remotes();
    if (remotes.is_err()) return std::move(remotes).error();
    for (const auto& remote : remotes.value()) {
        if (remote.name == *name.value()) return R::ok(remote);
    }
    return R::ok(std::nullopt);
}

Result<std::vector<MergeConflict>> Present::get_merge_conflicts() {
    auto bundle = get_statuses_for_changed_files();
    if (bundle.is_err()) return std::move(bundle).error();

    // merge_conflict_files is a std::map, so rows come out sorted by path
    std::vector<MergeConflict> conflicts;
    for (const auto& [path, status] : bundle.value()->merge_conflict_files) {
        conflicts.push_back(MergeConflict{path, status});
    }
    return Result<std::vector<MergeConflict>>::ok(std::move(conflicts));
}

Result<bool> Present::path_has_merge_markers(const std::string& path) {
    auto content = repo_.object_store_->read_file(path);
    if (content.is_err()) return std::move(content).error();
    if (!content.value()) return Result<bool>::ok(false);
    return Result<bool>::ok(has_merge_markers(*content.value()));
}

} // namespace vista
