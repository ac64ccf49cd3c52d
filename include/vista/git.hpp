#pragma once

#include <vista/models.hpp>
#include <vista/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vista {

// The tree every repository has before its first commit
inline constexpr char EMPTY_TREE_SHA[] = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandOptions {
    std::string working_dir;
    std::string stdin_data;     // written to the child's stdin, then closed
    int timeout_seconds = 60;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options = {});

struct ExecOptions {
    std::string stdin_data;
    // Exit codes other than 0 that are not failures
    // (e.g. `git config --get` returns 1 for an unset key)
    std::vector<int> allowed_exit_codes;
};

// Which side of a three-way diff `git checkout --ours/--theirs` takes
enum class Side { Ours, Theirs };

struct MergeFileResult {
    std::string content;
    bool conflict = false;
};

// The version-control collaborator: git driven as a subprocess in one
// working directory. exec() is the single seam every primitive goes
// through; tests subclass it to observe or script commands.
class GitShellOut {
public:
    GitShellOut(std::string working_dir, std::string git_binary = "git",
                int timeout_seconds = 60);
    virtual ~GitShellOut() = default;

    // Run `git <args>` in the working directory. Non-zero exit codes not in
    // allowed_exit_codes become CommandFailure.
    virtual Result<CommandResult> exec(const std::vector<std::string>& args,
                                       const ExecOptions& options = {});

    const std::string& working_dir() const { return working_dir_; }
    void set_working_dir(std::string dir) { working_dir_ = std::move(dir); }

    // ---- Repository discovery / creation ----

    // True when the working directory is inside a git work tree
    Result<bool> is_git_repository();
    // Absolute path of the .git directory
    Result<std::string> resolve_git_dir();
    Status init();
    Status clone(const std::string& url, const std::string& dest);

    // ---- Status ----

    // `git diff --name-status` between two sources
    Result<std::map<std::string, FileStatus>> diff_name_status(
        const std::vector<std::string>& extra_args);
    Result<std::vector<std::string>> untracked_files();
    Result<std::vector<IndexStageEntry>> unmerged_entries();
    // Blob shas recorded at HEAD for the given paths (absent paths omitted)
    Result<std::map<std::string, std::string>> head_blob_shas(
        const std::vector<std::string>& paths);
    // Two-letter porcelain status for one path, empty when clean
    Result<std::string> porcelain_status(const std::string& path);
    Result<bool> is_tracked(const std::string& path);
    bool is_merging(const std::string& git_dir) const;

    // ---- Diffs ----

    // Raw unified diff for one path. staged: index vs HEAD; amending:
    // index vs HEAD~. Unstaged untracked files are diffed against /dev/null.
    Result<std::string> diff_for_path(const std::string& path,
                                      bool staged, bool amending);
    Result<bool> has_parent_commit();

    // ---- Index ----

    Status stage_files(const std::vector<std::string>& paths);
    Status unstage_files(const std::vector<std::string>& paths,
                         const std::string& commit = "HEAD");
    Status apply_patch(const std::string& patch_text, bool index);
    Result<std::string> read_file_from_index(const std::string& path);
    Status update_index_info(const std::string& index_info);

    // ---- History ----

    // Commit at <ref>; an unresolvable HEAD yields an empty Commit
    Result<Commit> get_commit(const std::string& ref);
    Result<Commit> get_head_commit() { return get_commit("HEAD"); }
    Status commit(const std::string& message, bool amend, bool allow_empty);
    Status merge(const std::string& ref);
    Status abort_merge();
    Status checkout(const std::string& revision, bool create_new);
    Status checkout_paths(const std::vector<std::string>& paths,
                          const std::string& revision);
    Status checkout_side(Side side, const std::vector<std::string>& paths);

    // ---- Refs / remotes ----

    Result<std::vector<std::string>> get_branches();
    Result<Branch> get_current_branch();
    Result<std::vector<Remote>> get_remotes();
    // Commits reachable from `to` but not `from`; 0 when either is unknown
    Result<int> count_commits(const std::string& from, const std::string& to);
    Status fetch(const std::string& remote, const std::string& branch);
    Status pull(const std::string& remote, const std::string& branch);
    Status push(const std::string& remote, const std::string& branch,
                bool set_upstream);

    // ---- Config ----

    Result<std::optional<std::string>> get_config(const std::string& key, bool local);
    Status set_config(const std::string& key, const std::string& value);
    Status unset_config(const std::string& key);

    // ---- Object store ----

    // `git hash-object -w --stdin`
    Result<std::string> write_blob(const std::string& content);
    // `git hash-object -w <path>`; empty string when the file is missing
    Result<std::string> store_file(const std::string& path);
    // Same id without writing the object
    Result<std::string> hash_file(const std::string& path);
    // `git cat-file blob <sha>`; MissingObject when it does not resolve
    Result<std::string> read_blob(const std::string& sha);
    // `git merge-file -p` over three in-memory texts
    Result<MergeFileResult> merge_file(const std::string& ours,
                                       const std::string& base,
                                       const std::string& theirs);

private:
    std::string working_dir_;
    std::string git_binary_;
    int timeout_seconds_;
};

// Split NUL-separated git output, dropping the trailing empty field
std::vector<std::string> split_nul(const std::string& s);

// Parse `git diff --name-status -z` output
std::map<std::string, FileStatus> parse_name_status(const std::string& output);

// Parse `git ls-files -u -z` output
std::vector<IndexStageEntry> parse_unmerged_entries(const std::string& output);

} // namespace vista
