#include <vista/git.hpp>
#include <vista/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace vista {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options) {
    if (args.empty()) {
        return VistaError{VistaError::InvalidArg, "run_command: empty args"};
    }

    // A child that exits before draining stdin must not kill us
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // O_CLOEXEC: children forked concurrently from other threads must not
    // inherit our pipe ends, or our child never sees EOF on stdin.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 ||
        pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return VistaError{VistaError::IO,
            std::string("pipe2() failed: ") + strerror(err)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return VistaError{VistaError::IO,
            std::string("fork() failed: ") + strerror(err)};
    }

    if (pid == 0) {
        // Child process; dup2 clears O_CLOEXEC on the standard descriptors
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!options.working_dir.empty()) {
            if (chdir(options.working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // Set non-blocking on our ends
    fcntl(stdin_pipe[1], F_SETFL, O_NONBLOCK);
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    const std::string& input = options.stdin_data;
    size_t written = 0;
    int stdin_fd = stdin_pipe[1];
    if (input.empty()) {
        close(stdin_fd);
        stdin_fd = -1;
    }

    std::string out_buf, err_buf;
    char buf[4096];
    auto start = std::chrono::steady_clock::now();

    auto close_all = [&]() {
        if (stdin_fd >= 0) close(stdin_fd);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    };

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= options.timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_all();
            return VistaError{VistaError::IO,
                "command timed out after " + std::to_string(options.timeout_seconds)
                + "s: " + args[0]};
        }

        // Feed stdin as the child accepts it
        if (stdin_fd >= 0) {
            ssize_t w = write(stdin_fd, input.data() + written, input.size() - written);
            if (w > 0) {
                written += static_cast<size_t>(w);
            } else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                // EPIPE: the child stopped reading; its exit status tells the rest
                written = input.size();
            }
            if (written >= input.size()) {
                close(stdin_fd);
                stdin_fd = -1;
            }
        }

        // Read available data
        ssize_t n;
        while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
            out_buf.append(buf, static_cast<size_t>(n));
        }
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            err_buf.append(buf, static_cast<size_t>(n));
        }

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            // Drain remaining data
            while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
                out_buf.append(buf, static_cast<size_t>(n));
            }
            while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
                err_buf.append(buf, static_cast<size_t>(n));
            }
            close_all();

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            int err = errno;
            close_all();
            return VistaError{VistaError::IO,
                std::string("waitpid failed: ") + strerror(err)};
        }

        // Brief sleep to avoid busy-wait
        usleep(500);
    }
}

// ---------------------------------------------------------------------------
// Output parsing (pure functions)
// ---------------------------------------------------------------------------

static std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

static std::string trim_trailing_whitespace(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream stream(s);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_nul(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < s.size()) {
        size_t pos = s.find('\0', start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::map<std::string, FileStatus> parse_name_status(const std::string& output) {
    // -z output: "<code>\0<path>\0" repeated. Codes may carry a score (R100).
    std::map<std::string, FileStatus> files;
    auto fields = split_nul(output);
    for (size_t i = 0; i + 1 < fields.size(); i += 2) {
        const std::string& code = fields[i];
        if (code.empty()) continue;
        auto status = file_status_from_code(code[0]);
        if (!status) continue;
        files[fields[i + 1]] = *status;
    }
    return files;
}

std::vector<IndexStageEntry> parse_unmerged_entries(const std::string& output) {
    // "<mode> <sha> <stage>\t<path>\0"
    std::vector<IndexStageEntry> entries;
    for (const auto& record : split_nul(output)) {
        auto tab = record.find('\t');
        if (tab == std::string::npos) continue;

        std::istringstream meta(record.substr(0, tab));
        IndexStageEntry e;
        if (!(meta >> e.mode >> e.sha >> e.stage)) continue;
        e.path = record.substr(tab + 1);
        entries.push_back(std::move(e));
    }
    return entries;
}

static std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ' ';
        out += args[i];
    }
    return out;
}

static std::vector<std::string> with_paths(std::vector<std::string> args,
                                           const std::vector<std::string>& paths) {
    args.push_back("--");
    args.insert(args.end(), paths.begin(), paths.end());
    return args;
}

// ---------------------------------------------------------------------------
// GitShellOut
// ---------------------------------------------------------------------------

GitShellOut::GitShellOut(std::string working_dir, std::string git_binary,
                         int timeout_seconds)
    : working_dir_(std::move(working_dir)),
      git_binary_(std::move(git_binary)),
      timeout_seconds_(timeout_seconds) {}

Result<CommandResult> GitShellOut::exec(const std::vector<std::string>& args,
                                        const ExecOptions& options) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(git_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    vista::log::debug("git %s", join_args(args).c_str());

    CommandOptions opts;
    std::error_code ec;
    if (!working_dir_.empty() && fs::is_directory(working_dir_, ec)) {
        opts.working_dir = working_dir_;
    }
    opts.stdin_data = options.stdin_data;
    opts.timeout_seconds = timeout_seconds_;

    auto r = run_command(argv, opts);
    if (r.is_err()) return std::move(r).error();

    int code = r.value().exit_code;
    if (code != 0 &&
        std::find(options.allowed_exit_codes.begin(),
                  options.allowed_exit_codes.end(), code)
            == options.allowed_exit_codes.end()) {
        vista::log::debug("git %s exited with %d", join_args(args).c_str(), code);
        return VistaError::command_failure(argv, code, std::move(r.value().stderr_str));
    }
    return r;
}

// ---- Repository discovery / creation ----

Result<bool> GitShellOut::is_git_repository() {
    std::error_code ec;
    if (working_dir_.empty() || !fs::is_directory(working_dir_, ec)) {
        return Result<bool>::ok(false);
    }

    auto r = exec({"rev-parse", "--show-toplevel"}, {"", {128}});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) return Result<bool>::ok(false);

    // A subdirectory of some other repository does not count
    fs::path top = trim_trailing_newlines(r.value().stdout_str);
    bool same = fs::equivalent(top, fs::path(working_dir_), ec);
    return Result<bool>::ok(!ec && same);
}

Result<std::string> GitShellOut::resolve_git_dir() {
    auto r = exec({"rev-parse", "--absolute-git-dir"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(r.value().stdout_str));
}

Status GitShellOut::init() {
    std::error_code ec;
    fs::create_directories(working_dir_, ec);
    if (ec) {
        return VistaError{VistaError::IO,
            "cannot create " + working_dir_ + ": " + ec.message()};
    }
    VISTA_TRY(exec({"init"}));
    return ok_status();
}

Status GitShellOut::clone(const std::string& url, const std::string& dest) {
    std::error_code ec;
    fs::path target = fs::absolute(dest, ec);
    if (ec) {
        return VistaError{VistaError::InvalidArg, "bad clone destination: " + dest};
    }
    fs::create_directories(target.parent_path(), ec);

    vista::log::info("cloning %s -> %s", url.c_str(), target.string().c_str());
    VISTA_TRY(exec({"clone", "--", url, target.string()}));
    return ok_status();
}

// ---- Status ----

Result<std::map<std::string, FileStatus>> GitShellOut::diff_name_status(
        const std::vector<std::string>& extra_args) {
    std::vector<std::string> args = {"diff", "--name-status", "--no-renames",
                                     "-z", "--no-color", "--no-ext-diff"};
    args.insert(args.end(), extra_args.begin(), extra_args.end());

    auto r = exec(args);
    if (r.is_err()) return std::move(r).error();
    return Result<std::map<std::string, FileStatus>>::ok(
        parse_name_status(r.value().stdout_str));
}

Result<std::vector<std::string>> GitShellOut::untracked_files() {
    auto r = exec({"ls-files", "--others", "--exclude-standard", "-z"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::vector<std::string>>::ok(split_nul(r.value().stdout_str));
}

Result<std::vector<IndexStageEntry>> GitShellOut::unmerged_entries() {
    auto r = exec({"ls-files", "-u", "-z"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::vector<IndexStageEntry>>::ok(
        parse_unmerged_entries(r.value().stdout_str));
}

Result<std::map<std::string, std::string>> GitShellOut::head_blob_shas(
        const std::vector<std::string>& paths) {
    std::map<std::string, std::string> shas;
    if (paths.empty()) return Result<std::map<std::string, std::string>>::ok(shas);

    auto head = get_head_commit();
    if (head.is_err()) return std::move(head).error();
    if (!head.value().is_present()) {
        return Result<std::map<std::string, std::string>>::ok(shas);
    }

    // "<mode> <type> <sha>\t<path>\0"
    auto r = exec(with_paths({"ls-tree", "-r", "-z", "HEAD"}, paths));
    if (r.is_err()) return std::move(r).error();
    for (const auto& record : split_nul(r.value().stdout_str)) {
        auto tab = record.find('\t');
        if (tab == std::string::npos) continue;
        std::istringstream meta(record.substr(0, tab));
        std::string mode, type, sha;
        if (!(meta >> mode >> type >> sha)) continue;
        shas[record.substr(tab + 1)] = sha;
    }
    return Result<std::map<std::string, std::string>>::ok(std::move(shas));
}

Result<std::string> GitShellOut::porcelain_status(const std::string& path) {
    auto r = exec(with_paths({"status", "--porcelain", "-z", "--untracked-files=all"},
                             {path}));
    if (r.is_err()) return std::move(r).error();
    const std::string& out = r.value().stdout_str;
    return Result<std::string>::ok(out.size() >= 2 ? out.substr(0, 2) : "");
}

Result<bool> GitShellOut::is_tracked(const std::string& path) {
    auto r = exec(with_paths({"ls-files", "--stage", "-z"}, {path}));
    if (r.is_err()) return std::move(r).error();
    for (const auto& record : split_nul(r.value().stdout_str)) {
        auto tab = record.find('\t');
        if (tab != std::string::npos && record.substr(tab + 1) == path) {
            return Result<bool>::ok(true);
        }
    }
    return Result<bool>::ok(false);
}

bool GitShellOut::is_merging(const std::string& git_dir) const {
    std::error_code ec;
    return !git_dir.empty() && fs::exists(fs::path(git_dir) / "MERGE_HEAD", ec);
}

// ---- Diffs ----

Result<bool> GitShellOut::has_parent_commit() {
    auto r = exec({"rev-parse", "--verify", "-q", "HEAD~^{commit}"}, {"", {1, 128}});
    if (r.is_err()) return std::move(r).error();
    return Result<bool>::ok(r.value().exit_code == 0);
}

Result<std::string> GitShellOut::diff_for_path(const std::string& path,
                                               bool staged, bool amending) {
    std::vector<std::string> args = {"-c", "core.quotepath=false", "diff",
                                     "--no-color", "--no-ext-diff", "--no-renames",
                                     "--src-prefix=a/", "--dst-prefix=b/"};

    if (!staged) {
        auto tracked = is_tracked(path);
        if (tracked.is_err()) return std::move(tracked).error();

        std::error_code ec;
        if (!tracked.value() && fs::exists(fs::path(working_dir_) / path, ec)) {
            // Untracked: diff against nothing. Exit code 1 means "differs".
            args.push_back("--no-index");
            auto r = exec(with_paths(args, {"/dev/null", path}), {"", {1}});
            if (r.is_err()) return std::move(r).error();
            return Result<std::string>::ok(std::move(r.value().stdout_str));
        }
    } else {
        args.push_back("--cached");
        std::string base;
        if (amending) {
            auto parent = has_parent_commit();
            if (parent.is_err()) return std::move(parent).error();
            base = parent.value() ? "HEAD~" : EMPTY_TREE_SHA;
        } else {
            auto head = get_head_commit();
            if (head.is_err()) return std::move(head).error();
            base = head.value().is_present() ? "HEAD" : EMPTY_TREE_SHA;
        }
        args.push_back(base);
    }

    auto r = exec(with_paths(args, {path}));
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

// ---- Index ----

Status GitShellOut::stage_files(const std::vector<std::string>& paths) {
    if (paths.empty()) return ok_status();
    VISTA_TRY(exec(with_paths({"add", "-A"}, paths)));
    return ok_status();
}

Status GitShellOut::unstage_files(const std::vector<std::string>& paths,
                                  const std::string& commit) {
    if (paths.empty()) return ok_status();

    auto head = get_head_commit();
    if (head.is_err()) return std::move(head).error();
    if (!head.value().is_present()) {
        // Nothing to reset to: drop the entries from the index
        VISTA_TRY(exec(with_paths({"rm", "--cached", "-q", "-r"}, paths)));
        return ok_status();
    }

    VISTA_TRY(exec(with_paths({"reset", "-q", commit}, paths)));
    return ok_status();
}

Status GitShellOut::apply_patch(const std::string& patch_text, bool index) {
    std::vector<std::string> args = {"apply"};
    if (index) args.push_back("--cached");
    args.push_back("-");
    VISTA_TRY(exec(args, {patch_text, {}}));
    return ok_status();
}

Result<std::string> GitShellOut::read_file_from_index(const std::string& path) {
    auto r = exec({"cat-file", "blob", ":" + path});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

Status GitShellOut::update_index_info(const std::string& index_info) {
    VISTA_TRY(exec({"update-index", "--index-info"}, {index_info, {}}));
    return ok_status();
}

// ---- History ----

Result<Commit> GitShellOut::get_commit(const std::string& ref) {
    auto sha = exec({"rev-parse", "--verify", "-q", ref + "^{commit}"}, {"", {1, 128}});
    if (sha.is_err()) return std::move(sha).error();
    if (sha.value().exit_code != 0) {
        if (ref == "HEAD") return Result<Commit>::ok(Commit{});
        return VistaError{VistaError::NotFound, "cannot resolve ref '" + ref + "'"};
    }

    std::string full_sha = trim_trailing_newlines(sha.value().stdout_str);
    auto r = exec({"log", "-1", "--format=%H%x00%B", full_sha});
    if (r.is_err()) return std::move(r).error();

    const std::string& out = r.value().stdout_str;
    auto nul = out.find('\0');
    if (nul == std::string::npos) {
        return VistaError{VistaError::Parse, "unexpected git log output for " + ref};
    }

    Commit c;
    c.sha = out.substr(0, nul);
    c.message = trim_trailing_whitespace(out.substr(nul + 1));
    return Result<Commit>::ok(std::move(c));
}

Status GitShellOut::commit(const std::string& message, bool amend, bool allow_empty) {
    std::vector<std::string> args = {"commit", "-m", message};
    if (amend) args.push_back("--amend");
    if (allow_empty) args.push_back("--allow-empty");
    VISTA_TRY(exec(args));
    return ok_status();
}

Status GitShellOut::merge(const std::string& ref) {
    VISTA_TRY(exec({"merge", "--no-edit", ref}));
    return ok_status();
}

Status GitShellOut::abort_merge() {
    VISTA_TRY(exec({"merge", "--abort"}));
    return ok_status();
}

Status GitShellOut::checkout(const std::string& revision, bool create_new) {
    std::vector<std::string> args = {"checkout"};
    if (create_new) args.push_back("-b");
    args.push_back(revision);
    VISTA_TRY(exec(args));
    return ok_status();
}

Status GitShellOut::checkout_paths(const std::vector<std::string>& paths,
                                   const std::string& revision) {
    if (paths.empty()) return ok_status();
    // An empty revision restores from the index
    std::vector<std::string> args = {"checkout"};
    if (!revision.empty()) args.push_back(revision);
    VISTA_TRY(exec(with_paths(args, paths)));
    return ok_status();
}

Status GitShellOut::checkout_side(Side side, const std::vector<std::string>& paths) {
    if (paths.empty()) return ok_status();
    VISTA_TRY(exec(with_paths(
        {"checkout", side == Side::Ours ? "--ours" : "--theirs"}, paths)));
    return ok_status();
}

// ---- Refs / remotes ----

Result<std::vector<std::string>> GitShellOut::get_branches() {
    auto r = exec({"for-each-ref", "--format=%(refname:short)", "refs/heads/"});
    if (r.is_err()) return std::move(r).error();
    return Result<std::vector<std::string>>::ok(split_lines(r.value().stdout_str));
}

Result<Branch> GitShellOut::get_current_branch() {
    auto r = exec({"symbolic-ref", "--short", "-q", "HEAD"}, {"", {1}});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code == 0) {
        return Result<Branch>::ok(
            Branch{trim_trailing_newlines(r.value().stdout_str), false});
    }

    auto sha = exec({"rev-parse", "--short", "HEAD"});
    if (sha.is_err()) return std::move(sha).error();
    return Result<Branch>::ok(Branch{trim_trailing_newlines(sha.value().stdout_str), true});
}

Result<std::vector<Remote>> GitShellOut::get_remotes() {
    auto r = exec({"config", "--get-regexp", "^remote\\..*\\.url$"}, {"", {1}});
    if (r.is_err()) return std::move(r).error();

    // "remote.<name>.url <url>"
    std::vector<Remote> remotes;
    for (const auto& line : split_lines(r.value().stdout_str)) {
        auto space = line.find(' ');
        if (space == std::string::npos) continue;
        std::string key = line.substr(0, space);
        const std::string prefix = "remote.";
        const std::string suffix = ".url";
        if (key.size() <= prefix.size() + suffix.size()) continue;
        remotes.push_back(Remote{
            key.substr(prefix.size(), key.size() - prefix.size() - suffix.size()),
            line.substr(space + 1)});
    }
    return Result<std::vector<Remote>>::ok(std::move(remotes));
}

Result<int> GitShellOut::count_commits(const std::string& from, const std::string& to) {
    for (const auto& ref : {from, to}) {
        auto v = exec({"rev-parse", "--verify", "-q", ref}, {"", {1, 128}});
        if (v.is_err()) return std::move(v).error();
        if (v.value().exit_code != 0) return Result<int>::ok(0);
    }

    auto r = exec({"rev-list", "--count", from + ".." + to});
    if (r.is_err()) return std::move(r).error();
    try {
        return Result<int>::ok(std::stoi(r.value().stdout_str));
    } catch (const std::exception&) {
        return VistaError{VistaError::Parse,
            "unexpected rev-list output: " + r.value().stdout_str};
    }
}

Status GitShellOut::fetch(const std::string& remote, const std::string& branch) {
    VISTA_TRY(exec({"fetch", remote, branch}));
    return ok_status();
}

Status GitShellOut::pull(const std::string& remote, const std::string& branch) {
    VISTA_TRY(exec({"pull", "--no-rebase", "--no-edit", remote, branch}));
    return ok_status();
}

Status GitShellOut::push(const std::string& remote, const std::string& branch,
                         bool set_upstream) {
    std::vector<std::string> args = {"push"};
    if (set_upstream) args.push_back("--set-upstream");
    args.push_back(remote);
    args.push_back(branch);
    VISTA_TRY(exec(args));
    return ok_status();
}

// ---- Config ----

Result<std::optional<std::string>> GitShellOut::get_config(const std::string& key,
                                                           bool local) {
    std::vector<std::string> args = {"config"};
    if (local) args.push_back("--local");
    args.push_back("--get");
    args.push_back(key);

    // Exit code 1: key not set
    auto r = exec(args, {"", {1}});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code == 1) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>>::ok(
        trim_trailing_newlines(r.value().stdout_str));
}

Status GitShellOut::set_config(const std::string& key, const std::string& value) {
    VISTA_TRY(exec({"config", key, value}));
    return ok_status();
}

Status GitShellOut::unset_config(const std::string& key) {
    // Exit code 5: key was not set
    VISTA_TRY(exec({"config", "--unset", key}, {"", {5}}));
    return ok_status();
}

// ---- Object store ----

static bool is_hex_sha(const std::string& s) {
    if (s.size() < 4 || s.size() > 64) return false;
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

Result<std::string> GitShellOut::write_blob(const std::string& content) {
    auto r = exec({"hash-object", "-w", "--stdin"}, {content, {}});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(r.value().stdout_str));
}

Result<std::string> GitShellOut::store_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(fs::path(working_dir_) / path, ec)) {
        return Result<std::string>::ok("");
    }
    auto r = exec({"hash-object", "-w", "--", path});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(r.value().stdout_str));
}

Result<std::string> GitShellOut::hash_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(fs::path(working_dir_) / path, ec)) {
        return Result<std::string>::ok("");
    }
    auto r = exec({"hash-object", "--", path});
    if (r.is_err()) return std::move(r).error();
    return Result<std::string>::ok(trim_trailing_newlines(r.value().stdout_str));
}

Result<std::string> GitShellOut::read_blob(const std::string& sha) {
    if (!is_hex_sha(sha)) {
        return VistaError{VistaError::MissingObject, "not an object id: '" + sha + "'"};
    }

    auto r = exec({"cat-file", "blob", sha}, {"", {1, 128}});
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return VistaError{VistaError::MissingObject, "no blob " + sha};
    }
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

namespace {

// Scratch files for merge-file, removed on scope exit
struct ScratchFile {
    fs::path path;

    explicit ScratchFile(const std::string& tag) {
        static std::atomic<unsigned> counter{0};
        path = fs::temp_directory_path() /
               ("vista_" + std::to_string(getpid()) + "_" +
                std::to_string(counter.fetch_add(1)) + "_" + tag);
    }

    ~ScratchFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    bool write(const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
        return static_cast<bool>(out);
    }
};

} // namespace

Result<MergeFileResult> GitShellOut::merge_file(const std::string& ours,
                                                const std::string& base,
                                                const std::string& theirs) {
    ScratchFile ours_file("ours"), base_file("base"), theirs_file("theirs");
    if (!ours_file.write(ours) || !base_file.write(base) || !theirs_file.write(theirs)) {
        return VistaError{VistaError::IO, "cannot write merge-file scratch files"};
    }

    // Positive exit codes count conflicts
    std::vector<int> conflicts;
    for (int i = 1; i < 128; ++i) conflicts.push_back(i);

    auto r = exec({"merge-file", "-p",
                   "-L", "current", "-L", "after-discard", "-L", "before-discard",
                   ours_file.path.string(), base_file.path.string(),
                   theirs_file.path.string()},
                  {"", conflicts});
    if (r.is_err()) return std::move(r).error();

    MergeFileResult result;
    result.content = std::move(r.value().stdout_str);
    result.conflict = r.value().exit_code != 0;
    return Result<MergeFileResult>::ok(std::move(result));
}

} // namespace vista
