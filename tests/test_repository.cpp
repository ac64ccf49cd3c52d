#include <catch2/catch.hpp>
#include <vista/repository.hpp>
#include "git_fixture.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

using namespace vista;

using Transitions = std::vector<std::pair<std::string, std::string>>;

static std::unique_ptr<Repository> open_loaded(const fs::path& dir) {
    auto repo = std::make_unique<Repository>(dir.string());
    repo->get_load_promise().wait();
    return repo;
}

static std::unique_ptr<Repository> open_present(const fs::path& dir) {
    auto repo = open_loaded(dir);
    REQUIRE(repo->is_present());
    return repo;
}

template<typename T>
static T ok_value(const Future<T>& f) {
    auto r = f.get();
    if (r.is_err()) FAIL(r.error().format());
    return r.value();
}

static void require_ok(const Future<std::monostate>& f) {
    auto r = f.get();
    if (r.is_err()) FAIL(r.error().format());
}

static std::string head_sha(const fs::path& dir) {
    auto out = git_ok(dir, {"rev-parse", "HEAD"});
    return out.substr(0, out.find('\n'));
}

// ===== Lifecycle =====

TEST_CASE("repository loads as present", "[repository]") {
    TempDir td;
    make_three_files(td.path);

    auto repo = std::make_unique<Repository>(td.str());
    repo->get_load_promise().wait();
    REQUIRE(repo->is_present());
    REQUIRE(repo->state_name() == "Present");
    REQUIRE(repo->is_in_state("Present"));
    REQUIRE_FALSE(repo->is_loading());
    REQUIRE_FALSE(repo->is_empty());
    REQUIRE(repo->working_directory() == td.str());
}

TEST_CASE("directory without a repository loads as absent", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);
    REQUIRE(repo->is_absent());
    REQUIRE(repo->is_empty());
    REQUIRE(repo->show_tab_init());
    REQUIRE_FALSE(repo->is_undetermined());
}

TEST_CASE("operations issued while loading wait for the load", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "changed\n");

    Repository repo(td.str());
    auto changes = repo.get_unstaged_changes();
    auto branch = repo.get_current_branch();

    REQUIRE(ok_value(changes) == std::vector<FileChange>{{"a.txt", FileStatus::Modified}});
    REQUIRE(ok_value(branch).name == "master");
    REQUIRE(repo.is_present());
}

TEST_CASE("init turns an absent repository present", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);
    REQUIRE(repo->is_absent());

    std::mutex m;
    Transitions seen;
    auto id = repo->on_did_change_state([&](const std::string& from, const std::string& to) {
        std::lock_guard<std::mutex> lock(m);
        seen.emplace_back(from, to);
    });

    require_ok(repo->init());
    REQUIRE(repo->is_present());
    REQUIRE(fs::is_directory(td.path / ".git"));

    {
        std::lock_guard<std::mutex> lock(m);
        REQUIRE(seen == Transitions{{"Absent", "Loading"}, {"Loading", "Present"}});
    }

    repo->off_did_change_state(id);
    repo->destroy();
    std::lock_guard<std::mutex> lock(m);
    REQUIRE(seen.size() == 2);
}

TEST_CASE("init on a present repository fails", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    auto r = repo->init().get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::AlreadyExists);
    REQUIRE(repo->is_present());
}

TEST_CASE("clone into an absent repository", "[repository]") {
    TempDir td;
    auto pair = make_local_and_remote(td.path, false);
    fs::path dest = td.path / "cloned";
    fs::create_directories(dest);

    auto repo = open_loaded(dest);
    REQUIRE(repo->is_absent());
    require_ok(repo->clone(pair.remote.string()));
    REQUIRE(repo->is_present());

    auto remotes = ok_value(repo->get_remotes());
    REQUIRE(remotes.size() == 1);
    REQUIRE(remotes[0].name == "origin");
    REQUIRE(ok_value(repo->get_last_commit()).message == "third commit");
}

TEST_CASE("failed clone leaves the repository absent", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);

    auto r = repo->clone((td.path / "no-such-remote").string()).get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::CommandFailure);
    REQUIRE(repo->is_absent());
}

TEST_CASE("failed clone keeps the working directory", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);
    fs::path dest = td.path / "elsewhere";

    auto r = repo->clone((td.path / "no-such-remote").string(), dest.string()).get();
    REQUIRE(r.is_err());
    REQUIRE(repo->working_directory() == td.str());
    REQUIRE(repo->is_absent());
}

TEST_CASE("clone into another destination moves the working directory", "[repository]") {
    TempDir td;
    auto pair = make_local_and_remote(td.path, false);
    fs::path start = td.path / "start";
    fs::create_directories(start);
    fs::path dest = td.path / "moved";

    auto repo = open_loaded(start);
    require_ok(repo->clone(pair.remote.string(), dest.string()));
    REQUIRE(repo->working_directory() == dest.string());
    REQUIRE(repo->is_present());
    REQUIRE(ok_value(repo->get_last_commit()).message == "third commit");
}

TEST_CASE("destroy while init runs never leaves the load pending", "[repository]") {
    for (int round = 0; round < 5; ++round) {
        TempDir td;
        auto repo = open_loaded(td.path);
        REQUIRE(repo->is_absent());

        std::optional<Future<std::monostate>> init;
        std::thread t([&]() { init = repo->init(); });
        repo->destroy();
        t.join();

        REQUIRE(repo->is_destroyed());
        REQUIRE(repo->get_load_promise().wait_for(std::chrono::seconds(10)) ==
                std::future_status::ready);
        REQUIRE(init.has_value());
        REQUIRE(init->wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    }
}

TEST_CASE("init after destroy fails without a new load", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);
    repo->destroy();

    auto r = repo->init().get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::Destroyed);
    REQUIRE(repo->get_load_promise().wait_for(std::chrono::seconds(0)) ==
            std::future_status::ready);
}

TEST_CASE("state callback may start a new load from the loader thread", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);
    REQUIRE(repo->is_absent());

    std::mutex m;
    std::atomic<bool> fired{false};
    std::optional<Future<std::monostate>> init;
    repo->on_did_change_state([&](const std::string& from, const std::string& to) {
        if (from != "Loading" || to != "Absent" || fired.exchange(true)) return;
        auto f = repo->init();
        std::lock_guard<std::mutex> lock(m);
        init = f;
    });

    // The failed clone lands back in Absent on the loader thread
    auto cloned = repo->clone((td.path / "no-such-remote").string()).get();
    REQUIRE(cloned.is_err());

    Future<std::monostate> pending;
    {
        std::lock_guard<std::mutex> lock(m);
        REQUIRE(init.has_value());
        pending = *init;
    }
    require_ok(pending);
    REQUIRE(repo->is_present());
}

TEST_CASE("path-less placeholders", "[repository]") {
    auto absent = Repository::absent();
    REQUIRE(absent->is_absent());
    REQUIRE(absent->get_load_promise().wait_for(std::chrono::seconds(0)) ==
            std::future_status::ready);

    auto init = absent->init().get();
    REQUIRE(init.is_err());
    REQUIRE(init.error().code == VistaError::InvalidArg);

    auto guess = Repository::absent_guess();
    REQUIRE(guess->is_absent_guess());
    REQUIRE(guess->is_undetermined());
    REQUIRE(guess->is_empty());
    REQUIRE(guess->show_tab_init());

    auto loading = Repository::loading_guess();
    REQUIRE(loading->is_loading_guess());
    REQUIRE(loading->is_undetermined());
    REQUIRE(loading->show_tab_loading());
    REQUIRE_FALSE(loading->is_empty());
}

TEST_CASE("placeholders refuse mutations and read empty", "[repository]") {
    TempDir td;
    auto repo = open_loaded(td.path);

    auto staged = repo->stage_files({"a.txt"}).get();
    REQUIRE(staged.is_err());
    REQUIRE(staged.error().code == VistaError::NotReady);
    REQUIRE_FALSE(staged.error().hint.empty());

    REQUIRE(repo->commit("message").get().error().code == VistaError::NotReady);
    REQUIRE(repo->restore_last_discard().get().error().code == VistaError::NotReady);

    REQUIRE(ok_value(repo->get_staged_changes()).empty());
    REQUIRE(ok_value(repo->get_unstaged_changes()).empty());
    REQUIRE(ok_value(repo->get_merge_conflicts()).empty());
    REQUIRE_FALSE(ok_value(repo->get_last_commit()).is_present());
    REQUIRE_FALSE(ok_value(repo->is_merging()));
    REQUIRE_FALSE(ok_value(repo->has_discard_history()));
    REQUIRE(ok_value(repo->get_file_patch_for_path("a.txt")) == nullptr);
}

TEST_CASE("destroyed repository fails every operation", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    repo->destroy();
    repo->destroy();
    REQUIRE(repo->is_destroyed());
    REQUIRE(repo->state_name() == "Destroyed");

    auto staged = repo->stage_files({"a.txt"}).get();
    REQUIRE(staged.is_err());
    REQUIRE(staged.error().code == VistaError::Destroyed);
    REQUIRE(repo->get_staged_changes().get().error().code == VistaError::Destroyed);
    REQUIRE(repo->get_last_commit().get().error().code == VistaError::Destroyed);
    REQUIRE(repo->init().get().error().code == VistaError::Destroyed);
}

// ===== Index and working tree =====

TEST_CASE("staged and unstaged changes", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "changed\n");
    fs::remove(td.path / "b.txt");
    write_file(td.path, "d.txt", "new\n");
    auto repo = open_present(td.path);

    REQUIRE(ok_value(repo->get_unstaged_changes()) == std::vector<FileChange>{
        {"a.txt", FileStatus::Modified},
        {"b.txt", FileStatus::Deleted},
        {"d.txt", FileStatus::Added},
    });
    REQUIRE(ok_value(repo->get_staged_changes()).empty());

    require_ok(repo->stage_files({"a.txt", "d.txt"}));
    REQUIRE(ok_value(repo->get_staged_changes()) == std::vector<FileChange>{
        {"a.txt", FileStatus::Modified},
        {"d.txt", FileStatus::Added},
    });
    REQUIRE(ok_value(repo->get_unstaged_changes()) == std::vector<FileChange>{
        {"b.txt", FileStatus::Deleted},
    });
    REQUIRE(ok_value(repo->read_file_from_index("a.txt")) == "changed\n");

    require_ok(repo->unstage_files({"a.txt"}));
    REQUIRE(ok_value(repo->get_staged_changes()) == std::vector<FileChange>{
        {"d.txt", FileStatus::Added},
    });
    REQUIRE(ok_value(repo->read_file_from_index("a.txt")) == "foo\n");
}

TEST_CASE("stage then unstage restores the index", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "modified\n");
    fs::remove(td.path / "b.txt");
    fs::rename(td.path / "c.txt", td.path / "renamed.txt");
    write_file(td.path, "added.txt", "added\n");
    auto repo = open_present(td.path);

    std::vector<std::string> paths{"a.txt", "added.txt", "b.txt", "c.txt", "renamed.txt"};
    auto unstaged_before = ok_value(repo->get_unstaged_changes());
    REQUIRE(unstaged_before.size() == 5);

    require_ok(repo->stage_files(paths));
    REQUIRE(ok_value(repo->get_staged_changes()) == std::vector<FileChange>{
        {"a.txt", FileStatus::Modified},
        {"added.txt", FileStatus::Added},
        {"b.txt", FileStatus::Deleted},
        {"c.txt", FileStatus::Deleted},
        {"renamed.txt", FileStatus::Added},
    });
    REQUIRE(ok_value(repo->get_unstaged_changes()).empty());

    require_ok(repo->unstage_files(paths));
    REQUIRE(ok_value(repo->get_staged_changes()).empty());
    REQUIRE(ok_value(repo->get_unstaged_changes()) == unstaged_before);
}

TEST_CASE("staging in an unborn repository", "[repository]") {
    TempDir td;
    init_repo(td.path);
    write_file(td.path, "first.txt", "hello\n");
    auto repo = open_present(td.path);

    REQUIRE_FALSE(ok_value(repo->get_last_commit()).is_present());
    require_ok(repo->stage_files({"first.txt"}));
    REQUIRE(ok_value(repo->get_staged_changes()) == std::vector<FileChange>{
        {"first.txt", FileStatus::Added},
    });
    require_ok(repo->unstage_files({"first.txt"}));
    REQUIRE(ok_value(repo->get_staged_changes()).empty());
}

TEST_CASE("stage files from the parent commit", "[repository]") {
    TempDir td;
    make_multiple_commits(td.path);
    auto repo = open_present(td.path);

    REQUIRE(ok_value(repo->get_staged_changes_since_parent_commit()) ==
            std::vector<FileChange>{{"file.txt", FileStatus::Modified}});

    require_ok(repo->stage_files_from_parent_commit({"file.txt"}));
    REQUIRE(ok_value(repo->read_file_from_index("file.txt")) == "two\n");
    REQUIRE(ok_value(repo->get_staged_changes()) ==
            std::vector<FileChange>{{"file.txt", FileStatus::Modified}});
    REQUIRE(ok_value(repo->get_staged_changes_since_parent_commit()).empty());
    REQUIRE(read_file(td.path, "file.txt") == "three\n");
}

TEST_CASE("staged changes since the parent of a root commit", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    auto changes = ok_value(repo->get_staged_changes_since_parent_commit());
    REQUIRE(changes.size() == 6);
    for (const auto& c : changes) {
        REQUIRE(c.status == FileStatus::Added);
    }
    REQUIRE(changes[0].file_path == "a.txt");
}

TEST_CASE("reads are cached until a mutation or refresh", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    REQUIRE(ok_value(repo->get_unstaged_changes()).empty());
    REQUIRE(repo->cache().contains(keys::changed_files()));

    // Out-of-band edits stay invisible to cached reads
    write_file(td.path, "a.txt", "changed\n");
    REQUIRE(ok_value(repo->get_unstaged_changes()).empty());

    repo->refresh();
    REQUIRE(ok_value(repo->get_unstaged_changes()).size() == 1);

    write_file(td.path, "b.txt", "changed\n");
    require_ok(repo->stage_files({"a.txt"}));
    REQUIRE_FALSE(repo->cache().contains(keys::changed_files()));
    REQUIRE(ok_value(repo->get_unstaged_changes()) ==
            std::vector<FileChange>{{"b.txt", FileStatus::Modified}});
}

TEST_CASE("file patches are shared until invalidated", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "foo\nmore\n");
    auto repo = open_present(td.path);

    auto first = ok_value(repo->get_file_patch_for_path("a.txt"));
    auto second = ok_value(repo->get_file_patch_for_path("a.txt"));
    REQUIRE(first != nullptr);
    REQUIRE(first.get() == second.get());
    REQUIRE(first->status == FileStatus::Modified);
    REQUIRE(first->hunks.size() == 1);

    REQUIRE(ok_value(repo->get_file_patch_for_path("a.txt", {true, false})) == nullptr);
    REQUIRE(ok_value(repo->get_file_patch_for_path("b.txt")) == nullptr);

    require_ok(repo->stage_files({"a.txt"}));
    auto unstaged = ok_value(repo->get_file_patch_for_path("a.txt"));
    REQUIRE(unstaged == nullptr);
    auto staged = ok_value(repo->get_file_patch_for_path("a.txt", {true, false}));
    REQUIRE(staged != nullptr);
    REQUIRE(*staged == *first);
}

TEST_CASE("stage and unstage only invalidate the paths they touch", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "b.txt", "bar\nstaged\n");
    git_ok(td.path, {"add", "b.txt"});
    write_file(td.path, "a.txt", "foo\nmore\n");
    write_file(td.path, "b.txt", "bar\nstaged\nunstaged\n");
    auto repo = open_present(td.path);

    const FilePatchOptions staged{true, false};
    auto a_unstaged = ok_value(repo->get_file_patch_for_path("a.txt"));
    auto b_unstaged = ok_value(repo->get_file_patch_for_path("b.txt"));
    auto b_staged = ok_value(repo->get_file_patch_for_path("b.txt", staged));
    auto last = ok_value(repo->get_last_commit());
    REQUIRE(a_unstaged != nullptr);
    REQUIRE(b_unstaged != nullptr);
    REQUIRE(b_staged != nullptr);

    require_ok(repo->stage_files({"a.txt"}));
    REQUIRE_FALSE(repo->cache().contains(keys::file_patch("a.txt", false, false)));
    REQUIRE(repo->cache().contains(keys::file_patch("b.txt", false, false)));
    REQUIRE(repo->cache().contains(keys::file_patch("b.txt", true, false)));
    REQUIRE(repo->cache().contains(keys::last_commit()));

    REQUIRE(ok_value(repo->get_file_patch_for_path("a.txt")) == nullptr);
    REQUIRE(ok_value(repo->get_file_patch_for_path("b.txt")).get() == b_unstaged.get());
    REQUIRE(ok_value(repo->get_file_patch_for_path("b.txt", staged)).get() == b_staged.get());
    REQUIRE(ok_value(repo->get_last_commit()) == last);

    auto a_staged = ok_value(repo->get_file_patch_for_path("a.txt", staged));
    REQUIRE(a_staged != nullptr);

    require_ok(repo->unstage_files({"a.txt"}));
    REQUIRE_FALSE(repo->cache().contains(keys::file_patch("a.txt", true, false)));
    REQUIRE(repo->cache().contains(keys::file_patch("b.txt", false, false)));
    REQUIRE(repo->cache().contains(keys::file_patch("b.txt", true, false)));
    REQUIRE(repo->cache().contains(keys::last_commit()));

    REQUIRE(ok_value(repo->get_file_patch_for_path("a.txt", staged)) == nullptr);
    auto a_again = ok_value(repo->get_file_patch_for_path("a.txt"));
    REQUIRE(a_again != nullptr);
    REQUIRE(*a_again == *a_unstaged);
    REQUIRE(ok_value(repo->get_file_patch_for_path("b.txt")).get() == b_unstaged.get());
    REQUIRE(ok_value(repo->get_file_patch_for_path("b.txt", staged)).get() == b_staged.get());
}

TEST_CASE("refresh yields equal but distinct patches", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "b.txt", "bar\nmore\n");
    auto repo = open_present(td.path);

    auto before = ok_value(repo->get_file_patch_for_path("b.txt"));
    REQUIRE(before != nullptr);
    REQUIRE(ok_value(repo->get_file_patch_for_path("b.txt")).get() == before.get());

    repo->refresh();
    REQUIRE_FALSE(repo->cache().contains(keys::file_patch("b.txt", false, false)));

    auto after = ok_value(repo->get_file_patch_for_path("b.txt"));
    REQUIRE(after != nullptr);
    REQUIRE(after.get() != before.get());
    REQUIRE(*after == *before);
}

TEST_CASE("patch for an untracked file", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "new.txt", "brand new\n");
    auto repo = open_present(td.path);

    auto patch = ok_value(repo->get_file_patch_for_path("new.txt"));
    REQUIRE(patch != nullptr);
    REQUIRE(patch->status == FileStatus::Added);
    REQUIRE(patch->path() == "new.txt");
    REQUIRE(patch->hunks[0].lines[0].text == "brand new");
}

TEST_CASE("amending patch compares against the parent commit", "[repository]") {
    TempDir td;
    make_multiple_commits(td.path);
    auto repo = open_present(td.path);

    REQUIRE(ok_value(repo->get_file_patch_for_path("file.txt", {true, false})) == nullptr);
    auto amending = ok_value(repo->get_file_patch_for_path("file.txt", {true, true}));
    REQUIRE(amending != nullptr);
    REQUIRE(amending->hunks[0].lines[0] == Line{LineStatus::Deleted, "two", 1, -1});
    REQUIRE(amending->hunks[0].lines[1] == Line{LineStatus::Added, "three", -1, 1});
}

TEST_CASE("apply patch to index and back", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "foo\nadded line\n");
    auto repo = open_present(td.path);

    auto patch = ok_value(repo->get_file_patch_for_path("a.txt"));
    REQUIRE(patch != nullptr);
    require_ok(repo->apply_patch_to_index(*patch));
    REQUIRE(ok_value(repo->read_file_from_index("a.txt")) == "foo\nadded line\n");
    REQUIRE(ok_value(repo->get_staged_changes()) ==
            std::vector<FileChange>{{"a.txt", FileStatus::Modified}});

    auto staged = ok_value(repo->get_file_patch_for_path("a.txt", {true, false}));
    require_ok(repo->apply_patch_to_index(staged->get_unstage_patch()));
    REQUIRE(ok_value(repo->read_file_from_index("a.txt")) == "foo\n");
    REQUIRE(ok_value(repo->get_staged_changes()).empty());
}

TEST_CASE("apply patch to the working directory", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "foo\nadded line\n");
    auto repo = open_present(td.path);

    auto patch = ok_value(repo->get_file_patch_for_path("a.txt"));
    require_ok(repo->apply_patch_to_workdir(patch->get_unstage_patch()));
    REQUIRE(read_file(td.path, "a.txt") == "foo\n");
    REQUIRE(ok_value(repo->get_unstaged_changes()).empty());
}

TEST_CASE("is_partially_staged", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "foo\nstaged\n");
    write_file(td.path, "b.txt", "fully staged\n");
    auto repo = open_present(td.path);

    require_ok(repo->stage_files({"a.txt", "b.txt"}));
    write_file(td.path, "a.txt", "foo\nstaged\nunstaged\n");
    repo->refresh();

    REQUIRE(ok_value(repo->is_partially_staged("a.txt")));
    REQUIRE_FALSE(ok_value(repo->is_partially_staged("b.txt")));
    REQUIRE_FALSE(ok_value(repo->is_partially_staged("c.txt")));
}

TEST_CASE("discard working directory changes", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "changed\n");
    write_file(td.path, "subdir-1/b.txt", "changed\n");
    write_file(td.path, "d.txt", "untracked\n");
    auto repo = open_present(td.path);
    REQUIRE(ok_value(repo->get_unstaged_changes()).size() == 3);

    require_ok(repo->discard_work_dir_changes_for_paths({"a.txt", "d.txt"}));
    REQUIRE(read_file(td.path, "a.txt") == "foo\n");
    REQUIRE_FALSE(fs::exists(td.path / "d.txt"));
    REQUIRE(ok_value(repo->get_unstaged_changes()) ==
            std::vector<FileChange>{{"subdir-1/b.txt", FileStatus::Modified}});
}

TEST_CASE("discard keeps staged content", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "staged\n");
    auto repo = open_present(td.path);
    require_ok(repo->stage_files({"a.txt"}));
    write_file(td.path, "a.txt", "staged\nand more\n");
    repo->refresh();

    require_ok(repo->discard_work_dir_changes_for_paths({"a.txt"}));
    REQUIRE(read_file(td.path, "a.txt") == "staged\n");
}

TEST_CASE("checkout paths at a revision", "[repository]") {
    TempDir td;
    make_multiple_commits(td.path);
    auto repo = open_present(td.path);

    require_ok(repo->checkout_paths_at_revision({"file.txt"}, "HEAD~2"));
    REQUIRE(read_file(td.path, "file.txt") == "one\n");
    REQUIRE(ok_value(repo->read_file_from_index("file.txt")) == "one\n");

    require_ok(repo->checkout_paths_at_revision({"file.txt"}));
    REQUIRE(read_file(td.path, "file.txt") == "three\n");
}

// ===== Commits, branches and config =====

TEST_CASE("commit wraps and strips the message", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "changed\n");
    auto repo = open_present(td.path);
    require_ok(repo->stage_files({"a.txt"}));

    std::string body;
    for (int i = 0; i < 15; ++i) body += (i ? " " : "") + std::string("abcd");
    require_ok(repo->commit("Make a change\n\n" + body + "\n# a comment\n"));

    auto last = ok_value(repo->get_last_commit());
    std::string wrapped = body.substr(0, 69) + "\n" + body.substr(70);
    REQUIRE(last.message == "Make a change\n\n" + wrapped);
    REQUIRE(last.sha == head_sha(td.path));
    REQUIRE(ok_value(repo->get_staged_changes()).empty());
}

TEST_CASE("commit honours the configured wrap column", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    Settings settings;
    settings.commit_wrap_column = 9;
    auto repo = std::make_unique<Repository>(td.str(), settings);
    repo->get_load_promise().wait();

    require_ok(repo->commit("S\n\none two three four", {false, true}));
    REQUIRE(ok_value(repo->get_last_commit()).message == "S\n\none two\nthree\nfour");
}

TEST_CASE("commit amend and empty commits", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);
    auto before = ok_value(repo->get_last_commit());

    auto nothing = repo->commit("nothing staged").get();
    REQUIRE(nothing.is_err());
    REQUIRE(nothing.error().code == VistaError::CommandFailure);

    require_ok(repo->commit("Reworded", {true, false}));
    auto amended = ok_value(repo->get_last_commit());
    REQUIRE(amended.message == "Reworded");
    REQUIRE(amended.sha != before.sha);
    REQUIRE(ok_value(repo->get_commit(amended.sha)) == amended);
}

TEST_CASE("get_commit for an unknown ref", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);
    auto r = repo->get_commit("no-such-ref").get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::NotFound);
    REQUIRE_FALSE(repo->cache().contains(keys::commit("no-such-ref")));
}

TEST_CASE("checkout branches", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    require_ok(repo->checkout("feature", true));
    REQUIRE(ok_value(repo->get_current_branch()) == Branch{"feature", false});
    REQUIRE(ok_value(repo->get_branches()) == std::vector<std::string>{"feature", "master"});

    auto missing = repo->checkout("no-such-branch").get();
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().command == "git checkout no-such-branch");

    require_ok(repo->checkout("master"));
    REQUIRE(ok_value(repo->get_current_branch()).name == "master");

    require_ok(repo->checkout(head_sha(td.path)));
    REQUIRE(ok_value(repo->get_current_branch()).detached);
}

TEST_CASE("get and set config", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    REQUIRE_FALSE(ok_value(repo->get_config("vista.test", true)).has_value());
    require_ok(repo->set_config("vista.test", "one"));
    REQUIRE(ok_value(repo->get_config("vista.test", true)) == std::optional<std::string>("one"));
    require_ok(repo->set_config("vista.test", "two"));
    REQUIRE(ok_value(repo->get_config("vista.test")) == std::optional<std::string>("two"));
}

// ===== Remotes =====

TEST_CASE("fetch and pull bring in remote commits", "[repository]") {
    TempDir td;
    auto pair = make_local_and_remote(td.path, true);
    auto repo = open_present(pair.local);

    REQUIRE(ok_value(repo->get_behind_count("master")) == 0);
    require_ok(repo->fetch("master"));
    REQUIRE(ok_value(repo->get_behind_count("master")) == 1);
    REQUIRE(ok_value(repo->get_ahead_count("master")) == 0);
    REQUIRE(read_file(pair.local, "file.txt") == "second\n");

    require_ok(repo->commit("local one", {false, true}));
    require_ok(repo->commit("local two", {false, true}));
    REQUIRE(ok_value(repo->get_ahead_count("master")) == 2);
    REQUIRE(ok_value(repo->get_behind_count("master")) == 1);

    require_ok(repo->pull("master"));
    REQUIRE(ok_value(repo->get_behind_count("master")) == 0);
    REQUIRE(ok_value(repo->get_ahead_count("master")) == 3);
    REQUIRE(read_file(pair.local, "file.txt") == "third\n");
    REQUIRE(ok_value(repo->get_last_commit()).message.rfind("Merge", 0) == 0);
}

TEST_CASE("push sends local commits", "[repository]") {
    TempDir td;
    auto pair = make_local_and_remote(td.path, false);
    auto repo = open_present(pair.local);

    require_ok(repo->commit("empty one", {false, true}));
    require_ok(repo->commit("empty two", {false, true}));
    REQUIRE(ok_value(repo->get_ahead_count("master")) == 2);

    require_ok(repo->push("master"));
    REQUIRE(ok_value(repo->get_ahead_count("master")) == 0);
    REQUIRE(head_sha(pair.local) == git_ok(pair.remote, {"rev-parse", "master"}).substr(0, 40));
}

TEST_CASE("push a new branch with upstream", "[repository]") {
    TempDir td;
    auto pair = make_local_and_remote(td.path, false);
    auto repo = open_present(pair.local);

    require_ok(repo->checkout("topic", true));
    REQUIRE_FALSE(ok_value(repo->get_remote_for_branch("topic")).has_value());
    require_ok(repo->push("topic", true));

    auto remote = ok_value(repo->get_remote_for_branch("topic"));
    REQUIRE(remote.has_value());
    REQUIRE(remote->name == "origin");
}

TEST_CASE("remote for a branch follows renames and removals", "[repository]") {
    TempDir td;
    auto pair = make_local_and_remote(td.path, false);
    auto repo = open_present(pair.local);

    auto remote = ok_value(repo->get_remote_for_branch("master"));
    REQUIRE(remote.has_value());
    REQUIRE(remote->name == "origin");
    REQUIRE(remote->url == pair.remote.string());

    git_ok(pair.local, {"remote", "rename", "origin", "renamed"});
    repo->refresh();
    remote = ok_value(repo->get_remote_for_branch("master"));
    REQUIRE(remote.has_value());
    REQUIRE(remote->name == "renamed");

    git_ok(pair.local, {"remote", "rm", "renamed"});
    repo->refresh();
    REQUIRE_FALSE(ok_value(repo->get_remote_for_branch("master")).has_value());
}

TEST_CASE("fetch without a remote does nothing", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);
    require_ok(repo->fetch("master"));
    require_ok(repo->pull("master"));
    REQUIRE(ok_value(repo->get_ahead_count("master")) == 0);
    REQUIRE(ok_value(repo->get_behind_count("master")) == 0);
}

// ===== Merges =====

TEST_CASE("merge conflicts are classified", "[repository]") {
    TempDir td;
    make_merge_conflict(td.path);
    auto repo = open_present(td.path);

    REQUIRE_FALSE(ok_value(repo->is_merging()));
    auto merged = repo->merge("branch").get();
    REQUIRE(merged.is_err());
    REQUIRE(merged.error().code == VistaError::CommandFailure);
    REQUIRE(ok_value(repo->is_merging()));

    using S = FileStatus;
    REQUIRE(ok_value(repo->get_merge_conflicts()) == std::vector<MergeConflict>{
        {"added-to-both.txt", {S::Modified, S::Added, S::Added}},
        {"modified-on-both-ours.txt", {S::Modified, S::Modified, S::Modified}},
        {"modified-on-both-theirs.txt", {S::Modified, S::Modified, S::Modified}},
        {"removed-on-branch.txt", {S::Equivalent, S::Modified, S::Deleted}},
        {"removed-on-master.txt", {S::Added, S::Deleted, S::Modified}},
    });

    // Conflicted paths only show up as conflicts
    REQUIRE(ok_value(repo->get_staged_changes()).empty());
    REQUIRE(ok_value(repo->get_unstaged_changes()).empty());

    fs::remove(td.path / "removed-on-branch.txt");
    repo->refresh();
    auto conflicts = ok_value(repo->get_merge_conflicts());
    REQUIRE(conflicts[3].file_path == "removed-on-branch.txt");
    REQUIRE(conflicts[3].status.file == S::Deleted);
}

TEST_CASE("merge markers in conflicted files", "[repository]") {
    TempDir td;
    make_merge_conflict(td.path);
    git_any(td.path, {"merge", "branch"});
    auto repo = open_present(td.path);

    REQUIRE(ok_value(repo->path_has_merge_markers("modified-on-both-ours.txt")));
    REQUIRE(ok_value(repo->path_has_merge_markers("added-to-both.txt")));
    REQUIRE_FALSE(ok_value(repo->path_has_merge_markers("removed-on-branch.txt")));
    REQUIRE_FALSE(ok_value(repo->path_has_merge_markers("no-such-file.txt")));
}

TEST_CASE("resolving and re-conflicting a path", "[repository]") {
    TempDir td;
    make_merge_conflict(td.path);
    git_any(td.path, {"merge", "branch"});
    auto repo = open_present(td.path);

    std::map<int, std::string> shas;
    auto entries = repo->git().unmerged_entries().value();
    for (const auto& e : entries) {
        if (e.path == "modified-on-both-ours.txt") shas[e.stage] = e.sha;
    }
    REQUIRE(shas.size() == 3);

    require_ok(repo->checkout_side(Side::Ours, {"modified-on-both-ours.txt"}));
    REQUIRE(read_file(td.path, "modified-on-both-ours.txt") == "master modification\n");

    require_ok(repo->stage_files({"modified-on-both-ours.txt"}));
    REQUIRE(ok_value(repo->get_merge_conflicts()).size() == 4);

    require_ok(repo->write_merge_conflict_to_index(
        "modified-on-both-ours.txt", shas[1], shas[2], shas[3]));
    REQUIRE(ok_value(repo->get_merge_conflicts()).size() == 5);
}

TEST_CASE("commit during a merge with conflicts fails", "[repository]") {
    TempDir td;
    make_merge_conflict(td.path);
    git_any(td.path, {"merge", "branch"});
    auto repo = open_present(td.path);
    auto before = head_sha(td.path);

    auto r = repo->commit("Merge branch").get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::CommandFailure);
    REQUIRE(r.error().command.rfind("git commit", 0) == 0);
    REQUIRE(head_sha(td.path) == before);
    REQUIRE(ok_value(repo->is_merging()));
}

TEST_CASE("abort merge with unrelated changes", "[repository]") {
    TempDir td;
    make_merge_conflict_abort(td.path);
    git_any(td.path, {"merge", "spanish"});
    write_file(td.path, "fruit.txt", "banana\n");
    auto repo = open_present(td.path);
    REQUIRE(ok_value(repo->is_merging()));

    require_ok(repo->abort_merge());
    REQUIRE_FALSE(ok_value(repo->is_merging()));
    REQUIRE(read_file(td.path, "fruit.txt") == "banana\n");
    REQUIRE(read_file(td.path, "color.txt") == "crimson\n");
    REQUIRE(ok_value(repo->get_merge_conflicts()).empty());
}

TEST_CASE("abort merge refuses to clobber a merged file", "[repository]") {
    TempDir td;
    make_merge_conflict_abort(td.path);
    git_any(td.path, {"merge", "spanish"});
    write_file(td.path, "animal.txt", "dirty\n");
    auto repo = open_present(td.path);

    auto r = repo->abort_merge().get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::CommandFailure);
    REQUIRE(r.error().command.rfind("git merge --abort", 0) == 0);
    REQUIRE(ok_value(repo->is_merging()));
    REQUIRE(read_file(td.path, "animal.txt") == "dirty\n");
}

// ===== Discard history =====

TEST_CASE("discard history survives reopening the repository", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "precious\n");

    {
        auto repo = open_present(td.path);
        Repository* r = repo.get();
        auto entry = ok_value(repo->store_before_and_after_blobs(
            {"a.txt"}, nullptr, [r]() {
                return r->discard_work_dir_changes_for_paths({"a.txt"}).get();
            }));
        REQUIRE(entry.size() == 1);
        REQUIRE(read_file(td.path, "a.txt") == "foo\n");
        REQUIRE(ok_value(repo->has_discard_history()));
        REQUIRE(ok_value(repo->get_config("vista.historySha", true)).has_value());
    }

    auto reopened = open_present(td.path);
    REQUIRE(ok_value(reopened->has_discard_history()));
    // Equal stacks serialize to the blob the first instance recorded
    REQUIRE(ok_value(reopened->create_discard_history_blob()) ==
            *ok_value(reopened->get_config("vista.historySha", true)));
    auto last = ok_value(reopened->get_last_history_snapshots());
    REQUIRE(last.has_value());
    REQUIRE((*last)[0].path == "a.txt");

    auto restored = ok_value(reopened->restore_last_discard());
    REQUIRE(restored.restored == std::vector<std::string>{"a.txt"});
    REQUIRE(read_file(td.path, "a.txt") == "precious\n");
    REQUIRE_FALSE(ok_value(reopened->has_discard_history()));
    REQUIRE(ok_value(reopened->get_unstaged_changes()) ==
            std::vector<FileChange>{{"a.txt", FileStatus::Modified}});
}

TEST_CASE("partial discard history by group key", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "foo\nextra\n");
    auto repo = open_present(td.path);
    Repository* r = repo.get();

    auto patch = ok_value(repo->get_file_patch_for_path("a.txt"));
    ok_value(repo->store_before_and_after_blobs({"a.txt"}, nullptr, [r, patch]() {
        return r->apply_patch_to_workdir(patch->get_unstage_patch()).get();
    }, "a.txt"));

    REQUIRE(ok_value(repo->has_discard_history("a.txt")));
    REQUIRE_FALSE(ok_value(repo->has_discard_history()));
    REQUIRE(ok_value(repo->get_discard_history("a.txt")).size() == 1);

    auto popped = ok_value(repo->pop_discard_history("a.txt"));
    REQUIRE(popped.has_value());
    REQUIRE_FALSE(ok_value(repo->has_discard_history("a.txt")));
    REQUIRE_FALSE(ok_value(repo->pop_discard_history("a.txt")).has_value());
}

TEST_CASE("clear and reload discard history", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    write_file(td.path, "a.txt", "changed\n");
    auto repo = open_present(td.path);
    Repository* r = repo.get();

    ok_value(repo->store_before_and_after_blobs({"a.txt"}, nullptr, [r]() {
        return r->discard_work_dir_changes_for_paths({"a.txt"}).get();
    }));
    auto blob = ok_value(repo->create_discard_history_blob());
    REQUIRE_FALSE(blob.empty());
    REQUIRE(ok_value(repo->update_discard_history()) == blob);

    require_ok(repo->clear_discard_history());
    REQUIRE_FALSE(ok_value(repo->has_discard_history()));

    require_ok(repo->reload_discard_history());
    REQUIRE_FALSE(ok_value(repo->has_discard_history()));

    require_ok(repo->set_config("vista.historySha", blob));
    require_ok(repo->reload_discard_history());
    REQUIRE(ok_value(repo->has_discard_history()));
}

TEST_CASE("bad discard history pointer loads empty", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);

    require_ok(repo->set_config("vista.historySha", std::string(40, '1')));
    require_ok(repo->reload_discard_history());
    REQUIRE_FALSE(ok_value(repo->has_discard_history()));
    REQUIRE(ok_value(repo->get_discard_history()).empty());

    auto reopened = open_present(td.path);
    REQUIRE_FALSE(ok_value(reopened->has_discard_history()));
}

TEST_CASE("restore with nothing recorded", "[repository]") {
    TempDir td;
    make_three_files(td.path);
    auto repo = open_present(td.path);
    auto r = repo->restore_last_discard().get();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VistaError::NotFound);
}
