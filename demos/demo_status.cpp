// demo_status.cpp
//
// Opens a working directory as a vista Repository and prints what the model
// sees: lifecycle state, current branch, last commit, staged and unstaged
// changes, merge conflicts and discard history. Run it with:
//
//     ./vista_status                # current directory
//     ./vista_status ~/src/project  # any working directory
//     ./vista_status /tmp/empty     # not a repository -> Absent
//
// Set [log] level = "debug" in <dir>/.vista.toml to watch every git command.

#include <vista/repository.hpp>
#include <vista/log.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace vista;

static void print_changes(const char* title, const std::vector<FileChange>& changes) {
    std::cout << title << " (" << changes.size() << ")\n";
    for (const auto& c : changes) {
        std::cout << "  " << file_status_name(c.status) << "  " << c.file_path << "\n";
    }
}

// Print the error and report failure to main
template<typename T>
static bool check(const Result<T>& r) {
    if (r.is_err()) {
        std::cerr << r.error().format() << "\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    std::string dir = argc > 1 ? argv[1] : fs::current_path().string();

    auto opened = Repository::open(dir);
    if (!check(opened)) return 1;
    auto repo = std::move(opened).value();

    repo->get_load_promise().wait();
    std::cout << "state:  " << repo->state_name() << "\n";
    if (!repo->is_present()) {
        std::cout << "no repository at " << dir << "\n";
        return 0;
    }

    auto branch = repo->get_current_branch().get();
    if (!check(branch)) return 1;
    std::cout << "branch: " << branch.value().name
              << (branch.value().detached ? " (detached)" : "") << "\n";

    auto last = repo->get_last_commit().get();
    if (!check(last)) return 1;
    if (last.value().is_present()) {
        std::string subject = last.value().message.substr(0, last.value().message.find('\n'));
        std::cout << "head:   " << last.value().sha.substr(0, 10) << " " << subject << "\n";
    } else {
        std::cout << "head:   (no commits yet)\n";
    }

    if (!branch.value().detached) {
        auto ahead = repo->get_ahead_count(branch.value().name).get();
        auto behind = repo->get_behind_count(branch.value().name).get();
        if (check(ahead) && check(behind)) {
            std::cout << "ahead " << ahead.value() << ", behind " << behind.value() << "\n";
        }
    }
    std::cout << "\n";

    auto staged = repo->get_staged_changes().get();
    auto unstaged = repo->get_unstaged_changes().get();
    if (!check(staged) || !check(unstaged)) return 1;
    print_changes("staged", staged.value());
    print_changes("unstaged", unstaged.value());

    auto conflicts = repo->get_merge_conflicts().get();
    if (!check(conflicts)) return 1;
    if (!conflicts.value().empty()) {
        std::cout << "conflicts (" << conflicts.value().size() << ")\n";
        for (const auto& c : conflicts.value()) {
            std::cout << "  ours " << file_status_name(c.status.ours)
                      << ", theirs " << file_status_name(c.status.theirs)
                      << ", file " << file_status_name(c.status.file)
                      << "  " << c.file_path << "\n";
        }
    }

    auto history = repo->get_discard_history().get();
    if (check(history) && !history.value().empty()) {
        std::cout << "discard history: " << history.value().size() << " entr"
                  << (history.value().size() == 1 ? "y" : "ies") << "\n";
    }

    repo->destroy();
    return 0;
}
