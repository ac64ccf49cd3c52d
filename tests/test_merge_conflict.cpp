#include <catch2/catch.hpp>
#include <vista/merge_conflict.hpp>

using namespace vista;

static ConflictInput stages(bool base, bool ours, bool theirs) {
    ConflictInput in;
    in.has_base = base;
    in.has_ours = ours;
    in.has_theirs = theirs;
    in.head_sha = "aaaa";
    in.worktree_sha = "bbbb";
    return in;
}

// ===== classify_conflict =====

TEST_CASE("classify conflict modified on both sides", "[merge_conflict]") {
    auto s = classify_conflict(stages(true, true, true));
    REQUIRE(s.ours == FileStatus::Modified);
    REQUIRE(s.theirs == FileStatus::Modified);
    REQUIRE(s.file == FileStatus::Modified);
}

TEST_CASE("classify conflict added to both sides", "[merge_conflict]") {
    auto s = classify_conflict(stages(false, true, true));
    REQUIRE(s.ours == FileStatus::Added);
    REQUIRE(s.theirs == FileStatus::Added);
}

TEST_CASE("classify conflict deleted on one side", "[merge_conflict]") {
    auto removed_theirs = classify_conflict(stages(true, true, false));
    REQUIRE(removed_theirs.ours == FileStatus::Modified);
    REQUIRE(removed_theirs.theirs == FileStatus::Deleted);

    auto removed_ours = classify_conflict(stages(true, false, true));
    REQUIRE(removed_ours.ours == FileStatus::Deleted);
    REQUIRE(removed_ours.theirs == FileStatus::Modified);
}

TEST_CASE("classify conflict working file against HEAD", "[merge_conflict]") {
    auto in = stages(true, true, false);

    in.worktree_sha = "aaaa";
    REQUIRE(classify_conflict(in).file == FileStatus::Equivalent);

    in.worktree_sha.reset();
    REQUIRE(classify_conflict(in).file == FileStatus::Deleted);

    in.worktree_sha = "cccc";
    in.head_sha.reset();
    REQUIRE(classify_conflict(in).file == FileStatus::Added);
}

// ===== group_unmerged_entries =====

TEST_CASE("group_unmerged_entries collects stages per path", "[merge_conflict]") {
    std::vector<IndexStageEntry> entries{
        {"both.txt", "100644", "111", 1},
        {"both.txt", "100644", "222", 2},
        {"both.txt", "100644", "333", 3},
        {"added.txt", "100644", "444", 2},
        {"added.txt", "100644", "555", 3},
        {"gone.txt", "100644", "666", 1},
        {"gone.txt", "100644", "777", 2},
    };
    auto grouped = group_unmerged_entries(entries);
    REQUIRE(grouped.size() == 3);

    REQUIRE(grouped["both.txt"].has_base);
    REQUIRE(grouped["both.txt"].has_ours);
    REQUIRE(grouped["both.txt"].has_theirs);

    REQUIRE_FALSE(grouped["added.txt"].has_base);
    REQUIRE(grouped["added.txt"].has_ours);

    REQUIRE(grouped["gone.txt"].has_ours);
    REQUIRE_FALSE(grouped["gone.txt"].has_theirs);
    REQUIRE_FALSE(grouped["gone.txt"].head_sha.has_value());
}

// ===== Merge markers =====

TEST_CASE("is_merge_marker_line", "[merge_conflict]") {
    REQUIRE(is_merge_marker_line("<<<<<<<"));
    REQUIRE(is_merge_marker_line(">>>>>>>"));
    REQUIRE(is_merge_marker_line("<<<<<<< HEAD"));
    REQUIRE(is_merge_marker_line(">>>>>>> feature/branch"));
    REQUIRE(is_merge_marker_line("<<<<<<< HEAD\r"));

    REQUIRE_FALSE(is_merge_marker_line("<<<<<<"));
    REQUIRE_FALSE(is_merge_marker_line("<<<<<<<<"));
    REQUIRE_FALSE(is_merge_marker_line("<<<<<<< "));
    REQUIRE_FALSE(is_merge_marker_line("<<<<<<< two words"));
    REQUIRE_FALSE(is_merge_marker_line(" <<<<<<< HEAD"));
    REQUIRE_FALSE(is_merge_marker_line("<<<>>>>"));
    REQUIRE_FALSE(is_merge_marker_line("======="));
    REQUIRE_FALSE(is_merge_marker_line(""));
}

TEST_CASE("has_merge_markers scans every line", "[merge_conflict]") {
    REQUIRE(has_merge_markers(
        "intro\n<<<<<<< HEAD\nours\n=======\ntheirs\n>>>>>>> branch\n"));
    REQUIRE(has_merge_markers("text\n>>>>>>> branch"));
    REQUIRE_FALSE(has_merge_markers("plain text\nno conflicts here\n"));
    REQUIRE_FALSE(has_merge_markers("a << b\n=======\n"));
    REQUIRE_FALSE(has_merge_markers(""));
}

TEST_CASE("has_merge_markers accepts bare markers but not stray chevrons", "[merge_conflict]") {
    REQUIRE(has_merge_markers("no branch name:\n>>>>>>>\n<<<<<<<\n"));

    std::string chevrons =
        "not enough chevrons:\n>>> HEAD\n<<< branch\n\n"
        "too many chevrons:\n>>>>>>>>> HEAD\n<<<<<<<<< branch\n\n"
        "too many words after chevrons:\n>>>>>>> blah blah blah\n<<<<<<< blah blah blah\n\n"
        "not at line beginning:\nfoo >>>>>>> bar\nbaz <<<<<<< qux\n";
    REQUIRE_FALSE(has_merge_markers(chevrons));
}
