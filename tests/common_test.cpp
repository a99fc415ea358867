#include <gtest/gtest.h>
#include "test_utils.hpp"

#include <algorithm>

/// count_lines_in_file

TEST(count_lines_in_file, newline_terminated) {
    ASSERT_EQ(count_lines_in_file(find_fixture("three_lines.txt")), 3);
}

TEST(count_lines_in_file, trailing_partial_line) {
    ASSERT_EQ(count_lines_in_file(find_fixture("no_trailing_newline.txt")), 2);
}

TEST(count_lines_in_file, empty_file) {
    ASSERT_EQ(count_lines_in_file(find_fixture("empty.txt")), 0);
}

TEST(count_lines_in_file, not_existing_file) {
    ASSERT_EQ(count_lines_in_file("not_existing_file.txt"), 0);
}

TEST(count_lines_in_file, directory) {
    ASSERT_EQ(count_lines_in_file("."), 0);
}

TEST(count_lines_in_file, larger_than_read_chunk) {
    std::string content;
    for (int i = 0; i < 20000; i++) {
        content += "line number " + std::to_string(i) + "\n";
    }
    write_file("many_lines.txt", content);
    ASSERT_EQ(count_lines_in_file("many_lines.txt"), 20000);
}

/// simple_glob_match

TEST(simple_glob_match, star_and_question) {
    EXPECT_TRUE(simple_glob_match(std::string("*.txt"), std::string("three_lines.txt")));
    EXPECT_TRUE(simple_glob_match(std::string("thr?e_*"), std::string("three_lines.txt")));
    EXPECT_FALSE(simple_glob_match(std::string("*.log"), std::string("three_lines.txt")));
}

/// simple_glob_find

TEST(test_simple_glob_find, exact_fname) {
    auto pathname = find_fixture("three_lines.txt");
    auto results = simple_glob_find(pathname.string());
    ASSERT_EQ(results.size(), 1);
    ASSERT_EQ(results[0], pathname);
}

TEST(test_simple_glob_find, glob_tail) {
    auto pathname = find_fixture("no_trailing_newline.txt");
    auto results = simple_glob_find(pathname.string() + "*");
    ASSERT_EQ(results.size(), 1);
    ASSERT_EQ(results[0], pathname);
}

TEST(test_simple_glob_find, glob_cut_tail) {
    auto pathname = find_fixture("no_trailing_newline.txt");
    std::string glob = pathname.string();
    glob = glob.substr(0, glob.size() - 1) + "*";
    auto results = simple_glob_find(glob);
    ASSERT_EQ(results.size(), 1);
    ASSERT_EQ(results[0], pathname);
}

TEST(test_simple_glob_find, glob_dir) {
    auto pathname = find_fixture("three_lines.txt");
    std::string glob = pathname.string();
    glob = glob.replace(glob.find("fixtures"), 8, "fix*res");
    auto results = simple_glob_find(glob);
    ASSERT_EQ(results.size(), 1);
    ASSERT_EQ(results[0], pathname);
}

TEST(test_simple_glob_find, glob_dir_negative) {
    auto pathname = find_fixture("three_lines.txt");
    std::string glob = pathname.string();
    glob = glob.replace(glob.find("fixtures"), 8, "fix*1res");
    auto results = simple_glob_find(glob);
    ASSERT_EQ(results.size(), 0);
}

TEST(test_simple_glob_find, sorted) {
    auto dir = find_fixture("three_lines.txt").parent_path();
    auto results = simple_glob_find((dir / "*.txt").string());
    ASSERT_EQ(results.size(), 3);
    ASSERT_TRUE(std::is_sorted(results.begin(), results.end()));
}

/// expand_file_args

TEST(expand_file_args, plain_names_kept) {
    auto results = expand_file_args({"not_existing_file.txt", "other.txt"});
    ASSERT_EQ(results.size(), 2);
    ASSERT_EQ(results[0], "not_existing_file.txt");
}

TEST(expand_file_args, glob_without_matches) {
    auto results = expand_file_args({"no_such_dir_*/x.txt"});
    ASSERT_TRUE(results.empty());
}
