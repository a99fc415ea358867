#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "commands/LinesCommand.hpp"

#include <nlohmann/json.hpp>

class LinesCommandTest : public CmdTestBase<LinesCommand> {};

TEST_F(LinesCommandTest, single_file) {
    std::string output = capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", lines_fname()});
    });
    ASSERT_EQ(fmt::format("{:>10} {}\n", 3, lines_fname_str()), output);
}

TEST_F(LinesCommandTest, several_files_have_total) {
    std::string output = capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", lines_fname(), no_eol_fname()});
    });
    auto lines = split(output, '\n');
    ASSERT_EQ(3, lines.size());
    EXPECT_EQ("2 " + no_eol_fname().string(), trim(lines[1]));
    EXPECT_EQ("5 total", trim(lines[2]));
}

TEST_F(LinesCommandTest, small_chunks) {
    std::string output = capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", "-c", "1", no_eol_fname()});
    });
    ASSERT_EQ("2 " + no_eol_fname().string(), trim(output));
}

TEST_F(LinesCommandTest, json) {
    std::string output = capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", "--json", lines_fname()});
    });
    auto j = nlohmann::json::parse(trim(output));
    EXPECT_EQ(lines_fname_str(), j["file"]);
    EXPECT_EQ(3, j["lines"]);
    EXPECT_EQ(17, j["bytes"]);
    EXPECT_EQ(true, j["ok"]);
    EXPECT_FALSE(j.contains("error"));
}

TEST_F(LinesCommandTest, missing_file) {
    std::string output = capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", "--json", lines_fname(), "not_existing_file.txt"}, 1);
    });
    std::vector<nlohmann::json> results;
    for_each_line(output, [&](const std::string& line) {
        results.push_back(nlohmann::json::parse(line));
    });
    ASSERT_EQ(2, results.size());
    EXPECT_EQ(true, results[0]["ok"]);
    EXPECT_EQ(false, results[1]["ok"]);
    EXPECT_EQ(0, results[1]["lines"]);
    EXPECT_THAT(results[1]["error"].get<std::string>(), HasSubstr("not_existing_file.txt"));
}

TEST_F(LinesCommandTest, glob) {
    auto dir = lines_fname().parent_path();
    std::string output = capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", (dir / "*_line*.txt").string()});
    });
    ASSERT_EQ("3 " + lines_fname().string(), trim(output));
}

TEST_F(LinesCommandTest, zero_chunk_size) {
    capture_stdout([&]() {
        run_cmd({"lines", "--no-progress", "-c", "0", lines_fname()}, 1);
    });
}
