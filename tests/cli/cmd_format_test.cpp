#include "schemat/cli/cmd_format.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace schemat;
using namespace schemat::cli;
namespace fs = std::filesystem;

class FormatCommandTest : public ::testing::Test {
protected:
    fs::path root;
    format::Formatter formatter;

    void SetUp() override {
        root = fs::temp_directory_path() / "schemat_cmd_format_test";
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    auto write(const std::string& name, const std::string& content) -> std::string {
        auto path = (root / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static auto read(const std::string& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

// ============================================================================
// Single File
// ============================================================================

TEST_F(FormatCommandTest, FormatRewritesFile) {
    auto path = write("a.scm", "(define   x\n\n\n 1)");
    auto result = process_file(path, formatter, false);
    EXPECT_EQ(result.status, FileStatus::Formatted);
    EXPECT_EQ(result.path, path);
    EXPECT_EQ(read(path), "(define x\n\n  1)\n");
}

TEST_F(FormatCommandTest, CanonicalFileUnchanged) {
    auto path = write("a.scm", "(define x 1)\n");
    EXPECT_EQ(process_file(path, formatter, false).status, FileStatus::Unchanged);
    EXPECT_EQ(process_file(path, formatter, true).status, FileStatus::Unchanged);
}

TEST_F(FormatCommandTest, CheckLeavesFileAlone) {
    auto path = write("a.scm", "  (a   b)");
    auto result = process_file(path, formatter, true);
    EXPECT_EQ(result.status, FileStatus::NotFormatted);
    EXPECT_EQ(read(path), "  (a   b)");
}

TEST_F(FormatCommandTest, ParseErrorReported) {
    auto path = write("bad.scm", "(a\n  (b c)\n");
    auto result = process_file(path, formatter, false);
    EXPECT_EQ(result.status, FileStatus::Error);
    EXPECT_NE(result.message.find("unclosed list"), std::string::npos) << result.message;
    EXPECT_NE(result.message.find("line 1"), std::string::npos) << result.message;
    EXPECT_EQ(read(path), "(a\n  (b c)\n");
}

TEST_F(FormatCommandTest, MissingFileReported) {
    auto path = (root / "missing.scm").string();
    auto result = process_file(path, formatter, true);
    EXPECT_EQ(result.status, FileStatus::Error);
    EXPECT_EQ(result.message, "Failed to open file: " + path);
}

// ============================================================================
// Worker Pool
// ============================================================================

TEST_F(FormatCommandTest, ResultsKeepInputOrder) {
    std::vector<std::string> paths;
    for (int i = 0; i < 20; ++i) {
        std::string content = i % 3 == 0 ? "(ok)\n" : "( needs   work )";
        paths.push_back(write("f" + std::to_string(i) + ".scm", content));
    }
    paths.push_back((root / "missing.scm").string());

    auto results = process_files(paths, formatter, true, 4);
    ASSERT_EQ(results.size(), paths.size());
    for (size_t i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].path, paths[i]);
        EXPECT_EQ(results[i].status,
                  i % 3 == 0 ? FileStatus::Unchanged : FileStatus::NotFormatted);
    }
    EXPECT_EQ(results.back().status, FileStatus::Error);
}

TEST_F(FormatCommandTest, EmptyFileList) {
    EXPECT_TRUE(process_files({}, formatter, false).empty());
}

TEST_F(FormatCommandTest, SingleThreadMatchesPool) {
    std::vector<std::string> paths;
    for (int i = 0; i < 8; ++i) {
        paths.push_back(write("g" + std::to_string(i) + ".scm", "(x  " + std::to_string(i) + ")"));
    }

    auto results = process_files(paths, formatter, false, 1);
    for (size_t i = 0; i < paths.size(); ++i) {
        EXPECT_EQ(results[i].status, FileStatus::Formatted);
        EXPECT_EQ(read(paths[i]), "(x " + std::to_string(i) + ")\n");
    }
}

// ============================================================================
// Reporting
// ============================================================================

TEST(ReportLineTest, FailuresAlwaysReported) {
    FileResult failed{.path = "a.scm", .status = FileStatus::NotFormatted, .message = {}};
    EXPECT_EQ(report_line(failed, true, false, false), "FAIL\ta.scm");

    FileResult error{.path = "b.scm", .status = FileStatus::Error, .message = "boom"};
    EXPECT_EQ(report_line(error, false, false, false), "ERROR\tb.scm\tboom");
}

TEST(ReportLineTest, SuccessOnlyWhenVerbose) {
    FileResult unchanged{.path = "a.scm", .status = FileStatus::Unchanged, .message = {}};
    EXPECT_EQ(report_line(unchanged, true, false, false), "");
    EXPECT_EQ(report_line(unchanged, true, true, false), "OK\ta.scm");
    EXPECT_EQ(report_line(unchanged, false, true, false), "FORMAT\ta.scm");

    FileResult formatted{.path = "b.scm", .status = FileStatus::Formatted, .message = {}};
    EXPECT_EQ(report_line(formatted, false, false, false), "");
    EXPECT_EQ(report_line(formatted, false, true, false), "FORMAT\tb.scm");
}

TEST(ReportLineTest, ColorsWrapLabel) {
    FileResult failed{.path = "a.scm", .status = FileStatus::NotFormatted, .message = {}};
    EXPECT_EQ(report_line(failed, true, false, true), "\033[33mFAIL\033[0m\ta.scm");
}

TEST(SummaryLineTest, WordingDependsOnMode) {
    EXPECT_EQ(summary_line(2, 5, true), "2 / 5 file(s) failed");
    EXPECT_EQ(summary_line(1, 3, false), "1 / 3 file(s) failed to format");
}

// ============================================================================
// Command
// ============================================================================

TEST_F(FormatCommandTest, RunCheckFailsOnUnformattedFile) {
    write("good.scm", "(a b)\n");
    write("bad.scm", "(a\nb)");

    CliOptions options;
    options.check = true;
    options.patterns = {root.string()};
    EXPECT_EQ(run_format(options), 1);

    options.check = false;
    EXPECT_EQ(run_format(options), 0);

    options.check = true;
    EXPECT_EQ(run_format(options), 0);
}

TEST_F(FormatCommandTest, RunFormatSummarizesFailures) {
    write("good.scm", "(a b)\n");
    write("bad.scm", "(a b");

    CliOptions options;
    options.patterns = {root.string()};

    ::testing::internal::CaptureStderr();
    EXPECT_EQ(run_format(options), 1);
    auto output = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("1 / 2 file(s) failed to format\n"), std::string::npos) << output;

    options.check = true;
    ::testing::internal::CaptureStderr();
    EXPECT_EQ(run_format(options), 1);
    output = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("1 / 2 file(s) failed\n"), std::string::npos) << output;
}

TEST_F(FormatCommandTest, RunCheckWithoutPatternsFails) {
    CliOptions options;
    options.check = true;
    EXPECT_EQ(run_format(options), 1);
}
