#include "schemat/cli/options.hpp"

#include <gtest/gtest.h>

using namespace schemat;
using namespace schemat::cli;

class CliOptionsTest : public ::testing::Test {
protected:
    auto parse(std::vector<std::string> args) -> Result<CliOptions, std::string> {
        args.insert(args.begin(), "schemat");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return parse_cli_options(static_cast<int>(args.size()), argv.data());
    }

    auto parse_ok(std::vector<std::string> args) -> CliOptions {
        auto result = parse(std::move(args));
        if (is_err(result)) {
            ADD_FAILURE() << "unexpected error: " << unwrap_err(result);
            return {};
        }
        return unwrap(result);
    }
};

TEST_F(CliOptionsTest, NoArguments) {
    auto options = parse_ok({});
    EXPECT_FALSE(options.check);
    EXPECT_FALSE(options.verbose);
    EXPECT_TRUE(options.patterns.empty());
    EXPECT_TRUE(options.ignore.empty());
}

TEST_F(CliOptionsTest, CheckAndPatterns) {
    auto options = parse_ok({"--check", "src/", "lib/*.scm"});
    EXPECT_TRUE(options.check);
    EXPECT_EQ(options.patterns, (std::vector<std::string>{"src/", "lib/*.scm"}));
}

TEST_F(CliOptionsTest, ShortFlags) {
    auto options = parse_ok({"-c", "-v", "a.scm"});
    EXPECT_TRUE(options.check);
    EXPECT_TRUE(options.verbose);
    EXPECT_TRUE(parse_ok({"-h"}).help);
    EXPECT_TRUE(parse_ok({"-V"}).version);
    EXPECT_TRUE(parse_ok({"--version"}).version);
}

TEST_F(CliOptionsTest, IgnorePatterns) {
    auto options = parse_ok({"-i", "vendor/*", "--ignore", "build", "--ignore=*.el", "."});
    EXPECT_EQ(options.ignore, (std::vector<std::string>{"vendor/*", "build", "*.el"}));
    EXPECT_EQ(options.patterns, (std::vector<std::string>{"."}));
}

TEST_F(CliOptionsTest, IgnoreRequiresPattern) {
    auto result = parse({"--check", "-i"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "option -i requires a pattern");
}

TEST_F(CliOptionsTest, UnknownOption) {
    auto result = parse({"--frobnicate"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "unknown option: --frobnicate");
}

TEST_F(CliOptionsTest, LogOptionsAreSkipped) {
    auto options = parse_ok({"--log-level=debug", "-vv", "-q", "--log-format=json", "x.scm"});
    EXPECT_EQ(options.patterns, (std::vector<std::string>{"x.scm"}));
    EXPECT_FALSE(options.verbose);
}

TEST_F(CliOptionsTest, DoubleDashEndsOptions) {
    auto options = parse_ok({"-c", "--", "-weird.scm", "--check"});
    EXPECT_TRUE(options.check);
    EXPECT_EQ(options.patterns, (std::vector<std::string>{"-weird.scm", "--check"}));
}

TEST_F(CliOptionsTest, LoneDashIsPattern) {
    EXPECT_EQ(parse_ok({"-"}).patterns, (std::vector<std::string>{"-"}));
}
