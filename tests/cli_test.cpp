#include <vector>
#include <fstream>
#include <unistd.h>
#include <filesystem>
#include <gtest/gtest.h>
#include "disk_triage/cli.hpp"

namespace disk_triage {
namespace {

CliParseResult parse(std::vector<const char*> args) {
    args.insert(args.begin(), "disk-triage");
    return parse_cli(static_cast<int>(args.size()), args.data());
}

TEST(ParseCliTest, DefaultsWithoutArguments) {
    auto result = parse({});
    ASSERT_TRUE(result.valid);
    EXPECT_FALSE(result.show_help);
    EXPECT_EQ(result.options.root.string(), ".");
    EXPECT_EQ(result.options.top, 20u);
    EXPECT_EQ(result.options.format, OutputFormat::Text);
    EXPECT_FALSE(result.options.dump_items);
}

TEST(ParseCliTest, ReadsAllOptions) {
    auto result = parse({"--top", "5", "--output-format", "json", "--dump-items", "/var/log"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.options.top, 5u);
    EXPECT_EQ(result.options.format, OutputFormat::Json);
    EXPECT_TRUE(result.options.dump_items);
    EXPECT_EQ(result.options.root.string(), "/var/log");
}

TEST(ParseCliTest, AcceptsInlineValues) {
    auto result = parse({"--top=3", "--output-format=text", "data"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.options.top, 3u);
    EXPECT_EQ(result.options.format, OutputFormat::Text);
    EXPECT_EQ(result.options.root.string(), "data");
}

TEST(ParseCliTest, HelpFlag) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST(ParseCliTest, RejectsInvalidOutputFormat) {
    auto result = parse({"--output-format", "xml"});
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error_message.find("xml"), std::string::npos);
    EXPECT_NE(result.error_message.find("text, json"), std::string::npos);
}

TEST(ParseCliTest, RejectsMalformedTop) {
    EXPECT_FALSE(parse({"--top", "ten"}).valid);
    EXPECT_FALSE(parse({"--top", "-3"}).valid);
    EXPECT_FALSE(parse({"--top="}).valid);
    EXPECT_FALSE(parse({"--top"}).valid);
}

TEST(ParseCliTest, AllowsZeroTop) {
    auto result = parse({"--top", "0"});
    ASSERT_TRUE(result.valid);
    EXPECT_EQ(result.options.top, 0u);
}

TEST(ParseCliTest, RejectsUnknownOptionsAndExtraArguments) {
    auto unknown = parse({"--verbose"});
    EXPECT_FALSE(unknown.valid);
    EXPECT_EQ(unknown.error_message, "Unknown option: --verbose");

    auto extra = parse({"one", "two"});
    EXPECT_FALSE(extra.valid);
    EXPECT_EQ(extra.error_message, "Unexpected extra argument: two");
}

TEST(ParseCliTest, DoubleDashEndsOptions) {
    auto result = parse({"--", "--dump-items"});
    ASSERT_TRUE(result.valid);
    EXPECT_FALSE(result.options.dump_items);
    EXPECT_EQ(result.options.root.string(), "--dump-items");
}

class ValidateRootTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("disk_triage_root_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
        std::ofstream(dir_ / "plain.txt") << "data";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(ValidateRootTest, AcceptsExistingDirectory) {
    EXPECT_FALSE(validate_root(dir_).has_value());
}

TEST_F(ValidateRootTest, RejectsMissingPath) {
    auto error = validate_root(dir_ / "missing");
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("does not exist"), std::string::npos);
    EXPECT_NE(error->find("missing"), std::string::npos);
}

TEST_F(ValidateRootTest, RejectsRegularFile) {
    auto error = validate_root(dir_ / "plain.txt");
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("is not a directory"), std::string::npos);
}

TEST(ExitCodeTest, CodesAreDistinctAndNonZero) {
    EXPECT_EQ(kExitUsage, 1);
    EXPECT_EQ(kExitBadDirectory, 2);
    EXPECT_EQ(kExitEmptyResult, 3);
}

}  // namespace
}  // namespace disk_triage
