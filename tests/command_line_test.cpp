#include "gtest/gtest.h"
#include "command_line.hpp"

#include <string>
#include <vector>

using namespace asset_splitter;

namespace {

CommandLine parse(std::vector<const char*> args) {
    args.insert(args.begin(), "split_assets");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CommandLineTest, DefaultsWithNoArguments) {
    CommandLine cmd = parse({});

    EXPECT_EQ(cmd.action, CommandAction::RUN);
    EXPECT_EQ(cmd.models_dir, "public/models/onnx");
    EXPECT_FALSE(cmd.quantized);
}

TEST(CommandLineTest, ModelsDirectoryAndQuantizedFlag) {
    CommandLine cmd = parse({"/srv/models", "--quantized"});

    EXPECT_EQ(cmd.action, CommandAction::RUN);
    EXPECT_EQ(cmd.models_dir, "/srv/models");
    EXPECT_TRUE(cmd.quantized);

    // Flag may come first
    cmd = parse({"--quantized", "models"});
    EXPECT_EQ(cmd.action, CommandAction::RUN);
    EXPECT_EQ(cmd.models_dir, "models");
    EXPECT_TRUE(cmd.quantized);
}

TEST(CommandLineTest, HelpStopsParsing) {
    EXPECT_EQ(parse({"-h"}).action, CommandAction::SHOW_HELP);
    EXPECT_EQ(parse({"models", "--help", "--bogus"}).action, CommandAction::SHOW_HELP);
}

TEST(CommandLineTest, UnknownOptionIsUsageError) {
    CommandLine cmd = parse({"--fast"});

    EXPECT_EQ(cmd.action, CommandAction::USAGE_ERROR);
    EXPECT_NE(cmd.error.find("--fast"), std::string::npos);
    EXPECT_EQ(EXIT_USAGE, 2);
}

TEST(CommandLineTest, SecondDirectoryIsUsageError) {
    CommandLine cmd = parse({"a", "b"});

    EXPECT_EQ(cmd.action, CommandAction::USAGE_ERROR);
    EXPECT_NE(cmd.error.find("b"), std::string::npos);
}

TEST(CommandLineTest, EmptyArgumentIsUsageError) {
    EXPECT_EQ(parse({""}).action, CommandAction::USAGE_ERROR);
}

TEST(CommandLineTest, UsageLineNamesTheProgram) {
    EXPECT_EQ(usage_line("split_assets"), "Usage: split_assets [models_dir] [--quantized]");
}
