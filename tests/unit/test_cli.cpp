#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include <sstream>

using namespace fcg;

class CommandArgsTest : public ::testing::Test {
protected:
    Command cmd;

    void SetUp() override {
        cmd.name = "metrics";
        cmd.description = "Compute metrics";
        cmd.options = {
            {"input", "i", "Input edge table", "", true, false},
            {"metrics", "m", "Metric list", "", false, false},
            {"format", "f", "Table format", "csv", false, false},
            {"quiet", "q", "Less output", "", false, true}
        };
        cmd.handler = [](const Args&) { return 0; };
    }
};

// ==========================================
// Parsing Tests
// ==========================================

TEST_F(CommandArgsTest, LongShortAndInlineForms) {
    Args args = parse_command_args(cmd, {"-i", "edges.csv", "--metrics=degree,hits", "-q"});

    EXPECT_EQ(args.require("input"), "edges.csv");
    EXPECT_EQ(args.get("metrics").as_list(), (std::vector<std::string>{"degree", "hits"}));
    EXPECT_TRUE(args.has("quiet"));
}

TEST_F(CommandArgsTest, DefaultsApplyWhenAbsent) {
    Args args = parse_command_args(cmd, {"--input", "edges.csv"});

    EXPECT_EQ(args.get("format").value, "csv");
    EXPECT_FALSE(args.has("metrics"));
    EXPECT_FALSE(args.has("quiet"));
    EXPECT_EQ(args.get("config", "fallback.json").value, "fallback.json");
}

TEST_F(CommandArgsTest, RejectsStrayPositionalArgument) {
    EXPECT_THROW(parse_command_args(cmd, {"--input", "edges.csv", "extra.csv"}),
                 std::runtime_error);
}

TEST_F(CommandArgsTest, RejectsUnknownOption) {
    EXPECT_THROW(parse_command_args(cmd, {"--input", "a.csv", "--threads", "4"}),
                 std::runtime_error);
}

TEST_F(CommandArgsTest, RejectsMissingValueAndRequired) {
    EXPECT_THROW(parse_command_args(cmd, {"--input"}), std::runtime_error);
    EXPECT_THROW(parse_command_args(cmd, {"-q"}), std::runtime_error);
    EXPECT_THROW(parse_command_args(cmd, {"-i", "a.csv", "--quiet=yes"}), std::runtime_error);
}

// ==========================================
// Value Conversion Tests
// ==========================================

TEST(ArgValueTest, StrictNumbers) {
    EXPECT_DOUBLE_EQ((ArgValue{"0.5", true}).as_double(), 0.5);
    EXPECT_DOUBLE_EQ((ArgValue{"", false}).as_double(1.5), 1.5);
    EXPECT_THROW((ArgValue{"0.5x", true}).as_double(), std::runtime_error);
    EXPECT_THROW((ArgValue{"abc", true}).as_double(), std::runtime_error);
}

TEST(ArgValueTest, ListTrimsAndDropsEmptyItems) {
    ArgValue v{" pagerank , ,degree ", true};
    EXPECT_EQ(v.as_list(), (std::vector<std::string>{"pagerank", "degree"}));
}

// ==========================================
// Help Tests
// ==========================================

TEST_F(CommandArgsTest, HelpListsOptions) {
    std::ostringstream out;
    cmd.print_help(out);
    std::string text = out.str();

    EXPECT_NE(text.find("Usage: fcg metrics --input <value>"), std::string::npos);
    EXPECT_NE(text.find("--quiet, -q\n"), std::string::npos);
    EXPECT_NE(text.find("(default: csv)"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
