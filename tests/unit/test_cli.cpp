#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace bsm;

namespace {

// Runs the CLI over a copy of the given words, argv[0] included
int run_cli(CLI& cli, std::vector<std::string> words) {
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(&word[0]);
    }
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        cli.register_command({
            "show",
            "Show one node",
            {
                {"input", "i", "Input file", "", true, false},
                {"top", "n", "Rows to show", "5", false, false},
                {"verbose", "v", "Chatty output", "", false, true}
            },
            [this](const Args& args) {
                seen = args;
                ++calls;
                return 0;
            }
        });
    }

    CLI cli{"bsmhg", "1.0.0"};
    Args seen;
    int calls = 0;
};

} // namespace

// ==========================================
// Argument Values
// ==========================================

TEST(ArgValueTest, NumericConversion) {
    EXPECT_EQ((ArgValue{"42", true}).as_int(), 42);
    EXPECT_EQ((ArgValue{"-3", true}).as_int(), -3);
    EXPECT_EQ((ArgValue{"", false}).as_int(7), 7);
    EXPECT_EQ((ArgValue{"12", true}).as_size(), 12u);
    EXPECT_EQ((ArgValue{"", false}).as_size(9), 9u);
}

TEST(ArgValueTest, MalformedNumbersThrow) {
    EXPECT_THROW((ArgValue{"abc", true}).as_int(), std::runtime_error);
    EXPECT_THROW((ArgValue{"10x", true}).as_int(), std::runtime_error);
    EXPECT_THROW((ArgValue{"99999999999", true}).as_int(), std::runtime_error);
    EXPECT_THROW((ArgValue{"-1", true}).as_size(), std::runtime_error);
}

TEST(ArgValueTest, ListSkipsEmptyItems) {
    auto items = (ArgValue{"centrality,,risk,", true}).as_list();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "centrality");
    EXPECT_EQ(items[1], "risk");
    EXPECT_TRUE((ArgValue{"", false}).as_list().empty());
}

TEST(ArgsTest, RequireAndDefaults) {
    Args args;
    args.named["input"] = ArgValue{"records.json", true};

    EXPECT_EQ(args.require("input"), "records.json");
    EXPECT_THROW(args.require("output"), std::runtime_error);
    EXPECT_TRUE(args.has("input"));
    EXPECT_FALSE(args.has("output"));
    EXPECT_EQ(args.get("output", "report.json").value, "report.json");
    EXPECT_FALSE(args.get("output").is_set);
}

// ==========================================
// Command Dispatch
// ==========================================

TEST_F(CliTest, ParsesNamedShortAndFlagOptions) {
    EXPECT_EQ(run_cli(cli, {"bsmhg", "show", "-i", "records.json", "--top=3", "--verbose"}), 0);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen.require("input"), "records.json");
    EXPECT_EQ(seen.get("top").as_size(), 3u);
    EXPECT_TRUE(seen.has("verbose"));
}

TEST_F(CliTest, AppliesDefaults) {
    EXPECT_EQ(run_cli(cli, {"bsmhg", "show", "--input", "records.json"}), 0);
    EXPECT_EQ(seen.get("top").as_size(), 5u);
    EXPECT_FALSE(seen.has("verbose"));
}

TEST_F(CliTest, StrayPositionalIsRejected) {
    EXPECT_EQ(run_cli(cli, {"bsmhg", "show", "--input", "records.json", "extra"}), 1);
    EXPECT_EQ(calls, 0);
}

TEST_F(CliTest, MissingRequiredOrValueIsRejected) {
    EXPECT_EQ(run_cli(cli, {"bsmhg", "show", "--top", "3"}), 1);
    EXPECT_EQ(run_cli(cli, {"bsmhg", "show", "--input"}), 1);
    EXPECT_EQ(calls, 0);
}

TEST_F(CliTest, UnknownCommandFails) {
    EXPECT_EQ(run_cli(cli, {"bsmhg", "frobnicate"}), 1);
    EXPECT_EQ(run_cli(cli, {"bsmhg"}), 1);
    EXPECT_EQ(calls, 0);
}

TEST_F(CliTest, HandlerExceptionBecomesExitCode) {
    cli.register_command({
        "fail",
        "Always throws",
        {},
        [](const Args&) -> int { throw std::runtime_error("boom"); }
    });
    EXPECT_EQ(run_cli(cli, {"bsmhg", "fail"}), 1);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
