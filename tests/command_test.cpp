#include <gtest/gtest.h>
#include "protocol/command.hpp"

using protocol::CommandParser;

TEST(CommandParserTest, SplitsVerbAndArgument) {
    auto cmd = CommandParser::parse("get report.pdf");
    EXPECT_EQ(cmd.verb, "GET");
    EXPECT_EQ(cmd.argument, "report.pdf");
}

TEST(CommandParserTest, ArgumentKeepsInnerWhitespace) {
    auto cmd = CommandParser::parse("  PUT \t my  file.txt   \r");
    EXPECT_EQ(cmd.verb, "PUT");
    EXPECT_EQ(cmd.argument, "my  file.txt");
}

TEST(CommandParserTest, MissingArgumentIsEmpty) {
    auto cmd = CommandParser::parse("ls");
    EXPECT_EQ(cmd.verb, "LS");
    EXPECT_EQ(cmd.argument, "");

    auto blank = CommandParser::parse("   ");
    EXPECT_EQ(blank.verb, "");
    EXPECT_EQ(blank.argument, "");
}

TEST(CommandParserTest, ValidatesAgainstGrammar) {
    for (const char* verb : {"LS", "GET", "PUT", "EXIT", "HELP"}) {
        EXPECT_TRUE(CommandParser::validate(verb)) << verb;
    }
    for (const char* verb : {"CD", "PWD", "MKDIR", "DELETE", "ls", ""}) {
        EXPECT_FALSE(CommandParser::validate(verb)) << verb;
    }
}

TEST(CommandParserTest, OnlyTransfersRequireArgument) {
    EXPECT_TRUE(CommandParser::requires_argument("GET"));
    EXPECT_TRUE(CommandParser::requires_argument("PUT"));
    EXPECT_FALSE(CommandParser::requires_argument("LS"));
    EXPECT_FALSE(CommandParser::requires_argument("EXIT"));
    EXPECT_FALSE(CommandParser::requires_argument("HELP"));
}

TEST(CommandParserTest, UnknownVerbParsesWithoutError) {
    auto cmd = CommandParser::parse("frobnicate now");
    EXPECT_EQ(cmd.verb, "FROBNICATE");
    EXPECT_EQ(cmd.argument, "now");
    EXPECT_FALSE(CommandParser::validate(cmd.verb));
}
