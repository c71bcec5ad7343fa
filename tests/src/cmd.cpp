#include "unit-tests.hpp"

using namespace avr;
using namespace avr::cmd;
using namespace avr::tests;

namespace
{
    ArgParser makeParser()
    {
        ArgParser arg_parser;
        arg_parser.addArg("--help", CommandLineArgDef::NArgs::Zero, CommandLineArgDef::Type::Bool, "Display help message and exit");
        arg_parser.addArg("--chains", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::String, "Chain table file");
        arg_parser.addArg("--lookback", CommandLineArgDef::NArgs::One, CommandLineArgDef::Type::Int, "Blocks to look back");
        arg_parser.addArg("--urls", CommandLineArgDef::NArgs::Many, CommandLineArgDef::Type::String, "RPC urls");
        return arg_parser;
    }
}

TEST_F(UnitTest, Cmd_ArgParser_FlagsValuesAndPositional)
{
    ArgParser arg_parser = makeParser();
    const char * argv[] = {"ancillary-resolver", "--help", "--chains", "chains.json", "--lookback", "-5", "q:\"Question?\""};

    ASSERT_TRUE(arg_parser.parse(7, argv).has_value());

    EXPECT_TRUE(arg_parser.getArg<bool>("--help").value_or(false));
    EXPECT_EQ(arg_parser.getArg<std::vector<std::string>>("--chains").value().at(0), "chains.json");
    EXPECT_EQ(arg_parser.getArg<std::vector<int>>("--lookback").value().at(0), -5);
    EXPECT_EQ(arg_parser.positional(), (std::vector<std::string>{"q:\"Question?\""}));
}

TEST_F(UnitTest, Cmd_ArgParser_MissingArgumentsAreEmpty)
{
    ArgParser arg_parser = makeParser();
    const char * argv[] = {"ancillary-resolver"};

    ASSERT_TRUE(arg_parser.parse(1, argv).has_value());
    EXPECT_FALSE(arg_parser.getArg<bool>("--help").has_value());
    EXPECT_FALSE(arg_parser.getArg<std::vector<std::string>>("--chains").has_value());
    EXPECT_TRUE(arg_parser.positional().empty());
}

TEST_F(UnitTest, Cmd_ArgParser_ManyStopsAtNextFlag)
{
    ArgParser arg_parser = makeParser();
    const char * argv[] = {"ancillary-resolver", "--urls", "https://a", "https://b", "--help"};

    ASSERT_TRUE(arg_parser.parse(5, argv).has_value());
    EXPECT_EQ(arg_parser.getArg<std::vector<std::string>>("--urls").value(), (std::vector<std::string>{"https://a", "https://b"}));
    EXPECT_TRUE(arg_parser.getArg<bool>("--help").value_or(false));
}

TEST_F(UnitTest, Cmd_ArgParser_DoubleDashEndsOptions)
{
    ArgParser arg_parser = makeParser();
    const char * argv[] = {"ancillary-resolver", "--", "--help"};

    ASSERT_TRUE(arg_parser.parse(3, argv).has_value());
    EXPECT_FALSE(arg_parser.getArg<bool>("--help").has_value());
    EXPECT_EQ(arg_parser.positional(), (std::vector<std::string>{"--help"}));
}

TEST_F(UnitTest, Cmd_ArgParser_Errors)
{
    {
        ArgParser arg_parser = makeParser();
        const char * argv[] = {"ancillary-resolver", "--unknown"};
        const auto res = arg_parser.parse(2, argv);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().kind, parse::Error::Kind::INVALID_VALUE);
    }
    {
        ArgParser arg_parser = makeParser();
        const char * argv[] = {"ancillary-resolver", "--chains"};
        const auto res = arg_parser.parse(2, argv);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().kind, parse::Error::Kind::MISSING_FIELD);
    }
    {
        ArgParser arg_parser = makeParser();
        const char * argv[] = {"ancillary-resolver", "--lookback", "ten"};
        const auto res = arg_parser.parse(3, argv);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().kind, parse::Error::Kind::TYPE_MISMATCH);
    }
    {
        ArgParser arg_parser = makeParser();
        const char * argv[] = {"ancillary-resolver", "--lookback", "99999999999"};
        const auto res = arg_parser.parse(3, argv);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().kind, parse::Error::Kind::OUT_OF_RANGE);
    }
}

TEST_F(UnitTest, Cmd_ArgParser_HelpListsEveryArgument)
{
    const std::string help = makeParser().constructHelpMessage();

    EXPECT_NE(help.find("--help"), std::string::npos);
    EXPECT_NE(help.find("--chains <value>"), std::string::npos);
    EXPECT_NE(help.find("--lookback <int>"), std::string::npos);
    EXPECT_NE(help.find("--urls <value>..."), std::string::npos);
    EXPECT_NE(help.find("Blocks to look back"), std::string::npos);
}
