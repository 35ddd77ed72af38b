#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "CommandLine.h"

namespace Chainer
{

    class CommandLineTest : public ::testing::Test
    {
    protected:
        static CommandLineOptions parseArgs(std::vector<std::string> args)
        {
            std::vector<char *> argv;
            for (auto &arg : args)
            {
                argv.push_back(arg.data());
            }
            argv.push_back(nullptr);
            return CommandLine::parse(static_cast<int>(args.size()), argv.data());
        }

        static std::string problemPath(const std::string &name)
        {
            return std::string(CHAINER_DATA_DIR) + "/problems/" + name;
        }

        // 运行并吞掉标准输出，返回退出码
        static int runQuietly(const CommandLineOptions &cli, std::string *output = nullptr)
        {
            testing::internal::CaptureStdout();
            testing::internal::CaptureStderr();
            int code = CommandLine::run(cli);
            std::string out = testing::internal::GetCapturedStdout();
            testing::internal::GetCapturedStderr();
            if (output)
            {
                *output = out;
            }
            return code;
        }
    };

    TEST_F(CommandLineTest, ParsesAllFlags)
    {
        CommandLineOptions cli = parseArgs({"fol-chainer", "-j", "-q", "-t", "4", "-r", "10", "problem.json"});
        EXPECT_TRUE(cli.asJson);
        EXPECT_TRUE(cli.quiet);
        EXPECT_FALSE(cli.verbose);
        EXPECT_EQ(cli.threads, 4);
        EXPECT_EQ(cli.roundCap, 10);
        EXPECT_EQ(cli.problemPath, "problem.json");
    }

    TEST_F(CommandLineTest, DefaultsLeaveFileOptionsAlone)
    {
        CommandLineOptions cli = parseArgs({"fol-chainer", "problem.json"});
        EXPECT_EQ(cli.threads, -1);
        EXPECT_EQ(cli.roundCap, -1);

        ChainerOptions options;
        options.roundCap = 5;
        options.workerThreads = 3;
        options.verbose = true;
        CommandLine::applyOverrides(cli, options);
        EXPECT_EQ(options.roundCap, 5);
        EXPECT_EQ(options.workerThreads, 3u);
        EXPECT_TRUE(options.verbose);
    }

    TEST_F(CommandLineTest, BadArgumentsRejected)
    {
        EXPECT_THROW(parseArgs({"fol-chainer", "-t", "many", "problem.json"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer", "-t", "-1", "problem.json"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer", "-r", "0", "problem.json"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer", "-r", "99999999999", "problem.json"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer", "-x", "problem.json"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer", "problem.json", "-r"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer"}), std::invalid_argument);
        EXPECT_THROW(parseArgs({"fol-chainer", "a.json", "b.json"}), std::invalid_argument);
    }

    TEST_F(CommandLineTest, CommandLineOverridesFileOptions)
    {
        CommandLineOptions cli = parseArgs({"fol-chainer", "-t", "0", "-r", "7", "problem.json"});
        ChainerOptions options;
        options.roundCap = 1000;
        options.workerThreads = 2;
        CommandLine::applyOverrides(cli, options);
        EXPECT_EQ(options.roundCap, 7);
        EXPECT_EQ(options.workerThreads, 0u);
    }

    TEST_F(CommandLineTest, QuietWinsOverVerbose)
    {
        ChainerOptions fromFile;
        fromFile.verbose = true;
        CommandLine::applyOverrides(parseArgs({"fol-chainer", "-q", "problem.json"}), fromFile);
        EXPECT_FALSE(fromFile.verbose);

        ChainerOptions both;
        CommandLine::applyOverrides(parseArgs({"fol-chainer", "-v", "-q", "problem.json"}), both);
        EXPECT_FALSE(both.verbose);

        ChainerOptions verbose;
        CommandLine::applyOverrides(parseArgs({"fol-chainer", "-v", "problem.json"}), verbose);
        EXPECT_TRUE(verbose.verbose);

        // JSON 输出时不打印逐轮日志
        ChainerOptions json;
        json.verbose = true;
        CommandLine::applyOverrides(parseArgs({"fol-chainer", "-j", "problem.json"}), json);
        EXPECT_FALSE(json.verbose);
    }

    TEST_F(CommandLineTest, ProvenQueryExitsZero)
    {
        std::string output;
        int code = runQuietly(parseArgs({"fol-chainer", "-q", problemPath("criminal.json")}), &output);
        EXPECT_EQ(code, CommandLine::EXIT_PROVEN);
        EXPECT_NE(output.find("Criminal(Robert)' is proven to be TRUE"), std::string::npos);
        EXPECT_EQ(output.find("--- Round"), std::string::npos);
    }

    TEST_F(CommandLineTest, RoundCapFromCommandLineExitsOne)
    {
        // 一轮之内推不出 Criminal(Robert)
        int code = runQuietly(parseArgs({"fol-chainer", "-q", "-r", "1", problemPath("criminal.json")}));
        EXPECT_EQ(code, CommandLine::EXIT_NOT_PROVEN);
    }

    TEST_F(CommandLineTest, InputErrorsExitTwo)
    {
        EXPECT_EQ(runQuietly(parseArgs({"fol-chainer", problemPath("unsafe_rule.json")})),
                  CommandLine::EXIT_INPUT_ERROR);
        EXPECT_EQ(runQuietly(parseArgs({"fol-chainer", problemPath("no_such_problem.json")})),
                  CommandLine::EXIT_INPUT_ERROR);
    }

    TEST_F(CommandLineTest, JsonOutput)
    {
        std::string output;
        int code = runQuietly(parseArgs({"fol-chainer", "-j", problemPath("peanuts.json")}), &output);
        ASSERT_EQ(code, CommandLine::EXIT_PROVEN);

        nlohmann::json result = nlohmann::json::parse(output);
        EXPECT_EQ(result["proven"], true);
        EXPECT_EQ(result["rounds"], 2);
        EXPECT_EQ(result["trace"].size(), 4u);
    }

    TEST_F(CommandLineTest, HelpExitsZero)
    {
        CommandLineOptions cli = parseArgs({"fol-chainer", "-h"});
        EXPECT_TRUE(cli.showHelp);
        std::string output;
        EXPECT_EQ(runQuietly(cli, &output), CommandLine::EXIT_PROVEN);
        EXPECT_NE(output.find("Usage:"), std::string::npos);
    }

} // namespace Chainer
