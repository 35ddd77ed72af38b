#ifndef CHAINER_COMMAND_LINE_H
#define CHAINER_COMMAND_LINE_H

#include <ostream>
#include <string>
#include "ForwardChainer.h"

namespace Chainer
{
    // 命令行解析结果，-1 表示未指定
    struct CommandLineOptions
    {
        std::string program = "fol-chainer";
        std::string problemPath;
        bool asJson = false;
        bool quiet = false;
        bool verbose = false;
        bool showHelp = false;
        long threads = -1;
        long roundCap = -1;
    };

    class CommandLine
    {
    public:
        static constexpr int EXIT_PROVEN = 0;
        static constexpr int EXIT_NOT_PROVEN = 1;
        static constexpr int EXIT_INPUT_ERROR = 2;

        // fol-chainer [-j] [-q|-v] [-t THREADS] [-r ROUND_CAP] PROBLEM.json
        // 参数错误抛出 std::invalid_argument
        static CommandLineOptions parse(int argc, char **argv);

        // 命令行的值覆盖问题文件中的 options；-q 和 -j 关闭逐轮输出
        static void applyOverrides(const CommandLineOptions &cli, ChainerOptions &options);

        // 加载、推理、输出，返回退出码：0 证明成功，1 未能证明，2 输入错误
        static int run(const CommandLineOptions &cli);

        static void printUsage(const std::string &program, std::ostream &out);
    };
}

#endif // CHAINER_COMMAND_LINE_H
