#include "CommandLine.h"
#include "KnowledgeBase.h"
#include "ProblemLoader.h"
#include "TraceSerializer.h"
#include "Errors.h"
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <unistd.h>

namespace Chainer
{
    namespace
    {
        bool parseNumber(const char *text, long &value)
        {
            char *end = nullptr;
            value = std::strtol(text, &end, 10);
            return end != text && *end == '\0';
        }
    }

    CommandLineOptions CommandLine::parse(int argc, char **argv)
    {
        CommandLineOptions cli;
        if (argc > 0)
        {
            cli.program = argv[0];
        }

        // glibc: optind = 0 重新初始化 getopt，允许在同一进程里多次解析
        optind = 0;
        opterr = 0;

        int opt;
        while ((opt = getopt(argc, argv, ":jqvt:r:h")) != -1)
        {
            switch (opt)
            {
            case 'j':
                cli.asJson = true;
                break;
            case 'q':
                cli.quiet = true;
                break;
            case 'v':
                cli.verbose = true;
                break;
            case 't':
                if (!parseNumber(optarg, cli.threads) || cli.threads < 0)
                {
                    throw std::invalid_argument(std::string("invalid thread count: ") + optarg);
                }
                break;
            case 'r':
                if (!parseNumber(optarg, cli.roundCap) || cli.roundCap <= 0 ||
                    cli.roundCap > std::numeric_limits<int>::max())
                {
                    throw std::invalid_argument(std::string("invalid round cap: ") + optarg);
                }
                break;
            case 'h':
                cli.showHelp = true;
                return cli;
            case ':':
                throw std::invalid_argument(std::string("option -") + static_cast<char>(optopt) +
                                            " needs a value");
            default:
                throw std::invalid_argument(std::string("unknown option -") + static_cast<char>(optopt));
            }
        }

        if (optind != argc - 1)
        {
            throw std::invalid_argument("expected exactly one problem file");
        }
        cli.problemPath = argv[optind];
        return cli;
    }

    void CommandLine::applyOverrides(const CommandLineOptions &cli, ChainerOptions &options)
    {
        if (cli.threads >= 0)
            options.workerThreads = static_cast<unsigned>(cli.threads);
        if (cli.roundCap > 0)
            options.roundCap = static_cast<int>(cli.roundCap);
        if (cli.verbose)
            options.verbose = true;
        if (cli.quiet || cli.asJson)
            options.verbose = false;
    }

    int CommandLine::run(const CommandLineOptions &cli)
    {
        if (cli.showHelp)
        {
            printUsage(cli.program, std::cout);
            return EXIT_PROVEN;
        }

        try
        {
            KnowledgeBase kb;
            ChainerOptions options;
            Fact query = ProblemLoader::loadFromFile(cli.problemPath, kb, options);
            applyOverrides(cli, options);

            ForwardChainer chainer(options);
            ChainResult result = chainer.run(kb, query);

            if (cli.asJson)
            {
                std::cout << TraceSerializer::serializeResult(result, kb.getRules(), kb).dump(2) << std::endl;
            }
            else
            {
                result.print(kb);
                if (result.proven)
                    std::cout << "Conclusion: the query '" << query.toString(kb) << "' is proven to be TRUE." << std::endl;
                else
                    std::cout << "Conclusion: the query '" << query.toString(kb) << "' cannot be proven." << std::endl;
            }
            return result.proven ? EXIT_PROVEN : EXIT_NOT_PROVEN;
        }
        catch (const ChainerError &e)
        {
            std::cerr << "error: " << e.what() << std::endl;
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "error: " << e.what() << std::endl;
        }
        catch (const nlohmann::json::exception &e)
        {
            std::cerr << "json error: " << e.what() << std::endl;
        }
        return EXIT_INPUT_ERROR;
    }

    void CommandLine::printUsage(const std::string &program, std::ostream &out)
    {
        out << "Usage: " << program << " [-j] [-q|-v] [-t THREADS] [-r ROUND_CAP] PROBLEM.json\n"
            << "  -j            print the result as JSON\n"
            << "  -q            do not log rounds (overrides options.verbose)\n"
            << "  -v            log every round\n"
            << "  -t THREADS    worker threads per round, 0 = hardware concurrency\n"
            << "  -r ROUND_CAP  maximum number of rounds\n";
    }
}
