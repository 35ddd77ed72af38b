#include <iostream>
#include <stdexcept>
#include "CommandLine.h"

int main(int argc, char **argv)
{
    Chainer::CommandLineOptions cli;
    try
    {
        cli = Chainer::CommandLine::parse(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        Chainer::CommandLine::printUsage(argc > 0 ? argv[0] : "fol-chainer", std::cerr);
        return Chainer::CommandLine::EXIT_INPUT_ERROR;
    }
    return Chainer::CommandLine::run(cli);
}
