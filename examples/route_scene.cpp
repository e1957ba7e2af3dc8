#include "RouteCommand.h"

#include <elbow/common/Logger.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace elbow;

    std::vector<std::string> args(argv + 1, argv + argc);
    cli::RouteOptions options;

    switch (cli::parseArgs(args, options, std::cerr)) {
        case cli::ParseResult::Help:
            cli::printUsage(argv[0], std::cout);
            return 0;
        case cli::ParseResult::Version:
            std::cout << "elbow_route " << versionString() << "\n";
            return 0;
        case cli::ParseResult::Error:
            cli::printUsage(argv[0], std::cerr);
            return 1;
        case cli::ParseResult::Run:
            break;
    }

    Logger::initialize();
    if (options.logLevel) {
        Logger::setLevel(*options.logLevel);
    }

    int status = cli::run(options, std::cout);
    Logger::flush();
    return status;
}
