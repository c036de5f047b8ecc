#include "cli.h"
#include "utils.h"
#include <iostream>
#include <exception>

int main(int argc, char* argv[]) {
    try {
        prompthub::CLI cli;

        if (!cli.parseArgs(argc, argv)) {
            return cli.getExitCode(); // Help, version or a bad option
        }

        return cli.run();

    } catch (const std::exception& e) {
        prompthub::utils::terminal::printError(std::string("Fatal error: ") + e.what());
        return 1;
    } catch (...) {
        prompthub::utils::terminal::printError("Unknown fatal error occurred");
        return 1;
    }
}
