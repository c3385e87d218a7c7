#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config_file.hpp"
#include "model/config.hpp"
#include "supervisor.hpp"
#include "util/error.hpp"

namespace {
void printUsage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " [--config <path>] [--socket <path>] [--help]\n"
        << "  --config <path>  pipe configuration (default " << kDefaultConfigPath << ")\n"
        << "  --socket <path>  syslog socket (default /dev/log, /var/run/syslog, /var/run/log)\n";
}

/**
 * @brief Fill cfg from argv.
 * @return false on an unknown option or a missing option value.
 */
bool parseArgs(int argc, char* argv[], Config& cfg, bool& helpRequested, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            helpRequested = true;
        } else if (arg == "--config" || arg == "--socket") {
            if (i + 1 >= argc) {
                err = arg + " needs a value";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                cfg.configPath = value;
            } else {
                cfg.syslogSocket = value;
            }
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
    }
    return true;
}
} // namespace

// Loads the pipe list, validates every pipe, then forwards until all workers have failed.
int main(int argc, char* argv[]) {
    Config cfg;
    bool helpRequested = false;
    std::string err;
    if (!parseArgs(argc, argv, cfg, helpRequested, err)) {
        std::cerr << err << std::endl;
        printUsage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }
    if (helpRequested) {
        printUsage(std::cout, argv[0]);
        std::cout << std::endl;
        printConfigExample(std::cout, cfg.configPath);
        return EXIT_SUCCESS;
    }

    if (!parseConfigFile(cfg.configPath, cfg.pipes, err)) {
        std::cerr << "Config error: " << err << std::endl;
        printConfigExample(std::cout, cfg.configPath);
        return EXIT_FAILURE;
    }

    Supervisor supervisor(cfg.syslogSocket);
    Failure failure;
    if (!supervisor.resolveAll(cfg.pipes, failure)) {
        std::cout << failure.message << std::endl;
        printConfigExample(std::cout, cfg.configPath);
        return EXIT_FAILURE;
    }

    supervisor.start();
    return supervisor.wait();
}
