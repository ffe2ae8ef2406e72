#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/AppConfig.hpp"
#include "core/CacheBenchmark.hpp"
#include "core/CacheDemo.hpp"
#include "logging/ConsoleLogger.hpp"
#include "utils/Utils.hpp"

using namespace std;

namespace {

void printUsage(const std::shared_ptr<ILogger>& logger_) {
    logger_->info("Usage: velocitycache [demo|benchmark|all] [key=value ...]");
    logger_->info("  demo      - Run cache demo");
    logger_->info("  benchmark - Run performance benchmarks");
    logger_->info("  all       - Run demo and benchmarks");
    logger_->info("Unit tests are run with ctest from the build directory.");
}

} // namespace

// --- Main Function ---
int main(int argc, char** argv) {
    std::stringstream ss;
    try {
        if (argc < 2) {
            printUsage(ConsoleLogger::getInstance(LogUtils::LogLevel::INFO));
            return 0;
        }
        const string command = argv[1];

        // Remaining arguments are key=value configuration overrides
        vector<string> args_vec;
        for (int i = 2; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        if (command == "demo") {
            CacheDemo(config_, logger_).run();
        } else if (command == "benchmark") {
            CacheBenchmark(config_, logger_).runAll();
        } else if (command == "all") {
            CacheDemo(config_, logger_).run();
            logger_->info(Constants::REPORT_SEPARATOR);
            CacheBenchmark(config_, logger_).runAll();
        } else {
            logger_->error("Unknown command: " + command);
            printUsage(logger_);
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        ss.str("");
        ss.clear();
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
