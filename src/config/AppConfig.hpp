#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <sstream>
#include <string>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "velocitycache.config";
    static constexpr auto REPORT_SEPARATOR = "============================================================";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Logging Level
    LogUtils::LogLevel log_level;

    // Demo
    int demo_max_size;
    int demo_short_ttl_millis;
    int demo_expiry_wait_millis;

    // Benchmarks
    int benchmark_cache_size;
    int benchmark_operations;
    int benchmark_ttl_cache_size;
    int benchmark_ttl_operations;
    int benchmark_ttl_millis;
    int benchmark_threads;
    double benchmark_target_ops_per_sec;
    std::string benchmark_report_file; // Empty = do not write a JSON report

    AppConfig() {
        // --- Set Defaults  ---
        log_level = LogUtils::LogLevel::INFO;

        demo_max_size = 5;
        demo_short_ttl_millis = 3000;
        demo_expiry_wait_millis = 4000;

        benchmark_cache_size = 10000;
        benchmark_operations = 50000;
        benchmark_ttl_cache_size = 1000;
        benchmark_ttl_operations = 10000;
        benchmark_ttl_millis = 1;
        benchmark_threads = 4;
        benchmark_target_ops_per_sec = 30000.0;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl  // Cast enum to int
            << "// --- Demo --- //" << std::endl
            << "demo_max_size: " << demo_max_size << std::endl
            << "demo_short_ttl_millis: " << demo_short_ttl_millis << std::endl
            << "demo_expiry_wait_millis: " << demo_expiry_wait_millis << std::endl
            << "// --- Benchmarks --- //" << std::endl
            << "benchmark_cache_size: " << benchmark_cache_size << std::endl
            << "benchmark_operations: " << benchmark_operations << std::endl
            << "benchmark_ttl_cache_size: " << benchmark_ttl_cache_size << std::endl
            << "benchmark_ttl_operations: " << benchmark_ttl_operations << std::endl
            << "benchmark_ttl_millis: " << benchmark_ttl_millis << std::endl
            << "benchmark_threads: " << benchmark_threads << std::endl
            << "benchmark_target_ops_per_sec: " << benchmark_target_ops_per_sec << std::endl
            << "benchmark_report_file: " << (benchmark_report_file.empty() ? "<none>" : benchmark_report_file) << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
