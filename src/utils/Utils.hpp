#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one key/value to the config. Returns false for unknown keys.
    // Malformed numbers and out-of-range values keep the current value and print a warning.
    static bool applyConfigValue(AppConfig& config, const string& key, const string& value) {
        if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else if (key == "demo_max_size") {
            applyPositiveInt(key, value, config.demo_max_size);
        } else if (key == "demo_short_ttl_millis") {
            applyNonNegativeInt(key, value, config.demo_short_ttl_millis);
        } else if (key == "demo_expiry_wait_millis") {
            applyNonNegativeInt(key, value, config.demo_expiry_wait_millis);
        } else if (key == "benchmark_cache_size") {
            applyPositiveInt(key, value, config.benchmark_cache_size);
        } else if (key == "benchmark_operations") {
            applyPositiveInt(key, value, config.benchmark_operations);
        } else if (key == "benchmark_ttl_cache_size") {
            applyPositiveInt(key, value, config.benchmark_ttl_cache_size);
        } else if (key == "benchmark_ttl_operations") {
            applyPositiveInt(key, value, config.benchmark_ttl_operations);
        } else if (key == "benchmark_ttl_millis") {
            applyNonNegativeInt(key, value, config.benchmark_ttl_millis);
        } else if (key == "benchmark_threads") {
            applyPositiveInt(key, value, config.benchmark_threads);
        } else if (key == "benchmark_target_ops_per_sec") {
            if (auto val = stringToDouble(value); val && *val >= 0.0) {
                config.benchmark_target_ops_per_sec = *val;
            } else {
                cerr << "Warning: Invalid number for benchmark_target_ops_per_sec: " << value << endl;
            }
        } else if (key == "benchmark_report_file") {
            config.benchmark_report_file = value;
        } else {
            return false;
        }
        return true;
    }

    // Load configuration from the config file, then apply command-line overrides
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        // Try multiple config file locations
        std::vector<std::string> config_paths = {
            std::string(Constants::CONFIG_FILE_NAME),            // Current directory
            "../" + std::string(Constants::CONFIG_FILE_NAME),     // Parent directory
            "/app/" + std::string(Constants::CONFIG_FILE_NAME),   // Docker container path
            "../../" + std::string(Constants::CONFIG_FILE_NAME)   // Development path
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                std::string line;
                while (getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != string::npos && delimiterPos > 0) {
                        string key = trim(line.substr(0, delimiterPos));
                        string value = trim(line.substr(delimiterPos + 1));
                        if (!applyConfigValue(config, key, value)) {
                            cerr << "Warning: Unknown key in config file: " << key << endl;
                        }
                    } else {
                        cerr << "Warning: Ignoring malformed line in config file: " << line << endl;
                    }
                }
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        // --- Command-line overrides ---
        for (const auto& [key, value] : startupArguments) {
            if (!applyConfigValue(config, key, value)) {
                cerr << "Warning: Unknown command-line argument: " << key << endl;
            }
        }

        return config;
    }

private:
    static void applyPositiveInt(const string& key, const string& value, int& target) {
        if (auto val = stringToInt(value); val && *val > 0) {
            target = *val;
        } else {
            cerr << "Warning: Invalid positive integer for " << key << ": " << value << endl;
        }
    }

    static void applyNonNegativeInt(const string& key, const string& value, int& target) {
        if (auto val = stringToInt(value); val && *val >= 0) {
            target = *val;
        } else {
            cerr << "Warning: Invalid non-negative integer for " << key << ": " << value << endl;
        }
    }
};

#endif // UTILS_HPP
