#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

// Define static members
std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

// The first call fixes the level for the lifetime of the process
std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::info(const std::string& message) {
    write(LogUtils::LogLevel::INFO, std::cout, LogUtils::INFO_LOG_PREFIX, message);
}

void ConsoleLogger::debug(const std::string& message) {
    write(LogUtils::LogLevel::DEBUG, std::cout, LogUtils::DEBUG_LOG_PREFIX, message);
}

void ConsoleLogger::warn(const std::string& message) {
    write(LogUtils::LogLevel::WARN, std::cout, LogUtils::WARN_LOG_PREFIX, message);
}

void ConsoleLogger::error(const std::string& message) {
    write(LogUtils::LogLevel::CERROR, std::cerr, LogUtils::CERROR_LOG_PREFIX, message);
}

// SETUP is the highest level, so setup lines pass every filter
void ConsoleLogger::setup(const std::string& message) {
    write(LogUtils::LogLevel::SETUP, std::cout, LogUtils::SETUP_LOG_PREFIX, message);
}

void ConsoleLogger::write(LogUtils::LogLevel level, std::ostream& out, const std::string& prefix, const std::string& message) {
    if (logLevel > level) {
        return;
    }
    std::lock_guard<std::mutex> lock(cout_mutex_);
    out << prefix << message << std::endl;
}
