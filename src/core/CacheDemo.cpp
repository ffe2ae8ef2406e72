#include "CacheDemo.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "../cache/VelocityCache.hpp"

CacheDemo::CacheDemo(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : config_(config), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

CacheStats CacheDemo::run() const {
    logger_->info("VelocityCache Demo");
    logger_->info(std::string(50, '='));

    VelocityCache cache(config_.demo_max_size);

    logger_->info("Setting values...");
    cache.set("BTC-USD", 43250.12, std::chrono::seconds(5));
    cache.set("ETH-USD", 2650.50, std::chrono::seconds(10));
    cache.set("ADA-USD", 0.45, std::chrono::milliseconds(config_.demo_short_ttl_millis));

    logger_->info("Getting values...");
    logLookup(cache, "BTC-USD", "BTC-USD");
    logLookup(cache, "ETH-USD", "ETH-USD");
    logLookup(cache, "ADA-USD", "ADA-USD");

    logger_->info("Cache Stats:");
    // items() only points at the object, so it must outlive the loop
    const json stats_json = cache.stats().to_json();
    for (const auto& [name, value] : stats_json.items()) {
        // Strings are printed without JSON quotes
        logger_->info("  " + name + ": " + (value.is_string() ? value.get<std::string>() : value.dump()));
    }

    logger_->info("Testing expiration...");
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.demo_expiry_wait_millis));

    std::stringstream ss;
    ss << "ADA-USD after " << config_.demo_expiry_wait_millis << "ms";
    logLookup(cache, "ADA-USD", ss.str());

    logger_->info("Demo complete!");
    return cache.stats();
}

void CacheDemo::logLookup(CacheInterface& cache, const std::string& key, const std::string& label) const {
    std::optional<json> value = cache.get(key);
    logger_->info(label + ": $" + (value ? value->dump() : std::string("null")));
}
