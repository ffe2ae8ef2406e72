#ifndef CACHEDEMO_HPP
#define CACHEDEMO_HPP

#include <memory>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/CacheStats.hpp"

class CacheInterface;

// Walks a small cache through set/get, stats reporting and TTL expiry, logging every step
class CacheDemo {
public:
    CacheDemo(const AppConfig& config, std::shared_ptr<ILogger> logger);

    CacheDemo(const CacheDemo&) = delete;
    CacheDemo& operator=(const CacheDemo&) = delete;

    // Returns the demo cache's stats after the expiry check
    CacheStats run() const;

private:
    void logLookup(CacheInterface& cache, const std::string& key, const std::string& label) const;

    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
};

#endif // CACHEDEMO_HPP
