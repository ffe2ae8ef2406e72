#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../models/CacheStats.hpp"

using json = nlohmann::json;

class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    virtual void set(const std::string& key, const json& value,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;
    virtual std::optional<json> get(const std::string& key) = 0;
    virtual std::optional<json> remove(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual bool contains(const std::string& key) const = 0;
    virtual size_t size() const = 0;
    virtual void clear() = 0;
    virtual std::vector<std::string> keys() const = 0;
    virtual CacheStats stats() const = 0;
};

#endif // CACHEINTERFACE_HPP
