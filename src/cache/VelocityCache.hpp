#ifndef VELOCITYCACHE_HPP
#define VELOCITYCACHE_HPP

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../interfaces/CacheInterface.hpp"

struct CacheEntry {
    std::string key;
    json value;
    std::optional<std::chrono::steady_clock::time_point> expiry; // nullopt = never expires
};

// Thread-safe LRU cache with optional per-entry TTL.
// Expired entries are only removed when touched by get(), exists() or remove(),
// so they keep occupying capacity and show up in size()/keys() until then.
class VelocityCache : public CacheInterface {
private:
    using EntryList = std::list<CacheEntry>;

    EntryList entries_;                                        // front = least recently used, back = most recently used
    std::unordered_map<std::string, EntryList::iterator> index_; // key -> node in entries_

    mutable std::mutex mutex_;
    const size_t max_size_;

    // Guarded by mutex_
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;

    static bool isExpired(const CacheEntry& entry, std::chrono::steady_clock::time_point now);
    static size_t validateMaxSize(int max_size);

    // Helpers below assume mutex_ is held
    void eraseEntry(EntryList::iterator it);
    void evictLeastRecentlyUsed();

public:
    // Throws std::invalid_argument if max_size is not positive
    explicit VelocityCache(int max_size = 1000);

    ~VelocityCache() override = default;

    VelocityCache(const VelocityCache&) = delete;
    VelocityCache& operator=(const VelocityCache&) = delete;

    void set(const std::string& key, const json& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    std::optional<json> get(const std::string& key) override;
    std::optional<json> remove(const std::string& key) override;

    // Empty key yields false instead of throwing. Does not change LRU order or hit/miss counters.
    bool exists(const std::string& key) override;

    // Raw presence check, ignores expiry and has no side effects
    bool contains(const std::string& key) const override;

    size_t size() const override;
    void clear() override;
    std::vector<std::string> keys() const override;
    CacheStats stats() const override;

    size_t maxSize() const { return max_size_; }
};

#endif // VELOCITYCACHE_HPP
