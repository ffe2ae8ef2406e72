#include "VelocityCache.hpp"

#include <iterator>
#include <stdexcept>

using namespace std::chrono;

VelocityCache::VelocityCache(int max_size) : max_size_(validateMaxSize(max_size)) {}

size_t VelocityCache::validateMaxSize(int max_size) {
    if (max_size <= 0) {
        throw std::invalid_argument("max_size must be positive");
    }
    return static_cast<size_t>(max_size);
}

bool VelocityCache::isExpired(const CacheEntry& entry, steady_clock::time_point now) {
    return entry.expiry.has_value() && now > *entry.expiry;
}

void VelocityCache::set(const std::string& key, const json& value, std::optional<milliseconds> ttl) {
    if (key.empty()) {
        throw std::invalid_argument("Key cannot be empty");
    }
    if (ttl && ttl->count() < 0) {
        throw std::invalid_argument("TTL must be non-negative, got " + std::to_string(ttl->count()) + "ms");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<steady_clock::time_point> expiry;
    if (ttl) {
        expiry = steady_clock::now() + *ttl;
    }

    auto index_it = index_.find(key);
    if (index_it != index_.end()) {
        // Update in place; an update is not growth so it never evicts
        EntryList::iterator entry_it = index_it->second;
        entry_it->value = value;
        entry_it->expiry = expiry;
        entries_.splice(entries_.end(), entries_, entry_it);
        return;
    }

    if (entries_.size() >= max_size_) {
        evictLeastRecentlyUsed();
    }

    entries_.push_back(CacheEntry{key, value, expiry});
    index_.emplace(key, std::prev(entries_.end()));
}

std::optional<json> VelocityCache::get(const std::string& key) {
    if (key.empty()) {
        throw std::invalid_argument("Key cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }

    EntryList::iterator entry_it = index_it->second;
    if (isExpired(*entry_it, steady_clock::now())) {
        eraseEntry(entry_it);
        ++misses_;
        ++expirations_;
        return std::nullopt;
    }

    entries_.splice(entries_.end(), entries_, entry_it);
    ++hits_;
    return entry_it->value;
}

std::optional<json> VelocityCache::remove(const std::string& key) {
    if (key.empty()) {
        throw std::invalid_argument("Key cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        return std::nullopt;
    }

    EntryList::iterator entry_it = index_it->second;
    const bool expired = isExpired(*entry_it, steady_clock::now());
    json value = std::move(entry_it->value);
    eraseEntry(entry_it);

    if (expired) {
        // Removed something that was already dead
        ++expirations_;
        return std::nullopt;
    }
    return value;
}

bool VelocityCache::exists(const std::string& key) {
    if (key.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto index_it = index_.find(key);
    if (index_it == index_.end()) {
        return false;
    }

    if (isExpired(*index_it->second, steady_clock::now())) {
        eraseEntry(index_it->second);
        ++expirations_;
        return false;
    }
    return true;
}

bool VelocityCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.find(key) != index_.end();
}

size_t VelocityCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void VelocityCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

std::vector<std::string> VelocityCache::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const CacheEntry& entry : entries_) {
        result.push_back(entry.key);
    }
    return result;
}

CacheStats VelocityCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.expirations = expirations_;
    stats.hit_rate = CacheStats::formatHitRate(hits_, misses_);
    stats.size = entries_.size();
    stats.max_size = max_size_;
    return stats;
}

void VelocityCache::eraseEntry(EntryList::iterator it) {
    // Index entry goes first, the node owns the key string used for the lookup
    index_.erase(it->key);
    entries_.erase(it);
}

void VelocityCache::evictLeastRecentlyUsed() {
    // The LRU victim goes regardless of whether it already expired; it counts as an eviction only
    if (entries_.empty()) {
        return;
    }
    eraseEntry(entries_.begin());
    ++evictions_;
}
