#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// --- Snapshot of a cache's counters, taken under the cache lock ---
class CacheStats {
public:
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    std::string hit_rate = "0.00%";
    size_t size = 0;
    size_t max_size = 0;

    // hits / (hits + misses) as a percentage with two decimals, "0.00%" before any lookup
    static std::string formatHitRate(uint64_t hits, uint64_t misses) {
        const uint64_t total = hits + misses;
        const double rate = total > 0 ? static_cast<double>(hits) / static_cast<double>(total) * 100.0 : 0.0;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << rate << "%";
        return oss.str();
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"expirations", expirations},
            {"hit_rate", hit_rate},
            {"size", size},
            {"max_size", max_size}
        };
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "hits: " << hits << "\n"
            << "misses: " << misses << "\n"
            << "evictions: " << evictions << "\n"
            << "expirations: " << expirations << "\n"
            << "hit_rate: " << hit_rate << "\n"
            << "size: " << size << "\n"
            << "max_size: " << max_size;
        return oss.str();
    }
};

#endif // CACHESTATS_HPP
