#ifndef CACHEBENCHMARK_HPP
#define CACHEBENCHMARK_HPP

#include <chrono>
#include <memory>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/BenchmarkResult.hpp"

// Times bulk cache workloads against a fresh VelocityCache per run.
// A run passes when its throughput reaches benchmark_target_ops_per_sec and it saw no errors.
class CacheBenchmark {
public:
    CacheBenchmark(const AppConfig& config, std::shared_ptr<ILogger> logger);

    CacheBenchmark(const CacheBenchmark&) = delete;
    CacheBenchmark& operator=(const CacheBenchmark&) = delete;

    BenchmarkResult benchmarkSetOperations(int cache_size, int operations) const;
    BenchmarkResult benchmarkGetOperations(int cache_size, int operations) const;
    // 20% SET, 80% GET
    BenchmarkResult benchmarkMixedOperations(int cache_size, int operations) const;
    BenchmarkResult benchmarkTtlExpiration(int cache_size, int operations, std::chrono::milliseconds ttl) const;
    // Each thread does operations / threads set+get round trips on its own keys.
    // A wrong value or an exception is an error; a key evicted before the read is not.
    BenchmarkResult benchmarkConcurrentOperations(int cache_size, int operations, int threads) const;

    // Runs every benchmark with the configured sizes, logs the summary and
    // writes the JSON report when benchmark_report_file is set
    BenchmarkReport runAll() const;

private:
    BenchmarkResult makeResult(const std::string& name, size_t operations,
                               std::chrono::steady_clock::duration elapsed, size_t errors = 0) const;
    void writeReport(const BenchmarkReport& report) const;

    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
};

#endif // CACHEBENCHMARK_HPP
