#include "CacheBenchmark.hpp"

#include <atomic>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "../cache/VelocityCache.hpp"

using namespace std::chrono;

namespace {

std::string keyFor(int i) {
    return "key_" + std::to_string(i);
}

std::string valueFor(int i) {
    return "value_" + std::to_string(i);
}

void fillCache(VelocityCache& cache, int cache_size) {
    for (int i = 0; i < cache_size; ++i) {
        cache.set(keyFor(i), valueFor(i), seconds(10));
    }
}

} // namespace

CacheBenchmark::CacheBenchmark(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : config_(config), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

BenchmarkResult CacheBenchmark::benchmarkSetOperations(int cache_size, int operations) const {
    VelocityCache cache(cache_size);

    logger_->info("Benchmarking " + BenchmarkResult::formatThousands(operations) + " SET operations...");
    const auto start = steady_clock::now();
    for (int i = 0; i < operations; ++i) {
        cache.set(keyFor(i), valueFor(i), seconds(1));
    }
    return makeResult("SET", static_cast<size_t>(operations), steady_clock::now() - start);
}

BenchmarkResult CacheBenchmark::benchmarkGetOperations(int cache_size, int operations) const {
    VelocityCache cache(cache_size);
    fillCache(cache, cache_size);

    logger_->info("Benchmarking " + BenchmarkResult::formatThousands(operations) + " GET operations...");
    const auto start = steady_clock::now();
    for (int i = 0; i < operations; ++i) {
        cache.get(keyFor(i % cache_size));
    }
    return makeResult("GET", static_cast<size_t>(operations), steady_clock::now() - start);
}

BenchmarkResult CacheBenchmark::benchmarkMixedOperations(int cache_size, int operations) const {
    VelocityCache cache(cache_size);
    fillCache(cache, cache_size);

    logger_->info("Benchmarking " + BenchmarkResult::formatThousands(operations) + " mixed operations (80% GET, 20% SET)...");
    const auto start = steady_clock::now();
    for (int i = 0; i < operations; ++i) {
        if (i % 5 == 0) {
            cache.set(keyFor(i % cache_size), valueFor(i), seconds(10));
        } else {
            cache.get(keyFor(i % cache_size));
        }
    }
    return makeResult("MIXED", static_cast<size_t>(operations), steady_clock::now() - start);
}

BenchmarkResult CacheBenchmark::benchmarkTtlExpiration(int cache_size, int operations, milliseconds ttl) const {
    VelocityCache cache(cache_size);

    logger_->info("Benchmarking " + BenchmarkResult::formatThousands(operations) + " operations with TTL expiration...");
    const auto start = steady_clock::now();
    for (int i = 0; i < operations; ++i) {
        // Short TTL, the read right after may or may not see the entry
        cache.set(keyFor(i % cache_size), valueFor(i), ttl);
        cache.get(keyFor(i % cache_size));
    }
    BenchmarkResult result = makeResult("TTL", static_cast<size_t>(operations), steady_clock::now() - start);

    logger_->info("Stats: " + cache.stats().to_json().dump());
    return result;
}

BenchmarkResult CacheBenchmark::benchmarkConcurrentOperations(int cache_size, int operations, int threads) const {
    if (threads <= 0) {
        throw std::invalid_argument("threads must be positive");
    }
    VelocityCache cache(cache_size);
    const int per_thread = operations / threads;
    std::atomic<size_t> errors{0};
    std::atomic<size_t> evicted{0};

    logger_->info("Benchmarking " + BenchmarkResult::formatThousands(per_thread * threads) +
                  " concurrent SET+GET round trips on " + std::to_string(threads) + " threads...");

    boost::asio::thread_pool pool(static_cast<size_t>(threads));
    const auto start = steady_clock::now();
    for (int t = 0; t < threads; ++t) {
        boost::asio::post(pool, [this, &cache, &errors, &evicted, t, per_thread]() {
            try {
                for (int i = 0; i < per_thread; ++i) {
                    const std::string key = "key_" + std::to_string(t) + "_" + std::to_string(i);
                    const std::string value = "value_" + std::to_string(t) + "_" + std::to_string(i);
                    cache.set(key, value);
                    std::optional<json> retrieved = cache.get(key);
                    if (!retrieved) {
                        // Other workers may push the key out before it is read back
                        evicted.fetch_add(1, std::memory_order_relaxed);
                    } else if (*retrieved != json(value)) {
                        errors.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            } catch (const std::exception& e) {
                errors.fetch_add(1, std::memory_order_relaxed);
                logger_->error("Exception in benchmark worker " + std::to_string(t) + ": " + e.what());
            }
        });
    }
    pool.join();
    const auto elapsed = steady_clock::now() - start;
    if (evicted.load() > 0) {
        logger_->debug(std::to_string(evicted.load()) + " keys were evicted before being read back");
    }

    // Each round trip is two cache operations
    BenchmarkResult result = makeResult("CONCURRENT", static_cast<size_t>(per_thread) * threads * 2, elapsed, errors.load());
    if (cache.size() > cache.maxSize()) {
        logger_->error("Cache size " + std::to_string(cache.size()) + " exceeds max_size " + std::to_string(cache.maxSize()));
        ++result.errors;
        result.passed = false;
    }
    return result;
}

BenchmarkReport CacheBenchmark::runAll() const {
    logger_->info(Constants::REPORT_SEPARATOR);
    logger_->info("VelocityCache TTL Performance Benchmarks");
    logger_->info(Constants::REPORT_SEPARATOR);

    BenchmarkReport report;
    report.target_ops_per_sec = config_.benchmark_target_ops_per_sec;
    report.results.push_back(benchmarkSetOperations(config_.benchmark_cache_size, config_.benchmark_operations));
    report.results.push_back(benchmarkGetOperations(config_.benchmark_cache_size, config_.benchmark_operations));
    report.results.push_back(benchmarkMixedOperations(config_.benchmark_cache_size, config_.benchmark_operations));
    report.results.push_back(benchmarkTtlExpiration(config_.benchmark_ttl_cache_size, config_.benchmark_ttl_operations,
                                                    milliseconds(config_.benchmark_ttl_millis)));
    report.results.push_back(benchmarkConcurrentOperations(config_.benchmark_cache_size, config_.benchmark_operations,
                                                           config_.benchmark_threads));

    double total = 0.0;
    bool errors_seen = false;
    for (const auto& result : report.results) {
        total += result.ops_per_sec;
        errors_seen = errors_seen || result.errors > 0;
    }
    report.overall_ops_per_sec = total / static_cast<double>(report.results.size());
    report.passed = !errors_seen && report.overall_ops_per_sec >= report.target_ops_per_sec;

    logger_->info(Constants::REPORT_SEPARATOR);
    logger_->info("SUMMARY");
    logger_->info(Constants::REPORT_SEPARATOR);
    for (const auto& result : report.results) {
        logger_->info(result.to_string());
    }
    BenchmarkResult overall;
    overall.name = "OVERALL";
    overall.ops_per_sec = report.overall_ops_per_sec;
    overall.passed = report.passed;
    logger_->info(overall.to_string());

    if (!config_.benchmark_report_file.empty()) {
        writeReport(report);
    }
    return report;
}

BenchmarkResult CacheBenchmark::makeResult(const std::string& name, size_t operations,
                                           steady_clock::duration elapsed, size_t errors) const {
    BenchmarkResult result;
    result.name = name;
    result.operations = operations;
    result.duration_seconds = duration_cast<duration<double>>(elapsed).count();
    // Guard against a zero-length measurement on coarse clocks
    result.ops_per_sec = result.duration_seconds > 0.0
        ? static_cast<double>(operations) / result.duration_seconds
        : static_cast<double>(operations);
    result.errors = errors;
    result.passed = errors == 0 && result.ops_per_sec >= config_.benchmark_target_ops_per_sec;

    std::ostringstream ss;
    ss << name << " Operations: " << BenchmarkResult::formatThousands(result.ops_per_sec)
       << " ops/sec (" << std::fixed << std::setprecision(3) << result.duration_seconds << "s)";
    logger_->info(ss.str());
    return result;
}

void CacheBenchmark::writeReport(const BenchmarkReport& report) const {
    std::ofstream out(config_.benchmark_report_file);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open benchmark report file: " + config_.benchmark_report_file);
    }
    out << report.to_json().dump(2) << std::endl;
    if (!out.good()) {
        throw std::runtime_error("Failed to write benchmark report file: " + config_.benchmark_report_file);
    }
    logger_->info("Benchmark report written to " + config_.benchmark_report_file);
}
