#ifndef BENCHMARKRESULT_HPP
#define BENCHMARKRESULT_HPP

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace std;

// --- Outcome of one timed benchmark run ---
class BenchmarkResult {
public:
    string name;
    size_t operations = 0;
    double duration_seconds = 0.0;
    double ops_per_sec = 0.0;
    size_t errors = 0;
    bool passed = false;

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"name", name},
            {"operations", operations},
            {"duration_seconds", duration_seconds},
            {"ops_per_sec", ops_per_sec},
            {"errors", errors},
            {"passed", passed}
        };
    }

    // e.g. "SET       :   412,345 ops/sec PASS"
    string to_string() const {
        std::ostringstream oss;
        oss << std::left << std::setw(10) << name << ": "
            << std::right << std::setw(10) << formatThousands(ops_per_sec) << " ops/sec "
            << (passed ? "PASS" : "FAIL");
        if (errors > 0) {
            oss << " (" << errors << " errors)";
        }
        return oss.str();
    }

    static string formatThousands(double value) {
        std::string digits = std::to_string(static_cast<long long>(value + 0.5));
        std::string result;
        int count = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            if (count > 0 && count % 3 == 0 && *it != '-') {
                result.insert(result.begin(), ',');
            }
            result.insert(result.begin(), *it);
            ++count;
        }
        return result;
    }
};

// --- All runs of one benchmark session ---
class BenchmarkReport {
public:
    vector<BenchmarkResult> results;
    double target_ops_per_sec = 0.0;
    double overall_ops_per_sec = 0.0;
    bool passed = false;

    nlohmann::json to_json() const {
        nlohmann::json runs = nlohmann::json::array();
        for (const auto& result : results) {
            runs.push_back(result.to_json());
        }
        return nlohmann::json{
            {"results", runs},
            {"target_ops_per_sec", target_ops_per_sec},
            {"overall_ops_per_sec", overall_ops_per_sec},
            {"passed", passed}
        };
    }
};

#endif // BENCHMARKRESULT_HPP
