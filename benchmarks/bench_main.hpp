#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace bsonx::benchmarks {

struct BenchmarkResult {
    std::string name;
    std::size_t data_size;
    int iterations;
    double avg_ms;
    double min_ms;
    double throughput_mbps;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

[[nodiscard]] inline std::string format_size(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

/**
 * @brief 重复执行 func，记录平均与最短耗时。
 *
 * 吞吐按平均耗时计算；data_size 为 0 时不计算吞吐。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    std::vector<double> timings;
    timings.reserve(static_cast<std::size_t>(iterations));

    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        timings.push_back(timer.elapsed_ms());
    }
    if (timings.empty()) {
        return;
    }

    double total_ms = 0.0;
    for (double t : timings) {
        total_ms += t;
    }
    const double avg_ms = total_ms / static_cast<double>(timings.size());
    const double min_ms = *std::min_element(timings.begin(), timings.end());

    double throughput_mbps = 0.0;
    if (avg_ms > 0.0 && data_size > 0) {
        const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
        throughput_mbps = mb / (avg_ms / 1000.0);
    }

    results().push_back(
        {std::string(name), data_size, iterations, avg_ms, min_ms, throughput_mbps});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(12)
              << "Size" << std::setw(8) << "Runs" << std::setw(12)
              << "Avg (ms)" << std::setw(12) << "Min (ms)" << std::setw(16)
              << "Throughput (MB/s)"
              << "\n";
    std::cout << std::string(110, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(50) << result.name << std::setw(12)
                  << format_size(result.data_size) << std::setw(8)
                  << result.iterations;

        std::cout << std::fixed << std::setprecision(3) << std::setw(12)
                  << result.avg_ms << std::setw(12) << result.min_ms;

        if (result.throughput_mbps > 0.0) {
            std::cout << std::setw(16) << result.throughput_mbps;
        } else {
            std::cout << std::setw(16) << "N/A";
        }

        std::cout << "\n";
    }

    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace bsonx::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::bsonx::benchmarks::run_benchmark(name, size, iterations, [&]() { code; })
