#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace blobspec::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t data_size;
    double avg_ms;
    double min_ms;
    double throughput_mbps;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        const auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// data_size 为单次迭代处理的字节数，用于计算吞吐。
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t data_size,
                          int iterations,
                          Func &&func) {
    if (iterations <= 0) {
        return;
    }

    std::vector<double> timings;
    timings.reserve(static_cast<std::size_t>(iterations));

    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        timings.push_back(timer.elapsed_ms());
    }

    double total_ms = 0.0;
    for (double t : timings) {
        total_ms += t;
    }
    const double avg_ms = total_ms / iterations;
    const double min_ms = *std::min_element(timings.begin(), timings.end());

    double throughput_mbps = 0.0;
    if (avg_ms > 0.0) {
        const double mb = static_cast<double>(data_size) / (1024.0 * 1024.0);
        throughput_mbps = mb / (avg_ms / 1000.0);
    }

    results().push_back({name, data_size, avg_ms, min_ms, throughput_mbps});
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

inline void print_results() {
    const std::string rule(100, '=');
    std::cout << "\n" << rule << "\nBENCHMARK RESULTS\n" << rule << "\n";
    std::cout << std::left << std::setw(46) << "Benchmark" << std::setw(12)
              << "Size" << std::setw(14) << "Avg (ms)" << std::setw(14)
              << "Min (ms)" << "Throughput (MB/s)\n";
    std::cout << std::string(100, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(46) << result.name << std::setw(12)
                  << format_size(result.data_size) << std::fixed
                  << std::setprecision(3) << std::setw(14) << result.avg_ms
                  << std::setw(14) << result.min_ms;
        if (result.throughput_mbps > 0.0) {
            std::cout << result.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }
    std::cout << rule << "\n\n";
}

} // namespace blobspec::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::blobspec::benchmarks::run_benchmark(                                     \
        name, size, iterations, [&]() { code; })
