#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace binform::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t bytes_per_iteration;
    double avg_ms;
    double best_ms;
    double throughput_mbps;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 返回单次调用耗时（毫秒）。
template <typename Func>
inline double time_once(Func &func) {
    const auto start = std::chrono::steady_clock::now();
    func();
    const auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

/**
 * @brief 执行 iterations 次并记录平均/最优耗时。
 *
 * bytes_per_iteration 用于计算吞吐（按平均耗时）；为 0 时吞吐显示 N/A。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t bytes_per_iteration,
                          int iterations,
                          Func &&func) {
    if (iterations <= 0) {
        return;
    }

    // 预热一次，避免首次分配计入结果
    (void)time_once(func);

    double total_ms = 0.0;
    double best_ms = 0.0;
    for (int i = 0; i < iterations; ++i) {
        const double t = time_once(func);
        total_ms += t;
        best_ms = (i == 0) ? t : std::min(best_ms, t);
    }
    const double avg_ms = total_ms / iterations;

    double throughput_mbps = 0.0;
    if (avg_ms > 0.0 && bytes_per_iteration != 0) {
        const double mb =
            static_cast<double>(bytes_per_iteration) / (1024.0 * 1024.0);
        throughput_mbps = mb / (avg_ms / 1000.0);
    }

    results().push_back(
        {name, bytes_per_iteration, avg_ms, best_ms, throughput_mbps});
}

inline std::string format_size(std::size_t n) {
    if (n >= 1024 * 1024) {
        return std::to_string(n / (1024 * 1024)) + " MB";
    }
    if (n >= 1024) {
        return std::to_string(n / 1024) + " KB";
    }
    return std::to_string(n) + " B";
}

inline void print_results() {
    const std::string rule(105, '=');
    std::cout << "\n" << rule << "\n";
    std::cout << "binform benchmarks\n";
    std::cout << rule << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(12)
              << "Size" << std::setw(14) << "Avg (ms)" << std::setw(14)
              << "Best (ms)" << "Throughput (MB/s)\n";
    std::cout << std::string(105, '-') << "\n";

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(50) << r.name << std::setw(12)
                  << format_size(r.bytes_per_iteration) << std::fixed
                  << std::setprecision(3) << std::setw(14) << r.avg_ms
                  << std::setw(14) << r.best_ms;
        if (r.throughput_mbps > 0.0) {
            std::cout << r.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }
    std::cout << rule << "\n\n";
}

} // namespace binform::benchmarks

#define BENCH_RUN(name, size, iterations, code)                                \
    ::binform::benchmarks::run_benchmark(name, size, iterations,              \
                                         [&]() { code; })
