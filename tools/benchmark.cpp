// Throughput benchmark for DiskMap.
//
// Opens a fresh store under the system temp directory and runs two phases
// with T worker threads:
//   (1) disjoint keys – each thread does N insert+get cycles on its own keys;
//   (2) shared key    – every thread does N alter(+1) calls on one counter,
//                       which serialise on the entry's exclusive lock.
//
// Prints: total ops, wall time, ops/sec, and latency percentiles (p50, p90,
// p99, p999) for each phase, then checks the counter for lost updates.

#include "common/logger.hpp"
#include "storage/disk_map.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;
using Map   = diskmap::DiskMap<std::string, int64_t>;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    std::size_t failed_ops{};
    double wall_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, double wall_sec) {
    BenchResult r;
    r.total_ops = latencies_ns.size();
    r.wall_sec  = wall_sec;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.ops_per_sec = wall_sec > 0 ? static_cast<double>(r.total_ops) / wall_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu (%zu failed)\n"
        "  Wall time:    %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.failed_ops, r.wall_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// Run `body(thread_index, latencies, failures)` on `threads` threads and
// merge what they recorded.
template <typename Body>
BenchResult run_threads(std::size_t threads, Body body) {
    std::vector<int64_t> all_latencies;
    std::size_t all_failures = 0;
    std::mutex merge_mutex;

    auto t0 = Clock::now();
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            std::vector<int64_t> latencies;
            std::size_t failures = 0;
            body(t, latencies, failures);

            std::lock_guard lock(merge_mutex);
            all_latencies.insert(all_latencies.end(), latencies.begin(), latencies.end());
            all_failures += failures;
        });
    }
    for (auto& w : workers) w.join();
    auto wall = std::chrono::duration<double>(Clock::now() - t0).count();

    auto r = compute_stats(all_latencies, wall);
    r.failed_ops = all_failures;
    return r;
}

template <typename Op>
void timed(std::vector<int64_t>& latencies, std::size_t& failures, Op op) {
    auto t0 = Clock::now();
    auto ec = op();
    auto t1 = Clock::now();
    latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    if (ec) ++failures;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    diskmap::init_default_logger(spdlog::level::warn);

    std::size_t num_cycles = 2'000;
    std::size_t num_threads = 4;
    if (argc > 1) {
        num_cycles = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_cycles == 0) num_cycles = 2'000;
    }
    if (argc > 2) {
        num_threads = static_cast<std::size_t>(std::atol(argv[2]));
        if (num_threads == 0) num_threads = 4;
    }

    const auto dir = std::filesystem::temp_directory_path() / "diskmap_benchmark";

    fprintf(stdout,
        "DiskMap Benchmark\n"
        "=================\n"
        "Cycles:    %zu per thread\n"
        "Threads:   %zu\n"
        "Directory: %s\n",
        num_cycles, num_threads, dir.c_str());

    Map map;
    if (auto ec = Map::open_new(dir, map)) {
        spdlog::error("benchmark: cannot open {}: {}", dir.string(), ec.message());
        return 1;
    }

    auto disjoint = run_threads(num_threads, [&](std::size_t t, auto& latencies, auto& failures) {
        latencies.reserve(num_cycles * 2);
        for (std::size_t i = 0; i < num_cycles; ++i) {
            const std::string key = "t" + std::to_string(t) + "_k" + std::to_string(i);
            timed(latencies, failures, [&] { return map.insert(key, static_cast<int64_t>(i)); });
            int64_t value = 0;
            timed(latencies, failures, [&] { return map.get(key, value); });
        }
    });

    if (auto ec = map.insert("counter", 0)) {
        spdlog::error("benchmark: cannot insert counter: {}", ec.message());
        return 1;
    }

    auto shared = run_threads(num_threads, [&](std::size_t, auto& latencies, auto& failures) {
        latencies.reserve(num_cycles);
        for (std::size_t i = 0; i < num_cycles; ++i) {
            timed(latencies, failures, [&] {
                return map.alter("counter", [](int64_t v) { return v + 1; });
            });
        }
    });

    print_result("Disjoint keys (insert + get)", disjoint);
    print_result("Shared key (alter)", shared);

    int64_t counter = 0;
    if (auto ec = map.get("counter", counter)) {
        spdlog::error("benchmark: cannot read counter: {}", ec.message());
        return 1;
    }
    const auto expected = static_cast<int64_t>(num_cycles * num_threads - shared.failed_ops);
    fprintf(stdout,
        "\n── Consistency ──\n"
        "  Counter:  %lld (expected %lld)\n\n",
        static_cast<long long>(counter), static_cast<long long>(expected));

    std::error_code cleanup_ec;
    std::filesystem::remove_all(dir, cleanup_ec);

    return counter == expected ? 0 : 1;
}
