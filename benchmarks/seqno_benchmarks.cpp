#include "seqtrack/seqno/global_checkpoint_tracker.hpp"
#include "seqtrack/seqno/local_checkpoint_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace
{

using Clock = std::chrono::steady_clock;
using seqtrack::seqno::GlobalCheckpointTracker;
using seqtrack::seqno::LocalCheckpointTracker;
using seqtrack::seqno::SequenceNumber;
using seqtrack::seqno::kNoOpsPerformed;
using seqtrack::seqno::kUnassignedSeqNo;

struct BenchmarkOptions final {
    std::size_t iterations = 1'000'000U;
    std::size_t threads = 4U;
    std::size_t replicas = 16U;
    bool json_output = false;
};

struct BenchmarkResult final {
    std::string name;
    std::size_t operations = 0U;
    Clock::duration elapsed{};
};

BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: seqtrack_benchmarks [--iterations N] [--threads N] [--replicas N] [--json]\n";
            std::exit(EXIT_SUCCESS);
        }
        if (arg == "--json") {
            options.json_output = true;
            continue;
        }
        if (index + 1 >= argc) {
            continue;
        }
        const auto value = std::strtoull(argv[index + 1], nullptr, 10);
        if (value == 0U) {
            continue;
        }
        if (arg == "--iterations" || arg == "-n") {
            options.iterations = static_cast<std::size_t>(value);
        } else if (arg == "--threads" || arg == "-t") {
            options.threads = static_cast<std::size_t>(value);
        } else if (arg == "--replicas" || arg == "-r") {
            options.replicas = static_cast<std::size_t>(value);
        }
    }
    return options;
}

BenchmarkResult benchmark_in_order(const BenchmarkOptions& options)
{
    LocalCheckpointTracker tracker{kNoOpsPerformed, kNoOpsPerformed};

    const auto start = Clock::now();
    for (std::size_t iteration = 0U; iteration < options.iterations; ++iteration) {
        tracker.mark_seq_no_as_completed(tracker.generate_seq_no());
    }
    return {"local_in_order", options.iterations, Clock::now() - start};
}

BenchmarkResult benchmark_out_of_order(const BenchmarkOptions& options)
{
    constexpr std::size_t kWindow = 256U;
    LocalCheckpointTracker tracker{kNoOpsPerformed, kNoOpsPerformed};
    std::mt19937 rng{7U};
    std::vector<SequenceNumber> window;
    window.reserve(kWindow);

    const auto start = Clock::now();
    for (std::size_t iteration = 0U; iteration < options.iterations; ++iteration) {
        window.push_back(tracker.generate_seq_no());
        if (window.size() == kWindow) {
            std::shuffle(window.begin(), window.end(), rng);
            for (const auto seq_no : window) {
                tracker.mark_seq_no_as_completed(seq_no);
            }
            window.clear();
        }
    }
    for (const auto seq_no : window) {
        tracker.mark_seq_no_as_completed(seq_no);
    }
    return {"local_out_of_order", options.iterations, Clock::now() - start};
}

BenchmarkResult benchmark_concurrent_writers(const BenchmarkOptions& options)
{
    LocalCheckpointTracker tracker{kNoOpsPerformed, kNoOpsPerformed};
    const auto per_thread = options.iterations / options.threads;

    const auto start = Clock::now();
    std::vector<std::thread> writers;
    for (std::size_t thread = 0U; thread < options.threads; ++thread) {
        writers.emplace_back([&tracker, per_thread] {
            for (std::size_t iteration = 0U; iteration < per_thread; ++iteration) {
                tracker.mark_seq_no_as_completed(tracker.generate_seq_no());
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    return {"local_concurrent_writers", per_thread * options.threads, Clock::now() - start};
}

BenchmarkResult benchmark_global_recompute(const BenchmarkOptions& options)
{
    GlobalCheckpointTracker tracker{kUnassignedSeqNo};
    seqtrack::seqno::AllocationIdSet active;
    std::vector<std::string> ids;
    for (std::size_t replica = 0U; replica < options.replicas; ++replica) {
        ids.push_back("allocation-" + std::to_string(replica));
        active.insert(ids.back());
    }
    tracker.update_allocation_ids_from_master(active, {});

    const auto rounds = std::max<std::size_t>(options.iterations / options.replicas, 1U);
    const auto start = Clock::now();
    for (std::size_t round = 0U; round < rounds; ++round) {
        for (const auto& id : ids) {
            tracker.update_local_checkpoint(id, static_cast<SequenceNumber>(round));
        }
        (void)tracker.update_checkpoint_on_primary();
    }
    return {"global_recompute", rounds, Clock::now() - start};
}

void print_table(const std::vector<BenchmarkResult>& results)
{
    std::cout << std::left << std::setw(28) << "benchmark" << std::right << std::setw(14) << "operations"
              << std::setw(14) << "elapsed_ms" << std::setw(16) << "ops_per_sec" << '\n';
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& result : results) {
        const auto seconds = std::chrono::duration<double>(result.elapsed).count();
        const auto ops_per_second = seconds > 0.0 ? static_cast<double>(result.operations) / seconds : 0.0;
        std::cout << std::left << std::setw(28) << result.name << std::right << std::setw(14) << result.operations
                  << std::setw(14) << seconds * 1000.0 << std::setw(16) << ops_per_second << '\n';
    }
    std::cout << std::defaultfloat;
}

void print_json(const std::vector<BenchmarkResult>& results)
{
    std::cout << "[";
    bool first = true;
    for (const auto& result : results) {
        const auto elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(result.elapsed).count();
        if (!first) {
            std::cout << ",";
        }
        first = false;
        std::cout << "{\"name\":\"" << result.name << "\",\"operations\":" << result.operations
                  << ",\"elapsed_ns\":" << elapsed_ns << "}";
    }
    std::cout << "]\n";
}

}  // namespace

int main(int argc, char** argv)
{
    try {
        const auto options = parse_options(argc, argv);

        std::vector<BenchmarkResult> results;
        results.reserve(4U);
        results.push_back(benchmark_in_order(options));
        results.push_back(benchmark_out_of_order(options));
        results.push_back(benchmark_concurrent_writers(options));
        results.push_back(benchmark_global_recompute(options));

        if (options.json_output) {
            print_json(results);
        } else {
            print_table(results);
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Benchmark harness failed: " << ex.what() << '\n';
        return 1;
    }
}
