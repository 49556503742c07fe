#include "seqtrack/seqno/sequence_numbers_service.hpp"
#include "seqtrack/seqno/seqno_telemetry_registry.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace seqno = seqtrack::seqno;

namespace {

struct SimulationOptions final {
    std::size_t writers = 4U;
    std::size_t operations = 10'000U;
    std::size_t replicas = 2U;
    std::size_t bit_arrays_size = seqno::LocalCheckpointTracker::kDefaultBitArraysSize;
    std::uint32_t seed = 42U;
    bool untrusted_active = false;
};

struct ShardCopy final {
    std::string allocation_id;
    std::unique_ptr<seqno::SequenceNumbersService> service;
};

std::unique_ptr<seqno::SequenceNumbersService> make_service(const std::string& allocation_id,
                                                            const SimulationOptions& options,
                                                            seqno::SeqNoTelemetryRegistry& registry)
{
    seqno::SequenceNumbersService::Config config{};
    config.shard_id = "[simulation][0]";
    config.telemetry_identifier = allocation_id;
    config.telemetry_registry = &registry;
    config.local.bit_arrays_size = options.bit_arrays_size;
    config.global.trust_new_active_allocations = !options.untrusted_active;
    return std::make_unique<seqno::SequenceNumbersService>(std::move(config));
}

void run_writers(std::vector<ShardCopy>& copies, const SimulationOptions& options, std::size_t operations)
{
    auto& primary = *copies.front().service;
    const auto per_writer = operations / options.writers;
    const auto remainder = operations % options.writers;

    std::vector<std::thread> writers;
    for (std::size_t writer = 0U; writer < options.writers; ++writer) {
        const auto count = per_writer + (writer < remainder ? 1U : 0U);
        writers.emplace_back([&copies, &primary, count, seed = options.seed + static_cast<std::uint32_t>(writer)] {
            std::mt19937 rng{seed};
            std::vector<seqno::SequenceNumber> batch;
            const auto flush = [&] {
                for (std::size_t index = 1U; index < copies.size(); ++index) {
                    std::shuffle(batch.begin(), batch.end(), rng);
                    auto& replica = *copies[index].service;
                    for (const auto seq_no : batch) {
                        replica.advance_max_seq_no(seq_no);
                        replica.mark_seq_no_as_completed(seq_no);
                    }
                }
                std::shuffle(batch.begin(), batch.end(), rng);
                for (const auto seq_no : batch) {
                    primary.mark_seq_no_as_completed(seq_no);
                }
                batch.clear();
            };

            for (std::size_t op = 0U; op < count; ++op) {
                batch.push_back(primary.generate_seq_no());
                if (batch.size() == 16U) {
                    flush();
                }
            }
            flush();
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
}

seqno::GlobalCheckpointUpdate sync_checkpoints(std::vector<ShardCopy>& copies)
{
    auto& primary = *copies.front().service;
    for (const auto& copy : copies) {
        primary.update_local_checkpoint_for_shard(copy.allocation_id, copy.service->local_checkpoint());
    }
    const auto outcome = primary.update_global_checkpoint_on_primary();
    for (std::size_t index = 1U; index < copies.size(); ++index) {
        copies[index].service->update_global_checkpoint_on_replica(primary.global_checkpoint());
    }
    return outcome;
}

void print_copy(const std::string& identifier, const seqno::SeqNoTelemetrySnapshot& snapshot)
{
    std::cout << identifier << '\n';
    std::cout << "  max_seq_no         " << snapshot.stats.max_seq_no << '\n';
    std::cout << "  local_checkpoint   " << snapshot.stats.local_checkpoint << '\n';
    std::cout << "  global_checkpoint  " << snapshot.stats.global_checkpoint << '\n';
    std::cout << "  completed          " << snapshot.local.completed
              << " (out of order " << snapshot.local.out_of_order_completions << ")\n";
    std::cout << "  max window         " << snapshot.local.max_outstanding_window << '\n';
    std::cout << "  bit arrays         " << snapshot.local.bit_arrays_allocated << " allocated, "
              << snapshot.local.bit_arrays_released << " released\n";
    if (snapshot.global.primary_recomputations > 0U) {
        std::cout << "  recomputations     " << snapshot.global.primary_recomputations << " ("
                  << snapshot.global.primary_advances << " advanced, "
                  << snapshot.global.primary_blocked_on_unknown << " blocked)\n";
        std::cout << "  allocations        " << snapshot.global.in_sync_allocations << " in-sync, "
                  << snapshot.global.tracked_allocations << " tracked\n";
    }
}

void run_simulation(const SimulationOptions& options)
{
    if (options.writers == 0U) {
        throw std::invalid_argument{"at least one writer is required"};
    }

    seqno::SeqNoTelemetryRegistry registry{};
    std::vector<ShardCopy> copies;
    copies.push_back({"p0", make_service("p0", options, registry)});
    for (std::size_t index = 1U; index <= options.replicas; ++index) {
        const auto allocation_id = "r" + std::to_string(index);
        copies.push_back({allocation_id, make_service(allocation_id, options, registry)});
    }

    seqno::AllocationIdSet active{"p0"};
    seqno::AllocationIdSet initializing{};
    for (std::size_t index = 1U; index < copies.size(); ++index) {
        (index == 1U ? active : initializing).insert(copies[index].allocation_id);
    }

    auto& primary = *copies.front().service;
    primary.update_allocation_ids_from_master(active, initializing);
    if (options.untrusted_active) {
        for (const auto& allocation_id : active) {
            primary.mark_allocation_id_as_in_sync(allocation_id);
        }
    }

    const auto first_phase = options.operations / 2U;
    run_writers(copies, options, first_phase);
    std::cout << "phase 1: " << seqno::to_string(sync_checkpoints(copies)) << '\n';

    for (const auto& allocation_id : initializing) {
        primary.mark_allocation_id_as_in_sync(allocation_id);
    }
    run_writers(copies, options, options.operations - first_phase);
    std::cout << "phase 2: " << seqno::to_string(sync_checkpoints(copies)) << '\n';
    std::cout << '\n';

    std::vector<std::pair<std::string, seqno::SeqNoTelemetrySnapshot>> snapshots;
    registry.visit([&snapshots](const std::string& identifier, const seqno::SeqNoTelemetrySnapshot& snapshot) {
        snapshots.emplace_back(identifier, snapshot);
    });
    std::sort(snapshots.begin(), snapshots.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });
    for (const auto& [identifier, snapshot] : snapshots) {
        print_copy(identifier, snapshot);
    }

    const auto total = registry.aggregate();
    std::cout << '\n'
              << "shard: max_seq_no=" << total.stats.max_seq_no << " min_local_checkpoint="
              << total.stats.local_checkpoint << " min_global_checkpoint=" << total.stats.global_checkpoint << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Operational tooling for shard sequence number tracking"};
    app.require_subcommand(1);

    SimulationOptions options{};
    auto* simulate = app.add_subcommand("simulate", "Drive a primary and its replicas through a concurrent workload");
    simulate->add_option("-w,--writers", options.writers, "Number of writer threads")->check(CLI::PositiveNumber);
    simulate->add_option("-n,--operations", options.operations, "Total operations to issue");
    simulate->add_option("-r,--replicas", options.replicas, "Number of replica copies");
    simulate->add_option("--bit-arrays-size", options.bit_arrays_size, "Width of each completion bit array")
        ->check(CLI::Range(std::size_t{seqno::LocalCheckpointTracker::kMinBitArraysSize}, std::size_t{1U << 20U}));
    simulate->add_option("--seed", options.seed, "Seed for completion reordering");
    simulate->add_flag("--untrusted-active", options.untrusted_active,
                       "Track new active allocation ids instead of admitting them as in-sync");
    simulate->callback([&options]() {
        run_simulation(options);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
