#include "seqtrack/seqno/sequence_numbers_service.hpp"
#include "seqtrack/seqno/seqno_errors.hpp"
#include "seqtrack/seqno/seqno_telemetry_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace seqtrack::seqno;

namespace {

SequenceNumbersService::Config make_config(std::string shard_id)
{
    SequenceNumbersService::Config config{};
    config.shard_id = std::move(shard_id);
    return config;
}

}  // namespace

TEST_CASE("SequenceNumbersService starts from sentinel values", "[seqno][service]")
{
    SequenceNumbersService service{make_config("[index][0]")};

    const auto stats = service.stats();
    CHECK(stats.max_seq_no == kNoOpsPerformed);
    CHECK(stats.local_checkpoint == kNoOpsPerformed);
    CHECK(stats.global_checkpoint == kUnassignedSeqNo);
    CHECK(service.shard_id() == "[index][0]");
}

TEST_CASE("SequenceNumbersService seeds both trackers from recovered values", "[seqno][service]")
{
    auto config = make_config("[index][1]");
    config.max_seq_no = 41;
    config.local_checkpoint = 39;
    config.global_checkpoint = 30;
    SequenceNumbersService service{config};

    CHECK(service.stats() == SeqNoStats{41, 39, 30});
    CHECK(service.generate_seq_no() == 42);

    service.mark_seq_no_as_completed(41);
    service.mark_seq_no_as_completed(40);
    CHECK(service.local_checkpoint() == 41);
    service.mark_seq_no_as_completed(42);
    CHECK(service.stats() == SeqNoStats{42, 42, 30});
}

TEST_CASE("SequenceNumbersService rejects inconsistent recovered values", "[seqno][service]")
{
    auto config = make_config("[index][2]");
    config.max_seq_no = 3;
    config.local_checkpoint = 7;

    std::error_code error{};
    try {
        SequenceNumbersService service{config};
    } catch (const std::system_error& ex) {
        error = ex.code();
    }
    CHECK(error == SeqNoErrc::InvalidRecoveredState);
}

TEST_CASE("SequenceNumbersService drives the global checkpoint on a primary", "[seqno][service]")
{
    SequenceNumbersService primary{make_config("[index][0]")};
    primary.update_allocation_ids_from_master({"p", "r1"}, {"r2"});

    for (int index = 0; index < 10; ++index) {
        primary.mark_seq_no_as_completed(primary.generate_seq_no());
    }
    primary.update_local_checkpoint_for_shard("p", primary.local_checkpoint());
    CHECK(primary.update_global_checkpoint_on_primary() == GlobalCheckpointUpdate::BlockedOnUnknown);
    CHECK(primary.global_checkpoint() == kUnassignedSeqNo);

    primary.update_local_checkpoint_for_shard("r1", 6);
    CHECK(primary.update_global_checkpoint_on_primary() == GlobalCheckpointUpdate::Advanced);
    CHECK(primary.global_checkpoint() == 6);

    primary.update_local_checkpoint_for_shard("r2", 1);
    CHECK(primary.allocation_state("r2") == AllocationState::Tracked);
    primary.mark_allocation_id_as_in_sync("r2");
    CHECK(primary.allocation_state("r2") == AllocationState::InSync);
    CHECK(primary.local_checkpoint_for("r2") == 1);
    CHECK(primary.update_global_checkpoint_on_primary() == GlobalCheckpointUpdate::NoChange);

    primary.update_local_checkpoint_for_shard("r1", 9);
    primary.update_local_checkpoint_for_shard("r2", 9);
    CHECK(primary.update_global_checkpoint_on_primary() == GlobalCheckpointUpdate::Advanced);
    CHECK(primary.stats() == SeqNoStats{9, 9, 9});
}

TEST_CASE("SequenceNumbersService on a replica follows the primary", "[seqno][service]")
{
    SequenceNumbersService replica{make_config("[index][0][replica]")};

    for (const SequenceNumber seq_no : {SequenceNumber{2}, SequenceNumber{0}, SequenceNumber{1}}) {
        replica.advance_max_seq_no(seq_no);
        replica.mark_seq_no_as_completed(seq_no);
    }
    CHECK(replica.max_seq_no() == 2);
    CHECK(replica.local_checkpoint() == 2);

    replica.update_global_checkpoint_on_replica(9);
    replica.update_global_checkpoint_on_replica(5);
    CHECK(replica.global_checkpoint() == 9);
}

TEST_CASE("SequenceNumbersService registers its telemetry for the shard lifetime", "[seqno][service]")
{
    SeqNoTelemetryRegistry registry{};

    {
        auto config = make_config("[index][0]");
        config.telemetry_registry = &registry;
        SequenceNumbersService first{config};

        config = make_config("[index][1]");
        config.telemetry_registry = &registry;
        config.telemetry_identifier = "shard-1";
        SequenceNumbersService second{config};

        REQUIRE(registry.size() == 2U);

        first.mark_seq_no_as_completed(first.generate_seq_no());
        (void)second.generate_seq_no();
        (void)second.generate_seq_no();

        std::vector<std::string> identifiers;
        registry.visit([&](const std::string& identifier, const SeqNoTelemetrySnapshot&) {
            identifiers.push_back(identifier);
        });
        std::sort(identifiers.begin(), identifiers.end());
        CHECK(identifiers == std::vector<std::string>{"[index][0]", "shard-1"});

        const auto total = registry.aggregate();
        CHECK(total.local.generated == 3U);
        CHECK(total.local.completed == 1U);
        CHECK(total.stats.max_seq_no == 1);
        CHECK(total.stats.local_checkpoint == kNoOpsPerformed);
        CHECK(total.local.outstanding_window == 2U);

        const auto snapshot = first.telemetry_snapshot();
        CHECK(snapshot.stats == SeqNoStats{0, 0, kUnassignedSeqNo});
        CHECK(snapshot.local.generated == 1U);
    }

    CHECK(registry.size() == 0U);
}

TEST_CASE("SequenceNumbersService keeps checkpoints consistent under concurrent writers", "[seqno][service]")
{
    constexpr int kWriters = 6;
    constexpr int kOperationsPerWriter = 1'500;

    auto config = make_config("[index][0]");
    config.local.bit_arrays_size = 16U;
    SequenceNumbersService primary{config};
    primary.update_allocation_ids_from_master({"p"}, {});

    std::atomic<bool> done{false};
    std::atomic<bool> violated{false};
    std::thread reporter([&] {
        auto previous_global = primary.global_checkpoint();
        while (!done.load(std::memory_order_acquire)) {
            const auto stats = primary.stats();
            primary.update_local_checkpoint_for_shard("p", stats.local_checkpoint);
            (void)primary.update_global_checkpoint_on_primary();
            const auto global = primary.global_checkpoint();
            if (stats.local_checkpoint > stats.max_seq_no || stats.global_checkpoint > stats.local_checkpoint
                || global < previous_global || global > primary.local_checkpoint()) {
                violated.store(true, std::memory_order_release);
            }
            previous_global = global;
        }
    });

    std::vector<std::thread> writers;
    for (int writer = 0; writer < kWriters; ++writer) {
        writers.emplace_back([&primary, writer] {
            std::mt19937 rng{static_cast<unsigned>(writer)};
            std::vector<SequenceNumber> in_flight;
            for (int op = 0; op < kOperationsPerWriter; ++op) {
                in_flight.push_back(primary.generate_seq_no());
                if (in_flight.size() == 8U) {
                    std::shuffle(in_flight.begin(), in_flight.end(), rng);
                    for (const auto seq_no : in_flight) {
                        primary.mark_seq_no_as_completed(seq_no);
                    }
                    in_flight.clear();
                }
            }
            for (const auto seq_no : in_flight) {
                primary.mark_seq_no_as_completed(seq_no);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    done.store(true, std::memory_order_release);
    reporter.join();

    const SequenceNumber last = kWriters * kOperationsPerWriter - 1;
    CHECK_FALSE(violated.load());
    CHECK(primary.max_seq_no() == last);
    CHECK(primary.local_checkpoint() == last);

    primary.update_local_checkpoint_for_shard("p", primary.local_checkpoint());
    (void)primary.update_global_checkpoint_on_primary();
    CHECK(primary.stats() == SeqNoStats{last, last, last});
}

TEST_CASE("SequenceNumbersService stats never report a checkpoint above max_seq_no", "[seqno][service]")
{
    constexpr int kOperations = 200'000;

    SequenceNumbersService service{make_config("[index][3]")};

    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int op = 0; op < kOperations; ++op) {
            service.mark_seq_no_as_completed(service.generate_seq_no());
        }
        done.store(true, std::memory_order_release);
    });

    std::size_t inverted = 0U;
    while (!done.load(std::memory_order_acquire)) {
        const auto stats = service.stats();
        if (stats.local_checkpoint > stats.max_seq_no) {
            ++inverted;
        }
    }
    writer.join();

    CHECK(inverted == 0U);
    CHECK(service.stats().local_checkpoint == kOperations - 1);
}
