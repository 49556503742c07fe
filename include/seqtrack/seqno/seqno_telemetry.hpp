#pragma once

#include "seqtrack/seqno/sequence_numbers.hpp"

#include <cstdint>
#include <string>

namespace seqtrack::seqno {

struct LocalCheckpointTelemetrySnapshot final {
    std::uint64_t generated = 0U;
    std::uint64_t completed = 0U;
    std::uint64_t duplicate_completions = 0U;
    std::uint64_t out_of_order_completions = 0U;
    std::uint64_t pending_completions = 0U;
    std::uint64_t outstanding_window = 0U;
    std::uint64_t max_outstanding_window = 0U;
    std::uint64_t bit_arrays_allocated = 0U;
    std::uint64_t bit_arrays_released = 0U;
    std::uint64_t waiters = 0U;
};

struct GlobalCheckpointTelemetrySnapshot final {
    std::uint64_t local_checkpoint_updates = 0U;
    std::uint64_t stale_local_checkpoint_updates = 0U;
    std::uint64_t unknown_allocation_reports = 0U;
    std::uint64_t in_sync_promotions = 0U;
    std::uint64_t master_updates = 0U;
    std::uint64_t removed_allocations = 0U;
    std::uint64_t primary_recomputations = 0U;
    std::uint64_t primary_advances = 0U;
    std::uint64_t primary_blocked_on_unknown = 0U;
    std::uint64_t replica_updates = 0U;
    std::uint64_t stale_replica_updates = 0U;
    std::uint64_t tracked_allocations = 0U;
    std::uint64_t in_sync_allocations = 0U;
    std::string last_blocking_allocation_id{};
};

struct SeqNoTelemetrySnapshot final {
    SeqNoStats stats{};
    LocalCheckpointTelemetrySnapshot local{};
    GlobalCheckpointTelemetrySnapshot global{};
};

}  // namespace seqtrack::seqno
