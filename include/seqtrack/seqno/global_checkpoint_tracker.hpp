#pragma once

#include "seqtrack/seqno/seqno_telemetry.hpp"
#include "seqtrack/seqno/sequence_numbers.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace seqtrack::seqno {

using AllocationIdSet = std::unordered_set<std::string>;

enum class AllocationState {
    Tracked,
    InSync
};

enum class GlobalCheckpointUpdate {
    NoChange,
    Advanced,
    BlockedOnUnknown
};

// Aggregates the local checkpoints reported by the copies of a shard and
// derives the global checkpoint as the minimum over the in-sync copies. The
// global checkpoint never decreases.
class GlobalCheckpointTracker final {
public:
    struct Config final {
        // Active allocation ids first seen in a master update join the in-sync
        // set directly. They still block the global checkpoint until they
        // report a local checkpoint.
        bool trust_new_active_allocations = true;
    };

    explicit GlobalCheckpointTracker(SequenceNumber global_checkpoint);
    GlobalCheckpointTracker(SequenceNumber global_checkpoint, Config config);

    GlobalCheckpointTracker(const GlobalCheckpointTracker&) = delete;
    GlobalCheckpointTracker& operator=(const GlobalCheckpointTracker&) = delete;
    GlobalCheckpointTracker(GlobalCheckpointTracker&&) = delete;
    GlobalCheckpointTracker& operator=(GlobalCheckpointTracker&&) = delete;

    void update_local_checkpoint(const std::string& allocation_id, SequenceNumber checkpoint);
    void mark_allocation_id_as_in_sync(const std::string& allocation_id);
    void update_allocation_ids_from_master(const AllocationIdSet& active_allocation_ids,
                                           const AllocationIdSet& initializing_allocation_ids);

    [[nodiscard]] GlobalCheckpointUpdate update_checkpoint_on_primary();
    void update_checkpoint_on_replica(SequenceNumber checkpoint);

    [[nodiscard]] SequenceNumber checkpoint() const noexcept;
    [[nodiscard]] Config config() const noexcept;

    [[nodiscard]] std::optional<AllocationState> allocation_state(const std::string& allocation_id) const;
    [[nodiscard]] std::optional<SequenceNumber> local_checkpoint_for(const std::string& allocation_id) const;
    [[nodiscard]] std::vector<std::string> in_sync_allocation_ids() const;
    [[nodiscard]] std::vector<std::string> tracked_allocation_ids() const;

    [[nodiscard]] GlobalCheckpointTelemetrySnapshot telemetry_snapshot() const;

private:
    struct AllocationEntry final {
        SequenceNumber local_checkpoint = kUnassignedSeqNo;
        AllocationState state = AllocationState::Tracked;
    };

    [[nodiscard]] std::vector<std::string> collect_ids_locked(AllocationState state) const;

    Config config_{};
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, AllocationEntry> allocations_{};
    std::atomic<SequenceNumber> global_checkpoint_{kUnassignedSeqNo};
    GlobalCheckpointTelemetrySnapshot telemetry_{};
};

[[nodiscard]] const char* to_string(AllocationState state) noexcept;
[[nodiscard]] const char* to_string(GlobalCheckpointUpdate update) noexcept;

}  // namespace seqtrack::seqno
