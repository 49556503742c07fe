#include "seqtrack/seqno/global_checkpoint_tracker.hpp"

#include "seqtrack/seqno/seqno_errors.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <system_error>

namespace seqtrack::seqno {

GlobalCheckpointTracker::GlobalCheckpointTracker(SequenceNumber global_checkpoint)
    : GlobalCheckpointTracker(global_checkpoint, Config{})
{
}

GlobalCheckpointTracker::GlobalCheckpointTracker(SequenceNumber global_checkpoint, Config config)
    : config_{config}
{
    if (global_checkpoint < kUnassignedSeqNo) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidRecoveredState),
                                "global_checkpoint must be non-negative, kNoOpsPerformed or kUnassignedSeqNo but was "
                                    + std::to_string(global_checkpoint));
    }
    global_checkpoint_.store(global_checkpoint, std::memory_order_relaxed);
}

void GlobalCheckpointTracker::update_local_checkpoint(const std::string& allocation_id, SequenceNumber checkpoint)
{
    if (checkpoint < kUnassignedSeqNo) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidSequenceNumber),
                                "invalid local checkpoint [" + std::to_string(checkpoint) + "] reported for allocation ["
                                    + allocation_id + "]");
    }

    std::lock_guard guard{mutex_};
    auto it = allocations_.find(allocation_id);
    if (it == allocations_.end()) {
        ++telemetry_.unknown_allocation_reports;
        allocations_.emplace(allocation_id, AllocationEntry{checkpoint, AllocationState::Tracked});
        return;
    }

    auto& entry = it->second;
    if (checkpoint <= entry.local_checkpoint) {
        ++telemetry_.stale_local_checkpoint_updates;
        return;
    }
    entry.local_checkpoint = checkpoint;
    ++telemetry_.local_checkpoint_updates;
}

void GlobalCheckpointTracker::mark_allocation_id_as_in_sync(const std::string& allocation_id)
{
    std::lock_guard guard{mutex_};
    auto it = allocations_.find(allocation_id);
    if (it == allocations_.end()) {
        throw std::system_error(make_error_code(SeqNoErrc::UnknownAllocationId),
                                "cannot mark unknown allocation [" + allocation_id + "] as in-sync");
    }
    if (it->second.state == AllocationState::InSync) {
        return;
    }
    it->second.state = AllocationState::InSync;
    ++telemetry_.in_sync_promotions;
}

void GlobalCheckpointTracker::update_allocation_ids_from_master(const AllocationIdSet& active_allocation_ids,
                                                                const AllocationIdSet& initializing_allocation_ids)
{
    std::lock_guard guard{mutex_};
    ++telemetry_.master_updates;

    for (auto it = allocations_.begin(); it != allocations_.end();) {
        if (!active_allocation_ids.contains(it->first) && !initializing_allocation_ids.contains(it->first)) {
            it = allocations_.erase(it);
            ++telemetry_.removed_allocations;
        } else {
            ++it;
        }
    }

    const auto active_state = config_.trust_new_active_allocations ? AllocationState::InSync : AllocationState::Tracked;
    for (const auto& allocation_id : active_allocation_ids) {
        auto [it, inserted] = allocations_.try_emplace(allocation_id, AllocationEntry{kUnassignedSeqNo, active_state});
        if (!inserted && it->second.state == AllocationState::Tracked && config_.trust_new_active_allocations) {
            it->second.state = AllocationState::InSync;
            ++telemetry_.in_sync_promotions;
        }
    }

    for (const auto& allocation_id : initializing_allocation_ids) {
        if (active_allocation_ids.contains(allocation_id)) {
            continue;
        }
        allocations_.try_emplace(allocation_id, AllocationEntry{kUnassignedSeqNo, AllocationState::Tracked});
    }
}

GlobalCheckpointUpdate GlobalCheckpointTracker::update_checkpoint_on_primary()
{
    std::lock_guard guard{mutex_};
    ++telemetry_.primary_recomputations;

    auto min_checkpoint = std::numeric_limits<SequenceNumber>::max();
    bool has_in_sync = false;
    for (const auto& [allocation_id, entry] : allocations_) {
        if (entry.state != AllocationState::InSync) {
            continue;
        }
        if (entry.local_checkpoint == kUnassignedSeqNo) {
            ++telemetry_.primary_blocked_on_unknown;
            telemetry_.last_blocking_allocation_id = allocation_id;
            return GlobalCheckpointUpdate::BlockedOnUnknown;
        }
        has_in_sync = true;
        min_checkpoint = std::min(min_checkpoint, entry.local_checkpoint);
    }

    if (!has_in_sync || min_checkpoint <= global_checkpoint_.load(std::memory_order_relaxed)) {
        return GlobalCheckpointUpdate::NoChange;
    }

    global_checkpoint_.store(min_checkpoint, std::memory_order_release);
    ++telemetry_.primary_advances;
    return GlobalCheckpointUpdate::Advanced;
}

void GlobalCheckpointTracker::update_checkpoint_on_replica(SequenceNumber checkpoint)
{
    std::lock_guard guard{mutex_};
    if (checkpoint <= global_checkpoint_.load(std::memory_order_relaxed)) {
        ++telemetry_.stale_replica_updates;
        return;
    }
    global_checkpoint_.store(checkpoint, std::memory_order_release);
    ++telemetry_.replica_updates;
}

SequenceNumber GlobalCheckpointTracker::checkpoint() const noexcept
{
    return global_checkpoint_.load(std::memory_order_acquire);
}

GlobalCheckpointTracker::Config GlobalCheckpointTracker::config() const noexcept
{
    return config_;
}

std::optional<AllocationState> GlobalCheckpointTracker::allocation_state(const std::string& allocation_id) const
{
    std::lock_guard guard{mutex_};
    auto it = allocations_.find(allocation_id);
    if (it == allocations_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::optional<SequenceNumber> GlobalCheckpointTracker::local_checkpoint_for(const std::string& allocation_id) const
{
    std::lock_guard guard{mutex_};
    auto it = allocations_.find(allocation_id);
    if (it == allocations_.end()) {
        return std::nullopt;
    }
    return it->second.local_checkpoint;
}

std::vector<std::string> GlobalCheckpointTracker::in_sync_allocation_ids() const
{
    std::lock_guard guard{mutex_};
    return collect_ids_locked(AllocationState::InSync);
}

std::vector<std::string> GlobalCheckpointTracker::tracked_allocation_ids() const
{
    std::lock_guard guard{mutex_};
    return collect_ids_locked(AllocationState::Tracked);
}

GlobalCheckpointTelemetrySnapshot GlobalCheckpointTracker::telemetry_snapshot() const
{
    std::lock_guard guard{mutex_};
    auto snapshot = telemetry_;
    for (const auto& [_, entry] : allocations_) {
        if (entry.state == AllocationState::InSync) {
            ++snapshot.in_sync_allocations;
        } else {
            ++snapshot.tracked_allocations;
        }
    }
    return snapshot;
}

std::vector<std::string> GlobalCheckpointTracker::collect_ids_locked(AllocationState state) const
{
    std::vector<std::string> ids;
    for (const auto& [allocation_id, entry] : allocations_) {
        if (entry.state == state) {
            ids.push_back(allocation_id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

const char* to_string(AllocationState state) noexcept
{
    switch (state) {
    case AllocationState::Tracked:
        return "tracked";
    case AllocationState::InSync:
        return "in_sync";
    default:
        return "unknown";
    }
}

const char* to_string(GlobalCheckpointUpdate update) noexcept
{
    switch (update) {
    case GlobalCheckpointUpdate::NoChange:
        return "no_change";
    case GlobalCheckpointUpdate::Advanced:
        return "advanced";
    case GlobalCheckpointUpdate::BlockedOnUnknown:
        return "blocked_on_unknown";
    default:
        return "unknown";
    }
}

}  // namespace seqtrack::seqno
