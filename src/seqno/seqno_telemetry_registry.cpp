#include "seqtrack/seqno/seqno_telemetry_registry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace seqtrack::seqno {

namespace {

LocalCheckpointTelemetrySnapshot& accumulate_local(LocalCheckpointTelemetrySnapshot& target,
                                                   const LocalCheckpointTelemetrySnapshot& source)
{
    target.generated += source.generated;
    target.completed += source.completed;
    target.duplicate_completions += source.duplicate_completions;
    target.out_of_order_completions += source.out_of_order_completions;
    target.pending_completions += source.pending_completions;
    target.outstanding_window = std::max(target.outstanding_window, source.outstanding_window);
    target.max_outstanding_window = std::max(target.max_outstanding_window, source.max_outstanding_window);
    target.bit_arrays_allocated += source.bit_arrays_allocated;
    target.bit_arrays_released += source.bit_arrays_released;
    target.waiters += source.waiters;
    return target;
}

GlobalCheckpointTelemetrySnapshot& accumulate_global(GlobalCheckpointTelemetrySnapshot& target,
                                                     const GlobalCheckpointTelemetrySnapshot& source)
{
    target.local_checkpoint_updates += source.local_checkpoint_updates;
    target.stale_local_checkpoint_updates += source.stale_local_checkpoint_updates;
    target.unknown_allocation_reports += source.unknown_allocation_reports;
    target.in_sync_promotions += source.in_sync_promotions;
    target.master_updates += source.master_updates;
    target.removed_allocations += source.removed_allocations;
    target.primary_recomputations += source.primary_recomputations;
    target.primary_advances += source.primary_advances;
    target.primary_blocked_on_unknown += source.primary_blocked_on_unknown;
    target.replica_updates += source.replica_updates;
    target.stale_replica_updates += source.stale_replica_updates;
    target.tracked_allocations += source.tracked_allocations;
    target.in_sync_allocations += source.in_sync_allocations;
    if (!source.last_blocking_allocation_id.empty()) {
        target.last_blocking_allocation_id = source.last_blocking_allocation_id;
    }
    return target;
}

void accumulate_stats(SeqNoStats& target, const SeqNoStats& source, bool first)
{
    if (first) {
        target = source;
        return;
    }
    target.max_seq_no = std::max(target.max_seq_no, source.max_seq_no);
    target.local_checkpoint = std::min(target.local_checkpoint, source.local_checkpoint);
    target.global_checkpoint = std::min(target.global_checkpoint, source.global_checkpoint);
}

}  // namespace

void SeqNoTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void SeqNoTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

SeqNoTelemetrySnapshot SeqNoTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> callbacks;
    {
        std::lock_guard guard(mutex_);
        callbacks.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            callbacks.push_back(sampler);
        }
    }

    SeqNoTelemetrySnapshot total{};
    bool first = true;
    for (const auto& callback : callbacks) {
        if (!callback) {
            continue;
        }
        const auto sample = callback();
        accumulate_stats(total.stats, sample.stats, first);
        accumulate_local(total.local, sample.local);
        accumulate_global(total.global, sample.global);
        first = false;
    }
    return total;
}

void SeqNoTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        if (!sampler) {
            continue;
        }
        visitor(identifier, sampler());
    }
}

std::size_t SeqNoTelemetryRegistry::size() const
{
    std::lock_guard guard(mutex_);
    return samplers_.size();
}

}  // namespace seqtrack::seqno
