#include "seqtrack/seqno/sequence_numbers_service.hpp"

#include <utility>

namespace seqtrack::seqno {

SequenceNumbersService::SequenceNumbersService(Config config)
    : shard_id_{std::move(config.shard_id)}
    , local_checkpoint_tracker_{config.max_seq_no, config.local_checkpoint, config.local}
    , global_checkpoint_tracker_{config.global_checkpoint, config.global}
    , telemetry_registry_{config.telemetry_registry}
    , telemetry_identifier_{std::move(config.telemetry_identifier)}
{
    if (telemetry_identifier_.empty()) {
        telemetry_identifier_ = shard_id_;
    }

    if (telemetry_registry_ && !telemetry_identifier_.empty()) {
        telemetry_registry_->register_sampler(telemetry_identifier_, [this] {
            return this->telemetry_snapshot();
        });
    }
}

SequenceNumbersService::~SequenceNumbersService()
{
    if (telemetry_registry_ && !telemetry_identifier_.empty()) {
        telemetry_registry_->unregister_sampler(telemetry_identifier_);
    }
}

SequenceNumber SequenceNumbersService::generate_seq_no()
{
    return local_checkpoint_tracker_.generate_seq_no();
}

void SequenceNumbersService::mark_seq_no_as_completed(SequenceNumber seq_no)
{
    local_checkpoint_tracker_.mark_seq_no_as_completed(seq_no);
}

void SequenceNumbersService::advance_max_seq_no(SequenceNumber seq_no)
{
    local_checkpoint_tracker_.advance_max_seq_no(seq_no);
}

void SequenceNumbersService::wait_for_ops_to_complete(SequenceNumber seq_no)
{
    local_checkpoint_tracker_.wait_for_ops_to_complete(seq_no);
}

SequenceNumber SequenceNumbersService::max_seq_no() const noexcept
{
    return local_checkpoint_tracker_.max_seq_no();
}

SequenceNumber SequenceNumbersService::local_checkpoint() const noexcept
{
    return local_checkpoint_tracker_.checkpoint();
}

void SequenceNumbersService::update_local_checkpoint_for_shard(const std::string& allocation_id,
                                                               SequenceNumber checkpoint)
{
    global_checkpoint_tracker_.update_local_checkpoint(allocation_id, checkpoint);
}

void SequenceNumbersService::mark_allocation_id_as_in_sync(const std::string& allocation_id)
{
    global_checkpoint_tracker_.mark_allocation_id_as_in_sync(allocation_id);
}

void SequenceNumbersService::update_allocation_ids_from_master(const AllocationIdSet& active_allocation_ids,
                                                               const AllocationIdSet& initializing_allocation_ids)
{
    global_checkpoint_tracker_.update_allocation_ids_from_master(active_allocation_ids, initializing_allocation_ids);
}

GlobalCheckpointUpdate SequenceNumbersService::update_global_checkpoint_on_primary()
{
    return global_checkpoint_tracker_.update_checkpoint_on_primary();
}

void SequenceNumbersService::update_global_checkpoint_on_replica(SequenceNumber checkpoint)
{
    global_checkpoint_tracker_.update_checkpoint_on_replica(checkpoint);
}

SequenceNumber SequenceNumbersService::global_checkpoint() const noexcept
{
    return global_checkpoint_tracker_.checkpoint();
}

std::optional<AllocationState> SequenceNumbersService::allocation_state(const std::string& allocation_id) const
{
    return global_checkpoint_tracker_.allocation_state(allocation_id);
}

std::optional<SequenceNumber> SequenceNumbersService::local_checkpoint_for(const std::string& allocation_id) const
{
    return global_checkpoint_tracker_.local_checkpoint_for(allocation_id);
}

SeqNoStats SequenceNumbersService::stats() const noexcept
{
    // All three only grow; loading the checkpoints before max_seq_no keeps local_checkpoint <= max_seq_no.
    const auto global = global_checkpoint();
    const auto local = local_checkpoint();
    const auto max = max_seq_no();
    return SeqNoStats{max, local, global};
}

SeqNoTelemetrySnapshot SequenceNumbersService::telemetry_snapshot() const
{
    SeqNoTelemetrySnapshot snapshot{};
    snapshot.stats = stats();
    snapshot.local = local_checkpoint_tracker_.telemetry_snapshot();
    snapshot.global = global_checkpoint_tracker_.telemetry_snapshot();
    return snapshot;
}

const std::string& SequenceNumbersService::shard_id() const noexcept
{
    return shard_id_;
}

}  // namespace seqtrack::seqno
