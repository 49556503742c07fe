#pragma once

#include "seqtrack/seqno/global_checkpoint_tracker.hpp"
#include "seqtrack/seqno/local_checkpoint_tracker.hpp"
#include "seqtrack/seqno/seqno_telemetry.hpp"
#include "seqtrack/seqno/seqno_telemetry_registry.hpp"
#include "seqtrack/seqno/sequence_numbers.hpp"

#include <optional>
#include <string>

namespace seqtrack::seqno {

// Per-shard-copy owner of the local and global checkpoint trackers. Created at
// shard open from the recovered values and destroyed at shard close.
class SequenceNumbersService final {
public:
    struct Config final {
        // Opaque shard identity; only used to label telemetry.
        std::string shard_id{};
        SequenceNumber max_seq_no = kNoOpsPerformed;
        SequenceNumber local_checkpoint = kNoOpsPerformed;
        SequenceNumber global_checkpoint = kUnassignedSeqNo;
        LocalCheckpointTracker::Config local{};
        GlobalCheckpointTracker::Config global{};
        SeqNoTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
    };

    explicit SequenceNumbersService(Config config);
    ~SequenceNumbersService();

    SequenceNumbersService(const SequenceNumbersService&) = delete;
    SequenceNumbersService& operator=(const SequenceNumbersService&) = delete;
    SequenceNumbersService(SequenceNumbersService&&) = delete;
    SequenceNumbersService& operator=(SequenceNumbersService&&) = delete;

    /**
     * Issues the next sequence number. mark_seq_no_as_completed must follow once
     * the operation finishes, whether or not it succeeded.
     */
    [[nodiscard]] SequenceNumber generate_seq_no();
    void mark_seq_no_as_completed(SequenceNumber seq_no);
    void advance_max_seq_no(SequenceNumber seq_no);
    void wait_for_ops_to_complete(SequenceNumber seq_no);
    [[nodiscard]] SequenceNumber max_seq_no() const noexcept;
    [[nodiscard]] SequenceNumber local_checkpoint() const noexcept;

    void update_local_checkpoint_for_shard(const std::string& allocation_id, SequenceNumber checkpoint);
    void mark_allocation_id_as_in_sync(const std::string& allocation_id);
    void update_allocation_ids_from_master(const AllocationIdSet& active_allocation_ids,
                                           const AllocationIdSet& initializing_allocation_ids);

    /**
     * Recomputes the global checkpoint from the in-sync copies. BlockedOnUnknown
     * means an in-sync copy has not reported yet and the caller should retry
     * on the next report.
     */
    [[nodiscard]] GlobalCheckpointUpdate update_global_checkpoint_on_primary();
    void update_global_checkpoint_on_replica(SequenceNumber checkpoint);
    [[nodiscard]] SequenceNumber global_checkpoint() const noexcept;

    [[nodiscard]] std::optional<AllocationState> allocation_state(const std::string& allocation_id) const;
    [[nodiscard]] std::optional<SequenceNumber> local_checkpoint_for(const std::string& allocation_id) const;

    [[nodiscard]] SeqNoStats stats() const noexcept;
    [[nodiscard]] SeqNoTelemetrySnapshot telemetry_snapshot() const;
    [[nodiscard]] const std::string& shard_id() const noexcept;

private:
    std::string shard_id_{};
    LocalCheckpointTracker local_checkpoint_tracker_;
    GlobalCheckpointTracker global_checkpoint_tracker_;
    SeqNoTelemetryRegistry* telemetry_registry_ = nullptr;
    std::string telemetry_identifier_{};
};

}  // namespace seqtrack::seqno
