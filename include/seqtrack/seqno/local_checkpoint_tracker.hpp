#pragma once

#include "seqtrack/seqno/seqno_telemetry.hpp"
#include "seqtrack/seqno/sequence_numbers.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace seqtrack::seqno {

// Issues sequence numbers for one shard copy and tracks which of them have
// completed. The checkpoint is the highest sequence number below which every
// issued number has been marked completed.
//
// Completions above the checkpoint are recorded in a deque of fixed-width bit
// arrays. The first array always covers checkpoint + 1; it is released once the
// checkpoint reaches its last slot, so memory follows the outstanding window.
class LocalCheckpointTracker final {
public:
    static constexpr std::size_t kDefaultBitArraysSize = 1024U;
    static constexpr std::size_t kMinBitArraysSize = 4U;

    struct Config final {
        std::size_t bit_arrays_size = kDefaultBitArraysSize;
    };

    LocalCheckpointTracker(SequenceNumber max_seq_no, SequenceNumber local_checkpoint);
    LocalCheckpointTracker(SequenceNumber max_seq_no, SequenceNumber local_checkpoint, Config config);

    LocalCheckpointTracker(const LocalCheckpointTracker&) = delete;
    LocalCheckpointTracker& operator=(const LocalCheckpointTracker&) = delete;
    LocalCheckpointTracker(LocalCheckpointTracker&&) = delete;
    LocalCheckpointTracker& operator=(LocalCheckpointTracker&&) = delete;

    // The caller must mark the returned number completed once the operation
    // finishes, whether or not it succeeded.
    [[nodiscard]] SequenceNumber generate_seq_no();

    // Throws std::system_error(SequenceNumberNotIssued) for numbers above
    // max_seq_no() and InvalidSequenceNumber for negative numbers. Marking a
    // number that is already complete is a no-op.
    void mark_seq_no_as_completed(SequenceNumber seq_no);

    // Records a number assigned elsewhere (the primary) as issued.
    void advance_max_seq_no(SequenceNumber seq_no);

    // Blocks until checkpoint() >= seq_no.
    void wait_for_ops_to_complete(SequenceNumber seq_no);

    [[nodiscard]] SequenceNumber checkpoint() const noexcept;
    [[nodiscard]] SequenceNumber max_seq_no() const noexcept;
    [[nodiscard]] Config config() const noexcept;
    [[nodiscard]] LocalCheckpointTelemetrySnapshot telemetry_snapshot() const;

private:
    using BitArray = std::vector<std::uint64_t>;

    [[nodiscard]] BitArray& bit_array_for_locked(SequenceNumber seq_no);
    [[nodiscard]] bool is_completed_locked(SequenceNumber seq_no) const noexcept;
    [[nodiscard]] std::size_t bit_offset_locked(SequenceNumber seq_no) const noexcept;
    void advance_checkpoint_locked();
    void update_window_locked() noexcept;

    Config config_{};
    std::size_t words_per_array_ = 0U;

    mutable std::mutex mutex_{};
    std::condition_variable checkpoint_advanced_{};
    std::deque<BitArray> processed_{};
    SequenceNumber first_tracked_seq_no_ = 0;
    SequenceNumber next_seq_no_ = 0;
    std::atomic<SequenceNumber> checkpoint_{kNoOpsPerformed};
    std::atomic<SequenceNumber> max_seq_no_{kNoOpsPerformed};
    LocalCheckpointTelemetrySnapshot telemetry_{};
};

}  // namespace seqtrack::seqno
