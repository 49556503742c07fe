#include "seqtrack/seqno/local_checkpoint_tracker.hpp"

#include "seqtrack/seqno/seqno_errors.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <system_error>

namespace seqtrack::seqno {

namespace {

constexpr std::size_t kBitsPerWord = 64U;

}  // namespace

LocalCheckpointTracker::LocalCheckpointTracker(SequenceNumber max_seq_no, SequenceNumber local_checkpoint)
    : LocalCheckpointTracker(max_seq_no, local_checkpoint, Config{})
{
}

LocalCheckpointTracker::LocalCheckpointTracker(SequenceNumber max_seq_no,
                                               SequenceNumber local_checkpoint,
                                               Config config)
    : config_{config}
{
    if (config_.bit_arrays_size < kMinBitArraysSize) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidConfiguration),
                                "bit_arrays_size must be at least " + std::to_string(kMinBitArraysSize) + " but was "
                                    + std::to_string(config_.bit_arrays_size));
    }
    if (max_seq_no < kNoOpsPerformed) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidRecoveredState),
                                "max_seq_no must be non-negative or kNoOpsPerformed but was " + std::to_string(max_seq_no));
    }
    if (local_checkpoint < kNoOpsPerformed) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidRecoveredState),
                                "local_checkpoint must be non-negative or kNoOpsPerformed but was "
                                    + std::to_string(local_checkpoint));
    }
    if (local_checkpoint > max_seq_no) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidRecoveredState),
                                "local_checkpoint [" + std::to_string(local_checkpoint) + "] exceeds max_seq_no ["
                                    + std::to_string(max_seq_no) + "]");
    }

    words_per_array_ = (config_.bit_arrays_size + kBitsPerWord - 1U) / kBitsPerWord;
    first_tracked_seq_no_ = local_checkpoint + 1;
    next_seq_no_ = max_seq_no + 1;
    checkpoint_.store(local_checkpoint, std::memory_order_relaxed);
    max_seq_no_.store(max_seq_no, std::memory_order_relaxed);
    update_window_locked();
}

SequenceNumber LocalCheckpointTracker::generate_seq_no()
{
    std::lock_guard guard{mutex_};
    if (next_seq_no_ == std::numeric_limits<SequenceNumber>::max()) {
        throw std::system_error(std::make_error_code(std::errc::value_too_large), "sequence number space exhausted");
    }
    const auto seq_no = next_seq_no_++;
    max_seq_no_.store(seq_no, std::memory_order_release);
    ++telemetry_.generated;
    update_window_locked();
    return seq_no;
}

void LocalCheckpointTracker::mark_seq_no_as_completed(SequenceNumber seq_no)
{
    std::lock_guard guard{mutex_};
    if (!is_assigned(seq_no)) {
        throw std::system_error(make_error_code(SeqNoErrc::InvalidSequenceNumber),
                                "cannot mark sequence number [" + std::to_string(seq_no) + "] as completed");
    }
    const auto max_seq_no = max_seq_no_.load(std::memory_order_relaxed);
    if (seq_no > max_seq_no) {
        throw std::system_error(make_error_code(SeqNoErrc::SequenceNumberNotIssued),
                                "sequence number [" + std::to_string(seq_no) + "] exceeds max_seq_no ["
                                    + std::to_string(max_seq_no) + "]");
    }

    const auto current = checkpoint_.load(std::memory_order_relaxed);
    if (seq_no <= current) {
        ++telemetry_.duplicate_completions;
        return;
    }

    auto& bits = bit_array_for_locked(seq_no);
    const auto offset = bit_offset_locked(seq_no);
    const auto mask = std::uint64_t{1} << (offset % kBitsPerWord);
    auto& word = bits[offset / kBitsPerWord];
    if ((word & mask) != 0U) {
        ++telemetry_.duplicate_completions;
        return;
    }

    word |= mask;
    ++telemetry_.completed;
    ++telemetry_.pending_completions;

    if (seq_no == current + 1) {
        advance_checkpoint_locked();
    } else {
        ++telemetry_.out_of_order_completions;
    }
    update_window_locked();
}

void LocalCheckpointTracker::advance_max_seq_no(SequenceNumber seq_no)
{
    std::lock_guard guard{mutex_};
    if (seq_no <= max_seq_no_.load(std::memory_order_relaxed)) {
        return;
    }
    if (seq_no == std::numeric_limits<SequenceNumber>::max()) {
        throw std::system_error(std::make_error_code(std::errc::value_too_large), "sequence number space exhausted");
    }
    max_seq_no_.store(seq_no, std::memory_order_release);
    next_seq_no_ = seq_no + 1;
    update_window_locked();
}

void LocalCheckpointTracker::wait_for_ops_to_complete(SequenceNumber seq_no)
{
    std::unique_lock lock{mutex_};
    const auto max_seq_no = max_seq_no_.load(std::memory_order_relaxed);
    if (seq_no > max_seq_no) {
        throw std::system_error(make_error_code(SeqNoErrc::SequenceNumberNotIssued),
                                "cannot wait for sequence number [" + std::to_string(seq_no) + "] above max_seq_no ["
                                    + std::to_string(max_seq_no) + "]");
    }

    ++telemetry_.waiters;
    checkpoint_advanced_.wait(lock, [this, seq_no] {
        return checkpoint_.load(std::memory_order_relaxed) >= seq_no;
    });
    --telemetry_.waiters;
}

SequenceNumber LocalCheckpointTracker::checkpoint() const noexcept
{
    return checkpoint_.load(std::memory_order_acquire);
}

SequenceNumber LocalCheckpointTracker::max_seq_no() const noexcept
{
    return max_seq_no_.load(std::memory_order_acquire);
}

LocalCheckpointTracker::Config LocalCheckpointTracker::config() const noexcept
{
    return config_;
}

LocalCheckpointTelemetrySnapshot LocalCheckpointTracker::telemetry_snapshot() const
{
    std::lock_guard guard{mutex_};
    return telemetry_;
}

LocalCheckpointTracker::BitArray& LocalCheckpointTracker::bit_array_for_locked(SequenceNumber seq_no)
{
    const auto relative = static_cast<std::uint64_t>(seq_no - first_tracked_seq_no_);
    const auto index = static_cast<std::size_t>(relative / config_.bit_arrays_size);
    while (index >= processed_.size()) {
        processed_.emplace_back(words_per_array_, 0U);
        ++telemetry_.bit_arrays_allocated;
    }
    return processed_[index];
}

bool LocalCheckpointTracker::is_completed_locked(SequenceNumber seq_no) const noexcept
{
    if (seq_no < first_tracked_seq_no_) {
        return true;
    }
    const auto relative = static_cast<std::uint64_t>(seq_no - first_tracked_seq_no_);
    const auto index = static_cast<std::size_t>(relative / config_.bit_arrays_size);
    if (index >= processed_.size()) {
        return false;
    }
    const auto offset = bit_offset_locked(seq_no);
    return (processed_[index][offset / kBitsPerWord] & (std::uint64_t{1} << (offset % kBitsPerWord))) != 0U;
}

std::size_t LocalCheckpointTracker::bit_offset_locked(SequenceNumber seq_no) const noexcept
{
    const auto relative = static_cast<std::uint64_t>(seq_no - first_tracked_seq_no_);
    return static_cast<std::size_t>(relative % config_.bit_arrays_size);
}

void LocalCheckpointTracker::advance_checkpoint_locked()
{
    const auto array_size = static_cast<SequenceNumber>(config_.bit_arrays_size);
    auto checkpoint = checkpoint_.load(std::memory_order_relaxed);
    do {
        ++checkpoint;
        --telemetry_.pending_completions;
        if (checkpoint == first_tracked_seq_no_ + array_size - 1) {
            processed_.pop_front();
            first_tracked_seq_no_ += array_size;
            ++telemetry_.bit_arrays_released;
        }
    } while (!processed_.empty() && is_completed_locked(checkpoint + 1));

    checkpoint_.store(checkpoint, std::memory_order_release);
    checkpoint_advanced_.notify_all();
}

void LocalCheckpointTracker::update_window_locked() noexcept
{
    const auto window = max_seq_no_.load(std::memory_order_relaxed) - checkpoint_.load(std::memory_order_relaxed);
    telemetry_.outstanding_window = static_cast<std::uint64_t>(std::max<SequenceNumber>(window, 0));
    telemetry_.max_outstanding_window = std::max(telemetry_.max_outstanding_window, telemetry_.outstanding_window);
}

}  // namespace seqtrack::seqno
