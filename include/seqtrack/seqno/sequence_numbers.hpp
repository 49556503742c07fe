#pragma once

#include <cstdint>

namespace seqtrack::seqno {

using SequenceNumber = std::int64_t;

// Nothing has been issued on the shard copy yet.
inline constexpr SequenceNumber kNoOpsPerformed = -1;

// The value is not known yet, e.g. a replica that has not reported.
inline constexpr SequenceNumber kUnassignedSeqNo = -2;

[[nodiscard]] constexpr bool is_assigned(SequenceNumber seq_no) noexcept
{
    return seq_no >= 0;
}

struct SeqNoStats final {
    SequenceNumber max_seq_no = kNoOpsPerformed;
    SequenceNumber local_checkpoint = kNoOpsPerformed;
    SequenceNumber global_checkpoint = kUnassignedSeqNo;

    friend bool operator==(const SeqNoStats&, const SeqNoStats&) = default;
};

}  // namespace seqtrack::seqno
