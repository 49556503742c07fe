#pragma once

#include <system_error>

namespace seqtrack::seqno {

enum class SeqNoErrc {
    Success = 0,
    SequenceNumberNotIssued,
    InvalidSequenceNumber,
    UnknownAllocationId,
    InvalidConfiguration,
    InvalidRecoveredState
};

const std::error_category& seqno_error_category() noexcept;
std::error_code make_error_code(SeqNoErrc value) noexcept;

}  // namespace seqtrack::seqno

namespace std {

template <>
struct is_error_code_enum<seqtrack::seqno::SeqNoErrc> : true_type {
};

}  // namespace std
