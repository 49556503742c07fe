#include "seqtrack/seqno/seqno_errors.hpp"

namespace seqtrack::seqno {

namespace {

class SeqNoErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "seqtrack.seqno";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<SeqNoErrc>(condition)) {
        case SeqNoErrc::Success:
            return "success";
        case SeqNoErrc::SequenceNumberNotIssued:
            return "sequence number was not issued";
        case SeqNoErrc::InvalidSequenceNumber:
            return "invalid sequence number";
        case SeqNoErrc::UnknownAllocationId:
            return "unknown allocation id";
        case SeqNoErrc::InvalidConfiguration:
            return "invalid configuration";
        case SeqNoErrc::InvalidRecoveredState:
            return "invalid recovered state";
        default:
            return "unknown seqno error";
        }
    }
};

const SeqNoErrorCategory kCategory{};

}  // namespace

const std::error_category& seqno_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(SeqNoErrc value) noexcept
{
    return {static_cast<int>(value), seqno_error_category()};
}

}  // namespace seqtrack::seqno
