#pragma once

#include "seqtrack/seqno/seqno_telemetry.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace seqtrack::seqno {

class SeqNoTelemetryRegistry final {
public:
    using Sampler = std::function<SeqNoTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const SeqNoTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    // Counters are summed; window gauges keep the widest shard. The stats
    // block carries the lowest checkpoints and the highest max_seq_no.
    [[nodiscard]] SeqNoTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;
    [[nodiscard]] std::size_t size() const;

private:
    using SamplerMap = std::unordered_map<std::string, Sampler>;

    mutable std::mutex mutex_{};
    SamplerMap samplers_{};
};

}  // namespace seqtrack::seqno
