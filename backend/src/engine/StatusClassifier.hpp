#pragma once

#include "engine/Types.hpp"

#include <optional>
#include <string>

namespace rt::engine
{

struct TimingState
{
    TimePoint added_at{};
    TimePoint last_progress_at{};
};

struct Classification
{
    TransferStatus status = TransferStatus::Metadata;
    std::optional<std::string> degraded_reason;
    // True when the reading shows genuine throughput; the caller then moves
    // last_progress_at to now.
    bool progress_observed = false;
};

// Derives a transfer's status from engine counters. Checks run in a fixed
// order and the first match wins: metadata, done/seeding, paused, no_peers,
// stalled, downloading. Faults are tracked by the caller, not here.
Classification classify(EngineCounters const &counters,
                        TimingState const &timing, TimePoint now,
                        ClassifierPolicy const &policy = {});

std::string no_peers_reason(ClassifierPolicy const &policy);

} // namespace rt::engine
