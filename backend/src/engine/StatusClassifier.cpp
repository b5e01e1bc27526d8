#include "engine/StatusClassifier.hpp"

#include <format>

namespace rt::engine
{

namespace
{
long long whole_seconds(std::chrono::milliseconds value)
{
    return std::chrono::duration_cast<std::chrono::seconds>(value).count();
}
} // namespace

std::string no_peers_reason(ClassifierPolicy const &policy)
{
    return std::format("No peers found after {} seconds.",
                       whole_seconds(policy.no_peers_timeout));
}

Classification classify(EngineCounters const &counters,
                        TimingState const &timing, TimePoint now,
                        ClassifierPolicy const &policy)
{
    Classification result;
    if (!counters.ready)
    {
        result.status = TransferStatus::Metadata;
        return result;
    }
    if (counters.done)
    {
        result.status = counters.upload_rate > 0 ? TransferStatus::Seeding
                                                 : TransferStatus::Done;
        return result;
    }
    if (counters.paused)
    {
        result.status = TransferStatus::Paused;
        return result;
    }
    if (counters.peer_count == 0 &&
        now - timing.added_at > policy.no_peers_timeout)
    {
        result.status = TransferStatus::NoPeers;
        result.degraded_reason = no_peers_reason(policy);
        return result;
    }
    if (counters.download_rate == 0 && counters.peer_count > 0 &&
        now - timing.last_progress_at > policy.stall_timeout)
    {
        result.status = TransferStatus::Stalled;
        result.degraded_reason = std::format(
            "Connected to {} peers but nothing received for {} seconds.",
            counters.peer_count, whole_seconds(policy.stall_timeout));
        return result;
    }
    result.status = TransferStatus::Downloading;
    result.progress_observed = counters.download_rate > 0;
    return result;
}

} // namespace rt::engine
