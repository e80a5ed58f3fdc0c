#include "pingstore/storage/ping_store_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace pingstore::storage {

namespace {

PingStoreTelemetrySnapshot& accumulate_snapshot(PingStoreTelemetrySnapshot& target, const PingStoreTelemetrySnapshot& source)
{
    target.store_calls += source.store_calls;
    target.store_failures += source.store_failures;
    target.duplicate_rejections += source.duplicate_rejections;
    target.bytes_written += source.bytes_written;
    target.total_store_duration_ns += source.total_store_duration_ns;
    target.last_store_duration_ns = std::max(target.last_store_duration_ns, source.last_store_duration_ns);
    target.enumerate_calls += source.enumerate_calls;
    target.enumerated_pings += source.enumerated_pings;
    target.skipped_files += source.skipped_files;
    target.quarantined_files += source.quarantined_files;
    target.total_enumerate_duration_ns += source.total_enumerate_duration_ns;
    target.last_enumerate_duration_ns = std::max(target.last_enumerate_duration_ns, source.last_enumerate_duration_ns);
    target.prune_calls += source.prune_calls;
    target.pruned_pings += source.pruned_pings;
    target.total_prune_duration_ns += source.total_prune_duration_ns;
    target.last_prune_duration_ns = std::max(target.last_prune_duration_ns, source.last_prune_duration_ns);
    target.acknowledge_calls += source.acknowledge_calls;
    target.acknowledged_pings += source.acknowledged_pings;
    target.total_acknowledge_duration_ns += source.total_acknowledge_duration_ns;
    target.last_acknowledge_duration_ns = std::max(target.last_acknowledge_duration_ns, source.last_acknowledge_duration_ns);
    target.delete_failures += source.delete_failures;
    return target;
}

}  // namespace

void PingStoreTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void PingStoreTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

PingStoreTelemetrySnapshot PingStoreTelemetryRegistry::aggregate() const
{
    PingStoreTelemetrySnapshot total{};
    std::lock_guard guard(mutex_);
    for (const auto& [_, sampler] : samplers_) {
        total = accumulate_snapshot(total, sampler());
    }
    return total;
}

void PingStoreTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, PingStoreTelemetrySnapshot>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler());
        }
    }

    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    for (const auto& [identifier, snapshot] : entries) {
        visitor(identifier, snapshot);
    }
}

}  // namespace pingstore::storage
