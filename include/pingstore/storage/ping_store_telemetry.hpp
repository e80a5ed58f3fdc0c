#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pingstore::storage {

struct PingStoreTelemetrySnapshot final {
    std::uint64_t store_calls = 0U;
    std::uint64_t store_failures = 0U;
    std::uint64_t duplicate_rejections = 0U;
    std::uint64_t bytes_written = 0U;
    std::uint64_t total_store_duration_ns = 0U;
    std::uint64_t last_store_duration_ns = 0U;
    std::uint64_t enumerate_calls = 0U;
    std::uint64_t enumerated_pings = 0U;
    std::uint64_t skipped_files = 0U;
    std::uint64_t quarantined_files = 0U;
    std::uint64_t total_enumerate_duration_ns = 0U;
    std::uint64_t last_enumerate_duration_ns = 0U;
    std::uint64_t prune_calls = 0U;
    std::uint64_t pruned_pings = 0U;
    std::uint64_t total_prune_duration_ns = 0U;
    std::uint64_t last_prune_duration_ns = 0U;
    std::uint64_t acknowledge_calls = 0U;
    std::uint64_t acknowledged_pings = 0U;
    std::uint64_t total_acknowledge_duration_ns = 0U;
    std::uint64_t last_acknowledge_duration_ns = 0U;
    std::uint64_t delete_failures = 0U;
};

// Samplers run with the registry lock held, so once unregister_sampler returns no
// call into that sampler is in flight and its owner may be destroyed. A sampler must
// not call back into the registry. Visitors run after the lock is released.
class PingStoreTelemetryRegistry final {
public:
    using Sampler = std::function<PingStoreTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const PingStoreTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] PingStoreTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    using SamplerMap = std::unordered_map<std::string, Sampler>;

    mutable std::mutex mutex_{};
    SamplerMap samplers_{};
};

}  // namespace pingstore::storage
