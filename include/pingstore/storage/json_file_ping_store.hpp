#pragma once

#include "pingstore/storage/ping_store.hpp"
#include "pingstore/storage/ping_store_events.hpp"
#include "pingstore/storage/ping_store_telemetry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace pingstore::storage {

inline constexpr std::size_t kDefaultMaxPingCount = 40U;
inline constexpr std::string_view kQuarantineDirectoryName{"quarantine"};
inline constexpr std::chrono::seconds kDefaultStaleTempFileAge{std::chrono::minutes{10}};

enum class MalformedPingPolicy : std::uint8_t {
    Skip,
    Quarantine,
    Report
};

struct JsonFilePingStoreConfig final {
    std::filesystem::path directory{};
    std::size_t max_ping_count = kDefaultMaxPingCount;
    MalformedPingPolicy malformed_policy = MalformedPingPolicy::Skip;
    bool sync_writes = true;
    // prune() removes temporary files left by interrupted writes once they are this old.
    std::chrono::seconds stale_temp_file_age = kDefaultStaleTempFileAge;
    PingStoreEventLogger event_logger{};
    PingStoreTelemetryRegistry* telemetry_registry = nullptr;
    std::string telemetry_identifier{};
};

// Keeps one JSON document per ping in a single directory. Mutating calls are
// serialised internally; readers in other threads or processes never observe a
// partially written record.
class JsonFilePingStore final : public PingStore {
public:
    // Throws std::system_error with PingStoreErrc::StorageUnavailable when the
    // directory cannot be created or is not a writable directory.
    explicit JsonFilePingStore(JsonFilePingStoreConfig config);
    ~JsonFilePingStore() override;

    JsonFilePingStore(const JsonFilePingStore&) = delete;
    JsonFilePingStore& operator=(const JsonFilePingStore&) = delete;
    JsonFilePingStore(JsonFilePingStore&&) = delete;
    JsonFilePingStore& operator=(JsonFilePingStore&&) = delete;

    using PingStore::store;

    std::error_code store(const PingRecord& ping, PublishMode mode) override;
    std::error_code get_all(std::vector<PingRecord>& out, PingEnumerationStats* stats = nullptr) const override;
    std::error_code prune(std::size_t max_count, PingPruneStats* stats = nullptr) override;
    std::error_code acknowledge(const std::unordered_set<std::uint64_t>& ping_ids,
                                PingAcknowledgeStats* stats = nullptr) override;

    // Prunes to config().max_ping_count.
    std::error_code maybe_prune(PingPruneStats* stats = nullptr);

    [[nodiscard]] std::filesystem::path file_for(std::uint64_t ping_id) const;
    [[nodiscard]] static std::optional<std::uint64_t> id_from_filename(std::string_view filename) noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept;
    [[nodiscard]] std::filesystem::path quarantine_directory() const;
    [[nodiscard]] const JsonFilePingStoreConfig& config() const noexcept;
    [[nodiscard]] PingStoreTelemetrySnapshot telemetry_snapshot() const;

private:
    struct StoredPingFile final {
        std::uint64_t id = 0U;
        std::filesystem::path path{};
    };

    struct DeleteTally final {
        std::uint64_t removed = 0U;
        std::uint64_t already_absent = 0U;
        std::uint64_t failed = 0U;
    };

    std::error_code list_ping_files(std::vector<StoredPingFile>& out) const;
    DeleteTally delete_ping_files(std::span<const StoredPingFile> files, PingStoreOperation operation) const;
    std::error_code quarantine_file(const StoredPingFile& file) const;
    std::uint64_t remove_stale_temp_files() const;
    void emit(PingStoreEvent event) const;

    JsonFilePingStoreConfig config_;
    mutable std::mutex mutation_mutex_{};
    mutable std::mutex telemetry_mutex_{};
    mutable PingStoreTelemetrySnapshot telemetry_{};
};

}  // namespace pingstore::storage
