#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <system_error>

namespace pingstore::storage {

enum class PingStoreOperation : std::uint8_t {
    Store,
    Enumerate,
    Prune,
    Acknowledge
};

enum class PingStoreEventOutcome : std::uint8_t {
    Completed,
    Failed,
    Skipped,
    Quarantined,
    AlreadyAbsent
};

// One event per store call, one per skipped or quarantined file, one per delete that
// failed or found the file already gone, and a closing summary per enumerate, prune and acknowledge call (ping_id unset, count set).
struct PingStoreEvent final {
    PingStoreOperation operation = PingStoreOperation::Store;
    PingStoreEventOutcome outcome = PingStoreEventOutcome::Completed;
    std::optional<std::uint64_t> ping_id{};
    std::filesystem::path path{};
    std::uint64_t count = 0U;
    std::error_code status{};
    std::error_code cause{};
    std::uint64_t duration_ns = 0U;
    std::chrono::system_clock::time_point timestamp{};
};

using PingStoreEventLogger = std::function<void(const PingStoreEvent&)>;

[[nodiscard]] std::string_view ping_store_operation_name(PingStoreOperation operation) noexcept;
[[nodiscard]] std::string_view ping_store_outcome_name(PingStoreEventOutcome outcome) noexcept;

}  // namespace pingstore::storage
