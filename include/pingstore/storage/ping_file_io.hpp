#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace pingstore::storage {

enum class PublishMode : std::uint8_t {
    CreateNew,
    Replace
};

enum class RemoveOutcome : std::uint8_t {
    Removed,
    AlreadyAbsent,
    Failed
};

struct AtomicWriteRequest final {
    std::filesystem::path temp_path{};
    std::filesystem::path target_path{};
    std::string_view contents{};
    PublishMode mode = PublishMode::CreateNew;
    bool sync = true;
};

// Writes contents to temp_path, closes it and publishes it at target_path. Readers
// observe either no target or the complete contents. CreateNew fails with
// std::errc::file_exists when the target is already present. The temporary file is
// removed on every failure path and no descriptor outlives the call.
[[nodiscard]] std::error_code write_file_atomically(const AtomicWriteRequest& request);

[[nodiscard]] std::error_code read_file_contents(const std::filesystem::path& path, std::string& out);

// A missing file is reported as AlreadyAbsent rather than an error.
[[nodiscard]] RemoveOutcome remove_file_idempotent(const std::filesystem::path& path, std::error_code& ec);

}  // namespace pingstore::storage
