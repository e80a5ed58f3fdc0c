#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pingstore::storage {

// Record files are named "ping-<id>.json". The id is the only run of digits in the
// name, rendered without sign or leading zeros.
inline constexpr std::string_view kPingFilePrefix{"ping-"};
inline constexpr std::string_view kPingFileExtension{".json"};

// In-flight writes use ".ping-<id>.json.tmp", which never decodes as a record.
inline constexpr std::string_view kPingTempFilePrefix{"."};
inline constexpr std::string_view kPingTempFileSuffix{".tmp"};

[[nodiscard]] std::string ping_filename_for(std::uint64_t ping_id);
[[nodiscard]] std::string ping_temp_filename_for(std::uint64_t ping_id);

// Inverse of ping_filename_for. Rejects names with another prefix or extension,
// leading zeros, or ids outside the uint64 range.
[[nodiscard]] std::optional<std::uint64_t> ping_id_from_filename(std::string_view filename) noexcept;

// Inverse of ping_temp_filename_for.
[[nodiscard]] std::optional<std::uint64_t> ping_id_from_temp_filename(std::string_view filename) noexcept;

}  // namespace pingstore::storage
