#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <system_error>

namespace pingstore::storage {

inline constexpr char kPingDestinationKey[] = "u";
inline constexpr char kPingPayloadKey[] = "p";

// Serialises {"u": destination, "p": payload}. The payload must be a JSON object and
// the destination non-empty; anything else yields PingStoreErrc::InvalidPing.
[[nodiscard]] std::error_code encode_ping_document(std::string_view destination,
                                                   const nlohmann::json& payload,
                                                   std::string& out);

// Accepts the payload either as an object or as a string holding a serialised object.
[[nodiscard]] std::error_code decode_ping_document(std::string_view text,
                                                   std::string& destination,
                                                   nlohmann::json& payload);

}  // namespace pingstore::storage
