#pragma once

#include "pingstore/storage/ping_store_events.hpp"

#include <string>

namespace pingstore::tools {

// Renders one event as a single JSON Lines record (no trailing newline).
[[nodiscard]] std::string format_ping_store_event_json(const pingstore::storage::PingStoreEvent& event);

}  // namespace pingstore::tools
