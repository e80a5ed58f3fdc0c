#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace pingstore::storage {

struct PingRecord final {
    std::uint64_t id = 0U;
    std::string destination{};
    nlohmann::json payload = nlohmann::json::object();
};

}  // namespace pingstore::storage
