#include "pingstore/storage/ping_filename_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <random>
#include <regex>
#include <string>
#include <vector>

using pingstore::storage::ping_filename_for;
using pingstore::storage::ping_id_from_filename;
using pingstore::storage::ping_id_from_temp_filename;
using pingstore::storage::ping_temp_filename_for;

namespace {

// The pattern external tooling uses to pull ids out of the store directory.
const std::regex kExternalIdPattern{"[^0-9]*([0-9]+)[^0-9]*"};

}  // namespace

TEST_CASE("Ping filenames round trip across the id range")
{
    const std::vector<std::uint64_t> ids{
        0U,
        1U,
        9U,
        10U,
        48'679U,
        465'739'201U,
        1'234'567'890U,
        std::numeric_limits<std::uint32_t>::max(),
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()),
        std::numeric_limits<std::uint64_t>::max(),
    };

    for (const auto id : ids) {
        CAPTURE(id);
        const auto name = ping_filename_for(id);
        const auto decoded = ping_id_from_filename(name);
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == id);
    }

    std::mt19937_64 generator{0x5EEDU};
    for (int i = 0; i < 256; ++i) {
        const auto id = generator();
        CAPTURE(id);
        REQUIRE(ping_id_from_filename(ping_filename_for(id)) == id);
    }
}

TEST_CASE("Ping filenames expose the id to the external digit pattern")
{
    for (const std::uint64_t id : {std::uint64_t{0U}, std::uint64_t{42U}, std::numeric_limits<std::uint64_t>::max()}) {
        const auto name = ping_filename_for(id);
        CAPTURE(name);

        REQUIRE(name.find(std::to_string(id)) != std::string::npos);

        std::smatch match;
        REQUIRE(std::regex_match(name, match, kExternalIdPattern));
        REQUIRE(match[1].str() == std::to_string(id));
    }
}

TEST_CASE("Ping filename decoding rejects foreign and non-canonical names")
{
    const std::vector<std::string> rejected{
        "",
        "ping-.json",
        "ping-007.json",
        "ping-00.json",
        "ping-12a.json",
        "ping--5.json",
        "ping-+5.json",
        "ping- 5.json",
        "ping-18446744073709551616.json",
        "ping-99999999999999999999999.json",
        "other-5.json",
        "ping-5.txt",
        "ping-5.json.bak",
        "ping5.json",
        "PING-5.JSON",
    };

    for (const auto& name : rejected) {
        CAPTURE(name);
        REQUIRE_FALSE(ping_id_from_filename(name).has_value());
    }
}

TEST_CASE("Temporary ping filenames never decode as records")
{
    const auto temp_name = ping_temp_filename_for(77U);
    REQUIRE(temp_name != ping_filename_for(77U));
    REQUIRE(temp_name.find("77") != std::string::npos);
    REQUIRE_FALSE(ping_id_from_filename(temp_name).has_value());
}

TEST_CASE("Temporary ping filenames decode back to their id")
{
    for (const std::uint64_t id : {std::uint64_t{0U}, std::uint64_t{77U}, std::numeric_limits<std::uint64_t>::max()}) {
        REQUIRE(ping_id_from_temp_filename(ping_temp_filename_for(id)) == id);
    }

    const std::vector<std::string> rejected{
        ".tmp",
        "..tmp",
        "ping-5.json",
        "ping-5.json.tmp",
        ".ping-5.json",
        ".ping-05.json.tmp",
        ".notes.tmp",
    };
    for (const auto& name : rejected) {
        INFO(name);
        REQUIRE_FALSE(ping_id_from_temp_filename(name).has_value());
    }
}
