#include "pingstore/storage/json_file_ping_store.hpp"
#include "pingstore/storage/ping_store_errors.hpp"
#include "pingstore/tools/ping_store_log_formatter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using pingstore::storage::JsonFilePingStore;
using pingstore::storage::JsonFilePingStoreConfig;
using pingstore::storage::MalformedPingPolicy;
using pingstore::storage::PingRecord;
using pingstore::storage::PingStoreErrc;
using pingstore::storage::PingStoreEvent;
using pingstore::storage::PingStoreEventOutcome;
using pingstore::storage::PingStoreOperation;

namespace {

std::filesystem::path make_temp_dir(const std::string& prefix)
{
    static std::atomic<std::uint64_t> counter{0U};
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_"
                       + std::to_string(counter.fetch_add(1U)));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

PingRecord make_ping(std::uint64_t id)
{
    PingRecord ping{};
    ping.id = id;
    ping.destination = "dest";
    ping.payload = nlohmann::json::object();
    return ping;
}

}  // namespace

TEST_CASE("Ping store events render as single-line JSON")
{
    PingStoreEvent event{};
    event.operation = PingStoreOperation::Store;
    event.outcome = PingStoreEventOutcome::Failed;
    event.ping_id = 42U;
    event.path = "/tmp/pings/ping-42.json";
    event.status = make_error_code(PingStoreErrc::StorageWriteFailed);
    event.cause = std::make_error_code(std::errc::no_space_on_device);
    event.duration_ns = 1'500U;
    event.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000}}
        + std::chrono::microseconds{250};

    const auto line = pingstore::tools::format_ping_store_event_json(event);
    REQUIRE(line.find('\n') == std::string::npos);

    const auto json = nlohmann::json::parse(line);
    REQUIRE(json.at("operation") == "store");
    REQUIRE(json.at("outcome") == "failed");
    REQUIRE(json.at("ping_id") == 42U);
    REQUIRE(json.at("path") == "/tmp/pings/ping-42.json");
    REQUIRE(json.at("count") == 0U);
    REQUIRE(json.at("duration_ns") == 1'500U);
    REQUIRE(json.at("status").at("category") == "pingstore.storage");
    REQUIRE(json.at("status").at("message") == "ping write failed");
    REQUIRE(json.at("cause").at("category") == "generic");
    REQUIRE(json.at("cause").at("value") == static_cast<int>(std::errc::no_space_on_device));
    REQUIRE(json.at("timestamp") == "2023-11-14T22:13:20.000250Z");
}

TEST_CASE("Summary events carry counts and null optional fields")
{
    PingStoreEvent event{};
    event.operation = PingStoreOperation::Prune;
    event.outcome = PingStoreEventOutcome::Completed;
    event.count = 3U;

    const auto json = nlohmann::json::parse(pingstore::tools::format_ping_store_event_json(event));
    REQUIRE(json.at("operation") == "prune");
    REQUIRE(json.at("outcome") == "completed");
    REQUIRE(json.at("ping_id").is_null());
    REQUIRE(json.at("count") == 3U);
    REQUIRE(json.at("status").is_null());
    REQUIRE(json.at("cause").is_null());
    REQUIRE(json.at("timestamp").is_null());
}

TEST_CASE("JsonFilePingStore reports each operation to the event logger")
{
    auto dir = make_temp_dir("pingstore_events_");
    std::vector<PingStoreEvent> events;

    JsonFilePingStoreConfig config{};
    config.directory = dir;
    config.sync_writes = false;
    config.malformed_policy = MalformedPingPolicy::Quarantine;
    config.event_logger = [&events](const PingStoreEvent& event) { events.push_back(event); };
    JsonFilePingStore store{config};

    REQUIRE_FALSE(store.store(make_ping(1U)));
    REQUIRE(store.store(make_ping(1U)) == PingStoreErrc::DuplicatePing);
    REQUIRE(events.size() == 2U);
    REQUIRE(events[0].operation == PingStoreOperation::Store);
    REQUIRE(events[0].outcome == PingStoreEventOutcome::Completed);
    REQUIRE(events[0].ping_id == 1U);
    REQUIRE(events[0].count == 1U);
    REQUIRE(events[0].timestamp.time_since_epoch().count() != 0);
    REQUIRE(events[1].outcome == PingStoreEventOutcome::Failed);
    REQUIRE(events[1].status == PingStoreErrc::DuplicatePing);
    REQUIRE(events[1].cause == std::errc::file_exists);

    {
        std::ofstream stream{store.file_for(2U)};
        stream << "[]";
    }
    events.clear();
    std::vector<PingRecord> pings;
    REQUIRE_FALSE(store.get_all(pings));
    REQUIRE(events.size() == 2U);
    REQUIRE(events[0].operation == PingStoreOperation::Enumerate);
    REQUIRE(events[0].outcome == PingStoreEventOutcome::Quarantined);
    REQUIRE(events[0].ping_id == 2U);
    REQUIRE(events[0].status == PingStoreErrc::StorageReadSkipped);
    REQUIRE(events[1].outcome == PingStoreEventOutcome::Completed);
    REQUIRE_FALSE(events[1].ping_id.has_value());
    REQUIRE(events[1].count == 1U);

    events.clear();
    REQUIRE_FALSE(store.acknowledge({1U}));
    REQUIRE_FALSE(store.prune(0U));
    REQUIRE(events.size() == 2U);
    REQUIRE(events[0].operation == PingStoreOperation::Acknowledge);
    REQUIRE(events[0].count == 1U);
    REQUIRE(events[1].operation == PingStoreOperation::Prune);
    REQUIRE(events[1].count == 0U);

    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("JsonFilePingStore reports deletes of missing pings as already absent")
{
    auto dir = make_temp_dir("pingstore_events_");
    std::vector<PingStoreEvent> events;

    JsonFilePingStoreConfig config{};
    config.directory = dir;
    config.sync_writes = false;
    config.event_logger = [&events](const PingStoreEvent& event) { events.push_back(event); };
    JsonFilePingStore store{config};

    REQUIRE_FALSE(store.store(make_ping(1U)));
    events.clear();

    REQUIRE_FALSE(store.acknowledge({1U, 42U}));
    REQUIRE(events.size() == 2U);
    REQUIRE(events[0].operation == PingStoreOperation::Acknowledge);
    REQUIRE(events[0].outcome == PingStoreEventOutcome::AlreadyAbsent);
    REQUIRE(events[0].ping_id == 42U);
    REQUIRE(events[0].path == store.file_for(42U));
    REQUIRE_FALSE(events[0].status);
    REQUIRE(events[1].outcome == PingStoreEventOutcome::Completed);
    REQUIRE(events[1].count == 1U);

    const auto line = nlohmann::json::parse(pingstore::tools::format_ping_store_event_json(events[0]));
    REQUIRE(line.at("outcome") == "already_absent");
    REQUIRE(line.at("ping_id") == 42U);

    (void)std::filesystem::remove_all(dir);
}
