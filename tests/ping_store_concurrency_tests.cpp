#include "pingstore/storage/json_file_ping_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>

using pingstore::storage::JsonFilePingStore;
using pingstore::storage::JsonFilePingStoreConfig;
using pingstore::storage::PingAcknowledgeStats;
using pingstore::storage::PingEnumerationStats;
using pingstore::storage::PingPruneStats;
using pingstore::storage::PingRecord;

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

JsonFilePingStoreConfig make_config(const std::filesystem::path& dir)
{
    JsonFilePingStoreConfig config{};
    config.directory = dir;
    config.sync_writes = false;
    return config;
}

PingRecord make_ping(std::uint64_t id)
{
    PingRecord ping{};
    ping.id = id;
    ping.destination = "submit/" + std::to_string(id);
    ping.payload = nlohmann::json{{"blob", std::string(512U, 'x')}, {"id", id}};
    return ping;
}

std::size_t count_entries(const std::filesystem::path& dir)
{
    std::size_t count = 0U;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

}  // namespace

TEST_CASE("Concurrent prune and acknowledge over the same pings never fail")
{
    auto dir = make_temp_dir("pingstore_race_");
    constexpr std::uint64_t kRounds = 20U;
    constexpr std::uint64_t kPingsPerRound = 50U;

    // Separate instances share nothing but the directory, like two processes would.
    JsonFilePingStore pruner{make_config(dir)};
    JsonFilePingStore uploader{make_config(dir)};

    for (std::uint64_t round = 0U; round < kRounds; ++round) {
        std::unordered_set<std::uint64_t> ids;
        for (std::uint64_t offset = 0U; offset < kPingsPerRound; ++offset) {
            const auto id = round * kPingsPerRound + offset;
            REQUIRE_FALSE(uploader.store(make_ping(id)));
            ids.insert(id);
        }

        std::error_code prune_ec;
        std::error_code ack_ec;
        PingPruneStats prune_stats{};
        PingAcknowledgeStats ack_stats{};

        std::thread prune_thread{[&] { prune_ec = pruner.prune(0U, &prune_stats); }};
        std::thread ack_thread{[&] { ack_ec = uploader.acknowledge(ids, &ack_stats); }};
        prune_thread.join();
        ack_thread.join();

        CAPTURE(round);
        REQUIRE_FALSE(prune_ec);
        REQUIRE_FALSE(ack_ec);
        REQUIRE(prune_stats.failed_deletes == 0U);
        REQUIRE(ack_stats.failed_deletes == 0U);
        REQUIRE(prune_stats.removed_pings + ack_stats.removed_pings == kPingsPerRound);
        REQUIRE(count_entries(dir) == 0U);
    }

    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Concurrent writers on one store keep every ping")
{
    auto dir = make_temp_dir("pingstore_writers_");
    JsonFilePingStore store{make_config(dir)};

    constexpr std::uint64_t kThreads = 4U;
    constexpr std::uint64_t kPingsPerThread = 25U;
    std::atomic<std::uint64_t> failures{0U};

    std::vector<std::thread> writers;
    for (std::uint64_t thread_index = 0U; thread_index < kThreads; ++thread_index) {
        writers.emplace_back([&, thread_index] {
            for (std::uint64_t offset = 0U; offset < kPingsPerThread; ++offset) {
                if (store.store(make_ping(thread_index * kPingsPerThread + offset))) {
                    failures.fetch_add(1U);
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    REQUIRE(failures.load() == 0U);
    std::vector<PingRecord> pings;
    REQUIRE_FALSE(store.get_all(pings));
    REQUIRE(pings.size() == kThreads * kPingsPerThread);

    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Readers never observe a partially written ping")
{
    auto dir = make_temp_dir("pingstore_readers_");
    JsonFilePingStore writer{make_config(dir)};
    JsonFilePingStore reader{make_config(dir)};

    constexpr std::uint64_t kPings = 200U;
    std::atomic<bool> done{false};
    std::atomic<std::uint64_t> skipped{0U};
    std::atomic<std::uint64_t> read_errors{0U};

    std::thread reader_thread{[&] {
        std::vector<PingRecord> pings;
        while (!done.load()) {
            PingEnumerationStats stats{};
            if (reader.get_all(pings, &stats)) {
                read_errors.fetch_add(1U);
            }
            skipped.fetch_add(stats.skipped_files);
        }
    }};

    for (std::uint64_t id = 0U; id < kPings; ++id) {
        REQUIRE_FALSE(writer.store(make_ping(id)));
    }
    done.store(true);
    reader_thread.join();

    REQUIRE(skipped.load() == 0U);
    REQUIRE(read_errors.load() == 0U);
    REQUIRE(count_entries(dir) == kPings);

    (void)std::filesystem::remove_all(dir);
}
