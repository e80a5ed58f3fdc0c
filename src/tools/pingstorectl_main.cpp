#include "pingstore/storage/json_file_ping_store.hpp"
#include "pingstore/storage/ping_file_io.hpp"
#include "pingstore/storage/ping_store_telemetry.hpp"
#include "pingstore/tools/ping_store_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

using pingstore::storage::JsonFilePingStore;
using pingstore::storage::JsonFilePingStoreConfig;
using pingstore::storage::MalformedPingPolicy;
using pingstore::storage::PingRecord;
using pingstore::storage::PingStoreTelemetryRegistry;

namespace {

constexpr const char* kTelemetryIdentifier = "pingstorectl";

struct StoreOptions final {
    std::string directory;
    std::size_t max_pings = pingstore::storage::kDefaultMaxPingCount;
    MalformedPingPolicy malformed_policy = MalformedPingPolicy::Skip;
    bool no_sync = false;
    std::string log_json_path;
};

struct EventLog final {
    std::unique_ptr<std::ofstream> file{};
    std::ostream* stream = nullptr;
    std::mutex mutex{};
};

void throw_if_failed(const std::error_code& ec, const std::string& what)
{
    if (ec) {
        throw std::system_error(ec, what);
    }
}

void open_event_log(const StoreOptions& options, EventLog& log)
{
    if (options.log_json_path.empty()) {
        return;
    }
    if (options.log_json_path == "-") {
        log.stream = &std::cout;
        return;
    }
    auto file = std::make_unique<std::ofstream>(options.log_json_path, std::ios::out | std::ios::app);
    if (!*file) {
        throw std::runtime_error("failed to open log file '" + options.log_json_path + "'");
    }
    log.stream = file.get();
    log.file = std::move(file);
}

std::unique_ptr<JsonFilePingStore> open_store(const StoreOptions& options,
                                              EventLog& log,
                                              PingStoreTelemetryRegistry& registry)
{
    open_event_log(options, log);

    JsonFilePingStoreConfig config{};
    config.directory = options.directory;
    config.max_ping_count = options.max_pings;
    config.malformed_policy = options.malformed_policy;
    config.sync_writes = !options.no_sync;
    config.telemetry_registry = &registry;
    config.telemetry_identifier = kTelemetryIdentifier;
    if (log.stream != nullptr) {
        config.event_logger = [&log](const pingstore::storage::PingStoreEvent& event) {
            const auto line = pingstore::tools::format_ping_store_event_json(event);
            std::lock_guard<std::mutex> guard{log.mutex};
            (*log.stream) << line << '\n';
            log.stream->flush();
        };
    }
    return std::make_unique<JsonFilePingStore>(std::move(config));
}

nlohmann::json load_payload(const std::string& payload_text, const std::string& payload_file)
{
    std::string text = payload_text;
    if (!payload_file.empty()) {
        const auto ec = pingstore::storage::read_file_contents(payload_file, text);
        throw_if_failed(ec, "failed to read payload file '" + payload_file + "'");
    }

    auto payload = nlohmann::json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw std::invalid_argument("payload must be a JSON object");
    }
    return payload;
}

std::vector<PingRecord> read_sorted(const JsonFilePingStore& store)
{
    std::vector<PingRecord> pings;
    pingstore::storage::PingEnumerationStats stats{};
    const auto ec = store.get_all(pings, &stats);
    if (stats.skipped_files > 0U || stats.quarantined_files > 0U) {
        std::cerr << "warning: " << stats.skipped_files << " unreadable ping file(s) skipped, "
                  << stats.quarantined_files << " quarantined" << '\n';
    }
    throw_if_failed(ec, "failed to enumerate pings");
    std::sort(pings.begin(), pings.end(), [](const PingRecord& lhs, const PingRecord& rhs) {
        return lhs.id < rhs.id;
    });
    return pings;
}

void print_pings(const std::vector<PingRecord>& pings, const std::string& format)
{
    if (format == "json") {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& ping : pings) {
            out.push_back({{"id", ping.id}, {"destination", ping.destination}, {"payload", ping.payload}});
        }
        std::cout << out.dump(2) << '\n';
        return;
    }

    for (const auto& ping : pings) {
        std::cout << ping.id << '\t' << ping.destination << '\t' << ping.payload.dump() << '\n';
    }
}

void print_stats(const std::vector<PingRecord>& pings, const PingStoreTelemetryRegistry& registry)
{
    std::cout << "pings: " << pings.size() << '\n';
    if (!pings.empty()) {
        std::cout << "oldest id: " << pings.front().id << '\n';
        std::cout << "newest id: " << pings.back().id << '\n';
    }

    const auto snapshot = registry.aggregate();
    std::cout << "enumerated: " << snapshot.enumerated_pings << '\n';
    std::cout << "skipped files: " << snapshot.skipped_files << '\n';
    std::cout << "quarantined files: " << snapshot.quarantined_files << '\n';
    std::cout << "enumerate duration: " << snapshot.last_enumerate_duration_ns << " ns" << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Inspect and maintain a ping store directory"};
    app.require_subcommand(1);

    StoreOptions options{};
    app.add_option("-d,--dir", options.directory, "Ping store directory")->required();
    app.add_option("--max-pings", options.max_pings, "Capacity used by prune when --max is not given")
        ->capture_default_str();
    app.add_option("--malformed", options.malformed_policy, "Handling of unreadable ping files (skip, quarantine, report)")
        ->transform(CLI::CheckedTransformer(std::map<std::string, MalformedPingPolicy>{
                                                {"skip", MalformedPingPolicy::Skip},
                                                {"quarantine", MalformedPingPolicy::Quarantine},
                                                {"report", MalformedPingPolicy::Report}},
                                            CLI::ignore_case));
    app.add_flag("--no-sync", options.no_sync, "Skip fsync before publishing a ping");
    app.add_option("--log-json", options.log_json_path, "Write store events as JSON Lines (use '-' for stdout)");

    EventLog log{};
    PingStoreTelemetryRegistry registry{};

    std::uint64_t store_id = 0U;
    std::string store_destination;
    std::string store_payload = "{}";
    std::string store_payload_file;
    bool store_replace = false;
    auto* store_cmd = app.add_subcommand("store", "Store one ping");
    store_cmd->add_option("--id", store_id, "Ping id")->required();
    store_cmd->add_option("--destination", store_destination, "Upload destination path")->required();
    store_cmd->add_option("--payload", store_payload, "Payload as a JSON object");
    store_cmd->add_option("--payload-file", store_payload_file, "Read the payload from a file")->check(CLI::ExistingFile);
    store_cmd->add_flag("--replace", store_replace, "Overwrite an existing ping with the same id");
    store_cmd->callback([&]() {
        auto store = open_store(options, log, registry);
        PingRecord ping{};
        ping.id = store_id;
        ping.destination = store_destination;
        ping.payload = load_payload(store_payload, store_payload_file);
        const auto mode = store_replace ? pingstore::storage::PublishMode::Replace
                                        : pingstore::storage::PublishMode::CreateNew;
        throw_if_failed(store->store(ping, mode), "failed to store ping " + std::to_string(store_id));
        std::cout << store->file_for(store_id).string() << '\n';
    });

    std::string list_format = "text";
    auto* list_cmd = app.add_subcommand("list", "List stored pings ordered by id");
    list_cmd->add_option("-f,--format", list_format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    list_cmd->callback([&]() {
        auto store = open_store(options, log, registry);
        print_pings(read_sorted(*store), list_format);
    });

    std::optional<std::size_t> prune_max;
    auto* prune_cmd = app.add_subcommand("prune", "Evict the oldest pings beyond capacity");
    prune_cmd->add_option("--max", prune_max, "Number of pings to keep");
    prune_cmd->callback([&]() {
        auto store = open_store(options, log, registry);
        pingstore::storage::PingPruneStats stats{};
        const auto ec = store->prune(prune_max.value_or(options.max_pings), &stats);
        std::cout << "removed " << stats.removed_pings << " of " << stats.candidate_pings << " candidate(s), "
                  << stats.stored_pings - stats.removed_pings - stats.already_absent << " remaining, "
                  << stats.stale_temp_files << " stale temporary file(s) cleared" << '\n';
        throw_if_failed(ec, "prune incomplete");
    });

    std::vector<std::uint64_t> ack_ids;
    auto* ack_cmd = app.add_subcommand("ack", "Remove pings confirmed as delivered");
    ack_cmd->add_option("ids", ack_ids, "Delivered ping ids")->required();
    ack_cmd->callback([&]() {
        auto store = open_store(options, log, registry);
        const std::unordered_set<std::uint64_t> ids(ack_ids.begin(), ack_ids.end());
        pingstore::storage::PingAcknowledgeStats stats{};
        const auto ec = store->acknowledge(ids, &stats);
        std::cout << "removed " << stats.removed_pings << ", already absent " << stats.already_absent << '\n';
        throw_if_failed(ec, "acknowledge incomplete");
    });

    auto* stats_cmd = app.add_subcommand("stats", "Summarise the store contents");
    stats_cmd->callback([&]() {
        auto store = open_store(options, log, registry);
        print_stats(read_sorted(*store), registry);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
