#include "pingstore/storage/json_file_ping_store.hpp"

#include "pingstore/storage/ping_document_codec.hpp"
#include "pingstore/storage/ping_filename_codec.hpp"
#include "pingstore/storage/ping_store_errors.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <unistd.h>

namespace pingstore::storage {

namespace {

[[nodiscard]] std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start)
{
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

[[noreturn]] void throw_unavailable(const std::filesystem::path& directory, const std::string& reason)
{
    throw std::system_error(make_error_code(PingStoreErrc::StorageUnavailable),
                            "ping store directory '" + directory.string() + "' " + reason);
}

void ensure_store_directory(const std::filesystem::path& directory)
{
    if (directory.empty()) {
        throw_unavailable(directory, "is not set");
    }

    std::error_code ec;
    const auto status = std::filesystem::status(directory, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw_unavailable(directory, "cannot be inspected: " + ec.message());
    }

    if (!std::filesystem::exists(status)) {
        ec.clear();
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            throw_unavailable(directory, "cannot be created: " + ec.message());
        }
        return;
    }

    if (!std::filesystem::is_directory(status)) {
        throw_unavailable(directory, "is not a directory");
    }
    if (::access(directory.native().c_str(), W_OK | X_OK) != 0) {
        throw_unavailable(directory, "is not writable");
    }
}

}  // namespace

JsonFilePingStore::JsonFilePingStore(JsonFilePingStoreConfig config)
    : config_{std::move(config)}
{
    ensure_store_directory(config_.directory);

    if (config_.telemetry_registry && !config_.telemetry_identifier.empty()) {
        config_.telemetry_registry->register_sampler(config_.telemetry_identifier, [this] {
            return this->telemetry_snapshot();
        });
    }
}

JsonFilePingStore::~JsonFilePingStore()
{
    if (config_.telemetry_registry && !config_.telemetry_identifier.empty()) {
        config_.telemetry_registry->unregister_sampler(config_.telemetry_identifier);
    }
}

std::filesystem::path JsonFilePingStore::file_for(std::uint64_t ping_id) const
{
    return config_.directory / ping_filename_for(ping_id);
}

std::optional<std::uint64_t> JsonFilePingStore::id_from_filename(std::string_view filename) noexcept
{
    return ping_id_from_filename(filename);
}

const std::filesystem::path& JsonFilePingStore::directory() const noexcept
{
    return config_.directory;
}

std::filesystem::path JsonFilePingStore::quarantine_directory() const
{
    return config_.directory / kQuarantineDirectoryName;
}

const JsonFilePingStoreConfig& JsonFilePingStore::config() const noexcept
{
    return config_;
}

PingStoreTelemetrySnapshot JsonFilePingStore::telemetry_snapshot() const
{
    std::lock_guard guard(telemetry_mutex_);
    return telemetry_;
}

void JsonFilePingStore::emit(PingStoreEvent event) const
{
    if (!config_.event_logger) {
        return;
    }
    event.timestamp = std::chrono::system_clock::now();
    config_.event_logger(event);
}

std::error_code JsonFilePingStore::store(const PingRecord& ping, PublishMode mode)
{
    const auto start = std::chrono::steady_clock::now();

    std::string document;
    std::error_code cause = encode_ping_document(ping.destination, ping.payload, document);
    std::error_code status = cause;

    if (!cause) {
        AtomicWriteRequest request{};
        request.temp_path = config_.directory / ping_temp_filename_for(ping.id);
        request.target_path = file_for(ping.id);
        request.contents = document;
        request.mode = mode;
        request.sync = config_.sync_writes;

        {
            std::lock_guard guard(mutation_mutex_);
            cause = write_file_atomically(request);
        }

        if (cause == std::errc::file_exists) {
            status = make_error_code(PingStoreErrc::DuplicatePing);
        } else if (cause) {
            status = make_error_code(PingStoreErrc::StorageWriteFailed);
        }
    }

    const auto duration_ns = elapsed_ns(start);
    {
        std::lock_guard guard(telemetry_mutex_);
        telemetry_.store_calls += 1U;
        telemetry_.total_store_duration_ns += duration_ns;
        telemetry_.last_store_duration_ns = duration_ns;
        if (status) {
            telemetry_.store_failures += 1U;
            if (status == PingStoreErrc::DuplicatePing) {
                telemetry_.duplicate_rejections += 1U;
            }
        } else {
            telemetry_.bytes_written += document.size();
        }
    }

    PingStoreEvent event{};
    event.operation = PingStoreOperation::Store;
    event.outcome = status ? PingStoreEventOutcome::Failed : PingStoreEventOutcome::Completed;
    event.ping_id = ping.id;
    event.path = file_for(ping.id);
    event.count = status ? 0U : 1U;
    event.status = status;
    event.cause = cause;
    event.duration_ns = duration_ns;
    emit(std::move(event));

    return status;
}

std::error_code JsonFilePingStore::list_ping_files(std::vector<StoredPingFile>& out) const
{
    out.clear();

    std::error_code ec;
    std::filesystem::directory_iterator iterator{config_.directory, ec};
    if (ec) {
        return ec;
    }

    for (const std::filesystem::directory_iterator end{}; iterator != end; iterator.increment(ec)) {
        if (ec) {
            return ec;
        }

        std::error_code type_ec;
        if (!iterator->is_regular_file(type_ec)) {
            continue;
        }

        const auto ping_id = ping_id_from_filename(iterator->path().filename().string());
        if (!ping_id) {
            continue;
        }
        out.push_back(StoredPingFile{*ping_id, iterator->path()});
    }

    return ec;
}

std::error_code JsonFilePingStore::quarantine_file(const StoredPingFile& file) const
{
    const auto destination_directory = quarantine_directory();

    std::lock_guard guard(mutation_mutex_);
    std::error_code ec;
    std::filesystem::create_directories(destination_directory, ec);
    if (ec) {
        return ec;
    }
    std::filesystem::rename(file.path, destination_directory / file.path.filename(), ec);
    return ec;
}

std::error_code JsonFilePingStore::get_all(std::vector<PingRecord>& out, PingEnumerationStats* stats) const
{
    const auto start = std::chrono::steady_clock::now();
    out.clear();
    if (stats) {
        *stats = PingEnumerationStats{};
    }

    std::vector<StoredPingFile> files;
    if (auto ec = list_ping_files(files); ec) {
        PingStoreEvent event{};
        event.operation = PingStoreOperation::Enumerate;
        event.outcome = PingStoreEventOutcome::Failed;
        event.path = config_.directory;
        event.status = make_error_code(PingStoreErrc::StorageUnavailable);
        event.cause = ec;
        emit(std::move(event));
        return make_error_code(PingStoreErrc::StorageUnavailable);
    }

    PingEnumerationStats local{};
    local.scanned_entries = files.size();
    out.reserve(files.size());

    std::string contents;
    for (const auto& file : files) {
        auto ec = read_file_contents(file.path, contents);
        if (ec == std::errc::no_such_file_or_directory) {
            // Acknowledged or pruned since the directory scan.
            continue;
        }

        PingRecord record{};
        record.id = file.id;
        bool parsed = false;
        if (!ec) {
            ec = decode_ping_document(contents, record.destination, record.payload);
            parsed = !ec;
        }

        if (parsed) {
            out.push_back(std::move(record));
            local.decoded_pings += 1U;
            continue;
        }

        PingStoreEvent event{};
        event.operation = PingStoreOperation::Enumerate;
        event.ping_id = file.id;
        event.path = file.path;
        event.status = make_error_code(PingStoreErrc::StorageReadSkipped);
        event.cause = ec;

        // Only unparseable documents are moved aside; unreadable files are left in place.
        const bool quarantine = config_.malformed_policy == MalformedPingPolicy::Quarantine
            && ec == PingStoreErrc::InvalidPing;
        if (quarantine) {
            if (auto move_ec = quarantine_file(file); !move_ec) {
                local.quarantined_files += 1U;
                event.outcome = PingStoreEventOutcome::Quarantined;
                emit(std::move(event));
                continue;
            } else {
                event.cause = move_ec;
            }
        }

        local.skipped_files += 1U;
        event.outcome = PingStoreEventOutcome::Skipped;
        emit(std::move(event));
    }

    const auto duration_ns = elapsed_ns(start);
    {
        std::lock_guard guard(telemetry_mutex_);
        telemetry_.enumerate_calls += 1U;
        telemetry_.enumerated_pings += local.decoded_pings;
        telemetry_.skipped_files += local.skipped_files;
        telemetry_.quarantined_files += local.quarantined_files;
        telemetry_.total_enumerate_duration_ns += duration_ns;
        telemetry_.last_enumerate_duration_ns = duration_ns;
    }

    std::error_code status{};
    const auto rejected = local.skipped_files + local.quarantined_files;
    if (config_.malformed_policy == MalformedPingPolicy::Report && rejected > 0U) {
        status = make_error_code(PingStoreErrc::StorageReadSkipped);
    }

    PingStoreEvent summary{};
    summary.operation = PingStoreOperation::Enumerate;
    summary.outcome = PingStoreEventOutcome::Completed;
    summary.path = config_.directory;
    summary.count = local.decoded_pings;
    summary.status = status;
    summary.duration_ns = duration_ns;
    emit(std::move(summary));

    if (stats) {
        *stats = local;
    }
    return status;
}

JsonFilePingStore::DeleteTally JsonFilePingStore::delete_ping_files(std::span<const StoredPingFile> files,
                                                                    PingStoreOperation operation) const
{
    DeleteTally tally{};
    for (const auto& file : files) {
        std::error_code ec;
        switch (remove_file_idempotent(file.path, ec)) {
        case RemoveOutcome::Removed:
            tally.removed += 1U;
            break;
        case RemoveOutcome::AlreadyAbsent: {
            tally.already_absent += 1U;
            PingStoreEvent event{};
            event.operation = operation;
            event.outcome = PingStoreEventOutcome::AlreadyAbsent;
            event.ping_id = file.id;
            event.path = file.path;
            emit(std::move(event));
            break;
        }
        case RemoveOutcome::Failed: {
            tally.failed += 1U;
            PingStoreEvent event{};
            event.operation = operation;
            event.outcome = PingStoreEventOutcome::Failed;
            event.ping_id = file.id;
            event.path = file.path;
            event.status = make_error_code(PingStoreErrc::StorageDeleteFailed);
            event.cause = ec;
            emit(std::move(event));
            break;
        }
        }
    }
    return tally;
}

std::uint64_t JsonFilePingStore::remove_stale_temp_files() const
{
    // Best effort: leftover temp names never decode as records, so a failed sweep
    // only delays reclaiming the space until the next prune.
    std::error_code ec;
    std::filesystem::directory_iterator iterator{config_.directory, ec};
    if (ec) {
        return 0U;
    }

    const auto now = std::filesystem::file_time_type::clock::now();
    std::uint64_t removed = 0U;
    for (const std::filesystem::directory_iterator end{}; iterator != end; iterator.increment(ec)) {
        if (ec) {
            break;
        }

        const auto ping_id = ping_id_from_temp_filename(iterator->path().filename().string());
        if (!ping_id) {
            continue;
        }

        std::error_code entry_ec;
        const auto modified = iterator->last_write_time(entry_ec);
        if (entry_ec || now - modified < config_.stale_temp_file_age) {
            continue;
        }
        if (remove_file_idempotent(iterator->path(), entry_ec) == RemoveOutcome::Removed) {
            removed += 1U;
        }
    }
    return removed;
}

std::error_code JsonFilePingStore::prune(std::size_t max_count, PingPruneStats* stats)
{
    const auto start = std::chrono::steady_clock::now();
    if (stats) {
        *stats = PingPruneStats{};
    }

    PingPruneStats local{};
    std::error_code status{};
    std::error_code cause{};
    {
        std::lock_guard guard(mutation_mutex_);

        local.stale_temp_files = remove_stale_temp_files();

        std::vector<StoredPingFile> files;
        cause = list_ping_files(files);
        if (cause) {
            status = make_error_code(PingStoreErrc::StorageUnavailable);
        } else {
            local.stored_pings = files.size();
            if (files.size() > max_count) {
                const auto excess = files.size() - max_count;
                std::partial_sort(files.begin(),
                                  files.begin() + static_cast<std::ptrdiff_t>(excess),
                                  files.end(),
                                  [](const StoredPingFile& lhs, const StoredPingFile& rhs) { return lhs.id < rhs.id; });
                local.candidate_pings = excess;

                const auto tally = delete_ping_files(std::span<const StoredPingFile>{files.data(), excess},
                                                     PingStoreOperation::Prune);
                local.removed_pings = tally.removed;
                local.already_absent = tally.already_absent;
                local.failed_deletes = tally.failed;
                if (tally.failed > 0U) {
                    status = make_error_code(PingStoreErrc::StorageDeleteFailed);
                }
            }
        }
    }

    const auto duration_ns = elapsed_ns(start);
    {
        std::lock_guard guard(telemetry_mutex_);
        telemetry_.prune_calls += 1U;
        telemetry_.pruned_pings += local.removed_pings;
        telemetry_.delete_failures += local.failed_deletes;
        telemetry_.total_prune_duration_ns += duration_ns;
        telemetry_.last_prune_duration_ns = duration_ns;
    }

    PingStoreEvent summary{};
    summary.operation = PingStoreOperation::Prune;
    summary.outcome = status ? PingStoreEventOutcome::Failed : PingStoreEventOutcome::Completed;
    summary.path = config_.directory;
    summary.count = local.removed_pings;
    summary.status = status;
    summary.cause = cause;
    summary.duration_ns = duration_ns;
    emit(std::move(summary));

    if (stats) {
        *stats = local;
    }
    return status;
}

std::error_code JsonFilePingStore::maybe_prune(PingPruneStats* stats)
{
    return prune(config_.max_ping_count, stats);
}

std::error_code JsonFilePingStore::acknowledge(const std::unordered_set<std::uint64_t>& ping_ids,
                                               PingAcknowledgeStats* stats)
{
    const auto start = std::chrono::steady_clock::now();
    if (stats) {
        *stats = PingAcknowledgeStats{};
    }

    std::vector<StoredPingFile> files;
    files.reserve(ping_ids.size());
    for (const auto ping_id : ping_ids) {
        files.push_back(StoredPingFile{ping_id, file_for(ping_id)});
    }

    DeleteTally tally{};
    {
        std::lock_guard guard(mutation_mutex_);
        tally = delete_ping_files(files, PingStoreOperation::Acknowledge);
    }

    PingAcknowledgeStats local{};
    local.requested_ids = ping_ids.size();
    local.removed_pings = tally.removed;
    local.already_absent = tally.already_absent;
    local.failed_deletes = tally.failed;

    const auto status = tally.failed > 0U ? make_error_code(PingStoreErrc::StorageDeleteFailed) : std::error_code{};

    const auto duration_ns = elapsed_ns(start);
    {
        std::lock_guard guard(telemetry_mutex_);
        telemetry_.acknowledge_calls += 1U;
        telemetry_.acknowledged_pings += local.removed_pings;
        telemetry_.delete_failures += local.failed_deletes;
        telemetry_.total_acknowledge_duration_ns += duration_ns;
        telemetry_.last_acknowledge_duration_ns = duration_ns;
    }

    PingStoreEvent summary{};
    summary.operation = PingStoreOperation::Acknowledge;
    summary.outcome = status ? PingStoreEventOutcome::Failed : PingStoreEventOutcome::Completed;
    summary.path = config_.directory;
    summary.count = local.removed_pings;
    summary.status = status;
    summary.duration_ns = duration_ns;
    emit(std::move(summary));

    if (stats) {
        *stats = local;
    }
    return status;
}

}  // namespace pingstore::storage
