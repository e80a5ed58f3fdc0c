#pragma once

#include "pingstore/storage/ping_file_io.hpp"
#include "pingstore/storage/ping_record.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace pingstore::storage {

struct PingEnumerationStats final {
    std::uint64_t scanned_entries = 0U;
    std::uint64_t decoded_pings = 0U;
    std::uint64_t skipped_files = 0U;
    std::uint64_t quarantined_files = 0U;
};

struct PingPruneStats final {
    std::uint64_t stored_pings = 0U;
    std::uint64_t candidate_pings = 0U;
    std::uint64_t removed_pings = 0U;
    std::uint64_t already_absent = 0U;
    std::uint64_t failed_deletes = 0U;
    std::uint64_t stale_temp_files = 0U;
};

struct PingAcknowledgeStats final {
    std::uint64_t requested_ids = 0U;
    std::uint64_t removed_pings = 0U;
    std::uint64_t already_absent = 0U;
    std::uint64_t failed_deletes = 0U;
};

// Durable queue of pings awaiting upload. Producers store, a maintenance task prunes
// to capacity, and the uploader reads everything back then acknowledges the ids it
// delivered.
class PingStore {
public:
    virtual ~PingStore() = default;

    // Fails with PingStoreErrc::DuplicatePing when the id is taken and mode is CreateNew.
    virtual std::error_code store(const PingRecord& ping, PublishMode mode) = 0;

    std::error_code store(const PingRecord& ping)
    {
        return store(ping, PublishMode::CreateNew);
    }

    // Records are returned in no particular order.
    virtual std::error_code get_all(std::vector<PingRecord>& out, PingEnumerationStats* stats = nullptr) const = 0;

    // Removes the records with the smallest ids until at most max_count remain.
    virtual std::error_code prune(std::size_t max_count, PingPruneStats* stats = nullptr) = 0;

    // Removes exactly the named records; unknown ids are ignored.
    virtual std::error_code acknowledge(const std::unordered_set<std::uint64_t>& ping_ids,
                                        PingAcknowledgeStats* stats = nullptr) = 0;
};

}  // namespace pingstore::storage
