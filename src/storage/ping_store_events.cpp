#include "pingstore/storage/ping_store_events.hpp"

namespace pingstore::storage {

std::string_view ping_store_operation_name(PingStoreOperation operation) noexcept
{
    switch (operation) {
    case PingStoreOperation::Store:
        return "store";
    case PingStoreOperation::Enumerate:
        return "enumerate";
    case PingStoreOperation::Prune:
        return "prune";
    case PingStoreOperation::Acknowledge:
        return "acknowledge";
    default:
        return "unknown";
    }
}

std::string_view ping_store_outcome_name(PingStoreEventOutcome outcome) noexcept
{
    switch (outcome) {
    case PingStoreEventOutcome::Completed:
        return "completed";
    case PingStoreEventOutcome::Failed:
        return "failed";
    case PingStoreEventOutcome::Skipped:
        return "skipped";
    case PingStoreEventOutcome::Quarantined:
        return "quarantined";
    case PingStoreEventOutcome::AlreadyAbsent:
        return "already_absent";
    default:
        return "unknown";
    }
}

}  // namespace pingstore::storage
