#include "pingstore/storage/ping_store_errors.hpp"

namespace pingstore::storage {

namespace {

class PingStoreErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "pingstore.storage";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<PingStoreErrc>(condition)) {
        case PingStoreErrc::Success:
            return "success";
        case PingStoreErrc::StorageUnavailable:
            return "ping storage directory unavailable";
        case PingStoreErrc::StorageWriteFailed:
            return "ping write failed";
        case PingStoreErrc::StorageReadSkipped:
            return "malformed ping skipped during enumeration";
        case PingStoreErrc::StorageDeleteFailed:
            return "ping delete failed";
        case PingStoreErrc::InvalidPing:
            return "invalid ping";
        case PingStoreErrc::DuplicatePing:
            return "ping id already stored";
        default:
            return "unknown ping store error";
        }
    }
};

const PingStoreErrorCategory kCategory{};

}  // namespace

const std::error_category& ping_store_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(PingStoreErrc value) noexcept
{
    return {static_cast<int>(value), ping_store_error_category()};
}

}  // namespace pingstore::storage
