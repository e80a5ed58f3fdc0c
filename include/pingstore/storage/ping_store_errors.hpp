#pragma once

#include <system_error>

namespace pingstore::storage {

enum class PingStoreErrc {
    Success = 0,
    StorageUnavailable,
    StorageWriteFailed,
    StorageReadSkipped,
    StorageDeleteFailed,
    InvalidPing,
    DuplicatePing
};

const std::error_category& ping_store_error_category() noexcept;
std::error_code make_error_code(PingStoreErrc value) noexcept;

}  // namespace pingstore::storage

namespace std {

template <>
struct is_error_code_enum<pingstore::storage::PingStoreErrc> : true_type {
};

}  // namespace std
