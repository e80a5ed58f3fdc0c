#include "pingstore/storage/ping_document_codec.hpp"

#include "pingstore/storage/ping_store_errors.hpp"

#include <utility>

namespace pingstore::storage {

namespace {

bool resolve_payload(const nlohmann::json& field, nlohmann::json& payload)
{
    if (field.is_object()) {
        payload = field;
        return true;
    }
    if (!field.is_string()) {
        return false;
    }

    auto nested = nlohmann::json::parse(field.get_ref<const std::string&>(), nullptr, false);
    if (nested.is_discarded() || !nested.is_object()) {
        return false;
    }
    payload = std::move(nested);
    return true;
}

}  // namespace

std::error_code encode_ping_document(std::string_view destination,
                                     const nlohmann::json& payload,
                                     std::string& out)
{
    if (destination.empty() || !payload.is_object()) {
        return make_error_code(PingStoreErrc::InvalidPing);
    }

    nlohmann::json document = nlohmann::json::object();
    document[kPingDestinationKey] = std::string{destination};
    document[kPingPayloadKey] = payload;

    try {
        out = document.dump();
    } catch (const nlohmann::json::exception&) {
        // Strings that are not valid UTF-8 cannot be serialised.
        return make_error_code(PingStoreErrc::InvalidPing);
    }
    return {};
}

std::error_code decode_ping_document(std::string_view text,
                                     std::string& destination,
                                     nlohmann::json& payload)
{
    const auto document = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return make_error_code(PingStoreErrc::InvalidPing);
    }

    const auto destination_it = document.find(kPingDestinationKey);
    if (destination_it == document.end() || !destination_it->is_string()) {
        return make_error_code(PingStoreErrc::InvalidPing);
    }
    const auto& destination_value = destination_it->get_ref<const std::string&>();
    if (destination_value.empty()) {
        return make_error_code(PingStoreErrc::InvalidPing);
    }

    const auto payload_it = document.find(kPingPayloadKey);
    if (payload_it == document.end()) {
        return make_error_code(PingStoreErrc::InvalidPing);
    }

    nlohmann::json resolved;
    if (!resolve_payload(*payload_it, resolved)) {
        return make_error_code(PingStoreErrc::InvalidPing);
    }

    destination = destination_value;
    payload = std::move(resolved);
    return {};
}

}  // namespace pingstore::storage
