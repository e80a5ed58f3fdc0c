#include "pingstore/tools/ping_store_log_formatter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

[[nodiscard]] nlohmann::json describe_error(const std::error_code& ec)
{
    if (!ec) {
        return nullptr;
    }
    return nlohmann::json{
        {"category", ec.category().name()},
        {"value", ec.value()},
        {"message", ec.message()},
    };
}

}  // namespace

namespace pingstore::tools {

std::string format_ping_store_event_json(const pingstore::storage::PingStoreEvent& event)
{
    nlohmann::json line = nlohmann::json::object();
    line["operation"] = std::string{pingstore::storage::ping_store_operation_name(event.operation)};
    line["outcome"] = std::string{pingstore::storage::ping_store_outcome_name(event.outcome)};
    if (event.ping_id) {
        line["ping_id"] = *event.ping_id;
    } else {
        line["ping_id"] = nullptr;
    }
    line["path"] = event.path.string();
    line["count"] = event.count;
    line["duration_ns"] = event.duration_ns;
    line["status"] = describe_error(event.status);
    line["cause"] = describe_error(event.cause);

    const auto timestamp = format_timestamp_iso(event.timestamp);
    if (timestamp.empty()) {
        line["timestamp"] = nullptr;
    } else {
        line["timestamp"] = timestamp;
    }

    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace pingstore::tools
