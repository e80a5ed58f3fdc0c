#include "pingstore/storage/ping_filename_codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace pingstore::storage {

std::string ping_filename_for(std::uint64_t ping_id)
{
    std::string name;
    name.reserve(kPingFilePrefix.size() + 20U + kPingFileExtension.size());
    name.append(kPingFilePrefix);
    name.append(std::to_string(ping_id));
    name.append(kPingFileExtension);
    return name;
}

std::string ping_temp_filename_for(std::uint64_t ping_id)
{
    std::string name{kPingTempFilePrefix};
    name.append(ping_filename_for(ping_id));
    name.append(kPingTempFileSuffix);
    return name;
}

std::optional<std::uint64_t> ping_id_from_filename(std::string_view filename) noexcept
{
    if (filename.size() <= kPingFilePrefix.size() + kPingFileExtension.size()) {
        return std::nullopt;
    }
    if (!filename.starts_with(kPingFilePrefix) || !filename.ends_with(kPingFileExtension)) {
        return std::nullopt;
    }

    const auto digits = filename.substr(kPingFilePrefix.size(),
                                        filename.size() - kPingFilePrefix.size() - kPingFileExtension.size());
    const bool all_digits = std::all_of(digits.begin(), digits.end(), [](char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    });
    if (!all_digits) {
        return std::nullopt;
    }
    if (digits.size() > 1U && digits.front() == '0') {
        return std::nullopt;
    }

    std::uint64_t ping_id = 0U;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, ping_id);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return ping_id;
}

std::optional<std::uint64_t> ping_id_from_temp_filename(std::string_view filename) noexcept
{
    if (filename.size() <= kPingTempFilePrefix.size() + kPingTempFileSuffix.size()) {
        return std::nullopt;
    }
    if (!filename.starts_with(kPingTempFilePrefix) || !filename.ends_with(kPingTempFileSuffix)) {
        return std::nullopt;
    }
    filename.remove_prefix(kPingTempFilePrefix.size());
    filename.remove_suffix(kPingTempFileSuffix.size());
    return ping_id_from_filename(filename);
}

}  // namespace pingstore::storage
