#include "pingstore/storage/ping_file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <limits>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace pingstore::storage {

namespace {

std::error_code last_errno()
{
    return std::error_code(errno, std::generic_category());
}

void discard_temp(const std::filesystem::path& temp_path)
{
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
}

std::error_code write_all(int fd, std::string_view contents)
{
    std::size_t total_written = 0U;
    std::size_t remaining = contents.size();
    while (remaining > 0U) {
        const auto chunk = std::min<std::size_t>(remaining, static_cast<std::size_t>(std::numeric_limits<ssize_t>::max()));
        const ssize_t write_count = ::write(fd, contents.data() + total_written, chunk);
        if (write_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_errno();
        }
        total_written += static_cast<std::size_t>(write_count);
        remaining -= static_cast<std::size_t>(write_count);
    }
    return {};
}

std::error_code write_temp_file(const AtomicWriteRequest& request)
{
    const auto path_native = request.temp_path.native();
    const int fd = ::open(path_native.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return last_errno();
    }

    auto status = write_all(fd, request.contents);
    if (!status && request.sync && ::fsync(fd) != 0) {
        status = last_errno();
    }

    if (::close(fd) != 0 && !status) {
        status = last_errno();
    }
    return status;
}

bool link_unsupported(int error)
{
    return error == EPERM || error == ENOTSUP || error == EOPNOTSUPP || error == EXDEV || error == ENOSYS;
}

std::error_code publish_create_new(const AtomicWriteRequest& request)
{
    const auto temp_native = request.temp_path.native();
    const auto target_native = request.target_path.native();

    if (::link(temp_native.c_str(), target_native.c_str()) == 0) {
        // The record is already published; a leftover temp name never decodes as a record.
        discard_temp(request.temp_path);
        return {};
    }

    const int link_error = errno;
    if (!link_unsupported(link_error)) {
        return std::error_code(link_error, std::generic_category());
    }

    std::error_code ec;
    if (std::filesystem::exists(request.target_path, ec)) {
        return std::make_error_code(std::errc::file_exists);
    }
    if (ec) {
        return ec;
    }
    if (::rename(temp_native.c_str(), target_native.c_str()) != 0) {
        return last_errno();
    }
    return {};
}

std::error_code publish_replace(const AtomicWriteRequest& request)
{
    if (::rename(request.temp_path.native().c_str(), request.target_path.native().c_str()) != 0) {
        return last_errno();
    }
    return {};
}

}  // namespace

std::error_code write_file_atomically(const AtomicWriteRequest& request)
{
    if (request.temp_path.empty() || request.target_path.empty() || request.temp_path == request.target_path) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (auto ec = write_temp_file(request); ec) {
        discard_temp(request.temp_path);
        return ec;
    }

    const auto ec = request.mode == PublishMode::Replace ? publish_replace(request) : publish_create_new(request);
    if (ec) {
        discard_temp(request.temp_path);
    }
    return ec;
}

std::error_code read_file_contents(const std::filesystem::path& path, std::string& out)
{
    out.clear();

    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) && !ec) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return std::make_error_code(std::errc::io_error);
    }

    out.assign(std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{});
    if (stream.bad()) {
        out.clear();
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

RemoveOutcome remove_file_idempotent(const std::filesystem::path& path, std::error_code& ec)
{
    ec.clear();
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            ec.clear();
            return RemoveOutcome::AlreadyAbsent;
        }
        return RemoveOutcome::Failed;
    }
    return removed ? RemoveOutcome::Removed : RemoveOutcome::AlreadyAbsent;
}

}  // namespace pingstore::storage
