#include "DiskFileStore.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <system_error>

#ifndef _WIN32
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {

ErrorCodes::Code code_for(const std::error_code& ec, ErrorCodes::Code fallback)
{
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorCodes::Code::FILE_NOT_FOUND;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorCodes::Code::FILE_PERMISSION_DENIED;
    }
    return fallback;
}

void remove_quietly(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

// Whether this process may open the file for writing, whatever its mode bits say.
bool is_writable(const std::filesystem::path& path)
{
    std::fstream probe(path, std::ios::in | std::ios::out | std::ios::binary);
    return probe.is_open();
}

// Fails when the path already exists, symlinks included.
std::FILE* open_exclusive(const std::filesystem::path& path)
{
#ifdef _WIN32
    return _wfopen(path.c_str(), L"wbx");
#else
    return std::fopen(path.c_str(), "wbx");
#endif
}

// False when the replacement cannot be given the original's owner and group.
bool copy_owner(const std::filesystem::path& original, const std::filesystem::path& replacement)
{
#ifdef _WIN32
    (void)original;
    (void)replacement;
    return true;
#else
    struct stat original_stat {};
    struct stat replacement_stat {};
    if (::stat(original.c_str(), &original_stat) != 0
        || ::stat(replacement.c_str(), &replacement_stat) != 0) {
        return false;
    }
    if (original_stat.st_uid == replacement_stat.st_uid
        && original_stat.st_gid == replacement_stat.st_gid) {
        return true;
    }
    return ::chown(replacement.c_str(), original_stat.st_uid, original_stat.st_gid) == 0;
#endif
}

void write_in_place(const std::filesystem::path& path, const std::string& content, const std::string& display)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, display);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, display);
    }
}

} // namespace


std::string DiskFileStore::read_all(const std::filesystem::path& path)
{
    const std::string display = Utils::path_to_utf8(path);

    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec) {
        THROW_APP_ERROR(code_for(ec, ErrorCodes::Code::FILE_OPEN_FAILED), display + ": " + ec.message());
    }
    if (!std::filesystem::is_regular_file(status)) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_PATH_INVALID, display + ": not a regular file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_OPEN_FAILED, display);
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_READ_FAILED, display);
    }
    return content;
}


void DiskFileStore::write_all(const std::filesystem::path& path, const std::string& content)
{
    const std::string display = Utils::path_to_utf8(path);

    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec) {
        THROW_APP_ERROR(code_for(ec, ErrorCodes::Code::FILE_WRITE_FAILED), display + ": " + ec.message());
    }
    if (!std::filesystem::is_regular_file(status)) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_PATH_INVALID, display + ": not a regular file");
    }
    if (!is_writable(path)) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_PERMISSION_DENIED, display + ": file is not writable");
    }

    const std::filesystem::path temporary = temporary_path_for(path);
    std::FILE* out = open_exclusive(temporary);
    if (!out) {
        const std::error_code open_ec(errno, std::generic_category());
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED,
                        display + ": cannot create temporary file: " + open_ec.message());
    }
    const bool written = std::fwrite(content.data(), 1, content.size(), out) == content.size();
    const bool closed = std::fclose(out) == 0;
    if (!written || !closed) {
        remove_quietly(temporary);
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, display);
    }

    if (!copy_owner(path, temporary)) {
        remove_quietly(temporary);
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Rewriting '{}' in place to keep its owner", display);
        }
        write_in_place(path, content, display);
        return;
    }

    // After chown, which may clear set-id bits.
    std::filesystem::permissions(temporary, status.permissions(), std::filesystem::perm_options::replace, ec);
    if (!ec) {
        std::filesystem::rename(temporary, path, ec);
    }
    if (ec) {
        remove_quietly(temporary);
        THROW_APP_ERROR(code_for(ec, ErrorCodes::Code::FILE_WRITE_FAILED), display + ": " + ec.message());
    }
}


std::filesystem::path DiskFileStore::temporary_path_for(const std::filesystem::path& path)
{
    static std::atomic<std::uint64_t> counter{0};
    const std::uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();

    std::filesystem::path temporary = path;
    temporary += "." + std::to_string(now) + "-" + std::to_string(value) + ".stw-tmp";
    return temporary;
}
