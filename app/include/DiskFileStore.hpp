#pragma once
#include "IFileStore.hpp"

#include <filesystem>
#include <string>

/**
 * @brief Reads and writes whole files on disk in binary mode.
 *
 * write_all() refuses files this process cannot open for writing. It creates
 * a uniquely named sibling temporary file exclusively, gives it the target's
 * owner and permissions and renames it over the target. When the owner cannot
 * be carried over, the target is rewritten in place.
 */
class DiskFileStore : public IFileStore {
public:
    std::string read_all(const std::filesystem::path& path) override;
    void write_all(const std::filesystem::path& path, const std::string& content) override;

    // A fresh sibling name on every call.
    static std::filesystem::path temporary_path_for(const std::filesystem::path& path);
};
