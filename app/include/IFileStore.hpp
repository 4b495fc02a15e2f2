#pragma once
#include <filesystem>
#include <string>

// Whole-file byte I/O used by the runner. Implementations throw ErrorCodes::AppException.
class IFileStore {
public:
    virtual ~IFileStore() = default;
    virtual std::string read_all(const std::filesystem::path& path) = 0;
    virtual void write_all(const std::filesystem::path& path, const std::string& content) = 0;
};
