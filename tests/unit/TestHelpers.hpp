/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, file helpers).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    static void set_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
        _putenv_s(key.c_str(), value.c_str());
#else
        setenv(key.c_str(), value.c_str(), 1);
#endif
    }

    static void unset_env(const std::string& key) {
#ifdef _WIN32
        _putenv_s(key.c_str(), "");
#else
        unsetenv(key.c_str());
#endif
    }

    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            set_env(key_, *value);
        } else {
            unset_env(key_);
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("stw-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write raw bytes to a file, creating parent directories as needed.
 */
inline void write_bytes(const std::filesystem::path& path, std::string_view bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

/**
 * @brief Read a whole file as raw bytes.
 */
inline std::string read_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
