/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, file fixtures).
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <iterator>
#include <sstream>

#include "Settings.hpp"

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

    /**
     * @brief Restore the original environment variable state.
     */
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
    /**
     * @brief Create a unique temporary directory.
     */
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("relocator-test-")) {
        std::filesystem::create_directories(path_);
    }

    /**
     * @brief Remove the temporary directory and its contents.
     */
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    /**
     * @brief Return the temporary directory path.
     * @return Reference to the directory path.
     */
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write @p content to @p path, creating parent directories.
 */
inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/**
 * @brief Write @p size bytes of a repeating pattern to @p path.
 */
inline void write_patterned_file(const std::filesystem::path& path, std::size_t size) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::vector<char> block(64 * 1024);
    for (std::size_t i = 0; i < block.size(); ++i) {
        block[i] = static_cast<char>('a' + (i % 23));
    }
    std::size_t remaining = size;
    while (remaining > 0) {
        const std::size_t count = std::min(remaining, block.size());
        out.write(block.data(), static_cast<std::streamsize>(count));
        remaining -= count;
    }
}

/**
 * @brief Read the whole file at @p path; empty when it cannot be opened.
 */
inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

/**
 * @brief Settings rooted inside @p root: config in root/config, data in root/data.
 *
 * Undo retries run without a delay so failure paths stay fast.
 */
inline Settings make_test_settings(const std::filesystem::path& root) {
    Settings settings((root / "config").string());
    settings.set_data_dir(root / "data");
    settings.set_retry_delay_ms(0);
    return settings;
}
