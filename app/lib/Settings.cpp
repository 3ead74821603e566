#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <sstream>
#include <cctype>
#include <utility>


namespace {
constexpr const char* kAppName = "FileRelocator";
constexpr const char* kRelocationSection = "Relocation";
constexpr const char* kRollbackSection = "Rollback";
constexpr const char* kSafetySection = "Safety";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

int parse_int_or(const std::string& value, int fallback) {
    if (value.empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        settings_log(spdlog::level::warn, "Invalid integer '{}' in config; using {}", value, fallback);
        return fallback;
    }
}

std::uintmax_t parse_size_or(const std::string& value, std::uintmax_t fallback) {
    if (value.empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || value.front() == '-') {
            throw std::invalid_argument(value);
        }
        return static_cast<std::uintmax_t>(parsed);
    } catch (const std::exception&) {
        settings_log(spdlog::level::warn, "Invalid size '{}' in config; using {}", value, fallback);
        return fallback;
    }
}

bool parse_bool_or(std::string value, bool fallback) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return fallback;
}

std::vector<std::string> parse_list(const std::string& value) {
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), not_space));
        item.erase(std::find_if(item.rbegin(), item.rend(), not_space).base(), item.end());
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string join_list(const std::vector<std::string>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << items[i];
    }
    return oss.str();
}

std::string bool_to_string(bool value) {
    return value ? "true" : "false";
}
}


Settings::Settings(std::string config_dir_override)
    : data_dir(Utils::default_data_dir()),
      ignore_patterns(default_ignore_patterns())
{
    if (config_dir_override.empty()) {
        config_path = define_config_path();
    } else {
        config_path = Utils::path_to_utf8(Utils::utf8_to_path(config_dir_override) / "config.ini");
    }
    config_dir = Utils::utf8_to_path(config_path).parent_path();

    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        settings_log(spdlog::level::err, "Error creating configuration directory '{}': {}",
                     Utils::path_to_utf8(config_dir), ec.message());
    }
}


std::string Settings::define_config_path() const
{
    if (const char* override_root = std::getenv("FILE_RELOCATOR_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return Utils::path_to_utf8(base / kAppName / "config.ini");
    }
#ifdef _WIN32
    if (const char* app_data = std::getenv("APPDATA")) {
        return std::string(app_data) + "\\" + kAppName + "\\config.ini";
    }
#else
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        return Utils::path_to_utf8(std::filesystem::path(xdg_config) / kAppName / "config.ini");
    }
#endif
    return Utils::path_to_utf8(Utils::home_dir() / ".config" / kAppName / "config.ini");
}


std::vector<std::string> Settings::default_ignore_patterns()
{
    return {
        ".git", ".svn", ".hg", "__pycache__", "node_modules", ".cache",
        ".DS_Store", "Thumbs.db", "desktop.ini",
        "*.tmp", "*.temp", "*.swp", "*.swo", "*.part", "*.bak"
    };
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        settings_log(spdlog::level::info, "No config at '{}'; using defaults", config_path);
        return false;
    }

    const std::string data_dir_value = config.getValue(kRelocationSection, "data_dir");
    if (!data_dir_value.empty()) {
        data_dir = Utils::utf8_to_path(data_dir_value);
    }
    const std::string journal_value = config.getValue(kRelocationSection, "journal_path");
    if (!journal_value.empty()) {
        journal_path = Utils::utf8_to_path(journal_value);
    }
    chunk_threshold_bytes = parse_size_or(config.getValue(kRelocationSection, "chunk_threshold_bytes"),
                                          chunk_threshold_bytes);
    chunk_size_bytes = static_cast<std::size_t>(
        parse_size_or(config.getValue(kRelocationSection, "chunk_size_bytes"), chunk_size_bytes));
    hash_threshold_bytes = parse_size_or(config.getValue(kRelocationSection, "hash_threshold_bytes"),
                                         hash_threshold_bytes);
    copy_timeout_seconds = parse_int_or(config.getValue(kRelocationSection, "copy_timeout_seconds"),
                                        copy_timeout_seconds);
    backups_enabled = parse_bool_or(config.getValue(kRelocationSection, "backups_enabled"), backups_enabled);

    undo_max_retries = parse_int_or(config.getValue(kRollbackSection, "undo_max_retries"), undo_max_retries);
    retry_delay_ms = parse_int_or(config.getValue(kRollbackSection, "retry_delay_ms"), retry_delay_ms);
    journal_retention_days = parse_int_or(config.getValue(kRollbackSection, "journal_retention_days"),
                                          journal_retention_days);
    backup_retention_days = parse_int_or(config.getValue(kRollbackSection, "backup_retention_days"),
                                         backup_retention_days);

    if (config.hasValue(kSafetySection, "ignore_patterns")) {
        ignore_patterns = parse_list(config.getValue(kSafetySection, "ignore_patterns"));
    }

    validate();
    settings_log(spdlog::level::debug, "Loaded settings from '{}'", config_path);
    return true;
}


void Settings::validate() const
{
    if (chunk_size_bytes == 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "chunk_size_bytes must be greater than zero", config_path);
    }
    if (copy_timeout_seconds < 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "copy_timeout_seconds must not be negative", config_path);
    }
    if (undo_max_retries < 1) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "undo_max_retries must be at least 1", config_path);
    }
    if (retry_delay_ms < 0 || journal_retention_days < 0 || backup_retention_days < 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "retry delay and retention periods must not be negative", config_path);
    }
}


bool Settings::save()
{
    config.setValue(kRelocationSection, "data_dir", Utils::path_to_utf8(data_dir));
    config.setValue(kRelocationSection, "journal_path", Utils::path_to_utf8(journal_path));
    config.setValue(kRelocationSection, "chunk_threshold_bytes", std::to_string(chunk_threshold_bytes));
    config.setValue(kRelocationSection, "chunk_size_bytes", std::to_string(chunk_size_bytes));
    config.setValue(kRelocationSection, "hash_threshold_bytes", std::to_string(hash_threshold_bytes));
    config.setValue(kRelocationSection, "copy_timeout_seconds", std::to_string(copy_timeout_seconds));
    config.setValue(kRelocationSection, "backups_enabled", bool_to_string(backups_enabled));

    config.setValue(kRollbackSection, "undo_max_retries", std::to_string(undo_max_retries));
    config.setValue(kRollbackSection, "retry_delay_ms", std::to_string(retry_delay_ms));
    config.setValue(kRollbackSection, "journal_retention_days", std::to_string(journal_retention_days));
    config.setValue(kRollbackSection, "backup_retention_days", std::to_string(backup_retention_days));

    config.setValue(kSafetySection, "ignore_patterns", join_list(ignore_patterns));

    return config.save(config_path);
}


std::filesystem::path Settings::get_data_dir() const
{
    return data_dir;
}

void Settings::set_data_dir(const std::filesystem::path& path)
{
    data_dir = path;
}

std::filesystem::path Settings::get_backup_dir() const
{
    return data_dir / "backup" / "file_backups";
}

std::filesystem::path Settings::get_journal_path() const
{
    if (!journal_path.empty()) {
        return journal_path;
    }
    return data_dir / "rollback.json";
}

void Settings::set_journal_path(const std::filesystem::path& path)
{
    journal_path = path;
}

std::uintmax_t Settings::get_chunk_threshold_bytes() const
{
    return chunk_threshold_bytes;
}

void Settings::set_chunk_threshold_bytes(std::uintmax_t value)
{
    chunk_threshold_bytes = value;
}

std::size_t Settings::get_chunk_size_bytes() const
{
    return chunk_size_bytes;
}

void Settings::set_chunk_size_bytes(std::size_t value)
{
    chunk_size_bytes = value;
}

std::uintmax_t Settings::get_hash_threshold_bytes() const
{
    return hash_threshold_bytes;
}

void Settings::set_hash_threshold_bytes(std::uintmax_t value)
{
    hash_threshold_bytes = value;
}

int Settings::get_copy_timeout_seconds() const
{
    return copy_timeout_seconds;
}

void Settings::set_copy_timeout_seconds(int value)
{
    copy_timeout_seconds = value;
}

bool Settings::get_backups_enabled() const
{
    return backups_enabled;
}

void Settings::set_backups_enabled(bool value)
{
    backups_enabled = value;
}

int Settings::get_undo_max_retries() const
{
    return undo_max_retries;
}

void Settings::set_undo_max_retries(int value)
{
    undo_max_retries = value;
}

int Settings::get_retry_delay_ms() const
{
    return retry_delay_ms;
}

void Settings::set_retry_delay_ms(int value)
{
    retry_delay_ms = value;
}

int Settings::get_journal_retention_days() const
{
    return journal_retention_days;
}

void Settings::set_journal_retention_days(int value)
{
    journal_retention_days = value;
}

int Settings::get_backup_retention_days() const
{
    return backup_retention_days;
}

void Settings::set_backup_retention_days(int value)
{
    backup_retention_days = value;
}

std::vector<std::string> Settings::get_ignore_patterns() const
{
    return ignore_patterns;
}

void Settings::set_ignore_patterns(std::vector<std::string> patterns)
{
    ignore_patterns = std::move(patterns);
}

std::string Settings::get_config_path() const
{
    return config_path;
}

std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}

std::string Settings::get_rules_path() const
{
    return Utils::path_to_utf8(config_dir / "rules.ini");
}
