#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>


class Settings
{
public:
    /**
     * @param config_dir Directory holding config.ini and rules.ini. When empty,
     *        define_config_path() picks the platform location.
     */
    explicit Settings(std::string config_dir = "");

    bool load();
    bool save();

    std::filesystem::path get_data_dir() const;
    void set_data_dir(const std::filesystem::path& path);

    std::filesystem::path get_backup_dir() const;
    std::filesystem::path get_journal_path() const;
    void set_journal_path(const std::filesystem::path& path);

    std::uintmax_t get_chunk_threshold_bytes() const;
    void set_chunk_threshold_bytes(std::uintmax_t value);

    std::size_t get_chunk_size_bytes() const;
    void set_chunk_size_bytes(std::size_t value);

    std::uintmax_t get_hash_threshold_bytes() const;
    void set_hash_threshold_bytes(std::uintmax_t value);

    int get_copy_timeout_seconds() const;
    void set_copy_timeout_seconds(int value);

    bool get_backups_enabled() const;
    void set_backups_enabled(bool value);

    int get_undo_max_retries() const;
    void set_undo_max_retries(int value);

    int get_retry_delay_ms() const;
    void set_retry_delay_ms(int value);

    int get_journal_retention_days() const;
    void set_journal_retention_days(int value);

    int get_backup_retention_days() const;
    void set_backup_retention_days(int value);

    std::vector<std::string> get_ignore_patterns() const;
    void set_ignore_patterns(std::vector<std::string> patterns);

    std::string get_config_path() const;
    std::string get_config_dir() const;
    std::string get_rules_path() const;

    static std::vector<std::string> default_ignore_patterns();

private:
    std::string define_config_path() const;
    void validate() const;

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::filesystem::path data_dir;
    std::filesystem::path journal_path;
    std::uintmax_t chunk_threshold_bytes{10'000'000};
    std::size_t chunk_size_bytes{1024 * 1024};
    std::uintmax_t hash_threshold_bytes{10'000'000};
    int copy_timeout_seconds{0};
    bool backups_enabled{true};
    int undo_max_retries{3};
    int retry_delay_ms{1000};
    int journal_retention_days{7};
    int backup_retention_days{7};
    std::vector<std::string> ignore_patterns;
};

#endif
