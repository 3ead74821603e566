#ifndef BACKUP_MANAGER_HPP
#define BACKUP_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>

class BackupManager {
public:
    explicit BackupManager(std::filesystem::path backup_dir, bool enabled = true);

    /**
     * @brief Copy @p file to `<backup_dir>/<name>.<unix_ts>.bak` without replacing an existing backup.
     * @return The backup path, or std::nullopt when backups are disabled or the copy failed.
     *
     * Failure is logged and never thrown; callers continue without a safety net.
     */
    std::optional<std::filesystem::path> create_backup(const std::filesystem::path& file) const;

    // Removes backups whose modification time is older than @p retention.
    std::size_t prune_expired(std::chrono::seconds retention) const;

    const std::filesystem::path& backup_dir() const { return backup_dir_; }
    bool enabled() const { return enabled_; }

    // `<name>.<timestamp>.bak`, or `<name>.<timestamp>_<counter>.bak` when counter > 0.
    static std::filesystem::path backup_path_for(const std::filesystem::path& backup_dir,
                                                 const std::filesystem::path& file,
                                                 std::int64_t timestamp,
                                                 int counter = 0);

private:
    std::filesystem::path backup_dir_;
    bool enabled_;
};

#endif
