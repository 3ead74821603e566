#include "BackupManager.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;


BackupManager::BackupManager(fs::path backup_dir, bool enabled)
    : backup_dir_(std::move(backup_dir)),
      enabled_(enabled)
{
}


fs::path BackupManager::backup_path_for(const fs::path& backup_dir,
                                        const fs::path& file,
                                        std::int64_t timestamp,
                                        int counter)
{
    std::string name = Utils::path_to_utf8(file.filename()) + "." + std::to_string(timestamp);
    if (counter > 0) {
        name += "_" + std::to_string(counter);
    }
    return backup_dir / Utils::utf8_to_path(name + ".bak");
}


std::optional<fs::path> BackupManager::create_backup(const fs::path& file) const
{
    if (!enabled_) {
        return std::nullopt;
    }

    auto logger = Logger::get_logger("core_logger");
    const std::string file_str = Utils::path_to_utf8(file);

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        if (logger) {
            logger->warn("Cannot backup nonexistent file: {}", file_str);
        }
        return std::nullopt;
    }

    fs::create_directories(backup_dir_, ec);
    if (ec) {
        if (logger) {
            logger->error("Failed to create backup directory {}: {}",
                          Utils::path_to_utf8(backup_dir_), ec.message());
        }
        return std::nullopt;
    }

    const std::int64_t timestamp = Utils::unix_timestamp();
    fs::path backup_path;
    for (int counter = 0;; ++counter) {
        backup_path = backup_path_for(backup_dir_, file, timestamp, counter);
        ec.clear();
        fs::copy_file(file, backup_path, fs::copy_options::none, ec);
        if (ec != std::errc::file_exists) {
            break;
        }
    }
    if (ec) {
        if (logger) {
            logger->error("Failed to create backup of {}: {}", file_str, ec.message());
        }
        std::error_code cleanup_ec;
        fs::remove(backup_path, cleanup_ec);
        return std::nullopt;
    }

    if (logger) {
        logger->info("Created backup of {} at {}", file_str, Utils::path_to_utf8(backup_path));
    }
    return backup_path;
}


std::size_t BackupManager::prune_expired(std::chrono::seconds retention) const
{
    std::error_code ec;
    if (!fs::is_directory(backup_dir_, ec)) {
        return 0;
    }

    auto logger = Logger::get_logger("core_logger");
    const auto cutoff = fs::file_time_type::clock::now() - retention;
    std::size_t removed = 0;

    for (fs::directory_iterator it(backup_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        const auto modified = it->last_write_time(entry_ec);
        if (entry_ec || modified >= cutoff) {
            continue;
        }
        if (fs::remove(it->path(), entry_ec)) {
            ++removed;
            if (logger) {
                logger->info("Deleted expired backup: {}", Utils::path_to_utf8(it->path()));
            }
        } else if (entry_ec && logger) {
            logger->error("Error deleting backup {}: {}", Utils::path_to_utf8(it->path()), entry_ec.message());
        }
    }
    if (ec && logger) {
        logger->warn("Error while scanning backups in {}: {}", Utils::path_to_utf8(backup_dir_), ec.message());
    }
    return removed;
}
