#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

std::string format_size(std::uintmax_t bytes);

// Whole seconds since the epoch; used for backup and collision names.
std::int64_t unix_timestamp();
double unix_timestamp_precise();

std::filesystem::path home_dir();

/**
 * @brief Default location for backups, the journal and logs.
 *
 * FILE_RELOCATOR_DATA_DIR wins, then $XDG_DATA_HOME/FileRelocator,
 * then ~/.local/share/FileRelocator (%APPDATA%\FileRelocator on Windows).
 */
std::filesystem::path default_data_dir();

} // namespace Utils

#endif
