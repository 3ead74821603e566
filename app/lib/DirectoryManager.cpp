#include "DirectoryManager.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <system_error>


bool DirectoryManager::ensure_directory(const std::filesystem::path& directory)
{
    if (directory.empty()) {
        return true;
    }

    std::error_code ec;
    const bool created = std::filesystem::create_directories(directory, ec);
    if (!ec) {
        if (created) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->info("Ensured directory exists: {}", Utils::path_to_utf8(directory));
            }
        }
        return true;
    }

    std::error_code dir_ec;
    if (std::filesystem::is_directory(directory, dir_ec)) {
        return true;
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("Error ensuring directory {}: {}", Utils::path_to_utf8(directory), ec.message());
    }
    return false;
}
