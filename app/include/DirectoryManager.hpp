#ifndef DIRECTORY_MANAGER_HPP
#define DIRECTORY_MANAGER_HPP

#include <filesystem>

class DirectoryManager {
public:
    // Recursive and idempotent; a directory created by a racing caller counts as success.
    static bool ensure_directory(const std::filesystem::path& directory);
};

#endif
