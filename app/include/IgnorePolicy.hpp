#ifndef IGNORE_POLICY_HPP
#define IGNORE_POLICY_HPP

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Decides which sources must never be relocated.
 *
 * A pattern matches when it globs the file name (`*` and `?` wildcards) or
 * equals any component of the path, so "node_modules" also covers files
 * nested below such a directory. A trailing '/' in a pattern is ignored.
 */
class IgnorePolicy {
public:
    explicit IgnorePolicy(std::vector<std::string> patterns);

    bool should_ignore(const std::filesystem::path& path) const;

    static bool match_glob(const std::string& text, const std::string& pattern);

private:
    std::vector<std::string> patterns_;
};

#endif
