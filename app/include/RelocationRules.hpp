#ifndef RELOCATION_RULES_HPP
#define RELOCATION_RULES_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct RelocationRule {
    std::string name;
    std::vector<std::string> extensions;   ///< Lowercase, with a leading dot.
    std::filesystem::path target_dir;      ///< Absolute, or relative to the sorted directory.
    std::optional<bool> preserve_path;

    bool matches(const std::filesystem::path& file) const;
};

/**
 * @brief Extension-to-directory rules read from rules.ini, one section per rule.
 *
 * Rules are validated once at load time; a section without extensions or
 * without a target_dir is logged and skipped.
 */
class RelocationRules {
public:
    explicit RelocationRules(std::string rules_path);

    bool load();

    std::vector<std::string> list_names() const;
    std::optional<RelocationRule> get(const std::string& name) const;
    bool empty() const { return rules_.empty(); }
    std::size_t size() const { return rules_.size(); }

    /**
     * @brief Destination for @p file when sorting @p base_dir.
     * @return std::nullopt when no rule claims the file's extension.
     *
     * Rules are consulted in name order and the first match wins.
     */
    std::optional<std::filesystem::path> destination_for(const std::filesystem::path& file,
                                                         const std::filesystem::path& base_dir) const;

    const std::string& path() const { return file_path_; }

    static std::string normalize_extension(std::string extension);

private:
    std::string file_path_;
    std::map<std::string, RelocationRule> rules_;
};

#endif
