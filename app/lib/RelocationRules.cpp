#include "RelocationRules.hpp"
#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>

namespace {
std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        part.erase(part.begin(), std::find_if(part.begin(), part.end(), not_space));
        part.erase(std::find_if(part.rbegin(), part.rend(), not_space).base(), part.end());
        if (!part.empty()) {
            out.push_back(part);
        }
    }
    return out;
}

std::optional<bool> parse_optional_bool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return std::nullopt;
}

void log_rule_error(const std::string& name, const std::string& reason) {
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("Skipping relocation rule [{}]: {}", name, reason);
    }
}
}


bool RelocationRule::matches(const std::filesystem::path& file) const
{
    const std::string ext = RelocationRules::normalize_extension(Utils::path_to_utf8(file.extension()));
    if (ext.empty()) {
        return false;
    }
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}


RelocationRules::RelocationRules(std::string rules_path)
    : file_path_(std::move(rules_path)) {}


std::string RelocationRules::normalize_extension(std::string extension)
{
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension == "." ? std::string{} : extension;
}


bool RelocationRules::load()
{
    rules_.clear();
    IniConfig config;
    if (!config.load(file_path_)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("No relocation rules at '{}'", file_path_);
        }
        return false;
    }

    for (const auto& section : config.sections()) {
        RelocationRule rule;
        rule.name = section;
        for (const auto& ext : split_csv(config.getValue(section, "extensions"))) {
            const std::string normalized = normalize_extension(ext);
            if (!normalized.empty()) {
                rule.extensions.push_back(normalized);
            }
        }
        if (rule.extensions.empty()) {
            log_rule_error(section, "no extensions");
            continue;
        }
        const std::string target = config.getValue(section, "target_dir");
        if (target.empty()) {
            log_rule_error(section, "missing target_dir");
            continue;
        }
        rule.target_dir = Utils::utf8_to_path(target);
        if (config.hasValue(section, "preserve_path")) {
            rule.preserve_path = parse_optional_bool(config.getValue(section, "preserve_path"));
            if (!rule.preserve_path) {
                log_rule_error(section, "preserve_path must be true or false");
                continue;
            }
        }
        rules_[section] = std::move(rule);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded {} relocation rule(s) from '{}'", rules_.size(), file_path_);
    }
    return true;
}


std::vector<std::string> RelocationRules::list_names() const
{
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& entry : rules_) {
        names.push_back(entry.first);
    }
    return names;
}


std::optional<RelocationRule> RelocationRules::get(const std::string& name) const
{
    if (auto it = rules_.find(name); it != rules_.end()) {
        return it->second;
    }
    return std::nullopt;
}


std::optional<std::filesystem::path> RelocationRules::destination_for(
    const std::filesystem::path& file, const std::filesystem::path& base_dir) const
{
    for (const auto& [name, rule] : rules_) {
        if (!rule.matches(file)) {
            continue;
        }
        const std::filesystem::path target = rule.target_dir.is_absolute()
            ? rule.target_dir
            : base_dir / rule.target_dir;
        if (rule.preserve_path.value_or(false)) {
            const auto relative = file.lexically_relative(base_dir);
            if (!relative.empty() && *relative.begin() != "..") {
                return target / relative;
            }
        }
        return target / file.filename();
    }
    return std::nullopt;
}
