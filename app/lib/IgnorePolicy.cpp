#include "IgnorePolicy.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <utility>


IgnorePolicy::IgnorePolicy(std::vector<std::string> patterns)
{
    for (auto& pattern : patterns) {
        while (!pattern.empty() && (pattern.back() == '/' || pattern.back() == '\\')) {
            pattern.pop_back();
        }
        if (pattern.starts_with("**/")) {
            pattern.erase(0, 3);
        }
        if (!pattern.empty()) {
            patterns_.push_back(std::move(pattern));
        }
    }
}


bool IgnorePolicy::should_ignore(const std::filesystem::path& path) const
{
    const std::string file_name = Utils::path_to_utf8(path.filename());
    for (const auto& pattern : patterns_) {
        if (match_glob(file_name, pattern)) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->info("Skipping ignored file: {} (matched {})", Utils::path_to_utf8(path), pattern);
            }
            return true;
        }
        const bool in_ignored_dir = std::any_of(path.begin(), path.end(), [&pattern](const auto& part) {
            return Utils::path_to_utf8(part) == pattern;
        });
        if (in_ignored_dir) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->info("Skipping file in ignored directory: {} (matched {})",
                             Utils::path_to_utf8(path), pattern);
            }
            return true;
        }
    }
    return false;
}


bool IgnorePolicy::match_glob(const std::string& text, const std::string& pattern)
{
    std::size_t t = 0;
    std::size_t p = 0;
    std::size_t star = std::string::npos;
    std::size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}
