#include "Utils.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace Utils {

namespace {
constexpr const char* kAppDirName = "FileRelocator";

std::string env_or_empty(const char* key)
{
    const char* value = std::getenv(key);
    return value ? std::string(value) : std::string();
}
}


std::string path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
#else
    return path.string();
#endif
}


std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
#else
    return std::filesystem::path(value);
#endif
}


std::string format_size(std::uintmax_t bytes)
{
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " " << units[unit];
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    }
    return oss.str();
}


std::int64_t unix_timestamp()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}


double unix_timestamp_precise()
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}


std::filesystem::path home_dir()
{
#ifdef _WIN32
    const std::string profile = env_or_empty("USERPROFILE");
    if (!profile.empty()) {
        return utf8_to_path(profile);
    }
#else
    const std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        return utf8_to_path(home);
    }
#endif
    return std::filesystem::current_path();
}


std::filesystem::path default_data_dir()
{
    const std::string override_dir = env_or_empty("FILE_RELOCATOR_DATA_DIR");
    if (!override_dir.empty()) {
        return utf8_to_path(override_dir);
    }
#ifdef _WIN32
    const std::string app_data = env_or_empty("APPDATA");
    if (!app_data.empty()) {
        return utf8_to_path(app_data) / kAppDirName;
    }
#else
    const std::string xdg_data = env_or_empty("XDG_DATA_HOME");
    if (!xdg_data.empty()) {
        return utf8_to_path(xdg_data) / kAppDirName;
    }
#endif
    return home_dir() / ".local" / "share" / kAppDirName;
}

} // namespace Utils
