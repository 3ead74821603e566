#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

const std::vector<std::string>& logger_names() {
    static const std::vector<std::string> names = {"core_logger", "journal_logger"};
    return names;
}
}


std::string Logger::default_log_dir()
{
    if (const char* override_dir = std::getenv("FILE_RELOCATOR_LOG_DIR")) {
        return override_dir;
    }
    return Utils::path_to_utf8(Utils::default_data_dir() / "logs");
}


void Logger::setup_loggers(const std::string& log_dir)
{
    const std::filesystem::path dir = Utils::utf8_to_path(log_dir.empty() ? default_log_dir() : log_dir);
    std::filesystem::create_directories(dir);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        Utils::path_to_utf8(dir / "relocator.log"), kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_level(spdlog::level::debug);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    for (const auto& name : logger_names()) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{file_sink, console_sink});
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
