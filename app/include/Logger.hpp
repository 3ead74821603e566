#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Creates and looks up the named application loggers.
 *
 * Library code never assumes the loggers exist: callers fetch them with
 * get_logger() and skip logging when it returns nullptr.
 */
class Logger {
public:
    /**
     * @brief Register core_logger and journal_logger with file and console sinks.
     * @param log_dir Directory for relocator.log; defaults to default_log_dir().
     */
    static void setup_loggers(const std::string& log_dir = "");

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string default_log_dir();
};

#endif
