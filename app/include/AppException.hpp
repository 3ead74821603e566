#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ErrorCodes {

/**
 * @brief Setup-time failure carrying a catalogued error code.
 *
 * Relocation failures are reported through MoveResult; this is thrown only
 * where no result can be returned (configuration, journal directory, CLI
 * arguments). When the failure concerns one file or directory the path is
 * kept alongside the code so callers can report it without re-parsing the
 * context string.
 */
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(ErrorInfo(code, custom_message,
                                 ErrorCatalog::get_error_info(code).resolution, context)) {}

    static AppException at_path(Code code,
                                const std::filesystem::path& path,
                                const std::string& custom_message = "")
    {
        const std::string context = Utils::path_to_utf8(path);
        AppException ex = custom_message.empty() ? AppException(code, context)
                                                 : AppException(code, custom_message, context);
        ex.path_ = path;
        return ex;
    }

    Code get_error_code() const noexcept { return info_.code; }
    int get_error_code_int() const noexcept { return static_cast<int>(info_.code); }
    const ErrorInfo& get_error_info() const noexcept { return info_; }

    // File or directory the failure concerns, if any.
    const std::optional<std::filesystem::path>& path() const noexcept { return path_; }

    std::string get_user_message() const { return info_.get_user_message(); }
    std::string get_full_details() const { return info_.get_full_details(); }

    // Process exit status for the CLI: 2 for bad arguments, 1 otherwise.
    int exit_status() const noexcept
    {
        return info_.code == Code::VALIDATION_INVALID_INPUT ? 2 : 1;
    }

private:
    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.get_user_message()),
          info_(std::move(info)) {}

    ErrorInfo info_;
    std::optional<std::filesystem::path> path_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#define THROW_APP_ERROR_AT(code, path) \
    throw ErrorCodes::AppException::at_path(code, path)

#endif // APPEXCEPTION_HPP
