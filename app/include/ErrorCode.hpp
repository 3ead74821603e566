#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Numbered error codes grouped by subsystem.
enum class Code {
    UNKNOWN_ERROR = 0,

    // File System (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_IO_FAILED = 1201,
    FILE_COPY_FAILED = 1202,
    FILE_DELETE_FAILED = 1203,
    FILE_VERIFICATION_FAILED = 1204,
    FILE_BACKUP_FAILED = 1205,
    DIRECTORY_CREATE_FAILED = 1206,
    PATH_INVALID = 1207,

    // Journal (1300-1399)
    JOURNAL_LOCK_FAILED = 1300,
    JOURNAL_WRITE_FAILED = 1301,
    JOURNAL_PARSE_FAILED = 1302,
    JOURNAL_READ_FAILED = 1303,

    // Configuration (1500-1599)
    CONFIG_INVALID = 1500,
    CONFIG_LOAD_FAILED = 1501,
    CONFIG_SAVE_FAILED = 1502,
    CONFIG_INVALID_VALUE = 1503,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,

    // System (1700-1799)
    SYSTEM_INIT_FAILED = 1700
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const {
        if (resolution.empty()) {
            return message;
        }
        return message + "\n\n" + resolution;
    }

    // Code, message, resolution and technical context
    std::string get_full_details() const {
        std::string details = "Error " + std::to_string(static_cast<int>(code)) + ": " + message;
        if (!resolution.empty()) {
            details += "\nResolution: " + resolution;
        }
        if (!context.empty()) {
            details += "\nDetails: " + context;
        }
        return details;
    }
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "") {
        switch (code) {
            case Code::FILE_NOT_FOUND:
                return {code, "The file could not be found.",
                        "Check that the path exists and was not moved by another program.", context};
            case Code::FILE_IO_FAILED:
                return {code, "A file could not be read or written.",
                        "Check file permissions and available disk space.", context};
            case Code::FILE_COPY_FAILED:
                return {code, "The file could not be copied.",
                        "Check that the destination is writable and has enough free space.", context};
            case Code::FILE_DELETE_FAILED:
                return {code, "The file could not be removed.",
                        "Check that the file is not open in another program.", context};
            case Code::FILE_VERIFICATION_FAILED:
                return {code, "The copied file does not match the original.",
                        "The original was left in place. Retry the move or check the destination storage.", context};
            case Code::FILE_BACKUP_FAILED:
                return {code, "A backup copy could not be created.",
                        "Check that the data directory is writable.", context};
            case Code::DIRECTORY_CREATE_FAILED:
                return {code, "A directory could not be created.",
                        "Check permissions on the parent directory.", context};
            case Code::PATH_INVALID:
                return {code, "Invalid path.",
                        "Provide an existing, accessible path.", context};
            case Code::JOURNAL_LOCK_FAILED:
                return {code, "The rollback journal could not be locked.",
                        "Make sure no other instance is stuck holding the journal.", context};
            case Code::JOURNAL_WRITE_FAILED:
                return {code, "The rollback journal could not be written.",
                        "Check that the data directory is writable.", context};
            case Code::JOURNAL_PARSE_FAILED:
                return {code, "The rollback journal is not valid JSON.",
                        "The journal will be rewritten on the next recorded operation.", context};
            case Code::JOURNAL_READ_FAILED:
                return {code, "The rollback journal could not be read.",
                        "Check permissions on the data directory.", context};
            case Code::CONFIG_INVALID:
                return {code, "The configuration is invalid.",
                        "Review config.ini and fix the reported entry.", context};
            case Code::CONFIG_LOAD_FAILED:
                return {code, "The configuration could not be loaded.",
                        "Check that config.ini exists and is readable.", context};
            case Code::CONFIG_SAVE_FAILED:
                return {code, "The configuration could not be saved.",
                        "Check that the configuration directory is writable.", context};
            case Code::CONFIG_INVALID_VALUE:
                return {code, "A configuration value is out of range.",
                        "Review config.ini and fix the reported value.", context};
            case Code::VALIDATION_INVALID_INPUT:
                return {code, "Invalid input.",
                        "Run with --help to see the expected arguments.", context};
            case Code::SYSTEM_INIT_FAILED:
                return {code, "Initialization failed.",
                        "Check the log file for details.", context};
            case Code::UNKNOWN_ERROR:
            default:
                return {code, "An unknown error occurred.", "", context};
        }
    }
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
