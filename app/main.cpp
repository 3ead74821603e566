#include "AppException.hpp"
#include "Logger.hpp"
#include "RelocationRules.hpp"
#include "RollbackJournal.hpp"
#include "RollbackManager.hpp"
#include "Settings.hpp"
#include "TransactionalMover.hpp"
#include "Utils.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

namespace fs = std::filesystem;

struct ParsedArguments {
    std::string config_dir;
    std::vector<std::string> positional;
    std::optional<int> days;
    bool help{false};
};

void print_usage()
{
    std::cout <<
        "Usage:\n"
        "  file_relocator [--config-dir <dir>] move <source> <destination>\n"
        "  file_relocator [--config-dir <dir>] sort <directory>\n"
        "  file_relocator [--config-dir <dir>] rollback last|list|redo|clear|cleanup [--days N]\n";
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            parsed.help = true;
            continue;
        }
        if (std::strcmp(argv[i], "--config-dir") == 0) {
            if (i + 1 >= argc) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                    "--config-dir requires a directory", "");
            }
            parsed.config_dir = argv[++i];
            continue;
        }
        if (std::strcmp(argv[i], "--days") == 0) {
            if (i + 1 >= argc) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                    "--days requires a number", "");
            }
            const std::string value = argv[++i];
            try {
                parsed.days = std::stoi(value);
            } catch (const std::exception&) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                    "--days expects a number", value);
            }
            if (*parsed.days < 0) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                                    "--days must not be negative", value);
            }
            continue;
        }
        parsed.positional.emplace_back(argv[i]);
    }
    return parsed;
}

bool report(const MoveResult& result)
{
    if (result.committed()) {
        std::cout << "Moved " << result.source << " -> " << result.destination << "\n";
        return true;
    }
    if (result.outcome == MoveOutcome::Skipped) {
        std::cout << "Skipped ignored file " << result.source << "\n";
        return true;
    }
    std::cerr << "Failed to move " << result.source << ": " << to_string(result.outcome);
    if (!result.detail.empty()) {
        std::cerr << " (" << result.detail << ")";
    }
    std::cerr << "\n";
    return false;
}

int run_move(TransactionalMover& mover, const std::vector<std::string>& args)
{
    if (args.size() != 3) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            "move expects a source and a destination", "");
    }
    const fs::path source = Utils::utf8_to_path(args[1]);
    fs::path destination = Utils::utf8_to_path(args[2]);
    std::error_code ec;
    if (fs::is_directory(destination, ec)) {
        destination /= source.filename();
    }
    return report(mover.move(source, destination)) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run_sort(TransactionalMover& mover, const Settings& settings, const std::vector<std::string>& args)
{
    if (args.size() != 2) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT, "sort expects a directory", "");
    }
    const fs::path base_dir = Utils::utf8_to_path(args[1]);
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        THROW_APP_ERROR_AT(ErrorCodes::Code::PATH_INVALID, base_dir);
    }

    RelocationRules rules(settings.get_rules_path());
    if (!rules.load() || rules.empty()) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_LOAD_FAILED,
                            "No usable relocation rules", settings.get_rules_path());
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(base_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw ErrorCodes::AppException::at_path(ErrorCodes::Code::FILE_IO_FAILED, base_dir,
                                                "Cannot list directory");
    }

    int moved = 0;
    int failed = 0;
    for (const auto& file : files) {
        const auto destination = rules.destination_for(file, base_dir);
        if (!destination) {
            continue;
        }
        const MoveResult result = mover.move(file, *destination);
        if (result.committed()) {
            ++moved;
        }
        if (!report(result)) {
            ++failed;
        }
    }
    std::cout << "Sorted " << moved << " file(s), " << failed << " failure(s)\n";
    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

void print_operations(const std::vector<Operation>& ops)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "    ";
    for (const auto& op : ops) {
        std::cout << Json::writeString(writer, RollbackJournal::to_json(op)) << "\n";
    }
}

int run_rollback(RollbackManager& rollback, const Settings& settings, const ParsedArguments& parsed)
{
    const auto& args = parsed.positional;
    if (args.size() != 2) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            "rollback expects last, list, redo, clear or cleanup", "");
    }
    const std::string& action = args[1];

    if (action == "last") {
        if (rollback.undo_last_operation()) {
            std::cout << "Undid the last operation\n";
            return EXIT_SUCCESS;
        }
        std::cerr << "Nothing was undone\n";
        return EXIT_FAILURE;
    }
    if (action == "redo") {
        if (rollback.redo_last_undone()) {
            std::cout << "Redid the last undone operation\n";
            return EXIT_SUCCESS;
        }
        std::cerr << "Nothing was redone\n";
        return EXIT_FAILURE;
    }
    if (action == "list") {
        const auto ops = rollback.journal().load();
        if (ops.empty()) {
            std::cout << "No rollback operations recorded.\n";
        } else {
            print_operations(ops);
        }
        return EXIT_SUCCESS;
    }
    if (action == "clear") {
        if (rollback.clear()) {
            std::cout << "Rollback history cleared\n";
            return EXIT_SUCCESS;
        }
        std::cerr << "Failed to clear rollback history\n";
        return EXIT_FAILURE;
    }
    if (action == "cleanup") {
        const int journal_days = parsed.days.value_or(settings.get_journal_retention_days());
        const int backup_days = parsed.days.value_or(settings.get_backup_retention_days());
        const bool pruned = rollback.cleanup_old_entries(std::chrono::hours(24 * journal_days));
        BackupManager backups(settings.get_backup_dir(), settings.get_backups_enabled());
        const std::size_t removed = backups.prune_expired(std::chrono::hours(24 * backup_days));
        std::cout << "Removed " << removed << " expired backup(s)\n";
        return pruned ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT, "Unknown rollback action", action);
}

int run_application(int argc, char** argv)
{
    const ParsedArguments parsed = parse_command_line(argc, argv);
    if (parsed.help) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (parsed.positional.empty()) {
        print_usage();
        return ErrorCodes::AppException(ErrorCodes::Code::VALIDATION_INVALID_INPUT).exit_status();
    }

    Settings settings(parsed.config_dir);
    settings.load();

    RollbackManager rollback(settings);
    TransactionalMover mover(settings, &rollback);

    const std::string& command = parsed.positional.front();
    if (command == "move") {
        return run_move(mover, parsed.positional);
    }
    if (command == "sort") {
        return run_sort(mover, settings, parsed.positional);
    }
    if (command == "rollback") {
        return run_rollback(rollback, settings, parsed);
    }

    THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT, "Unknown command", command);
}

} // namespace


int main(int argc, char **argv) {
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    try {
        return run_application(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        std::cerr << ex.get_full_details() << "\n";
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.get_full_details());
        }
        return ex.exit_status();
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
