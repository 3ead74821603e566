#include "TransactionalMover.hpp"
#include "DirectoryManager.hpp"
#include "Logger.hpp"
#include "RollbackManager.hpp"
#include "Settings.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {
template <typename... Args>
void mover_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

void remove_quietly(const fs::path& path)
{
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        mover_log(spdlog::level::warn, "Failed to remove {}: {}", Utils::path_to_utf8(path), ec.message());
    }
}

fs::path with_suffix(const fs::path& destination, const std::string& suffix)
{
    const std::string name = Utils::path_to_utf8(destination.stem()) + suffix +
                             Utils::path_to_utf8(destination.extension());
    return destination.parent_path() / Utils::utf8_to_path(name);
}

bool path_taken(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

// `<dest>.part`, or `<dest>.<n>.part` when an unrelated file already holds that name.
fs::path part_path_for(const fs::path& destination)
{
    const std::string base = Utils::path_to_utf8(destination);
    fs::path candidate = Utils::utf8_to_path(base + ".part");
    for (int counter = 1; path_taken(candidate); ++counter) {
        candidate = Utils::utf8_to_path(base + "." + std::to_string(counter) + ".part");
    }
    return candidate;
}
}


TransactionalMover::TransactionalMover(const Settings& settings, RollbackManager* recorder)
    : verifier_(settings.get_hash_threshold_bytes()),
      backups_(settings.get_backup_dir(), settings.get_backups_enabled()),
      ignore_policy_(settings.get_ignore_patterns()),
      recorder_(recorder)
{
    options_.chunk_threshold_bytes = settings.get_chunk_threshold_bytes();
    options_.chunk_size_bytes = settings.get_chunk_size_bytes();
    options_.copy_timeout = std::chrono::seconds(settings.get_copy_timeout_seconds());
}


fs::path TransactionalMover::resolve_collision(const fs::path& destination)
{
    if (!path_taken(destination)) {
        return destination;
    }
    const std::string stamp = "_" + std::to_string(Utils::unix_timestamp());
    fs::path candidate = with_suffix(destination, stamp);
    for (int counter = 1; path_taken(candidate); ++counter) {
        candidate = with_suffix(destination, stamp + "_" + std::to_string(counter));
    }
    return candidate;
}


MoveResult TransactionalMover::move(const fs::path& source, const fs::path& destination)
{
    return run(source, destination, nullptr, true);
}


MoveResult TransactionalMover::move(const fs::path& source,
                                    const fs::path& destination,
                                    std::atomic<bool>& stop_flag)
{
    return run(source, destination, &stop_flag, true);
}


std::future<MoveResult> TransactionalMover::move_async(fs::path source, fs::path destination)
{
    return std::async(std::launch::async,
                      [this, source = std::move(source), destination = std::move(destination)]() {
                          return move(source, destination);
                      });
}


MoveResult TransactionalMover::relocate(const fs::path& source, const fs::path& destination)
{
    return run(source, destination, nullptr, false);
}


MoveResult TransactionalMover::relocate(const fs::path& source,
                                        const fs::path& destination,
                                        std::atomic<bool>& stop_flag)
{
    return run(source, destination, &stop_flag, false);
}


MoveResult TransactionalMover::run(const fs::path& source,
                                   const fs::path& destination,
                                   std::atomic<bool>* stop_flag,
                                   bool journaled)
{
    if (journaled && ignore_policy_.should_ignore(source)) {
        MoveResult skipped;
        skipped.outcome = MoveOutcome::Skipped;
        skipped.source = Utils::path_to_utf8(source);
        skipped.destination = Utils::path_to_utf8(destination);
        return skipped;
    }

    MoveResult result = transfer(source, destination, stop_flag);

    if (journaled && recorder_ &&
        !recorder_->record_operation(OperationKind::Move, result.source, result.destination,
                                     result.backup_path, result.outcome)) {
        mover_log(spdlog::level::err, "Move {} -> {} ({}) is missing from the rollback journal",
                  result.source, result.destination, to_string(result.outcome));
    }
    return result;
}


MoveResult TransactionalMover::transfer(const fs::path& source,
                                        const fs::path& destination,
                                        std::atomic<bool>* stop_flag)
{
    MoveResult result;
    result.source = Utils::path_to_utf8(source);
    result.destination = Utils::path_to_utf8(destination);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        result.outcome = MoveOutcome::NotFound;
        result.detail = "source missing or not a regular file";
        mover_log(spdlog::level::warn, "Source file does not exist: {}", result.source);
        return result;
    }
    const std::uintmax_t source_size = fs::file_size(source, ec);
    if (ec) {
        result.outcome = MoveOutcome::IoError;
        result.detail = ec.message();
        mover_log(spdlog::level::err, "Cannot stat {}: {}", result.source, ec.message());
        return result;
    }

    if (auto backup = backups_.create_backup(source)) {
        result.backup_path = Utils::path_to_utf8(*backup);
    } else if (backups_.enabled()) {
        mover_log(spdlog::level::warn, "Continuing without a backup of {}", result.source);
    }
    result.state = MoveState::BackedUp;

    if (destination.has_parent_path() && !DirectoryManager::ensure_directory(destination.parent_path())) {
        result.outcome = MoveOutcome::IoError;
        result.detail = "cannot create destination directory";
        return result;
    }

    const fs::path target = resolve_collision(destination);
    if (target != destination) {
        mover_log(spdlog::level::info, "Destination {} exists; using {}",
                  result.destination, Utils::path_to_utf8(target));
    }
    result.destination = Utils::path_to_utf8(target);

    result.chunked = source_size >= options_.chunk_threshold_bytes;
    const CopyStatus status = result.chunked ? copy_chunked(source, target, stop_flag)
                                             : copy_direct(source, target);
    switch (status) {
        case CopyStatus::Done:
            break;
        case CopyStatus::Cancelled:
            result.outcome = MoveOutcome::Cancelled;
            result.detail = "copy cancelled";
            return result;
        case CopyStatus::TimedOut:
            result.outcome = MoveOutcome::TimedOut;
            result.detail = "copy timed out";
            return result;
        case CopyStatus::Failed:
        default:
            result.outcome = MoveOutcome::IoError;
            result.detail = "copy failed";
            return result;
    }
    result.state = MoveState::Copied;
    TestHooks::notify_copy_completed(source, target);

    if (!verifier_.verify_copy(source, target)) {
        result.state = MoveState::VerificationFailed;
        mover_log(spdlog::level::err, "Verification failed for {} -> {}; removing destination",
                  result.source, result.destination);
        remove_quietly(target);
        result.state = MoveState::CleanedUp;
        result.outcome = MoveOutcome::VerificationFailed;
        result.detail = "destination does not match source";
        return result;
    }
    result.state = MoveState::Verified;

    std::error_code remove_ec;
    if (TestHooks::has_source_removal_hook()) {
        remove_ec = TestHooks::run_source_removal_hook(source);
    } else {
        fs::remove(source, remove_ec);
    }
    if (remove_ec) {
        mover_log(spdlog::level::err, "Failed to remove source {} after copy: {}; removing destination",
                  result.source, remove_ec.message());
        remove_quietly(target);
        result.state = MoveState::CleanedUp;
        result.outcome = MoveOutcome::IoError;
        result.detail = remove_ec.message();
        return result;
    }

    result.state = MoveState::Committed;
    result.outcome = MoveOutcome::Committed;
    mover_log(spdlog::level::info, "Moved {} -> {}{}", result.source, result.destination,
              result.chunked ? " (chunked)" : "");
    return result;
}


TransactionalMover::CopyStatus TransactionalMover::copy_direct(const fs::path& source,
                                                               const fs::path& destination) const
{
    std::error_code ec;
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if (ec) {
        mover_log(spdlog::level::err, "Error copying {} to {}: {}",
                  Utils::path_to_utf8(source), Utils::path_to_utf8(destination), ec.message());
        std::error_code exists_ec;
        if (ec != std::errc::file_exists && fs::exists(destination, exists_ec)) {
            remove_quietly(destination);
        }
        return CopyStatus::Failed;
    }
    return CopyStatus::Done;
}


TransactionalMover::CopyStatus TransactionalMover::copy_chunked(const fs::path& source,
                                                                const fs::path& destination,
                                                                std::atomic<bool>* stop_flag) const
{
    const std::string source_str = Utils::path_to_utf8(source);
    const fs::path part_path = part_path_for(destination);

    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        mover_log(spdlog::level::err, "Cannot open {} for reading", source_str);
        return CopyStatus::Failed;
    }

    CopyStatus status = CopyStatus::Done;
    {
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            mover_log(spdlog::level::err, "Cannot open {} for writing", Utils::path_to_utf8(part_path));
            return CopyStatus::Failed;
        }

        const auto started = std::chrono::steady_clock::now();
        std::vector<char> buffer(options_.chunk_size_bytes);
        std::uintmax_t copied = 0;
        while (in) {
            if (stop_flag && stop_flag->load()) {
                status = CopyStatus::Cancelled;
                break;
            }
            if (options_.copy_timeout.count() > 0 &&
                std::chrono::steady_clock::now() - started > options_.copy_timeout) {
                status = CopyStatus::TimedOut;
                break;
            }
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize count = in.gcount();
            if (count > 0) {
                out.write(buffer.data(), count);
                if (!out) {
                    status = CopyStatus::Failed;
                    break;
                }
                copied += static_cast<std::uintmax_t>(count);
                TestHooks::notify_chunk_copied(source, copied);
            }
            std::this_thread::yield();
        }
        if (status == CopyStatus::Done && in.bad()) {
            status = CopyStatus::Failed;
        }
        out.flush();
        if (status == CopyStatus::Done && !out) {
            status = CopyStatus::Failed;
        }
    }

    if (status != CopyStatus::Done) {
        switch (status) {
            case CopyStatus::Cancelled:
                mover_log(spdlog::level::warn, "Chunked copy of {} cancelled", source_str);
                break;
            case CopyStatus::TimedOut:
                mover_log(spdlog::level::err, "Chunked copy of {} exceeded {}s", source_str,
                          options_.copy_timeout.count());
                break;
            default:
                mover_log(spdlog::level::err, "Chunked copy of {} failed", source_str);
                break;
        }
        remove_quietly(part_path);
        return status;
    }

    std::error_code ec;
    fs::rename(part_path, destination, ec);
    if (ec) {
        mover_log(spdlog::level::err, "Failed to finalize {}: {}",
                  Utils::path_to_utf8(destination), ec.message());
        remove_quietly(part_path);
        return CopyStatus::Failed;
    }
    return CopyStatus::Done;
}
