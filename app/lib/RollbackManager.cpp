#include "RollbackManager.hpp"
#include "AppException.hpp"
#include "DirectoryManager.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {
std::shared_ptr<spdlog::logger> rollback_logger()
{
    return Logger::get_logger("journal_logger");
}

bool retryable(MoveOutcome outcome)
{
    return outcome == MoveOutcome::IoError || outcome == MoveOutcome::VerificationFailed;
}
}


RollbackManager::RollbackManager(const Settings& settings)
    : journal_(settings.get_journal_path()),
      replayer_(settings, nullptr),
      max_retries_(std::max(1, settings.get_undo_max_retries())),
      retry_delay_(std::max(0, settings.get_retry_delay_ms()))
{
    const fs::path journal_dir = journal_.path().parent_path();
    if (!DirectoryManager::ensure_directory(journal_dir)) {
        THROW_APP_ERROR_AT(ErrorCodes::Code::DIRECTORY_CREATE_FAILED, journal_dir);
    }

    std::lock_guard<std::mutex> guard(mutex_);
    rebuild_stacks();
    if (auto logger = rollback_logger()) {
        logger->debug("Rollback journal {} loaded: {} undoable, {} redoable",
                      Utils::path_to_utf8(journal_.path()), undo_stack_.size(), redo_stack_.size());
    }
}


RollbackManager::~RollbackManager()
{
    close();
}


void RollbackManager::rebuild_stacks()
{
    undo_stack_.clear();
    redo_stack_.clear();
    for (const auto& op : journal_.load()) {
        if (!op.is_committed()) {
            continue;
        }
        if (op.state == OperationState::Active) {
            undo_stack_.push_back(op);
        } else if (op.state == OperationState::Undone) {
            redo_stack_.push_back(op);
        }
    }
    std::reverse(redo_stack_.begin(), redo_stack_.end());
}


bool RollbackManager::record_operation(OperationKind kind,
                                       const std::string& source,
                                       const std::string& destination,
                                       std::optional<std::string> backup,
                                       MoveOutcome outcome)
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto logger = rollback_logger();
    if (closed_) {
        if (logger) {
            logger->warn("Rollback manager is closed; not recording {} -> {}", source, destination);
        }
        return false;
    }

    Operation op;
    op.kind = kind;
    op.source_path = source;
    op.destination_path = destination;
    op.timestamp = Utils::unix_timestamp_precise();
    op.backup_path = std::move(backup);
    op.outcome = outcome;
    op.state = OperationState::Active;

    auto stored = journal_.append(op);
    if (!stored) {
        if (logger) {
            logger->error("Failed to journal {} -> {}; the operation cannot be undone", source, destination);
        }
        return false;
    }

    if (!redo_stack_.empty()) {
        for (auto& undone : redo_stack_) {
            undone.state = OperationState::Superseded;
        }
        if (!journal_.update(redo_stack_) && logger) {
            logger->error("Failed to mark {} undone operation(s) as superseded", redo_stack_.size());
        }
        redo_stack_.clear();
    }

    if (logger) {
        logger->info("Recorded {} #{}: {} -> {} ({})", to_string(stored->kind), stored->id,
                     stored->source_path, stored->destination_path, to_string(stored->outcome));
    }
    undo_stack_.push_back(std::move(*stored));
    return true;
}


MoveResult RollbackManager::replay(const fs::path& from, const fs::path& to)
{
    MoveResult result;
    for (int attempt = 1; attempt <= max_retries_; ++attempt) {
        result = replayer_.relocate(from, to);
        if (result.committed() || !retryable(result.outcome)) {
            break;
        }
        if (auto logger = rollback_logger()) {
            logger->warn("Attempt {} of {} to move {} back failed: {}", attempt, max_retries_,
                         Utils::path_to_utf8(from), result.detail);
        }
        if (attempt < max_retries_ && retry_delay_.count() > 0) {
            std::this_thread::sleep_for(retry_delay_);
        }
    }
    return result;
}


bool RollbackManager::undo_last_operation()
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto logger = rollback_logger();
    if (closed_) {
        return false;
    }

    while (!undo_stack_.empty() && !undo_stack_.back().is_committed()) {
        if (logger) {
            logger->debug("Skipping operation #{} ({}); nothing to reverse",
                          undo_stack_.back().id, to_string(undo_stack_.back().outcome));
        }
        undo_stack_.pop_back();
    }
    if (undo_stack_.empty()) {
        if (logger) {
            logger->info("No operations to undo");
        }
        return false;
    }

    Operation op = undo_stack_.back();
    undo_stack_.pop_back();

    const MoveResult result = replay(Utils::utf8_to_path(op.destination_path),
                                     Utils::utf8_to_path(op.source_path));
    if (!result.committed()) {
        if (logger) {
            logger->error("Failed to undo operation #{} ({} -> {}): {}", op.id, op.destination_path,
                          op.source_path, to_string(result.outcome));
        }
        undo_stack_.push_back(std::move(op));
        return false;
    }

    op.source_path = result.destination;
    op.state = OperationState::Undone;
    if (!journal_.update(op) && logger) {
        logger->error("Undo of operation #{} succeeded but the journal was not updated", op.id);
    }
    if (logger) {
        logger->info("Undid operation #{}: {} restored", op.id, op.source_path);
    }
    redo_stack_.push_back(std::move(op));
    return true;
}


bool RollbackManager::redo_last_undone()
{
    std::lock_guard<std::mutex> guard(mutex_);
    auto logger = rollback_logger();
    if (closed_) {
        return false;
    }
    if (redo_stack_.empty()) {
        if (logger) {
            logger->info("No operations to redo");
        }
        return false;
    }

    Operation op = redo_stack_.back();
    redo_stack_.pop_back();

    const MoveResult result = replayer_.relocate(Utils::utf8_to_path(op.source_path),
                                                 Utils::utf8_to_path(op.destination_path));
    if (!result.committed()) {
        if (logger) {
            logger->error("Failed to redo operation #{} ({} -> {}): {}", op.id, op.source_path,
                          op.destination_path, to_string(result.outcome));
        }
        redo_stack_.push_back(std::move(op));
        return false;
    }

    op.destination_path = result.destination;
    op.state = OperationState::Active;
    if (!journal_.update(op) && logger) {
        logger->error("Redo of operation #{} succeeded but the journal was not updated", op.id);
    }
    if (logger) {
        logger->info("Redid operation #{}: {} -> {}", op.id, op.source_path, op.destination_path);
    }
    undo_stack_.push_back(std::move(op));
    return true;
}


bool RollbackManager::clear()
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_) {
        return false;
    }
    undo_stack_.clear();
    redo_stack_.clear();
    return journal_.clear();
}


bool RollbackManager::cleanup_old_entries(std::chrono::seconds retention)
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_) {
        return false;
    }
    const double cutoff = Utils::unix_timestamp_precise() - static_cast<double>(retention.count());
    const bool pruned = journal_.prune_older_than(cutoff);
    rebuild_stacks();
    return pruned;
}


std::vector<Operation> RollbackManager::operations() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return undo_stack_;
}


std::vector<Operation> RollbackManager::undone_operations() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return redo_stack_;
}


void RollbackManager::close()
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    undo_stack_.clear();
    redo_stack_.clear();
    if (auto logger = rollback_logger()) {
        logger->debug("Closed rollback journal {}", Utils::path_to_utf8(journal_.path()));
    }
}


bool RollbackManager::closed() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return closed_;
}
