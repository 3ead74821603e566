#ifndef ROLLBACK_MANAGER_HPP
#define ROLLBACK_MANAGER_HPP

#include "RollbackJournal.hpp"
#include "TransactionalMover.hpp"
#include "Types.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class Settings;

/**
 * @brief Undo and redo stacks over the rollback journal.
 *
 * The constructor rebuilds both stacks from the journal: committed, active
 * entries form the undo stack in journal order, committed, undone entries
 * form the redo stack with the most recently undone on top. Entries that
 * never committed stay in the journal for auditing and are never replayed.
 *
 * Undo and redo replay moves through an internal TransactionalMover that does
 * not journal, so a replay never shows up as a new operation.
 */
class RollbackManager {
public:
    /**
     * @throws ErrorCodes::AppException when the journal directory cannot be created.
     */
    explicit RollbackManager(const Settings& settings);
    ~RollbackManager();

    RollbackManager(const RollbackManager&) = delete;
    RollbackManager& operator=(const RollbackManager&) = delete;

    /**
     * @brief Journal an attempted operation. Performs no filesystem action.
     *
     * The new entry goes on the undo stack; the redo stack is cleared and its
     * entries are marked superseded. Returns false, leaving both stacks
     * untouched, when the entry could not be journaled.
     */
    bool record_operation(OperationKind kind,
                          const std::string& source,
                          const std::string& destination,
                          std::optional<std::string> backup = std::nullopt,
                          MoveOutcome outcome = MoveOutcome::Committed);

    bool undo_last_operation();
    bool redo_last_undone();

    // Empties both stacks and the journal. Safe to call repeatedly.
    bool clear();

    // Drops journal entries older than @p retention and rebuilds the stacks.
    bool cleanup_old_entries(std::chrono::seconds retention);

    // Undo stack, oldest first.
    std::vector<Operation> operations() const;
    // Redo stack, most recently undone last.
    std::vector<Operation> undone_operations() const;

    void close();
    bool closed() const;

    const RollbackJournal& journal() const { return journal_; }

private:
    void rebuild_stacks();
    MoveResult replay(const std::filesystem::path& from, const std::filesystem::path& to);

    RollbackJournal journal_;
    TransactionalMover replayer_;
    int max_retries_;
    std::chrono::milliseconds retry_delay_;

    mutable std::mutex mutex_;
    std::vector<Operation> undo_stack_;
    std::vector<Operation> redo_stack_;
    bool closed_{false};
};

#endif
