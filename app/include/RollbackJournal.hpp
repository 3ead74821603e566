#ifndef ROLLBACK_JOURNAL_HPP
#define ROLLBACK_JOURNAL_HPP

#include "ErrorCode.hpp"
#include "Types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace Json { class Value; }

/**
 * @brief File-backed record of every attempted operation.
 *
 * The journal is a JSON array rewritten in full on each mutation. Every
 * read-modify-write holds an in-process mutex and an exclusive advisory lock
 * on `<journal>.lock`, and lands through a temporary file and rename.
 * Failures are logged and returned as false; last_error() keeps the code.
 */
class RollbackJournal {
public:
    explicit RollbackJournal(std::filesystem::path journal_path,
                             std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

    // Missing or unparsable journals read as empty.
    std::vector<Operation> load() const;

    /**
     * @brief Append @p op, assigning it the next free id.
     * @return The stored operation, or std::nullopt when the journal could not be written.
     */
    std::optional<Operation> append(Operation op);

    // Replace stored entries that share an id with one of @p ops.
    bool update(const std::vector<Operation>& ops);
    bool update(const Operation& op);

    bool clear();

    // Drop entries whose timestamp is older than @p cutoff (unix seconds).
    bool prune_older_than(double cutoff);

    const std::filesystem::path& path() const { return path_; }
    std::optional<ErrorCodes::Code> last_error() const;

    static Json::Value to_json(const Operation& op);
    static std::optional<Operation> from_json(const Json::Value& value);

private:
    using Mutator = std::function<void(std::vector<Operation>&)>;

    bool rewrite(const Mutator& mutator);
    std::vector<Operation> read_entries() const;
    bool write_entries(const std::vector<Operation>& entries) const;
    void fail(ErrorCodes::Code code, const std::string& context) const;

    std::filesystem::path path_;
    std::filesystem::path lock_path_;
    std::chrono::milliseconds lock_timeout_;
    mutable std::mutex mutex_;
    mutable std::optional<ErrorCodes::Code> last_error_;
};

#endif
