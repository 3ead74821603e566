#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

enum class OperationKind { Move };

inline std::string to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Move: return "move";
        default: return "unknown";
    }
}

inline std::optional<OperationKind> operation_kind_from_string(const std::string& value) {
    if (value == "move") {
        return OperationKind::Move;
    }
    return std::nullopt;
}

/**
 * @brief Final result of a single relocation attempt.
 */
enum class MoveOutcome {
    Committed,          ///< Destination verified, source removed.
    VerificationFailed, ///< Size or hash mismatch, destination removed.
    IoError,            ///< Copy, delete or directory creation failed.
    NotFound,           ///< Source missing or not a regular file.
    Cancelled,          ///< Stop flag raised during a chunked copy.
    TimedOut,           ///< Chunked copy exceeded the configured timeout.
    Skipped             ///< Source matched the ignore policy; nothing recorded.
};

inline std::string to_string(MoveOutcome outcome) {
    switch (outcome) {
        case MoveOutcome::Committed: return "committed";
        case MoveOutcome::VerificationFailed: return "verification_failed";
        case MoveOutcome::IoError: return "io_error";
        case MoveOutcome::NotFound: return "not_found";
        case MoveOutcome::Cancelled: return "cancelled";
        case MoveOutcome::TimedOut: return "timed_out";
        case MoveOutcome::Skipped: return "skipped";
        default: return "unknown";
    }
}

inline std::optional<MoveOutcome> move_outcome_from_string(const std::string& value) {
    static const std::pair<const char*, MoveOutcome> table[] = {
        {"committed", MoveOutcome::Committed},
        {"verification_failed", MoveOutcome::VerificationFailed},
        {"io_error", MoveOutcome::IoError},
        {"not_found", MoveOutcome::NotFound},
        {"cancelled", MoveOutcome::Cancelled},
        {"timed_out", MoveOutcome::TimedOut},
        {"skipped", MoveOutcome::Skipped},
    };
    for (const auto& [name, outcome] : table) {
        if (value == name) {
            return outcome;
        }
    }
    return std::nullopt;
}

// Steps a single move passes through; the last reached step is reported.
enum class MoveState {
    Pending,
    BackedUp,
    Copied,
    Verified,
    Committed,
    VerificationFailed,
    CleanedUp
};

inline std::string to_string(MoveState state) {
    switch (state) {
        case MoveState::Pending: return "Pending";
        case MoveState::BackedUp: return "BackedUp";
        case MoveState::Copied: return "Copied";
        case MoveState::Verified: return "Verified";
        case MoveState::Committed: return "Committed";
        case MoveState::VerificationFailed: return "VerificationFailed";
        case MoveState::CleanedUp: return "CleanedUp";
        default: return "Unknown";
    }
}

/**
 * @brief Position of a recorded operation in the undo/redo lifecycle.
 */
enum class OperationState {
    Active,    ///< On the undo stack.
    Undone,    ///< On the redo stack.
    Superseded ///< Dropped from redo by a newer recorded operation.
};

inline std::string to_string(OperationState state) {
    switch (state) {
        case OperationState::Active: return "active";
        case OperationState::Undone: return "undone";
        case OperationState::Superseded: return "superseded";
        default: return "unknown";
    }
}

inline std::optional<OperationState> operation_state_from_string(const std::string& value) {
    if (value == "active") return OperationState::Active;
    if (value == "undone") return OperationState::Undone;
    if (value == "superseded") return OperationState::Superseded;
    return std::nullopt;
}

struct Operation {
    std::uint64_t id{0};
    OperationKind kind{OperationKind::Move};
    std::string source_path;
    std::string destination_path;
    double timestamp{0.0};
    std::optional<std::string> backup_path;
    MoveOutcome outcome{MoveOutcome::Committed};
    OperationState state{OperationState::Active};

    bool is_committed() const { return outcome == MoveOutcome::Committed; }
};

struct MoveResult {
    MoveOutcome outcome{MoveOutcome::IoError};
    MoveState state{MoveState::Pending};
    std::string source;
    std::string destination;           ///< Final destination after collision handling.
    std::optional<std::string> backup_path;
    bool chunked{false};
    std::string detail;

    bool committed() const { return outcome == MoveOutcome::Committed; }
};

#endif
