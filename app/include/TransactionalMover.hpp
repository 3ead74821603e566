#ifndef TRANSACTIONAL_MOVER_HPP
#define TRANSACTIONAL_MOVER_HPP

#include "BackupManager.hpp"
#include "IgnorePolicy.hpp"
#include "IntegrityVerifier.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>

class RollbackManager;
class Settings;

/**
 * @brief Moves one file with copy, verify and delete semantics.
 *
 * A move either commits (verified destination, source removed) or leaves the
 * source untouched and removes whatever it wrote. Filesystem failures never
 * escape as exceptions; they are reported through MoveResult::outcome.
 */
class TransactionalMover {
public:
    struct Options {
        std::uintmax_t chunk_threshold_bytes{10'000'000};
        std::size_t chunk_size_bytes{1024 * 1024};
        std::chrono::seconds copy_timeout{0};
    };

    /**
     * @param recorder Receives every attempted move; nullptr disables journaling.
     *        The mover does not own it.
     */
    explicit TransactionalMover(const Settings& settings, RollbackManager* recorder = nullptr);

    /**
     * @brief Relocate @p source to @p destination and journal the attempt.
     *
     * Ignored sources return MoveOutcome::Skipped and are not journaled. When
     * @p destination already exists the file lands at a timestamped sibling
     * name reported in MoveResult::destination.
     */
    MoveResult move(const std::filesystem::path& source,
                    const std::filesystem::path& destination);
    MoveResult move(const std::filesystem::path& source,
                    const std::filesystem::path& destination,
                    std::atomic<bool>& stop_flag);

    // Runs move() on a worker thread. The mover must outlive the returned future.
    std::future<MoveResult> move_async(std::filesystem::path source,
                                       std::filesystem::path destination);

    // Same pipeline as move() without the ignore check and without journaling.
    MoveResult relocate(const std::filesystem::path& source,
                        const std::filesystem::path& destination);
    MoveResult relocate(const std::filesystem::path& source,
                        const std::filesystem::path& destination,
                        std::atomic<bool>& stop_flag);

    /**
     * @brief First free name for @p destination.
     *
     * Returns @p destination itself when it does not exist, otherwise
     * `stem_<unix_ts>ext`, then `stem_<unix_ts>_<n>ext`.
     */
    static std::filesystem::path resolve_collision(const std::filesystem::path& destination);

    const Options& options() const { return options_; }

private:
    enum class CopyStatus { Done, Failed, Cancelled, TimedOut };

    MoveResult run(const std::filesystem::path& source,
                   const std::filesystem::path& destination,
                   std::atomic<bool>* stop_flag,
                   bool journaled);
    MoveResult transfer(const std::filesystem::path& source,
                        const std::filesystem::path& destination,
                        std::atomic<bool>* stop_flag);
    CopyStatus copy_direct(const std::filesystem::path& source,
                           const std::filesystem::path& destination) const;
    CopyStatus copy_chunked(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            std::atomic<bool>* stop_flag) const;

    IntegrityVerifier verifier_;
    BackupManager backups_;
    IgnorePolicy ignore_policy_;
    Options options_;
    RollbackManager* recorder_;
};

#endif
