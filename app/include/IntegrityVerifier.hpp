#ifndef INTEGRITY_VERIFIER_HPP
#define INTEGRITY_VERIFIER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @brief Decides whether a copied file can be trusted enough to delete its original.
 *
 * Nothing here throws: every failure is logged and reported as an empty
 * digest or a false verification result.
 */
class IntegrityVerifier {
public:
    static constexpr std::size_t kHashBlockSize = 4096;
    static constexpr std::uintmax_t kDefaultHashThreshold = 10'000'000;

    /**
     * @param hash_threshold_bytes Files smaller than this are compared by
     *        SHA-256 in addition to size; larger files by size only.
     */
    explicit IntegrityVerifier(std::uintmax_t hash_threshold_bytes = kDefaultHashThreshold);

    /**
     * @brief Stream the file through SHA-256 in fixed-size blocks.
     * @return Lowercase hex digest, or an empty string when the file cannot be read.
     */
    std::string hash(const std::filesystem::path& path) const;

    bool verify_copy(const std::filesystem::path& source,
                     const std::filesystem::path& destination) const;

    std::uintmax_t hash_threshold() const { return hash_threshold_; }

private:
    std::uintmax_t hash_threshold_;
};

#endif
