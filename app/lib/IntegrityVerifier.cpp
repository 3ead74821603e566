#include "IntegrityVerifier.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <thread>
#include <system_error>

namespace {
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string hex_encode(const unsigned char* data, unsigned int length)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

void log_error(const std::string& message)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("{}", message);
    }
}
}


IntegrityVerifier::IntegrityVerifier(std::uintmax_t hash_threshold_bytes)
    : hash_threshold_(hash_threshold_bytes)
{
}


std::string IntegrityVerifier::hash(const std::filesystem::path& path) const
{
    const std::string path_str = Utils::path_to_utf8(path);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        log_error("Error calculating hash for " + path_str + ": cannot open file");
        return {};
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        log_error("Error calculating hash for " + path_str + ": digest initialization failed");
        return {};
    }

    std::array<char, kHashBlockSize> block{};
    while (file) {
        file.read(block.data(), static_cast<std::streamsize>(block.size()));
        const std::streamsize count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), block.data(), static_cast<std::size_t>(count)) != 1) {
            log_error("Error calculating hash for " + path_str + ": digest update failed");
            return {};
        }
        std::this_thread::yield();
    }
    if (file.bad()) {
        log_error("Error calculating hash for " + path_str + ": read failed");
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        log_error("Error calculating hash for " + path_str + ": digest finalization failed");
        return {};
    }
    return hex_encode(digest, digest_length);
}


bool IntegrityVerifier::verify_copy(const std::filesystem::path& source,
                                    const std::filesystem::path& destination) const
{
    const std::string source_str = Utils::path_to_utf8(source);
    const std::string destination_str = Utils::path_to_utf8(destination);

    std::error_code ec;
    if (!std::filesystem::exists(destination, ec)) {
        log_error("Destination file does not exist: " + destination_str);
        return false;
    }

    const auto source_size = std::filesystem::file_size(source, ec);
    if (ec) {
        log_error("Error verifying file copy " + source_str + " -> " + destination_str + ": " + ec.message());
        return false;
    }
    const auto destination_size = std::filesystem::file_size(destination, ec);
    if (ec) {
        log_error("Error verifying file copy " + source_str + " -> " + destination_str + ": " + ec.message());
        return false;
    }

    if (source_size != destination_size) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("File size mismatch: {} ({} bytes) -> {} ({} bytes)",
                          source_str, source_size, destination_str, destination_size);
        }
        return false;
    }

    if (source_size < hash_threshold_) {
        const std::string source_hash = hash(source);
        const std::string destination_hash = hash(destination);
        if (source_hash.empty() || destination_hash.empty() || source_hash != destination_hash) {
            log_error("File hash mismatch: " + source_str + " -> " + destination_str);
            return false;
        }
    } else if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Skipping hash comparison for {} ({}); sizes match",
                      source_str, Utils::format_size(source_size));
    }

    return true;
}
