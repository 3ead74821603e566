#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <system_error>

namespace TestHooks {

// Runs after a copy finishes and before it is verified.
using CopyCompletedHook = std::function<void(const std::filesystem::path& source,
                                              const std::filesystem::path& destination)>;
void set_copy_completed_hook(CopyCompletedHook hook);
void reset_copy_completed_hook();
void notify_copy_completed(const std::filesystem::path& source,
                           const std::filesystem::path& destination);

// Runs after each chunk of a chunked copy with the running byte count.
using ChunkCopiedHook = std::function<void(const std::filesystem::path& source, std::uintmax_t bytes_copied)>;
void set_chunk_copied_hook(ChunkCopiedHook hook);
void reset_chunk_copied_hook();
void notify_chunk_copied(const std::filesystem::path& source, std::uintmax_t bytes_copied);

// Replaces the removal of a verified move's source; return a non-empty error to simulate failure.
using SourceRemovalHook = std::function<std::error_code(const std::filesystem::path& source)>;
void set_source_removal_hook(SourceRemovalHook hook);
void reset_source_removal_hook();
bool has_source_removal_hook();
std::error_code run_source_removal_hook(const std::filesystem::path& source);

} // namespace TestHooks
