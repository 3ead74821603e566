#include "TestHooks.hpp"

#include <mutex>
#include <utility>

namespace TestHooks {

namespace {
std::mutex& hook_mutex() {
    static std::mutex mutex;
    return mutex;
}

CopyCompletedHook& copy_completed_slot() {
    static CopyCompletedHook hook;
    return hook;
}

ChunkCopiedHook& chunk_copied_slot() {
    static ChunkCopiedHook hook;
    return hook;
}

SourceRemovalHook& source_removal_slot() {
    static SourceRemovalHook hook;
    return hook;
}
}

void set_copy_completed_hook(CopyCompletedHook hook)
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    copy_completed_slot() = std::move(hook);
}

void reset_copy_completed_hook()
{
    set_copy_completed_hook({});
}

void notify_copy_completed(const std::filesystem::path& source,
                           const std::filesystem::path& destination)
{
    CopyCompletedHook hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex());
        hook = copy_completed_slot();
    }
    if (hook) {
        hook(source, destination);
    }
}

void set_chunk_copied_hook(ChunkCopiedHook hook)
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    chunk_copied_slot() = std::move(hook);
}

void reset_chunk_copied_hook()
{
    set_chunk_copied_hook({});
}

void notify_chunk_copied(const std::filesystem::path& source, std::uintmax_t bytes_copied)
{
    ChunkCopiedHook hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex());
        hook = chunk_copied_slot();
    }
    if (hook) {
        hook(source, bytes_copied);
    }
}

void set_source_removal_hook(SourceRemovalHook hook)
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    source_removal_slot() = std::move(hook);
}

void reset_source_removal_hook()
{
    set_source_removal_hook({});
}

bool has_source_removal_hook()
{
    std::lock_guard<std::mutex> lock(hook_mutex());
    return static_cast<bool>(source_removal_slot());
}

std::error_code run_source_removal_hook(const std::filesystem::path& source)
{
    SourceRemovalHook hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex());
        hook = source_removal_slot();
    }
    return hook ? hook(source) : std::error_code{};
}

} // namespace TestHooks
