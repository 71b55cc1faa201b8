#ifndef INCLUDE_BUFFERVAULT_CORE_CLIPBOARDMONITOR_HPP
#define INCLUDE_BUFFERVAULT_CORE_CLIPBOARDMONITOR_HPP

#include "buffervault/clipboard/IClipboard.hpp"
#include "buffervault/core/HistoryStore.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

namespace buffervault::core
{

inline constexpr std::size_t g_kBytesPerMiB{ 1024U * 1024U };

struct MonitorOptions final
{
    std::chrono::milliseconds interval{ 500 };
    std::size_t maxItemBytes{ 10U * g_kBytesPerMiB };
    std::chrono::milliseconds stopTimeout{ 2000 };
};

enum class MonitorState : std::uint8_t
{
    Stopped,
    Running,
};

// Polls the clipboard on a background thread and records every distinct, non-blank value.
// The clipboard and the store must outlive the monitor.
class ClipboardMonitor final
{
public:
    ClipboardMonitor(buffervault::clipboard::IClipboard& clipboard, HistoryStore& store, MonitorOptions options = {});

    ClipboardMonitor(const ClipboardMonitor&) = delete;
    ClipboardMonitor& operator=(const ClipboardMonitor&) = delete;
    ClipboardMonitor(ClipboardMonitor&&) = delete;
    ClipboardMonitor& operator=(ClipboardMonitor&&) = delete;
    ~ClipboardMonitor();

    // No-op when already running.
    void start();

    // Waits at most MonitorOptions::stopTimeout for the loop to exit, then detaches it.
    // Returns false when the loop was detached; it may still be using the clipboard and the store.
    bool stop();

    [[nodiscard]] MonitorState state() const;

    // One iteration of the loop without the sleep. Returns true when an entry was added.
    bool pollOnce();

    // Writes entry `index` to the clipboard so the next poll does not record it again.
    // False when the entry is missing, is not text, or the write fails.
    bool restoreToClipboard(std::size_t index);

    // Makes the next poll treat the current clipboard value as new.
    void forgetLastObserved();

private:
    struct LoopState;

    static bool pollIteration(LoopState& state, const MonitorOptions& options);
    static void runLoop(const std::shared_ptr<LoopState>& state, MonitorOptions options);

    std::shared_ptr<LoopState> m_state;
    MonitorOptions m_options;
    std::thread m_thread;
};

} // namespace buffervault::core

#endif // INCLUDE_BUFFERVAULT_CORE_CLIPBOARDMONITOR_HPP
