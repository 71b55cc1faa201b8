#include "buffervault/core/ClipboardMonitor.hpp"

#include "buffervault/LoggingCategories.hpp"
#include <QString>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <utility>

namespace buffervault::core
{

using buffervault::log::lcMonitor;

// Shared with the loop thread so a loop detached by stop() keeps its own flags after the monitor
// is gone. The clipboard and the store behind the raw pointers must still outlive that loop.
struct ClipboardMonitor::LoopState final
{
    LoopState(buffervault::clipboard::IClipboard& c, HistoryStore& s) : clipboard{ &c }, store{ &s }
    {
    }

    buffervault::clipboard::IClipboard* clipboard;
    HistoryStore* store;

    std::mutex mutex;
    std::condition_variable wake;
    bool running{ false };
    bool exited{ true };

    // Held across one read-compare-record step and across restores.
    std::mutex pollMutex;
    std::string lastObserved;
};

namespace
{

[[nodiscard]] bool isBlank(const std::string& text)
{
    return QString::fromStdString(text).trimmed().isEmpty();
}

} // namespace

ClipboardMonitor::ClipboardMonitor(buffervault::clipboard::IClipboard& clipboard, HistoryStore& store,
                                   MonitorOptions options)
    : m_state{ std::make_shared<LoopState>(clipboard, store) }, m_options{ options }
{
}

ClipboardMonitor::~ClipboardMonitor()
{
    (void)stop();
}

bool ClipboardMonitor::pollIteration(LoopState& state, const MonitorOptions& options)
{
    const std::scoped_lock pollLock{ state.pollMutex };

    std::string current{};
    try
    {
        current = state.clipboard->read();
    }
    catch (const buffervault::clipboard::ClipboardError& e)
    {
        qCWarning(lcMonitor) << "clipboard read failed:" << e.what();
        return false;
    }

    if (current == state.lastObserved)
    {
        return false;
    }

    bool added{ false };
    if (isBlank(current))
    {
        qCDebug(lcMonitor) << "ignoring blank clipboard value";
    }
    else if (current.size() > options.maxItemBytes)
    {
        qCInfo(lcMonitor) << "ignoring clipboard value of" << current.size() << "bytes, limit is"
                          << options.maxItemBytes;
    }
    else
    {
        added = state.store->addEntry(current, EntryType::Text) != nullptr;
    }

    state.lastObserved = std::move(current);
    return added;
}

void ClipboardMonitor::runLoop(const std::shared_ptr<LoopState>& state, MonitorOptions options)
{
    qCDebug(lcMonitor) << "monitor loop started";

    std::unique_lock lock{ state->mutex };
    while (state->running)
    {
        lock.unlock();
        try
        {
            (void)pollIteration(*state, options);
        }
        catch (const std::exception& e)
        {
            qCWarning(lcMonitor) << "monitor iteration failed:" << e.what();
        }
        lock.lock();

        state->wake.wait_for(lock, options.interval, [&state] { return !state->running; });
    }

    state->exited = true;
    lock.unlock();
    state->wake.notify_all();
    qCDebug(lcMonitor) << "monitor loop exited";
}

void ClipboardMonitor::start()
{
    const std::scoped_lock lock{ m_state->mutex };
    if (m_state->running)
    {
        return;
    }

    m_state->running = true;
    m_state->exited = false;
    m_thread = std::thread{ [state = m_state, options = m_options] { runLoop(state, options); } };
    qCInfo(lcMonitor) << "monitoring clipboard every" << m_options.interval.count() << "ms";
}

bool ClipboardMonitor::stop()
{
    if (!m_thread.joinable())
    {
        return true;
    }

    {
        const std::scoped_lock lock{ m_state->mutex };
        m_state->running = false;
    }
    m_state->wake.notify_all();

    bool exited{ false };
    {
        std::unique_lock lock{ m_state->mutex };
        exited = m_state->wake.wait_for(lock, m_options.stopTimeout, [this] { return m_state->exited; });
    }

    if (exited)
    {
        m_thread.join();
        qCInfo(lcMonitor) << "monitoring stopped";
        return true;
    }

    qCWarning(lcMonitor) << "monitor loop did not exit within" << m_options.stopTimeout.count()
                         << "ms, detaching it";
    m_thread.detach();

    // The detached loop keeps the old state; a later start() must not share it.
    // The loop may be stuck inside a poll, so do not block on it here.
    std::string lastObserved{};
    if (std::unique_lock pollLock{ m_state->pollMutex, std::try_to_lock }; pollLock.owns_lock())
    {
        lastObserved = m_state->lastObserved;
    }
    auto fresh{ std::make_shared<LoopState>(*m_state->clipboard, *m_state->store) };
    fresh->lastObserved = std::move(lastObserved);
    m_state = std::move(fresh);
    return false;
}

MonitorState ClipboardMonitor::state() const
{
    const std::scoped_lock lock{ m_state->mutex };
    return m_state->running ? MonitorState::Running : MonitorState::Stopped;
}

bool ClipboardMonitor::pollOnce()
{
    return pollIteration(*m_state, m_options);
}

bool ClipboardMonitor::restoreToClipboard(std::size_t index)
{
    const EntryPtr entry{ m_state->store->getEntry(index) };
    if (!entry)
    {
        qCDebug(lcMonitor) << "restore: no entry at index" << index;
        return false;
    }
    if (entry->type() != EntryType::Text)
    {
        qCDebug(lcMonitor) << "restore: entry" << index << "is not text";
        return false;
    }

    const std::scoped_lock pollLock{ m_state->pollMutex };
    try
    {
        m_state->clipboard->write(entry->content());
    }
    catch (const buffervault::clipboard::ClipboardError& e)
    {
        qCWarning(lcMonitor) << "restore: clipboard write failed:" << e.what();
        return false;
    }
    m_state->lastObserved = entry->content();
    return true;
}

void ClipboardMonitor::forgetLastObserved()
{
    const std::scoped_lock pollLock{ m_state->pollMutex };
    m_state->lastObserved.clear();
}

} // namespace buffervault::core
