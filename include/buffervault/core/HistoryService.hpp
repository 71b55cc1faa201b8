#ifndef INCLUDE_BUFFERVAULT_CORE_HISTORYSERVICE_HPP
#define INCLUDE_BUFFERVAULT_CORE_HISTORYSERVICE_HPP

#include "buffervault/core/ClipboardMonitor.hpp"
#include "buffervault/core/HistoryStore.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace buffervault::core
{

enum class InspectError : std::uint8_t
{
    NotFound,
    NotSealed,
    StorageError,
    AuthFailed,
};

template <class T> using InspectResult = std::variant<T, InspectError>;

// Query and restore entry points shared by every front end.
class HistoryService final
{
public:
    // `monitor` may be null for one-shot use; restores then fail. `maxHistoryItems` 0 means no cap.
    HistoryService(HistoryStore& store, ClipboardMonitor* monitor, std::size_t maxHistoryItems);

    [[nodiscard]] std::vector<EntryPtr> getHistory(std::optional<std::size_t> limit = std::nullopt) const;
    [[nodiscard]] std::vector<SearchHit> search(std::string_view query) const;
    bool restoreToClipboard(std::size_t index);
    bool removeEntry(std::size_t index);

    // Also forgets the monitor's last observed value so the current clipboard is recorded again.
    void clearHistory();

    [[nodiscard]] HistoryStats stats() const;
    [[nodiscard]] InspectResult<std::string> inspectEntry(std::size_t index) const;

private:
    HistoryStore* m_store;
    ClipboardMonitor* m_monitor;
    std::size_t m_maxHistoryItems;
};

} // namespace buffervault::core

#endif // INCLUDE_BUFFERVAULT_CORE_HISTORYSERVICE_HPP
