#include "buffervault/core/HistoryService.hpp"

#include "buffervault/crypto/CryptoErrors.hpp"
#include "buffervault/storage/StorageErrors.hpp"
#include <algorithm>

namespace buffervault::core
{

HistoryService::HistoryService(HistoryStore& store, ClipboardMonitor* monitor, std::size_t maxHistoryItems)
    : m_store{ &store }, m_monitor{ monitor }, m_maxHistoryItems{ maxHistoryItems }
{
}

std::vector<EntryPtr> HistoryService::getHistory(std::optional<std::size_t> limit) const
{
    if (m_maxHistoryItems != 0U)
    {
        limit = limit ? std::min(*limit, m_maxHistoryItems) : m_maxHistoryItems;
    }
    return m_store->getHistory(limit);
}

std::vector<SearchHit> HistoryService::search(std::string_view query) const
{
    return m_store->searchHistory(query);
}

bool HistoryService::restoreToClipboard(std::size_t index)
{
    if (m_monitor == nullptr)
    {
        return false;
    }
    return m_monitor->restoreToClipboard(index);
}

bool HistoryService::removeEntry(std::size_t index)
{
    return m_store->removeEntry(index);
}

void HistoryService::clearHistory()
{
    m_store->clearHistory();
    if (m_monitor != nullptr)
    {
        m_monitor->forgetLastObserved();
    }
}

HistoryStats HistoryService::stats() const
{
    return m_store->stats();
}

InspectResult<std::string> HistoryService::inspectEntry(std::size_t index) const
{
    if (!m_store->getEntry(index))
    {
        return InspectError::NotFound;
    }
    try
    {
        auto plain{ m_store->readSealedEntry(index) };
        if (!plain)
        {
            return InspectError::NotSealed;
        }
        return std::move(*plain);
    }
    catch (const buffervault::crypto::DecryptionError&)
    {
        return InspectError::AuthFailed;
    }
    catch (const buffervault::storage::PersistenceError&)
    {
        return InspectError::StorageError;
    }
}

} // namespace buffervault::core
