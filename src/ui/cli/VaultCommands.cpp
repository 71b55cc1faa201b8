#include "VaultCommands.hpp"

#include <variant>

namespace buffervault::ui::cli
{

VaultCommands::VaultCommands(buffervault::core::HistoryService& service, std::ostream& out, std::ostream& err)
    : m_service(service), m_out(out), m_err(err)
{
}

void VaultCommands::printEntry(std::size_t index, const buffervault::core::ClipboardEntry& entry)
{
    m_out << "[" << index << "] " << entry.displayTime() << "\n";
    m_out << "    " << entry.preview() << "\n";
}

int VaultCommands::history(std::size_t limit)
{
    const auto entries = m_service.getHistory(limit);
    m_out << "Total items in history: " << m_service.stats().totalEntries << "\n";
    if (entries.empty())
    {
        m_out << "(empty)\n";
        return 0;
    }

    m_out << "\n";
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        printEntry(i, *entries[i]);
    }
    return 0;
}

int VaultCommands::search(const std::string& query)
{
    const auto hits = m_service.search(query);
    if (hits.empty())
    {
        m_out << "No matches.\n";
        return 0;
    }

    for (const auto& hit : hits)
    {
        printEntry(hit.index, *hit.entry);
    }
    return 0;
}

int VaultCommands::restore(std::size_t index)
{
    if (!m_service.restoreToClipboard(index))
    {
        m_err << "Error: Could not restore entry " << index << ".\n";
        return 1;
    }
    m_out << "Entry " << index << " copied to the clipboard.\n";
    return 0;
}

int VaultCommands::remove(std::size_t index)
{
    if (!m_service.removeEntry(index))
    {
        m_err << "Error: No entry at index " << index << ".\n";
        return 1;
    }
    m_out << "Entry " << index << " removed.\n";
    return 0;
}

int VaultCommands::clear()
{
    m_service.clearHistory();
    m_out << "History cleared.\n";
    return 0;
}

int VaultCommands::stats()
{
    const auto s = m_service.stats();
    m_out << "Entries:    " << s.totalEntries << "\n";
    m_out << "Storage:    " << s.storagePath.string() << "\n";
    m_out << "Encryption: " << (s.encryptionEnabled ? "enabled" : "disabled") << "\n";
    return 0;
}

int VaultCommands::inspect(std::size_t index)
{
    const auto result = m_service.inspectEntry(index);
    if (const auto* text = std::get_if<std::string>(&result))
    {
        m_out << *text << "\n";
        return 0;
    }

    switch (std::get<buffervault::core::InspectError>(result))
    {
    case buffervault::core::InspectError::NotFound:
        m_err << "Error: No entry at index " << index << ".\n";
        break;
    case buffervault::core::InspectError::NotSealed:
        m_err << "Error: Entry " << index << " has no ciphertext file.\n";
        break;
    case buffervault::core::InspectError::StorageError:
        m_err << "Error: Ciphertext file for entry " << index << " could not be read.\n";
        break;
    case buffervault::core::InspectError::AuthFailed:
        m_err << "Error: Ciphertext file for entry " << index << " failed authentication.\n";
        break;
    }
    return 1;
}

void printSettings(const buffervault::config::Settings& settings, std::ostream& out)
{
    out << "history/maxItems=" << settings.maxHistoryItems << "\n";
    out << "storage/path=" << settings.storagePath.string() << "\n";
    out << "storage/encryptionEnabled=" << (settings.encryptionEnabled ? "true" : "false") << "\n";
    out << "monitor/maxItemSizeMb=" << settings.maxItemSizeMb << "\n";
    out << "monitor/pollIntervalMs=" << settings.pollInterval.count() << "\n";
    out << "security/passwordSource=" << buffervault::core::toString(settings.passwordSource) << "\n";
}

} // namespace buffervault::ui::cli
