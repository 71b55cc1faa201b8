#include "buffervault/core/HistoryStore.hpp"

#include "buffervault/LoggingCategories.hpp"
#include "buffervault/crypto/CryptoErrors.hpp"
#include "buffervault/storage/StorageErrors.hpp"
#include <QString>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace buffervault::core
{
namespace
{

using buffervault::log::lcStorage;
using buffervault::log::lcStore;

[[nodiscard]] buffervault::storage::IndexRecord toRecord(const ClipboardEntry& entry,
                                                         const std::optional<std::vector<std::uint8_t>>& sealed,
                                                         const std::string& blobName)
{
    buffervault::storage::IndexRecord record{};
    if (sealed)
    {
        record.sealedContent = *sealed;
    }
    else
    {
        record.content = entry.content();
    }
    record.timestamp = entry.timestamp();
    record.entryType = std::string{ toString(entry.type()) };
    record.metadata = entry.metadata();
    if (sealed && blobName != entry.vaultFileName())
    {
        record.vaultFile = blobName;
    }
    return record;
}

} // namespace

double wallClockSeconds()
{
    return std::chrono::duration<double>{ std::chrono::system_clock::now().time_since_epoch() }.count();
}

HistoryStore::HistoryStore(buffervault::storage::IHistoryRepository& repository, std::filesystem::path storagePath,
                           std::optional<buffervault::crypto::VaultCipher> cipher, NowProvider now)
    : m_repository{ repository }, m_storagePath{ std::move(storagePath) }, m_cipher{ std::move(cipher) },
      m_now{ std::move(now) }
{
    const std::scoped_lock lock{ m_mutex };
    loadLocked();
}

void HistoryStore::loadLocked()
{
    std::vector<Slot> loaded{};
    bool upgraded{ false };
    try
    {
        const auto records{ m_repository.loadIndex(m_storagePath) };
        if (!records)
        {
            return;
        }

        loaded.reserve(records->size());
        for (const auto& record : *records)
        {
            Slot slot{};
            const EntryType type{ parseEntryType(record.entryType) };
            std::string content{};
            if (record.sealedContent)
            {
                if (!m_cipher)
                {
                    throw buffervault::crypto::DecryptionError(
                        "vault index holds sealed entries but encryption is disabled");
                }
                try
                {
                    content = m_cipher->decrypt(*record.sealedContent);
                }
                catch (const buffervault::crypto::DecryptionError&)
                {
                    throw buffervault::crypto::DecryptionError("cannot open vault index: wrong password");
                }
                slot.sealed = record.sealedContent;
            }
            else
            {
                content = record.content.value_or(std::string{});
                if (m_cipher && type == EntryType::Text)
                {
                    // Plaintext left by an unencrypted run; seal it on the next rewrite.
                    slot.sealed = m_cipher->encrypt(content);
                    upgraded = true;
                }
            }
            slot.entry = std::make_shared<const ClipboardEntry>(std::move(content), record.timestamp, type,
                                                                record.metadata);
            if (record.vaultFile)
            {
                slot.blobName = *record.vaultFile;
            }
            else if (record.sealedContent)
            {
                slot.blobName = slot.entry->vaultFileName();
            }
            else if (slot.sealed)
            {
                slot.blobName = freeBlobName(loaded, *slot.entry);
            }
            loaded.push_back(std::move(slot));
        }
    }
    catch (const buffervault::crypto::DecryptionError&)
    {
        // A key mismatch is not corruption; the index stays in place for the right password.
        throw;
    }
    catch (const std::exception& e)
    {
        qCWarning(lcStorage) << "index at" << QString::fromStdU16String(m_storagePath.u16string())
                             << "is unreadable:" << e.what();
        try
        {
            const auto moved{ m_repository.quarantineIndex(m_storagePath) };
            qCWarning(lcStorage) << "moved unreadable index to" << QString::fromStdU16String(moved.u16string());
        }
        catch (const std::exception& quarantineError)
        {
            qCWarning(lcStorage) << "failed to move unreadable index aside:" << quarantineError.what();
        }
        return;
    }

    m_slots = std::move(loaded);
    qCDebug(lcStore) << "loaded" << m_slots.size() << "entries";

    if (upgraded)
    {
        for (const auto& slot : m_slots)
        {
            if (!slot.sealed)
            {
                continue;
            }
            try
            {
                m_repository.writeBlob(m_storagePath, slot.blobName, *slot.sealed);
            }
            catch (const std::exception& e)
            {
                qCWarning(lcStorage) << "failed to write ciphertext file:" << e.what();
            }
        }
        persistIndexLocked();
    }
}

void HistoryStore::persistIndexLocked()
{
    std::vector<buffervault::storage::IndexRecord> records{};
    records.reserve(m_slots.size());
    for (const auto& slot : m_slots)
    {
        if (slot.indexed)
        {
            records.push_back(toRecord(*slot.entry, slot.sealed, slot.blobName));
        }
    }

    try
    {
        m_repository.storeIndex(m_storagePath, records);
    }
    catch (const std::exception& e)
    {
        qCWarning(lcStorage) << "failed to save index:" << e.what();
    }
}

void HistoryStore::deleteBlobLocked(const Slot& removed)
{
    if (!removed.sealed)
    {
        return;
    }

    try
    {
        if (!m_repository.deleteBlob(m_storagePath, removed.blobName))
        {
            qCDebug(lcStorage) << "ciphertext file" << QString::fromStdString(removed.blobName) << "was already gone";
        }
    }
    catch (const std::exception& e)
    {
        qCWarning(lcStorage) << "failed to delete ciphertext file:" << e.what();
    }
}

// Entries created within the same second would share "<seconds>.vault"; later ones get a numeric suffix.
std::string HistoryStore::freeBlobName(const std::vector<Slot>& slots, const ClipboardEntry& entry)
{
    const std::string base{ entry.vaultFileName() };
    const auto taken{ [&slots](const std::string& name)
                      { return std::ranges::any_of(slots, [&name](const Slot& s) { return s.blobName == name; }); } };
    if (!taken(base))
    {
        return base;
    }

    const std::string stem{ base.substr(0, base.size() - std::string_view{ ".vault" }.size()) };
    for (std::size_t n{ 1 };; ++n)
    {
        std::string candidate{ stem + "-" + std::to_string(n) + ".vault" };
        if (!taken(candidate))
        {
            return candidate;
        }
    }
}

EntryPtr HistoryStore::addEntry(std::string content, EntryType type, Metadata metadata)
{
    const std::scoped_lock lock{ m_mutex };
    if (!m_slots.empty() && m_slots.front().entry->content() == content)
    {
        return nullptr;
    }

    Slot slot{};
    slot.entry = std::make_shared<const ClipboardEntry>(std::move(content), m_now(), type, std::move(metadata));

    if (m_cipher && type == EntryType::Text)
    {
        try
        {
            slot.sealed = m_cipher->encrypt(slot.entry->content());
        }
        catch (const std::exception& e)
        {
            qCWarning(lcStore) << "failed to seal entry, keeping it out of the index:" << e.what();
            slot.indexed = false;
        }
    }

    if (slot.sealed)
    {
        slot.blobName = freeBlobName(m_slots, *slot.entry);
        try
        {
            m_repository.writeBlob(m_storagePath, slot.blobName, *slot.sealed);
        }
        catch (const std::exception& e)
        {
            qCWarning(lcStorage) << "failed to write ciphertext file:" << e.what();
        }
    }

    EntryPtr added{ slot.entry };
    m_slots.insert(m_slots.begin(), std::move(slot));
    qCDebug(lcStore) << "added entry of" << added->content().size() << "bytes";
    persistIndexLocked();
    return added;
}

std::vector<EntryPtr> HistoryStore::getHistory(std::optional<std::size_t> limit) const
{
    const std::scoped_lock lock{ m_mutex };
    const std::size_t count{ limit ? std::min(*limit, m_slots.size()) : m_slots.size() };

    std::vector<EntryPtr> out{};
    out.reserve(count);
    for (std::size_t i{ 0 }; i < count; ++i)
    {
        out.push_back(m_slots[i].entry);
    }
    return out;
}

EntryPtr HistoryStore::getEntry(std::size_t index) const
{
    const std::scoped_lock lock{ m_mutex };
    if (index >= m_slots.size())
    {
        return nullptr;
    }
    return m_slots[index].entry;
}

bool HistoryStore::removeEntry(std::size_t index)
{
    const std::scoped_lock lock{ m_mutex };
    if (index >= m_slots.size())
    {
        return false;
    }

    const Slot removed{ std::move(m_slots[index]) };
    m_slots.erase(m_slots.begin() + static_cast<std::ptrdiff_t>(index));
    deleteBlobLocked(removed);
    persistIndexLocked();
    return true;
}

void HistoryStore::clearHistory()
{
    const std::scoped_lock lock{ m_mutex };
    std::vector<Slot> removed{};
    removed.swap(m_slots);
    for (const auto& slot : removed)
    {
        deleteBlobLocked(slot);
    }
    qCDebug(lcStore) << "cleared" << removed.size() << "entries";
    persistIndexLocked();
}

std::vector<SearchHit> HistoryStore::searchHistory(std::string_view query) const
{
    const QString needle{ QString::fromUtf8(query.data(), static_cast<qsizetype>(query.size())) };

    const std::scoped_lock lock{ m_mutex };
    std::vector<SearchHit> hits{};
    for (std::size_t i{ 0 }; i < m_slots.size(); ++i)
    {
        const auto& entry{ m_slots[i].entry };
        if (entry->type() != EntryType::Text)
        {
            continue;
        }
        if (QString::fromStdString(entry->content()).contains(needle, Qt::CaseInsensitive))
        {
            hits.push_back(SearchHit{ .index = i, .entry = entry });
        }
    }
    return hits;
}

HistoryStats HistoryStore::stats() const
{
    const std::scoped_lock lock{ m_mutex };
    return HistoryStats{
        .totalEntries = m_slots.size(),
        .storagePath = m_storagePath,
        .encryptionEnabled = m_cipher.has_value(),
    };
}

std::optional<std::string> HistoryStore::readSealedEntry(std::size_t index) const
{
    const std::scoped_lock lock{ m_mutex };
    if (!m_cipher || index >= m_slots.size() || m_slots[index].entry->type() != EntryType::Text)
    {
        return std::nullopt;
    }

    const std::string& name{ m_slots[index].blobName };
    const auto token{ m_repository.readBlob(m_storagePath, name) };
    if (!token)
    {
        throw buffervault::storage::PersistenceError("ciphertext file " + name + " is missing");
    }
    return m_cipher->decrypt(*token);
}

} // namespace buffervault::core
