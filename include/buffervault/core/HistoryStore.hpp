#ifndef INCLUDE_BUFFERVAULT_CORE_HISTORYSTORE_HPP
#define INCLUDE_BUFFERVAULT_CORE_HISTORYSTORE_HPP

#include "buffervault/core/ClipboardEntry.hpp"
#include "buffervault/core/Metadata.hpp"
#include "buffervault/crypto/VaultCipher.hpp"
#include "buffervault/storage/IHistoryRepository.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace buffervault::core
{

struct SearchHit final
{
    std::size_t index{ 0 };
    EntryPtr entry;
};

struct HistoryStats final
{
    std::size_t totalEntries{ 0 };
    std::filesystem::path storagePath;
    bool encryptionEnabled{ false };
};

[[nodiscard]] double wallClockSeconds();

// Owns the clipboard history of one vault directory.
//
// Entries are ordered most recent first and only ever inserted at position 0. Every mutation
// rewrites the whole index. Persistence failures are logged and absorbed; the in-memory history
// stays authoritative for the lifetime of the process.
// All public operations serialize on one mutex, so the poller thread and a foreground caller may
// share an instance.
class HistoryStore final
{
public:
    using NowProvider = std::function<double()>;

    // Loads the existing index. An unreadable index is moved aside and the store starts empty.
    // Sealed records that do not open with `cipher`, or sealed records without a cipher, throw
    // DecryptionError and leave the index untouched.
    // Without a cipher, entries are stored in plaintext.
    HistoryStore(buffervault::storage::IHistoryRepository& repository, std::filesystem::path storagePath,
                 std::optional<buffervault::crypto::VaultCipher> cipher, NowProvider now = wallClockSeconds);

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;
    HistoryStore(HistoryStore&&) = delete;
    HistoryStore& operator=(HistoryStore&&) = delete;
    ~HistoryStore() = default;

    // nullptr when `content` equals the most recent entry; nothing is persisted then.
    EntryPtr addEntry(std::string content, EntryType type = EntryType::Text, Metadata metadata = {});

    [[nodiscard]] std::vector<EntryPtr> getHistory(std::optional<std::size_t> limit = std::nullopt) const;
    [[nodiscard]] EntryPtr getEntry(std::size_t index) const;
    bool removeEntry(std::size_t index);
    void clearHistory();

    // Case-insensitive substring match over text entries, in history order.
    [[nodiscard]] std::vector<SearchHit> searchHistory(std::string_view query) const;

    [[nodiscard]] HistoryStats stats() const;

    // Decrypts the entry's ciphertext file. std::nullopt when the entry does not exist, is not text,
    // or encryption is disabled. Throws DecryptionError or PersistenceError.
    [[nodiscard]] std::optional<std::string> readSealedEntry(std::size_t index) const;

private:
    struct Slot final
    {
        EntryPtr entry;
        std::optional<std::vector<std::uint8_t>> sealed;
        std::string blobName;
        bool indexed{ true };
    };

    void loadLocked();
    void persistIndexLocked();
    void deleteBlobLocked(const Slot& removed);
    [[nodiscard]] static std::string freeBlobName(const std::vector<Slot>& slots, const ClipboardEntry& entry);

    buffervault::storage::IHistoryRepository& m_repository;
    std::filesystem::path m_storagePath;
    std::optional<buffervault::crypto::VaultCipher> m_cipher;
    NowProvider m_now;

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
};

} // namespace buffervault::core

#endif // INCLUDE_BUFFERVAULT_CORE_HISTORYSTORE_HPP
