#ifndef INCLUDE_BUFFERVAULT_STORAGE_IHISTORYREPOSITORY_HPP
#define INCLUDE_BUFFERVAULT_STORAGE_IHISTORYREPOSITORY_HPP

#include "buffervault/core/Metadata.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace buffervault::storage
{

inline constexpr const char* g_kIndexFileName{ "index.json" };
inline constexpr const char* g_kSaltFileName{ ".vault_salt" };

// One persisted history entry. Exactly one of content / sealedContent is set.
struct IndexRecord final
{
    std::optional<std::string> content;
    std::optional<std::vector<std::uint8_t>> sealedContent;
    double timestamp{ 0.0 };
    std::string entryType{ "text" };
    buffervault::core::Metadata metadata;
    // Ciphertext file name when it differs from the timestamp-derived default.
    std::optional<std::string> vaultFile;
};

class IHistoryRepository
{
public:
    IHistoryRepository() = default;
    IHistoryRepository(const IHistoryRepository&) = delete;
    IHistoryRepository& operator=(const IHistoryRepository&) = delete;
    IHistoryRepository(IHistoryRepository&&) = delete;
    IHistoryRepository& operator=(IHistoryRepository&&) = delete;
    virtual ~IHistoryRepository() = default;

    // std::nullopt when the vault has no index yet.
    // Throws CorruptIndexError for an index that cannot be parsed and PersistenceError on I/O failure.
    [[nodiscard]] virtual std::optional<std::vector<IndexRecord>>
    loadIndex(const std::filesystem::path& vaultDir) const = 0;

    // Replaces the whole index atomically. Creates the vault directory when missing.
    virtual void storeIndex(const std::filesystem::path& vaultDir, const std::vector<IndexRecord>& records) = 0;

    // Moves the current index aside and returns its new location.
    virtual std::filesystem::path quarantineIndex(const std::filesystem::path& vaultDir) = 0;

    virtual void writeBlob(const std::filesystem::path& vaultDir, const std::string& name,
                           std::span<const std::uint8_t> bytes) = 0;

    [[nodiscard]] virtual std::optional<std::vector<std::uint8_t>> readBlob(const std::filesystem::path& vaultDir,
                                                                            const std::string& name) const = 0;

    // Returns false when the blob did not exist.
    virtual bool deleteBlob(const std::filesystem::path& vaultDir, const std::string& name) = 0;
};

} // namespace buffervault::storage

#endif // INCLUDE_BUFFERVAULT_STORAGE_IHISTORYREPOSITORY_HPP
