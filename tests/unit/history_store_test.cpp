#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "TestUtils.hpp"
#include "buffervault/core/HistoryStore.hpp"
#include "buffervault/crypto/CryptoErrors.hpp"
#include "buffervault/crypto/VaultCipher.hpp"
#include "buffervault/crypto/providers/OpenSslProviderFactory.hpp"
#include "buffervault/storage/StorageErrors.hpp"
#include "buffervault/storage/json/JsonHistoryRepositoryFactory.hpp"

namespace fs = std::filesystem;

using buffervault::core::EntryType;
using buffervault::core::HistoryStore;

using ::testing::ElementsAre;

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

const buffervault::crypto::Pbkdf2Params g_fastParams{ .iterations = 1000U, .derivedKeyBytes = 32U };

std::string readFile(const fs::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> contents(const std::vector<buffervault::core::EntryPtr>& entries)
{
    std::vector<std::string> out;
    std::ranges::transform(entries, std::back_inserter(out), [](const auto& e) { return e->content(); });
    return out;
}

// Forwards to the JSON repository; individual operations can be switched to fail.
class FlakyRepository final : public buffervault::storage::IHistoryRepository
{
public:
    bool failStoreIndex{ false };  // NOLINT
    bool failWriteBlob{ false };   // NOLINT
    bool failDeleteBlob{ false };  // NOLINT
    std::size_t storeIndexCalls{ 0 }; // NOLINT

    [[nodiscard]] std::optional<std::vector<buffervault::storage::IndexRecord>>
    loadIndex(const fs::path& vaultDir) const override
    {
        return m_inner->loadIndex(vaultDir);
    }

    void storeIndex(const fs::path& vaultDir, const std::vector<buffervault::storage::IndexRecord>& records) override
    {
        ++storeIndexCalls;
        if (failStoreIndex)
        {
            throw buffervault::storage::PersistenceError("disk full");
        }
        m_inner->storeIndex(vaultDir, records);
    }

    fs::path quarantineIndex(const fs::path& vaultDir) override
    {
        return m_inner->quarantineIndex(vaultDir);
    }

    void writeBlob(const fs::path& vaultDir, const std::string& name, std::span<const std::uint8_t> bytes) override
    {
        if (failWriteBlob)
        {
            throw buffervault::storage::PersistenceError("disk full");
        }
        m_inner->writeBlob(vaultDir, name, bytes);
    }

    [[nodiscard]] std::optional<std::vector<std::uint8_t>> readBlob(const fs::path& vaultDir,
                                                                    const std::string& name) const override
    {
        return m_inner->readBlob(vaultDir, name);
    }

    bool deleteBlob(const fs::path& vaultDir, const std::string& name) override
    {
        if (failDeleteBlob)
        {
            throw buffervault::storage::PersistenceError("read-only");
        }
        return m_inner->deleteBlob(vaultDir, name);
    }

private:
    std::unique_ptr<buffervault::storage::IHistoryRepository> m_inner{
        buffervault::storage::json::makeJsonHistoryRepository()
    };
};

} // namespace

class HistoryStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_vaultDir = m_dir.path() / "vault";
        m_crypto = buffervault::crypto::providers::makeOpenSslCryptoProvider();
    }

    [[nodiscard]] std::optional<buffervault::crypto::VaultCipher> cipher(std::string_view password = "pw") const
    {
        return buffervault::crypto::VaultCipher::open(*m_crypto, m_vaultDir / ".vault_salt", asBytes(password),
                                                      g_fastParams);
    }

    [[nodiscard]] std::unique_ptr<HistoryStore> openPlain()
    {
        return std::make_unique<HistoryStore>(m_repo, m_vaultDir, std::nullopt, clock());
    }

    [[nodiscard]] std::unique_ptr<HistoryStore> openSealed(std::string_view password = "pw")
    {
        return std::make_unique<HistoryStore>(m_repo, m_vaultDir, cipher(password), clock());
    }

    // Advances by `m_step` on every call.
    [[nodiscard]] HistoryStore::NowProvider clock()
    {
        return [this]()
        {
            m_now += m_step;
            return m_now;
        };
    }

    [[nodiscard]] std::vector<std::string> vaultFiles() const
    {
        auto names{ buffervault::test_utils::listFileNames(m_vaultDir) };
        std::erase_if(names, [](const std::string& n) { return !n.ends_with(".vault"); });
        std::ranges::sort(names);
        return names;
    }

    buffervault::test_utils::TempDir m_dir{ "history_store_" };      // NOLINT
    fs::path m_vaultDir;                                            // NOLINT
    std::unique_ptr<buffervault::crypto::ICryptoProvider> m_crypto; // NOLINT
    FlakyRepository m_repo;                                         // NOLINT
    double m_now{ 1700000000.0 };                                   // NOLINT
    double m_step{ 1.0 };                                           // NOLINT
};

TEST_F(HistoryStoreTest, NewEntriesGoFirst)
{
    auto store{ openPlain() };
    store->addEntry("a");
    store->addEntry("b");
    store->addEntry("c");

    EXPECT_THAT(contents(store->getHistory()), ElementsAre("c", "b", "a"));
    EXPECT_THAT(contents(store->getHistory(2)), ElementsAre("c", "b"));
    EXPECT_EQ(store->getHistory(0).size(), 0U);
    EXPECT_EQ(store->getHistory(50).size(), 3U);
}

TEST_F(HistoryStoreTest, AdjacentDuplicateIsIgnored)
{
    auto store{ openPlain() };
    ASSERT_NE(store->addEntry("same"), nullptr);
    const auto calls{ m_repo.storeIndexCalls };

    EXPECT_EQ(store->addEntry("same"), nullptr);
    EXPECT_EQ(store->stats().totalEntries, 1U);
    EXPECT_EQ(m_repo.storeIndexCalls, calls);
}

TEST_F(HistoryStoreTest, NonAdjacentDuplicateIsKept)
{
    auto store{ openPlain() };
    store->addEntry("x");
    store->addEntry("y");
    ASSERT_NE(store->addEntry("x"), nullptr);

    EXPECT_THAT(contents(store->getHistory()), ElementsAre("x", "y", "x"));
}

TEST_F(HistoryStoreTest, AddedEntryCarriesClockAndMetadata)
{
    auto store{ openPlain() };
    buffervault::core::Metadata meta{};
    meta.emplace("source", std::string{ "test" });

    const auto entry{ store->addEntry("m", EntryType::Text, meta) };
    ASSERT_NE(entry, nullptr);
    EXPECT_DOUBLE_EQ(entry->timestamp(), 1700000001.0);
    EXPECT_EQ(entry->metadata(), meta);
}

TEST_F(HistoryStoreTest, GetEntryOutOfRangeIsNull)
{
    auto store{ openPlain() };
    store->addEntry("only");
    EXPECT_EQ(store->getEntry(0)->content(), "only");
    EXPECT_EQ(store->getEntry(1), nullptr);
}

TEST_F(HistoryStoreTest, RemoveShiftsLaterEntries)
{
    auto store{ openPlain() };
    store->addEntry("a");
    store->addEntry("b");
    store->addEntry("c");

    EXPECT_TRUE(store->removeEntry(1));
    EXPECT_THAT(contents(store->getHistory()), ElementsAre("c", "a"));
    EXPECT_FALSE(store->removeEntry(2));
    EXPECT_EQ(store->stats().totalEntries, 2U);
}

TEST_F(HistoryStoreTest, ClearEmptiesHistoryAndIndex)
{
    {
        auto store{ openPlain() };
        store->addEntry("a");
        store->addEntry("b");
        store->clearHistory();
        EXPECT_TRUE(store->getHistory().empty());
    }
    EXPECT_TRUE(openPlain()->getHistory().empty());
}

TEST_F(HistoryStoreTest, SearchIsCaseInsensitiveAndReportsIndices)
{
    auto store{ openPlain() };
    store->addEntry("Hello World");
    store->addEntry("other");
    store->addEntry("say HELLO");

    const auto hits{ store->searchHistory("hello") };
    ASSERT_EQ(hits.size(), 2U);
    EXPECT_EQ(hits[0].index, 0U);
    EXPECT_EQ(hits[0].entry->content(), "say HELLO");
    EXPECT_EQ(hits[1].index, 2U);
    EXPECT_TRUE(store->searchHistory("absent").empty());
}

TEST_F(HistoryStoreTest, SearchFoldsNonAsciiCase)
{
    auto store{ openPlain() };
    store->addEntry("ŻÓŁW");
    EXPECT_EQ(store->searchHistory("żółw").size(), 1U);
}

TEST_F(HistoryStoreTest, SearchSkipsNonTextEntries)
{
    auto store{ openPlain() };
    store->addEntry("needle", EntryType::Other);
    EXPECT_TRUE(store->searchHistory("needle").empty());
}

TEST_F(HistoryStoreTest, PlaintextHistorySurvivesReopen)
{
    {
        auto store{ openPlain() };
        store->addEntry("first");
        store->addEntry("second");
    }
    auto reopened{ openPlain() };
    EXPECT_THAT(contents(reopened->getHistory()), ElementsAre("second", "first"));
    EXPECT_FALSE(reopened->stats().encryptionEnabled);
    EXPECT_TRUE(vaultFiles().empty());
}

TEST_F(HistoryStoreTest, EncryptedIndexHoldsNoPlaintext)
{
    {
        auto store{ openSealed() };
        store->addEntry("top secret value");
        EXPECT_TRUE(store->stats().encryptionEnabled);
    }

    const std::string index{ readFile(m_vaultDir / "index.json") };
    EXPECT_EQ(index.find("top secret value"), std::string::npos);
    EXPECT_NE(index.find("sealed_content"), std::string::npos);
    EXPECT_THAT(vaultFiles(), ElementsAre("1700000001.vault"));
}

TEST_F(HistoryStoreTest, EncryptedHistorySurvivesReopen)
{
    {
        auto store{ openSealed() };
        store->addEntry("alpha");
        store->addEntry("beta");
    }
    auto reopened{ openSealed() };
    EXPECT_THAT(contents(reopened->getHistory()), ElementsAre("beta", "alpha"));
}

TEST_F(HistoryStoreTest, WrongPasswordFailsAndLeavesIndexInPlace)
{
    {
        auto store{ openSealed("right") };
        store->addEntry("secret");
    }
    const std::string before{ readFile(m_vaultDir / "index.json") };

    EXPECT_THROW((void)openSealed("wrong"), buffervault::crypto::DecryptionError);
    EXPECT_EQ(readFile(m_vaultDir / "index.json"), before);
    const auto names{ buffervault::test_utils::listFileNames(m_vaultDir) };
    EXPECT_TRUE(std::ranges::none_of(names, [](const std::string& n) { return n.starts_with("index.json.corrupt"); }));

    EXPECT_THAT(contents(openSealed("right")->getHistory()), ElementsAre("secret"));
}

TEST_F(HistoryStoreTest, SealedIndexWithoutCipherFailsAndLeavesIndexInPlace)
{
    {
        auto store{ openSealed() };
        store->addEntry("secret");
    }
    const std::string before{ readFile(m_vaultDir / "index.json") };

    EXPECT_THROW((void)openPlain(), buffervault::crypto::DecryptionError);
    EXPECT_EQ(readFile(m_vaultDir / "index.json"), before);
    EXPECT_THAT(contents(openSealed()->getHistory()), ElementsAre("secret"));
}

TEST_F(HistoryStoreTest, CorruptIndexIsMovedAsideAndStoreStartsEmpty)
{
    fs::create_directories(m_vaultDir);
    {
        std::ofstream out{ m_vaultDir / "index.json", std::ios::binary };
        out << "{ not json";
    }

    auto store{ openPlain() };
    EXPECT_TRUE(store->getHistory().empty());
    store->addEntry("fresh");
    EXPECT_THAT(contents(openPlain()->getHistory()), ElementsAre("fresh"));
}

TEST_F(HistoryStoreTest, PlaintextEntriesAreSealedWhenEncryptionTurnsOn)
{
    {
        auto store{ openPlain() };
        store->addEntry("legacy one");
        store->addEntry("legacy two");
    }
    {
        auto store{ openSealed() };
        EXPECT_THAT(contents(store->getHistory()), ElementsAre("legacy two", "legacy one"));
        EXPECT_EQ(store->readSealedEntry(1), std::optional<std::string>{ "legacy one" });
    }

    EXPECT_EQ(readFile(m_vaultDir / "index.json").find("legacy"), std::string::npos);
    EXPECT_EQ(vaultFiles().size(), 2U);
}

TEST_F(HistoryStoreTest, ReadSealedEntryDecryptsCiphertextFile)
{
    auto store{ openSealed() };
    store->addEntry("inspect me");
    EXPECT_EQ(store->readSealedEntry(0), std::optional<std::string>{ "inspect me" });
    EXPECT_FALSE(store->readSealedEntry(1).has_value());
}

TEST_F(HistoryStoreTest, ReadSealedEntryIsEmptyWithoutEncryption)
{
    auto store{ openPlain() };
    store->addEntry("plain");
    EXPECT_FALSE(store->readSealedEntry(0).has_value());
}

TEST_F(HistoryStoreTest, ReadSealedEntryThrowsWhenFileIsMissing)
{
    auto store{ openSealed() };
    store->addEntry("gone");
    fs::remove(m_vaultDir / "1700000001.vault");
    EXPECT_THROW((void)store->readSealedEntry(0), buffervault::storage::PersistenceError);
}

TEST_F(HistoryStoreTest, ReadSealedEntryThrowsOnTamperedFile)
{
    auto store{ openSealed() };
    store->addEntry("tamper");
    {
        std::ofstream out{ m_vaultDir / "1700000001.vault", std::ios::binary | std::ios::trunc };
        out << "garbage";
    }
    EXPECT_THROW((void)store->readSealedEntry(0), buffervault::crypto::DecryptionError);
}

TEST_F(HistoryStoreTest, EntriesWithinOneSecondGetDistinctCiphertextFiles)
{
    m_step = 0.25;
    {
        auto store{ openSealed() };
        store->addEntry("one");
        store->addEntry("two");
        store->addEntry("three");
        EXPECT_THAT(vaultFiles(), ElementsAre("1700000000-1.vault", "1700000000-2.vault",
                                                           "1700000000.vault"));
        EXPECT_EQ(store->readSealedEntry(2), std::optional<std::string>{ "one" });
    }

    auto reopened{ openSealed() };
    EXPECT_EQ(reopened->readSealedEntry(0), std::optional<std::string>{ "three" });
    EXPECT_EQ(reopened->readSealedEntry(1), std::optional<std::string>{ "two" });
    EXPECT_EQ(reopened->readSealedEntry(2), std::optional<std::string>{ "one" });

    EXPECT_TRUE(reopened->removeEntry(1));
    EXPECT_THAT(vaultFiles(), ElementsAre("1700000000-2.vault", "1700000000.vault"));
    EXPECT_EQ(reopened->readSealedEntry(0), std::optional<std::string>{ "three" });
}

TEST_F(HistoryStoreTest, RemoveAndClearDeleteCiphertextFiles)
{
    auto store{ openSealed() };
    store->addEntry("a");
    store->addEntry("b");
    store->addEntry("c");
    ASSERT_EQ(vaultFiles().size(), 3U);

    EXPECT_TRUE(store->removeEntry(0));
    EXPECT_EQ(vaultFiles().size(), 2U);

    store->clearHistory();
    EXPECT_TRUE(vaultFiles().empty());
}

TEST_F(HistoryStoreTest, IndexWriteFailureKeepsMemoryAuthoritative)
{
    auto store{ openPlain() };
    m_repo.failStoreIndex = true;

    EXPECT_NE(store->addEntry("kept"), nullptr);
    EXPECT_TRUE(store->removeEntry(0));
    store->addEntry("again");
    EXPECT_NO_THROW(store->clearHistory());
    store->addEntry("last");
    EXPECT_THAT(contents(store->getHistory()), ElementsAre("last"));
}

TEST_F(HistoryStoreTest, BlobFailuresAreAbsorbed)
{
    auto store{ openSealed() };
    m_repo.failWriteBlob = true;
    EXPECT_NE(store->addEntry("no blob"), nullptr);
    EXPECT_THROW((void)store->readSealedEntry(0), buffervault::storage::PersistenceError);

    m_repo.failWriteBlob = false;
    store->addEntry("with blob");
    m_repo.failDeleteBlob = true;
    EXPECT_TRUE(store->removeEntry(0));
    EXPECT_NO_THROW(store->clearHistory());
    EXPECT_TRUE(store->getHistory().empty());
}

TEST_F(HistoryStoreTest, StatsReportPathAndCount)
{
    auto store{ openPlain() };
    store->addEntry("a");
    const auto stats{ store->stats() };
    EXPECT_EQ(stats.totalEntries, 1U);
    EXPECT_EQ(stats.storagePath, m_vaultDir);
    EXPECT_FALSE(stats.encryptionEnabled);
}

TEST_F(HistoryStoreTest, NonTextEntriesStayPlainInEncryptedVault)
{
    {
        auto store{ openSealed() };
        store->addEntry("[image]", EntryType::Other);
        EXPECT_FALSE(store->readSealedEntry(0).has_value());
        EXPECT_TRUE(vaultFiles().empty());
    }
    auto reopened{ openSealed() };
    ASSERT_EQ(reopened->getHistory().size(), 1U);
    EXPECT_EQ(reopened->getEntry(0)->type(), EntryType::Other);
}
