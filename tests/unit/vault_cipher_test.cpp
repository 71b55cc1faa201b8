#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "TestUtils.hpp"
#include "buffervault/crypto/CryptoErrors.hpp"
#include "buffervault/crypto/KeyMaterial.hpp"
#include "buffervault/crypto/SealedToken.hpp"
#include "buffervault/crypto/VaultCipher.hpp"
#include "buffervault/crypto/providers/OpenSslProviderFactory.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

// Keeps the suite fast; production vaults use the default iteration count.
const buffervault::crypto::Pbkdf2Params g_fastParams{ .iterations = 1000U, .derivedKeyBytes = 32U };

} // namespace

class VaultCipherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_crypto = buffervault::crypto::providers::makeOpenSslCryptoProvider();
    }

    [[nodiscard]] buffervault::crypto::VaultCipher openCipher(std::string_view password) const
    {
        return buffervault::crypto::VaultCipher::open(*m_crypto, saltFile(), asBytes(password), g_fastParams);
    }

    [[nodiscard]] std::filesystem::path saltFile() const
    {
        return m_dir.path() / ".vault_salt";
    }

    buffervault::test_utils::TempDir m_dir{ "vault_cipher_" };         // NOLINT
    std::unique_ptr<buffervault::crypto::ICryptoProvider> m_crypto; // NOLINT
};

TEST_F(VaultCipherTest, RoundTripsMultiByteText)
{
    const auto cipher{ openCipher("pw") };
    const std::string text{ "żółć 🚀 日本語\n\ttabs" };

    const auto token{ cipher.encrypt(text) };
    EXPECT_EQ(token.size(), text.size() + buffervault::crypto::g_kSealedTokenOverhead);
    EXPECT_EQ(token.front(), buffervault::crypto::g_kSealedTokenVersion);
    EXPECT_EQ(cipher.decrypt(token), text);
}

TEST_F(VaultCipherTest, RoundTripsEmptyText)
{
    const auto cipher{ openCipher("pw") };
    EXPECT_EQ(cipher.decrypt(cipher.encrypt("")), "");
}

TEST_F(VaultCipherTest, SamePasswordAndSaltDecryptAcrossInstances)
{
    const auto token{ openCipher("pw").encrypt("persisted") };
    EXPECT_EQ(openCipher("pw").decrypt(token), "persisted");
}

TEST_F(VaultCipherTest, WrongPasswordFailsWithDecryptionError)
{
    const auto token{ openCipher("right").encrypt("secret") };
    EXPECT_THROW((void)openCipher("wrong").decrypt(token), buffervault::crypto::DecryptionError);
}

TEST_F(VaultCipherTest, TamperedTokenFails)
{
    const auto cipher{ openCipher("pw") };
    const auto token{ cipher.encrypt("secret") };

    for (std::size_t i = 0; i < token.size(); ++i)
    {
        auto tampered{ token };
        tampered[i] ^= 0x80U;
        EXPECT_THROW((void)cipher.decrypt(tampered), buffervault::crypto::DecryptionError) << "byte " << i;
    }
}

TEST_F(VaultCipherTest, ArbitraryBytesFail)
{
    const auto cipher{ openCipher("pw") };
    EXPECT_THROW((void)cipher.decrypt(std::vector<std::uint8_t>{}), buffervault::crypto::DecryptionError);
    EXPECT_THROW((void)cipher.decrypt(std::vector<std::uint8_t>(5U, 0x01U)), buffervault::crypto::DecryptionError);
    EXPECT_THROW((void)cipher.decrypt(std::vector<std::uint8_t>(64U, 0x01U)), buffervault::crypto::DecryptionError);
}

TEST_F(VaultCipherTest, TruncatedTokenFails)
{
    const auto cipher{ openCipher("pw") };
    auto token{ cipher.encrypt("secret") };
    token.pop_back();
    EXPECT_THROW((void)cipher.decrypt(token), buffervault::crypto::DecryptionError);
}

TEST_F(VaultCipherTest, InvalidUtf8PlaintextFails)
{
    const auto cipher{ openCipher("pw") };
    const auto token{ cipher.encrypt(std::string_view{ "\xff\xfe", 2 }) };
    EXPECT_THROW((void)cipher.decrypt(token), buffervault::crypto::DecryptionError);
}

TEST_F(VaultCipherTest, SaltIsCreatedOnceAndReused)
{
    const auto first{ buffervault::crypto::loadOrCreateSalt(*m_crypto, saltFile()) };
    ASSERT_TRUE(std::filesystem::exists(saltFile()));
    EXPECT_EQ(std::filesystem::file_size(saltFile()), buffervault::crypto::g_kSaltBytes);

    const auto second{ buffervault::crypto::loadOrCreateSalt(*m_crypto, saltFile()) };
    EXPECT_EQ(first, second);
}

TEST_F(VaultCipherTest, WrongSizedSaltFileIsAnError)
{
    {
        std::ofstream out{ saltFile(), std::ios::binary };
        out << "short";
    }
    EXPECT_THROW((void)buffervault::crypto::loadOrCreateSalt(*m_crypto, saltFile()), std::runtime_error);
    EXPECT_EQ(std::filesystem::file_size(saltFile()), 5U);
}

TEST_F(VaultCipherTest, DeriveVaultKeyRequiresSixteenByteSalt)
{
    const std::vector<std::uint8_t> shortSalt(15U, 0x01U);
    EXPECT_THROW((void)buffervault::crypto::deriveVaultKey(*m_crypto, asBytes("pw"), shortSalt, g_fastParams),
                 std::invalid_argument);
}

TEST(SealedToken, DecodeRejectsUnknownVersion)
{
    std::vector<std::uint8_t> token(buffervault::crypto::g_kSealedTokenOverhead + 4U, 0x00U);
    token[0] = 0x02U;
    EXPECT_FALSE(buffervault::crypto::decodeSealedToken(token).has_value());
}

TEST(SealedToken, EncodeLaysOutVersionNonceBodyTag)
{
    buffervault::crypto::AeadBox box{};
    box.nonce.fill(0xAAU);
    box.tag.fill(0xBBU);
    box.cipherText = { 0x01U, 0x02U };

    const auto token{ buffervault::crypto::encodeSealedToken(box) };
    ASSERT_EQ(token.size(), buffervault::crypto::g_kSealedTokenOverhead + 2U);
    EXPECT_EQ(token[0], buffervault::crypto::g_kSealedTokenVersion);
    EXPECT_EQ(token[1], 0xAAU);
    EXPECT_EQ(token[13], 0x01U);
    EXPECT_EQ(token[14], 0x02U);
    EXPECT_EQ(token.back(), 0xBBU);

    const auto decoded{ buffervault::crypto::decodeSealedToken(token) };
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->cipherText, box.cipherText);
    EXPECT_EQ(decoded->nonce, box.nonce);
    EXPECT_EQ(decoded->tag, box.tag);
}
