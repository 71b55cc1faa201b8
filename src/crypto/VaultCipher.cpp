#include "buffervault/crypto/VaultCipher.hpp"
#include "buffervault/crypto/CryptoErrors.hpp"
#include "buffervault/crypto/KeyMaterial.hpp"
#include "buffervault/crypto/SealedToken.hpp"
#include <stdexcept>
#include <utility>

namespace buffervault::crypto
{
namespace
{

constexpr std::string_view g_kEntryAad{ "buffervault.entry.v1" };

[[nodiscard]] std::span<const std::byte> entryAad() noexcept
{
    return std::as_bytes(std::span<const char>{ g_kEntryAad.data(), g_kEntryAad.size() });
}

// Rejects overlong forms, surrogates and code points above U+10FFFF. Kept free of Qt like the rest of
// buffervault_crypto.
[[nodiscard]] bool isValidUtf8(std::span<const std::uint8_t> bytes) noexcept
{
    std::size_t i{ 0 };
    while (i < bytes.size())
    {
        const std::uint8_t lead{ bytes[i] };
        std::size_t extra{ 0 };
        std::uint32_t cp{ 0 };
        if (lead < 0x80U)
        {
            ++i;
            continue;
        }
        if ((lead & 0xE0U) == 0xC0U)
        {
            extra = 1;
            cp = lead & 0x1FU;
        }
        else if ((lead & 0xF0U) == 0xE0U)
        {
            extra = 2;
            cp = lead & 0x0FU;
        }
        else if ((lead & 0xF8U) == 0xF0U)
        {
            extra = 3;
            cp = lead & 0x07U;
        }
        else
        {
            return false;
        }

        if (bytes.size() - i <= extra)
        {
            return false;
        }
        for (std::size_t k{ 1 }; k <= extra; ++k)
        {
            const std::uint8_t cont{ bytes[i + k] };
            if ((cont & 0xC0U) != 0x80U)
            {
                return false;
            }
            cp = (cp << 6U) | (cont & 0x3FU);
        }

        constexpr std::uint32_t kMinForLength[]{ 0x0U, 0x80U, 0x800U, 0x10000U };
        if (cp < kMinForLength[extra] || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU))
        {
            return false;
        }
        i += extra + 1U;
    }
    return true;
}

} // namespace

buffervault::security::SecureBuffer deriveVaultKey(const ICryptoProvider& crypto, std::span<const std::byte> password,
                                                   std::span<const std::uint8_t> salt, const Pbkdf2Params& params)
{
    if (salt.size() != g_kSaltBytes)
    {
        throw std::invalid_argument("deriveVaultKey: salt must be 16 bytes");
    }
    if (params.derivedKeyBytes != g_aeadKeyBytes)
    {
        throw std::invalid_argument("deriveVaultKey: key size must match the AEAD key");
    }
    return crypto.deriveKey(password, salt, params);
}

VaultCipher::VaultCipher(ICryptoProvider& crypto, buffervault::security::SecureBuffer key)
    : m_crypto{ &crypto }, m_key{ std::move(key) }
{
    if (m_key.size() != g_aeadKeyBytes)
    {
        throw std::invalid_argument("VaultCipher: key must be 32 bytes");
    }
}

VaultCipher VaultCipher::open(ICryptoProvider& crypto, const std::filesystem::path& saltFile,
                              std::span<const std::byte> password, const Pbkdf2Params& params)
{
    const Salt salt{ loadOrCreateSalt(crypto, saltFile) };
    return VaultCipher{ crypto, deriveVaultKey(crypto, password, salt, params) };
}

std::vector<std::uint8_t> VaultCipher::encrypt(std::string_view plainText) const
{
    const auto plain{ std::as_bytes(std::span<const char>{ plainText.data(), plainText.size() }) };
    return encodeSealedToken(m_crypto->aeadEncrypt(buffervault::security::asSpan(m_key), plain, entryAad()));
}

std::string VaultCipher::decrypt(std::span<const std::uint8_t> token) const
{
    const auto box{ decodeSealedToken(token) };
    if (!box)
    {
        throw DecryptionError("decrypt: malformed sealed token");
    }

    auto plain{ m_crypto->aeadDecrypt(buffervault::security::asSpan(m_key), *box, entryAad()) };
    if (!plain)
    {
        throw DecryptionError("decrypt: authentication failed");
    }
    if (!isValidUtf8(buffervault::security::asSpan(*plain)))
    {
        buffervault::security::secureRelease(*plain);
        throw DecryptionError("decrypt: plaintext is not valid UTF-8");
    }

    std::string out(reinterpret_cast<const char*>(plain->data()), plain->size());
    buffervault::security::secureRelease(*plain);
    return out;
}

} // namespace buffervault::crypto
