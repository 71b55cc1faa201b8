#ifndef INCLUDE_BUFFERVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "buffervault/crypto/KdfParams.hpp"
#include "buffervault/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace buffervault::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // PBKDF2-HMAC-SHA256. Deterministic for equal inputs.
    // Empty password, wrong salt size or zero iterations throw std::invalid_argument.
    [[nodiscard]] virtual buffervault::security::SecureBuffer
    deriveKey(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
              const Pbkdf2Params& params) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: AES-256-GCM (12-byte nonce, 16-byte tag).
    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    [[nodiscard]] virtual std::optional<buffervault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace buffervault::crypto

#endif // INCLUDE_BUFFERVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
