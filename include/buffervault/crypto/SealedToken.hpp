#ifndef INCLUDE_BUFFERVAULT_CRYPTO_SEALEDTOKEN_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_SEALEDTOKEN_HPP

#include "buffervault/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace buffervault::crypto
{

inline constexpr std::uint8_t g_kSealedTokenVersion{ 1 };
inline constexpr std::size_t g_kSealedTokenOverhead{ 1U + g_aeadNonceBytes + g_aeadTagBytes };

// Layout: version(1) | nonce(12) | ciphertext | tag(16).
[[nodiscard]] std::vector<std::uint8_t> encodeSealedToken(const AeadBox& box);

// std::nullopt when truncated or carrying an unknown version.
[[nodiscard]] std::optional<AeadBox> decodeSealedToken(std::span<const std::uint8_t> token);

} // namespace buffervault::crypto

#endif // INCLUDE_BUFFERVAULT_CRYPTO_SEALEDTOKEN_HPP
