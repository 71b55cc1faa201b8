#ifndef INCLUDE_BUFFERVAULT_CRYPTO_KEYMATERIAL_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_KEYMATERIAL_HPP

#include "buffervault/crypto/ICryptoProvider.hpp"
#include "buffervault/crypto/KdfParams.hpp"
#include <array>
#include <cstdint>
#include <filesystem>

namespace buffervault::crypto
{

using Salt = std::array<std::uint8_t, g_kSaltBytes>;

// Reads the vault salt, creating it from the CSPRNG on first use.
// An existing file of the wrong size throws std::runtime_error; it is never regenerated.
[[nodiscard]] Salt loadOrCreateSalt(ICryptoProvider& crypto, const std::filesystem::path& saltFile);

} // namespace buffervault::crypto

#endif // INCLUDE_BUFFERVAULT_CRYPTO_KEYMATERIAL_HPP
