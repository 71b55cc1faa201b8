#ifndef INCLUDE_BUFFERVAULT_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace buffervault::crypto
{

inline constexpr std::size_t g_kSaltBytes{ 16 };
inline constexpr std::size_t g_kDerivedKeyBytes{ 32 };
inline constexpr std::uint32_t g_kPbkdf2Iterations{ 100'000 };

// PBKDF2-HMAC-SHA256 parameters. Persisted vaults rely on the defaults never changing.
struct Pbkdf2Params final
{
    std::uint32_t iterations{ g_kPbkdf2Iterations };
    std::size_t derivedKeyBytes{ g_kDerivedKeyBytes };
};

} // namespace buffervault::crypto

#endif // INCLUDE_BUFFERVAULT_CRYPTO_KDFPARAMS_HPP
