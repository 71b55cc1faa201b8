#ifndef INCLUDE_BUFFERVAULT_CRYPTO_VAULTCIPHER_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_VAULTCIPHER_HPP

#include "buffervault/crypto/ICryptoProvider.hpp"
#include "buffervault/crypto/KdfParams.hpp"
#include "buffervault/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace buffervault::crypto
{

// Derives the vault key. Unlike ICryptoProvider::deriveKey, the salt must be exactly g_kSaltBytes.
[[nodiscard]] buffervault::security::SecureBuffer deriveVaultKey(const ICryptoProvider& crypto,
                                                                 std::span<const std::byte> password,
                                                                 std::span<const std::uint8_t> salt,
                                                                 const Pbkdf2Params& params = {});

// Seals and opens entry content with the key derived for one vault directory.
// The provider must outlive the cipher.
class VaultCipher final
{
public:
    VaultCipher(ICryptoProvider& crypto, buffervault::security::SecureBuffer key);

    // Loads or creates the salt at `saltFile`, then derives the key from `password`.
    [[nodiscard]] static VaultCipher open(ICryptoProvider& crypto, const std::filesystem::path& saltFile,
                                          std::span<const std::byte> password, const Pbkdf2Params& params = {});

    // Fresh nonce on every call; the token is self-contained.
    [[nodiscard]] std::vector<std::uint8_t> encrypt(std::string_view plainText) const;

    // Throws DecryptionError on malformed tokens, authentication failure or non-UTF-8 plaintext.
    // UTF-8 is checked by a local validator; this target links no Qt, and QString decoding would
    // replace bad sequences instead of rejecting them.
    [[nodiscard]] std::string decrypt(std::span<const std::uint8_t> token) const;

private:
    ICryptoProvider* m_crypto;
    buffervault::security::SecureBuffer m_key;
};

} // namespace buffervault::crypto

#endif // INCLUDE_BUFFERVAULT_CRYPTO_VAULTCIPHER_HPP
