#ifndef INCLUDE_BUFFERVAULT_CORE_PASSWORDPOLICY_HPP
#define INCLUDE_BUFFERVAULT_CORE_PASSWORDPOLICY_HPP

#include "buffervault/security/SecureMemory.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace buffervault::core
{

inline constexpr const char* g_kPasswordEnvVar{ "BUFFERVAULT_PASSWORD" };

enum class PasswordSource : std::uint8_t
{
    MachineDefault,
    Prompt,
    Environment,
};

// Accepts "machine", "prompt" and "env".
[[nodiscard]] std::optional<PasswordSource> parsePasswordSource(std::string_view text) noexcept;
[[nodiscard]] std::string_view toString(PasswordSource source) noexcept;

// "BufferVault-<hostname>". Anyone who knows the host name can derive it, so it only keeps
// casual readers of the vault directory out.
[[nodiscard]] buffervault::security::SecureString machineDefaultPassword();

using PasswordReader = std::function<buffervault::security::SecureString(const std::string& prompt)>;

// Throws std::runtime_error when the selected source yields no password.
[[nodiscard]] buffervault::security::SecureString resolvePassword(PasswordSource source,
                                                                  const PasswordReader& reader);

} // namespace buffervault::core

#endif // INCLUDE_BUFFERVAULT_CORE_PASSWORDPOLICY_HPP
