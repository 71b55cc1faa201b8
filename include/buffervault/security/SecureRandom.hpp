#ifndef INCLUDE_BUFFERVAULT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_BUFFERVAULT_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace buffervault::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace buffervault::security

#endif // INCLUDE_BUFFERVAULT_SECURITY_SECURERANDOM_HPP
