#ifndef INCLUDE_BUFFERVAULT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_BUFFERVAULT_SECURITY_SCOPEWIPE_HPP

#include "buffervault/security/SecureMemory.hpp"
#include <cstddef>
#include <span>

namespace buffervault::security
{

// Wipes a byte range when the guard leaves scope, unless released first.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = other.m_bytes;
            other.release();
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

} // namespace buffervault::security

#endif // INCLUDE_BUFFERVAULT_SECURITY_SCOPEWIPE_HPP
