#include "ConsoleUtils.hpp"

#include "buffervault/security/ScopeWipe.hpp"
#include <iostream>
#include <span>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace buffervault::ui::cli
{

namespace
{

// Turns echo off for its lifetime and restores the previous mode afterwards.
class EchoGuard final
{
public:
    EchoGuard()
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#elif defined(__linux__)
        if (isatty(STDIN_FILENO) == 1 && tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            struct termios tty = m_saved;
            tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &tty) == 0;
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    ~EchoGuard()
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#elif defined(__linux__)
        tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
    bool m_active{ false };
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#elif defined(__linux__)
    struct termios m_saved
    {
    };
#endif
};

} // namespace

buffervault::security::SecureString readPassword(const std::string& prompt)
{
    std::cerr << prompt << std::flush;

    std::string line;
    {
        const EchoGuard guard{};
        std::getline(std::cin, line);
    }
    std::cerr << "\n";

    auto sec = buffervault::security::secureStringFrom(line);
    auto wipeLine = buffervault::security::ScopeWipe{ std::as_writable_bytes(std::span<char>{ line }) };
    return sec;
}

} // namespace buffervault::ui::cli
