#include "buffervault/core/PasswordPolicy.hpp"

#include "buffervault/LoggingCategories.hpp"
#include <QSysInfo>
#include <cstdlib>
#include <stdexcept>

namespace buffervault::core
{

using buffervault::log::lcCrypto;

std::optional<PasswordSource> parsePasswordSource(std::string_view text) noexcept
{
    if (text == "machine")
    {
        return PasswordSource::MachineDefault;
    }
    if (text == "prompt")
    {
        return PasswordSource::Prompt;
    }
    if (text == "env")
    {
        return PasswordSource::Environment;
    }
    return std::nullopt;
}

std::string_view toString(PasswordSource source) noexcept
{
    switch (source)
    {
    case PasswordSource::Prompt:
        return "prompt";
    case PasswordSource::Environment:
        return "env";
    case PasswordSource::MachineDefault:
        break;
    }
    return "machine";
}

buffervault::security::SecureString machineDefaultPassword()
{
    const std::string host{ QSysInfo::machineHostName().toStdString() };
    return buffervault::security::secureStringFrom("BufferVault-" + host);
}

buffervault::security::SecureString resolvePassword(PasswordSource source, const PasswordReader& reader)
{
    switch (source)
    {
    case PasswordSource::Prompt:
    {
        if (!reader)
        {
            throw std::runtime_error("no terminal available to prompt for the vault password");
        }
        auto password{ reader("Vault password: ") };
        if (password.empty())
        {
            throw std::runtime_error("empty vault password");
        }
        return password;
    }
    case PasswordSource::Environment:
    {
        const char* value{ std::getenv(g_kPasswordEnvVar) };
        if (value == nullptr || *value == '\0')
        {
            throw std::runtime_error(std::string{ g_kPasswordEnvVar } + " is not set");
        }
        return buffervault::security::secureStringFrom(value);
    }
    case PasswordSource::MachineDefault:
        break;
    }

    qCWarning(lcCrypto) << "vault key is derived from the host name; this only deters casual reading."
                        << "Set security/passwordSource to prompt or env for real protection.";
    return machineDefaultPassword();
}

} // namespace buffervault::core
