#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

#include "buffervault/core/PasswordPolicy.hpp"

using buffervault::core::PasswordSource;

namespace
{

std::string str(const buffervault::security::SecureString& s)
{
    return std::string{ s.data(), s.size() };
}

// Restores the variable on scope exit.
class EnvGuard final
{
public:
    explicit EnvGuard(const char* name) : m_name{ name }
    {
        if (const char* v{ std::getenv(name) }; v != nullptr)
        {
            m_saved = v;
        }
    }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
    ~EnvGuard()
    {
        if (m_saved)
        {
            ::setenv(m_name, m_saved->c_str(), 1);
        }
        else
        {
            ::unsetenv(m_name);
        }
    }

private:
    const char* m_name;
    std::optional<std::string> m_saved;
};

} // namespace

TEST(PasswordPolicy, ParsesKnownSources)
{
    EXPECT_EQ(buffervault::core::parsePasswordSource("machine"), PasswordSource::MachineDefault);
    EXPECT_EQ(buffervault::core::parsePasswordSource("prompt"), PasswordSource::Prompt);
    EXPECT_EQ(buffervault::core::parsePasswordSource("env"), PasswordSource::Environment);
    EXPECT_FALSE(buffervault::core::parsePasswordSource("Prompt").has_value());
    EXPECT_FALSE(buffervault::core::parsePasswordSource("").has_value());
}

TEST(PasswordPolicy, SourceNamesRoundTrip)
{
    for (const auto source : { PasswordSource::MachineDefault, PasswordSource::Prompt, PasswordSource::Environment })
    {
        EXPECT_EQ(buffervault::core::parsePasswordSource(buffervault::core::toString(source)), source);
    }
}

TEST(PasswordPolicy, MachineDefaultIsStableAndPrefixed)
{
    const auto a{ str(buffervault::core::machineDefaultPassword()) };
    const auto b{ str(buffervault::core::resolvePassword(PasswordSource::MachineDefault, {})) };
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.rfind("BufferVault-", 0), 0U);
}

TEST(PasswordPolicy, PromptUsesReader)
{
    std::string seenPrompt;
    const auto password{ buffervault::core::resolvePassword(PasswordSource::Prompt, [&](const std::string& prompt) {
        seenPrompt = prompt;
        return buffervault::security::secureStringFrom("typed");
    }) };
    EXPECT_EQ(str(password), "typed");
    EXPECT_FALSE(seenPrompt.empty());
}

TEST(PasswordPolicy, PromptRejectsEmptyOrMissingReader)
{
    EXPECT_THROW((void)buffervault::core::resolvePassword(
                     PasswordSource::Prompt, [](const std::string&) { return buffervault::security::SecureString{}; }),
                 std::runtime_error);
    EXPECT_THROW((void)buffervault::core::resolvePassword(PasswordSource::Prompt, {}), std::runtime_error);
}

TEST(PasswordPolicy, EnvironmentSourceReadsVariable)
{
    const EnvGuard guard{ buffervault::core::g_kPasswordEnvVar };

    ::setenv(buffervault::core::g_kPasswordEnvVar, "from-env", 1);
    EXPECT_EQ(str(buffervault::core::resolvePassword(PasswordSource::Environment, {})), "from-env");

    ::setenv(buffervault::core::g_kPasswordEnvVar, "", 1);
    EXPECT_THROW((void)buffervault::core::resolvePassword(PasswordSource::Environment, {}), std::runtime_error);

    ::unsetenv(buffervault::core::g_kPasswordEnvVar);
    EXPECT_THROW((void)buffervault::core::resolvePassword(PasswordSource::Environment, {}), std::runtime_error);
}
