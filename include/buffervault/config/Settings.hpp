#ifndef INCLUDE_BUFFERVAULT_CONFIG_SETTINGS_HPP
#define INCLUDE_BUFFERVAULT_CONFIG_SETTINGS_HPP

#include "buffervault/core/PasswordPolicy.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace buffervault::config
{

constexpr std::size_t g_defaultMaxHistoryItems{ 1000 };
constexpr const char* g_defaultStoragePath{ "clipboard_data" };
constexpr bool g_defaultEncryptionEnabled{ true };
constexpr std::size_t g_defaultMaxItemSizeMb{ 10 };
constexpr std::chrono::milliseconds g_defaultPollInterval{ 500 };

struct Settings final
{
    // 0 disables the cap.
    std::size_t maxHistoryItems{ g_defaultMaxHistoryItems };
    std::filesystem::path storagePath{ g_defaultStoragePath };
    bool encryptionEnabled{ g_defaultEncryptionEnabled };
    std::size_t maxItemSizeMb{ g_defaultMaxItemSizeMb };
    std::chrono::milliseconds pollInterval{ g_defaultPollInterval };
    buffervault::core::PasswordSource passwordSource{ buffervault::core::PasswordSource::MachineDefault };
};

// Reads an INI file. Missing keys take their defaults; invalid values are logged and replaced by defaults.
[[nodiscard]] Settings loadSettings(const std::filesystem::path& iniFile);

// Throws std::runtime_error when the file cannot be written.
void saveSettings(const std::filesystem::path& iniFile, const Settings& settings);

} // namespace buffervault::config

#endif // INCLUDE_BUFFERVAULT_CONFIG_SETTINGS_HPP
