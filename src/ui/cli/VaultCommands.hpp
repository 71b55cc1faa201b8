#ifndef BUFFERVAULT_UI_CLI_VAULTCOMMANDS_HPP
#define BUFFERVAULT_UI_CLI_VAULTCOMMANDS_HPP

#include "buffervault/config/Settings.hpp"
#include "buffervault/core/HistoryService.hpp"

#include <cstddef>
#include <iostream>
#include <string>

namespace buffervault::ui::cli
{

inline constexpr std::size_t g_kDefaultHistoryLimit{ 20 };

// One-shot subcommands. Each returns the process exit code.
class VaultCommands final
{
public:
    VaultCommands(buffervault::core::HistoryService& service, std::ostream& out, std::ostream& err);

    int history(std::size_t limit);
    int search(const std::string& query);
    int restore(std::size_t index);
    int remove(std::size_t index);
    int clear();
    int stats();
    int inspect(std::size_t index);

private:
    buffervault::core::HistoryService& m_service;
    std::ostream& m_out;
    std::ostream& m_err;

    void printEntry(std::size_t index, const buffervault::core::ClipboardEntry& entry);
};

void printSettings(const buffervault::config::Settings& settings, std::ostream& out);

} // namespace buffervault::ui::cli

#endif // BUFFERVAULT_UI_CLI_VAULTCOMMANDS_HPP
