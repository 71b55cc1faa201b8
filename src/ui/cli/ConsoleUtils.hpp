#ifndef BUFFERVAULT_UI_CLI_CONSOLEUTILS_HPP
#define BUFFERVAULT_UI_CLI_CONSOLEUTILS_HPP

#include "buffervault/security/SecureMemory.hpp"
#include <string>

namespace buffervault::ui::cli
{

// Reads one line from stdin with terminal echo disabled.
[[nodiscard]] buffervault::security::SecureString readPassword(const std::string& prompt);

} // namespace buffervault::ui::cli

#endif // BUFFERVAULT_UI_CLI_CONSOLEUTILS_HPP
