#ifndef BUFFERVAULT_UI_CLI_VAULTCONTEXT_HPP
#define BUFFERVAULT_UI_CLI_VAULTCONTEXT_HPP

#include "buffervault/config/Settings.hpp"
#include "buffervault/core/HistoryStore.hpp"
#include "buffervault/core/PasswordPolicy.hpp"
#include "buffervault/crypto/ICryptoProvider.hpp"
#include "buffervault/storage/IHistoryRepository.hpp"

#include <memory>

namespace buffervault::ui::cli
{

// The store and everything it borrows, kept alive together.
struct VaultContext final
{
    std::unique_ptr<buffervault::crypto::ICryptoProvider> crypto;
    std::unique_ptr<buffervault::storage::IHistoryRepository> repository;
    std::unique_ptr<buffervault::core::HistoryStore> store;
};

// Derives the key when encryption is enabled, then loads the history.
[[nodiscard]] VaultContext openVaultContext(const buffervault::config::Settings& settings,
                                            const buffervault::core::PasswordReader& passwordReader);

} // namespace buffervault::ui::cli

#endif // BUFFERVAULT_UI_CLI_VAULTCONTEXT_HPP
