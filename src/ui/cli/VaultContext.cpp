#include "VaultContext.hpp"

#include "buffervault/crypto/VaultCipher.hpp"
#include "buffervault/crypto/providers/OpenSslProviderFactory.hpp"
#include "buffervault/security/ScopeWipe.hpp"
#include "buffervault/storage/json/JsonHistoryRepositoryFactory.hpp"

#include <optional>

namespace buffervault::ui::cli
{

VaultContext openVaultContext(const buffervault::config::Settings& settings,
                              const buffervault::core::PasswordReader& passwordReader)
{
    VaultContext ctx{};
    ctx.crypto = buffervault::crypto::providers::makeOpenSslCryptoProvider();
    ctx.repository = buffervault::storage::json::makeJsonHistoryRepository();

    std::optional<buffervault::crypto::VaultCipher> cipher{};
    if (settings.encryptionEnabled)
    {
        auto password = buffervault::core::resolvePassword(settings.passwordSource, passwordReader);
        auto wipePassword = buffervault::security::scopeWipe(password);
        cipher = buffervault::crypto::VaultCipher::open(*ctx.crypto,
                                                        settings.storagePath / buffervault::storage::g_kSaltFileName,
                                                        buffervault::security::asBytes(password));
    }

    ctx.store = std::make_unique<buffervault::core::HistoryStore>(*ctx.repository, settings.storagePath,
                                                                  std::move(cipher));
    return ctx;
}

} // namespace buffervault::ui::cli
