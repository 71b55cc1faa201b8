#ifndef INCLUDE_BUFFERVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "buffervault/crypto/ICryptoProvider.hpp"
#include <memory>

namespace buffervault::crypto::providers
{

[[nodiscard]] std::unique_ptr<buffervault::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace buffervault::crypto::providers

#endif // INCLUDE_BUFFERVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
