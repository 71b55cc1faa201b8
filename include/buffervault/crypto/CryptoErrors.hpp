#ifndef INCLUDE_BUFFERVAULT_CRYPTO_CRYPTOERRORS_HPP
#define INCLUDE_BUFFERVAULT_CRYPTO_CRYPTOERRORS_HPP

#include <stdexcept>

namespace buffervault::crypto
{

// A sealed token could not be opened: malformed, wrong key, tampered, or not UTF-8.
class DecryptionError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace buffervault::crypto

#endif // INCLUDE_BUFFERVAULT_CRYPTO_CRYPTOERRORS_HPP
