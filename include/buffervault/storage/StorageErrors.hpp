#ifndef INCLUDE_BUFFERVAULT_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_BUFFERVAULT_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace buffervault::storage
{

// Reading or writing the vault directory failed.
class PersistenceError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The index exists but does not parse as an index.
class CorruptIndexError final : public PersistenceError
{
public:
    using PersistenceError::PersistenceError;
};

} // namespace buffervault::storage

#endif // INCLUDE_BUFFERVAULT_STORAGE_STORAGEERRORS_HPP
