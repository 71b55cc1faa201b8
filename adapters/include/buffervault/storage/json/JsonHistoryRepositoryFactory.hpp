#ifndef INCLUDE_BUFFERVAULT_STORAGE_JSON_JSONHISTORYREPOSITORYFACTORY_HPP
#define INCLUDE_BUFFERVAULT_STORAGE_JSON_JSONHISTORYREPOSITORYFACTORY_HPP

#include "buffervault/storage/IHistoryRepository.hpp"
#include <memory>

namespace buffervault::storage::json
{

[[nodiscard]] std::unique_ptr<buffervault::storage::IHistoryRepository> makeJsonHistoryRepository();

} // namespace buffervault::storage::json

#endif // INCLUDE_BUFFERVAULT_STORAGE_JSON_JSONHISTORYREPOSITORYFACTORY_HPP
