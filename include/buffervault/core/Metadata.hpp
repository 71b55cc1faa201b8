#ifndef INCLUDE_BUFFERVAULT_CORE_METADATA_HPP
#define INCLUDE_BUFFERVAULT_CORE_METADATA_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace buffervault::core
{

using MetadataValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;
using Metadata = std::map<std::string, MetadataValue, std::less<>>;

} // namespace buffervault::core

#endif // INCLUDE_BUFFERVAULT_CORE_METADATA_HPP
