#ifndef INCLUDE_BUFFERVAULT_CORE_CLIPBOARDENTRY_HPP
#define INCLUDE_BUFFERVAULT_CORE_CLIPBOARDENTRY_HPP

#include "buffervault/core/Metadata.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace buffervault::core
{

enum class EntryType : std::uint8_t
{
    Text,
    Other,
};

[[nodiscard]] std::string_view toString(EntryType type) noexcept;

// Unknown tags read back from disk map to EntryType::Other.
[[nodiscard]] EntryType parseEntryType(std::string_view tag) noexcept;

inline constexpr std::size_t g_kDefaultPreviewLength{ 100 };

class ClipboardEntry final
{
public:
    ClipboardEntry(std::string content, double timestamp, EntryType type = EntryType::Text, Metadata metadata = {});

    [[nodiscard]] const std::string& content() const noexcept
    {
        return m_content;
    }
    // Seconds since the Unix epoch.
    [[nodiscard]] double timestamp() const noexcept
    {
        return m_timestamp;
    }
    [[nodiscard]] EntryType type() const noexcept
    {
        return m_type;
    }
    [[nodiscard]] const Metadata& metadata() const noexcept
    {
        return m_metadata;
    }

    // First `maxLength` code points, with "..." appended when truncated. "[other]" for non-text entries.
    [[nodiscard]] std::string preview(std::size_t maxLength = g_kDefaultPreviewLength) const;

    // Local time, "yyyy-MM-dd HH:mm:ss".
    [[nodiscard]] std::string displayTime() const;

    // "<whole seconds>.vault"; entries created within the same second share a name.
    [[nodiscard]] std::string vaultFileName() const;

private:
    std::string m_content;
    double m_timestamp{ 0.0 };
    EntryType m_type{ EntryType::Text };
    Metadata m_metadata;
};

using EntryPtr = std::shared_ptr<const ClipboardEntry>;

} // namespace buffervault::core

#endif // INCLUDE_BUFFERVAULT_CORE_CLIPBOARDENTRY_HPP
