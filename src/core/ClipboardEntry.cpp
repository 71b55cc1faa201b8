#include "buffervault/core/ClipboardEntry.hpp"
#include <QDateTime>
#include <QString>
#include <cmath>
#include <utility>

namespace buffervault::core
{
namespace
{

constexpr std::string_view g_kTextTag{ "text" };
constexpr std::string_view g_kOtherTag{ "other" };

} // namespace

std::string_view toString(EntryType type) noexcept
{
    return type == EntryType::Text ? g_kTextTag : g_kOtherTag;
}

EntryType parseEntryType(std::string_view tag) noexcept
{
    return tag == g_kTextTag ? EntryType::Text : EntryType::Other;
}

ClipboardEntry::ClipboardEntry(std::string content, double timestamp, EntryType type, Metadata metadata)
    : m_content{ std::move(content) }, m_timestamp{ timestamp }, m_type{ type }, m_metadata{ std::move(metadata) }
{
}

std::string ClipboardEntry::preview(std::size_t maxLength) const
{
    if (m_type != EntryType::Text)
    {
        return "[other]";
    }

    const QString text{ QString::fromStdString(m_content) };
    const auto codePoints{ text.toUcs4() };
    if (static_cast<std::size_t>(codePoints.size()) <= maxLength)
    {
        return m_content;
    }

    const QString head{ QString::fromUcs4(reinterpret_cast<const char32_t*>(codePoints.constData()),
                                                    static_cast<qsizetype>(maxLength)) };
    return head.toStdString() + "...";
}

std::string ClipboardEntry::displayTime() const
{
    const auto millis{ static_cast<qint64>(std::llround(m_timestamp * 1000.0)) };
    return QDateTime::fromMSecsSinceEpoch(millis)
        .toLocalTime()
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
        .toStdString();
}

std::string ClipboardEntry::vaultFileName() const
{
    return std::to_string(static_cast<std::int64_t>(std::trunc(m_timestamp))) + ".vault";
}

} // namespace buffervault::core
