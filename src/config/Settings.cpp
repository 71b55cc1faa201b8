#include "buffervault/config/Settings.hpp"

#include "buffervault/LoggingCategories.hpp"
#include <QSettings>
#include <QString>
#include <QVariant>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace buffervault::config
{
namespace
{

using buffervault::log::lcConfig;

constexpr const char* g_kMaxItemsKey{ "history/maxItems" };
constexpr const char* g_kStoragePathKey{ "storage/path" };
constexpr const char* g_kEncryptionKey{ "storage/encryptionEnabled" };
constexpr const char* g_kMaxItemSizeKey{ "monitor/maxItemSizeMb" };
constexpr const char* g_kPollIntervalKey{ "monitor/pollIntervalMs" };
constexpr const char* g_kPasswordSourceKey{ "security/passwordSource" };

[[nodiscard]] QString toQString(const std::filesystem::path& path)
{
    return QString::fromStdU16String(path.u16string());
}

void warnInvalid(const char* key, const QVariant& value)
{
    qCWarning(lcConfig) << "ignoring invalid value" << value.toString() << "for" << key << "- using the default";
}

[[nodiscard]] std::optional<long long> readInteger(const QSettings& settings, const char* key, long long minimum)
{
    if (!settings.contains(QString::fromLatin1(key)))
    {
        return std::nullopt;
    }
    const QVariant value{ settings.value(QString::fromLatin1(key)) };
    bool ok{ false };
    const long long parsed{ value.toString().trimmed().toLongLong(&ok) };
    if (!ok || parsed < minimum)
    {
        warnInvalid(key, value);
        return std::nullopt;
    }
    return parsed;
}

[[nodiscard]] std::optional<bool> readBool(const QSettings& settings, const char* key)
{
    if (!settings.contains(QString::fromLatin1(key)))
    {
        return std::nullopt;
    }
    const QVariant value{ settings.value(QString::fromLatin1(key)) };
    const QString text{ value.toString().trimmed().toLower() };
    if (text == QLatin1String("true") || text == QLatin1String("1"))
    {
        return true;
    }
    if (text == QLatin1String("false") || text == QLatin1String("0"))
    {
        return false;
    }
    warnInvalid(key, value);
    return std::nullopt;
}

} // namespace

Settings loadSettings(const std::filesystem::path& iniFile)
{
    Settings out{};
    const QSettings settings{ toQString(iniFile), QSettings::IniFormat };
    if (settings.status() != QSettings::NoError)
    {
        qCWarning(lcConfig) << "cannot parse" << toQString(iniFile) << "- using defaults";
        return out;
    }

    if (const auto v{ readInteger(settings, g_kMaxItemsKey, 0) })
    {
        out.maxHistoryItems = static_cast<std::size_t>(*v);
    }
    if (settings.contains(QString::fromLatin1(g_kStoragePathKey)))
    {
        const QString path{ settings.value(QString::fromLatin1(g_kStoragePathKey)).toString().trimmed() };
        if (path.isEmpty())
        {
            warnInvalid(g_kStoragePathKey, path);
        }
        else
        {
            out.storagePath = std::filesystem::path{ path.toStdU16String() };
        }
    }
    if (const auto v{ readBool(settings, g_kEncryptionKey) })
    {
        out.encryptionEnabled = *v;
    }
    if (const auto v{ readInteger(settings, g_kMaxItemSizeKey, 1) })
    {
        out.maxItemSizeMb = static_cast<std::size_t>(*v);
    }
    if (const auto v{ readInteger(settings, g_kPollIntervalKey, 1) })
    {
        out.pollInterval = std::chrono::milliseconds{ *v };
    }
    if (settings.contains(QString::fromLatin1(g_kPasswordSourceKey)))
    {
        const QVariant value{ settings.value(QString::fromLatin1(g_kPasswordSourceKey)) };
        if (const auto source{ buffervault::core::parsePasswordSource(value.toString().trimmed().toStdString()) })
        {
            out.passwordSource = *source;
        }
        else
        {
            warnInvalid(g_kPasswordSourceKey, value);
        }
    }

    qCDebug(lcConfig) << "loaded settings from" << toQString(iniFile);
    return out;
}

void saveSettings(const std::filesystem::path& iniFile, const Settings& settings)
{
    QSettings out{ toQString(iniFile), QSettings::IniFormat };
    out.setValue(QString::fromLatin1(g_kMaxItemsKey), static_cast<qulonglong>(settings.maxHistoryItems));
    out.setValue(QString::fromLatin1(g_kStoragePathKey), toQString(settings.storagePath));
    out.setValue(QString::fromLatin1(g_kEncryptionKey), settings.encryptionEnabled);
    out.setValue(QString::fromLatin1(g_kMaxItemSizeKey), static_cast<qulonglong>(settings.maxItemSizeMb));
    out.setValue(QString::fromLatin1(g_kPollIntervalKey), static_cast<qlonglong>(settings.pollInterval.count()));
    const std::string_view source{ buffervault::core::toString(settings.passwordSource) };
    out.setValue(QString::fromLatin1(g_kPasswordSourceKey),
                 QString::fromLatin1(source.data(), static_cast<qsizetype>(source.size())));
    out.sync();
    if (out.status() != QSettings::NoError)
    {
        throw std::runtime_error("config: failed to write " + iniFile.string());
    }
}

} // namespace buffervault::config
