#include "buffervault/storage/json/JsonHistoryRepositoryFactory.hpp"

#include "buffervault/storage/IHistoryRepository.hpp"
#include "buffervault/storage/StorageErrors.hpp"
#include <QByteArray>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QMetaType>
#include <QSaveFile>
#include <QString>
#include <QVariant>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

namespace buffervault::storage::json
{
namespace
{

constexpr QJsonDocument::JsonFormat g_kIndexFormat{ QJsonDocument::Indented };
constexpr auto g_kBase64Options{ QByteArray::Base64UrlEncoding };

[[nodiscard]] QString toQString(const std::filesystem::path& path)
{
    return QString::fromStdU16String(path.u16string());
}

[[nodiscard]] std::filesystem::path indexPathFor(const std::filesystem::path& vaultDir)
{
    return vaultDir / g_kIndexFileName;
}

void ensureVaultDir(const std::filesystem::path& vaultDir)
{
    std::error_code ec{};
    std::filesystem::create_directories(vaultDir, ec);
    if (ec)
    {
        throw PersistenceError("storage: failed to create vault directory");
    }
}

// Writes through a temporary file that replaces the target only on commit.
void writeFileAtomically(const std::filesystem::path& path, const QByteArray& bytes)
{
    QSaveFile file{ toQString(path) };
    if (!file.open(QIODevice::WriteOnly))
    {
        throw PersistenceError("storage: failed to open " + path.filename().string() + " for writing");
    }
    if (file.write(bytes) != bytes.size())
    {
        file.cancelWriting();
        throw PersistenceError("storage: failed to write " + path.filename().string());
    }
    if (!file.commit())
    {
        throw PersistenceError("storage: failed to commit " + path.filename().string());
    }
}

[[nodiscard]] QJsonValue metadataValueToJson(const buffervault::core::MetadataValue& value)
{
    return std::visit(
        [](const auto& v) -> QJsonValue
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>)
            {
                return QJsonValue{ QJsonValue::Null };
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return QJsonValue{ v };
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return QJsonValue{ static_cast<qint64>(v) };
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return QJsonValue{ v };
            }
            else
            {
                return QJsonValue{ QString::fromStdString(v) };
            }
        },
        value);
}

[[nodiscard]] buffervault::core::MetadataValue metadataValueFromJson(const QJsonValue& value)
{
    switch (value.type())
    {
    case QJsonValue::Null:
        return nullptr;
    case QJsonValue::Bool:
        return value.toBool();
    case QJsonValue::Double:
        if (value.toVariant().typeId() == QMetaType::LongLong)
        {
            return static_cast<std::int64_t>(value.toInteger());
        }
        return value.toDouble();
    case QJsonValue::String:
        return value.toString().toStdString();
    default:
        throw CorruptIndexError("storage: metadata values must be scalars");
    }
}

[[nodiscard]] QJsonObject recordToJson(const IndexRecord& record)
{
    QJsonObject obj{};
    if (record.sealedContent)
    {
        const QByteArray raw{ reinterpret_cast<const char*>(record.sealedContent->data()),
                              static_cast<qsizetype>(record.sealedContent->size()) };
        obj.insert(QStringLiteral("sealed_content"), QString::fromLatin1(raw.toBase64(g_kBase64Options)));
    }
    else
    {
        obj.insert(QStringLiteral("content"), QString::fromStdString(record.content.value_or(std::string{})));
    }
    obj.insert(QStringLiteral("timestamp"), record.timestamp);
    obj.insert(QStringLiteral("entry_type"), QString::fromStdString(record.entryType));

    QJsonObject metadata{};
    for (const auto& [key, value] : record.metadata)
    {
        metadata.insert(QString::fromStdString(key), metadataValueToJson(value));
    }
    obj.insert(QStringLiteral("metadata"), metadata);
    if (record.vaultFile)
    {
        obj.insert(QStringLiteral("vault_file"), QString::fromStdString(*record.vaultFile));
    }
    return obj;
}

[[nodiscard]] IndexRecord recordFromJson(const QJsonValue& value)
{
    if (!value.isObject())
    {
        throw CorruptIndexError("storage: index entries must be objects");
    }
    const QJsonObject obj{ value.toObject() };

    IndexRecord record{};
    const QJsonValue sealed{ obj.value(QStringLiteral("sealed_content")) };
    const QJsonValue content{ obj.value(QStringLiteral("content")) };
    if (sealed.isString())
    {
        const auto decoded{ QByteArray::fromBase64Encoding(sealed.toString().toLatin1(),
                                                           g_kBase64Options | QByteArray::AbortOnBase64DecodingErrors) };
        if (!decoded)
        {
            throw CorruptIndexError("storage: sealed_content is not base64url");
        }
        record.sealedContent = std::vector<std::uint8_t>(decoded.decoded.begin(), decoded.decoded.end());
    }
    else if (content.isString())
    {
        record.content = content.toString().toStdString();
    }
    else
    {
        throw CorruptIndexError("storage: index entry has no content");
    }

    const QJsonValue timestamp{ obj.value(QStringLiteral("timestamp")) };
    if (!timestamp.isDouble())
    {
        throw CorruptIndexError("storage: index entry has no numeric timestamp");
    }
    record.timestamp = timestamp.toDouble();

    const QJsonValue entryType{ obj.value(QStringLiteral("entry_type")) };
    if (entryType.isString())
    {
        record.entryType = entryType.toString().toStdString();
    }

    const QJsonValue metadata{ obj.value(QStringLiteral("metadata")) };
    if (metadata.isObject())
    {
        const QJsonObject metaObj{ metadata.toObject() };
        for (auto it{ metaObj.begin() }; it != metaObj.end(); ++it)
        {
            record.metadata.emplace(it.key().toStdString(), metadataValueFromJson(it.value()));
        }
    }
    else if (!metadata.isUndefined() && !metadata.isNull())
    {
        throw CorruptIndexError("storage: metadata must be an object");
    }

    const QJsonValue vaultFile{ obj.value(QStringLiteral("vault_file")) };
    if (vaultFile.isString())
    {
        const std::string name{ vaultFile.toString().toStdString() };
        if (name.empty() || name == "." || name == ".." || std::filesystem::path{ name }.filename().string() != name)
        {
            throw CorruptIndexError("storage: vault_file must be a plain file name");
        }
        record.vaultFile = name;
    }

    return record;
}

class JsonHistoryRepository final : public buffervault::storage::IHistoryRepository
{
public:
    [[nodiscard]] std::optional<std::vector<IndexRecord>>
    loadIndex(const std::filesystem::path& vaultDir) const override
    {
        const auto indexPath{ indexPathFor(vaultDir) };
        std::error_code ec{};
        if (!std::filesystem::exists(indexPath, ec))
        {
            if (ec)
            {
                throw PersistenceError("storage: failed to probe index");
            }
            return std::nullopt;
        }

        QFile file{ toQString(indexPath) };
        if (!file.open(QIODevice::ReadOnly))
        {
            throw PersistenceError("storage: failed to open index for reading");
        }
        const QByteArray bytes{ file.readAll() };

        QJsonParseError parseError{};
        const QJsonDocument doc{ QJsonDocument::fromJson(bytes, &parseError) };
        if (parseError.error != QJsonParseError::NoError)
        {
            throw CorruptIndexError("storage: index is not valid JSON: " + parseError.errorString().toStdString());
        }
        if (!doc.isArray())
        {
            throw CorruptIndexError("storage: index must be a JSON array");
        }

        const QJsonArray array{ doc.array() };
        std::vector<IndexRecord> records{};
        records.reserve(static_cast<std::size_t>(array.size()));
        for (const QJsonValue& value : array)
        {
            records.push_back(recordFromJson(value));
        }
        return records;
    }

    void storeIndex(const std::filesystem::path& vaultDir, const std::vector<IndexRecord>& records) override
    {
        ensureVaultDir(vaultDir);

        QJsonArray array{};
        for (const auto& record : records)
        {
            array.append(recordToJson(record));
        }
        writeFileAtomically(indexPathFor(vaultDir), QJsonDocument{ array }.toJson(g_kIndexFormat));
    }

    std::filesystem::path quarantineIndex(const std::filesystem::path& vaultDir) override
    {
        const auto seconds{
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
                .count() };
        const auto indexPath{ indexPathFor(vaultDir) };
        auto target{ vaultDir / (std::string{ g_kIndexFileName } + ".corrupt-" + std::to_string(seconds)) };

        std::error_code ec{};
        std::filesystem::rename(indexPath, target, ec);
        if (ec)
        {
            throw PersistenceError("storage: failed to quarantine index: " + ec.message());
        }
        return target;
    }

    void writeBlob(const std::filesystem::path& vaultDir, const std::string& name,
                   std::span<const std::uint8_t> bytes) override
    {
        ensureVaultDir(vaultDir);
        writeFileAtomically(vaultDir / name, QByteArray{ reinterpret_cast<const char*>(bytes.data()),
                                                         static_cast<qsizetype>(bytes.size()) });
    }

    [[nodiscard]] std::optional<std::vector<std::uint8_t>> readBlob(const std::filesystem::path& vaultDir,
                                                                    const std::string& name) const override
    {
        const auto path{ vaultDir / name };
        std::error_code ec{};
        if (!std::filesystem::exists(path, ec))
        {
            if (ec)
            {
                throw PersistenceError("storage: failed to probe " + name);
            }
            return std::nullopt;
        }

        QFile file{ toQString(path) };
        if (!file.open(QIODevice::ReadOnly))
        {
            throw PersistenceError("storage: failed to open " + name + " for reading");
        }
        const QByteArray bytes{ file.readAll() };
        return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
    }

    bool deleteBlob(const std::filesystem::path& vaultDir, const std::string& name) override
    {
        std::error_code ec{};
        const bool removed{ std::filesystem::remove(vaultDir / name, ec) };
        if (ec)
        {
            throw PersistenceError("storage: failed to delete " + name + ": " + ec.message());
        }
        return removed;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<buffervault::storage::IHistoryRepository> makeJsonHistoryRepository()
{
    return std::make_unique<JsonHistoryRepository>();
}

} // namespace buffervault::storage::json
