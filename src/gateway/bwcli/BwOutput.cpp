#include "BwOutput.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <optional>
#include <string>

namespace deckwarden::gateway::bwcli
{
namespace
{

[[nodiscard]] std::optional<std::string> optionalString(const QJsonValue& value)
{
    if (!value.isString())
    {
        return std::nullopt;
    }
    const QString text = value.toString();
    if (text.isEmpty())
    {
        return std::nullopt;
    }
    return text.toStdString();
}

[[nodiscard]] GatewayError malformed(const char* what, const QJsonParseError& error)
{
    std::string message{ "Unexpected " };
    message += what;
    message += " output from bw";
    if (error.error != QJsonParseError::NoError)
    {
        message += ": ";
        message += error.errorString().toStdString();
    }
    return GatewayError{ message };
}

[[nodiscard]] deckwarden::core::VaultItemDetail itemFrom(const QJsonObject& object)
{
    deckwarden::core::VaultItemDetail item{};
    item.id = object.value(QStringLiteral("id")).toString().toStdString();
    item.name = object.value(QStringLiteral("name")).toString().toStdString();

    const QJsonObject login = object.value(QStringLiteral("login")).toObject();
    item.username = optionalString(login.value(QStringLiteral("username")));
    item.password = optionalString(login.value(QStringLiteral("password")));
    item.totp = optionalString(login.value(QStringLiteral("totp")));

    const QJsonArray uris = login.value(QStringLiteral("uris")).toArray();
    for (const QJsonValue& entry : uris)
    {
        if (auto uri = optionalString(entry.toObject().value(QStringLiteral("uri"))))
        {
            item.uris.push_back(std::move(*uri));
        }
    }
    return item;
}

} // namespace

GatewayResult<StatusPayload> parseStatus(const QByteArray& json)
{
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject())
    {
        return malformed("status", error);
    }

    const QJsonObject object = doc.object();
    StatusPayload payload{};
    payload.status = object.value(QStringLiteral("status")).toString().toStdString();
    payload.userEmail = optionalString(object.value(QStringLiteral("userEmail")));
    return payload;
}

GatewayResult<std::vector<deckwarden::core::VaultItemSummary>> parseItemList(const QByteArray& json)
{
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray())
    {
        return malformed("item list", error);
    }

    std::vector<deckwarden::core::VaultItemSummary> items{};
    const QJsonArray array = doc.array();
    items.reserve(static_cast<std::size_t>(array.size()));
    for (const QJsonValue& value : array)
    {
        const QJsonObject object = value.toObject();
        const QString id = object.value(QStringLiteral("id")).toString();
        if (id.isEmpty())
        {
            continue;
        }
        items.push_back({ id.toStdString(), object.value(QStringLiteral("name")).toString().toStdString() });
    }
    return items;
}

GatewayResult<deckwarden::core::VaultItemDetail> parseItem(const QByteArray& json)
{
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject())
    {
        return malformed("item", error);
    }

    auto item = itemFrom(doc.object());
    if (item.id.empty())
    {
        return GatewayError{ "Unexpected item output from bw: missing id" };
    }
    return item;
}

QString errorText(const QByteArray& stderrData, const QByteArray& stdoutData, int exitCode)
{
    const QString err = QString::fromUtf8(stderrData).trimmed();
    if (!err.isEmpty())
    {
        return err;
    }
    const QString out = QString::fromUtf8(stdoutData).trimmed();
    if (!out.isEmpty())
    {
        return out;
    }
    return QStringLiteral("bw exited with code %1").arg(exitCode);
}

QStringList redactedArguments(const QStringList& args)
{
    QStringList out{};
    out.reserve(args.size());
    bool redactNext = false;
    for (const QString& arg : args)
    {
        if (redactNext)
        {
            out << QStringLiteral("***");
            redactNext = false;
            continue;
        }
        out << arg;
        redactNext = (arg == QStringLiteral("--code")) || (arg == QStringLiteral("--session"));
    }
    return out;
}

} // namespace deckwarden::gateway::bwcli
