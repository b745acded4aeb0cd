#include "deckwarden/credentials/settings/SettingsCredentialStoreFactory.hpp"

#include "deckwarden/security/MemoryWiper.hpp"
#include <QByteArray>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <optional>
#include <span>
#include <string>

Q_LOGGING_CATEGORY(lcCredentials, "deckwarden.credentials")

namespace deckwarden::credentials::settings
{
namespace
{

[[nodiscard]] QString keyFor(CredentialKind kind)
{
    return kind == CredentialKind::Password ? QStringLiteral("credentials/password")
                                            : QStringLiteral("credentials/email");
}

void wipe(QByteArray& bytes) noexcept
{
    if (bytes.isEmpty())
    {
        return;
    }
    deckwarden::security::secureWipe(std::span{ bytes.data(), static_cast<std::size_t>(bytes.size()) });
}

class SettingsCredentialStore final : public deckwarden::credentials::ICredentialStore
{
public:
    explicit SettingsCredentialStore(std::optional<QString> iniFile) : m_iniFile(std::move(iniFile))
    {
    }

    [[nodiscard]] CredentialResult<SavedCredential> getSavedStatus(CredentialKind kind) const override
    {
        auto settings = open();
        if (settings->status() != QSettings::NoError)
        {
            qCWarning(lcCredentials) << "cannot read settings for" << keyFor(kind);
            return CredentialError{ "Could not read saved " + std::string{ toString(kind) } + "." };
        }

        const QString stored = settings->value(keyFor(kind)).toString();
        if (stored.isEmpty())
        {
            return SavedCredential{};
        }

        QByteArray bytes = stored.toUtf8();
        SavedCredential out{};
        out.saved = true;
        out.value = deckwarden::security::SecureString(bytes.begin(), bytes.end());
        wipe(bytes);
        return out;
    }

    [[nodiscard]] CredentialResult<std::monostate> save(CredentialKind kind,
                                                        const deckwarden::security::SecureString& value) override
    {
        auto settings = open();
        const auto view = deckwarden::security::asStringView(value);
        settings->setValue(keyFor(kind), QString::fromUtf8(view.data(), static_cast<qsizetype>(view.size())));
        settings->sync();
        if (settings->status() != QSettings::NoError)
        {
            qCWarning(lcCredentials) << "failed to write" << keyFor(kind);
            return CredentialError{ "Failed to save " + std::string{ toString(kind) } + "." };
        }
        return std::monostate{};
    }

    [[nodiscard]] CredentialResult<std::monostate> clear(CredentialKind kind) override
    {
        auto settings = open();
        settings->remove(keyFor(kind));
        settings->sync();
        if (settings->status() != QSettings::NoError)
        {
            qCWarning(lcCredentials) << "failed to clear" << keyFor(kind);
            return CredentialError{ "Failed to clear saved " + std::string{ toString(kind) } + "." };
        }
        return std::monostate{};
    }

private:
    [[nodiscard]] std::unique_ptr<QSettings> open() const
    {
        if (m_iniFile)
        {
            return std::make_unique<QSettings>(*m_iniFile, QSettings::IniFormat);
        }
        return std::make_unique<QSettings>();
    }

    std::optional<QString> m_iniFile;
};

} // namespace

std::unique_ptr<deckwarden::credentials::ICredentialStore> makeSettingsCredentialStore()
{
    return std::make_unique<SettingsCredentialStore>(std::nullopt);
}

std::unique_ptr<deckwarden::credentials::ICredentialStore>
makeSettingsCredentialStore(const std::filesystem::path& iniFile)
{
    return std::make_unique<SettingsCredentialStore>(QString::fromStdString(iniFile.string()));
}

} // namespace deckwarden::credentials::settings
