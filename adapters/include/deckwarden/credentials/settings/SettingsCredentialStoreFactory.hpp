#ifndef INCLUDE_DECKWARDEN_CREDENTIALS_SETTINGS_SETTINGSCREDENTIALSTOREFACTORY_HPP
#define INCLUDE_DECKWARDEN_CREDENTIALS_SETTINGS_SETTINGSCREDENTIALSTOREFACTORY_HPP

#include "deckwarden/credentials/ICredentialStore.hpp"
#include <filesystem>
#include <memory>

namespace deckwarden::credentials::settings
{

// Uses the application's default QSettings location.
[[nodiscard]] std::unique_ptr<deckwarden::credentials::ICredentialStore> makeSettingsCredentialStore();

// Uses an INI file at `iniFile`.
[[nodiscard]] std::unique_ptr<deckwarden::credentials::ICredentialStore>
makeSettingsCredentialStore(const std::filesystem::path& iniFile);

} // namespace deckwarden::credentials::settings

#endif // INCLUDE_DECKWARDEN_CREDENTIALS_SETTINGS_SETTINGSCREDENTIALSTOREFACTORY_HPP
