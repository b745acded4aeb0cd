#ifndef INCLUDE_DECKWARDEN_CREDENTIALS_ICREDENTIALSTORE_HPP
#define INCLUDE_DECKWARDEN_CREDENTIALS_ICREDENTIALSTORE_HPP

#include "deckwarden/security/SecureString.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace deckwarden::credentials
{

enum class CredentialKind : std::uint8_t
{
    Password,
    Email,
};

[[nodiscard]] constexpr std::string_view toString(CredentialKind kind) noexcept
{
    return kind == CredentialKind::Password ? std::string_view{ "password" } : std::string_view{ "email" };
}

struct CredentialError final
{
    std::string message;
};

template <class T> using CredentialResult = std::variant<T, CredentialError>;

struct SavedCredential final
{
    bool saved{ false };
    std::optional<deckwarden::security::SecureString> value{};
};

// On-device storage for the remembered password and email.
class ICredentialStore
{
public:
    ICredentialStore() = default;
    ICredentialStore(const ICredentialStore&) = delete;
    ICredentialStore& operator=(const ICredentialStore&) = delete;
    ICredentialStore(ICredentialStore&&) = delete;
    ICredentialStore& operator=(ICredentialStore&&) = delete;
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual CredentialResult<SavedCredential> getSavedStatus(CredentialKind kind) const = 0;

    [[nodiscard]] virtual CredentialResult<std::monostate> save(CredentialKind kind,
                                                                const deckwarden::security::SecureString& value) = 0;

    [[nodiscard]] virtual CredentialResult<std::monostate> clear(CredentialKind kind) = 0;
};

} // namespace deckwarden::credentials

#endif // INCLUDE_DECKWARDEN_CREDENTIALS_ICREDENTIALSTORE_HPP
