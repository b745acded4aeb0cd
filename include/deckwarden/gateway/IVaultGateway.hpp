#ifndef INCLUDE_DECKWARDEN_GATEWAY_IVAULTGATEWAY_HPP
#define INCLUDE_DECKWARDEN_GATEWAY_IVAULTGATEWAY_HPP

#include "deckwarden/core/VaultItem.hpp"
#include "deckwarden/gateway/ServerRegion.hpp"
#include "deckwarden/security/SecureString.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace deckwarden::gateway
{

struct GatewayError final
{
    std::string message;
};

template <class T> using GatewayResult = std::variant<T, GatewayError>;

// Invoked exactly once per call, either before the call returns or later from the event loop.
template <class T> using GatewayCallback = std::function<void(GatewayResult<T>)>;

struct StatusPayload final
{
    std::string status;
    std::optional<std::string> userEmail{};
};

struct LoginRequest final
{
    std::string email;
    deckwarden::security::SecureString password;
    ServerRegion server{ ServerRegion::Us };
    // Empty when no second factor is supplied.
    std::string totpCode;
};

// Request/response surface of the vault CLI. Every operation is asynchronous; arguments are only
// borrowed for the duration of the call.
class IVaultGateway
{
public:
    IVaultGateway() = default;
    IVaultGateway(const IVaultGateway&) = delete;
    IVaultGateway& operator=(const IVaultGateway&) = delete;
    IVaultGateway(IVaultGateway&&) = delete;
    IVaultGateway& operator=(IVaultGateway&&) = delete;
    virtual ~IVaultGateway() = default;

    virtual void status(GatewayCallback<StatusPayload> done) = 0;

    virtual void login(const LoginRequest& request, GatewayCallback<std::monostate> done) = 0;

    virtual void unlock(const deckwarden::security::SecureString& password,
                        GatewayCallback<std::monostate> done) = 0;

    virtual void sync(GatewayCallback<std::monostate> done) = 0;
    virtual void lock(GatewayCallback<std::monostate> done) = 0;
    virtual void logout(GatewayCallback<std::monostate> done) = 0;

    virtual void searchItems(std::string_view query,
                             GatewayCallback<std::vector<deckwarden::core::VaultItemSummary>> done) = 0;

    virtual void getItem(std::string_view id, GatewayCallback<deckwarden::core::VaultItemDetail> done) = 0;
};

} // namespace deckwarden::gateway

#endif // INCLUDE_DECKWARDEN_GATEWAY_IVAULTGATEWAY_HPP
