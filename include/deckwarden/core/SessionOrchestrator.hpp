#ifndef INCLUDE_DECKWARDEN_CORE_SESSIONORCHESTRATOR_HPP
#define INCLUDE_DECKWARDEN_CORE_SESSIONORCHESTRATOR_HPP

#include "deckwarden/core/CommandSerializer.hpp"
#include "deckwarden/core/ItemCache.hpp"
#include "deckwarden/core/SessionStatus.hpp"
#include "deckwarden/core/SessionTracker.hpp"
#include "deckwarden/credentials/ICredentialStore.hpp"
#include "deckwarden/gateway/IVaultGateway.hpp"
#include "deckwarden/notify/INotifier.hpp"
#include "deckwarden/security/SecureString.hpp"
#include <functional>
#include <optional>
#include <string>

namespace deckwarden::core
{

// In-memory contents of the login form fields.
struct LoginForm final
{
    std::string email;
    deckwarden::security::SecureString password;
    std::string totpCode;
    deckwarden::gateway::ServerRegion server{ deckwarden::gateway::ServerRegion::Us };
    bool rememberEmail{ false };
};

struct CredentialFlags final
{
    bool passwordSaved{ false };
    bool emailSaved{ false };
};

struct CommandReport final
{
    CommandKind kind{ CommandKind::Refresh };
    bool succeeded{ false };
    std::optional<std::string> error{};
    // A follow-up step failed after the primary operation succeeded; the success stands.
    std::optional<std::string> sideEffectError{};
    // The failure looked like session loss and the status was re-queried before completion.
    bool reconciled{ false };
};

struct OperationReport final
{
    bool succeeded{ false };
    std::optional<std::string> error{};
};

using CommandCallback = std::function<void(const CommandReport&)>;
using Confirmation = std::function<bool()>;
using StateListener = std::function<void()>;

// Coordinates every session-mutating command against the single CLI session. At most one command
// runs at a time; each one releases the slot before its completion callback fires.
class SessionOrchestrator final
{
public:
    SessionOrchestrator(deckwarden::gateway::IVaultGateway& gateway, deckwarden::credentials::ICredentialStore& store,
                        deckwarden::notify::INotifier& notifier);

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;
    SessionOrchestrator(SessionOrchestrator&&) = delete;
    SessionOrchestrator& operator=(SessionOrchestrator&&) = delete;
    ~SessionOrchestrator() = default;

    // Reads the saved-credential flags and pre-fills the email field from the store.
    void initialize();

    // Called after every observable change (admission, cache, status, completion).
    void setStateListener(StateListener listener);

    [[nodiscard]] LoginForm& form() noexcept;
    [[nodiscard]] const LoginForm& form() const noexcept;
    [[nodiscard]] const SessionInfo& session() const noexcept;
    [[nodiscard]] const ItemCache& items() const noexcept;
    [[nodiscard]] const CredentialFlags& credentials() const noexcept;
    [[nodiscard]] bool busy() const noexcept;
    [[nodiscard]] std::optional<CommandKind> activeCommand() const noexcept;

    [[nodiscard]] Admission refresh(CommandCallback done = {});

    // Uses the form's email, password (or the saved password when the field is blank), region and 2FA code.
    [[nodiscard]] Admission login(CommandCallback done = {});

    // Uses the form's password, or the saved password when the field is blank.
    [[nodiscard]] Admission unlock(CommandCallback done = {});

    [[nodiscard]] Admission sync(CommandCallback done = {});
    [[nodiscard]] Admission lock(CommandCallback done = {});

    // `confirm` is asked only when the slot is free; declining (or passing no confirmation) does nothing.
    [[nodiscard]] Admission logout(const Confirmation& confirm, CommandCallback done = {});

    [[nodiscard]] Admission search(std::string query, CommandCallback done = {});
    [[nodiscard]] Admission selectItem(std::string id, CommandCallback done = {});

    [[nodiscard]] OperationReport savePassword(const deckwarden::security::SecureString& password);
    [[nodiscard]] OperationReport forgetPassword();
    [[nodiscard]] OperationReport setRememberEmail(bool enabled);

private:
    Admission admit(CommandKind kind, const CommandSerializer::Action& action);

    void finish(const LeaseHandle& lease, CommandReport report, const CommandCallback& done);
    void fail(const LeaseHandle& lease, CommandReport report, const CommandCallback& done);
    void refreshThenSucceed(const LeaseHandle& lease, CommandReport report, const CommandCallback& done);

    [[nodiscard]] deckwarden::security::SecureString passwordForAttempt();
    [[nodiscard]] std::optional<std::string> rememberEmailAfterLogin(const std::string& email);
    [[nodiscard]] std::optional<std::string> forgetLocalCredentials();

    void notifyOutcome(const CommandReport& report);
    void changed() const;

    deckwarden::gateway::IVaultGateway* m_gateway{ nullptr };
    deckwarden::credentials::ICredentialStore* m_store{ nullptr };
    deckwarden::notify::INotifier* m_notifier{ nullptr };

    ItemCache m_cache;
    SessionTracker m_tracker;
    CommandSerializer m_serializer;
    LoginForm m_form;
    CredentialFlags m_credentials;
    StateListener m_listener;
};

} // namespace deckwarden::core

#endif // INCLUDE_DECKWARDEN_CORE_SESSIONORCHESTRATOR_HPP
