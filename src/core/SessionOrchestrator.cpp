#include "deckwarden/core/SessionOrchestrator.hpp"
#include "deckwarden/core/ErrorClassifier.hpp"
#include "deckwarden/security/MemoryWiper.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace deckwarden::core
{
namespace
{

using deckwarden::credentials::CredentialError;
using deckwarden::credentials::CredentialKind;
using deckwarden::gateway::GatewayError;
using deckwarden::gateway::GatewayResult;

[[nodiscard]] std::string trimmed(std::string_view text)
{
    const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && isSpace(text.front()))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back()))
    {
        text.remove_suffix(1);
    }
    return std::string{ text };
}

[[nodiscard]] bool isBlank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

[[nodiscard]] std::string messageOf(const GatewayError& error)
{
    return error.message.empty() ? std::string{ "Unknown error" } : error.message;
}

[[nodiscard]] std::string_view titleFor(CommandKind kind) noexcept
{
    switch (kind)
    {
    case CommandKind::Refresh:
        return "Status";
    case CommandKind::Login:
        return "Login";
    case CommandKind::Unlock:
        return "Unlock";
    case CommandKind::Sync:
        return "Sync";
    case CommandKind::Lock:
        return "Lock";
    case CommandKind::Logout:
        return "Logout";
    case CommandKind::Search:
        return "Search";
    case CommandKind::SelectItem:
        return "Item";
    }
    return "Vault";
}

} // namespace

SessionOrchestrator::SessionOrchestrator(deckwarden::gateway::IVaultGateway& gateway,
                                         deckwarden::credentials::ICredentialStore& store,
                                         deckwarden::notify::INotifier& notifier)
    : m_gateway(&gateway), m_store(&store), m_notifier(&notifier), m_tracker(gateway, m_cache)
{
}

void SessionOrchestrator::initialize()
{
    const auto password = m_store->getSavedStatus(CredentialKind::Password);
    const auto* savedPassword = std::get_if<deckwarden::credentials::SavedCredential>(&password);
    m_credentials.passwordSaved = (savedPassword != nullptr) && savedPassword->saved;

    const auto email = m_store->getSavedStatus(CredentialKind::Email);
    const auto* savedEmail = std::get_if<deckwarden::credentials::SavedCredential>(&email);
    m_credentials.emailSaved = (savedEmail != nullptr) && savedEmail->saved;
    if (m_credentials.emailSaved && savedEmail->value && !savedEmail->value->empty())
    {
        m_form.email = std::string{ deckwarden::security::asStringView(*savedEmail->value) };
        m_form.rememberEmail = true;
    }

    changed();
}

void SessionOrchestrator::setStateListener(StateListener listener)
{
    m_listener = std::move(listener);
}

LoginForm& SessionOrchestrator::form() noexcept
{
    return m_form;
}

const LoginForm& SessionOrchestrator::form() const noexcept
{
    return m_form;
}

const SessionInfo& SessionOrchestrator::session() const noexcept
{
    return m_tracker.info();
}

const ItemCache& SessionOrchestrator::items() const noexcept
{
    return m_cache;
}

const CredentialFlags& SessionOrchestrator::credentials() const noexcept
{
    return m_credentials;
}

bool SessionOrchestrator::busy() const noexcept
{
    return m_serializer.busy();
}

std::optional<CommandKind> SessionOrchestrator::activeCommand() const noexcept
{
    return m_serializer.activeCommand();
}

Admission SessionOrchestrator::refresh(CommandCallback done)
{
    return admit(CommandKind::Refresh,
                 [this, done = std::move(done)](const LeaseHandle& lease)
                 {
                     m_tracker.refreshStatus(
                         [this, lease, done](const SessionInfo& info)
                         {
                             CommandReport report{ CommandKind::Refresh };
                             report.succeeded = info.status != SessionStatus::Unknown;
                             if (!report.succeeded)
                             {
                                 report.error = m_tracker.lastError();
                             }
                             finish(lease, std::move(report), done);
                         });
                 });
}

Admission SessionOrchestrator::login(CommandCallback done)
{
    return admit(
        CommandKind::Login,
        [this, done = std::move(done)](const LeaseHandle& lease)
        {
            CommandReport report{ CommandKind::Login };
            if (isBlank(m_form.email))
            {
                report.error = "Enter your email address.";
                finish(lease, std::move(report), done);
                return;
            }

            deckwarden::gateway::LoginRequest request{};
            request.password = passwordForAttempt();
            if (request.password.empty())
            {
                report.error = "Enter your master password.";
                finish(lease, std::move(report), done);
                return;
            }
            request.email = trimmed(m_form.email);
            request.server = m_form.server;
            request.totpCode = trimmed(m_form.totpCode);
            deckwarden::security::secureClear(m_form.password);

            m_gateway->login(
                request,
                [this, lease, done, email = request.email](GatewayResult<std::monostate> result)
                {
                    // A 2FA code is single-use; never leave it in the field after an attempt.
                    deckwarden::security::secureWipe(m_form.totpCode);

                    CommandReport outcome{ CommandKind::Login };
                    if (const auto* error = std::get_if<GatewayError>(&result))
                    {
                        outcome.error = messageOf(*error);
                        fail(lease, std::move(outcome), done);
                        return;
                    }

                    outcome.sideEffectError = rememberEmailAfterLogin(email);
                    refreshThenSucceed(lease, std::move(outcome), done);
                });
        });
}

Admission SessionOrchestrator::unlock(CommandCallback done)
{
    return admit(CommandKind::Unlock,
                 [this, done = std::move(done)](const LeaseHandle& lease)
                 {
                     auto password = passwordForAttempt();
                     deckwarden::security::secureClear(m_form.password);
                     if (password.empty())
                     {
                         CommandReport report{ CommandKind::Unlock };
                         report.error = "Enter your master password.";
                         finish(lease, std::move(report), done);
                         return;
                     }

                     m_gateway->unlock(password,
                                       [this, lease, done](GatewayResult<std::monostate> result)
                                       {
                                           CommandReport outcome{ CommandKind::Unlock };
                                           if (const auto* error = std::get_if<GatewayError>(&result))
                                           {
                                               outcome.error = messageOf(*error);
                                               fail(lease, std::move(outcome), done);
                                               return;
                                           }
                                           refreshThenSucceed(lease, std::move(outcome), done);
                                       });
                 });
}

Admission SessionOrchestrator::sync(CommandCallback done)
{
    return admit(CommandKind::Sync,
                 [this, done = std::move(done)](const LeaseHandle& lease)
                 {
                     m_gateway->sync(
                         [this, lease, done](GatewayResult<std::monostate> result)
                         {
                             CommandReport outcome{ CommandKind::Sync };
                             if (const auto* error = std::get_if<GatewayError>(&result))
                             {
                                 outcome.error = messageOf(*error);
                                 fail(lease, std::move(outcome), done);
                                 return;
                             }
                             refreshThenSucceed(lease, std::move(outcome), done);
                         });
                 });
}

Admission SessionOrchestrator::lock(CommandCallback done)
{
    return admit(CommandKind::Lock,
                 [this, done = std::move(done)](const LeaseHandle& lease)
                 {
                     m_gateway->lock(
                         [this, lease, done](GatewayResult<std::monostate> result)
                         {
                             CommandReport outcome{ CommandKind::Lock };
                             if (const auto* error = std::get_if<GatewayError>(&result))
                             {
                                 outcome.error = messageOf(*error);
                                 fail(lease, std::move(outcome), done);
                                 return;
                             }
                             // Cleared here as well as by the refresh, in case the refreshed status is ambiguous.
                             m_cache.clear();
                             changed();
                             refreshThenSucceed(lease, std::move(outcome), done);
                         });
                 });
}

Admission SessionOrchestrator::logout(const Confirmation& confirm, CommandCallback done)
{
    if (m_serializer.busy())
    {
        return Admission::Busy;
    }
    if (!confirm || !confirm())
    {
        return Admission::Declined;
    }

    return admit(CommandKind::Logout,
                 [this, done = std::move(done)](const LeaseHandle& lease)
                 {
                     m_gateway->logout(
                         [this, lease, done](GatewayResult<std::monostate> result)
                         {
                             CommandReport outcome{ CommandKind::Logout };
                             if (const auto* error = std::get_if<GatewayError>(&result))
                             {
                                 outcome.error = messageOf(*error);
                                 fail(lease, std::move(outcome), done);
                                 return;
                             }
                             m_cache.clear();
                             outcome.sideEffectError = forgetLocalCredentials();
                             changed();
                             refreshThenSucceed(lease, std::move(outcome), done);
                         });
                 });
}

Admission SessionOrchestrator::search(std::string query, CommandCallback done)
{
    return admit(
        CommandKind::Search,
        [this, query = std::move(query), done = std::move(done)](const LeaseHandle& lease)
        {
            CommandReport report{ CommandKind::Search };
            if (isBlank(query))
            {
                m_cache.clear();
                report.succeeded = true;
                finish(lease, std::move(report), done);
                return;
            }
            if (!m_tracker.isUnlocked())
            {
                report.error = "Unlock the vault before searching.";
                finish(lease, std::move(report), done);
                return;
            }

            m_gateway->searchItems(
                trimmed(query),
                [this, lease, done](GatewayResult<std::vector<VaultItemSummary>> result)
                {
                    CommandReport outcome{ CommandKind::Search };
                    if (const auto* error = std::get_if<GatewayError>(&result))
                    {
                        outcome.error = messageOf(*error);
                        fail(lease, std::move(outcome), done);
                        return;
                    }
                    if (m_tracker.isUnlocked())
                    {
                        m_cache.replaceResults(std::move(std::get<std::vector<VaultItemSummary>>(result)));
                    }
                    outcome.succeeded = true;
                    finish(lease, std::move(outcome), done);
                });
        });
}

Admission SessionOrchestrator::selectItem(std::string id, CommandCallback done)
{
    return admit(CommandKind::SelectItem,
                 [this, id = std::move(id), done = std::move(done)](const LeaseHandle& lease)
                 {
                     CommandReport report{ CommandKind::SelectItem };
                     if (isBlank(id))
                     {
                         report.error = "No item selected.";
                         finish(lease, std::move(report), done);
                         return;
                     }
                     if (!m_tracker.isUnlocked())
                     {
                         report.error = "Unlock the vault before opening items.";
                         finish(lease, std::move(report), done);
                         return;
                     }

                     m_cache.select(id);
                     changed();

                     m_gateway->getItem(id,
                                        [this, lease, done](GatewayResult<VaultItemDetail> result)
                                        {
                                            CommandReport outcome{ CommandKind::SelectItem };
                                            if (const auto* error = std::get_if<GatewayError>(&result))
                                            {
                                                m_cache.clearDetail();
                                                outcome.error = messageOf(*error);
                                                fail(lease, std::move(outcome), done);
                                                return;
                                            }
                                            if (!m_tracker.isUnlocked() ||
                                                !m_cache.setDetail(std::move(std::get<VaultItemDetail>(result))))
                                            {
                                                m_cache.clearDetail();
                                                outcome.error = "The vault returned a different item than requested.";
                                                finish(lease, std::move(outcome), done);
                                                return;
                                            }
                                            outcome.succeeded = true;
                                            finish(lease, std::move(outcome), done);
                                        });
                 });
}

OperationReport SessionOrchestrator::savePassword(const deckwarden::security::SecureString& password)
{
    OperationReport report{};
    if (deckwarden::security::isBlank(password))
    {
        report.error = "Enter your password before saving.";
        m_notifier->notify("Missing password", *report.error);
        return report;
    }

    const auto result = m_store->save(CredentialKind::Password, password);
    if (const auto* error = std::get_if<CredentialError>(&result))
    {
        report.error = error->message.empty() ? std::string{ "Failed to save password" } : error->message;
        m_notifier->notify("Error", *report.error);
        return report;
    }

    m_credentials.passwordSaved = true;
    deckwarden::security::secureClear(m_form.password);
    report.succeeded = true;
    m_notifier->notify("Password saved", "Saved on this device.");
    changed();
    return report;
}

OperationReport SessionOrchestrator::forgetPassword()
{
    OperationReport report{};
    const auto result = m_store->clear(CredentialKind::Password);
    if (const auto* error = std::get_if<CredentialError>(&result))
    {
        report.error = error->message.empty() ? std::string{ "Failed to clear saved password" } : error->message;
        m_notifier->notify("Error", *report.error);
    }
    else
    {
        report.succeeded = true;
    }

    m_credentials.passwordSaved = false;
    deckwarden::security::secureClear(m_form.password);
    changed();
    return report;
}

OperationReport SessionOrchestrator::setRememberEmail(bool enabled)
{
    OperationReport report{};
    m_form.rememberEmail = enabled;
    if (enabled)
    {
        report.succeeded = true;
        changed();
        return report;
    }

    const auto result = m_store->clear(CredentialKind::Email);
    if (const auto* error = std::get_if<CredentialError>(&result))
    {
        report.error = error->message.empty() ? std::string{ "Failed to clear saved email" } : error->message;
        m_notifier->notify("Error", *report.error);
    }
    else
    {
        report.succeeded = true;
    }
    m_credentials.emailSaved = false;
    changed();
    return report;
}

Admission SessionOrchestrator::admit(CommandKind kind, const CommandSerializer::Action& action)
{
    return m_serializer.run(kind,
                            [this, &action](LeaseHandle lease)
                            {
                                changed();
                                action(std::move(lease));
                            });
}

void SessionOrchestrator::finish(const LeaseHandle& lease, CommandReport report, const CommandCallback& done)
{
    lease->release();
    notifyOutcome(report);
    changed();
    if (done)
    {
        done(report);
    }
}

void SessionOrchestrator::fail(const LeaseHandle& lease, CommandReport report, const CommandCallback& done)
{
    report.succeeded = false;
    if (report.error && isTransient(*report.error))
    {
        m_tracker.refreshStatus(
            [this, lease, report = std::move(report), done](const SessionInfo&) mutable
            {
                report.reconciled = true;
                finish(lease, std::move(report), done);
            });
        return;
    }
    finish(lease, std::move(report), done);
}

void SessionOrchestrator::refreshThenSucceed(const LeaseHandle& lease, CommandReport report,
                                             const CommandCallback& done)
{
    m_tracker.refreshStatus(
        [this, lease, report = std::move(report), done](const SessionInfo&) mutable
        {
            report.succeeded = true;
            finish(lease, std::move(report), done);
        });
}

deckwarden::security::SecureString SessionOrchestrator::passwordForAttempt()
{
    if (!deckwarden::security::isBlank(m_form.password))
    {
        return m_form.password;
    }

    const auto saved = m_store->getSavedStatus(CredentialKind::Password);
    if (const auto* credential = std::get_if<deckwarden::credentials::SavedCredential>(&saved))
    {
        if (credential->saved && credential->value)
        {
            return *credential->value;
        }
    }
    return {};
}

std::optional<std::string> SessionOrchestrator::rememberEmailAfterLogin(const std::string& email)
{
    if (!m_form.rememberEmail || isBlank(email))
    {
        return std::nullopt;
    }

    const auto result = m_store->save(CredentialKind::Email, deckwarden::security::secureStringFrom(email));
    if (const auto* error = std::get_if<CredentialError>(&result))
    {
        return "Logged in, but the email could not be remembered: " + error->message;
    }
    m_credentials.emailSaved = true;
    return std::nullopt;
}

std::optional<std::string> SessionOrchestrator::forgetLocalCredentials()
{
    std::optional<std::string> failure{};
    for (const auto kind : { CredentialKind::Password, CredentialKind::Email })
    {
        const auto result = m_store->clear(kind);
        if (const auto* error = std::get_if<CredentialError>(&result))
        {
            failure = "Failed to clear saved " + std::string{ deckwarden::credentials::toString(kind) } + ": " +
                      error->message;
        }
    }

    m_credentials = CredentialFlags{};
    deckwarden::security::secureClear(m_form.password);
    deckwarden::security::secureWipe(m_form.email);
    m_form.rememberEmail = false;
    return failure;
}

void SessionOrchestrator::notifyOutcome(const CommandReport& report)
{
    if (report.sideEffectError)
    {
        m_notifier->notify("Error", *report.sideEffectError);
    }

    if (!report.succeeded)
    {
        const std::string title = std::string{ titleFor(report.kind) } + " failed";
        m_notifier->notify(title, report.error.value_or("Unknown error"));
        return;
    }

    switch (report.kind)
    {
    case CommandKind::Login:
        m_notifier->notify("Logged in", describe(m_tracker.info()));
        break;
    case CommandKind::Unlock:
        m_notifier->notify("Vault unlocked", describe(m_tracker.info()));
        break;
    case CommandKind::Sync:
        m_notifier->notify("Vault synced", "Vault data is up to date.");
        break;
    case CommandKind::Lock:
        m_notifier->notify("Vault locked", describe(m_tracker.info()));
        break;
    case CommandKind::Logout:
        m_notifier->notify("Logged out", "Saved credentials were removed from this device.");
        break;
    case CommandKind::Refresh:
    case CommandKind::Search:
    case CommandKind::SelectItem:
        break;
    }
}

void SessionOrchestrator::changed() const
{
    if (m_listener)
    {
        m_listener();
    }
}

} // namespace deckwarden::core
