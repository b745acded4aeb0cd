#include "deckwarden/core/SessionOrchestrator.hpp"
#include "test_utils/Fakes.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <optional>

namespace
{
using deckwarden::core::Admission;
using deckwarden::core::CommandKind;
using deckwarden::core::CommandReport;
using deckwarden::core::SessionOrchestrator;
using deckwarden::core::SessionStatus;
using deckwarden::core::VaultItemDetail;
using deckwarden::core::VaultItemSummary;
using deckwarden::credentials::CredentialKind;
using deckwarden::gateway::GatewayError;
using deckwarden::gateway::ServerRegion;
using deckwarden::test_utils::FakeVaultGateway;
using deckwarden::test_utils::MemoryCredentialStore;
using deckwarden::test_utils::RecordingNotifier;

VaultItemDetail bankDetail()
{
    VaultItemDetail detail{};
    detail.id = "1";
    detail.name = "Bank";
    detail.username = "alice";
    detail.password = "s3cret";
    detail.totp = "otpauth://totp/bank";
    detail.uris = { "https://bank.example" };
    return detail;
}

class SessionOrchestratorTest : public ::testing::Test
{
protected:
    FakeVaultGateway m_gateway{};
    MemoryCredentialStore m_store{};
    RecordingNotifier m_notifier{};
    SessionOrchestrator m_orchestrator{ m_gateway, m_store, m_notifier };

    std::optional<CommandReport> m_report{};

    [[nodiscard]] deckwarden::core::CommandCallback capture()
    {
        return [this](const CommandReport& report) { m_report = report; };
    }

    void fillLoginForm(const std::string& email = "user@example.com", const std::string& password = "hunter2")
    {
        auto& form = m_orchestrator.form();
        form.email = email;
        form.password = deckwarden::security::secureStringFrom(password);
    }

    // Brings the session to Unlocked and resets the call counters.
    void startUnlocked()
    {
        m_gateway.statusResult = deckwarden::test_utils::unlockedStatus();
        ASSERT_EQ(m_orchestrator.refresh(), Admission::Started);
        ASSERT_EQ(m_orchestrator.session().status, SessionStatus::Unlocked);
        m_gateway.statusCalls = 0;
        m_notifier.toasts.clear();
    }

    void populateResults()
    {
        m_gateway.searchResult = std::vector<VaultItemSummary>{ { "1", "Bank" } };
        ASSERT_EQ(m_orchestrator.search("bank"), Admission::Started);
        m_gateway.itemResult = bankDetail();
        ASSERT_EQ(m_orchestrator.selectItem("1"), Admission::Started);
        ASSERT_TRUE(m_orchestrator.items().detail().has_value());
    }
};
} // namespace

TEST_F(SessionOrchestratorTest, LoginFailingWithLockedVaultRefreshesStatusOnce)
{
    fillLoginForm();
    m_gateway.loginResult = GatewayError{ "vault is locked" };

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_report.has_value());
    EXPECT_FALSE(m_report->succeeded);
    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_report->error, "vault is locked");
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_TRUE(m_notifier.hasTitle("Login failed"));
}

TEST_F(SessionOrchestratorTest, LoginFailingWithBadCredentialsDoesNotRefresh)
{
    fillLoginForm();
    m_gateway.loginResult = GatewayError{ "invalid credentials" };

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_report.has_value());
    EXPECT_FALSE(m_report->succeeded);
    EXPECT_FALSE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 0);
    EXPECT_FALSE(m_orchestrator.busy());
}

TEST_F(SessionOrchestratorTest, SuccessfulLoginRefreshesStatusAndNotifies)
{
    fillLoginForm("  user@example.com ");
    m_orchestrator.form().server = ServerRegion::Eu;
    m_gateway.statusResult = deckwarden::test_utils::unlockedStatus();

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_report.has_value());
    EXPECT_TRUE(m_report->succeeded);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Unlocked);
    ASSERT_TRUE(m_gateway.lastLogin.has_value());
    EXPECT_EQ(m_gateway.lastLogin->email, "user@example.com");
    EXPECT_EQ(m_gateway.lastLogin->password, "hunter2");
    EXPECT_EQ(m_gateway.lastLogin->server, ServerRegion::Eu);
    EXPECT_TRUE(m_notifier.hasTitle("Logged in"));
}

TEST_F(SessionOrchestratorTest, LoginClearsTheSecondFactorAfterEveryAttempt)
{
    fillLoginForm();
    m_orchestrator.form().totpCode = "123456";
    m_gateway.loginResult = GatewayError{ "Two-step login code is invalid." };

    ASSERT_EQ(m_orchestrator.login(), Admission::Started);
    EXPECT_EQ(m_gateway.lastLogin->totpCode, "123456");
    EXPECT_TRUE(m_orchestrator.form().totpCode.empty());

    fillLoginForm();
    m_orchestrator.form().totpCode = "654321";
    m_gateway.loginResult = std::monostate{};

    ASSERT_EQ(m_orchestrator.login(), Admission::Started);
    EXPECT_TRUE(m_orchestrator.form().totpCode.empty());
}

TEST_F(SessionOrchestratorTest, LoginClearsThePasswordField)
{
    fillLoginForm();
    ASSERT_EQ(m_orchestrator.login(), Admission::Started);
    EXPECT_TRUE(m_orchestrator.form().password.empty());
}

TEST_F(SessionOrchestratorTest, LoginWithoutEmailFailsBeforeTheGateway)
{
    fillLoginForm("   ");

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_report.has_value());
    EXPECT_EQ(m_report->error, "Enter your email address.");
    EXPECT_EQ(m_gateway.loginCalls, 0);
    EXPECT_EQ(m_gateway.statusCalls, 0);
    EXPECT_FALSE(m_orchestrator.busy());
}

TEST_F(SessionOrchestratorTest, LoginFallsBackToTheSavedPassword)
{
    m_store.put(CredentialKind::Password, "saved-pw");
    fillLoginForm("user@example.com", "");

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_gateway.lastLogin.has_value());
    EXPECT_EQ(m_gateway.lastLogin->password, "saved-pw");
}

TEST_F(SessionOrchestratorTest, LoginWithoutAnyPasswordFails)
{
    fillLoginForm("user@example.com", "");

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_report.has_value());
    EXPECT_EQ(m_report->error, "Enter your master password.");
    EXPECT_EQ(m_gateway.loginCalls, 0);
}

TEST_F(SessionOrchestratorTest, RememberEmailFailureDoesNotFailTheLogin)
{
    fillLoginForm();
    m_orchestrator.form().rememberEmail = true;
    m_store.failSave = true;
    m_gateway.statusResult = deckwarden::test_utils::unlockedStatus();

    ASSERT_EQ(m_orchestrator.login(capture()), Admission::Started);

    ASSERT_TRUE(m_report.has_value());
    EXPECT_TRUE(m_report->succeeded);
    EXPECT_TRUE(m_report->sideEffectError.has_value());
    EXPECT_TRUE(m_notifier.hasTitle("Error"));
    EXPECT_TRUE(m_notifier.hasTitle("Logged in"));
    EXPECT_FALSE(m_orchestrator.credentials().emailSaved);
}

TEST_F(SessionOrchestratorTest, RememberEmailStoresTheEmailOnSuccess)
{
    fillLoginForm();
    m_orchestrator.form().rememberEmail = true;

    ASSERT_EQ(m_orchestrator.login(), Admission::Started);

    EXPECT_EQ(m_store.stored(CredentialKind::Email), "user@example.com");
    EXPECT_TRUE(m_orchestrator.credentials().emailSaved);
}

TEST_F(SessionOrchestratorTest, UnlockUsesFormPasswordAndNotifies)
{
    m_orchestrator.form().password = deckwarden::security::secureStringFrom("hunter2");
    m_gateway.statusResult = deckwarden::test_utils::unlockedStatus();

    ASSERT_EQ(m_orchestrator.unlock(capture()), Admission::Started);

    EXPECT_EQ(m_gateway.lastUnlockPassword, "hunter2");
    EXPECT_TRUE(m_report->succeeded);
    EXPECT_TRUE(m_notifier.hasTitle("Vault unlocked"));
    EXPECT_TRUE(m_orchestrator.form().password.empty());
}

TEST_F(SessionOrchestratorTest, BlankSearchClearsResultsWithoutCallingTheGateway)
{
    startUnlocked();
    populateResults();
    const int searchesBefore = m_gateway.searchCalls;

    ASSERT_EQ(m_orchestrator.search("   ", capture()), Admission::Started);

    EXPECT_TRUE(m_report->succeeded);
    EXPECT_EQ(m_gateway.searchCalls, searchesBefore);
    EXPECT_TRUE(m_orchestrator.items().empty());
}

TEST_F(SessionOrchestratorTest, SearchReplacesResultsAndDropsTheSelection)
{
    startUnlocked();
    populateResults();
    m_gateway.searchResult = std::vector<VaultItemSummary>{ { "1", "Bank" }, { "2", "Bank (old)" } };

    ASSERT_EQ(m_orchestrator.search("bank", capture()), Admission::Started);

    EXPECT_TRUE(m_report->succeeded);
    EXPECT_EQ(m_gateway.lastQuery, "bank");
    EXPECT_EQ(m_orchestrator.items().results().size(), 2U);
    EXPECT_FALSE(m_orchestrator.items().selectedId().has_value());
    EXPECT_FALSE(m_orchestrator.items().detail().has_value());
}

TEST_F(SessionOrchestratorTest, SearchRequiresAnUnlockedVault)
{
    ASSERT_EQ(m_orchestrator.search("bank", capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_EQ(m_report->error, "Unlock the vault before searching.");
    EXPECT_EQ(m_gateway.searchCalls, 0);
}

TEST_F(SessionOrchestratorTest, SelectItemStoresTheDetail)
{
    startUnlocked();
    m_gateway.itemResult = bankDetail();

    ASSERT_EQ(m_orchestrator.selectItem("1", capture()), Admission::Started);

    EXPECT_TRUE(m_report->succeeded);
    ASSERT_TRUE(m_orchestrator.items().detail().has_value());
    EXPECT_EQ(m_orchestrator.items().detail()->username, "alice");
    EXPECT_EQ(m_gateway.lastItemId, "1");
}

TEST_F(SessionOrchestratorTest, SelectItemRejectsAMismatchedDetail)
{
    startUnlocked();
    m_gateway.itemResult = bankDetail();

    ASSERT_EQ(m_orchestrator.selectItem("2", capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_FALSE(m_orchestrator.items().detail().has_value());
}

TEST_F(SessionOrchestratorTest, SelectItemFailureLeavesNoDetail)
{
    startUnlocked();
    populateResults();
    m_gateway.itemResult = GatewayError{ "Not found." };

    ASSERT_EQ(m_orchestrator.selectItem("1", capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_FALSE(m_orchestrator.items().detail().has_value());
    EXPECT_EQ(m_gateway.statusCalls, 0);
    EXPECT_TRUE(m_notifier.hasTitle("Item failed"));
}

TEST_F(SessionOrchestratorTest, DeclinedLogoutDoesNothing)
{
    startUnlocked();

    EXPECT_EQ(m_orchestrator.logout([]() { return false; }), Admission::Declined);
    EXPECT_EQ(m_orchestrator.logout({}), Admission::Declined);
    EXPECT_EQ(m_gateway.logoutCalls, 0);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Unlocked);
}

TEST_F(SessionOrchestratorTest, ConfirmedLogoutForgetsEverythingLocal)
{
    m_store.put(CredentialKind::Password, "saved-pw");
    m_store.put(CredentialKind::Email, "user@example.com");
    m_orchestrator.initialize();
    startUnlocked();
    populateResults();
    m_gateway.statusResult = deckwarden::gateway::StatusPayload{ "unauthenticated", std::nullopt };

    ASSERT_EQ(m_orchestrator.logout([]() { return true; }, capture()), Admission::Started);

    EXPECT_TRUE(m_report->succeeded);
    EXPECT_EQ(m_gateway.logoutCalls, 1);
    EXPECT_FALSE(m_store.stored(CredentialKind::Password).has_value());
    EXPECT_FALSE(m_store.stored(CredentialKind::Email).has_value());
    EXPECT_TRUE(m_orchestrator.items().empty());
    EXPECT_FALSE(m_orchestrator.credentials().passwordSaved);
    EXPECT_FALSE(m_orchestrator.credentials().emailSaved);
    EXPECT_TRUE(m_orchestrator.form().email.empty());
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Error);
    EXPECT_TRUE(m_notifier.hasTitle("Logged out"));
}

TEST_F(SessionOrchestratorTest, SecondCommandIsRejectedWhileOneIsInFlight)
{
    startUnlocked();
    m_gateway.deferred = true;

    ASSERT_EQ(m_orchestrator.sync(), Admission::Started);
    EXPECT_TRUE(m_orchestrator.busy());
    EXPECT_EQ(m_orchestrator.activeCommand(), CommandKind::Sync);

    EXPECT_EQ(m_orchestrator.lock(), Admission::Busy);
    EXPECT_EQ(m_orchestrator.search("bank"), Admission::Busy);
    bool asked = false;
    EXPECT_EQ(m_orchestrator.logout(
                  [&]()
                  {
                      asked = true;
                      return true;
                  }),
              Admission::Busy);
    EXPECT_FALSE(asked);
    EXPECT_EQ(m_gateway.lockCalls, 0);

    m_gateway.resolveAll();
    EXPECT_FALSE(m_orchestrator.busy());
    EXPECT_EQ(m_orchestrator.lock(), Admission::Started);
}

TEST_F(SessionOrchestratorTest, SlotIsFreeWhenTheCompletionCallbackRuns)
{
    startUnlocked();

    Admission chained = Admission::Busy;
    ASSERT_EQ(m_orchestrator.sync(
                  [&](const CommandReport&)
                  {
                      EXPECT_FALSE(m_orchestrator.busy());
                      chained = m_orchestrator.refresh();
                  }),
              Admission::Started);

    EXPECT_EQ(chained, Admission::Started);
}

TEST_F(SessionOrchestratorTest, LeavingUnlockedEmptiesTheCache)
{
    startUnlocked();
    populateResults();

    m_gateway.statusResult = deckwarden::test_utils::lockedStatus();
    ASSERT_EQ(m_orchestrator.refresh(), Admission::Started);

    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Locked);
    EXPECT_TRUE(m_orchestrator.items().empty());
}

TEST_F(SessionOrchestratorTest, TransientSyncFailureReconcilesTheStatus)
{
    startUnlocked();
    populateResults();
    m_gateway.syncResult = GatewayError{ "Vault is locked." };
    m_gateway.statusResult = deckwarden::test_utils::lockedStatus();

    ASSERT_EQ(m_orchestrator.sync(capture()), Admission::Started);

    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Locked);
    EXPECT_TRUE(m_orchestrator.items().empty());
}

TEST_F(SessionOrchestratorTest, LockClearsTheCacheAndNotifies)
{
    startUnlocked();
    populateResults();
    m_gateway.statusResult = deckwarden::test_utils::lockedStatus();

    ASSERT_EQ(m_orchestrator.lock(capture()), Admission::Started);

    EXPECT_TRUE(m_report->succeeded);
    EXPECT_TRUE(m_orchestrator.items().empty());
    EXPECT_TRUE(m_notifier.hasTitle("Vault locked"));
}

TEST_F(SessionOrchestratorTest, SyncRefreshesTheStatus)
{
    startUnlocked();

    ASSERT_EQ(m_orchestrator.sync(capture()), Admission::Started);

    EXPECT_TRUE(m_report->succeeded);
    EXPECT_EQ(m_gateway.syncCalls, 1);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_TRUE(m_notifier.hasTitle("Vault synced"));
}

TEST_F(SessionOrchestratorTest, InitializePrefillsTheRememberedEmail)
{
    m_store.put(CredentialKind::Email, "remembered@example.com");

    m_orchestrator.initialize();

    EXPECT_EQ(m_orchestrator.form().email, "remembered@example.com");
    EXPECT_TRUE(m_orchestrator.form().rememberEmail);
    EXPECT_TRUE(m_orchestrator.credentials().emailSaved);
    EXPECT_FALSE(m_orchestrator.credentials().passwordSaved);
}

TEST_F(SessionOrchestratorTest, SavingABlankPasswordIsRefused)
{
    const auto report = m_orchestrator.savePassword(deckwarden::security::secureStringFrom("  "));

    EXPECT_FALSE(report.succeeded);
    EXPECT_EQ(m_store.saveCalls, 0);
    ASSERT_FALSE(m_notifier.toasts.empty());
    EXPECT_EQ(m_notifier.toasts.back().title, "Missing password");
    EXPECT_EQ(m_notifier.toasts.back().body, "Enter your password before saving.");
}

TEST_F(SessionOrchestratorTest, SavingAPasswordSetsTheFlag)
{
    const auto report = m_orchestrator.savePassword(deckwarden::security::secureStringFrom("hunter2"));

    EXPECT_TRUE(report.succeeded);
    EXPECT_TRUE(m_orchestrator.credentials().passwordSaved);
    EXPECT_EQ(m_store.stored(CredentialKind::Password), "hunter2");
    EXPECT_EQ(m_notifier.toasts.back().body, "Saved on this device.");
}

TEST_F(SessionOrchestratorTest, ForgettingThePasswordClearsTheFlagEvenOnFailure)
{
    ASSERT_TRUE(m_orchestrator.savePassword(deckwarden::security::secureStringFrom("hunter2")).succeeded);
    m_store.failClear = true;

    const auto report = m_orchestrator.forgetPassword();

    EXPECT_FALSE(report.succeeded);
    EXPECT_FALSE(m_orchestrator.credentials().passwordSaved);
    EXPECT_TRUE(m_notifier.hasTitle("Error"));
}

TEST_F(SessionOrchestratorTest, DisablingRememberEmailClearsTheSavedEmail)
{
    m_store.put(CredentialKind::Email, "user@example.com");
    m_orchestrator.initialize();

    const auto report = m_orchestrator.setRememberEmail(false);

    EXPECT_TRUE(report.succeeded);
    EXPECT_FALSE(m_orchestrator.form().rememberEmail);
    EXPECT_FALSE(m_orchestrator.credentials().emailSaved);
    EXPECT_FALSE(m_store.stored(CredentialKind::Email).has_value());
}

TEST_F(SessionOrchestratorTest, ListenerSeesEveryChange)
{
    int notifications = 0;
    m_orchestrator.setStateListener([&]() { ++notifications; });

    ASSERT_EQ(m_orchestrator.refresh(), Admission::Started);

    // Admission and completion.
    EXPECT_GE(notifications, 2);
}

TEST_F(SessionOrchestratorTest, FailedLogoutKeepsEverythingLocal)
{
    m_store.put(CredentialKind::Password, "saved-pw");
    m_store.put(CredentialKind::Email, "user@example.com");
    m_orchestrator.initialize();
    startUnlocked();
    populateResults();
    m_gateway.logoutResult = GatewayError{ "Network unreachable." };

    ASSERT_EQ(m_orchestrator.logout([]() { return true; }, capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_FALSE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 0);
    EXPECT_EQ(m_store.stored(CredentialKind::Password), "saved-pw");
    EXPECT_EQ(m_store.stored(CredentialKind::Email), "user@example.com");
    EXPECT_EQ(m_store.clearCalls, 0);
    EXPECT_TRUE(m_orchestrator.credentials().passwordSaved);
    EXPECT_TRUE(m_orchestrator.credentials().emailSaved);
    EXPECT_EQ(m_orchestrator.form().email, "user@example.com");
    EXPECT_TRUE(m_orchestrator.items().detail().has_value());
    EXPECT_EQ(m_orchestrator.items().results().size(), 1U);
    EXPECT_TRUE(m_notifier.hasTitle("Logout failed"));
}

TEST_F(SessionOrchestratorTest, TransientLogoutFailureRefreshesStatusOnce)
{
    m_store.put(CredentialKind::Password, "saved-pw");
    m_orchestrator.initialize();
    startUnlocked();
    m_gateway.logoutResult = GatewayError{ "You are not logged in: no active session." };
    m_gateway.statusResult = deckwarden::gateway::StatusPayload{ "unauthenticated", std::nullopt };

    ASSERT_EQ(m_orchestrator.logout([]() { return true; }, capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_EQ(m_store.stored(CredentialKind::Password), "saved-pw");
    EXPECT_TRUE(m_orchestrator.credentials().passwordSaved);
    EXPECT_FALSE(m_orchestrator.busy());
}

TEST_F(SessionOrchestratorTest, PermanentLockFailureKeepsTheCache)
{
    startUnlocked();
    populateResults();
    m_gateway.lockResult = GatewayError{ "bw exited with code 1" };

    ASSERT_EQ(m_orchestrator.lock(capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_FALSE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 0);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Unlocked);
    EXPECT_EQ(m_orchestrator.items().results().size(), 1U);
    EXPECT_TRUE(m_notifier.hasTitle("Lock failed"));
}

TEST_F(SessionOrchestratorTest, TransientLockFailureReconcilesTheStatus)
{
    startUnlocked();
    populateResults();
    m_gateway.lockResult = GatewayError{ "Vault is locked." };
    m_gateway.statusResult = deckwarden::test_utils::lockedStatus();

    ASSERT_EQ(m_orchestrator.lock(capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Locked);
    EXPECT_TRUE(m_orchestrator.items().empty());
}

TEST_F(SessionOrchestratorTest, TransientSearchFailureKeepsThePreviousResults)
{
    startUnlocked();
    populateResults();
    m_gateway.searchResult = GatewayError{ "Session key is invalid: unauthenticated request." };

    ASSERT_EQ(m_orchestrator.search("mail", capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Unlocked);
    ASSERT_EQ(m_orchestrator.items().results().size(), 1U);
    EXPECT_EQ(m_orchestrator.items().results().front().name, "Bank");
    EXPECT_TRUE(m_notifier.hasTitle("Search failed"));
}

TEST_F(SessionOrchestratorTest, TransientSelectFailureReconcilesTheStatus)
{
    startUnlocked();
    populateResults();
    m_gateway.itemResult = GatewayError{ "Vault is locked." };
    m_gateway.statusResult = deckwarden::test_utils::lockedStatus();

    ASSERT_EQ(m_orchestrator.selectItem("1", capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_EQ(m_orchestrator.session().status, SessionStatus::Locked);
    EXPECT_FALSE(m_orchestrator.items().detail().has_value());
    EXPECT_TRUE(m_orchestrator.items().empty());
}

TEST_F(SessionOrchestratorTest, FailedUnlockClearsThePasswordAndReconciles)
{
    m_orchestrator.form().password = deckwarden::security::secureStringFrom("hunter2");
    m_gateway.unlockResult = GatewayError{ "Vault is locked." };

    ASSERT_EQ(m_orchestrator.unlock(capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_TRUE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 1);
    EXPECT_TRUE(m_orchestrator.form().password.empty());
    EXPECT_EQ(m_gateway.lastUnlockPassword, "hunter2");
    EXPECT_TRUE(m_notifier.hasTitle("Unlock failed"));
}

TEST_F(SessionOrchestratorTest, WrongMasterPasswordDoesNotRefresh)
{
    m_orchestrator.form().password = deckwarden::security::secureStringFrom("hunter3");
    m_gateway.unlockResult = GatewayError{ "Invalid master password." };

    ASSERT_EQ(m_orchestrator.unlock(capture()), Admission::Started);

    EXPECT_FALSE(m_report->succeeded);
    EXPECT_FALSE(m_report->reconciled);
    EXPECT_EQ(m_gateway.statusCalls, 0);
    EXPECT_TRUE(m_orchestrator.form().password.empty());
}

TEST(SessionOrchestratorLifetime, OrchestratorMayGoAwayWhileACommandIsPending)
{
    auto gateway = std::make_unique<FakeVaultGateway>();
    MemoryCredentialStore store{};
    RecordingNotifier notifier{};
    auto orchestrator = std::make_unique<SessionOrchestrator>(*gateway, store, notifier);

    gateway->deferred = true;
    ASSERT_EQ(orchestrator->sync(), Admission::Started);
    ASSERT_TRUE(orchestrator->busy());
    ASSERT_EQ(gateway->pendingCount(), 1U);

    orchestrator.reset();
    gateway.reset();

    EXPECT_TRUE(notifier.toasts.empty());
}
