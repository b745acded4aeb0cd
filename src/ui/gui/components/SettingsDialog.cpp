#include "SettingsDialog.hpp"
#include "deckwarden/security/MemoryWiper.hpp"
#include "deckwarden/security/SecureString.hpp"
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QSignalBlocker>
#include <QVBoxLayout>
#include <algorithm>
#include <span>

namespace
{
constexpr int g_msPerSecond = 1000;
constexpr int g_minCliTimeoutSeconds = 5;
constexpr int g_maxCliTimeoutSeconds = 600;
constexpr int g_maxClipboardSeconds = 300;
} // namespace

SettingsDialog::SettingsDialog(deckwarden::core::SessionOrchestrator& orchestrator, QWidget* parent)
    : QDialog(parent), m_orchestrator(orchestrator)
{
    setModal(true);
    setWindowTitle("Settings");
    setupUi();
}

void SettingsDialog::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(20, 20, 20, 20);
    mainLayout->setSpacing(12);

    auto* cliBox = new QGroupBox("Bitwarden CLI", this);
    auto* cliLayout = new QFormLayout(cliBox);

    m_cliProgram = new QLineEdit(cliBox);
    m_cliProgram->setPlaceholderText("bw");
    cliLayout->addRow("Executable:", m_cliProgram);

    m_cliTimeoutSeconds = new QSpinBox(cliBox);
    m_cliTimeoutSeconds->setRange(g_minCliTimeoutSeconds, g_maxCliTimeoutSeconds);
    m_cliTimeoutSeconds->setSuffix(" sec");
    cliLayout->addRow("Timeout:", m_cliTimeoutSeconds);

    mainLayout->addWidget(cliBox);

    auto* clipboardBox = new QGroupBox("Clipboard", this);
    auto* clipboardLayout = new QFormLayout(clipboardBox);
    m_clipboardSeconds = new QSpinBox(clipboardBox);
    m_clipboardSeconds->setRange(0, g_maxClipboardSeconds);
    m_clipboardSeconds->setSuffix(" sec");
    m_clipboardSeconds->setSpecialValueText("Never");
    clipboardLayout->addRow("Auto-clear after:", m_clipboardSeconds);
    mainLayout->addWidget(clipboardBox);

    auto* passwordBox = new QGroupBox("Master password", this);
    auto* passwordLayout = new QVBoxLayout(passwordBox);

    m_rememberPassword = new QCheckBox("Remember password on this device", passwordBox);
    connect(m_rememberPassword, &QCheckBox::toggled, this, &SettingsDialog::onRememberToggled);
    passwordLayout->addWidget(m_rememberPassword);

    auto* entryLayout = new QHBoxLayout();
    m_password = new QLineEdit(passwordBox);
    m_password->setEchoMode(QLineEdit::Password);
    m_password->setPlaceholderText("Master password");
    entryLayout->addWidget(m_password);

    m_savePasswordButton = new QPushButton("Save password", passwordBox);
    connect(m_savePasswordButton, &QPushButton::clicked, this, &SettingsDialog::onSavePasswordClicked);
    entryLayout->addWidget(m_savePasswordButton);
    passwordLayout->addLayout(entryLayout);

    m_passwordStatus = new QLabel(passwordBox);
    passwordLayout->addWidget(m_passwordStatus);
    mainLayout->addWidget(passwordBox);

    auto* buttonsLayout = new QHBoxLayout();
    buttonsLayout->addStretch();

    m_cancelButton = new QPushButton("Cancel", this);
    connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    buttonsLayout->addWidget(m_cancelButton);

    m_saveButton = new QPushButton("Save", this);
    connect(m_saveButton, &QPushButton::clicked, this, &SettingsDialog::onSaveClicked);
    buttonsLayout->addWidget(m_saveButton);

    mainLayout->addLayout(buttonsLayout);

    syncRememberPassword();
}

void SettingsDialog::setCliProgram(const QString& program)
{
    m_cliProgram->setText(program);
}

void SettingsDialog::setCliTimeoutMs(int ms)
{
    const int seconds = std::clamp(ms / g_msPerSecond, g_minCliTimeoutSeconds, g_maxCliTimeoutSeconds);
    m_cliTimeoutSeconds->setValue(seconds);
}

void SettingsDialog::setClipboardTimeoutMs(int ms)
{
    const int seconds = std::clamp(ms / g_msPerSecond, 0, g_maxClipboardSeconds);
    m_clipboardSeconds->setValue(seconds);
}

void SettingsDialog::syncRememberPassword()
{
    const bool saved = m_orchestrator.credentials().passwordSaved;
    {
        const QSignalBlocker blocker(m_rememberPassword);
        m_rememberPassword->setChecked(saved);
    }
    m_password->setEnabled(saved);
    m_savePasswordButton->setEnabled(saved);
    m_passwordStatus->setText(saved ? "Saved on this device." : QString{});
    clearPasswordField();
}

QString SettingsDialog::cliProgram() const
{
    const QString program = m_cliProgram->text().trimmed();
    return program.isEmpty() ? QStringLiteral("bw") : program;
}

int SettingsDialog::cliTimeoutMs() const noexcept
{
    return m_cliTimeoutSeconds->value() * g_msPerSecond;
}

int SettingsDialog::clipboardTimeoutMs() const noexcept
{
    return m_clipboardSeconds->value() * g_msPerSecond;
}

void SettingsDialog::onRememberToggled(bool checked)
{
    m_password->setEnabled(checked);
    m_savePasswordButton->setEnabled(checked);
    if (checked)
    {
        return;
    }

    const auto report = m_orchestrator.forgetPassword();
    clearPasswordField();
    m_passwordStatus->setText(report.succeeded ? QString{} : QString::fromStdString(report.error.value_or("")));
}

void SettingsDialog::onSavePasswordClicked()
{
    QString password = m_password->text();
    QByteArray bytes = password.toUtf8();
    password.fill(QChar(0));
    bytes.detach();

    deckwarden::security::SecureString secure(bytes.begin(), bytes.end());
    if (!bytes.isEmpty())
    {
        deckwarden::security::secureWipe(std::span{ bytes.data(), static_cast<size_t>(bytes.size()) });
    }

    const auto report = m_orchestrator.savePassword(secure);
    deckwarden::security::secureClear(secure);
    if (report.succeeded)
    {
        clearPasswordField();
        m_passwordStatus->setText("Saved on this device.");
        return;
    }
    m_passwordStatus->setText(QString::fromStdString(report.error.value_or("")));
}

void SettingsDialog::clearPasswordField()
{
    if (m_password != nullptr)
    {
        m_password->clear();
    }
}

void SettingsDialog::onSaveClicked()
{
    clearPasswordField();
    accept();
}
