#include "LoginView.hpp"
#include "GuiSettings.hpp"
#include "deckwarden/security/MemoryWiper.hpp"

#include <QByteArray>
#include <QHBoxLayout>
#include <QIcon>
#include <QSignalBlocker>
#include <QVBoxLayout>
#include <span>

namespace
{
constexpr int g_inputHeight = 40;
constexpr int g_buttonHeight = 45;

using deckwarden::core::Admission;
using deckwarden::core::CommandReport;
using deckwarden::gateway::ServerRegion;

QString toQString(const std::string& text)
{
    return QString::fromStdString(text);
}
} // namespace

LoginView::LoginView(deckwarden::core::SessionOrchestrator& orchestrator, QWidget* parent)
    : QWidget(parent), m_orchestrator(orchestrator)
{
    setupUi();
    pullFormFields();
    syncState();
}

void LoginView::setupUi()
{
    auto* layout = new QVBoxLayout(this); // NOLINT(cppcoreguidelines-owning-memory)
    layout->setSpacing(12);
    layout->setContentsMargins(30, 30, 30, 30);

    auto* logoLabel = new QLabel("DECKWARDEN", this); // NOLINT(cppcoreguidelines-owning-memory)
    logoLabel->setAlignment(Qt::AlignCenter);
    logoLabel->setStyleSheet(
        "font-size: 24px; font-weight: bold; letter-spacing: 4px; color: #F5D163; margin-bottom: 10px;");
    layout->addWidget(logoLabel);

    auto* statusLayout = new QHBoxLayout(); // NOLINT(cppcoreguidelines-owning-memory)
    m_statusLabel = new QLabel(this);       // NOLINT(cppcoreguidelines-owning-memory)
    m_statusLabel->setObjectName("StatusLabel");
    m_statusLabel->setWordWrap(true);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_refreshBtn = new QPushButton(QIcon(":/icons/refresh.svg"), "", this);
    m_refreshBtn->setFixedSize(g_inputHeight, g_inputHeight);
    m_refreshBtn->setToolTip("Refresh status");
    m_refreshBtn->setObjectName("RefreshButton");
    connect(m_refreshBtn, &QPushButton::clicked, this, &LoginView::onRefreshClicked);

    statusLayout->addWidget(m_statusLabel, 1);
    statusLayout->addWidget(m_refreshBtn);
    layout->addLayout(statusLayout);

    m_emailInput = new QLineEdit(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_emailInput->setPlaceholderText("Email");
    m_emailInput->setFixedHeight(g_inputHeight);
    m_emailInput->setObjectName("EmailInput");
    connect(m_emailInput, &QLineEdit::textChanged, this,
            [this](const QString& text) { m_orchestrator.form().email = text.toStdString(); });
    layout->addWidget(m_emailInput);

    auto* passLayout = new QHBoxLayout(); // NOLINT(cppcoreguidelines-owning-memory)
    passLayout->setSpacing(5);

    m_passInput = new QLineEdit(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_passInput->setEchoMode(QLineEdit::Password);
    m_passInput->setFixedHeight(g_inputHeight);
    m_passInput->setObjectName("PassInput");
    connect(m_passInput, &QLineEdit::returnPressed, this, &LoginView::onUnlockClicked);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_visibilityBtn = new QPushButton(QIcon(":/icons/eye-off.svg"), "", this);
    m_visibilityBtn->setFixedSize(g_inputHeight, g_inputHeight);
    m_visibilityBtn->setCheckable(true);
    m_visibilityBtn->setCursor(Qt::PointingHandCursor);
    connect(m_visibilityBtn, &QPushButton::toggled, this, &LoginView::togglePasswordVisibility);

    passLayout->addWidget(m_passInput);
    passLayout->addWidget(m_visibilityBtn);
    layout->addLayout(passLayout);

    m_totpInput = new QLineEdit(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_totpInput->setPlaceholderText("2FA code (optional)");
    m_totpInput->setFixedHeight(g_inputHeight);
    m_totpInput->setObjectName("TotpInput");
    connect(m_totpInput, &QLineEdit::textChanged, this,
            [this](const QString& text) { m_orchestrator.form().totpCode = text.toStdString(); });
    layout->addWidget(m_totpInput);

    m_euServer = new QCheckBox("Use EU server", this); // NOLINT(cppcoreguidelines-owning-memory)
    m_euServer->setObjectName("EuServer");
    connect(m_euServer, &QCheckBox::toggled, this,
            [this](bool checked)
            {
                const auto region = checked ? ServerRegion::Eu : ServerRegion::Us;
                m_orchestrator.form().server = region;
                deckwarden::ui::writeLoginServer(region);
            });
    layout->addWidget(m_euServer);

    m_rememberEmail = new QCheckBox("Remember email", this); // NOLINT(cppcoreguidelines-owning-memory)
    m_rememberEmail->setObjectName("RememberEmail");
    connect(m_rememberEmail, &QCheckBox::toggled, this, &LoginView::onRememberEmailToggled);
    layout->addWidget(m_rememberEmail);

    m_errorLabel = new QLabel(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_errorLabel->setObjectName("ErrorLabel");
    m_errorLabel->setWordWrap(true);
    m_errorLabel->setStyleSheet("color: #E57373;");
    layout->addWidget(m_errorLabel);

    layout->addStretch();

    auto* btnLayout = new QHBoxLayout(); // NOLINT(cppcoreguidelines-owning-memory)
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_loginBtn = new QPushButton(QIcon(":/icons/login.svg"), "LOG IN", this);
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_unlockBtn = new QPushButton(QIcon(":/icons/key.svg"), "UNLOCK", this);

    m_loginBtn->setFixedHeight(g_buttonHeight);
    m_unlockBtn->setFixedHeight(g_buttonHeight);
    m_loginBtn->setObjectName("LoginButton");
    m_unlockBtn->setObjectName("UnlockButton");

    connect(m_loginBtn, &QPushButton::clicked, this, &LoginView::onLoginClicked);
    connect(m_unlockBtn, &QPushButton::clicked, this, &LoginView::onUnlockClicked);

    btnLayout->addWidget(m_loginBtn);
    btnLayout->addWidget(m_unlockBtn);
    layout->addLayout(btnLayout);
}

void LoginView::syncState()
{
    const auto& session = m_orchestrator.session();
    QString status = toQString(deckwarden::core::describe(session));
    if (const auto command = m_orchestrator.activeCommand())
    {
        const auto name = deckwarden::core::toString(*command);
        status += QStringLiteral(" - %1...").arg(QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size())));
    }
    m_statusLabel->setText(status);

    const bool idle = !m_orchestrator.busy();
    m_loginBtn->setEnabled(idle);
    m_unlockBtn->setEnabled(idle);
    m_refreshBtn->setEnabled(idle);

    m_passInput->setPlaceholderText(m_orchestrator.credentials().passwordSaved ? "Master Password (saved)"
                                                                              : "Master Password");
    pullFormFields();
}

void LoginView::pullFormFields()
{
    const auto& form = m_orchestrator.form();

    const QString email = toQString(form.email);
    if (m_emailInput->text() != email)
    {
        const QSignalBlocker blocker(m_emailInput);
        m_emailInput->setText(email);
    }

    const QString totp = toQString(form.totpCode);
    if (m_totpInput->text() != totp)
    {
        const QSignalBlocker blocker(m_totpInput);
        m_totpInput->setText(totp);
    }

    {
        const QSignalBlocker blocker(m_euServer);
        m_euServer->setChecked(form.server == ServerRegion::Eu);
    }
    {
        const QSignalBlocker blocker(m_rememberEmail);
        m_rememberEmail->setChecked(form.rememberEmail);
    }
}

void LoginView::pushFormFields()
{
    auto& form = m_orchestrator.form();
    form.email = m_emailInput->text().toStdString();
    form.totpCode = m_totpInput->text().toStdString();
    form.server = m_euServer->isChecked() ? ServerRegion::Eu : ServerRegion::Us;

    QString password = m_passInput->text();
    QByteArray authData = password.toUtf8();
    password.fill(QChar(0));
    password.clear();
    authData.detach();

    deckwarden::security::secureClear(form.password);
    form.password.assign(authData.begin(), authData.end());
    if (!authData.isEmpty())
    {
        deckwarden::security::secureWipe(std::span{ authData.data(), static_cast<size_t>(authData.size()) });
    }
    m_passInput->clear();
}

void LoginView::togglePasswordVisibility()
{
    if (m_visibilityBtn->isChecked())
    {
        m_passInput->setEchoMode(QLineEdit::Normal);
        m_visibilityBtn->setIcon(QIcon(":/icons/eye.svg"));
    }
    else
    {
        m_passInput->setEchoMode(QLineEdit::Password);
        m_visibilityBtn->setIcon(QIcon(":/icons/eye-off.svg"));
    }
}

void LoginView::onLoginClicked()
{
    m_errorLabel->clear();
    pushFormFields();
    reportAdmission(m_orchestrator.login([this](const CommandReport& report) { reportCompletion(report); }));
}

void LoginView::onUnlockClicked()
{
    m_errorLabel->clear();
    pushFormFields();
    reportAdmission(m_orchestrator.unlock([this](const CommandReport& report) { reportCompletion(report); }));
}

void LoginView::onRefreshClicked()
{
    m_errorLabel->clear();
    reportAdmission(m_orchestrator.refresh([this](const CommandReport& report) { reportCompletion(report); }));
}

void LoginView::onRememberEmailToggled(bool checked)
{
    deckwarden::ui::writeRememberEmail(checked);
    const auto report = m_orchestrator.setRememberEmail(checked);
    if (!report.succeeded && report.error)
    {
        m_errorLabel->setText(toQString(*report.error));
    }
}

void LoginView::reportCompletion(const CommandReport& report)
{
    const QString error = report.error ? toQString(*report.error) : QString{};
    m_errorLabel->setText(error);
    emit commandFinished(report.succeeded, error);
}

void LoginView::reportAdmission(Admission admission)
{
    if (admission == Admission::Busy)
    {
        m_errorLabel->setText("Another command is still running.");
    }
}
