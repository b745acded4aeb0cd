#include "DashboardView.hpp"
#include "GuiLogging.hpp"
#include "deckwarden/security/MemoryWiper.hpp"
#include <QClipboard>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QIcon>
#include <QMessageBox>
#include <QVBoxLayout>
#include <algorithm>
#include <initializer_list>

namespace
{
constexpr int g_margin = 20;
constexpr int g_spacing = 12;
constexpr int g_iconSize = 35;
constexpr auto g_masked = "••••••••";

using deckwarden::core::Admission;
using deckwarden::core::CommandReport;

QString toQString(const std::string& text)
{
    return QString::fromStdString(text);
}
} // namespace

DashboardView::DashboardView(deckwarden::core::SessionOrchestrator& orchestrator,
                             deckwarden::clipboard::ClipboardCopier& copier, QWidget* parent)
    : QWidget(parent), m_orchestrator(orchestrator), m_copier(copier)
{
    setupUi();
    syncState();
}

void DashboardView::setupUi()
{
    auto* layout = new QVBoxLayout(this); // NOLINT(cppcoreguidelines-owning-memory)
    layout->setContentsMargins(g_margin, g_margin, g_margin, g_margin);
    layout->setSpacing(g_spacing);

    m_statusLabel = new QLabel(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_statusLabel->setObjectName("StatusLabel");
    m_statusLabel->setWordWrap(true);
    layout->addWidget(m_statusLabel);

    auto* toolbarLayout = new QHBoxLayout(); // NOLINT(cppcoreguidelines-owning-memory)

    m_searchBar = new QLineEdit(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_searchBar->setPlaceholderText("Search vault...");
    m_searchBar->setFixedHeight(g_iconSize);
    m_searchBar->setObjectName("SearchInput");
    connect(m_searchBar, &QLineEdit::returnPressed, this, &DashboardView::onSearchSubmitted);

    m_btnSearch = new QPushButton(QIcon(":/icons/search.svg"), "", this); // NOLINT(cppcoreguidelines-owning-memory)
    m_btnSearch->setFixedSize(g_iconSize, g_iconSize);
    m_btnSearch->setCursor(Qt::PointingHandCursor);
    m_btnSearch->setObjectName("SearchButton");
    connect(m_btnSearch, &QPushButton::clicked, this, &DashboardView::onSearchSubmitted);

    m_btnSettings = new QPushButton(QIcon(":/icons/settings.svg"), "", this); // NOLINT(cppcoreguidelines-owning-memory)
    m_btnSettings->setFixedSize(g_iconSize, g_iconSize);
    m_btnSettings->setCursor(Qt::PointingHandCursor);
    m_btnSettings->setObjectName("IconButton");
    connect(m_btnSettings, &QPushButton::clicked, this, &DashboardView::settingsClicked);

    toolbarLayout->addWidget(m_searchBar);
    toolbarLayout->addWidget(m_btnSearch);
    toolbarLayout->addWidget(m_btnSettings);
    layout->addLayout(toolbarLayout);

    m_listWidget = new QListWidget(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_listWidget->setFrameShape(QFrame::NoFrame);
    m_listWidget->setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    m_listWidget->setObjectName("ResultList");
    connect(m_listWidget, &QListWidget::itemClicked, this, &DashboardView::onItemClicked);
    layout->addWidget(m_listWidget, 1);

    m_detailPanel = new QWidget(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_detailPanel->setObjectName("DetailPanel");
    auto* detailLayout = new QVBoxLayout(m_detailPanel); // NOLINT(cppcoreguidelines-owning-memory)
    detailLayout->setContentsMargins(0, 0, 0, 0);

    m_itemName = new QLabel(m_detailPanel); // NOLINT(cppcoreguidelines-owning-memory)
    m_itemName->setStyleSheet("font-weight: bold; font-size: 16px;");
    detailLayout->addWidget(m_itemName);

    auto* fields = new QFormLayout(); // NOLINT(cppcoreguidelines-owning-memory)
    addCopyRow(fields, "Username", m_usernameValue, Field::Username);
    addCopyRow(fields, "Password", m_passwordValue, Field::Password);
    addCopyRow(fields, "TOTP", m_totpValue, Field::Totp);
    addCopyRow(fields, "URI", m_uriValue, Field::Uri);
    detailLayout->addLayout(fields);
    layout->addWidget(m_detailPanel);

    m_errorLabel = new QLabel(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_errorLabel->setObjectName("ErrorLabel");
    m_errorLabel->setWordWrap(true);
    m_errorLabel->setStyleSheet("color: #E57373;");
    layout->addWidget(m_errorLabel);

    auto* actions = new QHBoxLayout(); // NOLINT(cppcoreguidelines-owning-memory)
    m_btnSync = new QPushButton(QIcon(":/icons/sync.svg"), "SYNC", this);        // NOLINT(cppcoreguidelines-owning-memory)
    m_btnLock = new QPushButton(QIcon(":/icons/lock.svg"), "LOCK", this);        // NOLINT(cppcoreguidelines-owning-memory)
    m_btnLogout = new QPushButton(QIcon(":/icons/logout.svg"), "LOG OUT", this); // NOLINT(cppcoreguidelines-owning-memory)
    m_btnSync->setObjectName("SyncButton");
    m_btnLock->setObjectName("LockButton");
    m_btnLogout->setObjectName("LogoutButton");
    connect(m_btnSync, &QPushButton::clicked, this, &DashboardView::onSyncClicked);
    connect(m_btnLock, &QPushButton::clicked, this, &DashboardView::onLockClicked);
    connect(m_btnLogout, &QPushButton::clicked, this, &DashboardView::onLogoutClicked);
    actions->addWidget(m_btnSync);
    actions->addWidget(m_btnLock);
    actions->addWidget(m_btnLogout);
    layout->addLayout(actions);

    m_clipboardTimer = new QTimer(this); // NOLINT(cppcoreguidelines-owning-memory)
    m_clipboardTimer->setSingleShot(true);
    connect(m_clipboardTimer, &QTimer::timeout, this, &DashboardView::clearClipboardIfUnchanged);
}

QPushButton* DashboardView::addCopyRow(QFormLayout* form, const QString& label, QLabel*& valueLabel, Field field)
{
    auto* row = new QHBoxLayout(); // NOLINT(cppcoreguidelines-owning-memory)
    valueLabel = new QLabel(m_detailPanel); // NOLINT(cppcoreguidelines-owning-memory)
    valueLabel->setTextInteractionFlags(Qt::NoTextInteraction);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* copyBtn = new QPushButton(QIcon(":/icons/copy.svg"), "Copy", m_detailPanel);
    copyBtn->setObjectName(QStringLiteral("Copy%1Button").arg(label));
    copyBtn->setCursor(Qt::PointingHandCursor);
    connect(copyBtn, &QPushButton::clicked, this, [this, field]() { copyField(field); });

    row->addWidget(valueLabel, 1);
    row->addWidget(copyBtn);
    form->addRow(label + ":", row);
    m_copyButtons.push_back(copyBtn);
    return copyBtn;
}

void DashboardView::setClipboardTimeoutMs(int timeoutMs) noexcept
{
    m_copyTimeoutMs = std::max(timeoutMs, 0);
}

void DashboardView::syncState()
{
    QString status = toQString(deckwarden::core::describe(m_orchestrator.session()));
    if (const auto command = m_orchestrator.activeCommand())
    {
        const auto name = deckwarden::core::toString(*command);
        status += QStringLiteral(" - %1...").arg(QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size())));
    }
    m_statusLabel->setText(status);

    const bool idle = !m_orchestrator.busy();
    for (auto* button : { m_btnSearch, m_btnSync, m_btnLock, m_btnLogout })
    {
        button->setEnabled(idle);
    }
    m_listWidget->setEnabled(idle);

    rebuildList();
    showDetail();
}

void DashboardView::rebuildList()
{
    const auto& results = m_orchestrator.items().results();
    if (results != m_shownResults)
    {
        m_shownResults = results;
        m_listWidget->clear();
        for (const auto& summary : m_shownResults)
        {
            auto* item = new QListWidgetItem(toQString(summary.name)); // NOLINT(cppcoreguidelines-owning-memory)
            item->setData(Qt::UserRole, toQString(summary.id));
            m_listWidget->addItem(item);
        }
    }

    const auto& selected = m_orchestrator.items().selectedId();
    for (int i = 0; i < m_listWidget->count(); ++i)
    {
        auto* item = m_listWidget->item(i);
        const bool isSelected = selected && item->data(Qt::UserRole).toString() == toQString(*selected);
        item->setSelected(isSelected);
    }
}

void DashboardView::showDetail()
{
    const auto& detail = m_orchestrator.items().detail();
    m_detailPanel->setVisible(m_orchestrator.items().selectedId().has_value());
    if (!detail)
    {
        const bool loading = m_orchestrator.items().selectedId().has_value();
        m_itemName->setText(loading ? "Loading..." : QString{});
        for (auto* label : { m_usernameValue, m_passwordValue, m_totpValue, m_uriValue })
        {
            label->clear();
        }
        for (auto* button : m_copyButtons)
        {
            button->setEnabled(false);
        }
        return;
    }

    m_itemName->setText(toQString(detail->name));
    m_usernameValue->setText(toQString(detail->username.value_or("")));
    m_passwordValue->setText(detail->password ? QString::fromUtf8(g_masked) : QString{});
    m_totpValue->setText(detail->totp ? QString::fromUtf8(g_masked) : QString{});
    m_uriValue->setText(detail->uris.empty() ? QString{} : toQString(detail->uris.front()));

    m_copyButtons[0]->setEnabled(detail->username.has_value());
    m_copyButtons[1]->setEnabled(detail->password.has_value());
    m_copyButtons[2]->setEnabled(detail->totp.has_value());
    m_copyButtons[3]->setEnabled(!detail->uris.empty());
}

void DashboardView::copyField(Field field)
{
    const auto& detail = m_orchestrator.items().detail();
    if (!detail)
    {
        return;
    }

    std::string value{};
    const char* label = "";
    bool secret = false;
    switch (field)
    {
    case Field::Username:
        value = detail->username.value_or("");
        label = "Username";
        break;
    case Field::Password:
        value = detail->password.value_or("");
        label = "Password";
        secret = true;
        break;
    case Field::Totp:
        value = detail->totp.value_or("");
        label = "TOTP";
        secret = true;
        break;
    case Field::Uri:
        value = detail->uris.empty() ? std::string{} : detail->uris.front();
        label = "URI";
        break;
    }

    const auto result = m_copier.copy(value, label);
    if (result.success && secret && m_copyTimeoutMs > 0)
    {
        m_lastCopied = QString::fromStdString(value);
        m_clipboardTimer->start(m_copyTimeoutMs);
    }
    deckwarden::security::secureWipe(value);
}

void DashboardView::clearClipboardIfUnchanged()
{
    auto* clipboard = QGuiApplication::clipboard();
    if (clipboard != nullptr && !m_lastCopied.isEmpty() && clipboard->text() == m_lastCopied)
    {
        clipboard->clear();
        qCInfo(lcGui) << "clipboard cleared";
    }
    m_lastCopied.fill(QChar(0));
    m_lastCopied.clear();
}

void DashboardView::clearSensitiveFields()
{
    m_searchBar->clear();
    m_errorLabel->clear();
    if (m_clipboardTimer->isActive())
    {
        m_clipboardTimer->stop();
        clearClipboardIfUnchanged();
    }
}

void DashboardView::onSearchSubmitted()
{
    m_errorLabel->clear();
    reportAdmission(m_orchestrator.search(m_searchBar->text().toStdString(),
                                          [this](const CommandReport& report) { reportCompletion(report); }));
}

void DashboardView::onItemClicked(QListWidgetItem* item)
{
    if (item == nullptr)
    {
        return;
    }
    m_errorLabel->clear();
    reportAdmission(m_orchestrator.selectItem(item->data(Qt::UserRole).toString().toStdString(),
                                              [this](const CommandReport& report) { reportCompletion(report); }));
}

void DashboardView::onSyncClicked()
{
    m_errorLabel->clear();
    reportAdmission(m_orchestrator.sync([this](const CommandReport& report) { reportCompletion(report); }));
}

void DashboardView::onLockClicked()
{
    m_errorLabel->clear();
    reportAdmission(m_orchestrator.lock([this](const CommandReport& report) { reportCompletion(report); }));
}

void DashboardView::onLogoutClicked()
{
    m_errorLabel->clear();
    const auto confirm = [this]()
    {
        const auto reply =
            QMessageBox::question(this, "Log Out", "Log out of Bitwarden and remove saved credentials from this device?",
                                  QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        return reply == QMessageBox::Yes;
    };
    reportAdmission(m_orchestrator.logout(confirm, [this](const CommandReport& report) { reportCompletion(report); }));
}

void DashboardView::reportCompletion(const CommandReport& report)
{
    const QString error = report.error ? toQString(*report.error) : QString{};
    m_errorLabel->setText(error);
    emit commandFinished(report.succeeded, error);
}

void DashboardView::reportAdmission(Admission admission)
{
    if (admission == Admission::Busy)
    {
        m_errorLabel->setText("Another command is still running.");
    }
}
