#include "MainWindow.hpp"
#include "GuiLogging.hpp"
#include "GuiSettings.hpp"
#include <QApplication>
#include <QStyle>
#include <QTimer>
#include <QVBoxLayout>

namespace
{
constexpr int g_defaultWidth = 360;
constexpr int g_defaultHeight = 640;
constexpr int g_screenMargin = 40;
constexpr int g_loginIndex = 0;
constexpr int g_dashboardIndex = 1;
} // namespace

MainWindow::MainWindow(deckwarden::core::SessionOrchestrator& orchestrator,
                       deckwarden::clipboard::ClipboardCopier& copier, TrayNotifier& notifier)
    : m_orchestrator(orchestrator), m_copier(copier), m_notifier(notifier)
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint);
    resize(g_defaultWidth, g_defaultHeight);

    setupUi();
    setupTray();

    m_orchestrator.setStateListener([this]() { onStateChanged(); });
    onStateChanged();

    // The CLI may already hold an unlocked session from an earlier run.
    QTimer::singleShot(0, this, [this]() { (void)m_orchestrator.refresh(); });

    updatePosition();
}

MainWindow::~MainWindow()
{
    m_orchestrator.setStateListener({});
    m_notifier.attach(nullptr);
}

void MainWindow::setupUi()
{
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* central = new QWidget(this);
    setCentralWidget(central);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto* mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(0);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_titleBar = new TitleBar(this);
    connect(m_titleBar, &TitleBar::closeClicked, this, &QMainWindow::close);
    mainLayout->addWidget(m_titleBar);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_stack = new QStackedWidget(this);
    mainLayout->addWidget(m_stack);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_loginView = new LoginView(m_orchestrator, this);
    m_stack->addWidget(m_loginView); // Index 0

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    m_dashboardView = new DashboardView(m_orchestrator, m_copier, this);
    m_dashboardView->setClipboardTimeoutMs(deckwarden::ui::readClipboardTimeoutMs());
    m_stack->addWidget(m_dashboardView); // Index 1

    connect(m_dashboardView, &DashboardView::settingsClicked, this, &MainWindow::openSettings);
}

void MainWindow::updatePosition()
{
    QScreen* screen = QGuiApplication::primaryScreen();
    if (screen == nullptr)
    {
        return;
    }

    QRect availableRect = screen->availableGeometry();

    int x{ availableRect.right() - width() - g_screenMargin };
    int y{ availableRect.bottom() - height() - g_screenMargin };

    this->move(x, y);

    this->raise();
    this->activateWindow();
    this->setFocus();
}

void MainWindow::switchToDashboard()
{
    if (m_stack != nullptr)
    {
        m_stack->setCurrentIndex(g_dashboardIndex);
    }
}

void MainWindow::switchToLogin()
{
    if (m_stack == nullptr)
    {
        return;
    }
    if (m_stack->currentIndex() == g_dashboardIndex && m_dashboardView != nullptr)
    {
        m_dashboardView->clearSensitiveFields();
    }
    m_stack->setCurrentIndex(g_loginIndex);
}

void MainWindow::onStateChanged()
{
    if (m_orchestrator.session().status == deckwarden::core::SessionStatus::Unlocked)
    {
        switchToDashboard();
    }
    else
    {
        switchToLogin();
    }

    m_loginView->syncState();
    m_dashboardView->syncState();

    if (m_lockAction != nullptr)
    {
        m_lockAction->setEnabled(!m_orchestrator.busy() &&
                                 m_orchestrator.session().status == deckwarden::core::SessionStatus::Unlocked);
    }
}

void MainWindow::lockVault()
{
    if (m_orchestrator.lock() == deckwarden::core::Admission::Busy)
    {
        qCInfo(lcGui) << "lock ignored, another command is running";
    }
}

void MainWindow::openSettings()
{
    if (m_settingsDialog == nullptr)
    {
        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        m_settingsDialog = new SettingsDialog(m_orchestrator, this);
    }

    m_settingsDialog->setCliProgram(deckwarden::ui::readCliProgram());
    m_settingsDialog->setCliTimeoutMs(deckwarden::ui::readCliTimeoutMs());
    m_settingsDialog->setClipboardTimeoutMs(deckwarden::ui::readClipboardTimeoutMs());
    m_settingsDialog->syncRememberPassword();

    if (m_settingsDialog->exec() != QDialog::Accepted)
    {
        return;
    }

    deckwarden::ui::writeCliProgram(m_settingsDialog->cliProgram());
    deckwarden::ui::writeCliTimeoutMs(m_settingsDialog->cliTimeoutMs());

    const int clipboardTimeoutMs = m_settingsDialog->clipboardTimeoutMs();
    deckwarden::ui::writeClipboardTimeoutMs(clipboardTimeoutMs);
    if (m_dashboardView != nullptr)
    {
        m_dashboardView->setClipboardTimeoutMs(clipboardTimeoutMs);
    }
}

void MainWindow::setupTray()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable())
    {
        qCWarning(lcGui) << "System tray is not available.";
        return;
    }

    m_trayMenu = new QMenu(this); // NOLINT(cppcoreguidelines-owning-memory)

    auto* toggleAction = m_trayMenu->addAction("Toggle Window");
    connect(toggleAction, &QAction::triggered,
            [this]()
            {
                if (isVisible())
                {
                    hide();
                }
                else
                {
                    show();
                    activateWindow();
                }
            });

    m_trayMenu->addSeparator();

    m_lockAction = m_trayMenu->addAction("Lock Vault");
    connect(m_lockAction, &QAction::triggered, this, &MainWindow::lockVault);

    m_trayMenu->addSeparator();

    auto* quitAction = m_trayMenu->addAction("Quit Deckwarden");
    connect(quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon = new QSystemTrayIcon(this); // NOLINT(cppcoreguidelines-owning-memory)
    QIcon icon(":/icon.svg");
    if (icon.isNull())
    {
        icon = style()->standardIcon(QStyle::SP_ComputerIcon);
    }
    m_trayIcon->setIcon(icon);
    m_trayIcon->setContextMenu(m_trayMenu);

    connect(m_trayIcon, &QSystemTrayIcon::activated,
            [this](QSystemTrayIcon::ActivationReason reason)
            {
                if (reason == QSystemTrayIcon::Trigger)
                {
                    if (isVisible())
                    {
                        hide();
                    }
                    else
                    {
                        show();
                        activateWindow();
                        raise();
                    }
                }
            });

    m_trayIcon->show();
    m_notifier.attach(m_trayIcon);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    bool trayWorks = QSystemTrayIcon::isSystemTrayAvailable() && (m_trayIcon != nullptr) && m_trayIcon->isVisible();

    if (trayWorks)
    {
        hide();
        event->ignore();
    }
    else
    {
        event->accept();
        qApp->quit();
    }
}
