#ifndef SRC_UI_GUI_MAINWINDOW_HPP
#define SRC_UI_GUI_MAINWINDOW_HPP
#include "components/SettingsDialog.hpp"
#include "components/TitleBar.hpp"
#include "components/TrayNotifier.hpp"
#include "deckwarden/clipboard/ClipboardCopier.hpp"
#include "deckwarden/core/SessionOrchestrator.hpp"
#include "views/DashboardView.hpp"
#include "views/LoginView.hpp"
#include <QCloseEvent>
#include <QMainWindow>
#include <QMenu>
#include <QScreen>
#include <QStackedWidget>
#include <QSystemTrayIcon>

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    MainWindow(deckwarden::core::SessionOrchestrator& orchestrator, deckwarden::clipboard::ClipboardCopier& copier,
               TrayNotifier& notifier);
    ~MainWindow() override;

    MainWindow(const MainWindow&) = delete;
    MainWindow& operator=(const MainWindow&) = delete;
    MainWindow(MainWindow&&) = delete;
    MainWindow& operator=(MainWindow&&) = delete;

    void switchToDashboard();
    void switchToLogin();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUi();
    void updatePosition();
    void setupTray();
    void openSettings();
    void onStateChanged();
    void lockVault();

    deckwarden::core::SessionOrchestrator& m_orchestrator;
    deckwarden::clipboard::ClipboardCopier& m_copier;
    TrayNotifier& m_notifier;

    TitleBar* m_titleBar{ nullptr };
    QStackedWidget* m_stack{ nullptr };
    SettingsDialog* m_settingsDialog{ nullptr };

    LoginView* m_loginView{ nullptr };
    DashboardView* m_dashboardView{ nullptr };

    QSystemTrayIcon* m_trayIcon{ nullptr };
    QMenu* m_trayMenu{ nullptr };
    QAction* m_lockAction{ nullptr };
};

#endif // SRC_UI_GUI_MAINWINDOW_HPP
