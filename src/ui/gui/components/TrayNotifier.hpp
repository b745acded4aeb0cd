#ifndef SRC_UI_GUI_COMPONENTS_TRAYNOTIFIER_HPP
#define SRC_UI_GUI_COMPONENTS_TRAYNOTIFIER_HPP

#include "deckwarden/notify/INotifier.hpp"
#include <QPointer>
#include <QSystemTrayIcon>

// Shows toasts as tray balloons; without a tray icon they only reach the log.
class TrayNotifier final : public deckwarden::notify::INotifier
{
public:
    void attach(QSystemTrayIcon* trayIcon) noexcept;

    void notify(std::string_view title, std::string_view body) override;

private:
    QPointer<QSystemTrayIcon> m_trayIcon;
};

#endif // SRC_UI_GUI_COMPONENTS_TRAYNOTIFIER_HPP
