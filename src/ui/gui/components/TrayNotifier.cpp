#include "TrayNotifier.hpp"
#include "GuiLogging.hpp"
#include <QString>

namespace
{
constexpr int g_balloonMs = 4000;

QString toQString(std::string_view text)
{
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}
} // namespace

void TrayNotifier::attach(QSystemTrayIcon* trayIcon) noexcept
{
    m_trayIcon = trayIcon;
}

void TrayNotifier::notify(std::string_view title, std::string_view body)
{
    const QString qTitle = toQString(title);
    const QString qBody = toQString(body);
    qCInfo(lcGui).noquote() << qTitle << "-" << qBody;

    if (m_trayIcon.isNull() || !m_trayIcon->isVisible() || !QSystemTrayIcon::supportsMessages())
    {
        return;
    }
    m_trayIcon->showMessage(qTitle, qBody, QSystemTrayIcon::Information, g_balloonMs);
}
