#ifndef DECKWARDEN_GUI_SETTINGS_HPP
#define DECKWARDEN_GUI_SETTINGS_HPP

#include "deckwarden/gateway/ServerRegion.hpp"
#include "deckwarden/gateway/bwcli/BwCliGatewayFactory.hpp"
#include <QSettings>
#include <QString>
#include <chrono>

namespace deckwarden::ui
{
constexpr int g_defaultCliTimeoutMs = 60000;
constexpr int g_defaultClipboardTimeoutMs = 15000;

inline QString readCliProgram()
{
    QSettings settings{};
    const QString program = settings.value("cli/program", QStringLiteral("bw")).toString().trimmed();
    return program.isEmpty() ? QStringLiteral("bw") : program;
}

inline void writeCliProgram(const QString& program)
{
    QSettings settings{};
    settings.setValue("cli/program", program.trimmed());
}

inline int readCliTimeoutMs()
{
    QSettings settings{};
    const int ms = settings.value("cli/timeoutMs", g_defaultCliTimeoutMs).toInt();
    return ms > 0 ? ms : g_defaultCliTimeoutMs;
}

inline void writeCliTimeoutMs(int ms)
{
    QSettings settings{};
    settings.setValue("cli/timeoutMs", ms);
}

inline int readClipboardTimeoutMs()
{
    QSettings settings{};
    return settings.value("clipboard/timeoutMs", g_defaultClipboardTimeoutMs).toInt();
}

inline void writeClipboardTimeoutMs(int ms)
{
    QSettings settings{};
    settings.setValue("clipboard/timeoutMs", ms);
}

inline deckwarden::gateway::ServerRegion readLoginServer()
{
    QSettings settings{};
    const auto tag = settings.value("login/server", QStringLiteral("us")).toString().toStdString();
    return deckwarden::gateway::regionFromTag(tag).value_or(deckwarden::gateway::ServerRegion::Us);
}

inline void writeLoginServer(deckwarden::gateway::ServerRegion region)
{
    QSettings settings{};
    const auto tag = deckwarden::gateway::regionTag(region);
    settings.setValue("login/server", QString::fromLatin1(tag.data(), static_cast<qsizetype>(tag.size())));
}

inline bool readRememberEmail()
{
    QSettings settings{};
    return settings.value("login/rememberEmail", false).toBool();
}

inline void writeRememberEmail(bool enabled)
{
    QSettings settings{};
    settings.setValue("login/rememberEmail", enabled);
}

// Re-read on every invocation so Settings changes apply to the next command.
inline deckwarden::gateway::bwcli::BwCliOptions readBwCliOptions()
{
    deckwarden::gateway::bwcli::BwCliOptions options{};
    options.program = readCliProgram().toStdString();
    options.timeout = std::chrono::milliseconds{ readCliTimeoutMs() };
    return options;
}
} // namespace deckwarden::ui

#endif // DECKWARDEN_GUI_SETTINGS_HPP
