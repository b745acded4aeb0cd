#include "deckwarden/clipboard/qt/QtClipboardFactory.hpp"

#include "deckwarden/security/MemoryWiper.hpp"
#include <QByteArray>
#include <QClipboard>
#include <QCoreApplication>
#include <QGuiApplication>
#include <QLoggingCategory>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <span>

Q_LOGGING_CATEGORY(lcClipboard, "deckwarden.clipboard")

namespace deckwarden::clipboard::qt
{
namespace
{

constexpr int g_startTimeoutMs = 2000;
constexpr int g_finishTimeoutMs = 3000;

[[nodiscard]] QClipboard* systemClipboard()
{
    // A bare QCoreApplication has no clipboard.
    if (qobject_cast<QGuiApplication*>(QCoreApplication::instance()) == nullptr)
    {
        return nullptr;
    }
    return QGuiApplication::clipboard();
}

class QtClipboardWriter final : public deckwarden::clipboard::IClipboardWriter
{
public:
    [[nodiscard]] bool writeText(std::string_view text) override
    {
        auto* clipboard = systemClipboard();
        if (clipboard == nullptr)
        {
            qCWarning(lcClipboard) << "no system clipboard available";
            return false;
        }
        QString written = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
        clipboard->setText(written);

        // setText() does not report failure; a clipboard that did not take the text reads back differently.
        QString readBack = clipboard->text();
        const bool stored = (readBack == written);
        written.fill(QChar(0));
        readBack.fill(QChar(0));
        if (!stored)
        {
            qCWarning(lcClipboard) << "system clipboard did not accept the text";
        }
        return stored;
    }
};

class QtClipboardReader final : public deckwarden::clipboard::IClipboardReader
{
public:
    [[nodiscard]] std::optional<std::string> readText() override
    {
        auto* clipboard = systemClipboard();
        if (clipboard == nullptr)
        {
            return std::nullopt;
        }
        return clipboard->text().toStdString();
    }
};

class CommandClipboardWriter final : public deckwarden::clipboard::IClipboardWriter
{
public:
    [[nodiscard]] bool writeText(std::string_view text) override
    {
        QString program{};
        QStringList args{};
        if (qEnvironmentVariableIsSet("WAYLAND_DISPLAY"))
        {
            program = QStandardPaths::findExecutable(QStringLiteral("wl-copy"));
        }
        if (program.isEmpty())
        {
            program = QStandardPaths::findExecutable(QStringLiteral("xclip"));
            args = { QStringLiteral("-selection"), QStringLiteral("clipboard") };
        }
        if (program.isEmpty())
        {
            qCWarning(lcClipboard) << "no clipboard tool found (wl-copy/xclip)";
            return false;
        }

        QProcess process{};
        process.setProgram(program);
        process.setArguments(args);
        process.setProcessChannelMode(QProcess::SeparateChannels);
        process.start();
        if (!process.waitForStarted(g_startTimeoutMs))
        {
            qCWarning(lcClipboard) << program << "failed to start";
            return false;
        }

        QByteArray input(text.data(), static_cast<qsizetype>(text.size()));
        process.write(input);
        deckwarden::security::secureWipe(std::span{ input.data(), static_cast<std::size_t>(input.size()) });
        process.closeWriteChannel();

        if (!process.waitForFinished(g_finishTimeoutMs))
        {
            process.kill();
            process.waitForFinished(g_startTimeoutMs);
            qCWarning(lcClipboard) << program << "timed out";
            return false;
        }
        if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0)
        {
            qCWarning(lcClipboard) << program << "exited with" << process.exitCode();
            return false;
        }
        qCInfo(lcClipboard) << "copied through" << program;
        return true;
    }
};

} // namespace

std::unique_ptr<deckwarden::clipboard::IClipboardWriter> makeQtClipboardWriter()
{
    return std::make_unique<QtClipboardWriter>();
}

std::unique_ptr<deckwarden::clipboard::IClipboardReader> makeQtClipboardReader()
{
    return std::make_unique<QtClipboardReader>();
}

std::unique_ptr<deckwarden::clipboard::IClipboardWriter> makeCommandClipboardWriter()
{
    return std::make_unique<CommandClipboardWriter>();
}

} // namespace deckwarden::clipboard::qt
