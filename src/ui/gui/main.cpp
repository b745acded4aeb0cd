#include "GuiLogging.hpp"
#include "GuiSettings.hpp"
#include "MainWindow.hpp"
#include "components/TrayNotifier.hpp"
#include "deckwarden/clipboard/ClipboardCopier.hpp"
#include "deckwarden/clipboard/qt/QtClipboardFactory.hpp"
#include "deckwarden/core/SessionOrchestrator.hpp"
#include "deckwarden/credentials/settings/SettingsCredentialStoreFactory.hpp"
#include "deckwarden/gateway/bwcli/BwCliGatewayFactory.hpp"
#include <QApplication>
#include <QFile>
#include <QtGlobal>
#include <exception>

int main(int argc, char* argv[])
{
#if defined(__linux__)
    if (!qEnvironmentVariableIsSet("QT_QPA_PLATFORM"))
    {
        qputenv("QT_QPA_PLATFORM", "xcb");
    }
#endif
    QApplication app(argc, argv);
    QApplication::setQuitOnLastWindowClosed(false);
    QApplication::setOrganizationName("Deckwarden");
    QApplication::setApplicationName("DeckwardenPanel");

    QFile styleFile(":/theme.qss");
    if (styleFile.open(QFile::ReadOnly))
    {
        app.setStyleSheet(QString::fromUtf8(styleFile.readAll()));
    }

    try
    {
        auto gateway = deckwarden::gateway::bwcli::makeBwCliGateway([]() { return deckwarden::ui::readBwCliOptions(); });
        auto store = deckwarden::credentials::settings::makeSettingsCredentialStore();
        TrayNotifier notifier{};

        auto clipboardWriter = deckwarden::clipboard::qt::makeQtClipboardWriter();
        auto clipboardFallback = deckwarden::clipboard::qt::makeCommandClipboardWriter();
        auto clipboardReader = deckwarden::clipboard::qt::makeQtClipboardReader();
        deckwarden::clipboard::ClipboardCopier copier(*clipboardWriter, clipboardFallback.get(), clipboardReader.get(),
                                                      &notifier);

        deckwarden::core::SessionOrchestrator orchestrator(*gateway, *store, notifier);
        orchestrator.initialize();
        orchestrator.form().server = deckwarden::ui::readLoginServer();
        if (deckwarden::ui::readRememberEmail())
        {
            orchestrator.form().rememberEmail = true;
        }

        MainWindow window(orchestrator, copier, notifier);
        window.show();

        return QApplication::exec();
    }
    catch (const std::exception& e)
    {
        qCCritical(lcGui) << "fatal:" << e.what();
        return 1;
    }
}
