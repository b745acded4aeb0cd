#include "deckwarden/gateway/bwcli/BwCliGatewayFactory.hpp"

#include "BwOutput.hpp"
#include "deckwarden/security/MemoryWiper.hpp"
#include "deckwarden/security/SecureString.hpp"

#include <QByteArray>
#include <QLoggingCategory>
#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <memory>
#include <utility>

Q_LOGGING_CATEGORY(lcGateway, "deckwarden.gateway")

namespace deckwarden::gateway::bwcli
{
namespace
{

constexpr auto g_passwordEnvVar = "DECKW_BW_PASSWORD";
constexpr auto g_sessionEnvVar = "BW_SESSION";
constexpr int g_killWaitMs = 1000;

struct ProcessOutcome final
{
    bool ok{ false };
    QByteArray output;
    QString error;
};

using ProcessCallback = std::function<void(ProcessOutcome)>;

[[nodiscard]] QString toQString(std::string_view text)
{
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

[[nodiscard]] QString toQString(const deckwarden::security::SecureString& text)
{
    const auto view = deckwarden::security::asStringView(text);
    return QString::fromUtf8(view.data(), static_cast<qsizetype>(view.size()));
}

template <class T> void failWith(const GatewayCallback<T>& done, const QString& message)
{
    done(GatewayError{ message.toStdString() });
}

class BwCliGateway final : public deckwarden::gateway::IVaultGateway
{
public:
    explicit BwCliGateway(BwCliOptionsProvider options) : m_options(std::move(options))
    {
    }

    BwCliGateway(const BwCliGateway&) = delete;
    BwCliGateway& operator=(const BwCliGateway&) = delete;
    BwCliGateway(BwCliGateway&&) = delete;
    BwCliGateway& operator=(BwCliGateway&&) = delete;

    ~BwCliGateway() override
    {
        // Pending callbacks are dropped, never invoked, once the gateway goes away.
        for (auto* process : m_context.findChildren<QProcess*>())
        {
            QObject::disconnect(process, nullptr, &m_context, nullptr);
            process->kill();
            process->waitForFinished(g_killWaitMs);
        }
        deckwarden::security::secureClear(m_sessionKey);
    }

    void status(GatewayCallback<StatusPayload> done) override
    {
        run({ QStringLiteral("status") }, {},
            [done = std::move(done)](ProcessOutcome outcome)
            {
                if (!outcome.ok)
                {
                    failWith(done, outcome.error);
                    return;
                }
                done(parseStatus(outcome.output));
            });
    }

    void login(const LoginRequest& request, GatewayCallback<std::monostate> done) override
    {
        QStringList loginArgs{ QStringLiteral("login"), toQString(request.email), QStringLiteral("--passwordenv"),
                               QString::fromLatin1(g_passwordEnvVar), QStringLiteral("--raw") };
        if (!request.totpCode.empty())
        {
            // Method 0 is an authenticator app code.
            loginArgs << QStringLiteral("--method") << QStringLiteral("0") << QStringLiteral("--code")
                      << toQString(request.totpCode);
        }

        QProcessEnvironment loginEnv{};
        loginEnv.insert(QString::fromLatin1(g_passwordEnvVar), toQString(request.password));

        const QStringList configArgs{ QStringLiteral("config"), QStringLiteral("server"),
                                      toQString(regionServerUrl(request.server)) };

        run(configArgs, {},
            [this, loginArgs, loginEnv, done = std::move(done)](ProcessOutcome configured) mutable
            {
                if (!configured.ok)
                {
                    loginArgs.clear();
                    loginEnv.clear();
                    failWith(done, configured.error);
                    return;
                }
                run(loginArgs, loginEnv,
                    [this, done](ProcessOutcome outcome)
                    {
                        if (!outcome.ok)
                        {
                            failWith(done, outcome.error);
                            return;
                        }
                        storeSessionKey(outcome.output);
                        done(std::monostate{});
                    });
                loginArgs.clear();
                loginEnv.clear();
            });
    }

    void unlock(const deckwarden::security::SecureString& password, GatewayCallback<std::monostate> done) override
    {
        QProcessEnvironment env{};
        env.insert(QString::fromLatin1(g_passwordEnvVar), toQString(password));

        run({ QStringLiteral("unlock"), QStringLiteral("--passwordenv"), QString::fromLatin1(g_passwordEnvVar),
              QStringLiteral("--raw") },
            env,
            [this, done = std::move(done)](ProcessOutcome outcome)
            {
                if (!outcome.ok)
                {
                    failWith(done, outcome.error);
                    return;
                }
                storeSessionKey(outcome.output);
                done(std::monostate{});
            });
    }

    void sync(GatewayCallback<std::monostate> done) override
    {
        runSimple({ QStringLiteral("sync") }, std::move(done), false);
    }

    void lock(GatewayCallback<std::monostate> done) override
    {
        runSimple({ QStringLiteral("lock") }, std::move(done), true);
    }

    void logout(GatewayCallback<std::monostate> done) override
    {
        runSimple({ QStringLiteral("logout") }, std::move(done), true);
    }

    void searchItems(std::string_view query,
                     GatewayCallback<std::vector<deckwarden::core::VaultItemSummary>> done) override
    {
        run({ QStringLiteral("list"), QStringLiteral("items"), QStringLiteral("--search"), toQString(query) }, {},
            [done = std::move(done)](ProcessOutcome outcome)
            {
                if (!outcome.ok)
                {
                    failWith(done, outcome.error);
                    return;
                }
                done(parseItemList(outcome.output));
            });
    }

    void getItem(std::string_view id, GatewayCallback<deckwarden::core::VaultItemDetail> done) override
    {
        run({ QStringLiteral("get"), QStringLiteral("item"), toQString(id) }, {},
            [done = std::move(done)](ProcessOutcome outcome)
            {
                if (!outcome.ok)
                {
                    failWith(done, outcome.error);
                    return;
                }
                auto result = parseItem(outcome.output);
                outcome.output.fill('\0');
                done(std::move(result));
            });
    }

private:
    void runSimple(const QStringList& args, GatewayCallback<std::monostate> done, bool dropsSession)
    {
        run(args, {},
            [this, done = std::move(done), dropsSession](ProcessOutcome outcome)
            {
                if (!outcome.ok)
                {
                    failWith(done, outcome.error);
                    return;
                }
                if (dropsSession)
                {
                    deckwarden::security::secureClear(m_sessionKey);
                }
                done(std::monostate{});
            });
    }

    void storeSessionKey(QByteArray& output)
    {
        const QByteArray key = output.trimmed();
        deckwarden::security::secureClear(m_sessionKey);
        m_sessionKey.assign(key.begin(), key.end());
        output.fill('\0');
    }

    void run(const QStringList& args, const QProcessEnvironment& extraEnv, ProcessCallback done)
    {
        const BwCliOptions options = m_options ? m_options() : BwCliOptions{};
        const QString program = toQString(options.program);

        QStringList fullArgs = args;
        fullArgs << QStringLiteral("--nointeraction");

        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        for (const QString& key : extraEnv.keys())
        {
            env.insert(key, extraEnv.value(key));
        }
        if (!m_sessionKey.empty())
        {
            env.insert(QString::fromLatin1(g_sessionEnvVar), toQString(m_sessionKey));
        }

        qCInfo(lcGateway) << "running" << program << redactedArguments(fullArgs);

        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        auto* process = new QProcess(&m_context);
        process->setProgram(program);
        process->setArguments(fullArgs);
        process->setProcessEnvironment(env);
        process->setProcessChannelMode(QProcess::SeparateChannels);

        // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
        auto* timer = new QTimer(process);
        timer->setSingleShot(true);

        auto completed = std::make_shared<bool>(false);
        const QString command = args.value(0);
        auto complete = [this, process, timer, completed, done = std::move(done)](ProcessOutcome outcome)
        {
            if (*completed)
            {
                return;
            }
            *completed = true;
            timer->stop();
            QObject::disconnect(process, nullptr, &m_context, nullptr);
            process->deleteLater();
            done(std::move(outcome));
        };

        QObject::connect(timer, &QTimer::timeout, &m_context,
                         [process, complete, command]()
                         {
                             qCWarning(lcGateway) << "bw" << command << "timed out";
                             complete(ProcessOutcome{ false, {}, QStringLiteral("Error: bw %1 timed out").arg(command) });
                             process->kill();
                         });

        QObject::connect(process, &QProcess::errorOccurred, &m_context,
                         [process, complete, command](QProcess::ProcessError error)
                         {
                             if (error != QProcess::FailedToStart)
                             {
                                 return;
                             }
                             qCWarning(lcGateway) << "bw" << command << "failed to start:" << process->errorString();
                             complete(ProcessOutcome{
                                 false, {}, QStringLiteral("Error: could not start bw: %1").arg(process->errorString()) });
                         });

        QObject::connect(process, &QProcess::finished, &m_context,
                         [process, complete, command](int exitCode, QProcess::ExitStatus exitStatus)
                         {
                             QByteArray output = process->readAllStandardOutput();
                             const QByteArray errors = process->readAllStandardError();

                             if (exitStatus != QProcess::NormalExit)
                             {
                                 qCWarning(lcGateway) << "bw" << command << "crashed";
                                 output.fill('\0');
                                 complete(ProcessOutcome{ false, {}, QStringLiteral("Error: bw %1 crashed").arg(command) });
                                 return;
                             }
                             if (exitCode != 0)
                             {
                                 const QString message = errorText(errors, output, exitCode);
                                 qCWarning(lcGateway) << "bw" << command << "exited with" << exitCode;
                                 output.fill('\0');
                                 complete(ProcessOutcome{ false, {}, message });
                                 return;
                             }
                             qCInfo(lcGateway) << "bw" << command << "succeeded";
                             complete(ProcessOutcome{ true, std::move(output), {} });
                         });

        timer->start(static_cast<int>(options.timeout.count()));
        process->start();

        // The child has its own copy by now; the one-time code must not stay on the QProcess.
        process->setArguments({});
        process->setProcessEnvironment(QProcessEnvironment{});
    }

    BwCliOptionsProvider m_options;
    QObject m_context;
    deckwarden::security::SecureString m_sessionKey;
};

} // namespace

std::unique_ptr<deckwarden::gateway::IVaultGateway> makeBwCliGateway(BwCliOptionsProvider options)
{
    return std::make_unique<BwCliGateway>(std::move(options));
}

} // namespace deckwarden::gateway::bwcli
