#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QUuid>

#include <iostream>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/lspbridge_version.hpp"
#include "daemon/worker_host.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("lspbridge-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(LSPBRIDGE_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Keeps one analyzer alive for a project and proxies its stdio over TCP."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption projectOption(QStringList() << "project",
                                     "Project root; the analyzer runs here.",
                                     "path");
    QCommandLineOption portOption(QStringList() << "port",
                                  "Loopback port for the proxy.",
                                  "port");
    QCommandLineOption analyzerOption(QStringList() << "analyzer",
                                      "Analyzer executable.",
                                      "path");
    QCommandLineOption stateDirOption(QStringList() << "state-dir",
                                      "Directory holding worker state files.",
                                      "path");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    parser.addOption(projectOption);
    parser.addOption(portOption);
    parser.addOption(analyzerOption);
    parser.addOption(stateDirOption);
    parser.addOption(traceOption);
    parser.process(app);

    lspbridge::BridgeConfig config = lspbridge::BridgeConfig::fromEnvironment();
    config.trace = config.trace || parser.isSet(traceOption);
    if (parser.isSet(stateDirOption)) {
        config.stateDir = parser.value(stateDirOption);
    }
    lspbridge::logging::initLogging(QStringLiteral("lspbridge-daemon"), config.trace);
    lspbridge::logging::setCorrelationId(QUuid::createUuid().toString(QUuid::WithoutBraces));

    bool portOk = false;
    const uint port = parser.value(portOption).toUInt(&portOk);
    const QString projectPath = QDir(parser.value(projectOption)).absolutePath();
    const QString analyzerPath = parser.value(analyzerOption);
    if (!parser.isSet(projectOption) || analyzerPath.isEmpty()
        || !portOk || port == 0 || port > 65535) {
        std::cerr << parser.helpText().toStdString();
        return 1;
    }

    LBLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("caller_spawn"),
               QStringLiteral("command_line"),
               lspbridge::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"project", projectPath.toStdString()},
                              {"port", port},
                              {"version", LSPBRIDGE_VERSION}}));

    lspbridge::WorkerHost host(config);
    QObject::connect(&host, &lspbridge::WorkerHost::finished,
                     &app, &QCoreApplication::quit, Qt::QueuedConnection);

    try {
        host.start(projectPath, analyzerPath, static_cast<quint16>(port));
    } catch (const lspbridge::DaemonError &ex) {
        qWarning() << "lspbridge-daemon: failed to start worker:" << ex.what();
        LBLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_start_failed"),
                    QString::fromLatin1(lspbridge::toKindString(ex.kind())),
                    QStringLiteral("worker_host"),
                    lspbridge::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"what", ex.what()}}));
        return 1;
    } catch (const std::exception &ex) {
        qWarning() << "lspbridge-daemon: unexpected failure:" << ex.what();
        LBLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("daemon_start_failed"),
                    QStringLiteral("exception"),
                    QStringLiteral("worker_host"),
                    lspbridge::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"what", ex.what()}}));
        return 1;
    }

    // The daemon lives exactly as long as its analyzer.
    return app.exec();
}
