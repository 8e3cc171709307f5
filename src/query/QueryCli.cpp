#include "query/QueryCli.hpp"

#include <iostream>
#include <utility>

#include <QCommandLineParser>

#include <nlohmann/json.hpp>

#include "client/diagnostic_format.hpp"
#include "client/worker_manager.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace lspbridge {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  lspbridge-query --project PATH [--json] [--errors-only] FILE\n"
        "  lspbridge-query --project PATH --status\n"
        "  lspbridge-query --project PATH --stop\n");
}

} // namespace

QueryCli::QueryCli(BridgeConfig config)
    : QueryCli(std::move(config), std::cout, std::cerr)
{
}

QueryCli::QueryCli(BridgeConfig config, std::ostream &out, std::ostream &err)
    : m_config(std::move(config))
    , m_out(out)
    , m_err(err)
{
}

int QueryCli::run(const QStringList &args)
{
    QCommandLineParser parser;
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption projectOption(QStringList() << "project",
                                           "Project root served by the worker.",
                                           "path");
    const QCommandLineOption jsonOption(QStringList() << "json",
                                        "Print diagnostics as a JSON array.");
    const QCommandLineOption errorsOnlyOption(QStringList() << "errors-only",
                                              "Only report error diagnostics.");
    const QCommandLineOption statusOption(QStringList() << "status",
                                          "Print the worker record for the project.");
    const QCommandLineOption stopOption(QStringList() << "stop",
                                        "Stop the worker for the project.");
    const QCommandLineOption traceOption(QStringList() << "trace",
                                         "Enable verbose trace logging.");
    parser.addOption(projectOption);
    parser.addOption(jsonOption);
    parser.addOption(errorsOnlyOption);
    parser.addOption(statusOption);
    parser.addOption(stopOption);
    parser.addOption(traceOption);
    parser.addPositionalArgument(QStringLiteral("file"),
                                 QStringLiteral("Source file to analyze."));

    if (!parser.parse(args)) {
        m_err << parser.errorText().toStdString() << "\n"
              << usageText().toStdString();
        return 1;
    }
    if (parser.isSet(helpOption)) {
        m_out << usageText().toStdString();
        return 0;
    }

    const QString projectPath = parser.value(projectOption);
    if (projectPath.isEmpty()) {
        m_err << usageText().toStdString();
        return 1;
    }

    const bool status = parser.isSet(statusOption);
    const bool stop = parser.isSet(stopOption);
    const QStringList files = parser.positionalArguments();
    if ((status && stop) || (!status && !stop && files.size() != 1)) {
        m_err << usageText().toStdString();
        return 1;
    }

    LBLOG_INFO(QStringLiteral("QueryCli"),
               QStringLiteral("run"),
               QStringLiteral("query_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"project", projectPath.toStdString()},
                              {"status", status},
                              {"stop", stop}}));

    try {
        WorkerManager manager(m_config);
        if (status) {
            return runStatus(manager, projectPath);
        }
        if (stop) {
            return runStop(manager, projectPath);
        }
        return runQuery(manager, projectPath, files.first(),
                        parser.isSet(jsonOption), parser.isSet(errorsOnlyOption));
    } catch (const DaemonError &ex) {
        m_err << "lspbridge-query: " << ex.what() << "\n";
        LBLOG_ERROR(QStringLiteral("QueryCli"),
                    QStringLiteral("run"),
                    QStringLiteral("query_failed"),
                    QString::fromLatin1(toKindString(ex.kind())),
                    QStringLiteral("worker_manager"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"what", ex.what()}}));
        return 1;
    } catch (const std::exception &ex) {
        m_err << "lspbridge-query: " << ex.what() << "\n";
        LBLOG_ERROR(QStringLiteral("QueryCli"),
                    QStringLiteral("run"),
                    QStringLiteral("query_failed"),
                    QStringLiteral("exception"),
                    QStringLiteral("worker_manager"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"what", ex.what()}}));
        return 1;
    }
}

int QueryCli::runQuery(WorkerManager &manager,
                       const QString &projectPath,
                       const QString &filePath,
                       bool asJson,
                       bool errorsOnly)
{
    const quint16 port = manager.ensureWorker(projectPath);
    DiagnosticList diagnostics = manager.queryDiagnostics(port, filePath, projectPath);
    if (errorsOnly) {
        diagnostics = filterBySeverity(diagnostics, DiagnosticSeverity::Error);
    }

    if (asJson) {
        m_out << diagnosticsToJson(diagnostics).dump(2) << "\n";
    } else {
        m_out << formatDiagnostics(diagnostics);
    }
    return 0;
}

int QueryCli::runStatus(WorkerManager &manager, const QString &projectPath)
{
    const auto record = manager.status(projectPath);
    if (!record) {
        m_out << "no worker running for "
              << WorkerManager::canonicalProjectPath(projectPath).toStdString() << "\n";
        return 0;
    }
    m_out << nlohmann::json(*record).dump(2) << "\n";
    return 0;
}

int QueryCli::runStop(WorkerManager &manager, const QString &projectPath)
{
    if (!manager.stopWorker(projectPath)) {
        m_out << "no worker running for "
              << WorkerManager::canonicalProjectPath(projectPath).toStdString() << "\n";
        return 0;
    }
    m_out << "stop requested\n";
    return 0;
}

} // namespace lspbridge
