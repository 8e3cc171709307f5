#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/lspbridge_version.hpp"
#include "query/QueryCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("lspbridge-query"));
    QCoreApplication::setApplicationVersion(QStringLiteral(LSPBRIDGE_VERSION));

    lspbridge::BridgeConfig config = lspbridge::BridgeConfig::fromEnvironment();
    const QStringList args = QCoreApplication::arguments();
    config.trace = config.trace || args.contains(QStringLiteral("--trace"));
    lspbridge::logging::initLogging(QStringLiteral("lspbridge-query"), config.trace);
    LBLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("query_cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               lspbridge::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", args.size()}}));

    // Each run is one invocation: connections are dropped on exit, the worker stays.
    lspbridge::QueryCli cli(config);
    return cli.run(args);
}
