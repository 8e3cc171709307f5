#include "common/config.hpp"

#include <QDir>

namespace lspbridge {

namespace {

int intFromEnvironment(const char *name, int fallback, int minimum)
{
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || value < minimum) {
        return fallback;
    }
    return value;
}

} // namespace

QString defaultStateDir()
{
    return QDir::tempPath() + QStringLiteral("/lspbridge");
}

BridgeConfig BridgeConfig::fromEnvironment()
{
    BridgeConfig config;

    config.stateDir = qEnvironmentVariable("LSPBRIDGE_STATE_DIR");
    if (config.stateDir.isEmpty()) {
        config.stateDir = defaultStateDir();
    }

    const int basePort = intFromEnvironment("LSPBRIDGE_BASE_PORT", config.basePort, 1);
    if (basePort <= 65535) {
        config.basePort = static_cast<quint16>(basePort);
    }
    config.portRange = intFromEnvironment("LSPBRIDGE_PORT_RANGE", config.portRange, 1);
    config.portProbeAttempts =
        intFromEnvironment("LSPBRIDGE_PORT_ATTEMPTS", config.portProbeAttempts, 1);

    config.requestTimeoutMs =
        intFromEnvironment("LSPBRIDGE_REQUEST_TIMEOUT_MS", config.requestTimeoutMs, 1);
    config.diagnosticsTimeoutMs =
        intFromEnvironment("LSPBRIDGE_DIAGNOSTICS_TIMEOUT_MS", config.diagnosticsTimeoutMs, 0);
    config.connectTimeoutMs =
        intFromEnvironment("LSPBRIDGE_CONNECT_TIMEOUT_MS", config.connectTimeoutMs, 1);
    config.startupTimeoutMs =
        intFromEnvironment("LSPBRIDGE_STARTUP_TIMEOUT_MS", config.startupTimeoutMs, 1);
    config.startupGraceMs =
        intFromEnvironment("LSPBRIDGE_STARTUP_GRACE_MS", config.startupGraceMs, 0);

    config.analyzerPath = qEnvironmentVariable("LSPBRIDGE_ANALYZER");
    config.daemonPath = qEnvironmentVariable("LSPBRIDGE_DAEMON_BIN");

    const QString languageId = qEnvironmentVariable("LSPBRIDGE_LANGUAGE_ID");
    if (!languageId.isEmpty()) {
        config.languageId = languageId;
    }

    config.trace = qEnvironmentVariableIntValue("LSPBRIDGE_TRACE") == 1;
    return config;
}

} // namespace lspbridge
