#pragma once

#include <QString>

namespace lspbridge {

/**
 * BridgeConfig collects the tunables shared by the daemon and its callers.
 * Every field has a default and can be overridden through LSPBRIDGE_* variables.
 */
struct BridgeConfig {
    QString stateDir;
    quint16 basePort = 19200;
    int portRange = 100;
    int portProbeAttempts = 100;

    int requestTimeoutMs = 30000;
    int diagnosticsTimeoutMs = 3000;
    int diagnosticsPollIntervalMs = 100;
    int connectTimeoutMs = 2000;
    int startupTimeoutMs = 10000;
    int startupGraceMs = 500;
    int shutdownGraceMs = 2000;

    QString analyzerName = QStringLiteral("rust-analyzer");
    // Explicit analyzer executable; when set no other lookup is attempted.
    QString analyzerPath;
    QString daemonPath;
    QString languageId = QStringLiteral("rust");
    bool trace = false;

    static BridgeConfig fromEnvironment();
};

QString defaultStateDir();

} // namespace lspbridge
