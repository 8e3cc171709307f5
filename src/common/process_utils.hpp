#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace lspbridge {

// True when |pid| names an existing process, including one owned by another user.
bool isProcessAlive(qint64 pid);
bool terminateProcess(qint64 pid);

// Resolve the analyzer executable; empty when none can be found.
QString locateAnalyzer(const BridgeConfig &config);

QString daemonExecutablePath(const BridgeConfig &config);

// Start |program| detached from the caller with its output sent to the null device.
bool launchDetached(const QString &program,
                    const QStringList &args,
                    const QString &workingDirectory,
                    qint64 *pid = nullptr);

} // namespace lspbridge
