#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <cerrno>
#include <csignal>

#include <signal.h>
#include <sys/types.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace lspbridge {

namespace {

constexpr int kNixLookupTimeoutMs = 60000;

QString findSiblingBinary(const QString &name)
{
    if (!QCoreApplication::instance()) {
        return QString();
    }

    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral(".."),
        QStringLiteral("../bin"),
        QStringLiteral("../../bin"),
    };

    for (const QString &relPath : relCandidates) {
        const QString candidate =
            QDir(appDir).absoluteFilePath(relPath + QDir::separator() + name);
        QFileInfo info(candidate);
        if (info.exists() && info.isExecutable()) {
            return info.absoluteFilePath();
        }
    }
    return QString();
}

QString executableOrEmpty(const QString &path)
{
    const QFileInfo info(path);
    if (info.exists() && info.isFile() && info.isExecutable()) {
        return info.absoluteFilePath();
    }
    return QString();
}

QString locateWithNix(const QString &name)
{
    const QString nix = QStandardPaths::findExecutable(QStringLiteral("nix"));
    if (nix.isEmpty()) {
        return QString();
    }

    QProcess proc;
    proc.start(nix, {QStringLiteral("build"),
                     QStringLiteral("--no-link"),
                     QStringLiteral("--print-out-paths"),
                     QStringLiteral("nixpkgs#") + name});
    if (!proc.waitForStarted() || !proc.waitForFinished(kNixLookupTimeoutMs)) {
        proc.kill();
        proc.waitForFinished();
        return QString();
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        return QString();
    }

    const QString outPath =
        QString::fromLocal8Bit(proc.readAllStandardOutput()).trimmed().split('\n').first();
    if (outPath.isEmpty()) {
        return QString();
    }
    return executableOrEmpty(outPath + QStringLiteral("/bin/") + name);
}

} // namespace

bool isProcessAlive(qint64 pid)
{
    // kill(0, ...) and negative pids address process groups, not a process.
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

bool terminateProcess(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    return ::kill(static_cast<pid_t>(pid), SIGTERM) == 0;
}

QString locateAnalyzer(const BridgeConfig &config)
{
    if (!config.analyzerPath.isEmpty()) {
        const QString explicitPath = executableOrEmpty(config.analyzerPath);
        if (!explicitPath.isEmpty()) {
            return explicitPath;
        }
        // Bare names are resolved against PATH.
        return QStandardPaths::findExecutable(config.analyzerPath);
    }

    const QString onPath = QStandardPaths::findExecutable(config.analyzerName);
    if (!onPath.isEmpty()) {
        return onPath;
    }

    const QString fromNix = locateWithNix(config.analyzerName);
    LBLOG_DEBUG(QStringLiteral("ProcessUtils"),
                QStringLiteral("locateAnalyzer"),
                QStringLiteral("analyzer_lookup"),
                QStringLiteral("not_on_path"),
                QStringLiteral("nix_build"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"name", config.analyzerName.toStdString()},
                               {"found", !fromNix.isEmpty()}}));
    return fromNix;
}

QString daemonExecutablePath(const BridgeConfig &config)
{
    if (!config.daemonPath.isEmpty()) {
        return config.daemonPath;
    }

    // Try sibling binary first (for dev builds and bundled installs)
    const QString sibling = findSiblingBinary(QStringLiteral("lspbridge-daemon"));
    if (!sibling.isEmpty()) {
        return sibling;
    }

    // Fall back to PATH lookup
    return QStandardPaths::findExecutable(QStringLiteral("lspbridge-daemon"));
}

bool launchDetached(const QString &program,
                    const QStringList &args,
                    const QString &workingDirectory,
                    qint64 *pid)
{
    QProcess process;
    process.setProgram(program);
    process.setArguments(args);
    process.setWorkingDirectory(workingDirectory);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());
    return process.startDetached(pid);
}

} // namespace lspbridge
