#include "client/worker_manager.hpp"

#include <chrono>
#include <utility>

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <QUrl>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace lspbridge {

namespace {

constexpr int kRecordPollIntervalMs = 100;

} // namespace

WorkerManager::WorkerManager(BridgeConfig config)
    : m_config(std::move(config))
    , m_store(m_config.stateDir)
    , m_allocator(m_config.basePort, m_config.portRange, m_config.portProbeAttempts)
    , m_connections(m_config, m_store)
{
}

QString WorkerManager::canonicalProjectPath(const QString &projectPath)
{
    const QFileInfo info(projectPath);
    const QString canonical = info.canonicalFilePath();
    return canonical.isEmpty() ? QDir::cleanPath(info.absoluteFilePath()) : canonical;
}

quint16 WorkerManager::ensureWorker(const QString &projectPath)
{
    const QString project = canonicalProjectPath(projectPath);
    logging::CorrelationScope scope(StateStore::hashProjectPath(project));

    if (const auto record = m_store.lookup(project)) {
        return static_cast<quint16>(record->port);
    }

    const QString analyzer = locateAnalyzer(m_config);
    if (analyzer.isEmpty()) {
        LBLOG_ERROR(QStringLiteral("WorkerManager"),
                    QStringLiteral("ensureWorker"),
                    QStringLiteral("analyzer_not_found"),
                    QStringLiteral("lookup_exhausted"),
                    QStringLiteral("env_path_nix"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"name", m_config.analyzerName.toStdString()}}));
        throw DaemonError(DaemonError::Kind::WorkerNotFound,
                          "cannot locate analyzer executable '"
                              + m_config.analyzerName.toStdString() + "'");
    }

    const quint16 port = m_allocator.allocate(project);

    const QString daemon = daemonExecutablePath(m_config);
    if (daemon.isEmpty()) {
        throw DaemonError(DaemonError::Kind::Spawn, "cannot locate lspbridge-daemon");
    }

    QStringList args = {
        QStringLiteral("--project"), project,
        QStringLiteral("--port"), QString::number(port),
        QStringLiteral("--analyzer"), analyzer,
        QStringLiteral("--state-dir"), m_config.stateDir,
    };
    if (m_config.trace) {
        args << QStringLiteral("--trace");
    }

    qint64 daemonPid = 0;
    if (!launchDetached(daemon, args, project, &daemonPid)) {
        LBLOG_ERROR(QStringLiteral("WorkerManager"),
                    QStringLiteral("ensureWorker"),
                    QStringLiteral("daemon_launch_failed"),
                    QStringLiteral("start_detached"),
                    QStringLiteral("qprocess"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"daemon", daemon.toStdString()}}));
        throw DaemonError(DaemonError::Kind::Spawn,
                          "failed to launch " + daemon.toStdString());
    }

    LBLOG_INFO(QStringLiteral("WorkerManager"),
               QStringLiteral("ensureWorker"),
               QStringLiteral("daemon_launched"),
               QStringLiteral("no_live_worker"),
               QStringLiteral("start_detached"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"project", project.toStdString()},
                              {"port", port},
                              {"daemonPid", daemonPid},
                              {"analyzer", analyzer.toStdString()}}));

    const auto record = waitForRecord(project, m_config.startupTimeoutMs);
    if (!record) {
        throw DaemonError(DaemonError::Kind::Spawn,
                          "daemon did not publish a worker within "
                              + std::to_string(m_config.startupTimeoutMs) + " ms");
    }

    // The analyzer needs a moment before it answers initialize promptly.
    suspendFor(m_config.startupGraceMs);
    return static_cast<quint16>(record->port);
}

DiagnosticList WorkerManager::queryDiagnostics(quint16 port,
                                               const QString &filePath,
                                               const QString &projectPath)
{
    const QString project = canonicalProjectPath(projectPath);
    const QFileInfo info(filePath);

    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        throw DaemonError(DaemonError::Kind::Io,
                          "cannot read " + filePath.toStdString() + ": "
                              + file.errorString().toStdString());
    }
    const QString text = QString::fromUtf8(file.readAll());
    const QString uri = QUrl::fromLocalFile(info.absoluteFilePath()).toString();

    RpcClient &client = m_connections.get(project, port);
    if (!client.isDocumentOpen(uri)) {
        client.openDocument(uri, text, m_config.languageId);
    } else {
        // Drop the previous push so the wait below only sees a fresh one.
        client.forgetDiagnostics(uri);
        client.changeDocument(uri, text, client.documentVersion(uri) + 1);
    }

    const DiagnosticList diagnostics =
        client.awaitDiagnostics(uri, m_config.diagnosticsTimeoutMs);

    LBLOG_DEBUG(QStringLiteral("WorkerManager"),
                QStringLiteral("queryDiagnostics"),
                QStringLiteral("diagnostics_collected"),
                QStringLiteral("query"),
                QStringLiteral("publish_diagnostics"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"uri", uri.toStdString()},
                               {"count", diagnostics.size()}}));
    return diagnostics;
}

std::optional<DaemonRecord> WorkerManager::status(const QString &projectPath) const
{
    return m_store.lookup(canonicalProjectPath(projectPath));
}

bool WorkerManager::stopWorker(const QString &projectPath)
{
    const auto record = status(projectPath);
    if (!record) {
        return false;
    }

    m_connections.clear();
    const bool signalled = terminateProcess(record->pid);
    LBLOG_INFO(QStringLiteral("WorkerManager"),
               QStringLiteral("stopWorker"),
               QStringLiteral("worker_stop_requested"),
               QStringLiteral("caller_request"),
               QStringLiteral("sigterm"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pid", record->pid},
                              {"signalled", signalled}}));
    return signalled;
}

const BridgeConfig &WorkerManager::config() const
{
    return m_config;
}

const StateStore &WorkerManager::store() const
{
    return m_store;
}

ConnectionCache &WorkerManager::connections()
{
    return m_connections;
}

std::optional<DaemonRecord> WorkerManager::waitForRecord(const QString &projectPath,
                                                         int timeoutMs) const
{
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        if (auto record = m_store.lookup(projectPath)) {
            return record;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        suspendFor(kRecordPollIntervalMs);
    }
}

void WorkerManager::suspendFor(int ms)
{
    if (ms <= 0) {
        return;
    }
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

} // namespace lspbridge
