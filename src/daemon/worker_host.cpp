#include "daemon/worker_host.hpp"

#include <chrono>
#include <string>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace lspbridge {

WorkerHost::WorkerHost(const BridgeConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_store(config.stateDir)
{
}

WorkerHost::~WorkerHost()
{
    shutdown();
}

DaemonRecord WorkerHost::start(const QString &projectPath,
                               const QString &analyzerPath,
                               quint16 port)
{
    m_supervisor.spawn(projectPath, analyzerPath);
    const qint64 pid = m_supervisor.processId();

    if (!m_proxy.start(port, m_supervisor.process())) {
        m_supervisor.shutdown(m_config.shutdownGraceMs);
        throw DaemonError(DaemonError::Kind::Allocation,
                          "proxy could not listen on port " + std::to_string(port));
    }

    DaemonRecord record;
    record.pid = pid;
    record.port = m_proxy.port();
    record.projectPath = projectPath.toStdString();
    record.startedAt = std::chrono::system_clock::now();
    record.initialized = false;

    try {
        m_store.persist(record);
    } catch (const DaemonError &) {
        m_proxy.stop();
        m_supervisor.shutdown(m_config.shutdownGraceMs);
        throw;
    }

    m_supervisor.addExitHook([this, projectPath, pid]() {
        handleWorkerExit(projectPath, pid);
    });

    LBLOG_INFO(QStringLiteral("WorkerHost"),
               QStringLiteral("start"),
               QStringLiteral("worker_host_started"),
               QStringLiteral("no_live_worker"),
               QStringLiteral("proxy_and_state"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"project", record.projectPath},
                              {"pid", pid},
                              {"port", record.port},
                              {"analyzer", analyzerPath.toStdString()}}));
    return record;
}

void WorkerHost::shutdown()
{
    m_supervisor.shutdown(m_config.shutdownGraceMs);
}

bool WorkerHost::isRunning() const
{
    return m_supervisor.isRunning();
}

quint16 WorkerHost::port() const
{
    return m_proxy.port();
}

qint64 WorkerHost::workerPid() const
{
    return m_supervisor.processId();
}

void WorkerHost::handleWorkerExit(const QString &projectPath, qint64 pid)
{
    m_proxy.stop();
    m_store.removeOwned(projectPath, pid);

    LBLOG_INFO(QStringLiteral("WorkerHost"),
               QStringLiteral("handleWorkerExit"),
               QStringLiteral("worker_host_finished"),
               QStringLiteral("worker_exited"),
               QStringLiteral("exit_hook"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"project", projectPath.toStdString()},
                              {"pid", pid}}));
    emit finished();
}

} // namespace lspbridge
