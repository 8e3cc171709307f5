#pragma once

#include <QObject>
#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/process_supervisor.hpp"
#include "daemon/proxy_listener.hpp"
#include "daemon/state_store.hpp"

namespace lspbridge {

/**
 * WorkerHost runs one analyzer for one project:
 * - spawns it through ProcessSupervisor
 * - exposes its stdio on a loopback port through ProxyListener
 * - publishes the DaemonRecord so other invocations can find it
 *
 * When the analyzer exits, the proxy is stopped, the record is removed and
 * finished() is emitted. lspbridge-daemon quits on that signal.
 */
class WorkerHost : public QObject
{
    Q_OBJECT
public:
    explicit WorkerHost(const BridgeConfig &config, QObject *parent = nullptr);
    ~WorkerHost() override;

    // Throws DaemonError (Spawn, Allocation or Io). Nothing is left running on failure.
    DaemonRecord start(const QString &projectPath, const QString &analyzerPath, quint16 port);
    void shutdown();

    bool isRunning() const;
    quint16 port() const;
    qint64 workerPid() const;

signals:
    void finished();

private:
    void handleWorkerExit(const QString &projectPath, qint64 pid);

    BridgeConfig m_config;
    StateStore m_store;
    ProxyListener m_proxy;
    // Declared last: destroyed first, while the proxy and store its hooks use are alive.
    ProcessSupervisor m_supervisor;
};

} // namespace lspbridge
