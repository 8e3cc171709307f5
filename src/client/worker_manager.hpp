#pragma once

#include <optional>

#include <QString>

#include "client/connection_cache.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/port_allocator.hpp"
#include "daemon/state_store.hpp"

namespace lspbridge {

/**
 * WorkerManager is the caller-side entry point. It makes sure a daemon is
 * running for a project, then asks that daemon's analyzer for the diagnostics
 * of one file. All failures surface as DaemonError.
 */
class WorkerManager
{
public:
    explicit WorkerManager(BridgeConfig config);

    // Returns the proxy port of a live worker, launching a daemon if needed.
    quint16 ensureWorker(const QString &projectPath);

    DiagnosticList queryDiagnostics(quint16 port,
                                    const QString &filePath,
                                    const QString &projectPath);

    std::optional<DaemonRecord> status(const QString &projectPath) const;

    // Sends SIGTERM to the recorded worker. False when none is running.
    bool stopWorker(const QString &projectPath);

    const BridgeConfig &config() const;
    const StateStore &store() const;
    ConnectionCache &connections();

    static QString canonicalProjectPath(const QString &projectPath);

private:
    std::optional<DaemonRecord> waitForRecord(const QString &projectPath, int timeoutMs) const;
    static void suspendFor(int ms);

    BridgeConfig m_config;
    StateStore m_store;
    PortAllocator m_allocator;
    ConnectionCache m_connections;
};

} // namespace lspbridge
