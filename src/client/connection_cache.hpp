#pragma once

#include <map>
#include <memory>
#include <utility>

#include <QString>

#include "common/config.hpp"
#include "daemon/state_store.hpp"
#include "protocol/rpc_client.hpp"

namespace lspbridge {

/**
 * ConnectionCache hands out one initialized RpcClient per (project, port) for
 * the lifetime of a single invocation. A worker that already completed its
 * handshake under an earlier invocation is adopted instead of re-initialized.
 */
class ConnectionCache
{
public:
    ConnectionCache(const BridgeConfig &config, const StateStore &store);
    ~ConnectionCache();

    ConnectionCache(const ConnectionCache &) = delete;
    ConnectionCache &operator=(const ConnectionCache &) = delete;

    // Throws DaemonError(Transport/RequestTimeout/Remote) when the client
    // cannot be connected or initialized.
    RpcClient &get(const QString &projectPath, quint16 port);

    bool contains(const QString &projectPath, quint16 port) const;
    int size() const;
    void clear();

private:
    using Key = std::pair<QString, quint16>;

    std::unique_ptr<RpcClient> openClient(const QString &projectPath, quint16 port);

    const BridgeConfig &m_config;
    const StateStore &m_store;
    std::map<Key, std::unique_ptr<RpcClient>> m_clients;
};

} // namespace lspbridge
