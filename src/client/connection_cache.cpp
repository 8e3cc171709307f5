#include "client/connection_cache.hpp"

#include <QUrl>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace lspbridge {

ConnectionCache::ConnectionCache(const BridgeConfig &config, const StateStore &store)
    : m_config(config)
    , m_store(store)
{
}

ConnectionCache::~ConnectionCache()
{
    clear();
}

RpcClient &ConnectionCache::get(const QString &projectPath, quint16 port)
{
    const Key key{projectPath, port};
    auto it = m_clients.find(key);
    if (it != m_clients.end()) {
        if (it->second->state() == RpcClient::State::Initialized) {
            return *it->second;
        }
        // Disconnected or closed entries are rebuilt from scratch.
        m_clients.erase(it);
    }

    auto inserted = m_clients.emplace(key, openClient(projectPath, port));
    return *inserted.first->second;
}

bool ConnectionCache::contains(const QString &projectPath, quint16 port) const
{
    return m_clients.find(Key{projectPath, port}) != m_clients.end();
}

int ConnectionCache::size() const
{
    return static_cast<int>(m_clients.size());
}

void ConnectionCache::clear()
{
    for (auto &entry : m_clients) {
        entry.second->close();
    }
    m_clients.clear();
}

std::unique_ptr<RpcClient> ConnectionCache::openClient(const QString &projectPath, quint16 port)
{
    auto client = std::make_unique<RpcClient>();
    client->setRequestTimeout(m_config.requestTimeoutMs);
    client->setPollInterval(m_config.diagnosticsPollIntervalMs);
    client->connectToProxy(port, m_config.connectTimeoutMs);

    std::optional<DaemonRecord> record = m_store.lookup(projectPath);
    if (record && record->port == port && record->initialized) {
        client->markInitialized();
        LBLOG_DEBUG(QStringLiteral("ConnectionCache"),
                    QStringLiteral("openClient"),
                    QStringLiteral("worker_adopted"),
                    QStringLiteral("already_initialized"),
                    QStringLiteral("state_file"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"project", projectPath.toStdString()},
                                   {"port", port}}));
        return client;
    }

    try {
        client->initializeAndWait(QUrl::fromLocalFile(projectPath).toString());
    } catch (const DaemonError &error) {
        // Another invocation may have won the handshake while this connection
        // waited in the proxy queue; the worker then rejects a second initialize.
        if (error.kind() != DaemonError::Kind::Remote) {
            throw;
        }
        const auto current = m_store.lookup(projectPath);
        if (!current || current->port != port || !current->initialized) {
            throw;
        }
        client->markInitialized();
        LBLOG_INFO(QStringLiteral("ConnectionCache"),
                   QStringLiteral("openClient"),
                   QStringLiteral("worker_adopted"),
                   QStringLiteral("initialize_raced"),
                   QStringLiteral("state_file"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"project", projectPath.toStdString()},
                                  {"port", port},
                                  {"code", error.remoteCode()}}));
        return client;
    }

    if (record && record->port == port) {
        record->initialized = true;
        m_store.persist(*record);
    }

    LBLOG_INFO(QStringLiteral("ConnectionCache"),
               QStringLiteral("openClient"),
               QStringLiteral("worker_initialized"),
               QStringLiteral("first_connection"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"project", projectPath.toStdString()},
                              {"port", port}}));
    return client;
}

} // namespace lspbridge
