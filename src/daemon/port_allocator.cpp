#include "daemon/port_allocator.hpp"

#include <algorithm>
#include <string>

#include <QHostAddress>
#include <QTcpServer>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/state_store.hpp"

namespace lspbridge {

namespace {

constexpr int kMaxPort = 65535;

} // namespace

PortAllocator::PortAllocator(quint16 basePort, int rangeSize, int maxAttempts)
    : m_basePort(basePort)
    , m_rangeSize(std::max(rangeSize, 1))
    , m_maxAttempts(std::max(maxAttempts, 1))
{
}

quint16 PortAllocator::startPort(const QString &projectPath) const
{
    bool ok = false;
    const quint32 numeric = StateStore::hashProjectPath(projectPath).toUInt(&ok, 16);
    const int offset = ok ? static_cast<int>(numeric % static_cast<quint32>(m_rangeSize)) : 0;
    return static_cast<quint16>(std::min(m_basePort + offset, kMaxPort));
}

quint16 PortAllocator::allocate(const QString &projectPath) const
{
    const int first = startPort(projectPath);
    const int last = std::min(first + m_maxAttempts - 1, kMaxPort);

    for (int port = first; port <= last; ++port) {
        if (isPortFree(static_cast<quint16>(port))) {
            LBLOG_DEBUG(QStringLiteral("PortAllocator"),
                        QStringLiteral("allocate"),
                        QStringLiteral("port_allocated"),
                        QStringLiteral("worker_spawn"),
                        QStringLiteral("linear_probe"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"port", port},
                                       {"probes", port - first + 1}}));
            return static_cast<quint16>(port);
        }
    }

    LBLOG_WARN(QStringLiteral("PortAllocator"),
               QStringLiteral("allocate"),
               QStringLiteral("port_allocation_failed"),
               QStringLiteral("probe_budget_exhausted"),
               QStringLiteral("linear_probe"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"firstPort", first}, {"lastPort", last}}));
    throw DaemonError(DaemonError::Kind::Allocation,
                      "no free port found in " + std::to_string(first) + "-"
                          + std::to_string(last));
}

bool PortAllocator::isPortFree(quint16 port)
{
    QTcpServer probe;
    if (!probe.listen(QHostAddress::LocalHost, port)) {
        return false;
    }
    probe.close();
    return true;
}

} // namespace lspbridge
