#pragma once

#include <QString>

namespace lspbridge {

/**
 * PortAllocator picks a loopback port for a project's proxy. The starting
 * point is derived from the project hash so the same project tends to land on
 * the same port; from there it probes upward until a bind succeeds.
 */
class PortAllocator
{
public:
    PortAllocator(quint16 basePort, int rangeSize, int maxAttempts);

    quint16 startPort(const QString &projectPath) const;

    // Throws DaemonError(Allocation) once the probe budget is exhausted.
    quint16 allocate(const QString &projectPath) const;

    // Binds and immediately releases a listener on 127.0.0.1:|port|.
    static bool isPortFree(quint16 port);

private:
    quint16 m_basePort;
    int m_rangeSize;
    int m_maxAttempts;
};

} // namespace lspbridge
