#pragma once

#include <stdexcept>
#include <string>

namespace lspbridge {

/**
 * DaemonError is the single failure type surfaced by the bridge. Synchronous
 * entry points throw it; asynchronous ones hand it to their error callback.
 */
class DaemonError : public std::runtime_error
{
public:
    enum class Kind {
        Allocation,     // no free port within the probe budget
        WorkerNotFound, // analyzer executable could not be located
        Spawn,          // worker or daemon process failed to start
        Transport,      // connection refused, reset or closed
        RequestTimeout, // one request exceeded its deadline
        Remote,         // the worker answered with an error object
        Protocol,       // call made in the wrong client state
        Io              // local file could not be read or written
    };

    DaemonError(Kind kind, const std::string &message, int remoteCode = 0)
        : std::runtime_error(message)
        , m_kind(kind)
        , m_remoteCode(remoteCode)
    {
    }

    Kind kind() const { return m_kind; }
    int remoteCode() const { return m_remoteCode; }

private:
    Kind m_kind;
    int m_remoteCode;
};

inline const char *toKindString(DaemonError::Kind kind)
{
    switch (kind) {
    case DaemonError::Kind::Allocation:
        return "allocation";
    case DaemonError::Kind::WorkerNotFound:
        return "worker_not_found";
    case DaemonError::Kind::Spawn:
        return "spawn";
    case DaemonError::Kind::Transport:
        return "transport";
    case DaemonError::Kind::RequestTimeout:
        return "request_timeout";
    case DaemonError::Kind::Remote:
        return "remote";
    case DaemonError::Kind::Protocol:
        return "protocol";
    case DaemonError::Kind::Io:
        return "io";
    }
    return "unknown";
}

} // namespace lspbridge
