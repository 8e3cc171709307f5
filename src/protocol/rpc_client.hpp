#pragma once

#include <functional>
#include <optional>
#include <string>

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTcpSocket>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace lspbridge {

/**
 * RpcClient speaks the framed JSON-RPC protocol over one proxy connection.
 *
 * Requests are correlated to responses by id, so replies may arrive in any
 * order. Every request carries its own deadline; an expired request is
 * rejected on its own and the connection stays up. Diagnostics pushed by the
 * worker are kept per document URI, each push replacing the previous one.
 *
 * The *AndWait / await* helpers spin a local event loop, so socket, process
 * and timer events keep flowing while the caller waits.
 */
class RpcClient : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Disconnected,
        Connected,
        Initialized,
        Closed
    };
    Q_ENUM(State)

    using ResultCallback = std::function<void(const nlohmann::json &result)>;
    using ErrorCallback = std::function<void(const DaemonError &error)>;
    using DiagnosticsCallback = std::function<void(const DiagnosticList &diagnostics)>;

    explicit RpcClient(QObject *parent = nullptr);
    ~RpcClient() override;

    void setRequestTimeout(int timeoutMs);
    void setPollInterval(int intervalMs);
    State state() const;

    // Throws DaemonError(Transport) if the proxy does not accept within |timeoutMs|.
    void connectToProxy(quint16 port, int timeoutMs);

    // Returns the request id. Throws DaemonError(Transport) when not connected.
    int request(const std::string &method,
                const nlohmann::json &params,
                ResultCallback onResult,
                ErrorCallback onError);
    void notify(const std::string &method, const nlohmann::json &params);

    void initialize(const QString &rootUri, ResultCallback onReady, ErrorCallback onError);
    void initializeAndWait(const QString &rootUri);
    // Adopt a worker that an earlier connection already initialized.
    void markInitialized();

    void openDocument(const QString &uri, const QString &text, const QString &languageId);
    void changeDocument(const QString &uri, const QString &text, int version);
    bool isDocumentOpen(const QString &uri) const;
    int documentVersion(const QString &uri) const;

    std::optional<DiagnosticList> diagnostics(const QString &uri) const;
    void forgetDiagnostics(const QString &uri);

    // |done| receives the pushed diagnostics, or an empty list once |timeoutMs| passes.
    void waitForDiagnostics(const QString &uri, int timeoutMs, DiagnosticsCallback done);
    DiagnosticList awaitDiagnostics(const QString &uri, int timeoutMs);

    int pendingRequestCount() const;
    void close();

signals:
    void stateChanged(lspbridge::RpcClient::State state);
    void diagnosticsPublished(const QString &uri);

private slots:
    void handleReadyRead();
    void handleDisconnected();

private:
    struct PendingRequest {
        std::string method;
        ResultCallback onResult;
        ErrorCallback onError;
    };

    void setState(State state);
    void send(const nlohmann::json &message);
    void dispatch(const nlohmann::json &message);
    void handleResponse(int id, const nlohmann::json &message);
    void handlePublishDiagnostics(const nlohmann::json &params);
    void handleRequestTimeout(int id);
    void rejectAllPending(const DaemonError &error);
    void requireInitialized(const char *operation) const;

    QTcpSocket *m_socket;
    QByteArray m_buffer;
    State m_state = State::Disconnected;
    int m_nextRequestId = 1;
    int m_requestTimeoutMs = 30000;
    int m_pollIntervalMs = 100;
    QHash<int, PendingRequest> m_pending;
    QHash<QString, DiagnosticList> m_diagnostics;
    QHash<QString, int> m_documentVersions;
};

} // namespace lspbridge
