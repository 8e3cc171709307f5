#include "protocol/rpc_client.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "protocol/message_framer.hpp"

namespace lspbridge {

namespace {

constexpr int kMethodNotFound = -32601;
constexpr char kPublishDiagnostics[] = "textDocument/publishDiagnostics";

} // namespace

RpcClient::RpcClient(QObject *parent)
    : QObject(parent)
    , m_socket(new QTcpSocket(this))
{
    connect(m_socket, &QTcpSocket::readyRead,
            this, &RpcClient::handleReadyRead);
    connect(m_socket, &QTcpSocket::disconnected,
            this, &RpcClient::handleDisconnected);
}

RpcClient::~RpcClient()
{
    // Outstanding callbacks may capture state that is already gone; drop them.
    disconnect(m_socket, nullptr, this, nullptr);
    m_pending.clear();
    if (m_socket->state() != QAbstractSocket::UnconnectedState) {
        m_socket->flush();
        m_socket->disconnectFromHost();
    }
}

void RpcClient::setRequestTimeout(int timeoutMs)
{
    m_requestTimeoutMs = std::max(timeoutMs, 1);
}

void RpcClient::setPollInterval(int intervalMs)
{
    m_pollIntervalMs = std::max(intervalMs, 1);
}

RpcClient::State RpcClient::state() const
{
    return m_state;
}

void RpcClient::connectToProxy(quint16 port, int timeoutMs)
{
    if (m_socket->state() == QAbstractSocket::ConnectedState) {
        return;
    }

    m_buffer.clear();

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    connect(m_socket, &QTcpSocket::connected, &loop, &QEventLoop::quit);
    connect(m_socket, &QTcpSocket::errorOccurred, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    m_socket->connectToHost(QHostAddress::LocalHost, port);
    timer.start(timeoutMs);
    if (m_socket->state() != QAbstractSocket::ConnectedState) {
        loop.exec();
    }

    if (m_socket->state() != QAbstractSocket::ConnectedState) {
        const std::string reason = m_socket->errorString().toStdString();
        m_socket->abort();
        LBLOG_WARN(QStringLiteral("RpcClient"),
                   QStringLiteral("connectToProxy"),
                   QStringLiteral("proxy_connect_failed"),
                   QStringLiteral("transport_error"),
                   QStringLiteral("tcp_loopback"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"port", port}, {"error", reason}}));
        throw DaemonError(DaemonError::Kind::Transport,
                          "cannot connect to proxy on port " + std::to_string(port)
                              + ": " + reason);
    }

    setState(State::Connected);
    LBLOG_DEBUG(QStringLiteral("RpcClient"),
                QStringLiteral("connectToProxy"),
                QStringLiteral("proxy_connected"),
                QStringLiteral("query"),
                QStringLiteral("tcp_loopback"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"port", port}}));
}

int RpcClient::request(const std::string &method,
                       const nlohmann::json &params,
                       ResultCallback onResult,
                       ErrorCallback onError)
{
    const int id = m_nextRequestId++;
    send(nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    });

    m_pending.insert(id, PendingRequest{method, std::move(onResult), std::move(onError)});
    QTimer::singleShot(m_requestTimeoutMs, this, [this, id]() {
        handleRequestTimeout(id);
    });

    LBLOG_DEBUG(QStringLiteral("RpcClient"),
                QStringLiteral("request"),
                QStringLiteral("rpc_request_sent"),
                QStringLiteral("query"),
                QStringLiteral("json_rpc"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"method", method}, {"id", id}}));
    return id;
}

void RpcClient::notify(const std::string &method, const nlohmann::json &params)
{
    send(nlohmann::json{
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params}
    });
}

void RpcClient::initialize(const QString &rootUri,
                           ResultCallback onReady,
                           ErrorCallback onError)
{
    const nlohmann::json params = {
        {"processId", QCoreApplication::applicationPid()},
        {"rootUri", rootUri.toStdString()},
        {"capabilities", {
            {"textDocument", {
                {"publishDiagnostics", {{"relatedInformation", true}}}
            }}
        }}
    };

    request("initialize", params,
            [this, onReady = std::move(onReady)](const nlohmann::json &result) {
                notify("initialized", nlohmann::json::object());
                setState(State::Initialized);
                if (onReady) {
                    onReady(result);
                }
            },
            std::move(onError));
}

void RpcClient::initializeAndWait(const QString &rootUri)
{
    if (m_state == State::Initialized) {
        return;
    }

    bool finished = false;
    std::optional<DaemonError> failure;
    QEventLoop loop;

    initialize(rootUri,
               [&](const nlohmann::json &) {
                   finished = true;
                   loop.quit();
               },
               [&](const DaemonError &error) {
                   failure = error;
                   finished = true;
                   loop.quit();
               });

    if (!finished) {
        loop.exec();
    }
    if (failure) {
        throw *failure;
    }
}

void RpcClient::markInitialized()
{
    if (m_state != State::Connected) {
        throw DaemonError(DaemonError::Kind::Protocol,
                          "markInitialized requires a connected client");
    }
    setState(State::Initialized);
}

void RpcClient::openDocument(const QString &uri,
                             const QString &text,
                             const QString &languageId)
{
    requireInitialized("openDocument");
    notify("textDocument/didOpen", {
        {"textDocument", {
            {"uri", uri.toStdString()},
            {"languageId", languageId.toStdString()},
            {"version", 1},
            {"text", text.toStdString()}
        }}
    });
    m_documentVersions.insert(uri, 1);
}

void RpcClient::changeDocument(const QString &uri, const QString &text, int version)
{
    requireInitialized("changeDocument");
    // Whole-document replacement: one change entry without a range.
    notify("textDocument/didChange", {
        {"textDocument", {
            {"uri", uri.toStdString()},
            {"version", version}
        }},
        {"contentChanges", nlohmann::json::array({
            nlohmann::json{{"text", text.toStdString()}}
        })}
    });
    m_documentVersions.insert(uri, version);
}

bool RpcClient::isDocumentOpen(const QString &uri) const
{
    return m_documentVersions.contains(uri);
}

int RpcClient::documentVersion(const QString &uri) const
{
    return m_documentVersions.value(uri, 0);
}

std::optional<DiagnosticList> RpcClient::diagnostics(const QString &uri) const
{
    const auto it = m_diagnostics.constFind(uri);
    if (it == m_diagnostics.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void RpcClient::forgetDiagnostics(const QString &uri)
{
    m_diagnostics.remove(uri);
}

void RpcClient::waitForDiagnostics(const QString &uri,
                                   int timeoutMs,
                                   DiagnosticsCallback done)
{
    if (const auto found = diagnostics(uri)) {
        done(*found);
        return;
    }
    if (timeoutMs <= 0) {
        done(DiagnosticList{});
        return;
    }

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    auto *poll = new QTimer(this);
    poll->setInterval(std::min(m_pollIntervalMs, timeoutMs));
    connect(poll, &QTimer::timeout, this,
            [this, poll, uri, deadline, done = std::move(done)]() {
                const auto found = diagnostics(uri);
                if (!found && std::chrono::steady_clock::now() < deadline) {
                    return;
                }
                poll->stop();
                poll->deleteLater();
                // Timing out only means nothing was observed yet.
                done(found.value_or(DiagnosticList{}));
            });
    poll->start();
}

DiagnosticList RpcClient::awaitDiagnostics(const QString &uri, int timeoutMs)
{
    DiagnosticList result;
    bool finished = false;
    QEventLoop loop;

    waitForDiagnostics(uri, timeoutMs, [&](const DiagnosticList &diagnostics) {
        result = diagnostics;
        finished = true;
        loop.quit();
    });

    if (!finished) {
        loop.exec();
    }
    return result;
}

int RpcClient::pendingRequestCount() const
{
    return static_cast<int>(m_pending.size());
}

void RpcClient::close()
{
    if (m_state == State::Closed) {
        return;
    }
    setState(State::Closed);

    if (m_socket->state() != QAbstractSocket::UnconnectedState) {
        m_socket->flush();
        m_socket->disconnectFromHost();
    }
    rejectAllPending(DaemonError(DaemonError::Kind::Transport, "client closed"));
}

void RpcClient::handleReadyRead()
{
    m_buffer.append(m_socket->readAll());
    DecodeResult decoded = decodeMessages(m_buffer);
    m_buffer = std::move(decoded.remaining);

    for (const QByteArray &payload : decoded.messages) {
        const auto message = nlohmann::json::parse(payload.toStdString(), nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            LBLOG_DEBUG(QStringLiteral("RpcClient"),
                        QStringLiteral("handleReadyRead"),
                        QStringLiteral("rpc_message_dropped"),
                        QStringLiteral("invalid_json"),
                        QStringLiteral("json_parse"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"bytes", payload.size()}}));
            continue;
        }

        try {
            dispatch(message);
        } catch (const std::exception &ex) {
            LBLOG_WARN(QStringLiteral("RpcClient"),
                       QStringLiteral("handleReadyRead"),
                       QStringLiteral("rpc_dispatch_error"),
                       QStringLiteral("exception"),
                       QStringLiteral("json_rpc"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"what", ex.what()}}));
        }
    }
}

void RpcClient::handleDisconnected()
{
    if (m_state != State::Closed) {
        setState(State::Disconnected);
    }
    rejectAllPending(DaemonError(DaemonError::Kind::Transport, "connection lost"));
}

void RpcClient::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void RpcClient::send(const nlohmann::json &message)
{
    if (m_state == State::Disconnected || m_state == State::Closed
        || m_socket->state() != QAbstractSocket::ConnectedState) {
        throw DaemonError(DaemonError::Kind::Transport, "not connected to proxy");
    }
    m_socket->write(encodeJson(message));
    m_socket->flush();
}

void RpcClient::dispatch(const nlohmann::json &message)
{
    const bool hasId = message.contains("id") && !message.at("id").is_null();
    const auto methodIt = message.find("method");

    if (methodIt != message.end() && methodIt->is_string()) {
        const std::string method = methodIt->get<std::string>();
        if (hasId) {
            // Requests from the worker; none are supported by this client.
            send(nlohmann::json{
                {"jsonrpc", "2.0"},
                {"id", message.at("id")},
                {"error", {{"code", kMethodNotFound},
                           {"message", "method not supported: " + method}}}
            });
            return;
        }
        if (method == kPublishDiagnostics) {
            handlePublishDiagnostics(message.value("params", nlohmann::json::object()));
        }
        return;
    }

    if (hasId && message.at("id").is_number_integer()) {
        handleResponse(message.at("id").get<int>(), message);
    }
}

void RpcClient::handleResponse(int id, const nlohmann::json &message)
{
    if (!m_pending.contains(id)) {
        LBLOG_DEBUG(QStringLiteral("RpcClient"),
                    QStringLiteral("handleResponse"),
                    QStringLiteral("rpc_response_unmatched"),
                    QStringLiteral("unknown_or_expired_id"),
                    QStringLiteral("json_rpc"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"id", id}}));
        return;
    }

    const PendingRequest pending = m_pending.take(id);

    const auto errorIt = message.find("error");
    if (errorIt != message.end() && !errorIt->is_null()) {
        std::string text = "request failed";
        int code = 0;
        if (errorIt->is_object()) {
            const auto messageIt = errorIt->find("message");
            if (messageIt != errorIt->end() && messageIt->is_string()) {
                text = messageIt->get<std::string>();
            }
            const auto codeIt = errorIt->find("code");
            if (codeIt != errorIt->end() && codeIt->is_number_integer()) {
                code = codeIt->get<int>();
            }
        } else if (errorIt->is_string()) {
            text = errorIt->get<std::string>();
        }
        LBLOG_WARN(QStringLiteral("RpcClient"),
                   QStringLiteral("handleResponse"),
                   QStringLiteral("rpc_request_error"),
                   QStringLiteral("worker_error"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"method", pending.method},
                                  {"id", id},
                                  {"code", code}}));
        if (pending.onError) {
            pending.onError(DaemonError(DaemonError::Kind::Remote, text, code));
        }
        return;
    }

    if (!pending.onResult) {
        return;
    }
    // The entry is already gone, so a throwing continuation must still settle it.
    try {
        const auto resultIt = message.find("result");
        pending.onResult(resultIt != message.end() ? *resultIt : nlohmann::json());
    } catch (const DaemonError &error) {
        if (pending.onError) {
            pending.onError(error);
        }
    } catch (const std::exception &ex) {
        if (pending.onError) {
            pending.onError(DaemonError(DaemonError::Kind::Protocol, ex.what()));
        }
    }
}

void RpcClient::handlePublishDiagnostics(const nlohmann::json &params)
{
    if (!params.is_object()) {
        return;
    }
    const std::string uri = params.value("uri", "");
    if (uri.empty()) {
        return;
    }

    DiagnosticList list;
    const auto it = params.find("diagnostics");
    if (it != params.end() && it->is_array()) {
        for (const auto &entry : *it) {
            if (entry.is_object()) {
                list.push_back(entry.get<Diagnostic>());
            }
        }
    }

    const QString key = QString::fromStdString(uri);
    // A push is the worker's full view of the document: replace, never merge.
    m_diagnostics.insert(key, std::move(list));
    emit diagnosticsPublished(key);
}

void RpcClient::handleRequestTimeout(int id)
{
    if (!m_pending.contains(id)) {
        return;
    }

    const PendingRequest pending = m_pending.take(id);
    LBLOG_WARN(QStringLiteral("RpcClient"),
               QStringLiteral("handleRequestTimeout"),
               QStringLiteral("rpc_request_timeout"),
               QStringLiteral("deadline_passed"),
               QStringLiteral("timer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"method", pending.method},
                              {"id", id},
                              {"timeoutMs", m_requestTimeoutMs}}));
    if (pending.onError) {
        pending.onError(DaemonError(DaemonError::Kind::RequestTimeout,
                                    "request timeout: " + pending.method));
    }
}

void RpcClient::rejectAllPending(const DaemonError &error)
{
    QHash<int, PendingRequest> pending;
    pending.swap(m_pending);
    for (auto it = pending.begin(); it != pending.end(); ++it) {
        if (it->onError) {
            it->onError(error);
        }
    }
}

void RpcClient::requireInitialized(const char *operation) const
{
    if (m_state != State::Initialized) {
        throw DaemonError(DaemonError::Kind::Protocol,
                          std::string(operation) + " before initialize");
    }
}

} // namespace lspbridge
