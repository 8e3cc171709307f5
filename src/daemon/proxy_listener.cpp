#include "daemon/proxy_listener.hpp"

#include <QDebug>
#include <QHostAddress>

#include "common/logging.hpp"

namespace lspbridge {

ProxyListener::ProxyListener(QObject *parent)
    : QObject(parent)
{
    connect(&m_server, &QTcpServer::newConnection,
            this, &ProxyListener::handleNewConnection);
}

ProxyListener::~ProxyListener()
{
    stop();
}

bool ProxyListener::start(quint16 port, QProcess *worker)
{
    if (!worker) {
        return false;
    }

    if (!m_server.listen(QHostAddress::LocalHost, port)) {
        qWarning() << "Failed to listen on proxy port" << port << m_server.errorString();
        LBLOG_ERROR(QStringLiteral("ProxyListener"),
                    QStringLiteral("start"),
                    QStringLiteral("proxy_listen_failed"),
                    QStringLiteral("bind_error"),
                    QStringLiteral("tcp_loopback"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"port", port},
                                   {"error", m_server.errorString().toStdString()}}));
        return false;
    }

    m_worker = worker;
    connect(worker, &QProcess::readyReadStandardOutput,
            this, &ProxyListener::handleWorkerOutput);
    connect(worker, &QProcess::readChannelFinished,
            this, &ProxyListener::handleWorkerOutputClosed);

    qInfo() << "lspbridge proxy listening on 127.0.0.1:" << port;
    return true;
}

void ProxyListener::stop()
{
    if (m_worker) {
        disconnect(m_worker.data(), nullptr, this, nullptr);
        m_worker.clear();
    }

    m_server.close();

    QList<QPointer<QTcpSocket>> sockets = m_waiting;
    if (m_active) {
        sockets.prepend(m_active);
    }
    m_active.clear();
    m_waiting.clear();

    for (const auto &socket : sockets) {
        if (!socket) {
            continue;
        }
        disconnect(socket.data(), nullptr, this, nullptr);
        socket->abort();
        socket->deleteLater();
    }
}

bool ProxyListener::isListening() const
{
    return m_server.isListening();
}

quint16 ProxyListener::port() const
{
    return m_server.serverPort();
}

int ProxyListener::connectionCount() const
{
    int count = m_active ? 1 : 0;
    for (const auto &socket : m_waiting) {
        if (socket) {
            ++count;
        }
    }
    return count;
}

void ProxyListener::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QTcpSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyListener::handleClientReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyListener::handleClientDisconnected);

        m_waiting.append(socket);
        LBLOG_DEBUG(QStringLiteral("ProxyListener"),
                    QStringLiteral("handleNewConnection"),
                    QStringLiteral("proxy_client_accepted"),
                    QStringLiteral("client_connect"),
                    QStringLiteral("tcp_loopback"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"peerPort", socket->peerPort()},
                                   {"queued", m_waiting.size()}}));
    }

    if (!m_active) {
        activateNext();
    }
}

void ProxyListener::handleClientReadyRead()
{
    auto *socket = qobject_cast<QTcpSocket *>(sender());
    // Waiting connections keep their bytes buffered until they are activated.
    if (!socket || socket != m_active) {
        return;
    }
    forwardToWorker(socket);
}

void ProxyListener::handleClientDisconnected()
{
    auto *socket = qobject_cast<QTcpSocket *>(sender());
    if (!socket) {
        return;
    }

    m_waiting.removeAll(QPointer<QTcpSocket>(socket));
    socket->deleteLater();

    if (socket == m_active) {
        m_active.clear();
        activateNext();
    }
}

void ProxyListener::handleWorkerOutput()
{
    if (!m_worker) {
        return;
    }

    const QByteArray data = m_worker->readAllStandardOutput();
    if (data.isEmpty()) {
        return;
    }

    if (!m_active) {
        LBLOG_DEBUG(QStringLiteral("ProxyListener"),
                    QStringLiteral("handleWorkerOutput"),
                    QStringLiteral("proxy_output_dropped"),
                    QStringLiteral("no_active_client"),
                    QStringLiteral("tcp_loopback"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"bytes", data.size()}}));
        return;
    }

    m_active->write(data);
}

void ProxyListener::handleWorkerOutputClosed()
{
    // End of the worker's stdout ends the relay for the current client.
    if (m_active) {
        m_active->disconnectFromHost();
    }
}

void ProxyListener::activateNext()
{
    while (!m_waiting.isEmpty()) {
        QPointer<QTcpSocket> next = m_waiting.takeFirst();
        if (!next || next->state() != QAbstractSocket::ConnectedState) {
            continue;
        }

        m_active = next;
        emit connectionActivated();
        if (m_active && m_active->bytesAvailable() > 0) {
            forwardToWorker(m_active);
        }
        return;
    }
}

void ProxyListener::forwardToWorker(QTcpSocket *socket)
{
    const QByteArray data = socket->readAll();
    if (data.isEmpty() || !m_worker) {
        return;
    }
    m_worker->write(data);
}

} // namespace lspbridge
