#pragma once

#include <QList>
#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QTcpServer>
#include <QTcpSocket>

namespace lspbridge {

/**
 * ProxyListener relays raw bytes between loopback TCP clients and a worker's
 * stdin/stdout. It never looks inside the stream.
 *
 * Only one connection is relayed at a time. Connections that arrive while
 * another is active wait, with their inbound bytes left in the socket buffer,
 * and are activated in arrival order once the active one closes. Worker
 * output produced while no connection is active is discarded.
 */
class ProxyListener : public QObject
{
    Q_OBJECT
public:
    explicit ProxyListener(QObject *parent = nullptr);
    ~ProxyListener() override;

    bool start(quint16 port, QProcess *worker);
    void stop();

    bool isListening() const;
    quint16 port() const;
    int connectionCount() const;

signals:
    void connectionActivated();

private slots:
    void handleNewConnection();
    void handleClientReadyRead();
    void handleClientDisconnected();
    void handleWorkerOutput();
    void handleWorkerOutputClosed();

private:
    void activateNext();
    void forwardToWorker(QTcpSocket *socket);

    QTcpServer m_server;
    QPointer<QProcess> m_worker;
    QPointer<QTcpSocket> m_active;
    QList<QPointer<QTcpSocket>> m_waiting;
};

} // namespace lspbridge
