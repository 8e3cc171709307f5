#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <chrono>
#include <functional>
#include <memory>

#include <nlohmann/json.hpp>

#include "client/connection_cache.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "daemon/state_store.hpp"
#include "protocol/message_framer.hpp"

namespace {

const QString kProject = QStringLiteral("/work/cached");

// Answers initialize through a configurable handler; counts the handshakes.
class HandshakeServer
{
public:
    HandshakeServer()
    {
        QObject::connect(&m_server, &QTcpServer::newConnection, [this]() {
            QTcpSocket *socket = m_server.nextPendingConnection();
            QObject::connect(socket, &QTcpSocket::readyRead, [this, socket]() {
                handleReadyRead(socket);
            });
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost, 0); }
    quint16 port() const { return m_server.serverPort(); }

    int initializeCount = 0;
    std::function<nlohmann::json(const nlohmann::json &id)> onInitialize;

private:
    void handleReadyRead(QTcpSocket *socket)
    {
        m_buffer.append(socket->readAll());
        auto decoded = lspbridge::decodeMessages(m_buffer);
        m_buffer = decoded.remaining;
        for (const auto &payload : decoded.messages) {
            const auto message = nlohmann::json::parse(payload.toStdString());
            if (message.value("method", "") != "initialize") {
                continue;
            }
            ++initializeCount;
            socket->write(lspbridge::encodeJson(onInitialize(message["id"])));
            socket->flush();
        }
    }

    QByteArray m_buffer;
    QTcpServer m_server;
};

nlohmann::json initializeResult(const nlohmann::json &id)
{
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"result", {{"capabilities", nlohmann::json::object()}}}};
}

nlohmann::json alreadyInitialized(const nlohmann::json &id)
{
    return {{"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", -32600}, {"message", "already initialized"}}}};
}

} // namespace

class ConnectionCacheTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testFirstConnectionInitializesAndPersists();
    void testInitializedRecordIsAdopted();
    void testRacedInitializeIsAdopted();
    void testRejectedInitializeWithoutRecordThrows();

private:
    lspbridge::DaemonRecord makeRecord(quint16 port, bool initialized) const;

    std::unique_ptr<QTemporaryDir> m_tempDir;
    lspbridge::BridgeConfig m_config;
};

void ConnectionCacheTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    m_config = lspbridge::BridgeConfig();
    m_config.stateDir = m_tempDir->path();
    m_config.connectTimeoutMs = 1000;
    m_config.requestTimeoutMs = 5000;
}

lspbridge::DaemonRecord ConnectionCacheTests::makeRecord(quint16 port, bool initialized) const
{
    lspbridge::DaemonRecord record;
    record.pid = QCoreApplication::applicationPid();
    record.port = port;
    record.projectPath = kProject.toStdString();
    record.startedAt = std::chrono::system_clock::now();
    record.initialized = initialized;
    return record;
}

void ConnectionCacheTests::testFirstConnectionInitializesAndPersists()
{
    HandshakeServer server;
    server.onInitialize = initializeResult;
    QVERIFY(server.listen());

    const lspbridge::StateStore store(m_config.stateDir);
    store.persist(makeRecord(server.port(), false));

    lspbridge::ConnectionCache cache(m_config, store);
    lspbridge::RpcClient &client = cache.get(kProject, server.port());
    QVERIFY(client.state() == lspbridge::RpcClient::State::Initialized);
    QCOMPARE(server.initializeCount, 1);
    QVERIFY(store.lookup(kProject)->initialized);

    // The cached client is handed out again without a new handshake.
    QCOMPARE(&cache.get(kProject, server.port()), &client);
    QCOMPARE(cache.size(), 1);
    QCOMPARE(server.initializeCount, 1);
}

void ConnectionCacheTests::testInitializedRecordIsAdopted()
{
    HandshakeServer server;
    server.onInitialize = initializeResult;
    QVERIFY(server.listen());

    const lspbridge::StateStore store(m_config.stateDir);
    store.persist(makeRecord(server.port(), true));

    lspbridge::ConnectionCache cache(m_config, store);
    QVERIFY(cache.get(kProject, server.port()).state()
            == lspbridge::RpcClient::State::Initialized);
    QTest::qWait(50);
    QCOMPARE(server.initializeCount, 0);
}

void ConnectionCacheTests::testRacedInitializeIsAdopted()
{
    HandshakeServer server;
    QVERIFY(server.listen());

    const lspbridge::StateStore store(m_config.stateDir);
    store.persist(makeRecord(server.port(), false));

    // Another caller finishes the handshake while this one is still queued.
    server.onInitialize = [&](const nlohmann::json &id) {
        store.persist(makeRecord(server.port(), true));
        return alreadyInitialized(id);
    };

    lspbridge::ConnectionCache cache(m_config, store);
    lspbridge::RpcClient &client = cache.get(kProject, server.port());
    QVERIFY(client.state() == lspbridge::RpcClient::State::Initialized);
    QCOMPARE(server.initializeCount, 1);
    QVERIFY(cache.contains(kProject, server.port()));
}

void ConnectionCacheTests::testRejectedInitializeWithoutRecordThrows()
{
    HandshakeServer server;
    server.onInitialize = alreadyInitialized;
    QVERIFY(server.listen());

    const lspbridge::StateStore store(m_config.stateDir);
    store.persist(makeRecord(server.port(), false));

    lspbridge::ConnectionCache cache(m_config, store);
    bool thrown = false;
    try {
        cache.get(kProject, server.port());
    } catch (const lspbridge::DaemonError &ex) {
        thrown = ex.kind() == lspbridge::DaemonError::Kind::Remote;
    }
    QVERIFY(thrown);
    QVERIFY(!cache.contains(kProject, server.port()));
}

QTEST_MAIN(ConnectionCacheTests)
#include "test_connection_cache.moc"
