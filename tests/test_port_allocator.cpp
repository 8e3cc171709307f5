#include <QtTest/QtTest>

#include <QHostAddress>
#include <QTcpServer>

#include <memory>
#include <set>
#include <vector>

#include "common/errors.hpp"
#include "daemon/port_allocator.hpp"

namespace {

constexpr quint16 kTestBasePort = 47310;

// Holds listeners on [first, first + count) for the duration of a test.
bool occupy(std::vector<std::unique_ptr<QTcpServer>> &holders, quint16 first, int count)
{
    for (int i = 0; i < count; ++i) {
        auto server = std::make_unique<QTcpServer>();
        if (!server->listen(QHostAddress::LocalHost, static_cast<quint16>(first + i))) {
            return false;
        }
        holders.push_back(std::move(server));
    }
    return true;
}

} // namespace

class PortAllocatorTests : public QObject
{
    Q_OBJECT
private slots:
    void testStartPortWithinRange();
    void testStartPortDeterministic();
    void testAllocateReturnsFreePort();
    void testAllocateSkipsOccupiedPort();
    void testAllocateNeverReturnsHeldPort();
    void testAllocationExhausted();
    void testNeverProbesPastMaxPort();
};

void PortAllocatorTests::testStartPortWithinRange()
{
    const lspbridge::PortAllocator allocator(19200, 100, 100);
    for (int i = 0; i < 100; ++i) {
        const quint16 port = allocator.startPort(QStringLiteral("/projects/p%1").arg(i));
        QVERIFY(port >= 19200);
        QVERIFY(port < 19300);
    }
}

void PortAllocatorTests::testStartPortDeterministic()
{
    const lspbridge::PortAllocator a(19200, 100, 100);
    const lspbridge::PortAllocator b(19200, 100, 100);
    QCOMPARE(a.startPort(QStringLiteral("/projects/same")),
             b.startPort(QStringLiteral("/projects/same")));
}

void PortAllocatorTests::testAllocateReturnsFreePort()
{
    const lspbridge::PortAllocator allocator(kTestBasePort, 10, 20);
    const QString project = QStringLiteral("/projects/free");
    const quint16 port = allocator.allocate(project);
    QVERIFY(port >= allocator.startPort(project));
    QVERIFY(port < allocator.startPort(project) + 20);
    QVERIFY(lspbridge::PortAllocator::isPortFree(port));
}

void PortAllocatorTests::testAllocateSkipsOccupiedPort()
{
    const lspbridge::PortAllocator allocator(kTestBasePort, 1, 5);
    std::vector<std::unique_ptr<QTcpServer>> holders;
    if (!occupy(holders, kTestBasePort, 1)) {
        QSKIP("test port already in use");
    }

    QVERIFY(!lspbridge::PortAllocator::isPortFree(kTestBasePort));
    const quint16 port = allocator.allocate(QStringLiteral("/projects/any"));
    QVERIFY(port > kTestBasePort);
    QVERIFY(port < kTestBasePort + 5);
}

void PortAllocatorTests::testAllocateNeverReturnsHeldPort()
{
    const lspbridge::PortAllocator allocator(kTestBasePort + 300, 100, 200);
    std::vector<std::unique_ptr<QTcpServer>> holders;
    std::set<quint16> held;

    for (int i = 0; i < 100; ++i) {
        const quint16 port = allocator.allocate(QStringLiteral("/projects/many/p%1").arg(i));
        QVERIFY2(held.count(port) == 0, qPrintable(QStringLiteral("port %1 reused").arg(port)));

        auto server = std::make_unique<QTcpServer>();
        QVERIFY(server->listen(QHostAddress::LocalHost, port));
        holders.push_back(std::move(server));
        held.insert(port);
    }
    QCOMPARE(static_cast<int>(held.size()), 100);
}

void PortAllocatorTests::testAllocationExhausted()
{
    const lspbridge::PortAllocator allocator(kTestBasePort + 20, 1, 3);
    std::vector<std::unique_ptr<QTcpServer>> holders;
    if (!occupy(holders, kTestBasePort + 20, 3)) {
        QSKIP("test ports already in use");
    }

    bool thrown = false;
    try {
        allocator.allocate(QStringLiteral("/projects/busy"));
    } catch (const lspbridge::DaemonError &ex) {
        thrown = true;
        QVERIFY(ex.kind() == lspbridge::DaemonError::Kind::Allocation);
    }
    QVERIFY(thrown);
}

void PortAllocatorTests::testNeverProbesPastMaxPort()
{
    const lspbridge::PortAllocator allocator(65535, 1, 50);
    QCOMPARE(allocator.startPort(QStringLiteral("/projects/top")), quint16(65535));

    std::vector<std::unique_ptr<QTcpServer>> holders;
    if (!occupy(holders, 65535, 1)) {
        QSKIP("port 65535 already in use");
    }

    bool thrown = false;
    try {
        allocator.allocate(QStringLiteral("/projects/top"));
    } catch (const lspbridge::DaemonError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

QTEST_MAIN(PortAllocatorTests)
#include "test_port_allocator.moc"
