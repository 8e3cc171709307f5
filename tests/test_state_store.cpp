#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <chrono>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "daemon/state_store.hpp"

namespace {

// Above any realistic pid_max, so kill(pid, 0) reports ESRCH.
constexpr qint64 kDeadPid = 2147483000;

lspbridge::DaemonRecord makeRecord(const QString &project, qint64 pid, int port)
{
    lspbridge::DaemonRecord record;
    record.pid = pid;
    record.port = port;
    record.projectPath = project.toStdString();
    record.startedAt = std::chrono::system_clock::now();
    return record;
}

} // namespace

class StateStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testHashIsStable();
    void testLookupMissing();
    void testPersistAndLookupLive();
    void testStaleRecordRemoved();
    void testMalformedRecordTreatedAsAbsent();
    void testRemoveIsIdempotent();
    void testRemoveOwnedKeepsNewerWorker();
    void testRecordJsonFields();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
};

void StateStoreTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
}

void StateStoreTests::testHashIsStable()
{
    const QString a = lspbridge::StateStore::hashProjectPath(QStringLiteral("/work/alpha"));
    QCOMPARE(static_cast<int>(a.size()), 8);
    QCOMPARE(a, lspbridge::StateStore::hashProjectPath(QStringLiteral("/work/alpha")));
    QVERIFY(a != lspbridge::StateStore::hashProjectPath(QStringLiteral("/work/beta")));

    const lspbridge::StateStore store(m_tempDir->path());
    QVERIFY(store.recordPath(QStringLiteral("/work/alpha")).endsWith("worker-" + a + ".json"));
}

void StateStoreTests::testLookupMissing()
{
    const lspbridge::StateStore store(m_tempDir->path() + "/missing");
    QVERIFY(!store.lookup(QStringLiteral("/work/alpha")).has_value());
}

void StateStoreTests::testPersistAndLookupLive()
{
    const lspbridge::StateStore store(m_tempDir->path() + "/state");
    const QString project = QStringLiteral("/work/alpha");
    store.persist(makeRecord(project, QCoreApplication::applicationPid(), 19234));

    const auto record = store.lookup(project);
    QVERIFY(record.has_value());
    QCOMPARE(record->port, 19234);
    QCOMPARE(record->pid, static_cast<std::int64_t>(QCoreApplication::applicationPid()));
    QCOMPARE(QString::fromStdString(record->projectPath), project);
    QVERIFY(!record->initialized);
}

void StateStoreTests::testStaleRecordRemoved()
{
    const lspbridge::StateStore store(m_tempDir->path());
    const QString project = QStringLiteral("/work/stale");
    store.persist(makeRecord(project, kDeadPid, 19200));
    QVERIFY(QFile::exists(store.recordPath(project)));

    QVERIFY(!store.lookup(project).has_value());
    QVERIFY(!QFile::exists(store.recordPath(project)));

    // The second lookup finds nothing to read at all.
    QVERIFY(!store.lookup(project).has_value());
    QVERIFY(!QFile::exists(store.recordPath(project)));
}

void StateStoreTests::testMalformedRecordTreatedAsAbsent()
{
    const lspbridge::StateStore store(m_tempDir->path());
    const QString project = QStringLiteral("/work/broken");

    QFile file(store.recordPath(project));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QVERIFY(!store.lookup(project).has_value());

    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{\"port\": 19200}");
    file.close();
    QVERIFY(!store.lookup(project).has_value());
}

void StateStoreTests::testRemoveIsIdempotent()
{
    const lspbridge::StateStore store(m_tempDir->path());
    const QString project = QStringLiteral("/work/alpha");
    store.persist(makeRecord(project, QCoreApplication::applicationPid(), 19201));

    store.remove(project);
    QVERIFY(!QFile::exists(store.recordPath(project)));
    store.remove(project);
    QVERIFY(!store.lookup(project).has_value());
}

void StateStoreTests::testRemoveOwnedKeepsNewerWorker()
{
    const lspbridge::StateStore store(m_tempDir->path());
    const QString project = QStringLiteral("/work/alpha");
    const qint64 self = QCoreApplication::applicationPid();
    store.persist(makeRecord(project, self, 19202));

    store.removeOwned(project, self + 1);
    QVERIFY(store.lookup(project).has_value());

    store.removeOwned(project, self);
    QVERIFY(!QFile::exists(store.recordPath(project)));
}

void StateStoreTests::testRecordJsonFields()
{
    const lspbridge::StateStore store(m_tempDir->path());
    const QString project = QStringLiteral("/work/fields");
    auto record = makeRecord(project, QCoreApplication::applicationPid(), 19203);
    record.initialized = true;
    store.persist(record);

    QFile file(store.recordPath(project));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto json = nlohmann::json::parse(file.readAll().toStdString());
    QVERIFY(json.contains("pid"));
    QVERIFY(json.contains("startedAt"));
    QCOMPARE(json.value("port", 0), 19203);
    QCOMPARE(json.value("initialized", false), true);
    QCOMPARE(QString::fromStdString(json.value("projectPath", "")), project);
    QCOMPARE(json.at("startedAt").get<std::int64_t>(), lspbridge::toEpochMillis(record.startedAt));
}

QTEST_MAIN(StateStoreTests)
#include "test_state_store.moc"
