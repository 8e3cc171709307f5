#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();

private:
    QString logPath(const QString &suffix) const;
    QList<nlohmann::json> readLines(const QString &path) const;

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LoggingTests::init()
{
    QFile::remove(logPath(".log"));
    QFile::remove(logPath("-trace.log"));
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/lspbridge/logs/lspbridge-test" + suffix;
}

QList<nlohmann::json> LoggingTests::readLines(const QString &path) const
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    lspbridge::logging::initLogging(QStringLiteral("lspbridge-test"), false);

    lspbridge::logging::logEvent(lspbridge::logging::LogLevel::Info,
                                 QStringLiteral("lspbridge-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 lspbridge::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath(".log"));
    QCOMPARE(static_cast<int>(lines.size()), 1);
    QCOMPARE(QString::fromStdString(lines.first().value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(lines.first().value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(lines.first().value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(lines.first()["context"].value("key", "")),
             QStringLiteral("value"));
    QVERIFY(!QFile::exists(logPath("-trace.log")));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    lspbridge::logging::initLogging(QStringLiteral("lspbridge-test"), false);
    QVERIFY(!lspbridge::logging::isTraceEnabled());

    LBLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugSuppressedWithoutTrace"),
                QStringLiteral("quiet"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                lspbridge::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(readLines(logPath(".log")).isEmpty());
}

void LoggingTests::testTraceWrites()
{
    lspbridge::logging::initLogging(QStringLiteral("lspbridge-test"), true);
    QVERIFY(lspbridge::logging::isTraceEnabled());

    lspbridge::logging::logEvent(lspbridge::logging::LogLevel::Debug,
                                 QStringLiteral("lspbridge-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testTraceWrites"),
                                 QStringLiteral("test_trace"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 lspbridge::logging::defaultWho(),
                                 QStringLiteral("corr-2"),
                                 nlohmann::json::object());

    QCOMPARE(static_cast<int>(readLines(logPath(".log")).size()), 1);
    const auto trace = readLines(logPath("-trace.log"));
    QCOMPARE(static_cast<int>(trace.size()), 1);
    QCOMPARE(QString::fromStdString(trace.first().value("level", "")), QStringLiteral("DEBUG"));

    lspbridge::logging::initLogging(QStringLiteral("lspbridge-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    lspbridge::logging::initLogging(QStringLiteral("lspbridge-test"), false);
    lspbridge::logging::setCorrelationId(QStringLiteral("outer"));
    {
        lspbridge::logging::CorrelationScope scope(QStringLiteral("inner"));
        QCOMPARE(lspbridge::logging::currentCorrelationId(), QStringLiteral("inner"));
        LBLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   lspbridge::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QCOMPARE(lspbridge::logging::currentCorrelationId(), QStringLiteral("outer"));

    const auto lines = readLines(logPath(".log"));
    QCOMPARE(static_cast<int>(lines.size()), 1);
    QCOMPARE(QString::fromStdString(lines.first().value("corr", "")), QStringLiteral("inner"));
    QCOMPARE(QString::fromStdString(lines.first().value("process", "")),
             QStringLiteral("lspbridge-test"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
