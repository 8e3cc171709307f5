#include "daemon/state_store.hpp"

#include <utility>

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QSaveFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace lspbridge {

namespace {

constexpr int kHashLength = 8;
constexpr qint64 kMaxRecordBytes = 64 * 1024;

} // namespace

StateStore::StateStore(QString stateDir)
    : m_stateDir(std::move(stateDir))
{
}

QString StateStore::hashProjectPath(const QString &projectPath)
{
    const QByteArray digest =
        QCryptographicHash::hash(projectPath.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex().left(kHashLength));
}

QString StateStore::stateDir() const
{
    return m_stateDir;
}

QString StateStore::recordPath(const QString &projectPath) const
{
    return QDir(m_stateDir).filePath(
        QStringLiteral("worker-%1.json").arg(hashProjectPath(projectPath)));
}

std::optional<DaemonRecord> StateStore::readRecord(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }

    const QByteArray data = file.read(kMaxRecordBytes);
    const auto parsed = nlohmann::json::parse(data.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    try {
        return parsed.get<DaemonRecord>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

std::optional<DaemonRecord> StateStore::lookup(const QString &projectPath) const
{
    const QString path = recordPath(projectPath);
    if (!QFile::exists(path)) {
        return std::nullopt;
    }

    const auto record = readRecord(path);
    if (!record.has_value()) {
        LBLOG_DEBUG(QStringLiteral("StateStore"),
                    QStringLiteral("lookup"),
                    QStringLiteral("state_unreadable"),
                    QStringLiteral("malformed_record"),
                    QStringLiteral("json_parse"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", path.toStdString()}}));
        return std::nullopt;
    }

    if (isProcessAlive(record->pid)) {
        return record;
    }

    QFile::remove(path);
    LBLOG_INFO(QStringLiteral("StateStore"),
               QStringLiteral("lookup"),
               QStringLiteral("state_stale_removed"),
               QStringLiteral("worker_dead"),
               QStringLiteral("pid_probe"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()},
                              {"pid", record->pid}}));
    return std::nullopt;
}

void StateStore::persist(const DaemonRecord &record) const
{
    if (!QDir().mkpath(m_stateDir)) {
        throw DaemonError(DaemonError::Kind::Io,
                          "failed to create state directory " + m_stateDir.toStdString());
    }

    const QString path = recordPath(QString::fromStdString(record.projectPath));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw DaemonError(DaemonError::Kind::Io,
                          "failed to open state file " + path.toStdString());
    }

    const nlohmann::json j = record;
    file.write(QByteArray::fromStdString(j.dump()));
    if (!file.commit()) {
        throw DaemonError(DaemonError::Kind::Io,
                          "failed to write state file " + path.toStdString());
    }
}

void StateStore::remove(const QString &projectPath) const
{
    const QString path = recordPath(projectPath);
    if (QFile::exists(path)) {
        QFile::remove(path);
    }
}

void StateStore::removeOwned(const QString &projectPath, qint64 pid) const
{
    const QString path = recordPath(projectPath);
    if (!QFile::exists(path)) {
        return;
    }

    const auto record = readRecord(path);
    if (record.has_value() && record->pid != pid) {
        return;
    }
    QFile::remove(path);
}

} // namespace lspbridge
