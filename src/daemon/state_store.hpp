#pragma once

#include <optional>

#include <QString>

#include "common/models.hpp"

namespace lspbridge {

/**
 * StateStore keeps one DaemonRecord file per project in a shared directory.
 * A record only counts while the process it names is alive; stale files are
 * deleted the first time they are looked up.
 */
class StateStore
{
public:
    explicit StateStore(QString stateDir);

    // Short, stable hex digest used for state file names and port derivation.
    static QString hashProjectPath(const QString &projectPath);

    QString stateDir() const;
    QString recordPath(const QString &projectPath) const;

    std::optional<DaemonRecord> lookup(const QString &projectPath) const;

    // Atomically replaces the record for record.projectPath. Throws DaemonError(Io).
    void persist(const DaemonRecord &record) const;

    // Idempotent: a missing file is not an error.
    void remove(const QString &projectPath) const;

    // Removes the record only while it still belongs to |pid|, so a newer
    // worker's record survives the exit of an older one.
    void removeOwned(const QString &projectPath, qint64 pid) const;

private:
    std::optional<DaemonRecord> readRecord(const QString &path) const;

    QString m_stateDir;
};

} // namespace lspbridge
