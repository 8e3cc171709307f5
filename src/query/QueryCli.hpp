#pragma once

#include <iosfwd>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace lspbridge {

class WorkerManager;

class QueryCli
{
public:
    explicit QueryCli(BridgeConfig config);
    QueryCli(BridgeConfig config, std::ostream &out, std::ostream &err);

    // |args| includes the program name. Returns the process exit code.
    int run(const QStringList &args);

private:
    int runQuery(WorkerManager &manager,
                 const QString &projectPath,
                 const QString &filePath,
                 bool asJson,
                 bool errorsOnly);
    int runStatus(WorkerManager &manager, const QString &projectPath);
    int runStop(WorkerManager &manager, const QString &projectPath);

    BridgeConfig m_config;
    std::ostream &m_out;
    std::ostream &m_err;
};

} // namespace lspbridge
