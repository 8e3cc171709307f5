#include "daemon/process_supervisor.hpp"

#include <utility>

#include <QDebug>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace lspbridge {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kDestructorGraceMs = 1000;

QString exitStatusString(QProcess::ExitStatus status)
{
    return status == QProcess::CrashExit ? QStringLiteral("crash")
                                         : QStringLiteral("normal");
}

} // namespace

ProcessSupervisor::ProcessSupervisor(QObject *parent)
    : QObject(parent)
{
    m_process.setProcessChannelMode(QProcess::SeparateChannels);
    m_process.setReadChannel(QProcess::StandardOutput);

    connect(&m_process, &QProcess::finished,
            this, &ProcessSupervisor::handleFinished);
    connect(&m_process, &QProcess::errorOccurred,
            this, &ProcessSupervisor::handleErrorOccurred);
    connect(&m_process, &QProcess::readyReadStandardError,
            this, &ProcessSupervisor::handleStandardError);
}

ProcessSupervisor::~ProcessSupervisor()
{
    shutdown(kDestructorGraceMs);
}

void ProcessSupervisor::spawn(const QString &projectPath,
                              const QString &executable,
                              const QStringList &arguments)
{
    if (m_started) {
        throw DaemonError(DaemonError::Kind::Spawn, "worker already spawned");
    }

    m_process.setWorkingDirectory(projectPath);
    m_process.setProgram(executable);
    m_process.setArguments(arguments);
    m_process.start(QIODevice::ReadWrite);

    if (!m_process.waitForStarted(kStartTimeoutMs)) {
        const std::string reason = m_process.errorString().toStdString();
        LBLOG_ERROR(QStringLiteral("ProcessSupervisor"),
                    QStringLiteral("spawn"),
                    QStringLiteral("worker_spawn_failed"),
                    QStringLiteral("start_error"),
                    QStringLiteral("qprocess"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"executable", executable.toStdString()},
                                   {"cwd", projectPath.toStdString()},
                                   {"error", reason}}));
        throw DaemonError(DaemonError::Kind::Spawn,
                          "failed to start " + executable.toStdString() + ": " + reason);
    }

    m_started = true;
    m_pid = m_process.processId();

    LBLOG_INFO(QStringLiteral("ProcessSupervisor"),
               QStringLiteral("spawn"),
               QStringLiteral("worker_spawned"),
               QStringLiteral("no_live_worker"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"executable", executable.toStdString()},
                              {"cwd", projectPath.toStdString()},
                              {"pid", m_pid}}));
}

QProcess *ProcessSupervisor::process()
{
    return &m_process;
}

qint64 ProcessSupervisor::processId() const
{
    return m_pid;
}

bool ProcessSupervisor::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

bool ProcessSupervisor::isFinalized() const
{
    return m_finalized;
}

void ProcessSupervisor::addExitHook(ExitHook hook)
{
    m_exitHooks.push_back(std::move(hook));
}

void ProcessSupervisor::shutdown(int graceMs)
{
    if (m_process.state() != QProcess::NotRunning) {
        m_process.closeWriteChannel();
        m_process.terminate();
        if (!m_process.waitForFinished(graceMs)) {
            m_process.kill();
            m_process.waitForFinished(graceMs);
        }
    }

    if (m_started) {
        runExitHooks();
    }
}

void ProcessSupervisor::handleFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    LBLOG_INFO(QStringLiteral("ProcessSupervisor"),
               QStringLiteral("handleFinished"),
               QStringLiteral("worker_exited"),
               exitStatusString(exitStatus),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pid", m_pid}, {"exitCode", exitCode}}));

    emit workerExited(exitCode, exitStatus);
    runExitHooks();
}

void ProcessSupervisor::handleErrorOccurred(QProcess::ProcessError error)
{
    // Crashes are followed by finished(); start failures are reported by spawn().
    if (error == QProcess::Crashed || error == QProcess::FailedToStart) {
        return;
    }
    qWarning() << "lspbridge: worker process error" << m_process.errorString();
    LBLOG_WARN(QStringLiteral("ProcessSupervisor"),
               QStringLiteral("handleErrorOccurred"),
               QStringLiteral("worker_io_error"),
               QStringLiteral("process_error"),
               QStringLiteral("qprocess"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"pid", m_pid},
                              {"error", m_process.errorString().toStdString()}}));
}

void ProcessSupervisor::handleStandardError()
{
    const QByteArray output = m_process.readAllStandardError();
    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray &line : lines) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        LBLOG_DEBUG(QStringLiteral("ProcessSupervisor"),
                    QStringLiteral("handleStandardError"),
                    QStringLiteral("worker_stderr"),
                    QStringLiteral("worker_output"),
                    QStringLiteral("stderr_pipe"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"pid", m_pid}, {"line", line.toStdString()}}));
    }
}

void ProcessSupervisor::runExitHooks()
{
    if (m_finalized) {
        return;
    }
    m_finalized = true;

    std::vector<ExitHook> hooks;
    hooks.swap(m_exitHooks);
    for (const auto &hook : hooks) {
        hook();
    }
}

} // namespace lspbridge
