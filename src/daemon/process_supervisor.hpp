#pragma once

#include <functional>
#include <vector>

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

namespace lspbridge {

/**
 * ProcessSupervisor owns one worker process and its standard streams.
 *
 * stdin and stdout carry the framed protocol and are exposed through
 * process(); stderr is read separately and only ever reaches the log.
 * Exit hooks run exactly once, whichever way the worker goes away.
 * The worker is never restarted here.
 */
class ProcessSupervisor : public QObject
{
    Q_OBJECT
public:
    using ExitHook = std::function<void()>;

    explicit ProcessSupervisor(QObject *parent = nullptr);
    ~ProcessSupervisor() override;

    // Throws DaemonError(Spawn) when the executable cannot be started.
    void spawn(const QString &projectPath,
               const QString &executable,
               const QStringList &arguments = {});

    QProcess *process();
    qint64 processId() const;
    bool isRunning() const;
    bool isFinalized() const;

    void addExitHook(ExitHook hook);

    // Close stdin, ask the worker to terminate, kill it after |graceMs|.
    void shutdown(int graceMs);

signals:
    void workerExited(int exitCode, QProcess::ExitStatus exitStatus);

private slots:
    void handleFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void handleErrorOccurred(QProcess::ProcessError error);
    void handleStandardError();

private:
    void runExitHooks();

    QProcess m_process;
    std::vector<ExitHook> m_exitHooks;
    qint64 m_pid = 0;
    bool m_started = false;
    bool m_finalized = false;
};

} // namespace lspbridge
