#pragma once
/*
Sandcastle - SidecarProcess
Role: Handle on one spawned sidecar. Turns the child's stdout/stderr, errors and exit
      into a single ordered stream of OutputEvent signals.
Integration: Created by a SidecarLauncher, exclusively owned by SidecarSupervisor.
Assumptions: Used from the thread that created it (QProcess affinity).
*/
#include <memory>
#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include "SidecarTypes.hpp"

class SidecarProcess : public QObject {
    Q_OBJECT

public:
    explicit SidecarProcess(QObject* parent = nullptr);
    ~SidecarProcess() override = default;

    virtual qint64 processId() const = 0;
    virtual bool isRunning() const = 0;

    // Sends the termination request and returns without waiting for exit.
    // On failure, writes the cause to *error.
    virtual bool terminate(QString* error) = 0;

signals:
    void outputEvent(const OutputEvent& event);
};

class QProcessSidecar : public SidecarProcess {
    Q_OBJECT

public:
    // Time a signalled child gets to exit on its own before teardown kills it.
    static constexpr int kTerminateGraceMs = 3000;

    explicit QProcessSidecar(QObject* parent = nullptr);
    // Asks a running child to exit (SIGTERM unless already sent), waits up to
    // kTerminateGraceMs, then kills it.
    ~QProcessSidecar() override;

    // Starts the program and waits up to startTimeoutMs for the OS to report it started.
    bool launch(const QString& program, const QStringList& arguments, int startTimeoutMs, QString* error);

    qint64 processId() const override;
    bool isRunning() const override;
    bool terminate(QString* error) override;

private slots:
    void onReadyReadStdout();
    void onReadyReadStderr();
    void onErrorOccurred(QProcess::ProcessError error);
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    void drainLines(QByteArray& buffer, OutputEvent::Kind kind, bool flushPartial);

    QProcess* m_process;
    QByteArray m_stdoutBuffer;
    QByteArray m_stderrBuffer;
    bool m_launching = false;
    bool m_terminateSent = false;
};

// Factory seam between the supervisor and the OS.
class SidecarLauncher {
public:
    virtual ~SidecarLauncher() = default;

    // Returns nullptr and fills *error when the process could not be spawned.
    virtual std::unique_ptr<SidecarProcess> launch(const QString& program,
                                                   const QStringList& arguments,
                                                   QString* error) = 0;
};

class QProcessLauncher : public SidecarLauncher {
public:
    explicit QProcessLauncher(int startTimeoutMs = 3000) : m_startTimeoutMs(startTimeoutMs) {}

    std::unique_ptr<SidecarProcess> launch(const QString& program,
                                           const QStringList& arguments,
                                           QString* error) override;

private:
    int m_startTimeoutMs;
};
