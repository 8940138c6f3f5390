#include "SidecarProcess.hpp"
#include "SandcastleLogging.hpp"
#include <QMetaType>

#ifdef Q_OS_UNIX
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#endif

SidecarProcess::SidecarProcess(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<OutputEvent>("OutputEvent");
}

QProcessSidecar::QProcessSidecar(QObject* parent)
    : SidecarProcess(parent)
    , m_process(new QProcess(this))
{
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    connect(m_process, &QProcess::readyReadStandardOutput, this, &QProcessSidecar::onReadyReadStdout);
    connect(m_process, &QProcess::readyReadStandardError, this, &QProcessSidecar::onReadyReadStderr);
    connect(m_process, &QProcess::errorOccurred, this, &QProcessSidecar::onErrorOccurred);
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &QProcessSidecar::onFinished);
}

QProcessSidecar::~QProcessSidecar() {
    m_process->disconnect(this);
    if (m_process->state() == QProcess::NotRunning)
        return;

    QString error;
    if (!m_terminateSent && !terminate(&error))
        sLog_Warning("Could not signal sidecar on teardown:" << error);
    if (m_process->waitForFinished(kTerminateGraceMs))
        return;

    sLog_Warning("Sidecar" << m_process->processId() << "ignored SIGTERM for" << kTerminateGraceMs << "ms, killing it");
    m_process->kill();
    m_process->waitForFinished(1000);
}

bool QProcessSidecar::launch(const QString& program, const QStringList& arguments,
                             int startTimeoutMs, QString* error) {
    sLog_Sidecar("Spawning" << program << arguments);
    m_launching = true;
    m_process->start(program, arguments);
    const bool started = m_process->waitForStarted(startTimeoutMs);
    m_launching = false;
    if (!started) {
        if (error)
            *error = m_process->errorString();
        return false;
    }
    sLog_Sidecar("Sidecar started with pid" << m_process->processId());
    return true;
}

qint64 QProcessSidecar::processId() const {
    return m_process->processId();
}

bool QProcessSidecar::isRunning() const {
    return m_process->state() != QProcess::NotRunning;
}

bool QProcessSidecar::terminate(QString* error) {
    if (m_process->state() == QProcess::NotRunning) {
        sLog_Sidecar("Sidecar already exited; nothing to signal");
        return true;
    }
#ifdef Q_OS_UNIX
    // QProcess::terminate() drops the kill(2) result; the caller needs it.
    const auto pid = static_cast<pid_t>(m_process->processId());
    if (::kill(pid, SIGTERM) != 0) {
        if (error)
            *error = QStringLiteral("Failed to send SIGTERM to pid %1: %2").arg(pid).arg(QString::fromLocal8Bit(std::strerror(errno)));
        return false;
    }
#else
    // Console children ignore WM_CLOSE, which is all terminate() sends on Windows.
    m_process->kill();
#endif
    m_terminateSent = true;
    return true;
}

void QProcessSidecar::onReadyReadStdout() {
    m_stdoutBuffer.append(m_process->readAllStandardOutput());
    drainLines(m_stdoutBuffer, OutputEvent::Kind::Stdout, false);
}

void QProcessSidecar::onReadyReadStderr() {
    m_stderrBuffer.append(m_process->readAllStandardError());
    drainLines(m_stderrBuffer, OutputEvent::Kind::Stderr, false);
}

void QProcessSidecar::onErrorOccurred(QProcess::ProcessError error) {
    // FailedToStart during launch() is reported through the launch result.
    if (m_launching && error == QProcess::FailedToStart)
        return;
    emit outputEvent(OutputEvent::processError(
        QStringLiteral("%1 (code %2)").arg(m_process->errorString()).arg(static_cast<int>(error))));
}

void QProcessSidecar::onFinished(int exitCode, QProcess::ExitStatus exitStatus) {
    m_stdoutBuffer.append(m_process->readAllStandardOutput());
    m_stderrBuffer.append(m_process->readAllStandardError());
    drainLines(m_stdoutBuffer, OutputEvent::Kind::Stdout, true);
    drainLines(m_stderrBuffer, OutputEvent::Kind::Stderr, true);
    emit outputEvent(OutputEvent::terminated(exitCode, exitStatus == QProcess::CrashExit));
}

void QProcessSidecar::drainLines(QByteArray& buffer, OutputEvent::Kind kind, bool flushPartial) {
    qsizetype newline = buffer.indexOf('\n');
    while (newline >= 0) {
        QByteArray line = buffer.left(newline);
        buffer.remove(0, newline + 1);
        if (line.endsWith('\r'))
            line.chop(1);
        emit outputEvent(OutputEvent{kind, QString::fromUtf8(line), 0, false});
        newline = buffer.indexOf('\n');
    }
    if (flushPartial && !buffer.isEmpty()) {
        emit outputEvent(OutputEvent{kind, QString::fromUtf8(buffer), 0, false});
        buffer.clear();
    }
}

std::unique_ptr<SidecarProcess> QProcessLauncher::launch(const QString& program,
                                                         const QStringList& arguments,
                                                         QString* error) {
    auto process = std::make_unique<QProcessSidecar>();
    if (!process->launch(program, arguments, m_startTimeoutMs, error))
        return nullptr;
    return process;
}
