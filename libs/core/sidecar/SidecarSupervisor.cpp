/*
Sandcastle - SidecarSupervisor
Role: Spawn → discover port → health check → ready, with idempotent stop.
Threading: Every state change happens under m_mutex; signals and promise
           completion happen after the lock is released. Callbacks from an
           earlier start are recognised by their generation and dropped.
*/
#include "SidecarSupervisor.hpp"
#include "BackendUrl.hpp"
#include "HealthPoller.hpp"
#include "PortDiscoveryReader.hpp"
#include "ResourceLocator.hpp"
#include "SandcastleLogging.hpp"
#include <QFutureWatcher>
#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>
#include <QTimer>

SidecarSupervisor::SidecarSupervisor(SidecarConfig config, QObject* parent)
    : SidecarSupervisor(config, std::make_unique<QProcessLauncher>(config.spawnTimeoutMs), parent)
{
}

SidecarSupervisor::SidecarSupervisor(SidecarConfig config, std::unique_ptr<SidecarLauncher> launcher, QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_launcher(std::move(launcher))
{
    qRegisterMetaType<Port>("Port");
}

SidecarSupervisor::~SidecarSupervisor() {
    if (auto error = stopOnOwnerThread())
        sLog_Error("Failed to stop sidecar during shutdown:" << error->message());
}

QFuture<Port> SidecarSupervisor::start() {
    if (QThread::currentThread() == thread())
        return startOnOwnerThread();

    QFuture<Port> future;
    QMetaObject::invokeMethod(this, [this]{ return startOnOwnerThread(); },
                              Qt::BlockingQueuedConnection, &future);
    return future;
}

void SidecarSupervisor::stop() {
    std::optional<SidecarError> error;
    if (QThread::currentThread() == thread()) {
        error = stopOnOwnerThread();
    } else {
        QMetaObject::invokeMethod(this, [this]{ return stopOnOwnerThread(); },
                                  Qt::BlockingQueuedConnection, &error);
    }
    if (error)
        throw *error;
}

std::optional<Port> SidecarSupervisor::port() const {
    QMutexLocker lock(&m_mutex);
    return m_state.port;
}

bool SidecarSupervisor::hasChild() const {
    QMutexLocker lock(&m_mutex);
    return m_state.child != nullptr;
}

qint64 SidecarSupervisor::processId() const {
    QMutexLocker lock(&m_mutex);
    return m_state.child ? m_state.child->processId() : 0;
}

QUrl SidecarSupervisor::serviceUrl() const {
    const auto current = port();
    return current ? backendUrlForPort(*current, m_config.health.host) : QUrl();
}

QFuture<Port> SidecarSupervisor::startOnOwnerThread() {
    {
        QMutexLocker lock(&m_mutex);
        if (m_state.child) {
            if (m_state.pending)
                return m_state.pending->future();
            if (m_state.port)
                return readyFuture(*m_state.port);
            return failedFuture(SidecarError(SidecarErrorKind::PortUnknown,
                                             QStringLiteral("Server running but port unknown")));
        }
    }

    // Only the owner thread changes the state, so the lookup and the blocking
    // spawn run unlocked and port() readers on other threads never wait on them.
    const ResourceLocator locator(m_config.resourceDir, m_config.serverBundle);
    const auto bundle = locator.locateBundle();
    if (!bundle) {
        const SidecarError error(SidecarErrorKind::ResourceMissing, locator.describeMissing());
        sLog_Warning(error.message());
        emit serverError(error.message());
        return failedFuture(error);
    }

    QStringList arguments = m_config.runtimeArguments;
    arguments << *bundle;
    const QString program = ResourceLocator::resolveRuntime(m_config.runtimeProgram);

    QString cause;
    std::unique_ptr<SidecarProcess> child = m_launcher->launch(program, arguments, &cause);
    if (!child) {
        const SidecarError error(SidecarErrorKind::SpawnFailed,
                                 QStringLiteral("Failed to spawn sidecar: %1").arg(cause));
        sLog_Warning(error.message());
        emit serverError(error.message());
        return failedFuture(error);
    }

    // Handle is visible to port()/stop() before any output is consumed.
    SidecarProcess* raw = child.get();
    QFuture<Port> future;
    quint64 generation = 0;
    {
        QMutexLocker lock(&m_mutex);
        m_state.child = std::move(child);
        m_state.port.reset();
        m_state.pending = std::make_shared<QPromise<Port>>();
        m_state.pending->start();
        generation = ++m_state.generation;
        future = m_state.pending->future();
    }

    sLog_Sidecar("Sidecar spawned, waiting up to" << m_config.portDiscoveryTimeoutMs << "ms for its port");
    awaitPort(raw, generation);
    return future;
}

void SidecarSupervisor::awaitPort(SidecarProcess* child, quint64 generation) {
    // Reader, watcher and timer die with the child object.
    auto* reader = new PortDiscoveryReader(m_config.announcementKey, child);
    connect(child, &SidecarProcess::outputEvent, reader, &PortDiscoveryReader::consume);
    connect(reader, &PortDiscoveryReader::serverOutput, this, &SidecarSupervisor::serverOutput);

    auto* timeout = new QTimer(child);
    timeout->setSingleShot(true);
    auto* watcher = new QFutureWatcher<Port>(child);

    connect(timeout, &QTimer::timeout, this, [this, generation, timeout, watcher]{
        watcher->disconnect(this);
        timeout->deleteLater();
        failStart(generation, SidecarError(SidecarErrorKind::PortDiscoveryTimeout,
                                           QStringLiteral("Timeout waiting for server to report port after %1ms")
                                               .arg(m_config.portDiscoveryTimeoutMs)));
    });
    connect(watcher, &QFutureWatcherBase::finished, this, [this, child, generation, timeout, watcher]{
        timeout->stop();
        timeout->deleteLater();
        const QFuture<Port> future = watcher->future();
        watcher->deleteLater();
        if (future.resultCount() > 0) {
            onPortDiscovered(child, generation, future.result());
        } else {
            failStart(generation, SidecarError(SidecarErrorKind::PortDiscoveryFailed,
                                               QStringLiteral("Failed to receive port from server")));
        }
    });

    watcher->setFuture(reader->portFuture());
    timeout->start(m_config.portDiscoveryTimeoutMs);
}

void SidecarSupervisor::onPortDiscovered(SidecarProcess* child, quint64 generation, Port port) {
    {
        QMutexLocker lock(&m_mutex);
        if (generation != m_state.generation || !m_state.pending)
            return;
        m_state.port = port;
    }
    sLog_Sidecar("Port" << port << "recorded, starting health check");

    auto* poller = new HealthPoller(m_config.health, child);
    auto* watcher = new QFutureWatcher<int>(child);
    connect(watcher, &QFutureWatcherBase::finished, this, [this, generation, port, poller, watcher]{
        const QFuture<int> future = watcher->future();
        watcher->deleteLater();
        poller->deleteLater();
        try {
            future.result();
            completeStart(generation, port);
        } catch (const SidecarError& error) {
            failStart(generation, error);
        }
    });
    watcher->setFuture(poller->poll(port));
}

void SidecarSupervisor::completeStart(quint64 generation, Port port) {
    StartPromise promise;
    {
        QMutexLocker lock(&m_mutex);
        if (generation != m_state.generation || !m_state.pending)
            return;
        promise = std::move(m_state.pending);
    }
    sLog_Info(QStringLiteral("[sidecar] Server started successfully on port %1").arg(port));
    promise->addResult(port);
    promise->finish();
    emit serverStarted(port);
}

void SidecarSupervisor::failStart(quint64 generation, const SidecarError& error) {
    StartPromise promise;
    std::unique_ptr<SidecarProcess> abandoned;
    {
        QMutexLocker lock(&m_mutex);
        if (generation != m_state.generation || !m_state.pending)
            return;
        promise = std::move(m_state.pending);
        if (!m_config.leaveRunningOnPartialFailure) {
            abandoned = std::move(m_state.child);
            m_state.port.reset();
            ++m_state.generation;
        }
    }

    sLog_Warning("[sidecar] Failed to start:" << error.message());
    if (abandoned) {
        QString cause;
        if (!abandoned->terminate(&cause))
            sLog_Warning("Could not terminate abandoned sidecar:" << cause);
        retire(std::move(abandoned));
    } else {
        sLog_Sidecar("Leaving sidecar running after failed start; stop() cleans it up");
    }

    promise->setException(error);
    promise->finish();
    emit serverError(error.message());
}

std::optional<SidecarError> SidecarSupervisor::stopOnOwnerThread() {
    std::unique_ptr<SidecarProcess> child;
    StartPromise pending;
    bool portKnown = false;
    {
        QMutexLocker lock(&m_mutex);
        if (!m_state.child)
            return std::nullopt;
        child = std::move(m_state.child);
        pending = std::move(m_state.pending);
        portKnown = m_state.port.has_value();
        m_state.port.reset();
        ++m_state.generation;
    }

    sLog_Info("[sidecar] Stopping server...");
    if (pending) {
        pending->setException(SidecarError(
            portKnown ? SidecarErrorKind::HealthCheckFailed : SidecarErrorKind::PortDiscoveryFailed,
            QStringLiteral("Server was stopped before it became ready")));
        pending->finish();
    }

    QString cause;
    const bool signalled = child->terminate(&cause);
    retire(std::move(child));
    emit serverStopped();

    if (!signalled)
        return SidecarError(SidecarErrorKind::StopFailed, cause);
    sLog_Info("[sidecar] Server stopped");
    return std::nullopt;
}

void SidecarSupervisor::retire(std::unique_ptr<SidecarProcess> child) {
    // The child exits on its own schedule; keep its QObject until then.
    SidecarProcess* process = child.release();
    process->setParent(this);
    if (!process->isRunning()) {
        process->deleteLater();
        return;
    }
    connect(process, &SidecarProcess::outputEvent, process, [process](const OutputEvent& event){
        if (event.kind == OutputEvent::Kind::Terminated)
            process->deleteLater();
    });
}

QFuture<Port> SidecarSupervisor::readyFuture(Port port) {
    QPromise<Port> promise;
    promise.start();
    promise.addResult(port);
    promise.finish();
    return promise.future();
}

QFuture<Port> SidecarSupervisor::failedFuture(const SidecarError& error) {
    QPromise<Port> promise;
    promise.start();
    promise.setException(error);
    promise.finish();
    return promise.future();
}
