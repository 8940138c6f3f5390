#pragma once
/*
Sandcastle - SidecarSupervisor
Role: Single authority over "is a server instance running, and on which port".
Inputs/Outputs: start() spawns the bundled server and resolves with its port once it
                announced itself and passed a health check; stop() signals it; port() reads state.
Threading: Work runs as cooperative tasks on the owner thread's event loop (QProcess signals,
           QTimer, QNetworkReply). start()/stop() called from other threads are marshalled onto
           the owner thread with a blocking queued call, so that loop must be running.
           port(), hasChild() and processId() only take the state mutex, which is never held
           across the spawn, and are safe from any thread.
Lifetime: A stopped child is retired, not awaited. Children still running when the supervisor
          is destroyed get QProcessSidecar::kTerminateGraceMs to exit before they are killed.
Integration: Owned by the host application; wire serverStarted/serverError to the UI.
Observability: Logs lifecycle on sandcastle.sidecar; child output on "[server]" lines.
Related: PortDiscoveryReader.hpp, HealthPoller.hpp, SidecarProcess.hpp, SidecarConfig.hpp.
*/
#include <memory>
#include <optional>
#include <QFuture>
#include <QMutex>
#include <QObject>
#include <QPromise>
#include <QString>
#include <QUrl>
#include "SidecarConfig.hpp"
#include "SidecarError.hpp"
#include "SidecarProcess.hpp"
#include "SidecarTypes.hpp"

class SidecarSupervisor : public QObject {
    Q_OBJECT

public:
    explicit SidecarSupervisor(SidecarConfig config, QObject* parent = nullptr);
    SidecarSupervisor(SidecarConfig config, std::unique_ptr<SidecarLauncher> launcher, QObject* parent = nullptr);
    ~SidecarSupervisor() override;

    SidecarSupervisor(const SidecarSupervisor&) = delete;
    SidecarSupervisor& operator=(const SidecarSupervisor&) = delete;

    /**
     * Brings the server up. The future fails with SidecarError on any step.
     * While a child is held nothing is spawned: callers get the in-flight
     * start, the known port, or PortUnknown.
     */
    QFuture<Port> start();

    /**
     * Sends the termination request to the held child and clears state.
     * No-op when nothing runs. Throws SidecarError(StopFailed) when the signal
     * could not be delivered; state is cleared either way.
     */
    void stop();

    std::optional<Port> port() const;
    bool hasChild() const;
    qint64 processId() const;   // 0 when no child is held
    QUrl serviceUrl() const;

    const SidecarConfig& config() const { return m_config; }

signals:
    void serverStarted(Port port);
    void serverStopped();
    void serverError(const QString& error);
    void serverOutput(const QString& line, bool isError);

private:
    using StartPromise = std::shared_ptr<QPromise<Port>>;

    QFuture<Port> startOnOwnerThread();
    std::optional<SidecarError> stopOnOwnerThread();

    void awaitPort(SidecarProcess* child, quint64 generation);
    void onPortDiscovered(SidecarProcess* child, quint64 generation, Port port);
    void completeStart(quint64 generation, Port port);
    void failStart(quint64 generation, const SidecarError& error);
    void retire(std::unique_ptr<SidecarProcess> child);

    static QFuture<Port> readyFuture(Port port);
    static QFuture<Port> failedFuture(const SidecarError& error);

    // Guarded by m_mutex
    struct State {
        std::unique_ptr<SidecarProcess> child;
        std::optional<Port> port;
        StartPromise pending;       // start in flight
        quint64 generation = 0;     // bumped per spawn and per stop
    };

    mutable QMutex m_mutex;
    State m_state;
    SidecarConfig m_config;
    std::unique_ptr<SidecarLauncher> m_launcher;
};
