/*
Sandcastle - main.cpp
Role: Headless host for the bundled server. Starts the sidecar on launch, reports the
      backend URL, and stops the sidecar when the application quits.
Usage: sandcastle_host [config.ini]
*/
#include <atomic>
#include <csignal>
#include <QCoreApplication>
#include <QDir>
#include <QFutureWatcher>
#include <QTimer>
#include "Log.hpp"
#include "SandcastleLogging.hpp"
#include "sidecar/BackendUrl.hpp"
#include "sidecar/SidecarSupervisor.hpp"

namespace {

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int) {
    g_shutdownRequested = true;
}

QString configPath(const QStringList& args) {
    if (args.size() > 1)
        return args.at(1);
    return QDir(QCoreApplication::applicationDirPath()).absoluteFilePath(QStringLiteral("config.ini"));
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("Sandcastle"));

    const QString iniPath = configPath(app.arguments());
    LOG_I("app", "Loading sidecar config from {}", iniPath.toStdString());
    SidecarSupervisor supervisor(SidecarConfig::load(iniPath));

    // A failed start is reported; the host keeps running without the server.
    auto* watcher = new QFutureWatcher<Port>(&app);
    QObject::connect(watcher, &QFutureWatcherBase::finished, &app, [watcher, &supervisor]{
        try {
            const Port port = watcher->future().result();
            LOG_I("sidecar", "Server ready on port {}", port);
        } catch (const SidecarError& e) {
            LOG_E("sidecar", "Failed to start: {}", e.message().toStdString());
        }
        const QUrl backend = resolveBackendUrl(supervisor.port(), supervisor.config().backendUrl);
        LOG_I("app", "Backend URL: {}", backend.toString().toStdString());
    });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &supervisor, [&supervisor]{
        try {
            supervisor.stop();
        } catch (const SidecarError& e) {
            LOG_W("sidecar", "Failed to stop: {}", e.message().toStdString());
        }
    });

    // Ctrl+C and service managers end the host through aboutToQuit so the sidecar is stopped.
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    auto* shutdownPoll = new QTimer(&app);
    QObject::connect(shutdownPoll, &QTimer::timeout, &app, []{
        if (g_shutdownRequested.exchange(false)) {
            sLog_App("Shutdown requested");
            QCoreApplication::quit();
        }
    });
    shutdownPoll->start(200);

    sLog_App("Starting sidecar...");
    watcher->setFuture(supervisor.start());

    return app.exec();
}
