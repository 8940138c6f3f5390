#pragma once
/*
Sandcastle - FakeHealthServer
Role: Minimal HTTP/1.1 responder on an ephemeral loopback port. Answers each request
      with the next scripted status code; the last code repeats.
*/
#include <QByteArray>
#include <QElapsedTimer>
#include <QHostAddress>
#include <QList>
#include <QStringList>
#include <QTcpServer>
#include <QTcpSocket>
#include "sidecar/SidecarTypes.hpp"

namespace fixtures {

class FakeHealthServer {
public:
    explicit FakeHealthServer(QList<int> statuses = {200})
        : m_statuses(std::move(statuses))
    {
        QObject::connect(&m_server, &QTcpServer::newConnection, &m_server, [this]{ acceptPending(); });
        m_clock.start();
    }

    bool listen() { return m_server.listen(QHostAddress::Any, 0); }
    Port port() const { return static_cast<Port>(m_server.serverPort()); }

    int requestCount() const { return m_requestTimesMs.size(); }
    const QList<qint64>& requestTimesMs() const { return m_requestTimesMs; }
    const QStringList& paths() const { return m_paths; }

private:
    void acceptPending() {
        while (QTcpSocket* socket = m_server.nextPendingConnection()) {
            QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]{
                QByteArray buffer = socket->property("request").toByteArray() + socket->readAll();
                socket->setProperty("request", buffer);
                if (!buffer.contains("\r\n\r\n") || socket->property("answered").toBool())
                    return;
                socket->setProperty("answered", true);
                respond(socket, buffer);
            });
        }
    }

    void respond(QTcpSocket* socket, const QByteArray& request) {
        const QList<QByteArray> requestLine = request.left(request.indexOf("\r\n")).split(' ');
        m_paths << (requestLine.size() > 1 ? QString::fromLatin1(requestLine.at(1)) : QString());
        m_requestTimesMs << m_clock.elapsed();

        const int index = qMin(m_requestTimesMs.size() - 1, m_statuses.size() - 1);
        const int status = m_statuses.value(index, 200);
        const QByteArray body = status < 300 ? QByteArray("{\"status\":\"ok\"}") : QByteArray("{\"status\":\"starting\"}");
        const QByteArray reason = status < 300 ? QByteArray("OK")
                                : status < 400 ? QByteArray("Found")
                                               : QByteArray("Service Unavailable");

        QByteArray response;
        response += "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason + "\r\n";
        if (status >= 300 && status < 400)
            response += "Location: /api/health\r\n";
        response += "Content-Type: application/json\r\n";
        response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
        response += "Connection: close\r\n\r\n";
        response += body;
        socket->write(response);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QList<int> m_statuses;
    QElapsedTimer m_clock;
    QList<qint64> m_requestTimesMs;
    QStringList m_paths;
};

// A loopback port nothing listens on.
inline Port closedPort() {
    QTcpServer probe;
    probe.listen(QHostAddress::LocalHost, 0);
    const Port port = static_cast<Port>(probe.serverPort());
    probe.close();
    return port;
}

} // namespace fixtures
