#pragma once
/*
Sandcastle - PortDiscoveryReader
Role: Maps the child's line-oriented output events to exactly one port value.
Inputs/Outputs: Consumes OutputEvent; publishes the first valid announcement on a OneShot<Port>.
Threading: Lives on the supervisor's thread; events arrive through queued or direct Qt signals.
Observability: Every line is logged as "[server] ..." and re-emitted through serverOutput.
*/
#include <QFuture>
#include <QObject>
#include <QString>
#include "OneShot.hpp"
#include "SidecarTypes.hpp"

class PortDiscoveryReader : public QObject {
    Q_OBJECT

public:
    explicit PortDiscoveryReader(QString announcementKey, QObject* parent = nullptr);

    QFuture<Port> portFuture() { return m_port.future(); }
    bool isSettled() const { return m_port.isSettled(); }
    bool sawTermination() const { return m_terminated; }

public slots:
    void consume(const OutputEvent& event);

signals:
    void serverOutput(const QString& line, bool isError);

private:
    QString m_key;
    OneShot<Port> m_port;
    bool m_terminated = false;
};
