#pragma once
#include <QByteArray>
#include <QException>
#include <QString>

enum class SidecarErrorKind {
    ResourceMissing,
    SpawnFailed,
    PortDiscoveryTimeout,
    PortDiscoveryFailed,
    HealthCheckFailed,
    StopFailed,
    PortUnknown,          // child held but no port was ever recorded
};

QString toString(SidecarErrorKind kind);

/**
 * Failure of a supervisor operation. Derives from QException so it can be
 * carried through QFuture and rethrown by QFuture::result().
 */
class SidecarError : public QException {
public:
    SidecarError(SidecarErrorKind kind, QString message);

    SidecarErrorKind kind() const noexcept { return m_kind; }
    const QString& message() const noexcept { return m_message; }

    const char* what() const noexcept override { return m_what.constData(); }
    void raise() const override { throw *this; }
    SidecarError* clone() const override { return new SidecarError(*this); }

private:
    SidecarErrorKind m_kind;
    QString m_message;
    QByteArray m_what;
};
