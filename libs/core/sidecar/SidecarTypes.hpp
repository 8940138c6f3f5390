#pragma once
/*
Sandcastle - SidecarTypes
Role: Value types shared by the sidecar supervisor, its child process handles and the port reader.
*/
#include <QMetaType>
#include <QString>
#include <QtGlobal>
#include <utility>

using Port = quint16;

// One unit of child process output, in arrival order.
struct OutputEvent {
    enum class Kind { Stdout, Stderr, ProcessError, Terminated };

    Kind kind = Kind::Stdout;
    QString text;       // line without terminator, or an error description
    int exitCode = 0;   // Terminated only
    bool crashed = false;

    static OutputEvent stdoutLine(QString line) { return {Kind::Stdout, std::move(line), 0, false}; }
    static OutputEvent stderrLine(QString line) { return {Kind::Stderr, std::move(line), 0, false}; }
    static OutputEvent processError(QString message) { return {Kind::ProcessError, std::move(message), 0, false}; }
    static OutputEvent terminated(int exitCode, bool crashed = false) { return {Kind::Terminated, QString(), exitCode, crashed}; }
};

Q_DECLARE_METATYPE(OutputEvent)
