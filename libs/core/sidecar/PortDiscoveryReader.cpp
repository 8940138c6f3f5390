#include "PortDiscoveryReader.hpp"
#include "PortAnnouncement.hpp"
#include "SandcastleLogging.hpp"

PortDiscoveryReader::PortDiscoveryReader(QString announcementKey, QObject* parent)
    : QObject(parent)
    , m_key(std::move(announcementKey))
{
}

void PortDiscoveryReader::consume(const OutputEvent& event) {
    switch (event.kind) {
        case OutputEvent::Kind::Stdout: {
            sLog_Info("[server]" << event.text);
            emit serverOutput(event.text, false);

            if (m_port.isSettled())
                return;
            if (auto port = parsePortAnnouncement(event.text, m_key)) {
                if (m_port.send(*port))
                    sLog_Sidecar("Server announced port" << *port);
            } else if (event.text.startsWith(m_key)) {
                sLog_Debug("Ignoring malformed port announcement:" << event.text);
            }
            return;
        }
        case OutputEvent::Kind::Stderr:
            sLog_Warning("[server]" << event.text);
            emit serverOutput(event.text, true);
            return;
        case OutputEvent::Kind::ProcessError:
            sLog_Warning("[server error]" << event.text);
            emit serverOutput(event.text, true);
            return;
        case OutputEvent::Kind::Terminated:
            m_terminated = true;
            sLog_Info(QStringLiteral("[server] terminated with status: %1%2")
                          .arg(event.exitCode)
                          .arg(event.crashed ? QStringLiteral(" (crashed)") : QString()));
            // No announcement can follow; release the waiting start early.
            m_port.close();
            return;
    }
}
