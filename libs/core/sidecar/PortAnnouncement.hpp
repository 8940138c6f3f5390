#pragma once
#include <optional>
#include <QString>
#include <QStringView>
#include "SidecarTypes.hpp"

inline constexpr char kDefaultAnnouncementKey[] = "SANDCASTLE_SERVER_PORT";

// Matches "<key>=<digits>" at the start of a stdout line. The remainder is
// trimmed and must parse as a base-10 unsigned 16-bit value. Pure.
[[nodiscard]] std::optional<Port> parsePortAnnouncement(QStringView line,
                                                        QStringView key = QStringView(u"SANDCASTLE_SERVER_PORT"));
