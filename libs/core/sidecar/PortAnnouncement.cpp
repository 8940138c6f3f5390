#include "PortAnnouncement.hpp"

std::optional<Port> parsePortAnnouncement(QStringView line, QStringView key) {
    if (key.isEmpty() || !line.startsWith(key))
        return std::nullopt;

    QStringView rest = line.mid(key.size());
    if (!rest.startsWith(u'='))
        return std::nullopt;

    const QString digits = rest.mid(1).trimmed().toString();
    if (digits.isEmpty())
        return std::nullopt;

    // toUShort accepts a leading sign; only plain digits are an announcement
    for (const QChar c : digits) {
        if (c.unicode() < u'0' || c.unicode() > u'9')
            return std::nullopt;
    }

    bool ok = false;
    const ushort value = digits.toUShort(&ok, 10);
    if (!ok)
        return std::nullopt;
    return static_cast<Port>(value);
}
