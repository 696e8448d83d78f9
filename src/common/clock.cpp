#include "common/clock.hpp"

#include <QTimeZone>

namespace daybreak {

std::chrono::system_clock::time_point SystemClock::now() const
{
    return std::chrono::system_clock::now();
}

std::string SystemClock::timeZoneId() const
{
    const QByteArray id = QTimeZone::systemTimeZoneId();
    if (id.isEmpty()) {
        return "UTC";
    }
    return id.toStdString();
}

} // namespace daybreak
