#include "common/time_utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <QRegularExpression>
#include <QTime>

namespace daybreak {

namespace {

constexpr const char *kDateFormat = "yyyy-MM-dd";

const QRegularExpression &resetTimePattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^([0-1]?[0-9]|2[0-3]):[0-5][0-9]$"));
    return pattern;
}

} // namespace

std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601Utc(
    const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    // Optional fractional seconds, then 'Z' or end of input.
    std::chrono::milliseconds fraction{0};
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        int millis = 0;
        while (std::isdigit(in.peek())) {
            const int digit = in.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
        fraction = std::chrono::milliseconds(millis);
    }
    const int next = in.peek();
    if (next != 'Z' && next != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time) + fraction;
}

QDateTime toQDateTime(std::chrono::system_clock::time_point timestamp)
{
    return QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        QTimeZone::utc());
}

std::chrono::system_clock::time_point fromQDateTime(const QDateTime &dateTime)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{dateTime.toMSecsSinceEpoch()}};
}

QTimeZone resolveTimeZone(const std::string &timeZoneId)
{
    if (timeZoneId.empty()) {
        return QTimeZone::utc();
    }
    QTimeZone zone(QByteArray::fromStdString(timeZoneId));
    if (!zone.isValid()) {
        return QTimeZone::utc();
    }
    return zone;
}

std::optional<QDate> parseCalendarDate(const std::string &value)
{
    if (value.size() != 10) {
        return std::nullopt;
    }
    const QDate date = QDate::fromString(QString::fromStdString(value),
                                         QString::fromLatin1(kDateFormat));
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

std::string formatCalendarDate(const QDate &date)
{
    return date.toString(QString::fromLatin1(kDateFormat)).toStdString();
}

std::string localDateString(std::chrono::system_clock::time_point timestamp,
                            const std::string &timeZoneId)
{
    const QDateTime local = toQDateTime(timestamp).toTimeZone(resolveTimeZone(timeZoneId));
    return formatCalendarDate(local.date());
}

std::string addDays(const std::string &date, int days)
{
    const auto parsed = parseCalendarDate(date);
    if (!parsed) {
        return {};
    }
    return formatCalendarDate(parsed->addDays(days));
}

std::optional<int> daysBetween(const std::string &from, const std::string &to)
{
    const auto fromDate = parseCalendarDate(from);
    const auto toDate = parseCalendarDate(to);
    if (!fromDate || !toDate) {
        return std::nullopt;
    }
    return static_cast<int>(fromDate->daysTo(*toDate));
}

bool isValidResetTime(const std::string &value)
{
    return resetTimePattern().match(QString::fromStdString(value)).hasMatch();
}

std::optional<int> resetTimeMinutes(const std::string &value)
{
    if (!isValidResetTime(value)) {
        return std::nullopt;
    }
    const auto colon = value.find(':');
    const int hours = std::stoi(value.substr(0, colon));
    const int minutes = std::stoi(value.substr(colon + 1));
    return hours * 60 + minutes;
}

std::optional<std::chrono::system_clock::time_point> resetDateTime(
    const std::string &date,
    const std::string &resetTime,
    const std::string &timeZoneId)
{
    const auto day = parseCalendarDate(date);
    if (!day) {
        return std::nullopt;
    }
    const int minutes = resetTimeMinutes(resetTime).value_or(0);
    const QTimeZone zone = resolveTimeZone(timeZoneId);
    QDateTime local(*day, QTime(minutes / 60, minutes % 60), zone);
    if (!local.isValid()) {
        // Reset time falls into a DST gap: count forward from local midnight.
        local = QDateTime(*day, QTime(0, 0), zone).addSecs(minutes * 60);
    }
    if (!local.isValid()) {
        return std::nullopt;
    }
    return fromQDateTime(local);
}

} // namespace daybreak
