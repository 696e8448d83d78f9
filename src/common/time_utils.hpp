#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDate>
#include <QDateTime>
#include <QTimeZone>

namespace daybreak {

// Calendar and instant helpers. Calendar dates are "yyyy-MM-dd" strings,
// reset times are "HH:MM" (24h), instants are system_clock time points.

std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp);

// Accepts "2024-01-03T01:00:00Z" and "2024-01-03T01:00:00.000Z".
std::optional<std::chrono::system_clock::time_point> parseIso8601Utc(
    const std::string &value);

QDateTime toQDateTime(std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point fromQDateTime(const QDateTime &dateTime);

// Resolves an IANA id; unknown or empty ids fall back to UTC.
QTimeZone resolveTimeZone(const std::string &timeZoneId);

std::optional<QDate> parseCalendarDate(const std::string &value);
std::string formatCalendarDate(const QDate &date);

// Calendar date of an instant in the given timezone.
std::string localDateString(std::chrono::system_clock::time_point timestamp,
                            const std::string &timeZoneId);

std::string addDays(const std::string &date, int days);

// Whole days from 'from' to 'to'; nullopt when either date is malformed.
std::optional<int> daysBetween(const std::string &from, const std::string &to);

bool isValidResetTime(const std::string &value);

// Parses "H:MM"/"HH:MM"; nullopt on anything the settings validator rejects.
std::optional<int> resetTimeMinutes(const std::string &value);

// Combines a calendar date with an "HH:MM" reset time in the given zone.
// Malformed reset times are treated as "00:00".
std::optional<std::chrono::system_clock::time_point> resetDateTime(
    const std::string &date,
    const std::string &resetTime,
    const std::string &timeZoneId);

} // namespace daybreak
