#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace stopevents {

// Operating-day key. Trips that start before 03:00 Eastern belong to the
// previous day.
using ServiceDate = std::chrono::year_month_day;

// An absolute point in time at second resolution.
using Instant = std::chrono::sys_seconds;

// Accepts "YYYYMMDD", "YYYY-MM-DD", or any timestamp that starts with
// "YYYY-MM-DD" (the remainder is ignored).
ServiceDate ParseServiceDate(std::string_view text);

// Formats as "YYYY-MM-DD".
std::string FormatServiceDate(const ServiceDate& date);

// Formats as "YYYYMMDD", the GTFS calendar representation.
std::string FormatDateInt(const ServiceDate& date);

// Offsets a date by the given number of days.
// Positive days moves forward, negative days moves backward.
ServiceDate OffsetDate(const ServiceDate& date, int days);

// America/New_York.
const std::chrono::time_zone* EasternZone();

// Interprets `seconds_after_midnight` (may exceed one day) as Eastern wall
// time counted from local midnight of `date`. Ambiguous wall times at the
// end of daylight saving resolve to the earlier instant.
Instant EasternWallTimeToInstant(const ServiceDate& date,
                                 int seconds_after_midnight);

// Same as above with the wall time taken as UTC.
Instant UtcWallTimeToInstant(const ServiceDate& date,
                             int seconds_after_midnight);

// Eastern wall time with its UTC offset: "YYYY-MM-DD HH:MM:SS-05:00".
std::string FormatEventTime(Instant t);

// Parses the output of FormatEventTime. A trailing "Z" means UTC; without
// any offset the text is taken as Eastern wall time.
Instant ParseEventTime(std::string_view text);

}  // namespace stopevents
