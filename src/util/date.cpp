#include "util/date.h"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stopevents {

namespace {

int ParseDigits(std::string_view text, std::string_view context) {
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    throw std::runtime_error("Invalid date format: " + std::string(context));
  }
  return value;
}

void WriteDate(std::ostream& os, const ServiceDate& date, const char* sep) {
  os << std::setfill('0') << std::setw(4) << int(date.year()) << sep
     << std::setw(2) << unsigned(date.month()) << sep << std::setw(2)
     << unsigned(date.day());
}

}  // namespace

ServiceDate ParseServiceDate(std::string_view text) {
  int y = 0;
  int m = 0;
  int d = 0;
  if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
    y = ParseDigits(text.substr(0, 4), text);
    m = ParseDigits(text.substr(5, 2), text);
    d = ParseDigits(text.substr(8, 2), text);
  } else if (text.size() == 8) {
    y = ParseDigits(text.substr(0, 4), text);
    m = ParseDigits(text.substr(4, 2), text);
    d = ParseDigits(text.substr(6, 2), text);
  } else {
    throw std::runtime_error("Invalid date format: " + std::string(text));
  }

  ServiceDate date{
      std::chrono::year{y},
      std::chrono::month{static_cast<unsigned>(m)},
      std::chrono::day{static_cast<unsigned>(d)}
  };
  if (!date.ok()) {
    throw std::runtime_error("Invalid calendar date: " + std::string(text));
  }
  return date;
}

std::string FormatServiceDate(const ServiceDate& date) {
  std::ostringstream oss;
  WriteDate(oss, date, "-");
  return oss.str();
}

std::string FormatDateInt(const ServiceDate& date) {
  std::ostringstream oss;
  WriteDate(oss, date, "");
  return oss.str();
}

ServiceDate OffsetDate(const ServiceDate& date, int days) {
  auto sys_days = std::chrono::sys_days{date} + std::chrono::days{days};
  return ServiceDate{sys_days};
}

const std::chrono::time_zone* EasternZone() {
  static const std::chrono::time_zone* zone =
      std::chrono::locate_zone("America/New_York");
  return zone;
}

Instant EasternWallTimeToInstant(const ServiceDate& date,
                                 int seconds_after_midnight) {
  std::chrono::local_seconds local = std::chrono::local_days{date} +
                                     std::chrono::seconds{seconds_after_midnight};
  return EasternZone()->to_sys(local, std::chrono::choose::earliest);
}

Instant UtcWallTimeToInstant(const ServiceDate& date,
                             int seconds_after_midnight) {
  return std::chrono::sys_days{date} +
         std::chrono::seconds{seconds_after_midnight};
}

std::string FormatEventTime(Instant t) {
  std::chrono::sys_info info = EasternZone()->get_info(t);
  Instant wall = t + info.offset;
  auto days = std::chrono::floor<std::chrono::days>(wall);
  ServiceDate ymd{days};
  std::chrono::hh_mm_ss hms{wall - days};

  long offset_minutes = info.offset.count() / 60;
  char sign = offset_minutes < 0 ? '-' : '+';
  if (offset_minutes < 0) offset_minutes = -offset_minutes;

  std::ostringstream oss;
  WriteDate(oss, ymd, "-");
  oss << " " << std::setw(2) << hms.hours().count() << ":" << std::setw(2)
      << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << sign << std::setw(2) << offset_minutes / 60
      << ":" << std::setw(2) << offset_minutes % 60;
  return oss.str();
}

Instant ParseEventTime(std::string_view text) {
  // YYYY-MM-DD HH:MM:SS, optionally followed by Z or +HH:MM / -HH:MM.
  if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T') ||
      text[13] != ':' || text[16] != ':') {
    throw std::runtime_error("Invalid event time: " + std::string(text));
  }
  ServiceDate date = ParseServiceDate(text.substr(0, 10));
  int seconds = ParseDigits(text.substr(11, 2), text) * 3600 +
                ParseDigits(text.substr(14, 2), text) * 60 +
                ParseDigits(text.substr(17, 2), text);

  std::string_view offset = text.substr(19);
  if (offset.empty()) {
    return EasternWallTimeToInstant(date, seconds);
  }
  if (offset == "Z") {
    return UtcWallTimeToInstant(date, seconds);
  }
  if (offset.size() != 6 || (offset[0] != '+' && offset[0] != '-') ||
      offset[3] != ':') {
    throw std::runtime_error("Invalid event time offset: " + std::string(text));
  }
  int offset_seconds = ParseDigits(offset.substr(1, 2), text) * 3600 +
                       ParseDigits(offset.substr(4, 2), text) * 60;
  if (offset[0] == '-') offset_seconds = -offset_seconds;
  return UtcWallTimeToInstant(date, seconds) -
         std::chrono::seconds{offset_seconds};
}

}  // namespace stopevents
