#pragma once

#include <array>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "util/date.h"

namespace stopevents {

struct GtfsStopId {
  std::string v;

  bool operator==(const GtfsStopId& other) const { return v == other.v; }
};

struct GtfsRouteId {
  std::string v;

  bool operator==(const GtfsRouteId& other) const { return v == other.v; }
};

struct GtfsTripId {
  std::string v;

  bool operator==(const GtfsTripId& other) const { return v == other.v; }
};

struct GtfsServiceId {
  std::string v;

  bool operator==(const GtfsServiceId& other) const { return v == other.v; }
};

// Seconds after the start of the service day. Values past 24:00:00 belong to
// trips that run over midnight.
struct GtfsTimeSinceServiceStart {
  int seconds;

  bool operator==(const GtfsTimeSinceServiceStart& other) const {
    return seconds == other.seconds;
  }
};

struct GtfsRouteDirectionId {
  GtfsRouteId route_id;
  int direction_id;

  bool operator==(const GtfsRouteDirectionId& other) const {
    return route_id == other.route_id && direction_id == other.direction_id;
  }
};

struct GtfsTrip {
  GtfsRouteDirectionId route_direction_id;
  GtfsTripId trip_id;
  GtfsServiceId service_id;

  bool operator==(const GtfsTrip& other) const {
    return route_direction_id == other.route_direction_id &&
           trip_id == other.trip_id && service_id == other.service_id;
  }
};

// One calendar.txt row.
struct GtfsCalendar {
  GtfsServiceId service_id;
  // Indexed by std::chrono::weekday::c_encoding(), Sunday first.
  std::array<bool, 7> weekdays;
  ServiceDate start_date;
  ServiceDate end_date;

  bool RunsOn(const ServiceDate& date) const;
};

// calendar_dates.txt exception_type values.
enum class GtfsExceptionType {
  kAdded = 1,
  kRemoved = 2,
};

struct GtfsCalendarDate {
  GtfsServiceId service_id;
  ServiceDate date;
  GtfsExceptionType exception_type;
};

struct GtfsStopTime {
  GtfsTripId trip_id;
  GtfsStopId stop_id;
  int stop_sequence;
  GtfsTimeSinceServiceStart arrival_time;
  GtfsTimeSinceServiceStart departure_time;

  bool operator==(const GtfsStopTime& other) const {
    return trip_id == other.trip_id && stop_id == other.stop_id &&
           stop_sequence == other.stop_sequence &&
           arrival_time == other.arrival_time &&
           departure_time == other.departure_time;
  }
};

// The tables of a feed that schedule enrichment reads.
struct Gtfs {
  std::vector<GtfsTrip> trips;
  std::vector<GtfsCalendar> calendar;
  std::vector<GtfsCalendarDate> calendar_dates;
  std::vector<GtfsStopTime> stop_times;
};

// The part of a feed that runs on one service date.
struct GtfsDay {
  std::vector<GtfsTrip> trips;
  std::vector<GtfsStopTime> stop_times;
};

// Loads trips, stop_times, calendar and calendar_dates from an unpacked GTFS
// directory. calendar.txt and calendar_dates.txt are each optional, but at
// least one of them must be present. Stop times without both an arrival and
// a departure are skipped.
Gtfs GtfsLoad(const std::string& gtfs_directory_path);

// Writes `gtfs` as a GTFS directory that GtfsLoad reads back.
void GtfsSave(const Gtfs& gtfs, const std::string& gtfs_directory_path);

// Service ids active on the date: calendar.txt weekday pattern within its
// range, then calendar_dates.txt additions and removals.
std::unordered_set<std::string> GtfsActiveServices(const Gtfs& gtfs,
                                                   const ServiceDate& date);

// Trips (and their stop times) whose service runs on the given date.
GtfsDay GtfsFilterByDate(const Gtfs& gtfs, const ServiceDate& date);

// "HH:MM:SS", hours may be a single digit or exceed 23.
GtfsTimeSinceServiceStart ParseGtfsTime(std::string_view time_str);

std::string FormatGtfsTime(const GtfsTimeSinceServiceStart& time);

// Pretty printing for Google Test
inline void PrintTo(const GtfsTripId& trip_id, std::ostream* os) {
  *os << "GtfsTripId{\"" << trip_id.v << "\"}";
}

inline void PrintTo(const GtfsStopTime& stop_time, std::ostream* os) {
  *os << "GtfsStopTime{" << stop_time.trip_id.v << " @ "
      << stop_time.stop_id.v << " #" << stop_time.stop_sequence << " "
      << FormatGtfsTime(stop_time.arrival_time) << "-"
      << FormatGtfsTime(stop_time.departure_time) << "}";
}

}  // namespace stopevents

template <>
struct std::hash<stopevents::GtfsTripId> {
  size_t operator()(const stopevents::GtfsTripId& trip_id) const {
    return std::hash<std::string>{}(trip_id.v);
  }
};
