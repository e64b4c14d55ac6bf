#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "util/date.h"

namespace stopevents {

enum class SourceKind {
  kRealtimeFeed,
  kHistoricRail,
  kHistoricBus,
  kHistoricFerry,
};

// What a raw record observed. Sparse (timepoint) sources report the
// timepoint role instead of arrival/departure.
enum class PointKind {
  kArrival,
  kDeparture,
  kStartpoint,
  kMidpoint,
  kEndpoint,
};

enum class EventType {
  kArr,
  kDep,
};

std::string_view ToString(SourceKind kind);
std::string_view ToString(PointKind kind);
std::string_view ToString(EventType type);

// Accepts "realtime", "rail", "bus", "ferry" as well as the enumerator
// spellings ("REALTIME_FEED", ...).
SourceKind ParseSourceKind(std::string_view text);
EventType ParseEventType(std::string_view text);

// Required column absent for the selected era mapping. Fatal for the batch.
class SchemaMismatchError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A record that cannot be placed in its trip's stop ordering. Per record:
// the record is excluded and counted.
class OrphanEventError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One observed vehicle-at-location fact.
struct RawMovementRecord {
  ServiceDate service_date;
  std::string route_id;
  std::string trip_id;
  int direction_id = 0;
  std::string stop_id;
  std::optional<int> stop_sequence;
  std::string vehicle_id;
  std::string vehicle_label;
  Instant timestamp;
  PointKind point_kind = PointKind::kArrival;
  std::optional<std::string> vehicle_consist;
  // Set on real-time departures: the move timestamp is logged against the
  // stop the vehicle is heading to and must be re-homed to the stop it left.
  bool reassign_departure = false;
  // Separates runs logged under one trip_id, such as ferry sailings that
  // reuse a trip id for the return leg.
  int run = 0;
};

// One ARR or DEP at one stop for one trip.
struct Event {
  ServiceDate service_date;
  std::string route_id;
  std::string trip_id;
  int direction_id = 0;
  std::string stop_id;
  int stop_sequence = 0;
  std::string vehicle_id;
  std::string vehicle_label;
  EventType event_type = EventType::kArr;
  Instant event_time;
  std::optional<int> travel_time_seconds;
  std::optional<int> dwell_time_seconds;
  std::optional<int> headway_seconds;
  std::optional<int> headway_branch_seconds;
  std::optional<int> scheduled_tt;
  std::optional<int> scheduled_headway;
  std::optional<int> scheduled_headway_branch;
  std::optional<std::string> vehicle_consist;

  // Routing attributes resolved from the schedule. Not part of the row
  // schema.
  std::string trunk_id;
  std::optional<std::string> branch_id;
  int run = 0;

  bool operator==(const Event& other) const {
    return service_date == other.service_date && route_id == other.route_id &&
           trip_id == other.trip_id && direction_id == other.direction_id &&
           stop_id == other.stop_id && stop_sequence == other.stop_sequence &&
           vehicle_id == other.vehicle_id &&
           vehicle_label == other.vehicle_label &&
           event_type == other.event_type && event_time == other.event_time &&
           travel_time_seconds == other.travel_time_seconds &&
           dwell_time_seconds == other.dwell_time_seconds &&
           headway_seconds == other.headway_seconds &&
           headway_branch_seconds == other.headway_branch_seconds &&
           scheduled_tt == other.scheduled_tt &&
           scheduled_headway == other.scheduled_headway &&
           scheduled_headway_branch == other.scheduled_headway_branch &&
           vehicle_consist == other.vehicle_consist &&
           trunk_id == other.trunk_id && branch_id == other.branch_id &&
           run == other.run;
  }
};

// Output row order: event_time, stop_sequence, ARR before DEP, trip_id.
bool EventRowLess(const Event& a, const Event& b);

// Counts of absorbed faults, returned alongside the output.
struct FaultSummary {
  int orphan_events = 0;
  int ordering_anomalies = 0;
  int schedule_misses = 0;
  int duplicate_records = 0;
  int filtered_records = 0;

  FaultSummary& operator+=(const FaultSummary& other) {
    orphan_events += other.orphan_events;
    ordering_anomalies += other.ordering_anomalies;
    schedule_misses += other.schedule_misses;
    duplicate_records += other.duplicate_records;
    filtered_records += other.filtered_records;
    return *this;
  }

  bool operator==(const FaultSummary& other) const {
    return orphan_events == other.orphan_events &&
           ordering_anomalies == other.ordering_anomalies &&
           schedule_misses == other.schedule_misses &&
           duplicate_records == other.duplicate_records &&
           filtered_records == other.filtered_records;
  }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(
    FaultSummary,
    orphan_events,
    ordering_anomalies,
    schedule_misses,
    duplicate_records,
    filtered_records
);

// Pretty printing for Google Test
void PrintTo(const Event& event, std::ostream* os);

}  // namespace stopevents
