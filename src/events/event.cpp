#include "events/event.h"

#include <tuple>

namespace stopevents {

std::string_view ToString(SourceKind kind) {
  switch (kind) {
    case SourceKind::kRealtimeFeed:
      return "REALTIME_FEED";
    case SourceKind::kHistoricRail:
      return "HISTORIC_RAIL";
    case SourceKind::kHistoricBus:
      return "HISTORIC_BUS";
    case SourceKind::kHistoricFerry:
      return "HISTORIC_FERRY";
  }
  return "UNKNOWN";
}

std::string_view ToString(PointKind kind) {
  switch (kind) {
    case PointKind::kArrival:
      return "ARRIVAL";
    case PointKind::kDeparture:
      return "DEPARTURE";
    case PointKind::kStartpoint:
      return "STARTPOINT";
    case PointKind::kMidpoint:
      return "MIDPOINT";
    case PointKind::kEndpoint:
      return "ENDPOINT";
  }
  return "UNKNOWN";
}

std::string_view ToString(EventType type) {
  return type == EventType::kArr ? "ARR" : "DEP";
}

SourceKind ParseSourceKind(std::string_view text) {
  if (text == "realtime" || text == "REALTIME_FEED") {
    return SourceKind::kRealtimeFeed;
  }
  if (text == "rail" || text == "HISTORIC_RAIL") {
    return SourceKind::kHistoricRail;
  }
  if (text == "bus" || text == "HISTORIC_BUS") {
    return SourceKind::kHistoricBus;
  }
  if (text == "ferry" || text == "HISTORIC_FERRY") {
    return SourceKind::kHistoricFerry;
  }
  throw std::runtime_error("Unknown source kind: " + std::string(text));
}

EventType ParseEventType(std::string_view text) {
  if (text == "ARR") {
    return EventType::kArr;
  }
  if (text == "DEP") {
    return EventType::kDep;
  }
  throw std::runtime_error("Unknown event type: " + std::string(text));
}

bool EventRowLess(const Event& a, const Event& b) {
  return std::tie(a.event_time, a.stop_sequence, a.event_type, a.trip_id) <
         std::tie(b.event_time, b.stop_sequence, b.event_type, b.trip_id);
}

void PrintTo(const Event& event, std::ostream* os) {
  *os << "Event{" << FormatServiceDate(event.service_date) << ", \""
      << event.trip_id << "\", \"" << event.stop_id << "\" #"
      << event.stop_sequence << ", " << ToString(event.event_type) << " @ "
      << FormatEventTime(event.event_time);
  auto field = [os](const char* name, const std::optional<int>& value) {
    if (value) {
      *os << ", " << name << "=" << *value;
    }
  };
  field("travel", event.travel_time_seconds);
  field("dwell", event.dwell_time_seconds);
  field("headway", event.headway_seconds);
  field("headway_branch", event.headway_branch_seconds);
  field("scheduled_tt", event.scheduled_tt);
  field("scheduled_headway", event.scheduled_headway);
  field("scheduled_headway_branch", event.scheduled_headway_branch);
  *os << "}";
}

}  // namespace stopevents
