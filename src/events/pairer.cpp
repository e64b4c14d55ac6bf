#include "events/pairer.h"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace stopevents {

namespace {

struct Visit {
  std::string stop_id;
  int stop_sequence;
  std::optional<Event> arrival;
  std::optional<Event> departure;
};

const RawMovementRecord& CheckSequenced(const RawMovementRecord& record) {
  if (!record.stop_sequence) {
    throw OrphanEventError(
        "Record of trip " + record.trip_id + " at stop " + record.stop_id +
        " has no stop_sequence"
    );
  }
  return record;
}

Event EventFrom(
    const RawMovementRecord& record,
    EventType type,
    const std::string& stop_id,
    int stop_sequence
) {
  Event event;
  event.service_date = record.service_date;
  event.route_id = record.route_id;
  event.trip_id = record.trip_id;
  event.direction_id = record.direction_id;
  event.stop_id = stop_id;
  event.stop_sequence = stop_sequence;
  event.vehicle_id = record.vehicle_id;
  event.vehicle_label = record.vehicle_label;
  event.event_type = type;
  event.event_time = record.timestamp;
  event.vehicle_consist = record.vehicle_consist;
  event.run = record.run;
  return event;
}

class TripPairer {
 public:
  TripPairer(
      const ScheduleIndex* schedule, FaultSummary& summary, const TextLogger& log
  )
      : schedule_(schedule), summary_(summary), log_(log) {}

  // `records` must be sorted by (stop_sequence, timestamp) and all belong to
  // one trip.
  void Run(const std::vector<const RawMovementRecord*>& records) {
    std::optional<std::pair<std::string, int>> pending;
    std::optional<std::pair<std::string, int>> current;

    for (const RawMovementRecord* record : records) {
      const int sequence = *record->stop_sequence;
      if (!current || current->second != sequence ||
          current->first != record->stop_id) {
        if (current && current->second < sequence) {
          pending = current;
        }
        current = {record->stop_id, sequence};
      }

      switch (record->point_kind) {
        case PointKind::kArrival:
        case PointKind::kEndpoint:
          Add(*record, EventType::kArr, record->stop_id, sequence);
          break;
        case PointKind::kStartpoint:
          Add(*record, EventType::kDep, record->stop_id, sequence);
          break;
        case PointKind::kMidpoint:
          Add(*record, EventType::kArr, record->stop_id, sequence);
          Add(*record, EventType::kDep, record->stop_id, sequence);
          break;
        case PointKind::kDeparture:
          if (!record->reassign_departure) {
            Add(*record, EventType::kDep, record->stop_id, sequence);
          } else if (pending) {
            Add(*record, EventType::kDep, pending->first, pending->second);
          } else if (const ScheduleReference* prior = PriorScheduledStop(
                         record->trip_id, sequence
                     )) {
            Add(*record, EventType::kDep, prior->stop_id.v,
                prior->stop_sequence);
          } else {
            unplaced_.push_back(record);
          }
          break;
      }
    }

    // A departure with no earlier stop stays where it was logged, unless a
    // reassigned departure already claimed that stop.
    for (const RawMovementRecord* record : unplaced_) {
      if (!HasDeparture(record->stop_id)) {
        Add(*record, EventType::kDep, record->stop_id, *record->stop_sequence);
        continue;
      }
      summary_.duplicate_records += 1;
      log_(
          "Dropped DEP of trip " + record->trip_id + " at stop " +
          record->stop_id + " (" + FormatEventTime(record->timestamp) +
          "): departure already taken from the next stop"
      );
    }
  }

  void AppendTo(std::vector<Event>& out) {
    for (auto& visit : visits_) {
      if (visit.arrival) {
        out.push_back(std::move(*visit.arrival));
      }
      if (visit.departure) {
        out.push_back(std::move(*visit.departure));
      }
    }
  }

 private:
  bool HasDeparture(const std::string& stop_id) const {
    return std::any_of(
        visits_.begin(),
        visits_.end(),
        [&stop_id](const Visit& v) {
          return v.stop_id == stop_id && v.departure.has_value();
        }
    );
  }

  const ScheduleReference* PriorScheduledStop(
      const std::string& trip_id, int stop_sequence
  ) const {
    if (schedule_ == nullptr) {
      return nullptr;
    }
    return schedule_->PriorStop(trip_id, stop_sequence);
  }

  void Add(
      const RawMovementRecord& record,
      EventType type,
      const std::string& stop_id,
      int stop_sequence
  ) {
    auto it = std::find_if(
        visits_.begin(),
        visits_.end(),
        [&stop_id](const Visit& v) { return v.stop_id == stop_id; }
    );
    if (it == visits_.end()) {
      visits_.push_back(Visit{stop_id, stop_sequence, {}, {}});
      it = visits_.end() - 1;
    }
    std::optional<Event>& slot =
        type == EventType::kArr ? it->arrival : it->departure;
    if (slot) {
      summary_.duplicate_records += 1;
      log_(
          "Dropped duplicate " + std::string(ToString(type)) + " of trip " +
          record.trip_id + " at stop " + stop_id + " (" +
          FormatEventTime(record.timestamp) + ")"
      );
      return;
    }
    slot = EventFrom(record, type, stop_id, it->stop_sequence);
  }

  const ScheduleIndex* schedule_;
  FaultSummary& summary_;
  const TextLogger& log_;
  std::vector<Visit> visits_;
  std::vector<const RawMovementRecord*> unplaced_;
};

}  // namespace

std::vector<Event> PairEvents(
    const std::vector<RawMovementRecord>& records,
    const ScheduleIndexes& schedules,
    const RouteTrunks& trunks,
    FaultSummary& summary,
    const TextLogger& log
) {
  std::map<std::tuple<ServiceDate, std::string, int>,
           std::vector<const RawMovementRecord*>>
      trips;
  for (const auto& record : records) {
    try {
      trips[{record.service_date, record.trip_id, record.run}].push_back(
          &CheckSequenced(record)
      );
    } catch (const OrphanEventError& e) {
      summary.orphan_events += 1;
      log(e.what());
    }
  }

  std::vector<Event> events;
  events.reserve(records.size());
  for (auto& [key, trip_records] : trips) {
    std::stable_sort(
        trip_records.begin(),
        trip_records.end(),
        [](const RawMovementRecord* a, const RawMovementRecord* b) {
          return std::tie(*a->stop_sequence, a->timestamp) <
                 std::tie(*b->stop_sequence, b->timestamp);
        }
    );

    const ScheduleIndex* schedule =
        FindScheduleIndex(schedules, std::get<0>(key));
    TripPairer pairer(schedule, summary, log);
    pairer.Run(trip_records);

    const size_t first = events.size();
    pairer.AppendTo(events);

    std::optional<std::string> branch_id;
    if (schedule != nullptr) {
      branch_id = schedule->BranchOf(std::get<1>(key));
    }
    for (size_t i = first; i < events.size(); ++i) {
      events[i].trunk_id = ResolveTrunk(trunks, events[i].route_id);
      events[i].branch_id = branch_id;
    }
  }

  std::stable_sort(events.begin(), events.end(), EventRowLess);
  return events;
}

}  // namespace stopevents
