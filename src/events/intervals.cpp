#include "events/intervals.h"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>

namespace stopevents {

namespace {

struct VisitEvents {
  int stop_sequence;
  Event* arrival = nullptr;
  Event* departure = nullptr;

  // Time the vehicle reached the stop, or left it when no arrival was seen.
  Instant ReachedAt() const {
    return arrival ? arrival->event_time : departure->event_time;
  }
  Instant LeftAt() const {
    return departure ? departure->event_time : arrival->event_time;
  }
  void Set(std::optional<int> Event::*field, int value) {
    if (arrival) {
      arrival->*field = value;
    }
    if (departure) {
      departure->*field = value;
    }
  }
};

class IntervalCalculator {
 public:
  IntervalCalculator(FaultSummary& summary, const TextLogger& log)
      : summary_(summary), log_(log) {}

  void TravelAndDwell(std::vector<Event>& events) {
    std::map<std::tuple<ServiceDate, std::string, int>,
             std::map<std::string, VisitEvents>>
        trips;
    for (auto& event : events) {
      auto& visits = trips[{event.service_date, event.trip_id, event.run}];
      auto it =
          visits.try_emplace(event.stop_id, VisitEvents{event.stop_sequence})
              .first;
      if (event.event_type == EventType::kArr) {
        it->second.arrival = &event;
      } else {
        it->second.departure = &event;
      }
    }

    for (auto& [trip, visits_by_stop] : trips) {
      std::vector<VisitEvents*> visits;
      for (auto& [stop_id, visit] : visits_by_stop) {
        visits.push_back(&visit);
      }
      std::stable_sort(
          visits.begin(),
          visits.end(),
          [](const VisitEvents* a, const VisitEvents* b) {
            return a->stop_sequence < b->stop_sequence;
          }
      );

      for (size_t i = 0; i < visits.size(); ++i) {
        VisitEvents& visit = *visits[i];
        if (i > 0) {
          std::optional<int> travel = NonNegative(
              Seconds(visits[i - 1]->LeftAt(), visit.ReachedAt()),
              "travel time",
              visit
          );
          if (travel) {
            visit.Set(&Event::travel_time_seconds, *travel);
          }
        }
        if (visit.arrival && visit.departure) {
          std::optional<int> dwell = NonNegative(
              Seconds(visit.arrival->event_time, visit.departure->event_time),
              "dwell time",
              visit
          );
          if (dwell) {
            visit.Set(&Event::dwell_time_seconds, *dwell);
          }
        }
      }
    }
  }

  // Consecutive events of the same type at one stop, grouped by `key_of`.
  // Events for which `key_of` returns nullopt are skipped.
  template <typename KeyOf>
  void Headways(
      std::vector<Event>& events,
      std::optional<int> Event::*field,
      KeyOf key_of
  ) {
    using Key = typename std::invoke_result_t<KeyOf, const Event&>::value_type;
    std::map<Key, std::vector<Event*>> groups;
    for (auto& event : events) {
      if (auto key = key_of(event)) {
        groups[*key].push_back(&event);
      }
    }
    for (auto& [key, group] : groups) {
      std::stable_sort(
          group.begin(),
          group.end(),
          [](const Event* a, const Event* b) {
            return std::tie(a->event_time, a->trip_id) <
                   std::tie(b->event_time, b->trip_id);
          }
      );
      for (size_t i = 1; i < group.size(); ++i) {
        int headway = Seconds(group[i - 1]->event_time, group[i]->event_time);
        if (headway < 0) {
          Anomaly("headway", *group[i], headway);
          continue;
        }
        group[i]->*field = headway;
      }
    }
  }

 private:
  static int Seconds(Instant from, Instant to) {
    return static_cast<int>((to - from).count());
  }

  std::optional<int> NonNegative(
      int seconds, std::string_view what, const VisitEvents& visit
  ) {
    if (seconds >= 0) {
      return seconds;
    }
    Anomaly(what, visit.arrival ? *visit.arrival : *visit.departure, seconds);
    return std::nullopt;
  }

  void Anomaly(std::string_view what, const Event& event, int seconds) {
    summary_.ordering_anomalies += 1;
    log_(
        "Negative " + std::string(what) + " " + std::to_string(seconds) +
        "s for trip " + event.trip_id + " at stop " + event.stop_id
    );
  }

  FaultSummary& summary_;
  const TextLogger& log_;
};

using HeadwayKey = std::tuple<ServiceDate, std::string, int, std::string, EventType>;
using BranchHeadwayKey =
    std::tuple<ServiceDate, std::string, std::string, int, std::string, EventType>;

}  // namespace

std::vector<Event> ComputeIntervals(
    std::vector<Event> events,
    const ScheduleIndexes& schedules,
    FaultSummary& summary,
    const TextLogger& log
) {
  IntervalCalculator calculator(summary, log);
  calculator.TravelAndDwell(events);

  calculator.Headways(
      events,
      &Event::headway_seconds,
      [](const Event& e) -> std::optional<HeadwayKey> {
        return HeadwayKey{
            e.service_date, e.trunk_id, e.direction_id, e.stop_id, e.event_type
        };
      }
  );

  calculator.Headways(
      events,
      &Event::headway_branch_seconds,
      [&schedules](const Event& e) -> std::optional<BranchHeadwayKey> {
        if (!e.branch_id) {
          return std::nullopt;
        }
        const ScheduleIndex* schedule =
            FindScheduleIndex(schedules, e.service_date);
        if (schedule == nullptr ||
            !schedule->IsBranching(e.trunk_id, e.direction_id)) {
          return std::nullopt;
        }
        return BranchHeadwayKey{
            e.service_date,
            e.trunk_id,
            *e.branch_id,
            e.direction_id,
            e.stop_id,
            e.event_type
        };
      }
  );
  return events;
}

}  // namespace stopevents
