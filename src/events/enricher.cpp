#include "events/enricher.h"

#include <string>

namespace stopevents {

std::vector<Event> Enrich(
    std::vector<Event> events,
    const ScheduleIndexes& schedules,
    FaultSummary& summary,
    const TextLogger& log
) {
  int misses = 0;
  for (auto& event : events) {
    const ScheduleIndex* schedule =
        FindScheduleIndex(schedules, event.service_date);
    const ScheduleReference* ref =
        schedule == nullptr
            ? nullptr
            : schedule->Find(event.route_id, event.trip_id, event.stop_id);
    if (ref == nullptr) {
      misses += 1;
      continue;
    }

    event.scheduled_tt = ref->scheduled_tt;
    event.scheduled_headway = schedule->ScheduledHeadway(
        *ref,
        event.event_type == EventType::kArr ? ref->arrival_time
                                            : ref->departure_time
    );
    event.scheduled_headway_branch = ref->scheduled_headway_branch;
  }

  if (misses > 0) {
    summary.schedule_misses += misses;
    log(
        "No schedule row for " + std::to_string(misses) + " of " +
        std::to_string(events.size()) + " events"
    );
  }
  return events;
}

}  // namespace stopevents
