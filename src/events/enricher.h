#pragma once

#include <vector>

#include "events/event.h"
#include "log.h"
#include "schedule/schedule_index.h"

namespace stopevents {

// Attaches scheduled_tt, scheduled_headway and scheduled_headway_branch from
// the schedule of each event's service date. Events without a schedule row
// keep those fields absent and count as schedule misses.
std::vector<Event> Enrich(
    std::vector<Event> events,
    const ScheduleIndexes& schedules,
    FaultSummary& summary,
    const TextLogger& log
);

}  // namespace stopevents
