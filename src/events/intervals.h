#pragma once

#include <vector>

#include "events/event.h"
#include "log.h"
#include "schedule/schedule_index.h"

namespace stopevents {

// Fills travel_time_seconds, dwell_time_seconds, headway_seconds and
// headway_branch_seconds. Event order is preserved.
//
// A computed interval that comes out negative is left absent and counted as
// an ordering anomaly.
std::vector<Event> ComputeIntervals(
    std::vector<Event> events,
    const ScheduleIndexes& schedules,
    FaultSummary& summary,
    const TextLogger& log
);

}  // namespace stopevents
