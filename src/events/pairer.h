#pragma once

#include <vector>

#include "events/event.h"
#include "log.h"
#include "schedule/schedule_index.h"

namespace stopevents {

// Reconstructs ARR/DEP events per stop visit from normalized records.
//
// Records are grouped by (service_date, trip_id, run). Each trip is walked once in
// stop_sequence order, keeping the most recent earlier stop as the pending
// visit:
// - Departures marked for reassignment move to the pending visit's stop. When
//   the trip has no observed earlier stop, the schedule's previous stop of the
//   trip is used, and with neither the departure stays at its own stop
//   unless that stop's departure is already taken, which counts as a
//   duplicate.
// - Timepoints expand: STARTPOINT -> DEP, MIDPOINT -> ARR + DEP,
//   ENDPOINT -> ARR.
// - A second ARR or DEP for the same (trip, stop) is dropped and counted.
// - Records without a stop_sequence are orphans: dropped and counted.
//
// trunk_id comes from `trunks`, branch_id from the service date's schedule.
// The result is ordered by EventRowLess.
std::vector<Event> PairEvents(
    const std::vector<RawMovementRecord>& records,
    const ScheduleIndexes& schedules,
    const RouteTrunks& trunks,
    FaultSummary& summary,
    const TextLogger& log
);

}  // namespace stopevents
