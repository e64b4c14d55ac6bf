#pragma once

#include <rapidcheck.h>

#include <string>
#include <vector>

#include "events/event.h"
#include "gtfs/gtfs.h"
#include "schedule/schedule_index.h"

namespace stopevents {

ServiceDate Ymd(int y, unsigned m, unsigned d);

// Eastern wall time "HH:MM:SS" after midnight of `date`.
Instant EasternAt(const ServiceDate& date, const std::string& time);

struct ScheduledStop {
  std::string stop_id;
  int stop_sequence;
  std::string arrival;
  std::string departure;
};

// Builds small feeds in which every trip runs every day of 2020-2030.
class GtfsBuilder {
 public:
  GtfsBuilder& Trip(
      const std::string& route_id,
      int direction_id,
      const std::string& trip_id,
      const std::vector<ScheduledStop>& stops
  );

  Gtfs Build() const { return gtfs_; }

 private:
  Gtfs gtfs_;
};

ScheduleFeed FeedOf(
    Gtfs gtfs,
    const std::string& key,
    const ServiceDate& active_date,
    const ServiceDate& end_date
);

// The index of `gtfs` for `date`, keyed the way the pipeline keys it.
ScheduleIndexes IndexesFor(
    const Gtfs& gtfs, const ServiceDate& date, RouteTrunks trunks = {}
);

// Rail-style observations of one trip on `date`: stops in sequence order,
// each with an arrival, a departure, or both, at non-decreasing times.
rc::Gen<std::vector<RawMovementRecord>> GenTripRecords(const ServiceDate& date);

void showValue(const RawMovementRecord& record, std::ostream& os);

}  // namespace stopevents
