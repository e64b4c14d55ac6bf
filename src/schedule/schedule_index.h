#pragma once

#include <compare>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gtfs/gtfs.h"
#include "schedule/schedule_lookup.h"
#include "util/date.h"

namespace stopevents {

// Width of one scheduled-headway smoothing window.
inline constexpr int kHeadwayBucketSeconds = 30 * 60;

// Maps branch route ids onto the trunk they share (e.g. "Green-B" ->
// "Green"). Routes that are not listed are their own trunk.
using RouteTrunks = std::unordered_map<std::string, std::string>;

std::string ResolveTrunk(const RouteTrunks& trunks, std::string_view route_id);

// Scheduled values for one stop of one trip, valid for one service date.
struct ScheduleReference {
  GtfsRouteId route_id;
  std::string trunk_id;
  // route_id and terminal stop of the trip, e.g. "Red>place-asmnl".
  std::string branch_id;
  GtfsTripId trip_id;
  GtfsStopId stop_id;
  int direction_id;
  int stop_sequence;
  GtfsTimeSinceServiceStart arrival_time;
  GtfsTimeSinceServiceStart departure_time;
  // Seconds from the trip's first departure.
  int scheduled_arrival_offset;
  int scheduled_departure_offset;
  // Arrival here minus departure at the previous scheduled stop.
  std::optional<int> scheduled_tt;
  // Departure here minus the previous same-branch trip's departure here.
  // Only set on trunks that branch.
  std::optional<int> scheduled_headway_branch;
  ServiceDate active_date;
  ServiceDate end_date;
};

struct HeadwayBucketKey {
  std::string trunk_id;
  // Empty unless the stop is served by exactly one branch of a branching
  // trunk.
  std::string branch_id;
  int direction_id;
  std::string stop_id;
  int time_bucket;

  bool operator==(const HeadwayBucketKey& other) const = default;
  auto operator<=>(const HeadwayBucketKey& other) const = default;
};

// Average scheduled trunk headway per bucket, rounded to the nearest 10s.
using ScheduledHeadwayTable = std::map<HeadwayBucketKey, int>;

// Time bucket of a time since service start.
inline int HeadwayBucketOf(GtfsTimeSinceServiceStart t) {
  return t.seconds / kHeadwayBucketSeconds;
}

// Rounds to the nearest multiple of 10 seconds, halves away from zero.
int RoundToTenSeconds(double seconds);

// Computes the bucket table from the schedule rows of one service date.
// Pure: equal input yields an equal table.
ScheduledHeadwayTable BuildScheduledHeadways(
    const std::vector<ScheduleReference>& references,
    const std::set<std::pair<std::string, int>>& branching_trunks
);

// The schedule of one service date. Built once, then shared read-only
// between workers through a shared_ptr<const ScheduleIndex>.
class ScheduleIndex {
  struct PrivateTag {};

 public:
  // Only Build constructs indexes.
  explicit ScheduleIndex(PrivateTag) {}

  // Filters `feed` to `date` and derives references, branches and buckets.
  static std::shared_ptr<const ScheduleIndex> Build(
      const ScheduleFeed& feed,
      const ServiceDate& date,
      const RouteTrunks& trunks
  );

  const ServiceDate& service_date() const { return service_date_; }
  const std::string& feed_key() const { return feed_key_; }
  const std::vector<ScheduleReference>& references() const {
    return references_;
  }
  const ScheduledHeadwayTable& headway_buckets() const {
    return headway_buckets_;
  }

  // The row for a trip at a stop, or nullptr when the schedule does not know
  // the trip, the stop, or lists the trip under another route.
  const ScheduleReference* Find(
      std::string_view route_id,
      std::string_view trip_id,
      std::string_view stop_id
  ) const;

  // The scheduled stop of the trip with the greatest stop_sequence below
  // `stop_sequence`, or nullptr.
  const ScheduleReference* PriorStop(
      std::string_view trip_id, int stop_sequence
  ) const;

  std::optional<std::string> BranchOf(std::string_view trip_id) const;

  // True when trips of the trunk in this direction end at more than one
  // terminal.
  bool IsBranching(const std::string& trunk_id, int direction_id) const;

  // Smoothed scheduled headway covering `at` for the reference's stop.
  std::optional<int> ScheduledHeadway(
      const ScheduleReference& reference, GtfsTimeSinceServiceStart at
  ) const;

 private:
  ServiceDate service_date_;
  std::string feed_key_;
  std::vector<ScheduleReference> references_;
  // Row indices per trip, ascending stop_sequence.
  std::unordered_map<GtfsTripId, std::vector<size_t>> by_trip_;
  std::unordered_map<GtfsTripId, std::string> trip_branches_;
  std::set<std::pair<std::string, int>> branching_trunks_;
  // Stops served by one branch only; maps the stop to that branch.
  std::map<std::tuple<std::string, int, std::string>, std::string>
      single_branch_stops_;
  ScheduledHeadwayTable headway_buckets_;
};

// The schedule indexes of one batch, one per service date that has a feed.
using ScheduleIndexes =
    std::map<ServiceDate, std::shared_ptr<const ScheduleIndex>>;

// nullptr when no feed covers `date`.
const ScheduleIndex* FindScheduleIndex(
    const ScheduleIndexes& indexes, const ServiceDate& date
);

}  // namespace stopevents
