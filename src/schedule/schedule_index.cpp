#include "schedule/schedule_index.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace stopevents {

namespace {

using StopGroupKey = std::tuple<std::string, int, std::string>;

StopGroupKey GroupKeyOf(const ScheduleReference& ref) {
  return {ref.trunk_id, ref.direction_id, ref.stop_id.v};
}

// Stops of branching trunks that only one branch serves.
std::map<StopGroupKey, std::string> FindSingleBranchStops(
    const std::vector<ScheduleReference>& references,
    const std::set<std::pair<std::string, int>>& branching_trunks
) {
  std::map<StopGroupKey, std::set<std::string>> branches_at_stop;
  for (const auto& ref : references) {
    if (branching_trunks.count({ref.trunk_id, ref.direction_id})) {
      branches_at_stop[GroupKeyOf(ref)].insert(ref.branch_id);
    }
  }

  std::map<StopGroupKey, std::string> result;
  for (const auto& [key, branches] : branches_at_stop) {
    if (branches.size() == 1) {
      result.emplace(key, *branches.begin());
    }
  }
  return result;
}

bool DepartsBefore(const ScheduleReference* a, const ScheduleReference* b) {
  if (a->departure_time.seconds != b->departure_time.seconds) {
    return a->departure_time.seconds < b->departure_time.seconds;
  }
  return a->trip_id.v < b->trip_id.v;
}

}  // namespace

std::string ResolveTrunk(const RouteTrunks& trunks, std::string_view route_id) {
  auto it = trunks.find(std::string(route_id));
  if (it != trunks.end()) {
    return it->second;
  }
  return std::string(route_id);
}

int RoundToTenSeconds(double seconds) {
  return static_cast<int>(std::lround(seconds / 10.0)) * 10;
}

ScheduledHeadwayTable BuildScheduledHeadways(
    const std::vector<ScheduleReference>& references,
    const std::set<std::pair<std::string, int>>& branching_trunks
) {
  std::map<StopGroupKey, std::vector<const ScheduleReference*>> by_stop;
  for (const auto& ref : references) {
    by_stop[GroupKeyOf(ref)].push_back(&ref);
  }
  std::map<StopGroupKey, std::string> single_branch_stops =
      FindSingleBranchStops(references, branching_trunks);

  std::map<HeadwayBucketKey, std::pair<long long, int>> sums;
  for (auto& [group, refs] : by_stop) {
    std::sort(refs.begin(), refs.end(), DepartsBefore);

    std::string branch;
    auto single = single_branch_stops.find(group);
    if (single != single_branch_stops.end()) {
      branch = single->second;
    }

    for (size_t i = 1; i < refs.size(); ++i) {
      int headway =
          refs[i]->departure_time.seconds - refs[i - 1]->departure_time.seconds;
      HeadwayBucketKey key{
          std::get<0>(group),
          branch,
          std::get<1>(group),
          std::get<2>(group),
          HeadwayBucketOf(refs[i]->departure_time)
      };
      auto& [sum, count] = sums[key];
      sum += headway;
      count += 1;
    }
  }

  ScheduledHeadwayTable table;
  for (const auto& [key, sum_count] : sums) {
    table.emplace(
        key,
        RoundToTenSeconds(
            static_cast<double>(sum_count.first) / sum_count.second
        )
    );
  }
  return table;
}

std::shared_ptr<const ScheduleIndex> ScheduleIndex::Build(
    const ScheduleFeed& feed, const ServiceDate& date, const RouteTrunks& trunks
) {
  auto index = std::make_shared<ScheduleIndex>(PrivateTag{});
  index->service_date_ = date;
  index->feed_key_ = feed.key;

  if (!feed.gtfs) {
    return index;
  }
  GtfsDay day = GtfsFilterByDate(*feed.gtfs, date);

  std::unordered_map<GtfsTripId, std::vector<const GtfsStopTime*>> trip_stops;
  for (const auto& stop_time : day.stop_times) {
    trip_stops[stop_time.trip_id].push_back(&stop_time);
  }

  std::map<std::pair<std::string, int>, std::unordered_set<std::string>>
      trunk_branches;

  for (const auto& trip : day.trips) {
    auto it = trip_stops.find(trip.trip_id);
    if (it == trip_stops.end() || it->second.empty()) {
      continue;
    }
    auto& stops = it->second;
    std::stable_sort(
        stops.begin(),
        stops.end(),
        [](const GtfsStopTime* a, const GtfsStopTime* b) {
          return a->stop_sequence < b->stop_sequence;
        }
    );

    const std::string& route_id = trip.route_direction_id.route_id.v;
    const int direction_id = trip.route_direction_id.direction_id;
    std::string trunk_id = ResolveTrunk(trunks, route_id);
    std::string branch_id = route_id + ">" + stops.back()->stop_id.v;
    const int trip_start = stops.front()->departure_time.seconds;

    index->trip_branches_[trip.trip_id] = branch_id;
    trunk_branches[{trunk_id, direction_id}].insert(branch_id);

    std::vector<size_t>& rows = index->by_trip_[trip.trip_id];
    for (size_t i = 0; i < stops.size(); ++i) {
      const GtfsStopTime& st = *stops[i];
      ScheduleReference ref{
          .route_id = trip.route_direction_id.route_id,
          .trunk_id = trunk_id,
          .branch_id = branch_id,
          .trip_id = trip.trip_id,
          .stop_id = st.stop_id,
          .direction_id = direction_id,
          .stop_sequence = st.stop_sequence,
          .arrival_time = st.arrival_time,
          .departure_time = st.departure_time,
          .scheduled_arrival_offset = st.arrival_time.seconds - trip_start,
          .scheduled_departure_offset = st.departure_time.seconds - trip_start,
          .scheduled_tt = std::nullopt,
          .scheduled_headway_branch = std::nullopt,
          .active_date = feed.active_date,
          .end_date = feed.end_date,
      };
      if (i > 0) {
        ref.scheduled_tt =
            st.arrival_time.seconds - stops[i - 1]->departure_time.seconds;
      }
      rows.push_back(index->references_.size());
      index->references_.push_back(std::move(ref));
    }
  }

  for (const auto& [trunk_direction, branches] : trunk_branches) {
    if (branches.size() > 1) {
      index->branching_trunks_.insert(trunk_direction);
    }
  }

  // Unsmoothed same-branch headways on branching trunks.
  std::map<std::pair<StopGroupKey, std::string>, std::vector<ScheduleReference*>>
      by_branch_stop;
  for (auto& ref : index->references_) {
    if (index->branching_trunks_.count({ref.trunk_id, ref.direction_id})) {
      by_branch_stop[{GroupKeyOf(ref), ref.branch_id}].push_back(&ref);
    }
  }
  for (auto& [key, refs] : by_branch_stop) {
    std::sort(refs.begin(), refs.end(), DepartsBefore);
    for (size_t i = 1; i < refs.size(); ++i) {
      refs[i]->scheduled_headway_branch =
          refs[i]->departure_time.seconds - refs[i - 1]->departure_time.seconds;
    }
  }

  index->single_branch_stops_ =
      FindSingleBranchStops(index->references_, index->branching_trunks_);
  index->headway_buckets_ =
      BuildScheduledHeadways(index->references_, index->branching_trunks_);
  return index;
}

const ScheduleReference* ScheduleIndex::Find(
    std::string_view route_id,
    std::string_view trip_id,
    std::string_view stop_id
) const {
  auto it = by_trip_.find(GtfsTripId{std::string(trip_id)});
  if (it == by_trip_.end()) {
    return nullptr;
  }
  for (size_t row : it->second) {
    const ScheduleReference& ref = references_[row];
    if (ref.stop_id.v == stop_id) {
      return ref.route_id.v == route_id ? &ref : nullptr;
    }
  }
  return nullptr;
}

const ScheduleReference* ScheduleIndex::PriorStop(
    std::string_view trip_id, int stop_sequence
) const {
  auto it = by_trip_.find(GtfsTripId{std::string(trip_id)});
  if (it == by_trip_.end()) {
    return nullptr;
  }
  const ScheduleReference* prior = nullptr;
  for (size_t row : it->second) {
    const ScheduleReference& ref = references_[row];
    if (ref.stop_sequence >= stop_sequence) {
      break;
    }
    prior = &ref;
  }
  return prior;
}

std::optional<std::string> ScheduleIndex::BranchOf(std::string_view trip_id
) const {
  auto it = trip_branches_.find(GtfsTripId{std::string(trip_id)});
  if (it == trip_branches_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ScheduleIndex::IsBranching(const std::string& trunk_id, int direction_id)
    const {
  return branching_trunks_.count({trunk_id, direction_id}) > 0;
}

std::optional<int> ScheduleIndex::ScheduledHeadway(
    const ScheduleReference& reference, GtfsTimeSinceServiceStart at
) const {
  HeadwayBucketKey key{
      reference.trunk_id,
      "",
      reference.direction_id,
      reference.stop_id.v,
      HeadwayBucketOf(at)
  };
  auto single = single_branch_stops_.find(GroupKeyOf(reference));
  if (single != single_branch_stops_.end()) {
    key.branch_id = single->second;
  }

  auto it = headway_buckets_.find(key);
  if (it == headway_buckets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const ScheduleIndex* FindScheduleIndex(
    const ScheduleIndexes& indexes, const ServiceDate& date
) {
  auto it = indexes.find(date);
  if (it == indexes.end()) {
    return nullptr;
  }
  return it->second.get();
}

}  // namespace stopevents
