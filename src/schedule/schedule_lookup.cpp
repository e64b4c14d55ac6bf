#include "schedule/schedule_lookup.h"

#include <tuple>

namespace stopevents {

std::optional<ScheduleFeed> SelectFeed(
    const std::vector<ScheduleFeed>& feeds, const ServiceDate& date
) {
  const ScheduleFeed* best = nullptr;
  auto width = [](const ScheduleFeed& feed) {
    return (std::chrono::sys_days{feed.end_date} -
            std::chrono::sys_days{feed.active_date})
        .count();
  };

  for (const auto& feed : feeds) {
    if (!feed.Contains(date)) {
      continue;
    }
    if (best == nullptr) {
      best = &feed;
      continue;
    }
    // Narrower range first, then later start, then greater key.
    auto rank = [&](const ScheduleFeed& f) {
      return std::make_tuple(
          -width(f), std::chrono::sys_days{f.active_date}, f.key
      );
    };
    if (rank(feed) > rank(*best)) {
      best = &feed;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

std::vector<ScheduleFeed> StaticScheduleLookup::Lookup(
    const ServiceDate& date
) const {
  std::vector<ScheduleFeed> result;
  for (const auto& feed : feeds_) {
    if (feed.Contains(date)) {
      result.push_back(feed);
    }
  }
  return result;
}

std::vector<ScheduleFeed> GtfsArchiveLookup::Lookup(const ServiceDate& date
) const {
  std::vector<ScheduleFeed> result;
  for (const auto& entry : entries_) {
    if (entry.active_date <= date && date <= entry.end_date) {
      result.push_back(ScheduleFeed{
          entry.key, entry.active_date, entry.end_date, Load(entry)
      });
    }
  }
  return result;
}

std::shared_ptr<const Gtfs> GtfsArchiveLookup::Load(
    const GtfsArchiveEntry& entry
) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loaded_.find(entry.key);
  if (it != loaded_.end()) {
    return it->second;
  }
  auto gtfs = std::make_shared<const Gtfs>(GtfsLoad(entry.directory));
  loaded_.emplace(entry.key, gtfs);
  return gtfs;
}

}  // namespace stopevents
