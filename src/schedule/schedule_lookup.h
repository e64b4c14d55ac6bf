#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "gtfs/gtfs.h"
#include "util/date.h"

namespace stopevents {

// One schedule dataset snapshot and the period during which it is
// authoritative (both ends inclusive).
struct ScheduleFeed {
  std::string key;
  ServiceDate active_date;
  ServiceDate end_date;
  std::shared_ptr<const Gtfs> gtfs;

  bool Contains(const ServiceDate& date) const {
    return active_date <= date && date <= end_date;
  }
};

// Read-only access to versioned schedule data.
class ScheduleLookup {
 public:
  virtual ~ScheduleLookup() = default;

  // Every feed version whose validity range contains `date`. May be empty.
  virtual std::vector<ScheduleFeed> Lookup(const ServiceDate& date) const = 0;
};

// Picks the feed whose validity range most tightly contains `date`. Ties go
// to the later active_date, then to the greater key. Returns nullopt when no
// feed contains the date.
std::optional<ScheduleFeed> SelectFeed(
    const std::vector<ScheduleFeed>& feeds, const ServiceDate& date
);

// A fixed list of in-memory feeds.
class StaticScheduleLookup : public ScheduleLookup {
 public:
  explicit StaticScheduleLookup(std::vector<ScheduleFeed> feeds)
      : feeds_(std::move(feeds)) {}

  std::vector<ScheduleFeed> Lookup(const ServiceDate& date) const override;

 private:
  std::vector<ScheduleFeed> feeds_;
};

struct GtfsArchiveEntry {
  std::string key;
  std::string directory;
  ServiceDate active_date;
  ServiceDate end_date;
};

// Feed versions stored as unpacked GTFS directories on local disk. A
// directory is loaded the first time a lookup needs it and kept afterwards.
class GtfsArchiveLookup : public ScheduleLookup {
 public:
  explicit GtfsArchiveLookup(std::vector<GtfsArchiveEntry> entries)
      : entries_(std::move(entries)) {}

  std::vector<ScheduleFeed> Lookup(const ServiceDate& date) const override;

 private:
  std::shared_ptr<const Gtfs> Load(const GtfsArchiveEntry& entry) const;

  std::vector<GtfsArchiveEntry> entries_;
  mutable std::mutex mutex_;
  mutable std::unordered_map<std::string, std::shared_ptr<const Gtfs>> loaded_;
};

}  // namespace stopevents
