#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "events/event.h"

namespace stopevents {

// Output columns, in row order.
const std::vector<std::string>& EventColumns();

// Storage grouping key of an event, e.g. "place-sstat/Year=2024/Month=2" for
// historic rail.
std::string PartitionKeyOf(const Event& event, SourceKind kind);

using Partitions = std::map<std::string, std::vector<Event>>;

// Groups events by partition key. Rows of each partition are ordered by
// EventRowLess.
Partitions Partition(std::vector<Event> events, SourceKind kind);

void SortRows(std::vector<Event>& rows);

// Header plus one line per event. Absent values are empty cells.
std::string SerializeEventsCsv(const std::vector<Event>& rows);

// Inverse of SerializeEventsCsv. trunk_id and branch_id are not part of the
// row and come back empty.
std::vector<Event> ParseEventsCsv(std::string_view csv_text);

// gzip with a zero modification time, so equal input gives equal bytes.
std::string GzipCompress(std::string_view data);
std::string GzipDecompress(std::string_view data);

// "Events-lamp/daily-data" for real-time, "Events/monthly-data" for rail, ...
std::string OutputPrefix(SourceKind kind);

// "{prefix}/{partition_key}/events.csv", with ".gz" when compressed.
std::string OutputPath(
    SourceKind kind, const std::string& partition_key, bool compressed
);

// Destination for serialized partitions.
class PartitionSink {
 public:
  virtual ~PartitionSink() = default;

  // Replaces whatever is stored at `path`.
  virtual void Write(const std::string& path, const std::string& bytes) = 0;
};

// Writes partitions as files below a root directory.
class DirectorySink : public PartitionSink {
 public:
  explicit DirectorySink(std::filesystem::path root) : root_(std::move(root)) {}

  void Write(const std::string& path, const std::string& bytes) override;

 private:
  std::filesystem::path root_;
};

}  // namespace stopevents
