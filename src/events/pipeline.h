#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "events/assembler.h"
#include "events/event.h"
#include "events/normalizer.h"
#include "log.h"
#include "schedule/schedule_index.h"
#include "schedule/schedule_lookup.h"

namespace stopevents {

struct PipelineOptions {
  // Partition workers. Hardware concurrency when unset.
  std::optional<unsigned> workers;
  // Gzip historic output. Real-time output is always plain CSV.
  bool compress = true;
  RouteTrunks route_trunks;
};

struct PipelineConfig {
  SourceKind source_kind = SourceKind::kRealtimeFeed;
  std::vector<std::string> inputs;
  ServiceDate service_date;
  std::string output_dir;
  NormalizeOptions normalize;
  PipelineOptions options;
  std::vector<GtfsArchiveEntry> feeds;
};

// Reads a TOML pipeline config. Relative paths are resolved against the
// directory of the config file.
PipelineConfig PipelineConfigLoad(const std::string& config_path);

struct WrittenPartition {
  std::string key;
  std::string path;
  size_t rows;
};

struct PipelineResult {
  // Key order.
  std::vector<WrittenPartition> partitions;
  FaultSummary summary;
  // False when cancellation stopped the run before every partition was
  // written.
  bool completed = true;
};

// One schedule index per service date of `records` that has a feed.
ScheduleIndexes BuildScheduleIndexes(
    const std::vector<RawMovementRecord>& records,
    const ScheduleLookup* lookup,
    const RouteTrunks& trunks,
    const TextLogger& log
);

// Pairs, computes intervals, then enriches and writes every partition on a
// worker pool. `cancel` is checked between partitions.
PipelineResult ProcessBatch(
    const std::vector<RawMovementRecord>& records,
    SourceKind kind,
    const ScheduleLookup* lookup,
    const PipelineOptions& options,
    PartitionSink& sink,
    const std::atomic<bool>& cancel,
    const TextLogger& log
);

// Normalizes every input of `config` and processes them as one batch.
PipelineResult RunPipeline(
    const PipelineConfig& config,
    PartitionSink& sink,
    const std::atomic<bool>& cancel,
    const TextLogger& log
);

}  // namespace stopevents
