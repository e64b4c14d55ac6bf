#include "events/pipeline.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <toml++/toml.hpp>

#include "events/enricher.h"
#include "events/intervals.h"
#include "events/pairer.h"

namespace stopevents {

namespace {

// TOML dates may be written natively (2024-02-07) or as strings.
template <typename Node>
std::optional<ServiceDate> DateValue(toml::node_view<Node> node) {
  if (auto date = node.value<toml::date>()) {
    return ServiceDate{
        std::chrono::year{date->year},
        std::chrono::month{date->month},
        std::chrono::day{date->day}
    };
  }
  if (auto text = node.value<std::string>()) {
    return ParseServiceDate(*text);
  }
  return std::nullopt;
}

template <typename Node>
std::vector<std::string> StringList(toml::node_view<Node> node) {
  std::vector<std::string> values;
  if (auto single = node.value<std::string>()) {
    values.push_back(*single);
  } else if (auto arr = node.as_array()) {
    for (const auto& elem : *arr) {
      if (auto val = elem.value<std::string>()) {
        values.push_back(*val);
      }
    }
  }
  return values;
}

}  // namespace

PipelineConfig PipelineConfigLoad(const std::string& config_path) {
  toml::table config;
  try {
    config = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw std::runtime_error(
        "Failed to parse pipeline config file '" + config_path +
        "': " + std::string(err.what())
    );
  }

  auto source_kind = config["source_kind"].value<std::string>();
  std::vector<std::string> inputs = StringList(config["input"]);
  std::optional<ServiceDate> service_date = DateValue(config["service_date"]);
  if (!source_kind || inputs.empty() || !service_date) {
    throw std::runtime_error(
        "Config file must contain source_kind, input and service_date"
    );
  }

  std::filesystem::path config_dir =
      std::filesystem::weakly_canonical(config_path).parent_path();

  PipelineConfig result;
  result.source_kind = ParseSourceKind(*source_kind);
  for (const auto& input : inputs) {
    result.inputs.push_back((config_dir / input).string());
  }
  result.service_date = *service_date;
  result.output_dir =
      (config_dir / config["output_dir"].value_or(std::string("out")))
          .string();

  if (auto workers = config["workers"].value<int64_t>()) {
    if (*workers < 1) {
      throw std::runtime_error("workers must be at least 1");
    }
    result.options.workers = static_cast<unsigned>(*workers);
  }
  result.options.compress = config["compress"].value_or(true);

  result.normalize.routes = StringList(config["routes"]);
  result.normalize.start_date = DateValue(config["start_date"]);
  result.normalize.end_date = DateValue(config["end_date"]);

  if (auto trunks = config["route_trunks"].as_table()) {
    for (const auto& [route, trunk] : *trunks) {
      if (auto val = trunk.value<std::string>()) {
        result.options.route_trunks[std::string(route.str())] = *val;
      }
    }
  }

  if (auto feeds = config["feeds"].as_array()) {
    for (const auto& elem : *feeds) {
      const toml::table* feed = elem.as_table();
      if (feed == nullptr) {
        throw std::runtime_error("feeds entries must be tables");
      }
      auto dir = (*feed)["dir"].value<std::string>();
      auto active_date = DateValue((*feed)["active_date"]);
      auto end_date = DateValue((*feed)["end_date"]);
      if (!dir || !active_date || !end_date) {
        throw std::runtime_error(
            "feeds entries must contain dir, active_date and end_date"
        );
      }
      result.feeds.push_back(GtfsArchiveEntry{
          .key = (*feed)["key"].value_or(*dir),
          .directory = (config_dir / *dir).string(),
          .active_date = *active_date,
          .end_date = *end_date,
      });
    }
  }
  return result;
}

ScheduleIndexes BuildScheduleIndexes(
    const std::vector<RawMovementRecord>& records,
    const ScheduleLookup* lookup,
    const RouteTrunks& trunks,
    const TextLogger& log
) {
  ScheduleIndexes indexes;
  if (lookup == nullptr) {
    return indexes;
  }
  std::set<ServiceDate> dates;
  for (const auto& record : records) {
    dates.insert(record.service_date);
  }
  for (const auto& date : dates) {
    std::optional<ScheduleFeed> feed = SelectFeed(lookup->Lookup(date), date);
    if (!feed) {
      log("No schedule feed covers " + FormatServiceDate(date));
      continue;
    }
    log(
        "Schedule for " + FormatServiceDate(date) + ": feed " + feed->key
    );
    indexes.emplace(date, ScheduleIndex::Build(*feed, date, trunks));
  }
  return indexes;
}

PipelineResult ProcessBatch(
    const std::vector<RawMovementRecord>& records,
    SourceKind kind,
    const ScheduleLookup* lookup,
    const PipelineOptions& options,
    PartitionSink& sink,
    const std::atomic<bool>& cancel,
    const TextLogger& log
) {
  PipelineResult result;
  const ScheduleIndexes schedules =
      BuildScheduleIndexes(records, lookup, options.route_trunks, log);

  std::vector<Event> events = ComputeIntervals(
      PairEvents(records, schedules, options.route_trunks, result.summary, log),
      schedules,
      result.summary,
      log
  );
  log(
      "Paired " + std::to_string(records.size()) + " records into " +
      std::to_string(events.size()) + " events"
  );

  Partitions partitions = Partition(std::move(events), kind);
  std::vector<Partitions::value_type*> work;
  work.reserve(partitions.size());
  for (auto& entry : partitions) {
    work.push_back(&entry);
  }
  const size_t num_work_items = work.size();
  const bool compressed = options.compress && kind != SourceKind::kRealtimeFeed;

  // Work queue shared by the partition workers
  std::mutex mutex;
  size_t next_item = 0;
  bool stopped = false;
  std::exception_ptr failure;
  std::vector<std::optional<WrittenPartition>> written(num_work_items);
  TextLogger worker_log = SynchronizedLogger(log);

  const unsigned int num_threads = std::min<unsigned>(
      options.workers.value_or(
          std::max(1u, std::thread::hardware_concurrency())
      ),
      std::max<size_t>(1, num_work_items)
  );

  auto worker = [&]() {
    FaultSummary local;
    while (true) {
      size_t i;
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (cancel.load() || failure) {
          stopped = stopped || next_item < num_work_items;
          break;
        }
        i = next_item;
        next_item += 1;
      }
      if (i >= num_work_items) {
        break;
      }

      auto& [key, rows] = *work[i];
      try {
        std::vector<Event> enriched =
            Enrich(std::move(rows), schedules, local, worker_log);
        SortRows(enriched);
        std::string bytes = SerializeEventsCsv(enriched);
        if (compressed) {
          bytes = GzipCompress(bytes);
        }
        std::string path = OutputPath(kind, key, compressed);
        sink.Write(path, bytes);
        written[i] = WrittenPartition{key, path, enriched.size()};
      } catch (const std::exception& e) {
        worker_log("Partition " + key + " failed: " + e.what());
        std::lock_guard<std::mutex> lock(mutex);
        if (!failure) {
          failure = std::current_exception();
        }
      }
    }

    std::lock_guard<std::mutex> lock(mutex);
    result.summary += local;
  };

  std::vector<std::thread> threads;
  threads.reserve(num_threads);
  for (unsigned int t = 0; t < num_threads; ++t) {
    threads.emplace_back(worker);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  if (failure) {
    std::rethrow_exception(failure);
  }

  for (auto& partition : written) {
    if (partition) {
      result.partitions.push_back(std::move(*partition));
    }
  }
  result.completed = !stopped;
  if (stopped) {
    log(
        "Cancelled after " + std::to_string(result.partitions.size()) + " of " +
        std::to_string(num_work_items) + " partitions"
    );
  }
  return result;
}

PipelineResult RunPipeline(
    const PipelineConfig& config,
    PartitionSink& sink,
    const std::atomic<bool>& cancel,
    const TextLogger& log
) {
  FaultSummary normalize_summary;
  std::vector<RawMovementRecord> records;
  for (const auto& input : config.inputs) {
    log("Reading " + input);
    std::vector<RawMovementRecord> batch = NormalizeFile(
        input,
        config.source_kind,
        config.service_date,
        config.normalize,
        normalize_summary,
        log
    );
    records.insert(
        records.end(),
        std::make_move_iterator(batch.begin()),
        std::make_move_iterator(batch.end())
    );
  }
  log("Normalized " + std::to_string(records.size()) + " records");

  std::unique_ptr<ScheduleLookup> lookup;
  if (!config.feeds.empty()) {
    lookup = std::make_unique<GtfsArchiveLookup>(config.feeds);
  }

  PipelineResult result = ProcessBatch(
      records,
      config.source_kind,
      lookup.get(),
      config.options,
      sink,
      cancel,
      log
  );
  result.summary += normalize_summary;
  return result;
}

}  // namespace stopevents
