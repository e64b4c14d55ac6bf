#include "events/pipeline.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>

#include "events/test_util/event_gen.h"

namespace stopevents {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::SizeIs;
using ::testing::StartsWith;
using ::testing::UnorderedElementsAre;

const ServiceDate kDate = Ymd(2024, 2, 7);

class MemorySink : public PartitionSink {
 public:
  void Write(const std::string& path, const std::string& bytes) override {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = bytes;
  }

  std::map<std::string, std::string> files() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> files_;
};

class FailingSink : public PartitionSink {
 public:
  void Write(const std::string& path, const std::string&) override {
    throw std::runtime_error("disk full: " + path);
  }
};

RawMovementRecord Record(
    const std::string& trip_id,
    const std::string& stop_id,
    int stop_sequence,
    PointKind kind,
    int seconds_after_midnight
) {
  RawMovementRecord record;
  record.service_date = kDate;
  record.route_id = "Red";
  record.trip_id = trip_id;
  record.stop_id = stop_id;
  record.stop_sequence = stop_sequence;
  record.vehicle_id = "v-" + trip_id;
  record.vehicle_label = trip_id;
  record.timestamp = EasternWallTimeToInstant(kDate, seconds_after_midnight);
  record.point_kind = kind;
  return record;
}

// Four trips over five stops, seven minutes apart.
std::vector<RawMovementRecord> LineRecords() {
  std::vector<RawMovementRecord> records;
  for (int trip = 0; trip < 4; ++trip) {
    for (int stop = 0; stop < 5; ++stop) {
      int arrival = 10 * 3600 + trip * 420 + stop * 180;
      std::string trip_id = "t" + std::to_string(trip);
      std::string stop_id = "S" + std::to_string(stop);
      records.push_back(
          Record(trip_id, stop_id, stop + 1, PointKind::kArrival, arrival)
      );
      records.push_back(
          Record(trip_id, stop_id, stop + 1, PointKind::kDeparture, arrival + 30)
      );
    }
  }
  return records;
}

Gtfs TwoStopSchedule() {
  return GtfsBuilder()
      .Trip("Red", 0, "t1", {{"A", 1, "10:00:00", "10:00:00"},
                             {"B", 2, "10:04:00", "10:04:00"}})
      .Trip("Red", 0, "t2", {{"A", 1, "10:10:00", "10:10:00"},
                             {"B", 2, "10:14:00", "10:14:00"}})
      .Build();
}

PipelineOptions Options(unsigned workers, bool compress = true) {
  PipelineOptions options;
  options.workers = workers;
  options.compress = compress;
  return options;
}

TEST(ProcessBatchTest, RailBatchIsEnrichedAndCompressed) {
  StaticScheduleLookup lookup(
      {FeedOf(TwoStopSchedule(), "winter", Ymd(2024, 1, 1), Ymd(2024, 3, 31))}
  );
  MemorySink sink;
  std::atomic<bool> cancel{false};
  PipelineResult result = ProcessBatch(
      {Record("t1", "A", 1, PointKind::kDeparture, 10 * 3600),
       Record("t1", "B", 2, PointKind::kArrival, 10 * 3600 + 300),
       Record("t2", "A", 1, PointKind::kDeparture, 10 * 3600 + 660)},
      SourceKind::kHistoricRail,
      &lookup,
      Options(2),
      sink,
      cancel,
      NullLogger()
  );

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(result.summary, FaultSummary{});
  EXPECT_THAT(
      result.partitions,
      ElementsAre(
          Field(&WrittenPartition::key, "A/Year=2024/Month=2"),
          Field(&WrittenPartition::key, "B/Year=2024/Month=2")
      )
  );
  EXPECT_EQ(result.partitions[0].rows, 2);
  EXPECT_EQ(result.partitions[0].path,
            "Events/monthly-data/A/Year=2024/Month=2/events.csv.gz");

  auto files = sink.files();
  std::vector<Event> at_a = ParseEventsCsv(
      GzipDecompress(files.at("Events/monthly-data/A/Year=2024/Month=2/events.csv.gz"))
  );
  ASSERT_THAT(at_a, SizeIs(2));
  EXPECT_THAT(at_a[1].headway_seconds, Optional(660));
  EXPECT_THAT(at_a[1].scheduled_headway, Optional(600));

  std::vector<Event> at_b = ParseEventsCsv(
      GzipDecompress(files.at("Events/monthly-data/B/Year=2024/Month=2/events.csv.gz"))
  );
  ASSERT_THAT(at_b, SizeIs(1));
  EXPECT_THAT(at_b[0].travel_time_seconds, Optional(300));
  EXPECT_THAT(at_b[0].scheduled_tt, Optional(240));
}

TEST(ProcessBatchTest, WithoutScheduleEventsStillWritten) {
  MemorySink sink;
  std::atomic<bool> cancel{false};
  PipelineResult result = ProcessBatch(
      {Record("t1", "A", 1, PointKind::kArrival, 10 * 3600)},
      SourceKind::kHistoricRail,
      nullptr,
      Options(1),
      sink,
      cancel,
      NullLogger()
  );
  EXPECT_THAT(result.partitions, SizeIs(1));
  EXPECT_EQ(result.summary.schedule_misses, 1);
}

TEST(ProcessBatchTest, RealtimeOutputIsPlainCsv) {
  MemorySink sink;
  std::atomic<bool> cancel{false};
  PipelineResult result = ProcessBatch(
      {Record("t1", "A", 1, PointKind::kArrival, 10 * 3600)},
      SourceKind::kRealtimeFeed,
      nullptr,
      Options(1, true),
      sink,
      cancel,
      NullLogger()
  );
  ASSERT_THAT(result.partitions, SizeIs(1));
  const std::string path =
      "Events-lamp/daily-data/A/Year=2024/Month=2/Day=7/events.csv";
  EXPECT_EQ(result.partitions[0].path, path);
  EXPECT_THAT(sink.files().at(path), StartsWith("service_date,route_id"));
}

TEST(ProcessBatchTest, FerrySailingsSharingTripIdStayApart) {
  FaultSummary normalized;
  std::vector<RawMovementRecord> records = NormalizeText(
      "service_date,route_id,trip_id,travel_direction,departure_terminal,"
      "arrival_terminal,mbta_sched_departure,mbta_sched_arrival,"
      "actual_departure,actual_arrival,vessel_time_slot\n"
      "2024-02-07 00:00:00+00:00,F1,trip1,To Boston,Hingham,Boston,"
      "2024-02-07 07:45:00+00:00,2024-02-07 08:00:00+00:00,"
      "2024-02-07 07:46:00,2024-02-07 08:02:00,slot1\n"
      "2024-02-07 00:00:00+00:00,F1,trip1,From Boston,Boston,Hingham,"
      "2024-02-07 08:45:00+00:00,2024-02-07 09:00:00+00:00,"
      "2024-02-07 08:46:00,2024-02-07 09:01:00,slot1\n",
      SourceKind::kHistoricFerry,
      kDate,
      {},
      normalized,
      NullLogger()
  );

  MemorySink sink;
  std::atomic<bool> cancel{false};
  PipelineResult result = ProcessBatch(
      records,
      SourceKind::kHistoricFerry,
      nullptr,
      Options(2, false),
      sink,
      cancel,
      NullLogger()
  );

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(result.summary.ordering_anomalies, 0);
  EXPECT_EQ(result.summary.duplicate_records, 0);
  auto has_key = [](const std::string& key) {
    return Field(&WrittenPartition::key, key);
  };
  EXPECT_THAT(
      result.partitions,
      UnorderedElementsAre(
          has_key("Boat-F1|1|Boat-Hingham/Year=2024/Month=2"),
          has_key("Boat-F1|1|Boat-Long/Year=2024/Month=2"),
          has_key("Boat-F1|0|Boat-Long/Year=2024/Month=2"),
          has_key("Boat-F1|0|Boat-Hingham/Year=2024/Month=2")
      )
  );

  auto files = sink.files();
  auto read = [&files](const std::string& key) {
    return ParseEventsCsv(
        files.at("Events/monthly-ferry-data/" + key + "/events.csv")
    );
  };
  std::vector<Event> outbound_arrival =
      read("Boat-F1|1|Boat-Long/Year=2024/Month=2");
  ASSERT_THAT(outbound_arrival, SizeIs(1));
  EXPECT_EQ(outbound_arrival[0].event_type, EventType::kArr);
  EXPECT_EQ(outbound_arrival[0].stop_sequence, 2);
  EXPECT_THAT(outbound_arrival[0].travel_time_seconds, Optional(960));
  EXPECT_EQ(outbound_arrival[0].dwell_time_seconds, std::nullopt);

  std::vector<Event> return_departure =
      read("Boat-F1|0|Boat-Long/Year=2024/Month=2");
  ASSERT_THAT(return_departure, SizeIs(1));
  EXPECT_EQ(return_departure[0].event_type, EventType::kDep);
  EXPECT_EQ(return_departure[0].stop_sequence, 1);
  EXPECT_EQ(return_departure[0].dwell_time_seconds, std::nullopt);

  std::vector<Event> return_arrival =
      read("Boat-F1|0|Boat-Hingham/Year=2024/Month=2");
  ASSERT_THAT(return_arrival, SizeIs(1));
  EXPECT_EQ(return_arrival[0].event_time, EasternAt(kDate, "09:01:00"));
  EXPECT_THAT(return_arrival[0].travel_time_seconds, Optional(900));
}

TEST(ProcessBatchTest, OutputDoesNotDependOnWorkerCount) {
  std::atomic<bool> cancel{false};
  MemorySink one;
  MemorySink many;
  ProcessBatch(LineRecords(), SourceKind::kHistoricRail, nullptr, Options(1),
               one, cancel, NullLogger());
  ProcessBatch(LineRecords(), SourceKind::kHistoricRail, nullptr, Options(8),
               many, cancel, NullLogger());
  EXPECT_THAT(one.files(), SizeIs(5));
  EXPECT_EQ(one.files(), many.files());
}

TEST(ProcessBatchTest, CancelledBeforeStartWritesNothing) {
  MemorySink sink;
  std::atomic<bool> cancel{true};
  PipelineResult result = ProcessBatch(
      LineRecords(), SourceKind::kHistoricRail, nullptr, Options(2), sink,
      cancel, NullLogger()
  );
  EXPECT_FALSE(result.completed);
  EXPECT_THAT(result.partitions, IsEmpty());
  EXPECT_THAT(sink.files(), IsEmpty());
}

TEST(ProcessBatchTest, SinkFailureIsRethrown) {
  FailingSink sink;
  std::atomic<bool> cancel{false};
  try {
    ProcessBatch(LineRecords(), SourceKind::kHistoricRail, nullptr, Options(3),
                 sink, cancel, NullLogger());
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("disk full"));
  }
}

class PipelineConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("stopevents_pipeline_" +
            std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()
            ));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::string WriteFile(const std::string& name, const std::string& contents) {
    std::filesystem::path path = dir_ / name;
    std::ofstream(path) << contents;
    return path.string();
  }

  std::string Resolved(const std::string& relative) const {
    return (std::filesystem::weakly_canonical(dir_) / relative).string();
  }

  std::filesystem::path dir_;
};

TEST_F(PipelineConfigTest, LoadsAllKeys) {
  std::string path = WriteFile(
      "pipeline.toml",
      "source_kind = \"bus\"\n"
      "input = [\"a.csv\", \"b.csv\"]\n"
      "service_date = 2024-02-07\n"
      "output_dir = \"published\"\n"
      "workers = 3\n"
      "compress = false\n"
      "routes = [\"1\", \"28\"]\n"
      "start_date = \"20240201\"\n"
      "\n"
      "[route_trunks]\n"
      "\"Green-B\" = \"Green\"\n"
      "\n"
      "[[feeds]]\n"
      "dir = \"gtfs/winter\"\n"
      "active_date = 2024-01-01\n"
      "end_date = \"2024-03-31\"\n"
      "\n"
      "[[feeds]]\n"
      "key = \"spring\"\n"
      "dir = \"gtfs/spring\"\n"
      "active_date = 2024-04-01\n"
      "end_date = 2024-06-30\n"
  );

  PipelineConfig config = PipelineConfigLoad(path);
  EXPECT_EQ(config.source_kind, SourceKind::kHistoricBus);
  EXPECT_THAT(config.inputs, ElementsAre(Resolved("a.csv"), Resolved("b.csv")));
  EXPECT_EQ(config.service_date, kDate);
  EXPECT_EQ(config.output_dir, Resolved("published"));
  EXPECT_THAT(config.options.workers, Optional(3u));
  EXPECT_FALSE(config.options.compress);
  EXPECT_THAT(config.normalize.routes, ElementsAre("1", "28"));
  EXPECT_THAT(config.normalize.start_date, Optional(Ymd(2024, 2, 1)));
  EXPECT_EQ(config.normalize.end_date, std::nullopt);
  EXPECT_EQ(config.options.route_trunks.at("Green-B"), "Green");

  ASSERT_THAT(config.feeds, SizeIs(2));
  EXPECT_EQ(config.feeds[0].key, "gtfs/winter");
  EXPECT_EQ(config.feeds[0].directory, Resolved("gtfs/winter"));
  EXPECT_EQ(config.feeds[0].end_date, Ymd(2024, 3, 31));
  EXPECT_EQ(config.feeds[1].key, "spring");
  EXPECT_EQ(config.feeds[1].active_date, Ymd(2024, 4, 1));
}

TEST_F(PipelineConfigTest, Defaults) {
  std::string path = WriteFile(
      "pipeline.toml",
      "source_kind = \"rail\"\n"
      "input = \"events.csv\"\n"
      "service_date = \"20240207\"\n"
  );
  PipelineConfig config = PipelineConfigLoad(path);
  EXPECT_THAT(config.inputs, ElementsAre(Resolved("events.csv")));
  EXPECT_EQ(config.output_dir, Resolved("out"));
  EXPECT_EQ(config.options.workers, std::nullopt);
  EXPECT_TRUE(config.options.compress);
  EXPECT_THAT(config.feeds, IsEmpty());
}

TEST_F(PipelineConfigTest, RejectsIncompleteConfig) {
  EXPECT_THROW(
      PipelineConfigLoad(WriteFile("a.toml", "source_kind = \"rail\"\n")),
      std::runtime_error
  );
  EXPECT_THROW(
      PipelineConfigLoad(WriteFile(
          "b.toml",
          "source_kind = \"rail\"\ninput = \"x.csv\"\n"
          "service_date = 2024-02-07\nworkers = 0\n"
      )),
      std::runtime_error
  );
  EXPECT_THROW(
      PipelineConfigLoad(WriteFile("c.toml", "source_kind = = \n")),
      std::runtime_error
  );
}

TEST_F(PipelineConfigTest, RunPipelineReadsFilesAndSchedule) {
  GtfsSave(TwoStopSchedule(), (dir_ / "gtfs" / "winter").string());
  WriteFile(
      "events.csv",
      "service_date,route_id,trip_id,direction_id,stop_id,sync_stop_sequence,"
      "vehicle_id,vehicle_label,event_type,event_time_sec\n"
      "20240207,Red,t1,0,A,1,v1,1700,DEP,36000\n"
      "20240207,Red,t1,0,B,2,v1,1700,ARR,36300\n"
      "20240207,Red,t1,0,B,2,v1,1700,PRD,36300\n"
  );
  std::string path = WriteFile(
      "pipeline.toml",
      "source_kind = \"rail\"\n"
      "input = \"events.csv\"\n"
      "service_date = 2024-02-07\n"
      "workers = 2\n"
      "\n"
      "[[feeds]]\n"
      "dir = \"gtfs/winter\"\n"
      "active_date = 2024-01-01\n"
      "end_date = 2024-03-31\n"
  );

  PipelineConfig config = PipelineConfigLoad(path);
  DirectorySink sink(config.output_dir);
  std::atomic<bool> cancel{false};
  PipelineResult result = RunPipeline(config, sink, cancel, NullLogger());

  EXPECT_TRUE(result.completed);
  EXPECT_EQ(result.summary.filtered_records, 1);
  ASSERT_THAT(result.partitions, SizeIs(2));

  std::ifstream file(
      std::filesystem::path(config.output_dir) / result.partitions[1].path,
      std::ios::binary
  );
  std::string bytes(
      (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>()
  );
  std::vector<Event> at_b = ParseEventsCsv(GzipDecompress(bytes));
  ASSERT_THAT(at_b, SizeIs(1));
  EXPECT_EQ(at_b[0].stop_id, "B");
  EXPECT_THAT(at_b[0].travel_time_seconds, Optional(300));
  EXPECT_THAT(at_b[0].scheduled_tt, Optional(240));
}

}  // namespace
}  // namespace stopevents
