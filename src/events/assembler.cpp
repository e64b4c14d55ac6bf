#include "events/assembler.h"

#include <zlib.h>

#include <algorithm>
#include <csv.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace stopevents {

namespace {

std::string OptionalCell(const std::optional<int>& value) {
  return value ? std::to_string(*value) : "";
}

std::optional<int> ParseOptionalCell(const std::string& cell) {
  if (cell.empty()) {
    return std::nullopt;
  }
  return std::stoi(cell);
}

std::string YearMonth(const ServiceDate& date) {
  return "Year=" + std::to_string(static_cast<int>(date.year())) +
         "/Month=" + std::to_string(static_cast<unsigned>(date.month()));
}

std::string ZlibError(const char* what, int code) {
  return std::string(what) + " failed with zlib error " + std::to_string(code);
}

}  // namespace

const std::vector<std::string>& EventColumns() {
  static const std::vector<std::string> columns = {
      "service_date",
      "route_id",
      "trip_id",
      "direction_id",
      "stop_id",
      "stop_sequence",
      "vehicle_id",
      "vehicle_label",
      "event_type",
      "event_time",
      "travel_time_seconds",
      "dwell_time_seconds",
      "headway_seconds",
      "headway_branch_seconds",
      "scheduled_tt",
      "scheduled_headway",
      "scheduled_headway_branch",
      "vehicle_consist",
  };
  return columns;
}

std::string PartitionKeyOf(const Event& event, SourceKind kind) {
  const std::string direction = std::to_string(event.direction_id);
  switch (kind) {
    case SourceKind::kRealtimeFeed:
      return event.stop_id + "/" + YearMonth(event.service_date) + "/Day=" +
             std::to_string(static_cast<unsigned>(event.service_date.day()));
    case SourceKind::kHistoricRail:
      return event.stop_id + "/" + YearMonth(event.service_date);
    case SourceKind::kHistoricBus:
      return event.route_id + "-" + direction + "-" + event.stop_id + "/" +
             YearMonth(event.service_date);
    case SourceKind::kHistoricFerry:
      return event.route_id + "|" + direction + "|" + event.stop_id + "/" +
             YearMonth(event.service_date);
  }
  throw std::runtime_error("Unknown source kind");
}

void SortRows(std::vector<Event>& rows) {
  std::stable_sort(rows.begin(), rows.end(), EventRowLess);
}

Partitions Partition(std::vector<Event> events, SourceKind kind) {
  Partitions partitions;
  for (auto& event : events) {
    std::string key = PartitionKeyOf(event, kind);
    partitions[key].push_back(std::move(event));
  }
  for (auto& [key, rows] : partitions) {
    SortRows(rows);
  }
  return partitions;
}

std::string SerializeEventsCsv(const std::vector<Event>& rows) {
  std::ostringstream out;
  auto writer = csv::make_csv_writer(out);
  writer << EventColumns();
  for (const auto& e : rows) {
    writer << std::vector<std::string>{
        FormatServiceDate(e.service_date),
        e.route_id,
        e.trip_id,
        std::to_string(e.direction_id),
        e.stop_id,
        std::to_string(e.stop_sequence),
        e.vehicle_id,
        e.vehicle_label,
        std::string(ToString(e.event_type)),
        FormatEventTime(e.event_time),
        OptionalCell(e.travel_time_seconds),
        OptionalCell(e.dwell_time_seconds),
        OptionalCell(e.headway_seconds),
        OptionalCell(e.headway_branch_seconds),
        OptionalCell(e.scheduled_tt),
        OptionalCell(e.scheduled_headway),
        OptionalCell(e.scheduled_headway_branch),
        e.vehicle_consist.value_or(""),
    };
  }
  return out.str();
}

std::vector<Event> ParseEventsCsv(std::string_view csv_text) {
  std::stringstream source{std::string(csv_text)};
  csv::CSVFormat format;
  format.delimiter(',').quote('"').header_row(0);
  csv::CSVReader reader(source, format);

  std::vector<Event> events;
  for (csv::CSVRow& row : reader) {
    auto cell = [&row](const char* column) {
      return row[column].get<std::string>();
    };
    Event& e = events.emplace_back();
    e.service_date = ParseServiceDate(cell("service_date"));
    e.route_id = cell("route_id");
    e.trip_id = cell("trip_id");
    e.direction_id = std::stoi(cell("direction_id"));
    e.stop_id = cell("stop_id");
    e.stop_sequence = std::stoi(cell("stop_sequence"));
    e.vehicle_id = cell("vehicle_id");
    e.vehicle_label = cell("vehicle_label");
    e.event_type = ParseEventType(cell("event_type"));
    e.event_time = ParseEventTime(cell("event_time"));
    e.travel_time_seconds = ParseOptionalCell(cell("travel_time_seconds"));
    e.dwell_time_seconds = ParseOptionalCell(cell("dwell_time_seconds"));
    e.headway_seconds = ParseOptionalCell(cell("headway_seconds"));
    e.headway_branch_seconds =
        ParseOptionalCell(cell("headway_branch_seconds"));
    e.scheduled_tt = ParseOptionalCell(cell("scheduled_tt"));
    e.scheduled_headway = ParseOptionalCell(cell("scheduled_headway"));
    e.scheduled_headway_branch =
        ParseOptionalCell(cell("scheduled_headway_branch"));
    std::string consist = cell("vehicle_consist");
    if (!consist.empty()) {
      e.vehicle_consist = consist;
    }
  }
  return events;
}

std::string GzipCompress(std::string_view data) {
  z_stream stream{};
  // windowBits 15 + 16 selects the gzip wrapper.
  int rc = deflateInit2(
      &stream, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY
  );
  if (rc != Z_OK) {
    throw std::runtime_error(ZlibError("deflateInit2", rc));
  }

  gz_header header{};
  header.time = 0;
  header.os = 255;
  rc = deflateSetHeader(&stream, &header);
  if (rc != Z_OK) {
    deflateEnd(&stream);
    throw std::runtime_error(ZlibError("deflateSetHeader", rc));
  }

  std::string out;
  out.resize(deflateBound(&stream, data.size()) + 32);
  stream.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  rc = deflate(&stream, Z_FINISH);
  if (rc != Z_STREAM_END) {
    deflateEnd(&stream);
    throw std::runtime_error(ZlibError("deflate", rc));
  }
  out.resize(stream.total_out);
  deflateEnd(&stream);
  return out;
}

std::string GzipDecompress(std::string_view data) {
  z_stream stream{};
  int rc = inflateInit2(&stream, 15 + 16);
  if (rc != Z_OK) {
    throw std::runtime_error(ZlibError("inflateInit2", rc));
  }
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  char buffer[1 << 16];
  do {
    stream.next_out = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = sizeof(buffer);
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&stream);
      throw std::runtime_error(ZlibError("inflate", rc));
    }
    out.append(buffer, sizeof(buffer) - stream.avail_out);
  } while (rc != Z_STREAM_END);
  inflateEnd(&stream);
  return out;
}

std::string OutputPrefix(SourceKind kind) {
  switch (kind) {
    case SourceKind::kRealtimeFeed:
      return "Events-lamp/daily-data";
    case SourceKind::kHistoricRail:
      return "Events/monthly-data";
    case SourceKind::kHistoricBus:
      return "Events/monthly-bus-data";
    case SourceKind::kHistoricFerry:
      return "Events/monthly-ferry-data";
  }
  throw std::runtime_error("Unknown source kind");
}

std::string OutputPath(
    SourceKind kind, const std::string& partition_key, bool compressed
) {
  return OutputPrefix(kind) + "/" + partition_key + "/events.csv" +
         (compressed ? ".gz" : "");
}

void DirectorySink::Write(const std::string& path, const std::string& bytes) {
  std::filesystem::path target = root_ / path;
  std::filesystem::create_directories(target.parent_path());
  std::ofstream file(target, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("Could not open file for writing: " + target.string());
  }
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    throw std::runtime_error("Could not write file: " + target.string());
  }
}

}  // namespace stopevents
