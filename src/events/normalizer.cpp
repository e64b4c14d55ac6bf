#include "events/normalizer.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <csv.hpp>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace stopevents {

namespace {

const SchemaVariant kRealtimeVariant{
    .name = "lamp-realtime",
    .kind = SourceKind::kRealtimeFeed,
    .required =
        {{"service_date", "service_date"},
         {"route_id", "route_id"},
         {"trip_id", "trip_id"},
         {"direction_id", "direction_id"},
         {"stop_id", "stop_id"},
         {"stop_sequence", "stop_sequence"},
         {"vehicle_id", "vehicle_id"},
         {"vehicle_label", "vehicle_label"},
         {"move_timestamp", "move_timestamp"},
         {"stop_timestamp", "stop_timestamp"}},
    .optional = {{"vehicle_consist", "vehicle_consist"}},
};

const SchemaVariant kRailLegacyVariant{
    .name = "rail-legacy",
    .kind = SourceKind::kHistoricRail,
    .required =
        {{"service_date", "service_date"},
         {"route_id", "route_id"},
         {"trip_id", "trip_id"},
         {"direction_id", "direction_id"},
         {"stop_id", "stop_id"},
         {"stop_sequence", "stop_sequence"},
         {"vehicle_id", "vehicle_id"},
         {"vehicle_label", "vehicle_label"},
         {"event_type", "event_type"},
         {"event_time_sec", "event_time_sec"}},
    .optional = {{"vehicle_consist", "vehicle_consist"}},
};

const SchemaVariant kRailSyncVariant{
    .name = "rail-sync-sequence",
    .kind = SourceKind::kHistoricRail,
    .required =
        {{"service_date", "service_date"},
         {"route_id", "route_id"},
         {"trip_id", "trip_id"},
         {"direction_id", "direction_id"},
         {"stop_id", "stop_id"},
         {"stop_sequence", "sync_stop_sequence"},
         {"vehicle_id", "vehicle_id"},
         {"vehicle_label", "vehicle_label"},
         {"event_type", "event_type"},
         {"event_time_sec", "event_time_sec"}},
    .optional = {{"vehicle_consist", "vehicle_consist"}},
};

const SchemaVariant kBusEasternVariant{
    .name = "bus-eastern",
    .kind = SourceKind::kHistoricBus,
    .required =
        {{"service_date", "service_date"},
         {"route_id", "route_id"},
         {"direction", "direction"},
         {"trip_id", "half_trip_id"},
         {"stop_id", "stop_id"},
         {"stop_sequence", "time_point_order"},
         {"point_type", "point_type"},
         {"actual", "actual"}},
    .optional = {},
};

const SchemaVariant kBusUtcVariant{
    .name = "bus-utc",
    .kind = SourceKind::kHistoricBus,
    .required =
        {{"service_date", "service_date"},
         {"route_id", "route_id"},
         {"direction", "direction_id"},
         {"trip_id", "half_trip_id"},
         {"stop_id", "stop_id"},
         {"stop_sequence", "time_point_order"},
         {"point_type", "point_type"},
         {"actual", "actual"}},
    .optional = {},
};

const SchemaVariant kFerryVariant{
    .name = "ferry",
    .kind = SourceKind::kHistoricFerry,
    .required =
        {{"service_date", "service_date"},
         {"route_id", "route_id"},
         {"trip_id", "trip_id"},
         {"direction", "travel_direction"},
         {"departure_stop", "departure_terminal"},
         {"arrival_stop", "arrival_terminal"},
         {"departure_time", "actual_departure"},
         {"arrival_time", "actual_arrival"},
         {"vehicle_id", "vessel_time_slot"}},
    .optional = {},
};

const std::unordered_map<std::string, std::string> kFerryRoutes = {
    {"F1", "Boat-F1"},
    {"F2H", "Boat-F1"},
    {"F3", "Boat-EastBoston"},
    {"F4", "Boat-F4"},
    {"F5", "Boat-Lynn"},
    {"F6", "Boat-F6"},
    {"F7", "Boat-F7"},
    {"F8", "Boat-F8"},
};

const std::unordered_map<std::string, std::string> kFerryTerminals = {
    {"Aquarium", "Boat-Aquarium"},
    {"Boston", "Boat-Long"},
    {"Central Whf", "Boat-Aquarium"},
    {"Georges", "Boat-George"},
    {"Hingham", "Boat-Hingham"},
    {"Hull", "Boat-Hull"},
    {"HULL", "Boat-Hull"},
    {"Lewis", "Boat-Lewis"},
    {"Logan", "Boat-Logan"},
    {"LOGAN", "Boat-Logan"},
    {"Long Wharf N", "Boat-Long"},
    {"Long Wharf S", "Boat-Long-South"},
    {"Lynn", "Boat-Blossom"},
    {"Navy Yard", "Boat-Charlestown"},
    {"Quincy", "Boat-Quincy"},
    {"Rowes", "Boat-Rowes"},
    {"Rowes Wharf", "Boat-Rowes"},
    {"Seaport", "Boat-Fan"},
    {"Winthrop", "Boat-Winthrop"},
};

std::string Trim(std::string_view text) {
  size_t begin = text.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(" \t\r");
  return std::string(text.substr(begin, end - begin + 1));
}

// Integer value of a cell, tolerating a fractional ".0" suffix written by
// float-typed exports. Empty cells are nullopt; anything else unparsable
// makes the source malformed.
std::optional<long long> OptionalInteger(
    std::string_view text, std::string_view column
) {
  std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  long long value = 0;
  const char* begin = trimmed.data();
  const char* end = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec == std::errc() && ptr == end) {
    return value;
  }
  double real = 0;
  auto [rptr, rec] = std::from_chars(begin, end, real);
  if (rec == std::errc() && rptr == end && std::floor(real) == real) {
    return static_cast<long long>(real);
  }
  throw std::runtime_error(
      "Invalid integer in column " + std::string(column) + ": " + trimmed
  );
}

long long RequiredInteger(std::string_view text, std::string_view column) {
  std::optional<long long> value = OptionalInteger(text, column);
  if (!value) {
    throw std::runtime_error("Missing value in column " + std::string(column));
  }
  return *value;
}

std::optional<int> OptionalSequence(
    std::string_view text, std::string_view column
) {
  std::optional<long long> value = OptionalInteger(text, column);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

// Real-time and rail files write booleans, integers, or floats here.
int ParseDirection(std::string_view text, std::string_view column) {
  std::string trimmed = Trim(text);
  if (trimmed == "true" || trimmed == "True" || trimmed == "TRUE") {
    return 1;
  }
  if (trimmed == "false" || trimmed == "False" || trimmed == "FALSE") {
    return 0;
  }
  if (trimmed == "Inbound") {
    return 1;
  }
  if (trimmed == "Outbound") {
    return 0;
  }
  if (trimmed == "From Boston") {
    return 0;
  }
  if (trimmed == "To Boston") {
    return 1;
  }
  return static_cast<int>(RequiredInteger(trimmed, column));
}

ServiceDate RowServiceDate(
    const std::string& text, const ServiceDate& fallback
) {
  std::string trimmed = Trim(text);
  if (trimmed.empty()) {
    return fallback;
  }
  return ParseServiceDate(trimmed);
}

class RowReader {
 public:
  RowReader(const SchemaVariant& variant, csv::CSVRow& row,
            const std::vector<std::string>& header)
      : variant_(variant), row_(row), header_(header) {}

  std::string Get(std::string_view field) const {
    std::string column(variant_.Column(field));
    return row_[column].get<std::string>();
  }

  std::optional<std::string> GetOptional(std::string_view field) const {
    auto it = variant_.optional.find(field);
    if (it == variant_.optional.end()) {
      return std::nullopt;
    }
    std::string column(it->second);
    if (std::find(header_.begin(), header_.end(), column) == header_.end()) {
      return std::nullopt;
    }
    std::string value = Trim(row_[column].get<std::string>());
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  }

  std::string_view ColumnName(std::string_view field) const {
    return variant_.Column(field);
  }

 private:
  const SchemaVariant& variant_;
  csv::CSVRow& row_;
  const std::vector<std::string>& header_;
};

class Normalizer {
 public:
  Normalizer(
      SourceKind kind,
      const ServiceDate& service_date,
      const NormalizeOptions& options,
      FaultSummary& summary,
      const TextLogger& log
  )
      : kind_(kind),
        service_date_(service_date),
        options_(options),
        summary_(summary),
        log_(log),
        variant_(SelectSchemaVariant(kind, service_date)) {}

  std::vector<RawMovementRecord> Run(csv::CSVReader& reader) {
    std::vector<std::string> header = reader.get_col_names();
    CheckSchema(variant_, header);

    std::vector<RawMovementRecord> records;
    const int filtered_before = summary_.filtered_records;
    size_t row_number = 0;
    for (csv::CSVRow& row : reader) {
      RowReader fields(variant_, row, header);
      switch (kind_) {
        case SourceKind::kRealtimeFeed:
          NormalizeRealtime(fields, records);
          break;
        case SourceKind::kHistoricRail:
          NormalizeRail(fields, records);
          break;
        case SourceKind::kHistoricBus:
          NormalizeBus(fields, records);
          break;
        case SourceKind::kHistoricFerry:
          NormalizeFerry(fields, row_number, records);
          break;
      }
      ++row_number;
    }
    int filtered = summary_.filtered_records - filtered_before;
    if (filtered > 0) {
      log_(
          std::string(variant_.name) + ": filtered " +
          std::to_string(filtered) + " rows"
      );
    }
    return records;
  }

 private:
  void Filter(std::string_view reason, std::string_view trip_id) {
    summary_.filtered_records += 1;
    log_(
        "Filtered row of trip " + std::string(trip_id) + ": " +
        std::string(reason)
    );
  }

  void NormalizeRealtime(
      const RowReader& fields, std::vector<RawMovementRecord>& records
  ) {
    RawMovementRecord record;
    record.service_date = RowServiceDate(fields.Get("service_date"), service_date_);
    record.trip_id = Trim(fields.Get("trip_id"));
    record.stop_id = Trim(fields.Get("stop_id"));
    if (record.stop_id.empty()) {
      Filter("no stop_id", record.trip_id);
      return;
    }
    if (record.service_date < kRevenueOnlyFeedCutover &&
        record.trip_id.starts_with("NONREV-")) {
      Filter("non-revenue trip", record.trip_id);
      return;
    }
    record.route_id = Trim(fields.Get("route_id"));
    record.direction_id = ParseDirection(
        fields.Get("direction_id"), fields.ColumnName("direction_id")
    );
    record.stop_sequence = OptionalSequence(
        fields.Get("stop_sequence"), fields.ColumnName("stop_sequence")
    );
    record.vehicle_id = Trim(fields.Get("vehicle_id"));
    record.vehicle_label = Trim(fields.Get("vehicle_label"));
    record.vehicle_consist = fields.GetOptional("vehicle_consist");

    std::optional<long long> move = OptionalInteger(
        fields.Get("move_timestamp"), fields.ColumnName("move_timestamp")
    );
    std::optional<long long> stop = OptionalInteger(
        fields.Get("stop_timestamp"), fields.ColumnName("stop_timestamp")
    );
    if (!move && !stop) {
      Filter("no timestamps", record.trip_id);
      return;
    }

    // The vehicle leaves the previous stop before it arrives here.
    if (move) {
      RawMovementRecord departure = record;
      departure.point_kind = PointKind::kDeparture;
      departure.timestamp = Instant{std::chrono::seconds{*move}};
      departure.reassign_departure = true;
      records.push_back(std::move(departure));
    }
    if (stop) {
      record.point_kind = PointKind::kArrival;
      record.timestamp = Instant{std::chrono::seconds{*stop}};
      records.push_back(std::move(record));
    }
  }

  void NormalizeRail(
      const RowReader& fields, std::vector<RawMovementRecord>& records
  ) {
    RawMovementRecord record;
    record.service_date = RowServiceDate(fields.Get("service_date"), service_date_);
    record.route_id = Trim(fields.Get("route_id"));
    record.trip_id = Trim(fields.Get("trip_id"));
    record.stop_id = Trim(fields.Get("stop_id"));
    if (record.stop_id.empty()) {
      Filter("no stop_id", record.trip_id);
      return;
    }
    std::string event_type = Trim(fields.Get("event_type"));
    if (event_type == "ARR") {
      record.point_kind = PointKind::kArrival;
    } else if (event_type == "DEP") {
      record.point_kind = PointKind::kDeparture;
    } else {
      Filter("event_type " + event_type, record.trip_id);
      return;
    }
    record.direction_id = ParseDirection(
        fields.Get("direction_id"), fields.ColumnName("direction_id")
    );
    record.stop_sequence = OptionalSequence(
        fields.Get("stop_sequence"), fields.ColumnName("stop_sequence")
    );
    record.vehicle_id = Trim(fields.Get("vehicle_id"));
    record.vehicle_label = Trim(fields.Get("vehicle_label"));
    record.vehicle_consist = fields.GetOptional("vehicle_consist");
    long long seconds = RequiredInteger(
        fields.Get("event_time_sec"), fields.ColumnName("event_time_sec")
    );
    record.timestamp = EasternWallTimeToInstant(
        record.service_date, static_cast<int>(seconds)
    );
    records.push_back(std::move(record));
  }

  void NormalizeBus(
      const RowReader& fields, std::vector<RawMovementRecord>& records
  ) {
    RawMovementRecord record;
    record.service_date = RowServiceDate(fields.Get("service_date"), service_date_);
    record.route_id = StripLeadingZeros(Trim(fields.Get("route_id")));
    record.trip_id = Trim(fields.Get("trip_id"));
    if (!options_.routes.empty() &&
        std::find(
            options_.routes.begin(), options_.routes.end(), record.route_id
        ) == options_.routes.end()) {
      summary_.filtered_records += 1;
      return;
    }
    record.stop_id = Trim(fields.Get("stop_id"));
    if (record.stop_id.empty()) {
      Filter("no stop_id", record.trip_id);
      return;
    }

    std::string point_type = Trim(fields.Get("point_type"));
    if (point_type == "Startpoint") {
      record.point_kind = PointKind::kStartpoint;
    } else if (point_type == "Midpoint") {
      record.point_kind = PointKind::kMidpoint;
    } else if (point_type == "Endpoint") {
      record.point_kind = PointKind::kEndpoint;
    } else {
      Filter("point_type " + point_type, record.trip_id);
      return;
    }

    std::string actual = Trim(fields.Get("actual"));
    if (actual.empty()) {
      Filter("no actual time", record.trip_id);
      return;
    }
    record.direction_id =
        ParseDirection(fields.Get("direction"), fields.ColumnName("direction"));
    record.stop_sequence = OptionalSequence(
        fields.Get("stop_sequence"), fields.ColumnName("stop_sequence")
    );

    int seconds = ParseBusTimepointSeconds(actual);
    if (record.service_date < kBusUtcCutover) {
      record.timestamp = EasternWallTimeToInstant(record.service_date, seconds);
    } else {
      record.timestamp = UtcWallTimeToInstant(record.service_date, seconds);
    }
    records.push_back(std::move(record));
  }

  void NormalizeFerry(
      const RowReader& fields,
      size_t row_number,
      std::vector<RawMovementRecord>& records
  ) {
    ServiceDate service_date =
        RowServiceDate(fields.Get("service_date"), service_date_);
    if ((options_.start_date && service_date < *options_.start_date) ||
        (options_.end_date && service_date > *options_.end_date)) {
      summary_.filtered_records += 1;
      return;
    }

    RawMovementRecord record;
    record.service_date = service_date;
    std::string route_label = Trim(fields.Get("route_id"));
    auto route = kFerryRoutes.find(route_label);
    record.route_id = route != kFerryRoutes.end() ? route->second
                                                  : "Boat-" + route_label;
    record.trip_id = Trim(fields.Get("trip_id"));
    if (record.trip_id.empty()) {
      record.trip_id = "ferry-" + route_label + "-" +
                       FormatDateInt(service_date) + "-" +
                       std::to_string(row_number);
    }
    record.direction_id =
        ParseDirection(fields.Get("direction"), fields.ColumnName("direction"));
    record.vehicle_id = Trim(fields.Get("vehicle_id"));
    record.vehicle_label = record.vehicle_id;
    // Each row is one sailing, even when the return leg repeats the trip id.
    record.run = static_cast<int>(row_number);

    auto terminal = [](const std::string& name) {
      auto it = kFerryTerminals.find(name);
      return it != kFerryTerminals.end() ? it->second : name;
    };

    std::string departure_time = Trim(fields.Get("departure_time"));
    std::string departure_stop = Trim(fields.Get("departure_stop"));
    if (!departure_time.empty() && !departure_stop.empty()) {
      RawMovementRecord departure = record;
      departure.stop_id = terminal(departure_stop);
      departure.stop_sequence = 1;
      departure.point_kind = PointKind::kDeparture;
      departure.timestamp = ParseEventTime(departure_time);
      records.push_back(std::move(departure));
    } else {
      Filter("sailing without departure", record.trip_id);
    }

    std::string arrival_time = Trim(fields.Get("arrival_time"));
    std::string arrival_stop = Trim(fields.Get("arrival_stop"));
    if (!arrival_time.empty() && !arrival_stop.empty()) {
      record.stop_id = terminal(arrival_stop);
      record.stop_sequence = 2;
      record.point_kind = PointKind::kArrival;
      record.timestamp = ParseEventTime(arrival_time);
      records.push_back(std::move(record));
    } else {
      Filter("sailing without arrival", record.trip_id);
    }
  }

  SourceKind kind_;
  ServiceDate service_date_;
  const NormalizeOptions& options_;
  FaultSummary& summary_;
  const TextLogger& log_;
  const SchemaVariant& variant_;
};

csv::CSVFormat SourceFormat() {
  csv::CSVFormat format;
  format.delimiter(',').quote('"').header_row(0);
  return format;
}

}  // namespace

const std::string_view& SchemaVariant::Column(std::string_view field) const {
  auto it = required.find(field);
  if (it != required.end()) {
    return it->second;
  }
  auto opt = optional.find(field);
  if (opt != optional.end()) {
    return opt->second;
  }
  throw std::runtime_error(
      "Schema variant " + std::string(name) + " has no field " +
      std::string(field)
  );
}

const SchemaVariant& SelectSchemaVariant(
    SourceKind kind, const ServiceDate& service_date
) {
  switch (kind) {
    case SourceKind::kRealtimeFeed:
      return kRealtimeVariant;
    case SourceKind::kHistoricRail:
      return service_date < kRailSyncSequenceCutover ? kRailLegacyVariant
                                                     : kRailSyncVariant;
    case SourceKind::kHistoricBus:
      return service_date < kBusUtcCutover ? kBusEasternVariant
                                           : kBusUtcVariant;
    case SourceKind::kHistoricFerry:
      return kFerryVariant;
  }
  throw std::runtime_error("Unknown source kind");
}

void CheckSchema(
    const SchemaVariant& variant, const std::vector<std::string>& header
) {
  for (const auto& [field, column] : variant.required) {
    if (std::find(header.begin(), header.end(), column) == header.end()) {
      throw SchemaMismatchError(
          "Schema variant " + std::string(variant.name) +
          " requires column " + std::string(column)
      );
    }
  }
}

std::string StripLeadingZeros(std::string_view route_id) {
  size_t first = route_id.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return route_id.empty() ? "" : "0";
  }
  return std::string(route_id.substr(first));
}

int ParseBusTimepointSeconds(std::string_view text) {
  // 1900-01-0X HH:MM:SS, 1900-01-0XTHH:MM:SSZ
  if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
      (text[10] != ' ' && text[10] != 'T') || text[13] != ':' ||
      text[16] != ':') {
    throw std::runtime_error(
        "Invalid timepoint time: " + std::string(text)
    );
  }
  auto number = [text](size_t pos, size_t len) {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data() + pos, text.data() + pos + len, value);
    if (ec != std::errc() || ptr != text.data() + pos + len) {
      throw std::runtime_error(
          "Invalid timepoint time: " + std::string(text)
      );
    }
    return value;
  };
  int day_offset = number(8, 2) - 1;
  int hours = number(11, 2);
  int minutes = number(14, 2);
  int seconds = number(17, 2);
  return day_offset * 86400 + hours * 3600 + minutes * 60 + seconds;
}

std::vector<RawMovementRecord> NormalizeText(
    std::string_view csv_text,
    SourceKind kind,
    const ServiceDate& service_date,
    const NormalizeOptions& options,
    FaultSummary& summary,
    const TextLogger& log
) {
  std::stringstream source{std::string(csv_text)};
  csv::CSVReader reader(source, SourceFormat());
  Normalizer normalizer(kind, service_date, options, summary, log);
  return normalizer.Run(reader);
}

std::vector<RawMovementRecord> NormalizeFile(
    const std::string& path,
    SourceKind kind,
    const ServiceDate& service_date,
    const NormalizeOptions& options,
    FaultSummary& summary,
    const TextLogger& log
) {
  Normalizer normalizer(kind, service_date, options, summary, log);
  try {
    csv::CSVReader reader(path, SourceFormat());
    return normalizer.Run(reader);
  } catch (const SchemaMismatchError& e) {
    throw SchemaMismatchError(path + ": " + e.what());
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not open or parse file: " + path + " - " + e.what()
    );
  }
}

}  // namespace stopevents
