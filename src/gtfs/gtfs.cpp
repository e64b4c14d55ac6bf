#include "gtfs/gtfs.h"

#include <charconv>
#include <csv.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stopevents {

namespace {

// Calls `read_row` for every row of a GTFS table. Any failure, including one
// thrown by `read_row`, is reported against the file.
template <typename ReadRow>
void ReadGtfsTable(const std::string& path, ReadRow read_row) {
  try {
    csv::CSVReader reader(path);
    for (csv::CSVRow& row : reader) {
      read_row(row);
    }
  } catch (const std::exception& e) {
    throw std::runtime_error(
        "Could not open or parse file: " + path + " - " + e.what()
    );
  }
}

std::string Cell(csv::CSVRow& row, const char* column) {
  return row[column].get<std::string>();
}

// Capacity guess from the file size, zero when the size is unknown.
size_t EstimatedRows(const std::string& path, size_t bytes_per_row) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size / bytes_per_row;
}

std::vector<GtfsTrip> LoadTrips(const std::string& path) {
  std::vector<GtfsTrip> trips;
  trips.reserve(EstimatedRows(path, 80));
  ReadGtfsTable(path, [&trips](csv::CSVRow& row) {
    trips.push_back(GtfsTrip{
        GtfsRouteDirectionId{
            GtfsRouteId{Cell(row, "route_id")}, row["direction_id"].get<int>()
        },
        GtfsTripId{Cell(row, "trip_id")},
        GtfsServiceId{Cell(row, "service_id")}
    });
  });
  return trips;
}

std::vector<GtfsStopTime> LoadStopTimes(const std::string& path) {
  std::vector<GtfsStopTime> stop_times;
  stop_times.reserve(EstimatedRows(path, 70));
  ReadGtfsTable(path, [&stop_times](csv::CSVRow& row) {
    auto arrival = row["arrival_time"].get<std::string_view>();
    auto departure = row["departure_time"].get<std::string_view>();
    if (arrival.empty() || departure.empty()) {
      return;
    }
    stop_times.push_back(GtfsStopTime{
        GtfsTripId{Cell(row, "trip_id")},
        GtfsStopId{Cell(row, "stop_id")},
        row["stop_sequence"].get<int>(),
        ParseGtfsTime(arrival),
        ParseGtfsTime(departure)
    });
  });
  return stop_times;
}

std::vector<GtfsCalendar> LoadCalendar(const std::string& path) {
  static constexpr std::array<const char*, 7> kDayColumns = {
      "sunday",
      "monday",
      "tuesday",
      "wednesday",
      "thursday",
      "friday",
      "saturday",
  };
  std::vector<GtfsCalendar> calendar;
  ReadGtfsTable(path, [&calendar](csv::CSVRow& row) {
    GtfsCalendar& entry = calendar.emplace_back();
    entry.service_id = GtfsServiceId{Cell(row, "service_id")};
    for (size_t day = 0; day < kDayColumns.size(); ++day) {
      entry.weekdays[day] = Cell(row, kDayColumns[day]) == "1";
    }
    entry.start_date = ParseServiceDate(Cell(row, "start_date"));
    entry.end_date = ParseServiceDate(Cell(row, "end_date"));
  });
  return calendar;
}

std::vector<GtfsCalendarDate> LoadCalendarDates(const std::string& path) {
  std::vector<GtfsCalendarDate> calendar_dates;
  ReadGtfsTable(path, [&calendar_dates](csv::CSVRow& row) {
    int exception_type = row["exception_type"].get<int>();
    if (exception_type != 1 && exception_type != 2) {
      throw std::runtime_error(
          "unknown exception_type " + std::to_string(exception_type)
      );
    }
    calendar_dates.push_back(GtfsCalendarDate{
        GtfsServiceId{Cell(row, "service_id")},
        ParseServiceDate(Cell(row, "date")),
        static_cast<GtfsExceptionType>(exception_type)
    });
  });
  return calendar_dates;
}

std::ofstream OpenForWriting(const std::string& path) {
  std::ofstream file(path);
  if (!file) {
    throw std::runtime_error("Could not open file for writing: " + path);
  }
  return file;
}

}  // namespace

bool GtfsCalendar::RunsOn(const ServiceDate& date) const {
  if (date < start_date || end_date < date) {
    return false;
  }
  std::chrono::weekday day{std::chrono::sys_days{date}};
  return weekdays[day.c_encoding()];
}

GtfsTimeSinceServiceStart ParseGtfsTime(std::string_view time_str) {
  int fields[3];
  size_t pos = 0;
  for (int i = 0; i < 3; ++i) {
    size_t end = i < 2 ? time_str.find(':', pos) : time_str.size();
    if (end == std::string_view::npos) {
      throw std::runtime_error(
          "Invalid time format: " + std::string(time_str)
      );
    }
    std::string_view field = time_str.substr(pos, end - pos);
    // Hours may be one digit or run past 99 for multi-day trips; minutes and
    // seconds are always two digits.
    bool width_ok = i == 0 ? !field.empty() && field.size() <= 3
                           : field.size() == 2;
    auto [ptr, ec] =
        std::from_chars(field.data(), field.data() + field.size(), fields[i]);
    if (!width_ok || ec != std::errc() ||
        ptr != field.data() + field.size() || fields[i] < 0) {
      throw std::runtime_error(
          "Invalid time format - non-digit characters: " +
          std::string(time_str)
      );
    }
    pos = end + 1;
  }
  return GtfsTimeSinceServiceStart{
      fields[0] * 3600 + fields[1] * 60 + fields[2]
  };
}

std::string FormatGtfsTime(const GtfsTimeSinceServiceStart& time) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << time.seconds / 3600 << ":"
      << std::setw(2) << (time.seconds % 3600) / 60 << ":" << std::setw(2)
      << time.seconds % 60;
  return oss.str();
}

Gtfs GtfsLoad(const std::string& gtfs_directory_path) {
  const std::string calendar_path = gtfs_directory_path + "/calendar.txt";
  const std::string calendar_dates_path =
      gtfs_directory_path + "/calendar_dates.txt";
  const bool has_calendar = std::filesystem::exists(calendar_path);
  const bool has_calendar_dates = std::filesystem::exists(calendar_dates_path);
  if (!has_calendar && !has_calendar_dates) {
    throw std::runtime_error(
        "GTFS directory has neither calendar.txt nor calendar_dates.txt: " +
        gtfs_directory_path
    );
  }

  Gtfs gtfs;
  gtfs.trips = LoadTrips(gtfs_directory_path + "/trips.txt");
  gtfs.stop_times = LoadStopTimes(gtfs_directory_path + "/stop_times.txt");
  if (has_calendar) {
    gtfs.calendar = LoadCalendar(calendar_path);
  }
  if (has_calendar_dates) {
    gtfs.calendar_dates = LoadCalendarDates(calendar_dates_path);
  }
  return gtfs;
}

void GtfsSave(const Gtfs& gtfs, const std::string& gtfs_directory_path) {
  std::filesystem::create_directories(gtfs_directory_path);

  std::ofstream trips = OpenForWriting(gtfs_directory_path + "/trips.txt");
  trips << "route_id,direction_id,trip_id,service_id\n";
  for (const auto& trip : gtfs.trips) {
    trips << trip.route_direction_id.route_id.v << ","
          << trip.route_direction_id.direction_id << "," << trip.trip_id.v
          << "," << trip.service_id.v << "\n";
  }

  std::ofstream stop_times =
      OpenForWriting(gtfs_directory_path + "/stop_times.txt");
  stop_times << "trip_id,stop_id,stop_sequence,arrival_time,departure_time\n";
  for (const auto& st : gtfs.stop_times) {
    stop_times << st.trip_id.v << "," << st.stop_id.v << ","
               << st.stop_sequence << "," << FormatGtfsTime(st.arrival_time)
               << "," << FormatGtfsTime(st.departure_time) << "\n";
  }

  // Always written, possibly empty, so that GtfsLoad accepts the directory.
  std::ofstream calendar =
      OpenForWriting(gtfs_directory_path + "/calendar.txt");
  calendar << "service_id,sunday,monday,tuesday,wednesday,thursday,friday,"
              "saturday,start_date,end_date\n";
  for (const auto& entry : gtfs.calendar) {
    calendar << entry.service_id.v;
    for (bool runs : entry.weekdays) {
      calendar << "," << (runs ? 1 : 0);
    }
    calendar << "," << FormatDateInt(entry.start_date) << ","
             << FormatDateInt(entry.end_date) << "\n";
  }

  if (!gtfs.calendar_dates.empty()) {
    std::ofstream calendar_dates =
        OpenForWriting(gtfs_directory_path + "/calendar_dates.txt");
    calendar_dates << "service_id,date,exception_type\n";
    for (const auto& cd : gtfs.calendar_dates) {
      calendar_dates << cd.service_id.v << "," << FormatDateInt(cd.date) << ","
                     << static_cast<int>(cd.exception_type) << "\n";
    }
  }
}

std::unordered_set<std::string> GtfsActiveServices(
    const Gtfs& gtfs, const ServiceDate& date
) {
  std::unordered_set<std::string> active;
  for (const auto& entry : gtfs.calendar) {
    if (entry.RunsOn(date)) {
      active.insert(entry.service_id.v);
    }
  }
  for (const auto& exception : gtfs.calendar_dates) {
    if (exception.date != date) {
      continue;
    }
    if (exception.exception_type == GtfsExceptionType::kAdded) {
      active.insert(exception.service_id.v);
    } else {
      active.erase(exception.service_id.v);
    }
  }
  return active;
}

GtfsDay GtfsFilterByDate(const Gtfs& gtfs, const ServiceDate& date) {
  const std::unordered_set<std::string> services =
      GtfsActiveServices(gtfs, date);

  GtfsDay day;
  std::unordered_set<GtfsTripId> trip_ids;
  for (const auto& trip : gtfs.trips) {
    if (services.count(trip.service_id.v)) {
      day.trips.push_back(trip);
      trip_ids.insert(trip.trip_id);
    }
  }
  for (const auto& stop_time : gtfs.stop_times) {
    if (trip_ids.count(stop_time.trip_id)) {
      day.stop_times.push_back(stop_time);
    }
  }
  return day;
}

}  // namespace stopevents
