#include "events/test_util/event_gen.h"

#include <memory>

namespace stopevents {

ServiceDate Ymd(int y, unsigned m, unsigned d) {
  return ServiceDate{std::chrono::year{y}, std::chrono::month{m},
                     std::chrono::day{d}};
}

Instant EasternAt(const ServiceDate& date, const std::string& time) {
  return EasternWallTimeToInstant(date, ParseGtfsTime(time).seconds);
}

GtfsBuilder& GtfsBuilder::Trip(
    const std::string& route_id,
    int direction_id,
    const std::string& trip_id,
    const std::vector<ScheduledStop>& stops
) {
  if (gtfs_.calendar.empty()) {
    GtfsCalendar daily;
    daily.service_id = GtfsServiceId{"daily"};
    daily.weekdays.fill(true);
    daily.start_date = Ymd(2020, 1, 1);
    daily.end_date = Ymd(2030, 12, 31);
    gtfs_.calendar.push_back(daily);
  }

  gtfs_.trips.push_back(GtfsTrip{
      GtfsRouteDirectionId{GtfsRouteId{route_id}, direction_id},
      GtfsTripId{trip_id},
      GtfsServiceId{"daily"}
  });
  for (const auto& stop : stops) {
    gtfs_.stop_times.push_back(GtfsStopTime{
        GtfsTripId{trip_id},
        GtfsStopId{stop.stop_id},
        stop.stop_sequence,
        ParseGtfsTime(stop.arrival),
        ParseGtfsTime(stop.departure)
    });
  }
  return *this;
}

ScheduleFeed FeedOf(
    Gtfs gtfs,
    const std::string& key,
    const ServiceDate& active_date,
    const ServiceDate& end_date
) {
  return ScheduleFeed{
      key, active_date, end_date, std::make_shared<const Gtfs>(std::move(gtfs))
  };
}

ScheduleIndexes IndexesFor(
    const Gtfs& gtfs, const ServiceDate& date, RouteTrunks trunks
) {
  ScheduleIndexes indexes;
  indexes.emplace(
      date,
      ScheduleIndex::Build(
          FeedOf(gtfs, "test", Ymd(2020, 1, 1), Ymd(2030, 12, 31)),
          date,
          trunks
      )
  );
  return indexes;
}

rc::Gen<std::vector<RawMovementRecord>> GenTripRecords(const ServiceDate& date) {
  return rc::gen::exec([date]() {
    const int num_stops = *rc::gen::inRange(1, 9);
    int t = *rc::gen::inRange(5 * 3600, 20 * 3600);
    std::vector<RawMovementRecord> records;
    for (int i = 0; i < num_stops; ++i) {
      bool has_arrival = *rc::gen::arbitrary<bool>();
      bool has_departure = *rc::gen::arbitrary<bool>();
      if (!has_arrival && !has_departure) {
        has_arrival = true;
      }

      RawMovementRecord record;
      record.service_date = date;
      record.route_id = "Red";
      record.trip_id = "trip";
      record.direction_id = 0;
      record.stop_id = "stop" + std::to_string(i);
      record.stop_sequence = (i + 1) * 10;
      record.vehicle_id = "v1";
      record.vehicle_label = "1700";

      if (has_arrival) {
        record.point_kind = PointKind::kArrival;
        record.timestamp = EasternWallTimeToInstant(date, t);
        records.push_back(record);
      }
      t += *rc::gen::inRange(0, 120);
      if (has_departure) {
        record.point_kind = PointKind::kDeparture;
        record.timestamp = EasternWallTimeToInstant(date, t);
        records.push_back(record);
      }
      t += *rc::gen::inRange(30, 600);
    }
    return records;
  });
}

void showValue(const RawMovementRecord& record, std::ostream& os) {
  os << "{" << record.trip_id << " " << record.stop_id << " #"
     << record.stop_sequence.value_or(-1) << " "
     << ToString(record.point_kind) << " @ "
     << FormatEventTime(record.timestamp) << "}";
}

}  // namespace stopevents
