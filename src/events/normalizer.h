#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "events/event.h"
#include "log.h"
#include "util/date.h"

namespace stopevents {

// Historic rail files switch to the newer column set on this date.
inline constexpr ServiceDate kRailSyncSequenceCutover{
    std::chrono::year{2024}, std::chrono::January, std::chrono::day{1}
};

// Historic bus timestamps are Eastern wall time before this date and UTC
// from it on. The direction column is renamed at the same time.
inline constexpr ServiceDate kBusUtcCutover{
    std::chrono::year{2024}, std::chrono::June, std::chrono::day{1}
};

// Before this date the real-time feed also carries non-revenue trips, whose
// ids start with "NONREV-". From it on those ids are revenue service.
inline constexpr ServiceDate kRevenueOnlyFeedCutover{
    std::chrono::year{2023}, std::chrono::December, std::chrono::day{1}
};

// An explicit mapping from canonical field names to the column names of one
// source era.
struct SchemaVariant {
  std::string_view name;
  SourceKind kind;
  std::map<std::string_view, std::string_view> required;
  std::map<std::string_view, std::string_view> optional;

  // Source column for a canonical field; throws for unmapped fields.
  const std::string_view& Column(std::string_view field) const;
};

// Pure function of (kind, service_date). Never looks at the data.
const SchemaVariant& SelectSchemaVariant(
    SourceKind kind, const ServiceDate& service_date
);

// Throws SchemaMismatchError naming the variant and the first missing
// required column.
void CheckSchema(
    const SchemaVariant& variant, const std::vector<std::string>& header
);

struct NormalizeOptions {
  // Bus routes to keep, after leading zeros are stripped. Empty keeps all.
  std::vector<std::string> routes;
  // Inclusive service date window for ferry rows.
  std::optional<ServiceDate> start_date;
  std::optional<ServiceDate> end_date;
};

// Converts one raw source (CSV with a header row) into canonical records in
// input order. `service_date` selects the schema variant and stands in for
// rows without their own service date. Rows that are deliberately dropped
// (non-revenue trips, rows without a stop, unknown event kinds, ...) are
// counted in `summary.filtered_records`.
std::vector<RawMovementRecord> NormalizeText(
    std::string_view csv_text,
    SourceKind kind,
    const ServiceDate& service_date,
    const NormalizeOptions& options,
    FaultSummary& summary,
    const TextLogger& log
);

std::vector<RawMovementRecord> NormalizeFile(
    const std::string& path,
    SourceKind kind,
    const ServiceDate& service_date,
    const NormalizeOptions& options,
    FaultSummary& summary,
    const TextLogger& log
);

// "01" -> "1"; a route made only of zeros keeps one.
std::string StripLeadingZeros(std::string_view route_id);

// Bus timepoint time "1900-01-0X HH:MM:SS" (optionally with 'T' and a
// trailing 'Z') as seconds after midnight of the service date; X-1 is a day
// offset.
int ParseBusTimepointSeconds(std::string_view text);

}  // namespace stopevents
