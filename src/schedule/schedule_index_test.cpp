#include "schedule/schedule_index.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include "events/test_util/event_gen.h"

namespace stopevents {
namespace {

using ::testing::Optional;

const ServiceDate kDate = Ymd(2024, 2, 7);

// Red splits after JFK into the Ashmont and Braintree branches.
Gtfs RedLine() {
  return GtfsBuilder()
      .Trip("Red", 0, "ash1", {{"park", 1, "08:00:00", "08:00:00"},
                               {"jfk", 2, "08:10:00", "08:11:00"},
                               {"ashmont", 3, "08:20:00", "08:20:00"}})
      .Trip("Red", 0, "brn1", {{"park", 1, "08:06:00", "08:06:00"},
                               {"jfk", 2, "08:16:00", "08:17:00"},
                               {"braintree", 3, "08:40:00", "08:40:00"}})
      .Trip("Red", 0, "ash2", {{"park", 1, "08:12:00", "08:12:00"},
                               {"jfk", 2, "08:22:00", "08:23:00"},
                               {"ashmont", 3, "08:32:00", "08:32:00"}})
      .Trip("Blue", 0, "blue1", {{"wonderland", 1, "08:00:00", "08:00:00"},
                                 {"bowdoin", 2, "08:20:00", "08:20:00"}})
      .Build();
}

std::shared_ptr<const ScheduleIndex> RedIndex() {
  return ScheduleIndex::Build(
      FeedOf(RedLine(), "winter", Ymd(2024, 1, 1), Ymd(2024, 3, 31)), kDate, {}
  );
}

TEST(RoundToTenSecondsTest, HalvesRoundAwayFromZero) {
  EXPECT_EQ(RoundToTenSeconds(754), 750);
  EXPECT_EQ(RoundToTenSeconds(755), 760);
  EXPECT_EQ(RoundToTenSeconds(750), 750);
  EXPECT_EQ(RoundToTenSeconds(-5), -10);
}

TEST(ResolveTrunkTest, UnlistedRouteIsItsOwnTrunk) {
  RouteTrunks trunks = {{"Green-B", "Green"}};
  EXPECT_EQ(ResolveTrunk(trunks, "Green-B"), "Green");
  EXPECT_EQ(ResolveTrunk(trunks, "Red"), "Red");
}

TEST(ScheduleIndexTest, ReferencesCarryOffsetsAndTravelTime) {
  auto index = RedIndex();
  const ScheduleReference* jfk = index->Find("Red", "ash1", "jfk");
  ASSERT_NE(jfk, nullptr);
  EXPECT_EQ(jfk->scheduled_arrival_offset, 600);
  EXPECT_EQ(jfk->scheduled_departure_offset, 660);
  EXPECT_THAT(jfk->scheduled_tt, Optional(600));
  EXPECT_EQ(jfk->branch_id, "Red>ashmont");
  EXPECT_EQ(jfk->active_date, Ymd(2024, 1, 1));
  EXPECT_EQ(jfk->end_date, Ymd(2024, 3, 31));

  const ScheduleReference* first = index->Find("Red", "ash1", "park");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->scheduled_tt, std::nullopt);
}

TEST(ScheduleIndexTest, FindRejectsOtherRoute) {
  auto index = RedIndex();
  EXPECT_EQ(index->Find("Blue", "ash1", "jfk"), nullptr);
  EXPECT_EQ(index->Find("Red", "nope", "jfk"), nullptr);
  EXPECT_EQ(index->Find("Red", "ash1", "braintree"), nullptr);
}

TEST(ScheduleIndexTest, PriorStopIsGreatestSmallerSequence) {
  auto index = RedIndex();
  const ScheduleReference* prior = index->PriorStop("ash1", 3);
  ASSERT_NE(prior, nullptr);
  EXPECT_EQ(prior->stop_id.v, "jfk");
  EXPECT_EQ(index->PriorStop("ash1", 1), nullptr);
  EXPECT_EQ(index->PriorStop("unknown", 3), nullptr);
}

TEST(ScheduleIndexTest, DetectsBranchingTrunks) {
  auto index = RedIndex();
  EXPECT_TRUE(index->IsBranching("Red", 0));
  EXPECT_FALSE(index->IsBranching("Blue", 0));
  EXPECT_FALSE(index->IsBranching("Red", 1));
  EXPECT_EQ(index->BranchOf("brn1"), "Red>braintree");
  EXPECT_EQ(index->BranchOf("unknown"), std::nullopt);
}

TEST(ScheduleIndexTest, BranchHeadwayOnlyCountsSameBranch) {
  auto index = RedIndex();
  // ash1 -> ash2 at park is 12 minutes; brn1 runs in between.
  EXPECT_THAT(index->Find("Red", "ash2", "park")->scheduled_headway_branch,
              Optional(720));
  EXPECT_EQ(index->Find("Red", "ash1", "park")->scheduled_headway_branch,
            std::nullopt);
  EXPECT_EQ(index->Find("Blue", "blue1", "bowdoin")->scheduled_headway_branch,
            std::nullopt);
}

TEST(ScheduleIndexTest, SmoothsTrunkHeadwayPerBucket) {
  auto index = RedIndex();
  // Departures at park: 08:00, 08:06, 08:12 -> headways 360, 360.
  const ScheduleReference* park = index->Find("Red", "ash1", "park");
  EXPECT_THAT(index->ScheduledHeadway(*park, park->departure_time),
              Optional(360));

  // ashmont is served by one branch only, so its bucket carries the branch.
  EXPECT_TRUE(index->headway_buckets().count(HeadwayBucketKey{
      "Red", "Red>ashmont", 0, "ashmont", HeadwayBucketOf(ParseGtfsTime("08:32:00"))
  }));
  const ScheduleReference* ashmont = index->Find("Red", "ash2", "ashmont");
  EXPECT_THAT(index->ScheduledHeadway(*ashmont, ashmont->arrival_time),
              Optional(720));

  // No bucket before the first headway exists.
  EXPECT_EQ(index->ScheduledHeadway(*park, ParseGtfsTime("05:00:00")),
            std::nullopt);
}

TEST(ScheduleIndexTest, AveragesAreRoundedToTenSeconds) {
  Gtfs gtfs = GtfsBuilder()
                  .Trip("Bus-1", 0, "a", {{"s", 1, "07:00:00", "07:00:00"}})
                  .Trip("Bus-1", 0, "b", {{"s", 1, "07:07:33", "07:07:33"}})
                  .Trip("Bus-1", 0, "c", {{"s", 1, "07:20:00", "07:20:00"}})
                  .Build();
  auto index = ScheduleIndex::Build(
      FeedOf(gtfs, "k", Ymd(2024, 1, 1), Ymd(2024, 12, 31)), kDate, {}
  );
  // Headways 453 and 747 average to exactly 600.
  const ScheduleReference* ref = index->Find("Bus-1", "a", "s");
  EXPECT_THAT(index->ScheduledHeadway(*ref, ref->departure_time),
              Optional(600));
}

TEST(ScheduleIndexTest, RouteTrunksMergeBranchRoutes) {
  Gtfs gtfs = GtfsBuilder()
                  .Trip("Green-B", 0, "b1", {{"kenmore", 1, "09:00:00", "09:00:00"},
                                             {"bc", 2, "09:20:00", "09:20:00"}})
                  .Trip("Green-C", 0, "c1", {{"kenmore", 1, "09:04:00", "09:04:00"},
                                             {"clev", 2, "09:24:00", "09:24:00"}})
                  .Build();
  auto index = ScheduleIndex::Build(
      FeedOf(gtfs, "k", Ymd(2024, 1, 1), Ymd(2024, 12, 31)),
      kDate,
      {{"Green-B", "Green"}, {"Green-C", "Green"}}
  );
  EXPECT_TRUE(index->IsBranching("Green", 0));
  EXPECT_EQ(index->Find("Green-C", "c1", "kenmore")->trunk_id, "Green");
  const ScheduleReference* c1 = index->Find("Green-C", "c1", "kenmore");
  EXPECT_THAT(index->ScheduledHeadway(*c1, c1->departure_time), Optional(240));
}

TEST(ScheduleIndexTest, EmptyFeedHasNoRows) {
  auto index = ScheduleIndex::Build(
      ScheduleFeed{"empty", Ymd(2024, 1, 1), Ymd(2024, 12, 31), nullptr},
      kDate,
      {}
  );
  EXPECT_TRUE(index->references().empty());
  EXPECT_EQ(index->feed_key(), "empty");
  EXPECT_EQ(index->service_date(), kDate);
}

TEST(FindScheduleIndexTest, MissingDateIsNull) {
  ScheduleIndexes indexes = IndexesFor(RedLine(), kDate);
  EXPECT_NE(FindScheduleIndex(indexes, kDate), nullptr);
  EXPECT_EQ(FindScheduleIndex(indexes, Ymd(2024, 2, 8)), nullptr);
}

// Departure times of one stop, seconds after 06:00.
rc::Gen<std::vector<int>> GenDepartures() {
  return rc::gen::container<std::vector<int>>(
      rc::gen::inRange(0, 4 * 3600)
  );
}

std::vector<ScheduleReference> ReferencesAt(const std::vector<int>& departures
) {
  std::vector<ScheduleReference> refs;
  for (size_t i = 0; i < departures.size(); ++i) {
    GtfsTimeSinceServiceStart t{6 * 3600 + departures[i]};
    refs.push_back(ScheduleReference{
        .route_id = GtfsRouteId{"Red"},
        .trunk_id = "Red",
        .branch_id = "Red>end",
        .trip_id = GtfsTripId{"t" + std::to_string(i)},
        .stop_id = GtfsStopId{"s"},
        .direction_id = 0,
        .stop_sequence = 1,
        .arrival_time = t,
        .departure_time = t,
        .scheduled_arrival_offset = 0,
        .scheduled_departure_offset = 0,
        .scheduled_tt = std::nullopt,
        .scheduled_headway_branch = std::nullopt,
        .active_date = kDate,
        .end_date = kDate,
    });
  }
  return refs;
}

RC_GTEST_PROP(ScheduledHeadwayProps, BucketValuesAreMultiplesOfTen, ()) {
  std::vector<int> departures = *GenDepartures();
  ScheduledHeadwayTable table =
      BuildScheduledHeadways(ReferencesAt(departures), {});
  for (const auto& [key, value] : table) {
    RC_ASSERT(value % 10 == 0);
    RC_ASSERT(value >= 0);
  }
}

RC_GTEST_PROP(ScheduledHeadwayProps, BuildingTwiceGivesEqualTables, ()) {
  std::vector<int> departures = *GenDepartures();
  std::vector<ScheduleReference> refs = ReferencesAt(departures);
  RC_ASSERT(BuildScheduledHeadways(refs, {}) == BuildScheduledHeadways(refs, {}));
}

}  // namespace
}  // namespace stopevents
