#include <gtest/gtest.h>
#include "trip_statistics.hpp"
#include <string>
#include <vector>

static EnrichedTripRecord makeEnriched(const std::string& region, int hour,
                                       int64_t duration, double distance,
                                       double speed,
                                       const std::string& pickup_time,
                                       double lat = 40.75, double lon = -73.98,
                                       TripType type = TRIP_WITHIN_REGION)
{
    EnrichedTripRecord e;
    e.raw.pickup_datetime = pickup_time;
    e.raw.trip_duration = duration;
    e.raw.pickup = {lat, lon};
    e.distance_km = distance;
    e.speed_kmh = speed;
    e.hour_of_day = hour;
    e.pickup_region = region;
    e.trip_type = type;
    return e;
}

TEST(TripStatistics, SummaryOfEmptySetIsZero)
{
    TripSummary s = TripStatistics::Summarize({});
    EXPECT_EQ(s.total_trips, 0);
    EXPECT_EQ(s.avg_duration_s, 0.0);
    EXPECT_TRUE(s.earliest_pickup.empty());
}

TEST(TripStatistics, SummaryAveragesAndRange)
{
    std::vector<EnrichedTripRecord> records = {
        makeEnriched("Manhattan", 8, 600, 2.0, 12.0, "2016-03-14 08:10:00"),
        makeEnriched("Brooklyn", 9, 1200, 4.0, 12.0, "2016-01-02 09:00:00"),
        makeEnriched("Unknown", 23, 300, 3.0, 36.0, "2016-06-30 23:59:58"),
    };

    TripSummary s = TripStatistics::Summarize(records);
    EXPECT_EQ(s.total_trips, 3);
    EXPECT_DOUBLE_EQ(s.avg_duration_s, 700.0);
    EXPECT_DOUBLE_EQ(s.avg_distance_km, 3.0);
    EXPECT_DOUBLE_EQ(s.avg_speed_kmh, 20.0);
    EXPECT_EQ(s.earliest_pickup, "2016-01-02 09:00:00");
    EXPECT_EQ(s.latest_pickup, "2016-06-30 23:59:58");
}

TEST(TripStatistics, ByRegionSkipsUnknownBusiestFirst)
{
    std::vector<EnrichedTripRecord> records = {
        makeEnriched("Queens", 1, 100, 1.0, 10.0, "t"),
        makeEnriched("Manhattan", 1, 200, 2.0, 10.0, "t"),
        makeEnriched("Manhattan", 1, 400, 4.0, 10.0, "t"),
        makeEnriched("Unknown", 1, 100, 1.0, 10.0, "t"),
        makeEnriched("Unknown", 1, 100, 1.0, 10.0, "t"),
        makeEnriched("Unknown", 1, 100, 1.0, 10.0, "t"),
    };

    auto regions = TripStatistics::ByRegion(records);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].region, "Manhattan");
    EXPECT_EQ(regions[0].trip_count, 2);
    EXPECT_DOUBLE_EQ(regions[0].avg_duration_s, 300.0);
    EXPECT_DOUBLE_EQ(regions[0].avg_distance_km, 3.0);
    EXPECT_EQ(regions[1].region, "Queens");
}

TEST(TripStatistics, ByHourAscending)
{
    std::vector<EnrichedTripRecord> records = {
        makeEnriched("Queens", 17, 100, 1.0, 10.0, "t"),
        makeEnriched("Queens", 3, 300, 1.0, 30.0, "t"),
        makeEnriched("Queens", 17, 300, 1.0, 20.0, "t"),
        makeEnriched("Queens", -1, 300, 1.0, 20.0, "t"),
    };

    auto hours = TripStatistics::ByHour(records);
    ASSERT_EQ(hours.size(), 2u);
    EXPECT_EQ(hours[0].hour_of_day, 3);
    EXPECT_EQ(hours[1].hour_of_day, 17);
    EXPECT_EQ(hours[1].trip_count, 2);
    EXPECT_DOUBLE_EQ(hours[1].avg_duration_s, 200.0);
    EXPECT_DOUBLE_EQ(hours[1].avg_speed_kmh, 15.0);
}

TEST(TripStatistics, HeatmapKeepsDenseCells)
{
    std::vector<EnrichedTripRecord> records;
    // 6 trips in one cell, 5 in another, 7 in a third
    for (int i = 0; i < 6; i++) {
        records.push_back(makeEnriched("Manhattan", 8, 600, 1.0, 10.0, "t",
                                       40.7501, -73.9801));
    }
    for (int i = 0; i < 5; i++) {
        records.push_back(makeEnriched("Manhattan", 8, 600, 1.0, 10.0, "t",
                                       40.7600, -73.9700));
    }
    for (int i = 0; i < 7; i++) {
        records.push_back(makeEnriched("Brooklyn", 9, 300, 1.0, 20.0, "t",
                                       40.6504, -73.9496));
    }

    auto cells = TripStatistics::Heatmap(records);
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0].intensity, 7);
    EXPECT_NEAR(cells[0].lat, 40.650, 1e-9);
    EXPECT_NEAR(cells[0].lon, -73.950, 1e-9);
    EXPECT_DOUBLE_EQ(cells[0].avg_speed_kmh, 20.0);
    EXPECT_EQ(cells[1].intensity, 6);
    EXPECT_NEAR(cells[1].lat, 40.750, 1e-9);

    TripFilter only_manhattan;
    only_manhattan.pickup_region = "Manhattan";
    auto filtered = TripStatistics::Heatmap(records, only_manhattan);
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].intensity, 6);
}

TEST(TripStatistics, FilterCombinesConstraints)
{
    std::vector<EnrichedTripRecord> records = {
        makeEnriched("Manhattan", 8, 600, 1.0, 10.0, "t", 40.75, -73.98, TRIP_CROSS_REGION),
        makeEnriched("Manhattan", 8, 60, 1.0, 10.0, "t"),
        makeEnriched("Manhattan", 9, 600, 1.0, 10.0, "t"),
        makeEnriched("Brooklyn", 8, 600, 1.0, 10.0, "t"),
    };

    TripFilter filter;
    EXPECT_EQ(TripStatistics::Filter(records, filter).size(), 4u);

    filter.pickup_region = "Manhattan";
    EXPECT_EQ(TripStatistics::Filter(records, filter).size(), 3u);

    filter.hour_of_day = 8;
    EXPECT_EQ(TripStatistics::Filter(records, filter).size(), 2u);

    filter.min_duration_s = 100;
    EXPECT_EQ(TripStatistics::Filter(records, filter).size(), 1u);

    filter.trip_type = TRIP_WITHIN_REGION;
    EXPECT_TRUE(TripStatistics::Filter(records, filter).empty());

    TripFilter max_only;
    max_only.max_duration_s = 60;
    EXPECT_EQ(TripStatistics::Filter(records, max_only).size(), 1u);
}
