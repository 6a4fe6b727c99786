#include <gtest/gtest.h>
#include "trip_analyzer.hpp"
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

static RawTripRecord makeTrip(const std::string& id, double plat, double plon,
                              double dlat, double dlon, int64_t duration)
{
    RawTripRecord r;
    r.id = id;
    r.pickup_datetime = "2016-03-14 17:24:55";
    r.passenger_count = 1;
    r.pickup = {plat, plon};
    r.dropoff = {dlat, dlon};
    r.trip_duration = duration;
    return r;
}

// 12 Manhattan pickups, 3 Unknown pickups, 2 invalid records
static std::vector<RawTripRecord> sampleBatch()
{
    std::vector<RawTripRecord> batch;
    for (int i = 0; i < 12; i++) {
        batch.push_back(makeTrip("m" + std::to_string(i), 40.75 + 0.001 * i, -73.98,
                                 40.65, -73.95, 600 + 60 * i));
    }
    for (int i = 0; i < 3; i++) {
        batch.push_back(makeTrip("u" + std::to_string(i), 40.48, -74.25 + 0.001 * i,
                                 40.75, -73.98, 1800));
    }
    batch.push_back(makeTrip("bad0", 0.0, 0.0, 40.75, -73.98, 600));
    batch.push_back(makeTrip("bad1", 40.75, -73.98, 40.76, -73.97, 5));
    return batch;
}

TEST(TripAnalyzer, DefaultsInitialize)
{
    TripAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Initialize());
    EXPECT_EQ(analyzer.Config().geo.regions.size(), 5u);
}

TEST(TripAnalyzer, MissingConfigFileFailsInitialize)
{
    TripAnalyzer analyzer("/nonexistent/config.json");
    EXPECT_FALSE(analyzer.Initialize());
}

TEST(TripAnalyzer, LoadsConfigFile)
{
    std::string path = ::testing::TempDir() + "trip_analyzer_config.json";
    {
        std::ofstream out(path);
        out << R"({"clustering": {"max_k": 3, "min_sample_size": 2}})";
    }

    TripAnalyzer analyzer(path);
    ASSERT_TRUE(analyzer.Initialize());
    EXPECT_EQ(analyzer.Config().clustering.max_k, 3);
    std::remove(path.c_str());
}

TEST(TripAnalyzer, IngestCountsAndStores)
{
    TripAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Initialize());

    EnrichmentOutput out = analyzer.Ingest(sampleBatch());
    EXPECT_EQ(out.processed_count, 17);
    EXPECT_EQ(out.valid_count, 15);
    EXPECT_EQ(out.invalid_count, 2);
    EXPECT_EQ(analyzer.Records().size(), 15u);

    AnalyzerMetrics metrics = analyzer.GetMetrics();
    EXPECT_EQ(metrics.processed_records, 17);
    EXPECT_EQ(metrics.stored_records, 15);
    EXPECT_NEAR(metrics.retention_rate, 15.0 / 17.0, 1e-12);
}

TEST(TripAnalyzer, SampleSkipsUnknownPickups)
{
    TripAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Initialize());
    analyzer.Ingest(sampleBatch());

    auto sample = analyzer.SelectClusterSample();
    ASSERT_EQ(sample.size(), 12u);
    for (const auto& p : sample) {
        EXPECT_EQ(p.trip_id[0], 'm');
    }
    EXPECT_DOUBLE_EQ(sample[0].Latitude(), 40.75);
    EXPECT_DOUBLE_EQ(sample[0].Duration(), 600.0);

    // Requested 3 is clamped up to the minimum of 10
    EXPECT_EQ(analyzer.SelectClusterSample(3).size(), 10u);
}

TEST(TripAnalyzer, ClusterClampsK)
{
    TripAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Initialize());
    analyzer.SetSeed(7);

    // 30 distinct Manhattan pickups: k=100 unclamped would be degenerate
    std::vector<RawTripRecord> batch;
    for (int i = 0; i < 30; i++) {
        batch.push_back(makeTrip("m" + std::to_string(i), 40.71 + 0.003 * i,
                                 -73.98 + 0.001 * (i % 7), 40.65, -73.95,
                                 300 + 90 * i));
    }
    analyzer.Ingest(batch);
    ASSERT_EQ(analyzer.Records().size(), 30u);

    ClusteringOutput out = analyzer.Cluster(100);
    EXPECT_EQ(out.total_points, 30);
    EXPECT_NE(out.termination, TERMINATION_DEGENERATE);
    EXPECT_GT(out.cluster_count, 1);
    EXPECT_LE(out.cluster_count, 20);

    size_t members = 0;
    for (const auto& c : out.clusters) {
        members += c.members.size();
    }
    EXPECT_EQ(members, 30u);
    EXPECT_EQ(analyzer.GetMetrics().clustering_runs, 1);
}

TEST(TripAnalyzer, ClusterWithNoRecordsIsEmpty)
{
    TripAnalyzer analyzer;
    ASSERT_TRUE(analyzer.Initialize());

    ClusteringOutput out = analyzer.Cluster(5);
    EXPECT_TRUE(out.clusters.empty());
    EXPECT_EQ(out.total_points, 0);
    EXPECT_EQ(out.termination, TERMINATION_EMPTY_INPUT);
}

TEST(TripAnalyzer, NothingHappensBeforeInitialize)
{
    TripAnalyzer analyzer;
    EnrichmentOutput out = analyzer.Ingest(sampleBatch());
    EXPECT_EQ(out.processed_count, 0);
    EXPECT_TRUE(analyzer.Records().empty());
    EXPECT_TRUE(analyzer.Cluster(3).clusters.empty());
}
