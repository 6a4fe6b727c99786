#include <gtest/gtest.h>
#include "distance_model.hpp"
#include <cmath>
#include <limits>

TEST(GreatCircle, SamePointIsZero)
{
    DistanceModel model;
    EXPECT_EQ(model.GreatCircleDistanceKm(40.75, -73.98, 40.75, -73.98), 0.0);
    EXPECT_EQ(model.GreatCircleDistanceKm(-33.9, 151.2, -33.9, 151.2), 0.0);
}

TEST(GreatCircle, IsSymmetric)
{
    DistanceModel model;
    double ab = model.GreatCircleDistanceKm(40.75, -73.98, 40.65, -73.78);
    double ba = model.GreatCircleDistanceKm(40.65, -73.78, 40.75, -73.98);
    EXPECT_DOUBLE_EQ(ab, ba);
    EXPECT_GT(ab, 0.0);
}

TEST(GreatCircle, OneDegreeOfLatitude)
{
    DistanceModel model;
    // 6371 * pi / 180
    EXPECT_NEAR(model.GreatCircleDistanceKm(0.0, 10.0, 1.0, 10.0), 111.195, 0.001);
}

TEST(GreatCircle, MonotonicInSeparation)
{
    DistanceModel model;
    double near = model.GreatCircleDistanceKm(40.70, -73.95, 40.71, -73.95);
    double mid = model.GreatCircleDistanceKm(40.70, -73.95, 40.75, -73.95);
    double far = model.GreatCircleDistanceKm(40.70, -73.95, 40.90, -73.95);
    EXPECT_LT(near, mid);
    EXPECT_LT(mid, far);
}

TEST(GreatCircle, AntipodesStayFinite)
{
    DistanceModel model;
    double d = model.GreatCircleDistanceKm(0.0, 0.0, 0.0, 180.0);
    EXPECT_NEAR(d, 6371.0 * M_PI, 1e-6);
}

TEST(GreatCircle, NonFiniteThrows)
{
    DistanceModel model;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(model.GreatCircleDistanceKm(nan, 0.0, 1.0, 1.0), InvalidInputError);
    EXPECT_THROW(model.GreatCircleDistanceKm(1.0, inf, 1.0, 1.0), InvalidInputError);
    EXPECT_THROW(model.GreatCircleDistanceKm(1.0, 1.0, -inf, 1.0), InvalidInputError);
    EXPECT_THROW(model.GreatCircleDistanceKm(1.0, 1.0, 1.0, nan), std::invalid_argument);
}

TEST(GreatCircle, UsesConfiguredRadius)
{
    DistanceConfig config;
    config.earth_radius_km = 1.0;
    DistanceModel model(config);
    EXPECT_NEAR(model.GreatCircleDistanceKm(0.0, 0.0, 0.0, 90.0), M_PI / 2.0, 1e-12);
}

TEST(FeatureDistance, IdenticalPointsAreZero)
{
    DistanceModel model;
    FeaturePoint a(40.70, -73.95, 300);
    FeaturePoint b(40.70, -73.95, 300);

    auto d = model.FeatureDistance(a, b);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(*d, 0.0);
}

TEST(FeatureDistance, DurationIsScaled)
{
    DistanceModel model;
    auto d = model.FeatureDistance(FeaturePoint(40.0, -73.0, 0.0),
                                   FeaturePoint(40.0, -73.0, 1000.0));
    ASSERT_TRUE(d.has_value());
    EXPECT_DOUBLE_EQ(*d, 1.0);
}

TEST(FeatureDistance, CombinesAllAxes)
{
    DistanceModel model;
    // lat 0.3, lon 0.4, duration 1200 s -> 1.2 units
    auto d = model.FeatureDistance(FeaturePoint(40.0, -73.0, 100.0),
                                   FeaturePoint(40.3, -72.6, 1300.0));
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(*d, std::sqrt(0.09 + 0.16 + 1.44), 1e-12);
}

TEST(FeatureDistance, IncompletePointIsIncomparable)
{
    DistanceModel model;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    FeaturePoint good(40.7, -73.9, 600.0);
    FeaturePoint missing(40.7, nan, 600.0);

    EXPECT_FALSE(model.FeatureDistance(good, missing).has_value());
    EXPECT_FALSE(model.FeatureDistance(missing, good).has_value());
    EXPECT_FALSE(missing.IsComplete());
    EXPECT_TRUE(good.IsComplete());
}
