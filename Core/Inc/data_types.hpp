// include/data_types.hpp
#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

// ============================================================
// Geometry
// ============================================================

/**
 * @struct Coordinate
 * @brief Geographic position in decimal degrees
 */
struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @struct BoundingBox
 * @brief Axis-aligned lat/lon rectangle, inclusive on all four edges
 */
struct BoundingBox {
    double min_lat;
    double max_lat;
    double min_lon;
    double max_lon;

    bool Contains(double lat, double lon) const {
        return lat >= min_lat && lat <= max_lat &&
               lon >= min_lon && lon <= max_lon;
    }
};

/**
 * @struct RegionBoundary
 * @brief Named geofence used for region labeling
 */
struct RegionBoundary {
    std::string name;
    BoundingBox box;
};

// Label returned when no region boundary contains a point
constexpr const char* UNKNOWN_REGION = "Unknown";

// ============================================================
// Trip Records
// ============================================================

enum TripType : uint8_t {
    TRIP_WITHIN_REGION = 0,
    TRIP_CROSS_REGION = 1
};

/**
 * @struct RawTripRecord
 * @brief One trip as supplied by the data source
 *
 * Numeric fields that could not be parsed hold NaN (coordinates)
 * or 0 (counts), which validation rejects.
 */
struct RawTripRecord {
    std::string id;
    int vendor_id = 0;
    std::string pickup_datetime;   // "YYYY-MM-DD HH:MM:SS", wall clock
    std::string dropoff_datetime;
    int passenger_count = 0;
    Coordinate pickup{std::numeric_limits<double>::quiet_NaN(),
                      std::numeric_limits<double>::quiet_NaN()};
    Coordinate dropoff{std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::quiet_NaN()};
    char store_and_fwd_flag = 'N';
    int64_t trip_duration = 0;     // seconds
};

/**
 * @struct EnrichedTripRecord
 * @brief Raw record plus derived geospatial/temporal attributes
 */
struct EnrichedTripRecord {
    RawTripRecord raw;

    double distance_km = 0.0;
    double speed_kmh = 0.0;
    double seconds_per_km = 0.0;

    int hour_of_day = -1;   // 0-23, -1 if timestamp unparseable
    int day_of_week = -1;   // 0-6 (Sunday = 0)
    int month = -1;         // 1-12

    std::string pickup_region;
    std::string dropoff_region;
    TripType trip_type = TRIP_WITHIN_REGION;
};

const char* TripTypeName(TripType type);

// ============================================================
// Clustering
// ============================================================

/**
 * @struct FeaturePoint
 * @brief Clustering input: (latitude deg, longitude deg, duration s)
 *
 * A point with any non-finite component is incomplete and never
 * comparable to anything.
 */
struct FeaturePoint {
    Eigen::Vector3d features = Eigen::Vector3d::Zero();
    std::string trip_id;

    FeaturePoint() = default;
    FeaturePoint(double lat, double lon, double duration,
                 std::string id = std::string())
        : features(lat, lon, duration), trip_id(std::move(id)) {}

    double Latitude() const { return features(0); }
    double Longitude() const { return features(1); }
    double Duration() const { return features(2); }

    bool IsComplete() const { return features.allFinite(); }
};

/**
 * @struct TripCluster
 * @brief One non-empty group of the final assignment
 */
struct TripCluster {
    int cluster_id;
    Eigen::Vector3d centroid;
    std::vector<FeaturePoint> members;
};
