// include/trip_statistics.hpp
#pragma once

#include "data_types.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @struct TripFilter
 * @brief Optional constraints on enriched records; unset fields match all
 */
struct TripFilter {
    std::optional<std::string> pickup_region;
    std::optional<int> hour_of_day;
    std::optional<int64_t> min_duration_s;
    std::optional<int64_t> max_duration_s;
    std::optional<TripType> trip_type;

    bool Matches(const EnrichedTripRecord& record) const;
};

struct TripSummary {
    int total_trips = 0;
    double avg_duration_s = 0.0;
    double avg_distance_km = 0.0;
    double avg_speed_kmh = 0.0;
    std::string earliest_pickup;
    std::string latest_pickup;
};

struct RegionSummary {
    std::string region;
    int trip_count = 0;
    double avg_duration_s = 0.0;
    double avg_distance_km = 0.0;
};

struct HourSummary {
    int hour_of_day = 0;
    int trip_count = 0;
    double avg_duration_s = 0.0;
    double avg_speed_kmh = 0.0;
};

struct HeatmapCell {
    double lat = 0.0;   // pickup latitude rounded to 3 decimals
    double lon = 0.0;
    int intensity = 0;
    double avg_duration_s = 0.0;
    double avg_speed_kmh = 0.0;
};

/**
 * @class TripStatistics
 * @brief Aggregate views over enriched records
 */
class TripStatistics {
public:
    static constexpr int HEATMAP_MIN_TRIPS = 5;     // cells need more than this
    static constexpr int HEATMAP_MAX_CELLS = 1000;

    static TripSummary Summarize(const std::vector<EnrichedTripRecord>& records);

    /**
     * @brief Per pickup region, Unknown excluded, busiest first
     */
    static std::vector<RegionSummary> ByRegion(
        const std::vector<EnrichedTripRecord>& records);

    /**
     * @brief Per hour of day, ascending; records without an hour skipped
     */
    static std::vector<HourSummary> ByHour(
        const std::vector<EnrichedTripRecord>& records);

    /**
     * @brief Pickup density on a 0.001 degree grid, densest first
     *
     * Cells are keyed by llround(deg * 1000). A coordinate within binary
     * rounding error of a .0005 edge may land in the neighbouring cell
     * compared to decimal ROUND(x, 3).
     */
    static std::vector<HeatmapCell> Heatmap(
        const std::vector<EnrichedTripRecord>& records,
        const TripFilter& filter = TripFilter());

    static std::vector<EnrichedTripRecord> Filter(
        const std::vector<EnrichedTripRecord>& records,
        const TripFilter& filter);
};
