// src/trip_statistics.cpp
/**
 * @file trip_statistics.cpp
 * @brief Summary, per-region, per-hour and heatmap aggregation
 */

#include "trip_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <iterator>
#include <utility>

namespace {

// Running sums for one group
struct Accumulator {
    int count = 0;
    double duration_sum = 0.0;
    double distance_sum = 0.0;
    double speed_sum = 0.0;

    void Add(const EnrichedTripRecord& r) {
        count++;
        duration_sum += static_cast<double>(r.raw.trip_duration);
        distance_sum += r.distance_km;
        speed_sum += r.speed_kmh;
    }
};

// Grid key in thousandths of a degree
long long GridIndex(double deg) {
    return static_cast<long long>(std::llround(deg * 1000.0));
}

}  // namespace

// ============================================================
// Filtering
// ============================================================

bool TripFilter::Matches(const EnrichedTripRecord& record) const {
    if (pickup_region && record.pickup_region != *pickup_region) {
        return false;
    }
    if (hour_of_day && record.hour_of_day != *hour_of_day) {
        return false;
    }
    if (min_duration_s && record.raw.trip_duration < *min_duration_s) {
        return false;
    }
    if (max_duration_s && record.raw.trip_duration > *max_duration_s) {
        return false;
    }
    if (trip_type && record.trip_type != *trip_type) {
        return false;
    }
    return true;
}

std::vector<EnrichedTripRecord> TripStatistics::Filter(
    const std::vector<EnrichedTripRecord>& records,
    const TripFilter& filter) {

    std::vector<EnrichedTripRecord> out;
    std::copy_if(records.begin(), records.end(), std::back_inserter(out),
                 [&filter](const EnrichedTripRecord& r) {
                     return filter.Matches(r);
                 });
    return out;
}

// ============================================================
// Aggregates
// ============================================================

TripSummary TripStatistics::Summarize(
    const std::vector<EnrichedTripRecord>& records) {

    TripSummary summary;
    Accumulator acc;

    for (const auto& r : records) {
        acc.Add(r);
        // "YYYY-MM-DD HH:MM:SS" orders lexicographically
        const std::string& ts = r.raw.pickup_datetime;
        if (summary.earliest_pickup.empty() || ts < summary.earliest_pickup) {
            summary.earliest_pickup = ts;
        }
        if (summary.latest_pickup.empty() || ts > summary.latest_pickup) {
            summary.latest_pickup = ts;
        }
    }

    summary.total_trips = acc.count;
    if (acc.count > 0) {
        summary.avg_duration_s = acc.duration_sum / acc.count;
        summary.avg_distance_km = acc.distance_sum / acc.count;
        summary.avg_speed_kmh = acc.speed_sum / acc.count;
    }
    return summary;
}

std::vector<RegionSummary> TripStatistics::ByRegion(
    const std::vector<EnrichedTripRecord>& records) {

    std::map<std::string, Accumulator> groups;
    for (const auto& r : records) {
        if (r.pickup_region == UNKNOWN_REGION) {
            continue;
        }
        groups[r.pickup_region].Add(r);
    }

    std::vector<RegionSummary> out;
    out.reserve(groups.size());
    for (const auto& [region, acc] : groups) {
        RegionSummary s;
        s.region = region;
        s.trip_count = acc.count;
        s.avg_duration_s = acc.duration_sum / acc.count;
        s.avg_distance_km = acc.distance_sum / acc.count;
        out.push_back(s);
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const RegionSummary& a, const RegionSummary& b) {
                         return a.trip_count > b.trip_count;
                     });
    return out;
}

std::vector<HourSummary> TripStatistics::ByHour(
    const std::vector<EnrichedTripRecord>& records) {

    std::map<int, Accumulator> groups;
    for (const auto& r : records) {
        if (r.hour_of_day < 0) {
            continue;
        }
        groups[r.hour_of_day].Add(r);
    }

    std::vector<HourSummary> out;
    out.reserve(groups.size());
    for (const auto& [hour, acc] : groups) {
        HourSummary s;
        s.hour_of_day = hour;
        s.trip_count = acc.count;
        s.avg_duration_s = acc.duration_sum / acc.count;
        s.avg_speed_kmh = acc.speed_sum / acc.count;
        out.push_back(s);
    }
    return out;
}

std::vector<HeatmapCell> TripStatistics::Heatmap(
    const std::vector<EnrichedTripRecord>& records,
    const TripFilter& filter) {

    std::map<std::pair<long long, long long>, Accumulator> grid;
    for (const auto& r : records) {
        if (!filter.Matches(r)) {
            continue;
        }
        grid[{GridIndex(r.raw.pickup.latitude),
              GridIndex(r.raw.pickup.longitude)}].Add(r);
    }

    std::vector<HeatmapCell> cells;
    for (const auto& [key, acc] : grid) {
        if (acc.count <= HEATMAP_MIN_TRIPS) {
            continue;
        }
        HeatmapCell cell;
        cell.lat = key.first / 1000.0;
        cell.lon = key.second / 1000.0;
        cell.intensity = acc.count;
        cell.avg_duration_s = acc.duration_sum / acc.count;
        cell.avg_speed_kmh = acc.speed_sum / acc.count;
        cells.push_back(cell);
    }

    std::stable_sort(cells.begin(), cells.end(),
                     [](const HeatmapCell& a, const HeatmapCell& b) {
                         return a.intensity > b.intensity;
                     });
    if (cells.size() > static_cast<size_t>(HEATMAP_MAX_CELLS)) {
        cells.resize(HEATMAP_MAX_CELLS);
    }
    return cells;
}
