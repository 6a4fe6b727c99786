// src/trip_enricher.cpp
/**
 * @file trip_enricher.cpp
 * @brief Trip validation & enrichment
 *
 * Responsibilities:
 * - Reject records with bad coordinates, duration, passengers or distance
 * - Compute great-circle distance and average speed
 * - Extract hour / weekday / month from the pickup wall clock
 * - Label pickup/dropoff regions and classify the trip
 */

#include "trip_enricher.hpp"
#include <cmath>
#include <cstdio>
#include <iostream>

namespace {

constexpr int kProgressInterval = 5000;

bool IsLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int DaysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && IsLeapYear(y)) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar
long DaysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

}  // namespace

const char* TripTypeName(TripType type) {
    switch (type) {
        case TRIP_CROSS_REGION:  return "Cross Region";
        case TRIP_WITHIN_REGION: return "Within Region";
    }
    return "Within Region";
}

// ============================================================
// Timestamp Parsing
// ============================================================

bool ParseWallClock(const std::string& text, WallClock& out) {
    WallClock wc{};
    char sep = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                             &wc.year, &wc.month, &wc.day, &sep,
                             &wc.hour, &wc.minute, &wc.second);
    if (fields != 7 || (sep != ' ' && sep != 'T')) {
        return false;
    }
    if (wc.month < 1 || wc.month > 12 ||
        wc.day < 1 || wc.day > DaysInMonth(wc.year, wc.month) ||
        wc.hour < 0 || wc.hour > 23 ||
        wc.minute < 0 || wc.minute > 59 ||
        wc.second < 0 || wc.second > 60) {
        return false;
    }

    // 1970-01-01 was a Thursday
    long days = DaysFromCivil(wc.year, wc.month, wc.day);
    wc.day_of_week = static_cast<int>(((days % 7) + 11) % 7);

    out = wc;
    return true;
}

// ============================================================
// Constructor & Initialization
// ============================================================

TripEnricher::TripEnricher()
    : TripEnricher(DefaultPipelineConfig()) {
}

TripEnricher::TripEnricher(const PipelineConfig& config)
    : config_(config),
      classifier_(config_.geo),
      distance_(config_.distance),
      initialized_(false),
      processed_count_(0),
      valid_count_(0),
      invalid_count_(0),
      processing_time_ms_(0.0) {
}

bool TripEnricher::Initialize() {
    std::cout << "🔧 [TripEnricher] Enrichment initialization...\n";

    const auto& b = config_.geo.bounds;
    const auto& v = config_.validation;
    if (b.min_lat > b.max_lat || b.min_lon > b.max_lon) {
        std::cerr << "❌ [TripEnricher] Global bounds are inverted\n";
        return false;
    }
    if (v.min_duration_s > v.max_duration_s ||
        v.min_passengers > v.max_passengers ||
        v.min_distance_km > v.max_distance_km) {
        std::cerr << "❌ [TripEnricher] Validation range is inverted\n";
        return false;
    }

    initialized_ = true;

    std::cout << "✅ [TripEnricher] Initialized\n";
    std::cout << "   - Bounds: lat [" << b.min_lat << ", " << b.max_lat
              << "], lon [" << b.min_lon << ", " << b.max_lon << "]\n";
    std::cout << "   - Regions (priority order):";
    for (const auto& region : config_.geo.regions) {
        std::cout << " " << region.name << ";";
    }
    std::cout << "\n";
    std::cout << "   - Duration: [" << v.min_duration_s << ", "
              << v.max_duration_s << "] s\n";
    std::cout << "   - Passengers: [" << v.min_passengers << ", "
              << v.max_passengers << "]\n";
    std::cout << "   - Distance: [" << v.min_distance_km << ", "
              << v.max_distance_km << "] km\n\n";

    return true;
}

// ============================================================
// Validation
// ============================================================

bool TripEnricher::Validate(const RawTripRecord& record) const {
    const ValidationConfig& v = config_.validation;

    // 1. Pickup coordinate
    if (!classifier_.IsValidCoordinate(record.pickup.latitude,
                                       record.pickup.longitude)) {
        return false;
    }

    // 2. Dropoff coordinate
    if (!classifier_.IsValidCoordinate(record.dropoff.latitude,
                                       record.dropoff.longitude)) {
        return false;
    }

    // 3. Duration
    if (record.trip_duration < v.min_duration_s ||
        record.trip_duration > v.max_duration_s) {
        return false;
    }

    // 4. Passenger count
    if (record.passenger_count < v.min_passengers ||
        record.passenger_count > v.max_passengers) {
        return false;
    }

    // 5. Distance (both endpoints are finite at this point)
    double distance = distance_.GreatCircleDistanceKm(record.pickup,
                                                      record.dropoff);
    if (distance < v.min_distance_km || distance > v.max_distance_km) {
        return false;
    }

    return true;
}

// ============================================================
// Enrichment
// ============================================================

EnrichedTripRecord TripEnricher::Enrich(const RawTripRecord& record) const {
    EnrichedTripRecord out;
    out.raw = record;

    out.distance_km = distance_.GreatCircleDistanceKm(record.pickup,
                                                      record.dropoff);
    double duration_s = static_cast<double>(record.trip_duration);
    out.speed_kmh = out.distance_km / (duration_s / 3600.0);
    out.seconds_per_km = duration_s / out.distance_km;

    WallClock wc;
    if (ParseWallClock(record.pickup_datetime, wc)) {
        out.hour_of_day = wc.hour;
        out.day_of_week = wc.day_of_week;
        out.month = wc.month;
    }

    out.pickup_region = classifier_.ClassifyRegion(record.pickup.latitude,
                                                   record.pickup.longitude);
    out.dropoff_region = classifier_.ClassifyRegion(record.dropoff.latitude,
                                                    record.dropoff.longitude);

    // Unknown on either side is never cross-region
    if (out.pickup_region != UNKNOWN_REGION &&
        out.dropoff_region != UNKNOWN_REGION &&
        out.pickup_region != out.dropoff_region) {
        out.trip_type = TRIP_CROSS_REGION;
    } else {
        out.trip_type = TRIP_WITHIN_REGION;
    }

    return out;
}

// ============================================================
// Batch Processing
// ============================================================

EnrichmentOutput TripEnricher::Process(
    const std::vector<RawTripRecord>& raw_records) {

    auto start_time = std::chrono::high_resolution_clock::now();

    EnrichmentOutput output;

    if (!initialized_) {
        std::cerr << "❌ [TripEnricher] Process called before Initialize\n";
        return output;
    }

    output.records.reserve(raw_records.size());

    for (const auto& record : raw_records) {
        output.processed_count++;

        if (output.processed_count % kProgressInterval == 0) {
            std::cout << "[TripEnricher] Processed " << output.processed_count
                      << " records...\n";
        }

        if (!Validate(record)) {
            output.invalid_count++;
            continue;
        }

        output.records.push_back(Enrich(record));
        output.valid_count++;
    }

    // ============================================================
    // Statistics
    // ============================================================

    processed_count_ += output.processed_count;
    valid_count_ += output.valid_count;
    invalid_count_ += output.invalid_count;

    auto end_time = std::chrono::high_resolution_clock::now();
    output.processing_time_ms =
        std::chrono::duration<double, std::milli>(
            end_time - start_time).count();
    processing_time_ms_ += output.processing_time_ms;

    std::cout << "[TripEnricher] Batch complete: processed "
              << output.processed_count << ", valid " << output.valid_count
              << ", invalid " << output.invalid_count << "\n";

    return output;
}

// ============================================================
// Configuration Methods
// ============================================================

void TripEnricher::SetDurationRange(int64_t min_s, int64_t max_s) {
    config_.validation.min_duration_s = min_s;
    config_.validation.max_duration_s = max_s;
    std::cout << "[TripEnricher] Duration range updated: [" << min_s << ", "
              << max_s << "] s\n";
}

void TripEnricher::SetPassengerRange(int min_count, int max_count) {
    config_.validation.min_passengers = min_count;
    config_.validation.max_passengers = max_count;
    std::cout << "[TripEnricher] Passenger range updated: [" << min_count
              << ", " << max_count << "]\n";
}

void TripEnricher::SetDistanceRange(double min_km, double max_km) {
    config_.validation.min_distance_km = min_km;
    config_.validation.max_distance_km = max_km;
    std::cout << "[TripEnricher] Distance range updated: [" << min_km
              << ", " << max_km << "] km\n";
}

EnrichmentStats TripEnricher::GetStatistics() const {
    EnrichmentStats stats;
    stats.processed_count = processed_count_;
    stats.valid_count = valid_count_;
    stats.invalid_count = invalid_count_;
    stats.processing_time_ms = processing_time_ms_;
    return stats;
}
