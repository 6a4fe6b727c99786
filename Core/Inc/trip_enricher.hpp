// include/trip_enricher.hpp
#pragma once

#include "data_types.hpp"
#include "pipeline_config.hpp"
#include "geo_classifier.hpp"
#include "distance_model.hpp"
#include <vector>
#include <string>
#include <chrono>

/**
 * @struct EnrichmentOutput
 * @brief Output from a batch enrichment pass
 */
struct EnrichmentOutput {
    std::vector<EnrichedTripRecord> records;
    int processed_count = 0;
    int valid_count = 0;
    int invalid_count = 0;
    double processing_time_ms = 0.0;
};

/**
 * @struct EnrichmentStats
 * @brief Counters accumulated across batches
 */
struct EnrichmentStats {
    int processed_count;
    int valid_count;
    int invalid_count;
    double processing_time_ms;
};

/**
 * @struct WallClock
 * @brief Calendar fields read straight from a timestamp string
 */
struct WallClock {
    int year;
    int month;   // 1-12
    int day;     // 1-31
    int hour;    // 0-23
    int minute;
    int second;
    int day_of_week;  // 0-6, Sunday = 0
};

/**
 * @brief Parse "YYYY-MM-DD HH:MM:SS" (or ISO 'T' separator) without any
 *        timezone conversion
 * @return False if the text is not a valid calendar timestamp
 */
bool ParseWallClock(const std::string& text, WallClock& out);

/**
 * @class TripEnricher
 * @brief Record validation and feature derivation
 *
 * Handles:
 * - Coordinate sanity checks against the global rectangle
 * - Duration / passenger / distance range checks
 * - Distance, speed and temporal bucket derivation
 * - Region labeling and trip classification
 */
class TripEnricher {
public:
    TripEnricher();
    explicit TripEnricher(const PipelineConfig& config);
    ~TripEnricher() = default;

    // Classifier holds a reference into config_
    TripEnricher(const TripEnricher&) = delete;
    TripEnricher& operator=(const TripEnricher&) = delete;

    /**
     * @brief Initialize enrichment module
     * @return True if successful
     */
    bool Initialize();

    /**
     * @brief Composite validity check, short-circuits on first failure
     *
     * Never throws.
     */
    bool Validate(const RawTripRecord& record) const;

    /**
     * @brief Derive features for one record
     *
     * Precondition: Validate(record) is true. Derived values for an
     * unvalidated record are unspecified (speed may be infinite or NaN).
     *
     * @throws InvalidInputError if a coordinate is not finite
     */
    EnrichedTripRecord Enrich(const RawTripRecord& record) const;

    /**
     * @brief Validate and enrich a batch, dropping and counting rejects
     * @param raw_records Records from the data source
     * @return Valid enriched records plus processed/valid/invalid counts
     */
    EnrichmentOutput Process(const std::vector<RawTripRecord>& raw_records);

    // Configuration setters
    void SetDurationRange(int64_t min_s, int64_t max_s);
    void SetPassengerRange(int min_count, int max_count);
    void SetDistanceRange(double min_km, double max_km);

    const GeoClassifier& Classifier() const { return classifier_; }
    const DistanceModel& Distance() const { return distance_; }

    // Statistics
    EnrichmentStats GetStatistics() const;

private:
    PipelineConfig config_;
    GeoClassifier classifier_;
    DistanceModel distance_;
    bool initialized_;

    // Statistics tracking
    int processed_count_;
    int valid_count_;
    int invalid_count_;
    double processing_time_ms_;
};
