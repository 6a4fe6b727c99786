// include/trip_analyzer.hpp
#pragma once

#include "data_types.hpp"
#include "pipeline_config.hpp"
#include "trip_enricher.hpp"
#include "cluster_engine.hpp"
#include <vector>
#include <string>
#include <memory>
#include <random>

/**
 * @struct AnalyzerMetrics
 * @brief Pipeline counters and timings
 */
struct AnalyzerMetrics {
    int processed_records = 0;
    int valid_records = 0;
    int invalid_records = 0;
    double retention_rate = 0.0;   // valid / processed
    int stored_records = 0;
    int clustering_runs = 0;
    int last_cluster_count = 0;
    int last_iterations = 0;
    double total_enrichment_ms = 0.0;
    double total_clustering_ms = 0.0;
};

/**
 * @class TripAnalyzer
 * @brief Main controller integrating enrichment and clustering
 *
 * Coordinates the pipeline:
 * raw records → TripEnricher → enriched store → sample → ClusterEngine
 *
 * Usage:
 * @code
 * TripAnalyzer analyzer("config/nyc.json");
 * if (!analyzer.Initialize()) return 1;
 *
 * auto batch = TripReader::ReadFile("train.csv");
 * analyzer.Ingest(batch.records);
 *
 * auto result = analyzer.Cluster(5, 10000);
 * for (const auto& c : result.clusters) {
 *     printf("Cluster %d: %zu trips\n", c.cluster_id, c.members.size());
 * }
 * @endcode
 */
class TripAnalyzer {
public:
    /**
     * @brief Constructor
     * @param config_file Path to JSON configuration; empty for defaults
     */
    explicit TripAnalyzer(const std::string& config_file = std::string());

    /**
     * @brief Constructor with an already-built configuration
     */
    explicit TripAnalyzer(const PipelineConfig& config);

    ~TripAnalyzer();

    /**
     * @brief Load configuration and initialize all modules
     * @return True if all modules initialized successfully
     */
    bool Initialize();

    /**
     * @brief Validate, enrich and store a batch of raw records
     * @return Batch result with processed/valid/invalid counts
     */
    EnrichmentOutput Ingest(const std::vector<RawTripRecord>& raw_records);

    /**
     * @brief Enriched records stored so far
     */
    const std::vector<EnrichedTripRecord>& Records() const;

    /**
     * @brief Feature points for clustering
     *
     * Stored records whose pickup region is known, in insertion order,
     * at most ClampSampleSize(limit) of them.
     */
    std::vector<FeaturePoint> SelectClusterSample(int limit = 0) const;

    /**
     * @brief Cluster a sample of the stored records
     * @param k Requested cluster count, clamped to the configured range
     * @param limit Requested sample size, clamped to the configured range
     */
    ClusteringOutput Cluster(int k = 0, int limit = 0);

    AnalyzerMetrics GetMetrics() const;

    const PipelineConfig& Config() const;

    // ============================================================
    // Configuration Methods
    // ============================================================

    void SetSeed(std::mt19937::result_type seed);

    /**
     * @brief Configure clustering module
     * @param max_iterations Iteration budget per run
     * @param threshold Centroid movement below which a run converges
     */
    void SetClusteringParams(int max_iterations, double threshold);

    /**
     * @brief Configure validation ranges
     */
    void SetValidationParams(int64_t min_duration_s, int64_t max_duration_s,
                             double min_distance_km, double max_distance_km);

private:
    std::string config_file_;

    // Implementation (Pimpl pattern for hiding module internals)
    class Impl;
    std::unique_ptr<Impl> impl_;
};
