// src/trip_analyzer.cpp
/**
 * @file trip_analyzer.cpp
 * @brief Main TripAnalyzer - Integrated pipeline controller
 *
 * Coordinates both stages:
 * - Loads configuration
 * - Routes raw records through validation and enrichment
 * - Selects clustering samples and runs K-means
 * - Provides pipeline metrics
 */

#include "trip_analyzer.hpp"
#include <iostream>
#include <chrono>

// ============================================================
// Implementation Class
// ============================================================

class TripAnalyzer::Impl {
public:
    PipelineConfig config;
    bool has_config = false;

    std::unique_ptr<TripEnricher> enricher;
    std::unique_ptr<ClusterEngine> engine;

    std::vector<EnrichedTripRecord> records;

    bool initialized = false;

    // Performance monitoring
    double total_enrichment_ms = 0;
    double total_clustering_ms = 0;
    int clustering_runs = 0;
};

// ============================================================
// Constructor & Destructor
// ============================================================

TripAnalyzer::TripAnalyzer(const std::string& config_file)
    : config_file_(config_file),
      impl_(std::make_unique<Impl>()) {
}

TripAnalyzer::TripAnalyzer(const PipelineConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->has_config = true;
}

TripAnalyzer::~TripAnalyzer() = default;

// ============================================================
// Initialization
// ============================================================

bool TripAnalyzer::Initialize() {
    std::cout << "\n";
    std::cout << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║  TripAnalyzer Pipeline Initialization                      ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n";

    try {
        if (!impl_->has_config) {
            if (config_file_.empty()) {
                std::cout << "ℹ️  No configuration file, using NYC defaults\n";
                impl_->config = DefaultPipelineConfig();
            } else {
                std::cout << "📄 Loading configuration: " << config_file_ << "\n";
                impl_->config = LoadPipelineConfig(config_file_);
            }
            impl_->has_config = true;
        }

        impl_->enricher = std::make_unique<TripEnricher>(impl_->config);
        if (!impl_->enricher->Initialize()) {
            return false;
        }

        impl_->engine = std::make_unique<ClusterEngine>(impl_->config);
        if (!impl_->engine->Initialize()) {
            return false;
        }

        impl_->initialized = true;

        std::cout << "╔════════════════════════════════════════════════════════════╗\n";
        std::cout << "║  ✅ All modules initialized successfully                   ║\n";
        std::cout << "╚════════════════════════════════════════════════════════════╝\n";

        return true;
    } catch (const std::exception& e) {
        std::cerr << "❌ Initialization failed: " << e.what() << "\n";
        return false;
    }
}

// ============================================================
// Enrichment Stage
// ============================================================

EnrichmentOutput TripAnalyzer::Ingest(
    const std::vector<RawTripRecord>& raw_records) {

    if (!impl_->initialized) {
        std::cerr << "❌ Pipeline not initialized\n";
        return EnrichmentOutput();
    }

    EnrichmentOutput output = impl_->enricher->Process(raw_records);
    impl_->total_enrichment_ms += output.processing_time_ms;

    impl_->records.insert(impl_->records.end(),
                          output.records.begin(), output.records.end());
    return output;
}

const std::vector<EnrichedTripRecord>& TripAnalyzer::Records() const {
    return impl_->records;
}

// ============================================================
// Clustering Stage
// ============================================================

std::vector<FeaturePoint> TripAnalyzer::SelectClusterSample(int limit) const {
    const size_t cap = static_cast<size_t>(
        ClampSampleSize(impl_->config.clustering, limit));

    std::vector<FeaturePoint> sample;
    for (const auto& r : impl_->records) {
        if (sample.size() >= cap) {
            break;
        }
        if (r.pickup_region == UNKNOWN_REGION) {
            continue;
        }
        sample.emplace_back(r.raw.pickup.latitude, r.raw.pickup.longitude,
                            static_cast<double>(r.raw.trip_duration),
                            r.raw.id);
    }
    return sample;
}

ClusteringOutput TripAnalyzer::Cluster(int k, int limit) {
    if (!impl_->initialized) {
        std::cerr << "❌ Pipeline not initialized\n";
        return ClusteringOutput();
    }

    const int k_value = ClampClusterCount(impl_->config.clustering, k);
    std::vector<FeaturePoint> sample = SelectClusterSample(limit);

    ClusteringOutput output = impl_->engine->Process(sample, k_value);
    impl_->total_clustering_ms += output.processing_time_ms;
    impl_->clustering_runs++;

    std::cout << "[TripAnalyzer] Generated " << output.cluster_count
              << " clusters from " << output.total_points << " trips ("
              << ClusterTerminationName(output.termination) << ", "
              << output.iterations << " iterations)\n";

    return output;
}

// ============================================================
// Metrics
// ============================================================

AnalyzerMetrics TripAnalyzer::GetMetrics() const {
    AnalyzerMetrics metrics;

    if (impl_->enricher) {
        auto stats = impl_->enricher->GetStatistics();
        metrics.processed_records = stats.processed_count;
        metrics.valid_records = stats.valid_count;
        metrics.invalid_records = stats.invalid_count;
        if (stats.processed_count > 0) {
            metrics.retention_rate =
                static_cast<double>(stats.valid_count) / stats.processed_count;
        }
    }

    if (impl_->engine) {
        auto stats = impl_->engine->GetStatistics();
        metrics.last_cluster_count = stats.cluster_count;
        metrics.last_iterations = stats.iterations;
    }

    metrics.stored_records = static_cast<int>(impl_->records.size());
    metrics.clustering_runs = impl_->clustering_runs;
    metrics.total_enrichment_ms = impl_->total_enrichment_ms;
    metrics.total_clustering_ms = impl_->total_clustering_ms;

    return metrics;
}

const PipelineConfig& TripAnalyzer::Config() const {
    return impl_->config;
}

// ============================================================
// Configuration
// ============================================================

void TripAnalyzer::SetSeed(std::mt19937::result_type seed) {
    if (impl_->engine) {
        impl_->engine->SetSeed(seed);
    }
}

void TripAnalyzer::SetClusteringParams(int max_iterations, double threshold) {
    if (impl_->engine) {
        impl_->engine->SetMaxIterations(max_iterations);
        impl_->engine->SetConvergenceThreshold(threshold);
    }
}

void TripAnalyzer::SetValidationParams(int64_t min_duration_s,
                                       int64_t max_duration_s,
                                       double min_distance_km,
                                       double max_distance_km) {
    if (impl_->enricher) {
        impl_->enricher->SetDurationRange(min_duration_s, max_duration_s);
        impl_->enricher->SetDistanceRange(min_distance_km, max_distance_km);
    }
}
