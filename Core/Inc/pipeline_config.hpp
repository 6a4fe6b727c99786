// include/pipeline_config.hpp
#pragma once

#include "data_types.hpp"
#include <string>
#include <vector>

/**
 * @struct GeoConfig
 * @brief Global validity rectangle and ordered region table
 *
 * Region order is the classification priority: the first boundary
 * containing a point wins.
 */
struct GeoConfig {
    BoundingBox bounds;
    std::vector<RegionBoundary> regions;
};

/**
 * @struct ValidationConfig
 * @brief Inclusive acceptance ranges for raw trips
 */
struct ValidationConfig {
    int64_t min_duration_s = 30;
    int64_t max_duration_s = 10800;
    int min_passengers = 1;
    int max_passengers = 6;
    double min_distance_km = 0.1;
    double max_distance_km = 100.0;
};

struct DistanceConfig {
    double earth_radius_km = 6371.0;
    double duration_divisor = 1000.0;  // seconds per feature unit
};

/**
 * @struct ClusteringConfig
 * @brief K-means parameters and request clamping limits
 */
struct ClusteringConfig {
    int max_iterations = 100;
    double convergence_threshold = 0.001;

    int default_k = 5;
    int min_k = 1;
    int max_k = 20;

    int default_sample_size = 10000;
    int min_sample_size = 10;
    int max_sample_size = 50000;
};

struct PipelineConfig {
    GeoConfig geo;
    ValidationConfig validation;
    DistanceConfig distance;
    ClusteringConfig clustering;
};

/**
 * @brief New York City defaults
 *
 * Regions in priority order: Manhattan, Brooklyn, Queens, Bronx,
 * Staten Island.
 */
PipelineConfig DefaultPipelineConfig();

/**
 * @brief Load configuration from a JSON file
 * @param path JSON file; missing keys keep their defaults
 * @return Parsed configuration
 * @throws std::runtime_error on unreadable/malformed file or
 *         inverted rectangle
 */
PipelineConfig LoadPipelineConfig(const std::string& path);

/**
 * @brief Same as LoadPipelineConfig but from an in-memory JSON document
 */
PipelineConfig ParsePipelineConfig(const std::string& json_text);

/**
 * @brief Clamp a requested cluster count into [min_k, max_k]
 * @param requested Requested k; 0 means "not given", negatives clamp to min_k
 */
int ClampClusterCount(const ClusteringConfig& config, int requested);

/**
 * @brief Clamp a requested sample size into [min, max]
 * @param requested Requested size; 0 means "not given"
 */
int ClampSampleSize(const ClusteringConfig& config, int requested);
