// include/cluster_engine.hpp
#pragma once

#include "data_types.hpp"
#include "pipeline_config.hpp"
#include "distance_model.hpp"
#include <vector>
#include <string>
#include <random>
#include <chrono>

/**
 * @brief How a clustering run ended
 */
enum ClusterTermination : uint8_t {
    TERMINATION_EMPTY_INPUT = 0,     // no points, no iteration
    TERMINATION_DEGENERATE = 1,      // k outside [1, n], one whole-set cluster
    TERMINATION_CONVERGED = 2,
    TERMINATION_MAX_ITERATIONS = 3
};

const char* ClusterTerminationName(ClusterTermination termination);

/**
 * @struct ClusteringOutput
 * @brief Output from a clustering run
 *
 * clusters never contains an empty group.
 */
struct ClusteringOutput {
    std::vector<TripCluster> clusters;
    int cluster_count = 0;
    int total_points = 0;
    int iterations = 0;
    ClusterTermination termination = TERMINATION_EMPTY_INPUT;
    double processing_time_ms = 0.0;
};

/**
 * @struct ClusteringStats
 * @brief Statistics from the last run
 */
struct ClusteringStats {
    int cluster_count;
    int iterations;
    double processing_time_ms;
};

/**
 * @class ClusterEngine
 * @brief K-means over (latitude, longitude, duration) feature points
 *
 * Centroids start at k distinct random input points. An empty cluster is
 * reseeded from a random input point on each update. Iteration stops when
 * every centroid moves less than the convergence threshold, or after
 * max_iterations.
 *
 * Incomplete points (any non-finite component) have no comparable
 * distance to any centroid and fall into cluster 0. They never move a
 * centroid. Callers that care should filter them out first.
 */
class ClusterEngine {
public:
    ClusterEngine();
    explicit ClusterEngine(const PipelineConfig& config,
                           std::mt19937::result_type seed = std::random_device{}());
    ~ClusterEngine() = default;

    /**
     * @brief Initialize clustering module
     * @return True if successful
     */
    bool Initialize();

    /**
     * @brief Cluster feature points
     * @param points Input points
     * @param k Requested cluster count
     * @param max_iterations Iteration budget; <= 0 uses the configured value
     * @return Non-empty clusters partitioning the input
     */
    ClusteringOutput Process(const std::vector<FeaturePoint>& points,
                             int k,
                             int max_iterations = 0);

    // Configuration
    void SetSeed(std::mt19937::result_type seed);
    void SetMaxIterations(int max_iterations);
    void SetConvergenceThreshold(double threshold);

    // Statistics
    ClusteringStats GetStatistics() const;

private:
    ClusteringConfig config_;
    DistanceModel distance_;
    std::mt19937 rng_;

    /**
     * @brief Pick k distinct input points as initial centroids
     */
    std::vector<Eigen::Vector3d> InitializeCentroids(
        const std::vector<FeaturePoint>& points,
        int k);

    /**
     * @brief Index of nearest centroid, first index on ties
     *
     * Incomparable distances rank behind every comparable one.
     */
    int NearestCentroid(const FeaturePoint& point,
                        const std::vector<Eigen::Vector3d>& centroids) const;

    /**
     * @brief Mean of complete members, or a random input point if empty
     */
    Eigen::Vector3d UpdateCentroid(const std::vector<int>& member_indices,
                                   const std::vector<FeaturePoint>& points,
                                   const Eigen::Vector3d& previous);

    bool HasConverged(const std::vector<Eigen::Vector3d>& old_centroids,
                      const std::vector<Eigen::Vector3d>& new_centroids) const;

    // Statistics
    int cluster_count_;
    int iterations_;
    double processing_time_ms_;
};
