// src/cluster_engine.cpp
/**
 * @file cluster_engine.cpp
 * @brief K-means trip clustering
 *
 * Responsibilities:
 * - Seed centroids from random distinct input points
 * - Assign points to the nearest centroid in feature space
 * - Recompute centroids, reseeding empty clusters
 * - Detect convergence and report non-empty clusters
 */

#include "cluster_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>

const char* ClusterTerminationName(ClusterTermination termination) {
    switch (termination) {
        case TERMINATION_EMPTY_INPUT:    return "empty input";
        case TERMINATION_DEGENERATE:     return "degenerate (single cluster)";
        case TERMINATION_CONVERGED:      return "converged";
        case TERMINATION_MAX_ITERATIONS: return "max iterations reached";
    }
    return "unknown";
}

// ============================================================
// Constructor & Initialization
// ============================================================

ClusterEngine::ClusterEngine()
    : ClusterEngine(DefaultPipelineConfig()) {
}

ClusterEngine::ClusterEngine(const PipelineConfig& config,
                             std::mt19937::result_type seed)
    : config_(config.clustering),
      distance_(config.distance),
      rng_(seed),
      cluster_count_(0),
      iterations_(0),
      processing_time_ms_(0.0) {
}

bool ClusterEngine::Initialize() {
    std::cout << "🔧 [ClusterEngine] Clustering initialization...\n";

    if (config_.max_iterations <= 0) {
        std::cerr << "❌ [ClusterEngine] max_iterations must be positive\n";
        return false;
    }
    if (!(config_.convergence_threshold > 0.0)) {
        std::cerr << "❌ [ClusterEngine] convergence threshold must be positive\n";
        return false;
    }

    std::cout << "✅ [ClusterEngine] Initialized\n";
    std::cout << "   - Max iterations: " << config_.max_iterations << "\n";
    std::cout << "   - Convergence threshold: "
              << config_.convergence_threshold << "\n";
    std::cout << "   - Duration divisor: "
              << distance_.Config().duration_divisor << " s\n\n";

    return true;
}

// ============================================================
// Main Clustering Function
// ============================================================

ClusteringOutput ClusterEngine::Process(
    const std::vector<FeaturePoint>& points,
    int k,
    int max_iterations) {

    auto start_time = std::chrono::high_resolution_clock::now();

    ClusteringOutput output;
    output.total_points = static_cast<int>(points.size());

    if (max_iterations <= 0) {
        max_iterations = std::max(1, config_.max_iterations);
    }

    const int n = static_cast<int>(points.size());

    if (n == 0) {
        output.termination = TERMINATION_EMPTY_INPUT;
    } else if (k <= 0 || k > n) {
        // ============================================================
        // Degenerate request: whole input as one cluster
        // ============================================================
        std::vector<int> all(n);
        std::iota(all.begin(), all.end(), 0);

        Eigen::Vector3d nan_vec = Eigen::Vector3d::Constant(
            std::numeric_limits<double>::quiet_NaN());

        TripCluster cluster;
        cluster.cluster_id = 0;
        cluster.centroid = UpdateCentroid(all, points, nan_vec);
        cluster.members = points;
        output.clusters.push_back(std::move(cluster));
        output.termination = TERMINATION_DEGENERATE;
    } else {
        // ============================================================
        // Iterative refinement
        // ============================================================
        std::vector<Eigen::Vector3d> centroids = InitializeCentroids(points, k);
        std::vector<Eigen::Vector3d> new_centroids(k);
        std::vector<std::vector<int>> members(k);

        output.termination = TERMINATION_MAX_ITERATIONS;

        for (int iter = 0; iter < max_iterations; iter++) {
            output.iterations = iter + 1;

            // Assign
            for (auto& m : members) {
                m.clear();
            }
            for (int i = 0; i < n; i++) {
                members[NearestCentroid(points[i], centroids)].push_back(i);
            }

            // Update
            for (int c = 0; c < k; c++) {
                new_centroids[c] = UpdateCentroid(members[c], points,
                                                  centroids[c]);
            }

            // Converge check
            if (HasConverged(centroids, new_centroids)) {
                output.termination = TERMINATION_CONVERGED;
                break;
            }

            centroids = new_centroids;
        }

        // ============================================================
        // Extract non-empty clusters
        // ============================================================
        for (int c = 0; c < k; c++) {
            if (members[c].empty()) {
                continue;
            }
            TripCluster cluster;
            cluster.cluster_id = static_cast<int>(output.clusters.size());
            cluster.centroid = new_centroids[c];
            cluster.members.reserve(members[c].size());
            for (int idx : members[c]) {
                cluster.members.push_back(points[idx]);
            }
            output.clusters.push_back(std::move(cluster));
        }
    }

    // ============================================================
    // Statistics
    // ============================================================
    output.cluster_count = static_cast<int>(output.clusters.size());
    cluster_count_ = output.cluster_count;
    iterations_ = output.iterations;

    auto end_time = std::chrono::high_resolution_clock::now();
    output.processing_time_ms =
        std::chrono::duration<double, std::milli>(
            end_time - start_time).count();
    processing_time_ms_ = output.processing_time_ms;

    return output;
}

// ============================================================
// K-means Steps
// ============================================================

std::vector<Eigen::Vector3d> ClusterEngine::InitializeCentroids(
    const std::vector<FeaturePoint>& points,
    int k) {

    // Partial Fisher-Yates: first k slots are a uniform sample without
    // replacement
    std::vector<size_t> indices(points.size());
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<Eigen::Vector3d> centroids;
    centroids.reserve(k);
    for (int i = 0; i < k; i++) {
        std::uniform_int_distribution<size_t> pick(i, indices.size() - 1);
        std::swap(indices[i], indices[pick(rng_)]);
        centroids.push_back(points[indices[i]].features);
    }

    return centroids;
}

int ClusterEngine::NearestCentroid(
    const FeaturePoint& point,
    const std::vector<Eigen::Vector3d>& centroids) const {

    int best = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    bool found = false;

    for (size_t c = 0; c < centroids.size(); c++) {
        std::optional<double> dist =
            distance_.FeatureDistance(point.features, centroids[c]);
        if (!dist) {
            continue;
        }
        if (!found || *dist < best_dist) {
            best = static_cast<int>(c);
            best_dist = *dist;
            found = true;
        }
    }

    return best;
}

Eigen::Vector3d ClusterEngine::UpdateCentroid(
    const std::vector<int>& member_indices,
    const std::vector<FeaturePoint>& points,
    const Eigen::Vector3d& previous) {

    if (member_indices.empty()) {
        std::uniform_int_distribution<size_t> pick(0, points.size() - 1);
        return points[pick(rng_)].features;
    }

    Eigen::Vector3d sum = Eigen::Vector3d::Zero();
    int complete = 0;
    for (int idx : member_indices) {
        if (points[idx].IsComplete()) {
            sum += points[idx].features;
            complete++;
        }
    }

    if (complete == 0) {
        return previous;
    }
    return sum / static_cast<double>(complete);
}

bool ClusterEngine::HasConverged(
    const std::vector<Eigen::Vector3d>& old_centroids,
    const std::vector<Eigen::Vector3d>& new_centroids) const {

    for (size_t c = 0; c < old_centroids.size(); c++) {
        std::optional<double> shift =
            distance_.FeatureDistance(old_centroids[c], new_centroids[c]);
        if (!shift || *shift >= config_.convergence_threshold) {
            return false;
        }
    }
    return true;
}

// ============================================================
// Configuration Methods
// ============================================================

void ClusterEngine::SetSeed(std::mt19937::result_type seed) {
    rng_.seed(seed);
    std::cout << "[ClusterEngine] Seed updated: " << seed << "\n";
}

void ClusterEngine::SetMaxIterations(int max_iterations) {
    config_.max_iterations = max_iterations;
    std::cout << "[ClusterEngine] Max iterations updated: "
              << max_iterations << "\n";
}

void ClusterEngine::SetConvergenceThreshold(double threshold) {
    config_.convergence_threshold = threshold;
    std::cout << "[ClusterEngine] Convergence threshold updated: "
              << threshold << "\n";
}

ClusteringStats ClusterEngine::GetStatistics() const {
    ClusteringStats stats;
    stats.cluster_count = cluster_count_;
    stats.iterations = iterations_;
    stats.processing_time_ms = processing_time_ms_;
    return stats;
}
