// src/distance_model.cpp
/**
 * @file distance_model.cpp
 * @brief Great-circle geometry and feature-space dissimilarity
 */

#include "distance_model.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

constexpr double kDegToRad = M_PI / 180.0;

}  // namespace

DistanceModel::DistanceModel(const DistanceConfig& config)
    : config_(config) {
}

// ============================================================
// Haversine
// ============================================================

double DistanceModel::GreatCircleDistanceKm(double lat1, double lon1,
                                            double lat2, double lon2) const {
    if (!std::isfinite(lat1) || !std::isfinite(lon1) ||
        !std::isfinite(lat2) || !std::isfinite(lon2)) {
        std::ostringstream msg;
        msg << "Non-finite coordinate: (" << lat1 << ", " << lon1
            << ") -> (" << lat2 << ", " << lon2 << ")";
        throw InvalidInputError(msg.str());
    }

    double d_lat = (lat2 - lat1) * kDegToRad;
    double d_lon = (lon2 - lon1) * kDegToRad;

    double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
               std::cos(lat1 * kDegToRad) * std::cos(lat2 * kDegToRad) *
               std::sin(d_lon / 2) * std::sin(d_lon / 2);
    a = std::min(1.0, std::max(0.0, a));  // rounding near antipodes
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return config_.earth_radius_km * c;
}

// ============================================================
// Feature Distance
// ============================================================

std::optional<double> DistanceModel::FeatureDistance(
    const Eigen::Vector3d& a,
    const Eigen::Vector3d& b) const {

    if (!a.allFinite() || !b.allFinite()) {
        return std::nullopt;
    }

    Eigen::Vector3d diff = a - b;
    diff(2) /= config_.duration_divisor;
    return diff.norm();
}

std::optional<double> DistanceModel::FeatureDistance(
    const FeaturePoint& a,
    const FeaturePoint& b) const {
    return FeatureDistance(a.features, b.features);
}
