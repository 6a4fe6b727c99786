// include/distance_model.hpp
#pragma once

#include "data_types.hpp"
#include "pipeline_config.hpp"
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @class InvalidInputError
 * @brief Raised for non-finite numeric input to distance computations
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @class DistanceModel
 * @brief Surface distance and clustering dissimilarity
 */
class DistanceModel {
public:
    DistanceModel() = default;
    explicit DistanceModel(const DistanceConfig& config);

    /**
     * @brief Haversine distance on a sphere
     * @param lat1, lon1, lat2, lon2 Degrees
     * @return Kilometres, never negative
     * @throws InvalidInputError if any argument is NaN or infinite
     */
    double GreatCircleDistanceKm(double lat1, double lon1,
                                 double lat2, double lon2) const;

    double GreatCircleDistanceKm(const Coordinate& a,
                                 const Coordinate& b) const {
        return GreatCircleDistanceKm(a.latitude, a.longitude,
                                     b.latitude, b.longitude);
    }

    /**
     * @brief Euclidean distance over (lat deg, lon deg, duration / divisor)
     *
     * Mixes angular degrees and scaled seconds in one metric. It is a
     * similarity measure for clustering, not a physical distance.
     *
     * @return std::nullopt if either point is incomplete
     */
    std::optional<double> FeatureDistance(const FeaturePoint& a,
                                          const FeaturePoint& b) const;

    std::optional<double> FeatureDistance(const Eigen::Vector3d& a,
                                          const Eigen::Vector3d& b) const;

    const DistanceConfig& Config() const { return config_; }

private:
    DistanceConfig config_;
};
