// include/geo_classifier.hpp
#pragma once

#include "data_types.hpp"
#include "pipeline_config.hpp"
#include <string>

/**
 * @class GeoClassifier
 * @brief Bounding-box geofencing
 *
 * Holds a read-only reference to the region table; the referenced
 * GeoConfig must outlive the classifier.
 */
class GeoClassifier {
public:
    explicit GeoClassifier(const GeoConfig& config);

    /**
     * @brief Coordinate sanity check
     * @return False if either component is exactly 0, or the point lies
     *         outside the global rectangle (inclusive edges)
     */
    bool IsValidCoordinate(double lat, double lon) const;

    /**
     * @brief Label of the first configured region containing the point
     * @return Region name, or UNKNOWN_REGION if none matches
     */
    const std::string& ClassifyRegion(double lat, double lon) const;

    const GeoConfig& Config() const { return config_; }

private:
    const GeoConfig& config_;
};
