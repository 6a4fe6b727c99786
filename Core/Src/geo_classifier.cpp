// src/geo_classifier.cpp
/**
 * @file geo_classifier.cpp
 * @brief Coordinate validation and region labeling
 */

#include "geo_classifier.hpp"
#include <cmath>

namespace {
const std::string kUnknownRegion = UNKNOWN_REGION;
}

GeoClassifier::GeoClassifier(const GeoConfig& config)
    : config_(config) {
}

bool GeoClassifier::IsValidCoordinate(double lat, double lon) const {
    // 0 is the "missing" sentinel in source data
    if (lat == 0.0 || lon == 0.0) {
        return false;
    }
    if (!std::isfinite(lat) || !std::isfinite(lon)) {
        return false;
    }
    return config_.bounds.Contains(lat, lon);
}

const std::string& GeoClassifier::ClassifyRegion(double lat, double lon) const {
    for (const auto& region : config_.regions) {
        if (region.box.Contains(lat, lon)) {
            return region.name;
        }
    }
    return kUnknownRegion;
}
