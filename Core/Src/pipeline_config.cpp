// src/pipeline_config.cpp
/**
 * @file pipeline_config.cpp
 * @brief Pipeline configuration defaults and JSON loading
 */

#include "pipeline_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// ============================================================
// JSON Helpers
// ============================================================

template <typename T>
void ReadIfPresent(const json& node, const char* key, T& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void CheckBox(const BoundingBox& box, const std::string& what) {
    if (box.min_lat > box.max_lat || box.min_lon > box.max_lon) {
        throw std::runtime_error("Inverted rectangle for " + what);
    }
}

BoundingBox ParseBox(const json& node, BoundingBox box) {
    ReadIfPresent(node, "min_lat", box.min_lat);
    ReadIfPresent(node, "max_lat", box.max_lat);
    ReadIfPresent(node, "min_lon", box.min_lon);
    ReadIfPresent(node, "max_lon", box.max_lon);
    return box;
}

PipelineConfig FromJson(const json& root) {
    PipelineConfig config = DefaultPipelineConfig();

    if (root.contains("geo")) {
        const json& geo = root.at("geo");
        if (geo.contains("bounds")) {
            config.geo.bounds = ParseBox(geo.at("bounds"), config.geo.bounds);
        }
        CheckBox(config.geo.bounds, "global bounds");

        if (geo.contains("regions")) {
            const json& regions = geo.at("regions");
            if (!regions.is_array()) {
                throw std::runtime_error("geo.regions must be an array");
            }
            config.geo.regions.clear();
            for (const auto& entry : regions) {
                RegionBoundary region;
                region.name = entry.at("name").get<std::string>();
                if (region.name.empty() || region.name == UNKNOWN_REGION) {
                    throw std::runtime_error(
                        "Region name must be non-empty and not \"" +
                        std::string(UNKNOWN_REGION) + "\"");
                }
                region.box = ParseBox(entry, BoundingBox{0.0, 0.0, 0.0, 0.0});
                CheckBox(region.box, "region " + region.name);
                config.geo.regions.push_back(region);
            }
        }
    }

    if (root.contains("validation")) {
        const json& v = root.at("validation");
        ReadIfPresent(v, "min_duration_s", config.validation.min_duration_s);
        ReadIfPresent(v, "max_duration_s", config.validation.max_duration_s);
        ReadIfPresent(v, "min_passengers", config.validation.min_passengers);
        ReadIfPresent(v, "max_passengers", config.validation.max_passengers);
        ReadIfPresent(v, "min_distance_km", config.validation.min_distance_km);
        ReadIfPresent(v, "max_distance_km", config.validation.max_distance_km);
    }

    if (root.contains("distance")) {
        const json& d = root.at("distance");
        ReadIfPresent(d, "earth_radius_km", config.distance.earth_radius_km);
        ReadIfPresent(d, "duration_divisor", config.distance.duration_divisor);
        if (config.distance.duration_divisor <= 0.0) {
            throw std::runtime_error("distance.duration_divisor must be > 0");
        }
    }

    if (root.contains("clustering")) {
        const json& c = root.at("clustering");
        ClusteringConfig& cc = config.clustering;
        ReadIfPresent(c, "max_iterations", cc.max_iterations);
        ReadIfPresent(c, "convergence_threshold", cc.convergence_threshold);
        ReadIfPresent(c, "default_k", cc.default_k);
        ReadIfPresent(c, "min_k", cc.min_k);
        ReadIfPresent(c, "max_k", cc.max_k);
        ReadIfPresent(c, "default_sample_size", cc.default_sample_size);
        ReadIfPresent(c, "min_sample_size", cc.min_sample_size);
        ReadIfPresent(c, "max_sample_size", cc.max_sample_size);
        if (cc.min_k > cc.max_k || cc.min_sample_size > cc.max_sample_size) {
            throw std::runtime_error("clustering clamp range is inverted");
        }
    }

    return config;
}

}  // namespace

// ============================================================
// Defaults
// ============================================================

PipelineConfig DefaultPipelineConfig() {
    PipelineConfig config;

    config.geo.bounds = {40.4774, 40.9176, -74.2591, -73.7004};
    config.geo.regions = {
        {"Manhattan",     {40.7000, 40.8000, -74.0500, -73.9000}},
        {"Brooklyn",      {40.5700, 40.7400, -74.0500, -73.8000}},
        {"Queens",        {40.5400, 40.8000, -74.0000, -73.7000}},
        {"Bronx",         {40.7800, 40.9200, -73.9500, -73.7500}},
        {"Staten Island", {40.5000, 40.6500, -74.3000, -74.0000}},
    };

    return config;
}

// ============================================================
// Loading
// ============================================================

PipelineConfig ParsePipelineConfig(const std::string& json_text) {
    try {
        return FromJson(json::parse(json_text));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed configuration: ") +
                                 e.what());
    }
}

PipelineConfig LoadPipelineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return ParsePipelineConfig(buffer.str());
}

// ============================================================
// Request Clamping
// ============================================================

int ClampClusterCount(const ClusteringConfig& config, int requested) {
    int k = requested != 0 ? requested : config.default_k;
    return std::max(config.min_k, std::min(k, config.max_k));
}

int ClampSampleSize(const ClusteringConfig& config, int requested) {
    int n = requested != 0 ? requested : config.default_sample_size;
    return std::max(config.min_sample_size,
                    std::min(n, config.max_sample_size));
}
