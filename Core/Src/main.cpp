// src/main.cpp
/**
 * @file main.cpp
 * @brief Trip enrichment & clustering pipeline
 *
 * Entry point for the command-line driver.
 * Runs CSV → validation/enrichment → statistics → clustering.
 */

#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <cstdio>
#include <stdexcept>

#include "trip_analyzer.hpp"
#include "trip_reader.hpp"
#include "trip_statistics.hpp"

// ============================================================
// Command Line
// ============================================================

struct CommandLine {
    std::string input_file;
    std::string config_file;
    std::string output_file;
    int k = 0;
    int limit = 0;
    bool has_seed = false;
    unsigned long seed = 0;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <train.csv> [--config file.json] [--k N] [--limit N]"
                 " [--seed S] [--out enriched.csv]\n";
}

/**
 * @throws std::invalid_argument on unknown option or bad number
 */
CommandLine ParseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            cmd.config_file = next();
        } else if (arg == "--k") {
            cmd.k = std::stoi(next());
        } else if (arg == "--limit") {
            cmd.limit = std::stoi(next());
        } else if (arg == "--seed") {
            cmd.seed = std::stoul(next());
            cmd.has_seed = true;
        } else if (arg == "--out") {
            cmd.output_file = next();
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option " + arg);
        } else if (cmd.input_file.empty()) {
            cmd.input_file = arg;
        } else {
            throw std::invalid_argument("Unexpected argument " + arg);
        }
    }
    if (cmd.input_file.empty()) {
        throw std::invalid_argument("No input file given");
    }
    return cmd;
}

// ============================================================
// Helper Functions
// ============================================================

/**
 * @brief Print overall, per-region and per-hour statistics
 */
void PrintStatistics(const std::vector<EnrichedTripRecord>& records) {
    TripSummary summary = TripStatistics::Summarize(records);

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "📊 TRIP STATISTICS\n";
    std::cout << std::string(60, '=') << "\n";
    printf("├─ Total trips:     %d\n", summary.total_trips);
    printf("├─ Avg duration:    %.1f s\n", summary.avg_duration_s);
    printf("├─ Avg distance:    %.3f km\n", summary.avg_distance_km);
    printf("├─ Avg speed:       %.2f km/h\n", summary.avg_speed_kmh);
    printf("├─ Earliest pickup: %s\n", summary.earliest_pickup.c_str());
    printf("└─ Latest pickup:   %s\n", summary.latest_pickup.c_str());

    std::cout << "\n📍 BY PICKUP REGION\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& r : TripStatistics::ByRegion(records)) {
        printf("%-14s | %7d trips | %7.1f s | %6.3f km\n",
               r.region.c_str(), r.trip_count,
               r.avg_duration_s, r.avg_distance_km);
    }

    std::cout << "\n🕐 BY HOUR OF DAY\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& h : TripStatistics::ByHour(records)) {
        printf("%02d:00 | %7d trips | %7.1f s | %6.2f km/h\n",
               h.hour_of_day, h.trip_count, h.avg_duration_s, h.avg_speed_kmh);
    }
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Print cluster centroids and sizes
 */
void PrintClusters(const ClusteringOutput& output) {
    if (output.clusters.empty()) {
        std::cout << "ℹ️  No clusters\n";
        return;
    }

    std::cout << "\n🧭 CLUSTERS (" << output.cluster_count << " from "
              << output.total_points << " trips, "
              << ClusterTerminationName(output.termination) << ")\n";
    std::cout << std::string(80, '-') << "\n";

    for (const auto& c : output.clusters) {
        printf("Cluster %2d | ", c.cluster_id);
        printf("Centroid: [%8.4f, %9.4f] | ", c.centroid(0), c.centroid(1));
        printf("Duration: %7.1f s | ", c.centroid(2));
        printf("Trips: %zu\n", c.members.size());
    }
    std::cout << std::string(80, '-') << "\n";
}

// ============================================================
// Main Application
// ============================================================

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = ParseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << "\n";
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        auto start_time = std::chrono::steady_clock::now();

        // ============================================================
        // 1. Initialize Pipeline
        // ============================================================
        TripAnalyzer analyzer(cmd.config_file);
        if (!analyzer.Initialize()) {
            std::cerr << "❌ Failed to initialize pipeline\n";
            return 1;
        }
        if (cmd.has_seed) {
            analyzer.SetSeed(static_cast<std::mt19937::result_type>(cmd.seed));
        }

        // ============================================================
        // 2. Read & Enrich
        // ============================================================
        TripReadOutput input = TripReader::ReadFile(cmd.input_file);
        EnrichmentOutput enriched = analyzer.Ingest(input.records);

        std::cout << "\n✅ Import completed\n";
        printf("├─ Total processed: %d\n", enriched.processed_count);
        printf("├─ Valid records:   %d\n", enriched.valid_count);
        printf("├─ Invalid records: %d\n", enriched.invalid_count);
        printf("└─ Malformed lines: %d\n", input.malformed_count);

        if (!cmd.output_file.empty()) {
            TripReader::WriteEnrichedFile(cmd.output_file, analyzer.Records());
        }

        PrintStatistics(analyzer.Records());

        // ============================================================
        // 3. Cluster
        // ============================================================
        ClusteringOutput clusters = analyzer.Cluster(cmd.k, cmd.limit);
        PrintClusters(clusters);

        // ============================================================
        // 4. Final Metrics
        // ============================================================
        auto metrics = analyzer.GetMetrics();
        auto total_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();

        printf("\n├─ Retention rate:  %.1f %%\n", metrics.retention_rate * 100.0);
        printf("├─ Enrichment time: %.1f ms\n", metrics.total_enrichment_ms);
        printf("├─ Clustering time: %.1f ms\n", metrics.total_clustering_ms);
        printf("└─ Total time:      %.1f s\n\n", total_time);

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << "\n";
        return 1;
    }
}

/* ============================================================
   USAGE EXAMPLES
   ============================================================

   1. Defaults (NYC bounds, k = 5, sample 10000):
      $ ./trip_cluster_main data/train.csv

   2. Custom config and cluster count:
      $ ./trip_cluster_main data/train.csv --config config/nyc.json --k 8

   3. Reproducible run with enriched CSV output:
      $ ./trip_cluster_main data/train.csv --seed 42 --out enriched.csv

   ============================================================ */
