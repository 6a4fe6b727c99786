// include/trip_reader.hpp
#pragma once

#include "data_types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <iosfwd>

/**
 * @struct CsvColumns
 * @brief Column positions resolved from the header row (-1 = absent)
 */
struct CsvColumns {
    int id = -1;
    int vendor_id = -1;
    int pickup_datetime = -1;
    int dropoff_datetime = -1;
    int passenger_count = -1;
    int pickup_longitude = -1;
    int pickup_latitude = -1;
    int dropoff_longitude = -1;
    int dropoff_latitude = -1;
    int store_and_fwd_flag = -1;
    int trip_duration = -1;
    int field_count = 0;
};

struct TripReadOutput {
    std::vector<RawTripRecord> records;
    int line_count = 0;        // data lines, header excluded
    int malformed_count = 0;   // wrong field count, skipped
};

/**
 * @class TripReader
 * @brief NYC taxi trip CSV source
 */
class TripReader {
public:
    /**
     * @brief Read every data line of a trip CSV
     * @throws std::runtime_error if the file cannot be opened or the
     *         header lacks a required column
     */
    static TripReadOutput ReadFile(const std::string& filename);
    static TripReadOutput ReadStream(std::istream& in);

    /**
     * @brief Resolve column positions by name
     * @throws std::runtime_error if a coordinate, duration or passenger
     *         column is missing
     */
    static CsvColumns ParseHeader(const std::string& header);

    /**
     * @brief Parse one data line
     * @return False if the field count does not match the header
     */
    static bool ParseLine(const std::string& line, const CsvColumns& columns,
                          RawTripRecord& record);

    // Fast string parsing utilities
    static std::vector<std::string_view> SplitFields(std::string_view line,
                                                     char delimiter = ',');
    static double ParseDouble(std::string_view sv, double defaultValue);
    static int64_t ParseInt(std::string_view sv, int64_t defaultValue = 0);

    /**
     * @brief Write enriched records as CSV (distance 3 dp, speed 2 dp)
     * @throws std::runtime_error if the file cannot be written
     */
    static void WriteEnrichedFile(const std::string& filename,
                                  const std::vector<EnrichedTripRecord>& records);
    static void WriteEnriched(std::ostream& out,
                              const std::vector<EnrichedTripRecord>& records);
};
