// src/trip_reader.cpp
/**
 * @file trip_reader.cpp
 * @brief Trip CSV parsing and enriched CSV output
 */

#include "trip_reader.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

std::string_view Trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '"')) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '"' ||
                           sv.back() == '\r')) {
        sv.remove_suffix(1);
    }
    return sv;
}

// Out-of-range values fall back to 0, which validation rejects
int NarrowInt(int64_t value) {
    if (value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        return 0;
    }
    return static_cast<int>(value);
}

std::string_view FieldAt(const std::vector<std::string_view>& fields,
                         int index) {
    if (index < 0 || index >= static_cast<int>(fields.size())) {
        return std::string_view();
    }
    return fields[index];
}

}  // namespace

// ============================================================
// Field Parsing
// ============================================================

std::vector<std::string_view> TripReader::SplitFields(std::string_view line,
                                                      char delimiter) {
    std::vector<std::string_view> fields;
    const char* curr = line.data();
    const char* end = line.data() + line.size();

    while (true) {
        const char* field_end = std::find(curr, end, delimiter);
        fields.push_back(Trim(std::string_view(curr, field_end - curr)));
        if (field_end == end) {
            break;
        }
        curr = field_end + 1;
    }
    return fields;
}

double TripReader::ParseDouble(std::string_view sv, double defaultValue) {
    double result = defaultValue;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc() || ptr != sv.data() + sv.size()) {
        return defaultValue;
    }
    return result;
}

int64_t TripReader::ParseInt(std::string_view sv, int64_t defaultValue) {
    int64_t result = defaultValue;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc() || ptr != sv.data() + sv.size()) {
        return defaultValue;
    }
    return result;
}

// ============================================================
// Header & Lines
// ============================================================

CsvColumns TripReader::ParseHeader(const std::string& header) {
    CsvColumns columns;
    auto fields = SplitFields(header);
    columns.field_count = static_cast<int>(fields.size());

    for (int i = 0; i < columns.field_count; i++) {
        std::string_view name = fields[i];
        if (name == "id") columns.id = i;
        else if (name == "vendor_id") columns.vendor_id = i;
        else if (name == "pickup_datetime") columns.pickup_datetime = i;
        else if (name == "dropoff_datetime") columns.dropoff_datetime = i;
        else if (name == "passenger_count") columns.passenger_count = i;
        else if (name == "pickup_longitude") columns.pickup_longitude = i;
        else if (name == "pickup_latitude") columns.pickup_latitude = i;
        else if (name == "dropoff_longitude") columns.dropoff_longitude = i;
        else if (name == "dropoff_latitude") columns.dropoff_latitude = i;
        else if (name == "store_and_fwd_flag") columns.store_and_fwd_flag = i;
        else if (name == "trip_duration") columns.trip_duration = i;
    }

    if (columns.pickup_latitude < 0 || columns.pickup_longitude < 0 ||
        columns.dropoff_latitude < 0 || columns.dropoff_longitude < 0 ||
        columns.trip_duration < 0 || columns.passenger_count < 0) {
        throw std::runtime_error("Trip CSV header is missing a required column: " +
                                 header);
    }
    return columns;
}

bool TripReader::ParseLine(const std::string& line, const CsvColumns& columns,
                           RawTripRecord& record) {
    auto fields = SplitFields(line);
    if (static_cast<int>(fields.size()) != columns.field_count) {
        return false;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();

    record = RawTripRecord();
    record.id = std::string(FieldAt(fields, columns.id));
    record.vendor_id = NarrowInt(ParseInt(FieldAt(fields, columns.vendor_id)));
    record.pickup_datetime = std::string(FieldAt(fields, columns.pickup_datetime));
    record.dropoff_datetime = std::string(FieldAt(fields, columns.dropoff_datetime));
    record.passenger_count =
        NarrowInt(ParseInt(FieldAt(fields, columns.passenger_count)));
    record.pickup.longitude = ParseDouble(FieldAt(fields, columns.pickup_longitude), nan);
    record.pickup.latitude = ParseDouble(FieldAt(fields, columns.pickup_latitude), nan);
    record.dropoff.longitude = ParseDouble(FieldAt(fields, columns.dropoff_longitude), nan);
    record.dropoff.latitude = ParseDouble(FieldAt(fields, columns.dropoff_latitude), nan);
    record.trip_duration = ParseInt(FieldAt(fields, columns.trip_duration));

    auto flag = FieldAt(fields, columns.store_and_fwd_flag);
    if (!flag.empty()) {
        record.store_and_fwd_flag = flag[0];
    }
    return true;
}

// ============================================================
// File Reading
// ============================================================

TripReadOutput TripReader::ReadStream(std::istream& in) {
    TripReadOutput output;

    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Trip CSV is empty");
    }
    CsvColumns columns = ParseHeader(line);

    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") {
            continue;
        }
        output.line_count++;

        RawTripRecord record;
        if (!ParseLine(line, columns, record)) {
            output.malformed_count++;
            continue;
        }
        output.records.push_back(std::move(record));
    }

    return output;
}

TripReadOutput TripReader::ReadFile(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Error opening file: " + filename);
    }

    TripReadOutput output = ReadStream(in);
    std::cout << "[TripReader] " << filename << ": " << output.line_count
              << " lines, " << output.malformed_count << " malformed\n";
    return output;
}

// ============================================================
// Enriched Output
// ============================================================

void TripReader::WriteEnriched(std::ostream& out,
                               const std::vector<EnrichedTripRecord>& records) {
    out << "id,vendor_id,pickup_datetime,dropoff_datetime,passenger_count,"
           "pickup_longitude,pickup_latitude,dropoff_longitude,dropoff_latitude,"
           "store_and_fwd_flag,trip_duration,distance_km,speed_kmh,"
           "seconds_per_km,hour_of_day,day_of_week,month,pickup_region,"
           "dropoff_region,trip_type\n";

    for (const auto& r : records) {
        const RawTripRecord& raw = r.raw;
        out << raw.id << ',' << raw.vendor_id << ','
            << raw.pickup_datetime << ',' << raw.dropoff_datetime << ','
            << raw.passenger_count << ','
            << std::setprecision(10)
            << raw.pickup.longitude << ',' << raw.pickup.latitude << ','
            << raw.dropoff.longitude << ',' << raw.dropoff.latitude << ','
            << raw.store_and_fwd_flag << ',' << raw.trip_duration << ','
            << std::fixed << std::setprecision(3) << r.distance_km << ','
            << std::setprecision(2) << r.speed_kmh << ','
            << r.seconds_per_km << ','
            << std::defaultfloat
            << r.hour_of_day << ',' << r.day_of_week << ',' << r.month << ','
            << r.pickup_region << ',' << r.dropoff_region << ','
            << TripTypeName(r.trip_type) << '\n';
    }
}

void TripReader::WriteEnrichedFile(const std::string& filename,
                                   const std::vector<EnrichedTripRecord>& records) {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Error opening output file: " + filename);
    }
    WriteEnriched(out, records);
    if (!out) {
        throw std::runtime_error("Error writing output file: " + filename);
    }
    std::cout << "[TripReader] Wrote " << records.size()
              << " enriched records to " << filename << "\n";
}
