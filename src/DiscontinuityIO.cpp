#include "DiscontinuityIO.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace RMRS {

namespace {

struct ColumnAliases {
    std::string DiscontinuityRecord::*field;
    std::vector<std::string> names;          // Canonical name first
};

const std::vector<ColumnAliases>& columnAliases() {
    static const std::vector<ColumnAliases> columns = {
        {&DiscontinuityRecord::station,       {"station", "station_id"}},
        {&DiscontinuityRecord::distance,      {"distance", "distance_m"}},
        {&DiscontinuityRecord::type,          {"type", "structure_type"}},
        {&DiscontinuityRecord::dip_direction, {"dip_direction", "dip_direction_degrees"}},
        {&DiscontinuityRecord::dip,           {"dip", "dip_degrees"}},
        {&DiscontinuityRecord::spacing,       {"spacing", "spacing_mm"}},
        {&DiscontinuityRecord::persistence,   {"persistence"}},
        {&DiscontinuityRecord::aperture,      {"aperture", "aperture_mm"}},
        {&DiscontinuityRecord::roughness,     {"roughness"}},
        {&DiscontinuityRecord::infill,        {"infill", "infilling_type"}},
        {&DiscontinuityRecord::weathering,    {"weathering"}},
        {&DiscontinuityRecord::groundwater,   {"groundwater"}},
    };
    return columns;
}

std::string normalizeHeader(const std::string& name) {
    std::string key = toLowerCopy(trimCopy(name));
    std::replace(key.begin(), key.end(), ' ', '_');
    return key;
}

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Columns shared by station and family rows
const char* SCORE_COLUMNS =
    "discontinuities,ucs_class,strength_rating,rqd,rqd_derived,rqd_rating,"
    "traverse_length_m,mean_spacing_mm,spacing_rating,persistence,aperture,roughness,"
    "infill,weathering,condition_rating,groundwater_code,groundwater_rating,"
    "orientation_adjustment,total,class,descriptor";

std::string scoreColumns(const RmrScore& s) {
    std::ostringstream oss;
    oss << s.discontinuity_count << ","
        << DiscontinuityIO::escapeField(s.ucs_class) << ","
        << formatNumber(s.strength_rating) << ","
        << formatNumber(s.rqd) << ","
        << (s.rqd_derived ? "yes" : "no") << ","
        << formatNumber(s.rqd_rating) << ","
        << formatNumber(s.traverse_length) << ","
        << formatNumber(s.mean_spacing_mm) << ","
        << formatNumber(s.spacing_rating) << ","
        << formatNumber(s.condition.persistence) << ","
        << formatNumber(s.condition.aperture) << ","
        << formatNumber(s.condition.roughness) << ","
        << formatNumber(s.condition.infill) << ","
        << formatNumber(s.condition.weathering) << ","
        << formatNumber(s.condition_rating) << ","
        << DiscontinuityIO::escapeField(s.dominant_groundwater_code) << ","
        << formatNumber(s.groundwater_rating) << ","
        << formatNumber(s.orientation_adjustment) << ","
        << formatNumber(s.total) << ","
        << s.classification.numeral() << ","
        << s.classification.descriptor;
    return oss.str();
}

} // namespace

// =============================================================================
// Reading
// =============================================================================

std::vector<std::string> DiscontinuityIO::splitLine(const std::string& line) {
    return splitCsvLine(line);
}

RecordTable DiscontinuityIO::readRecords(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return readRecords(file, filename);
}

RecordTable DiscontinuityIO::readRecords(std::istream& in, const std::string& source_name) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error(source_name + ": empty file, expected a header line");
    }

    // UTF-8 byte order mark written by spreadsheet exports
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    std::vector<std::string> header = splitLine(line);
    for (auto& name : header) {
        name = normalizeHeader(name);
    }

    // Column index of every required field
    const auto& columns = columnAliases();
    std::vector<size_t> column_of(columns.size());
    size_t min_fields = 0;

    for (size_t s = 0; s < columns.size(); ++s) {
        bool found = false;
        for (const auto& alias : columns[s].names) {
            auto it = std::find(header.begin(), header.end(), alias);
            if (it != header.end()) {
                column_of[s] = static_cast<size_t>(it - header.begin());
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::runtime_error(source_name + ": missing required column '" +
                                     columns[s].names.front() + "'");
        }
        min_fields = std::max(min_fields, column_of[s] + 1);
    }

    RecordTable table;
    int data_row = 0;

    while (std::getline(in, line)) {
        data_row++;
        if (trimCopy(line).empty()) continue;

        std::vector<std::string> fields = splitLine(line);
        if (fields.size() < min_fields) {
            RecordError error;
            error.source_row = data_row;
            error.station = fields.front();
            error.kind = "Malformed";
            error.message = source_name + ": row " + std::to_string(data_row) + " has " +
                            std::to_string(fields.size()) + " fields, expected " +
                            std::to_string(min_fields);
            table.errors.push_back(error);
            continue;
        }

        DiscontinuityRecord record;
        record.source_row = data_row;
        for (size_t s = 0; s < columns.size(); ++s) {
            record.*(columns[s].field) = fields[column_of[s]];
        }
        table.records.push_back(record);
    }

    return table;
}

// =============================================================================
// Result rows
// =============================================================================

std::string DiscontinuityIO::escapeField(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string DiscontinuityIO::stationHeader() {
    return std::string("station,") + SCORE_COLUMNS;
}

std::string DiscontinuityIO::stationRow(const RmrScore& score) {
    return escapeField(score.unit) + "," + scoreColumns(score);
}

std::string DiscontinuityIO::familyHeader() {
    return std::string("family,mean_dip_direction,mean_dip,tolerance,fisher_kappa,"
                       "max_deviation,dominant_type,stations,") + SCORE_COLUMNS;
}

std::string DiscontinuityIO::familyRow(const FamilySummary& summary) {
    const Family& f = summary.family;

    std::string stations;
    for (size_t i = 0; i < f.stations.size(); ++i) {
        if (i > 0) stations += ";";
        stations += f.stations[i];
    }

    std::ostringstream oss;
    oss << f.label() << ","
        << formatNumber(f.mean.dip_direction) << ","
        << formatNumber(f.mean.dip) << ","
        << formatNumber(f.tolerance) << ","
        << formatNumber(f.fisher_kappa) << ","
        << formatNumber(f.max_deviation) << ","
        << escapeField(toString(f.dominant_type)) << ","
        << escapeField(stations) << ","
        << scoreColumns(summary.score);
    return oss.str();
}

std::string DiscontinuityIO::unclusteredHeader() {
    return "source_row,station,distance,type,dip_direction,dip";
}

std::string DiscontinuityIO::unclusteredRow(const Discontinuity& d) {
    std::ostringstream oss;
    oss << d.source_row << ","
        << escapeField(d.station) << ","
        << formatNumber(d.distance) << ","
        << escapeField(toString(d.type)) << ","
        << formatNumber(d.orientation.dip_direction) << ","
        << formatNumber(d.orientation.dip);
    return oss.str();
}

std::string DiscontinuityIO::errorHeader() {
    return "scope,source_row,unit,kind,message";
}

std::string DiscontinuityIO::errorRow(const RecordError& error) {
    return "record," + std::to_string(error.source_row) + "," +
           escapeField(error.station) + "," + escapeField(error.kind) + "," +
           escapeField(error.message);
}

std::string DiscontinuityIO::errorRow(const UnitFailure& failure) {
    return escapeField(failure.scope) + ",," + escapeField(failure.unit) + "," +
           escapeField(failure.kind) + "," + escapeField(failure.message);
}

void DiscontinuityIO::writeTable(const std::string& filename, const std::string& header,
                                 const std::vector<std::string>& rows) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << header << "\n";
    for (const auto& row : rows) {
        file << row << "\n";
    }
}

} // namespace RMRS
