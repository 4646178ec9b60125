#include "Discontinuity.hpp"
#include "CodeDictionary.hpp"
#include "RmrErrors.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace RMRS {

namespace {

constexpr double DEG_TO_RAD = M_PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / M_PI;

} // namespace

// ============================================================================
// Orientation geometry
// ============================================================================

std::array<double, 3> Orientation::pole() const {
    double dd = dip_direction * DEG_TO_RAD;
    double d = dip * DEG_TO_RAD;
    return {std::sin(d) * std::sin(dd), std::sin(d) * std::cos(dd), std::cos(d)};
}

double normalizeDipDirection(double dip_direction) {
    double wrapped = std::fmod(dip_direction, 360.0);
    if (wrapped < 0.0) wrapped += 360.0;
    // fmod of a tiny negative value can round back up to 360
    if (wrapped >= 360.0) wrapped -= 360.0;
    return wrapped;
}

double circularDistance(double d1, double d2) {
    double diff = std::abs(normalizeDipDirection(d1) - normalizeDipDirection(d2));
    return std::min(diff, 360.0 - diff);
}

double greatCircleDistance(const Orientation& a, const Orientation& b) {
    auto pa = a.pole();
    auto pb = b.pole();
    double dot = std::abs(pa[0] * pb[0] + pa[1] * pb[1] + pa[2] * pb[2]);
    dot = std::min(1.0, dot);
    return std::acos(dot) * RAD_TO_DEG;
}

Orientation meanOrientation(const std::vector<Orientation>& orientations) {
    if (orientations.empty()) {
        return Orientation();
    }

    double sum_sin = 0.0, sum_cos = 0.0, sum_dip = 0.0;
    for (const auto& o : orientations) {
        double dd = o.dip_direction * DEG_TO_RAD;
        sum_sin += std::sin(dd);
        sum_cos += std::cos(dd);
        sum_dip += o.dip;
    }

    double mean_dd;
    if (std::sqrt(sum_sin * sum_sin + sum_cos * sum_cos) < 1e-12) {
        mean_dd = orientations.front().dip_direction;
    } else {
        mean_dd = normalizeDipDirection(std::atan2(sum_sin, sum_cos) * RAD_TO_DEG);
    }

    return Orientation(mean_dd, sum_dip / orientations.size());
}

// ============================================================================
// Discontinuity
// ============================================================================

Discontinuity::Discontinuity()
    : source_row(-1), distance(0.0), type(StructureType::JOINT) {}

const std::string& Discontinuity::code(RatingParameter param) const {
    switch (param) {
        case RatingParameter::SPACING:     return spacing_code;
        case RatingParameter::PERSISTENCE: return persistence_code;
        case RatingParameter::APERTURE:    return aperture_code;
        case RatingParameter::ROUGHNESS:   return roughness_code;
        case RatingParameter::INFILL:      return infill_code;
        case RatingParameter::WEATHERING:  return weathering_code;
        case RatingParameter::GROUNDWATER: return groundwater_code;
        case RatingParameter::STRENGTH:    break;
    }
    throw std::invalid_argument("Strength is a station property, not a discontinuity code");
}

std::string Discontinuity::label() const {
    if (source_row >= 0) {
        return "row " + std::to_string(source_row);
    }
    return station + " @ " + std::to_string(distance) + " m";
}

StructureType parseStructureType(const std::string& code, int source_row) {
    std::string key = toUpperCopy(trimCopy(code));

    static const std::map<std::string, StructureType> types = {
        {"J", StructureType::JOINT},      {"JOINT", StructureType::JOINT},
        {"JN", StructureType::JOINT},
        {"F", StructureType::FAULT},      {"FAULT", StructureType::FAULT},
        {"FLT", StructureType::FAULT},
        {"S", StructureType::SPALLING},   {"SP", StructureType::SPALLING},
        {"SPALLING", StructureType::SPALLING},
        {"SHEETING", StructureType::SPALLING},
        {"SPALLING/SHEETING", StructureType::SPALLING},
        {"B", StructureType::BEDDING},    {"BEDDING", StructureType::BEDDING},
        {"FO", StructureType::FOLIATION}, {"FOLIATION", StructureType::FOLIATION},
        {"V", StructureType::VEIN},       {"VEIN", StructureType::VEIN},
        {"C", StructureType::CONTACT},    {"CONTACT", StructureType::CONTACT},
        {"O", StructureType::OTHER},      {"OTHER", StructureType::OTHER}
    };

    auto it = types.find(key);
    if (it == types.end()) {
        throw UnknownTypeError(trimCopy(code), source_row);
    }
    return it->second;
}

// ============================================================================
// DiscontinuityValidator
// ============================================================================

DiscontinuityValidator::DiscontinuityValidator(const CodeDictionary& dictionary)
    : dictionary_(dictionary) {}

double DiscontinuityValidator::parseNumber(const std::string& text, const std::string& field,
                                           int source_row) const {
    std::string value = trimCopy(text);
    double result;
    try {
        size_t consumed = 0;
        result = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw InvalidRangeError(field, std::nan(""), source_row);
    }

    if (!std::isfinite(result)) {
        throw InvalidRangeError(field, result, source_row);
    }
    return result;
}

std::string DiscontinuityValidator::checkedCode(RatingParameter param, const std::string& text,
                                                int source_row) const {
    std::string code = CodeDictionary::canonicalCode(text);
    if (!dictionary_.hasCode(param, code)) {
        throw UnknownCodeError(param, trimCopy(text), source_row);
    }
    return code;
}

Discontinuity DiscontinuityValidator::validate(const DiscontinuityRecord& record) const {
    const int row = record.source_row;
    Discontinuity disc;
    disc.source_row = row;

    disc.station = trimCopy(record.station);
    if (disc.station.empty()) {
        throw EmptyInputError("station identifier of row " + std::to_string(row));
    }

    disc.distance = parseNumber(record.distance, "distance", row);
    if (disc.distance <= 0.0) {
        throw InvalidRangeError("distance", disc.distance, row);
    }

    disc.type = parseStructureType(record.type, row);

    double dip_direction = parseNumber(record.dip_direction, "dip_direction", row);
    double dip = parseNumber(record.dip, "dip", row);

    if (dip < -DIP_CLAMP_SLACK || dip > 90.0 + DIP_CLAMP_SLACK) {
        throw InvalidRangeError("dip", dip, row);
    }
    dip = std::max(0.0, std::min(90.0, dip));

    disc.orientation = Orientation(normalizeDipDirection(dip_direction), dip);

    disc.spacing_code = checkedCode(RatingParameter::SPACING, record.spacing, row);
    disc.persistence_code = checkedCode(RatingParameter::PERSISTENCE, record.persistence, row);
    disc.aperture_code = checkedCode(RatingParameter::APERTURE, record.aperture, row);
    disc.roughness_code = checkedCode(RatingParameter::ROUGHNESS, record.roughness, row);
    disc.infill_code = checkedCode(RatingParameter::INFILL, record.infill, row);
    disc.weathering_code = checkedCode(RatingParameter::WEATHERING, record.weathering, row);
    disc.groundwater_code = checkedCode(RatingParameter::GROUNDWATER, record.groundwater, row);

    return disc;
}

ValidationReport DiscontinuityValidator::validateAll(
    const std::vector<DiscontinuityRecord>& records) const {

    ValidationReport report;
    report.valid.reserve(records.size());

    for (const auto& record : records) {
        try {
            report.valid.push_back(validate(record));
        } catch (const RmrError& e) {
            report.errors.push_back({record.source_row, trimCopy(record.station),
                                     e.kind(), e.what()});
        }
    }

    return report;
}

// ============================================================================
// Station
// ============================================================================

double Station::effectiveTraverseLength() const {
    if (traverse_length) {
        return *traverse_length;
    }
    double max_distance = 0.0;
    for (const auto& disc : discontinuities) {
        max_distance = std::max(max_distance, disc.distance);
    }
    return max_distance;
}

std::vector<Station> groupByStation(const std::vector<Discontinuity>& discontinuities,
                                    const std::string& default_ucs_class) {
    std::vector<Station> stations;
    std::map<std::string, size_t> index;

    for (const auto& disc : discontinuities) {
        auto it = index.find(disc.station);
        if (it == index.end()) {
            Station station;
            station.id = disc.station;
            station.ucs_class = default_ucs_class;
            index[disc.station] = stations.size();
            stations.push_back(station);
            it = index.find(disc.station);
        }
        stations[it->second].discontinuities.push_back(disc);
    }

    return stations;
}

} // namespace RMRS
