#include "RMRS.hpp"
#include <algorithm>
#include <cctype>

namespace RMRS {

std::string toString(RatingParameter param) {
    switch (param) {
        case RatingParameter::STRENGTH:    return "strength";
        case RatingParameter::SPACING:     return "spacing";
        case RatingParameter::PERSISTENCE: return "persistence";
        case RatingParameter::APERTURE:    return "aperture";
        case RatingParameter::ROUGHNESS:   return "roughness";
        case RatingParameter::INFILL:      return "infill";
        case RatingParameter::WEATHERING:  return "weathering";
        case RatingParameter::GROUNDWATER: return "groundwater";
    }
    return "unknown";
}

std::string toString(StructureType type) {
    switch (type) {
        case StructureType::JOINT:     return "Joint";
        case StructureType::FAULT:     return "Fault";
        case StructureType::SPALLING:  return "Spalling/Sheeting";
        case StructureType::BEDDING:   return "Bedding";
        case StructureType::FOLIATION: return "Foliation";
        case StructureType::VEIN:      return "Vein";
        case StructureType::CONTACT:   return "Contact";
        case StructureType::OTHER:     return "Other";
    }
    return "Other";
}

std::string toString(ClusterMetric metric) {
    switch (metric) {
        case ClusterMetric::TWO_THRESHOLD: return "TWO_THRESHOLD";
        case ClusterMetric::GREAT_CIRCLE:  return "GREAT_CIRCLE";
    }
    return "TWO_THRESHOLD";
}

bool parseRatingParameter(const std::string& name, RatingParameter& param) {
    std::string key = toLowerCopy(trimCopy(name));
    for (RatingParameter p : allRatingParameters()) {
        if (toString(p) == key) {
            param = p;
            return true;
        }
    }
    // Column-style aliases used in field sheets
    if (key == "ucs" || key == "ucs_class") { param = RatingParameter::STRENGTH; return true; }
    if (key == "infilling" || key == "infilling_type") { param = RatingParameter::INFILL; return true; }
    return false;
}

bool parseClusterMetric(const std::string& name, ClusterMetric& metric) {
    std::string key = toUpperCopy(trimCopy(name));
    if (key == "TWO_THRESHOLD") { metric = ClusterMetric::TWO_THRESHOLD; return true; }
    if (key == "GREAT_CIRCLE") { metric = ClusterMetric::GREAT_CIRCLE; return true; }
    return false;
}

const std::vector<RatingParameter>& allRatingParameters() {
    static const std::vector<RatingParameter> params = {
        RatingParameter::STRENGTH,
        RatingParameter::SPACING,
        RatingParameter::PERSISTENCE,
        RatingParameter::APERTURE,
        RatingParameter::ROUGHNESS,
        RatingParameter::INFILL,
        RatingParameter::WEATHERING,
        RatingParameter::GROUNDWATER
    };
    return params;
}

std::string trimCopy(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string toLowerCopy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpperCopy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(trimCopy(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(trimCopy(current));

    return fields;
}

} // namespace RMRS
