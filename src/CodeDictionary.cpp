#include "CodeDictionary.hpp"
#include "RmrErrors.hpp"
#include <fstream>
#include <stdexcept>

namespace RMRS {

CodeDictionary::CodeDictionary(Table table) : table_(std::move(table)) {}

std::string CodeDictionary::canonicalCode(const std::string& code) {
    std::string result = toUpperCopy(trimCopy(code));

    // "2.0" as exported by spreadsheets is the same class as "2"
    size_t dot = result.find('.');
    if (dot != std::string::npos && dot > 0 &&
        result.find_first_not_of("0123456789") == dot &&
        result.find_first_not_of('0', dot + 1) == std::string::npos) {
        result.erase(dot);
    }
    return result;
}

// =============================================================================
// Construction
// =============================================================================

CodeDictionary CodeDictionary::createDefault() {
    Table t;

    // Intact rock strength by ISRM grade
    auto& strength = t[RatingParameter::STRENGTH];
    strength["R0"] = CodeEntry(0.0, "Extremely weak (< 1 MPa)");
    strength["R1"] = CodeEntry(1.0, "Very weak (1-5 MPa)");
    strength["R2"] = CodeEntry(4.0, "Weak (5-25 MPa)");
    strength["R3"] = CodeEntry(7.0, "Medium strong (25-50 MPa)");
    strength["R4"] = CodeEntry(12.0, "Strong (50-100 MPa)");
    strength["R5"] = CodeEntry(15.0, "Very strong (100-250 MPa)");
    strength["R6"] = CodeEntry(15.0, "Extremely strong (> 250 MPa)");

    // Representative spacing of each field class (mm)
    auto& spacing = t[RatingParameter::SPACING];
    spacing["1"] = CodeEntry(10.0, "Extremely close (< 20 mm)");
    spacing["2"] = CodeEntry(40.0, "Very close (20-60 mm)");
    spacing["3"] = CodeEntry(130.0, "Close (60-200 mm)");
    spacing["4"] = CodeEntry(400.0, "Moderate (200-600 mm)");
    spacing["5"] = CodeEntry(800.0, "Wide (600-2000 mm)");
    spacing["6"] = CodeEntry(2000.0, "Very wide (> 2000 mm)");

    auto& persistence = t[RatingParameter::PERSISTENCE];
    persistence["1"] = CodeEntry(6.0, "< 1 m");
    persistence["2"] = CodeEntry(4.0, "1-3 m");
    persistence["3"] = CodeEntry(2.0, "3-10 m");
    persistence["4"] = CodeEntry(1.0, "10-20 m");
    persistence["5"] = CodeEntry(0.0, "> 20 m");

    auto& aperture = t[RatingParameter::APERTURE];
    aperture["1"] = CodeEntry(6.0, "None");
    aperture["2"] = CodeEntry(5.0, "< 0.1 mm");
    aperture["3"] = CodeEntry(4.0, "0.1-1 mm");
    aperture["4"] = CodeEntry(1.0, "1-5 mm");
    aperture["5"] = CodeEntry(0.0, "> 5 mm");

    auto& roughness = t[RatingParameter::ROUGHNESS];
    roughness["1"] = CodeEntry(6.0, "Very rough");
    roughness["2"] = CodeEntry(5.0, "Rough");
    roughness["3"] = CodeEntry(3.0, "Slightly rough");
    roughness["4"] = CodeEntry(1.0, "Smooth");
    roughness["5"] = CodeEntry(0.0, "Slickensided");

    auto& infill = t[RatingParameter::INFILL];
    infill["1"] = CodeEntry(6.0, "None");
    infill["2"] = CodeEntry(4.0, "Hard filling < 5 mm");
    infill["3"] = CodeEntry(2.0, "Hard filling > 5 mm");
    infill["4"] = CodeEntry(2.0, "Soft filling < 5 mm");
    infill["5"] = CodeEntry(0.0, "Soft filling > 5 mm");

    auto& weathering = t[RatingParameter::WEATHERING];
    weathering["1"] = CodeEntry(6.0, "Unweathered");
    weathering["2"] = CodeEntry(5.0, "Slightly weathered");
    weathering["3"] = CodeEntry(3.0, "Moderately weathered");
    weathering["4"] = CodeEntry(1.0, "Highly weathered");
    weathering["5"] = CodeEntry(0.0, "Decomposed");

    auto& groundwater = t[RatingParameter::GROUNDWATER];
    groundwater["1"] = CodeEntry(15.0, "Completely dry");
    groundwater["2"] = CodeEntry(10.0, "Damp");
    groundwater["3"] = CodeEntry(7.0, "Wet");
    groundwater["4"] = CodeEntry(4.0, "Dripping");
    groundwater["5"] = CodeEntry(0.0, "Flowing");

    return CodeDictionary(std::move(t));
}

CodeDictionary CodeDictionary::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return loadFromStream(file, filename);
}

CodeDictionary CodeDictionary::loadFromStream(std::istream& in, const std::string& source_name) {
    Table t;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trimCopy(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto fields = splitCsvLine(line);
        if (fields.size() < 3) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_num) +
                                     ": expected parameter,code,value");
        }

        if (toLowerCopy(fields[0]) == "parameter") {
            continue;  // Header
        }

        RatingParameter param;
        if (!parseRatingParameter(fields[0], param)) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_num) +
                                     ": unknown parameter '" + fields[0] + "'");
        }

        std::string code = canonicalCode(fields[1]);
        if (code.empty()) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_num) +
                                     ": empty code");
        }

        double value;
        try {
            size_t consumed = 0;
            value = std::stod(fields[2], &consumed);
            if (consumed != fields[2].size()) {
                throw std::invalid_argument(fields[2]);
            }
        } catch (const std::exception&) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_num) +
                                     ": value '" + fields[2] + "' is not a number");
        }

        auto& codes = t[param];
        if (codes.count(code) > 0) {
            throw std::runtime_error(source_name + ":" + std::to_string(line_num) +
                                     ": duplicate " + toString(param) + " code '" +
                                     code + "'");
        }

        std::string description;
        for (size_t i = 3; i < fields.size(); ++i) {
            if (i > 3) description += ",";
            description += fields[i];
        }

        codes[code] = CodeEntry(value, description);
    }

    return CodeDictionary(std::move(t));
}

// =============================================================================
// Lookup
// =============================================================================

const CodeEntry* CodeDictionary::getEntry(RatingParameter parameter,
                                          const std::string& code) const {
    auto param_it = table_.find(parameter);
    if (param_it == table_.end()) return nullptr;

    auto code_it = param_it->second.find(canonicalCode(code));
    if (code_it == param_it->second.end()) return nullptr;

    return &(code_it->second);
}

double CodeDictionary::ratingFor(RatingParameter parameter, const std::string& code) const {
    const CodeEntry* entry = getEntry(parameter, code);
    if (!entry) {
        throw UnknownCodeError(parameter, trimCopy(code));
    }
    return entry->value;
}

bool CodeDictionary::hasCode(RatingParameter parameter, const std::string& code) const {
    return getEntry(parameter, code) != nullptr;
}

std::vector<std::string> CodeDictionary::getCodes(RatingParameter parameter) const {
    std::vector<std::string> codes;
    auto it = table_.find(parameter);
    if (it != table_.end()) {
        for (const auto& pair : it->second) {
            codes.push_back(pair.first);
        }
    }
    return codes;
}

size_t CodeDictionary::size() const {
    size_t n = 0;
    for (const auto& pair : table_) {
        n += pair.second.size();
    }
    return n;
}

void CodeDictionary::writeTable(std::ostream& out) const {
    out << "parameter,code,value,description\n";
    for (RatingParameter param : allRatingParameters()) {
        auto it = table_.find(param);
        if (it == table_.end()) continue;
        for (const auto& [code, entry] : it->second) {
            out << toString(param) << "," << code << "," << entry.value << ","
                << entry.description << "\n";
        }
    }
}

} // namespace RMRS
