#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace RMRS {

namespace {
const std::string STATION_PREFIX = "STATION.";
}

ConfigReader::ConfigReader() {}

ClusteringOptions ConfigReader::ClusteringConfig::toOptions() const {
    ClusteringOptions options;
    options.tolerance = tolerance;
    options.min_members = min_members;
    options.metric = metric;
    return options;
}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            data[current_section];
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << " in " << filename
                      << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    return trimCopy(str);
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = toLowerCopy(getString(section, key));
    if (val.empty()) return default_val;

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::optional<double> ConfigReader::getOptionalDouble(const std::string& section,
                                                      const std::string& key) const {
    std::string val = getString(section, key);
    if (val.empty()) return std::nullopt;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "] " << key
                  << " = '" << val << "' as double" << std::endl;
        return std::nullopt;
    }
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

void ConfigReader::set(const std::string& section, const std::string& key,
                       const std::string& value) {
    data[section][key] = value;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values from the other file override existing ones
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
        data[section.first];
    }

    return true;
}

// =============================================================================
// Section Parsers
// =============================================================================

bool ConfigReader::parseAnalysisConfig(AnalysisConfig& config) const {
    if (!hasSection("ANALYSIS")) return false;

    config.project_name = getString("ANALYSIS", "project_name", config.project_name);
    config.ucs_class = getString("ANALYSIS", "ucs_class", config.ucs_class);
    config.orientation_adjustment = getDouble("ANALYSIS", "orientation_adjustment",
                                              config.orientation_adjustment);
    return true;
}

bool ConfigReader::parseClusteringConfig(ClusteringConfig& config) const {
    if (!hasSection("CLUSTERING")) return false;

    config.enabled = getBool("CLUSTERING", "enabled", config.enabled);
    config.tolerance = getDouble("CLUSTERING", "tolerance", config.tolerance);
    config.min_members = getInt("CLUSTERING", "min_members", config.min_members);

    std::string metric = getString("CLUSTERING", "metric");
    if (!metric.empty() && !parseClusterMetric(metric, config.metric)) {
        std::cerr << "Warning: Unknown clustering metric '" << metric
                  << "', using " << toString(config.metric) << std::endl;
    }
    return true;
}

bool ConfigReader::parseInputConfig(InputConfig& config) const {
    if (!hasSection("INPUT")) return false;

    config.data_file = getString("INPUT", "data_file", config.data_file);
    config.dictionary_file = getString("INPUT", "dictionary_file", config.dictionary_file);
    return true;
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    if (!hasSection("OUTPUT")) return false;

    config.base_path = getString("OUTPUT", "path", config.base_path);
    config.write_stations = getBool("OUTPUT", "stations", config.write_stations);
    config.write_families = getBool("OUTPUT", "families", config.write_families);
    config.write_unclustered = getBool("OUTPUT", "unclustered", config.write_unclustered);
    config.write_errors = getBool("OUTPUT", "errors", config.write_errors);
    return true;
}

std::vector<ConfigReader::StationConfig> ConfigReader::parseStationConfigs() const {
    std::vector<StationConfig> stations;

    for (const auto& section : getSectionsMatching(STATION_PREFIX)) {
        StationConfig sc;
        sc.id = section.substr(STATION_PREFIX.size());
        if (sc.id.empty()) {
            std::cerr << "Warning: Section [" << section << "] names no station" << std::endl;
            continue;
        }
        sc.rqd = getOptionalDouble(section, "rqd");
        sc.traverse_length = getOptionalDouble(section, "traverse_length");
        sc.ucs_class = getString(section, "ucs_class");
        stations.push_back(sc);
    }

    return stations;
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("ANALYSIS")) {
        result.warnings.push_back("No [ANALYSIS] section found - using defaults");
    }

    if (getString("INPUT", "data_file").empty()) {
        result.warnings.push_back("No data_file in [INPUT] - must be given on the command line");
    }

    AnalysisConfig analysis;
    parseAnalysisConfig(analysis);
    if (!std::isfinite(analysis.orientation_adjustment) || analysis.orientation_adjustment > 0.0) {
        result.errors.push_back("Invalid orientation_adjustment (must be <= 0)");
        result.valid = false;
    }
    if (trimCopy(analysis.ucs_class).empty()) {
        result.errors.push_back("Empty ucs_class in [ANALYSIS]");
        result.valid = false;
    }

    ClusteringConfig clustering;
    parseClusteringConfig(clustering);
    if (!(clustering.tolerance > 0.0 && clustering.tolerance <= 180.0)) {
        result.errors.push_back("Invalid clustering tolerance (must be in (0, 180] degrees)");
        result.valid = false;
    }
    if (clustering.min_members < 1) {
        result.errors.push_back("Invalid min_members (must be >= 1)");
        result.valid = false;
    }
    std::string metric = getString("CLUSTERING", "metric");
    ClusterMetric parsed = ClusterMetric::TWO_THRESHOLD;
    if (!metric.empty() && !parseClusterMetric(metric, parsed)) {
        result.errors.push_back("Unknown clustering metric '" + metric + "'");
        result.valid = false;
    }

    for (const auto& station : parseStationConfigs()) {
        if (station.rqd && (*station.rqd < 0.0 || *station.rqd > 100.0)) {
            result.errors.push_back("Invalid rqd for station " + station.id + " (must be 0-100)");
            result.valid = false;
        }
        if (station.traverse_length && *station.traverse_length <= 0.0) {
            result.errors.push_back("Invalid traverse_length for station " + station.id +
                                    " (must be > 0)");
            result.valid = false;
        }
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << "# RMRS Configuration File\n";
    file << "# Angles in degrees, lengths in metres\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[ANALYSIS]\n";
    file << "project_name = RMR analysis\n";
    file << "ucs_class = R4                       # Strength grade R0-R6\n";
    file << "orientation_adjustment = -5.0        # Penalty, must be <= 0\n\n";

    file << "[CLUSTERING]\n";
    file << "enabled = true\n";
    file << "tolerance = 15.0                     # Admission tolerance (degrees)\n";
    file << "min_members = 3                      # Smaller groups are reported unclustered\n";
    file << "metric = TWO_THRESHOLD               # TWO_THRESHOLD or GREAT_CIRCLE\n\n";

    file << "[INPUT]\n";
    file << "data_file = discontinuities.csv\n";
    file << "# dictionary_file = codes.csv        # Omit to use the built-in RMR table\n\n";

    file << "[OUTPUT]\n";
    file << "path = output/rmr                    # Prefix of the result tables\n";
    file << "stations = true                      # <path>_stations.csv\n";
    file << "families = true                      # <path>_families.csv\n";
    file << "unclustered = true                   # <path>_unclustered.csv\n";
    file << "errors = true                        # <path>_errors.csv\n\n";

    file << "# Per-station overrides\n";
    file << "# [STATION.ST-01]\n";
    file << "# rqd = 78.2                         # Measured RQD (%)\n";
    file << "# traverse_length = 10.0             # Scanline length (m)\n";
    file << "# ucs_class = R5\n";
}

} // namespace RMRS
