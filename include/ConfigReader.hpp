#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "RMRS.hpp"
#include "OrientationClustering.hpp"
#include <string>
#include <map>
#include <vector>
#include <optional>
#include <fstream>
#include <sstream>

namespace RMRS {

/**
 * @brief INI-style configuration reader
 *
 * Sections:
 *   [ANALYSIS]       ucs_class, orientation_adjustment, project_name
 *   [CLUSTERING]     enabled, tolerance, min_members, metric
 *   [INPUT]          data_file, dictionary_file
 *   [OUTPUT]         path, stations, families, unclustered, errors
 *   [STATION.<id>]   rqd, traverse_length, ucs_class
 *
 * Everything has a default, so an analysis can run from an empty file
 * plus a data file given on the command line.
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    struct AnalysisConfig {
        std::string project_name;
        std::string ucs_class;               // Default strength code for all stations
        double orientation_adjustment;       // <= 0

        AnalysisConfig()
            : project_name("RMR analysis"), ucs_class("R4"),
              orientation_adjustment(DEFAULT_ORIENTATION_ADJUSTMENT) {}
    };

    struct ClusteringConfig {
        bool enabled;
        double tolerance;                    // degrees
        int min_members;
        ClusterMetric metric;

        ClusteringConfig()
            : enabled(true), tolerance(DEFAULT_CLUSTER_TOLERANCE),
              min_members(DEFAULT_MIN_FAMILY_MEMBERS),
              metric(ClusterMetric::TWO_THRESHOLD) {}

        ClusteringOptions toOptions() const;
    };

    struct InputConfig {
        std::string data_file;               // Discontinuity CSV
        std::string dictionary_file;         // Empty: built-in table
    };

    struct OutputConfig {
        std::string base_path;               // Prefix of the result tables
        bool write_stations;
        bool write_families;
        bool write_unclustered;
        bool write_errors;

        OutputConfig()
            : base_path("output/rmr"), write_stations(true), write_families(true),
              write_unclustered(true), write_errors(true) {}
    };

    struct StationConfig {
        std::string id;
        std::optional<double> rqd;               // Measured RQD (%)
        std::optional<double> traverse_length;   // Scanline length (m)
        std::string ucs_class;                   // Empty: [ANALYSIS] ucs_class
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    bool loadFile(const std::string& filename);

    // =========================================================================
    // Section Parsers
    // =========================================================================

    /// Fill @p config; returns false (defaults kept) if the section is absent
    bool parseAnalysisConfig(AnalysisConfig& config) const;
    bool parseClusteringConfig(ClusteringConfig& config) const;
    bool parseInputConfig(InputConfig& config) const;
    bool parseOutputConfig(OutputConfig& config) const;

    /// One entry per [STATION.<id>] section
    std::vector<StationConfig> parseStationConfigs() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::optional<double> getOptionalDouble(const std::string& section,
                                            const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;

    /// Set a value, as the command line does for overrides
    void set(const std::string& section, const std::string& key, const std::string& value);

    /// Values of @p filename override the ones already loaded
    bool mergeFile(const std::string& filename);

    ValidationResult validate() const;

    /// Write an annotated configuration with every key at its default
    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
};

} // namespace RMRS

#endif // CONFIG_READER_HPP
