#ifndef RMR_ANALYSIS_HPP
#define RMR_ANALYSIS_HPP

/**
 * @file RmrAnalysis.hpp
 * @brief Batch pipeline: records -> stations and families -> RMR results
 *
 * prepare() validates the records, groups them into stations, applies
 * per-station overrides and clusters every valid discontinuity of the
 * project. Stations and families are then scored independently, by index,
 * so a driver can distribute them over processes. A unit that cannot be
 * scored yields a UnitFailure; the others are unaffected.
 */

#include "RMRS.hpp"
#include "CodeDictionary.hpp"
#include "ConfigReader.hpp"
#include "Discontinuity.hpp"
#include "FamilyStatistics.hpp"
#include "OrientationClustering.hpp"
#include "RatingAggregator.hpp"
#include "RmrErrors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace RMRS {

/**
 * @brief Run parameters of an analysis
 */
struct AnalysisSettings {
    std::string default_ucs_class;
    double orientation_adjustment;
    bool clustering_enabled;
    ClusteringOptions clustering;
    std::vector<ConfigReader::StationConfig> station_overrides;

    AnalysisSettings()
        : default_ucs_class("R4"),
          orientation_adjustment(DEFAULT_ORIENTATION_ADJUSTMENT),
          clustering_enabled(true) {}

    /// Settings from the [ANALYSIS], [CLUSTERING] and [STATION.*] sections
    static AnalysisSettings fromConfig(const ConfigReader& config);
};

struct StationResult {
    std::string station;
    std::optional<RmrScore> score;
    std::optional<UnitFailure> failure;

    bool ok() const { return score.has_value(); }
};

struct FamilyResult {
    std::optional<FamilySummary> summary;
    std::optional<UnitFailure> failure;

    bool ok() const { return summary.has_value(); }
};

/**
 * @brief Project-level figures
 */
struct ProjectSummary {
    size_t record_count;
    size_t valid_record_count;
    size_t station_count;
    size_t scored_station_count;
    size_t family_count;
    size_t unclustered_count;
    double mean_rmr;                             ///< Mean of scored station totals
    std::optional<Classification> dominant_class;

    ProjectSummary()
        : record_count(0), valid_record_count(0), station_count(0),
          scored_station_count(0), family_count(0), unclustered_count(0),
          mean_rmr(0.0) {}
};

class RmrAnalysis {
public:
    RmrAnalysis(const CodeDictionary& dictionary, const AnalysisSettings& settings);

    /**
     * @brief Validate, group and cluster
     * @param read_errors Rows the reader already rejected, kept in the error list
     * @throws InvalidRangeError for invalid settings
     */
    void prepare(const std::vector<DiscontinuityRecord>& records,
                 const std::vector<RecordError>& read_errors = {});

    size_t stationCount() const { return stations_.size(); }
    size_t familyCount() const { return families_.size(); }

    StationResult scoreStation(size_t index) const;
    FamilyResult scoreFamily(size_t index) const;

    std::vector<StationResult> scoreStations() const;
    std::vector<FamilyResult> scoreFamilies() const;

    /**
     * @brief Project summary from the totals of the scored stations
     *
     * The dominant class is the most frequent one; ties go to the better class.
     */
    ProjectSummary summarize(const std::vector<double>& station_totals) const;

    const std::vector<Station>& stations() const { return stations_; }
    const std::vector<Family>& families() const { return families_; }
    const std::vector<Discontinuity>& validDiscontinuities() const { return valid_; }
    const std::vector<Discontinuity>& unclustered() const { return unclustered_; }
    const std::vector<RecordError>& recordErrors() const { return record_errors_; }
    const AnalysisSettings& settings() const { return settings_; }

private:
    void applyOverrides();

    const CodeDictionary& dictionary_;
    AnalysisSettings settings_;
    RatingAggregator aggregator_;

    size_t record_count_;
    std::vector<Discontinuity> valid_;
    std::vector<RecordError> record_errors_;
    std::vector<Station> stations_;
    std::vector<Family> families_;
    std::vector<Discontinuity> unclustered_;
};

} // namespace RMRS

#endif // RMR_ANALYSIS_HPP
