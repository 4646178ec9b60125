#include "RmrAnalysis.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>

namespace RMRS {

// =============================================================================
// AnalysisSettings
// =============================================================================

AnalysisSettings AnalysisSettings::fromConfig(const ConfigReader& config) {
    AnalysisSettings settings;

    ConfigReader::AnalysisConfig analysis;
    config.parseAnalysisConfig(analysis);
    settings.default_ucs_class = analysis.ucs_class;
    settings.orientation_adjustment = analysis.orientation_adjustment;

    ConfigReader::ClusteringConfig clustering;
    config.parseClusteringConfig(clustering);
    settings.clustering_enabled = clustering.enabled;
    settings.clustering = clustering.toOptions();

    settings.station_overrides = config.parseStationConfigs();
    return settings;
}

// =============================================================================
// RmrAnalysis
// =============================================================================

RmrAnalysis::RmrAnalysis(const CodeDictionary& dictionary, const AnalysisSettings& settings)
    : dictionary_(dictionary), settings_(settings), aggregator_(dictionary),
      record_count_(0) {}

void RmrAnalysis::prepare(const std::vector<DiscontinuityRecord>& records,
                          const std::vector<RecordError>& read_errors) {
    if (!std::isfinite(settings_.orientation_adjustment) ||
        settings_.orientation_adjustment > 0.0) {
        throw InvalidRangeError("orientation_adjustment", settings_.orientation_adjustment);
    }
    settings_.clustering.validate();

    record_count_ = records.size() + read_errors.size();

    DiscontinuityValidator validator(dictionary_);
    ValidationReport report = validator.validateAll(records);

    valid_ = report.valid;
    record_errors_ = read_errors;
    record_errors_.insert(record_errors_.end(), report.errors.begin(), report.errors.end());
    std::stable_sort(record_errors_.begin(), record_errors_.end(),
                     [](const RecordError& a, const RecordError& b) {
                         return a.source_row < b.source_row;
                     });

    stations_ = groupByStation(valid_, settings_.default_ucs_class);
    applyOverrides();

    families_.clear();
    unclustered_.clear();

    if (!settings_.clustering_enabled) {
        return;
    }

    std::vector<Orientation> orientations;
    orientations.reserve(valid_.size());
    for (const auto& d : valid_) {
        orientations.push_back(d.orientation);
    }

    OrientationClustering clusterer(settings_.clustering);
    ClusteringResult clustering = clusterer.cluster(orientations);

    families_ = FamilyStatistics::buildFamilies(clustering, valid_, stations_);
    for (size_t idx : clustering.unclustered) {
        unclustered_.push_back(valid_[idx]);
    }
}

void RmrAnalysis::applyOverrides() {
    for (const auto& override_cfg : settings_.station_overrides) {
        auto it = std::find_if(stations_.begin(), stations_.end(),
                               [&](const Station& s) { return s.id == override_cfg.id; });
        if (it == stations_.end()) {
            std::cerr << "Warning: Configuration for station " << override_cfg.id
                      << " matches no station in the data" << std::endl;
            continue;
        }

        if (override_cfg.rqd) it->rqd = override_cfg.rqd;
        if (override_cfg.traverse_length) it->traverse_length = override_cfg.traverse_length;
        if (!override_cfg.ucs_class.empty()) it->ucs_class = override_cfg.ucs_class;
    }
}

StationResult RmrAnalysis::scoreStation(size_t index) const {
    const Station& station = stations_.at(index);

    StationResult result;
    result.station = station.id;
    try {
        result.score = aggregator_.scoreStation(station, settings_.orientation_adjustment);
    } catch (const RmrError& e) {
        result.failure = UnitFailure{"station", station.id, e.kind(), e.what()};
    }
    return result;
}

FamilyResult RmrAnalysis::scoreFamily(size_t index) const {
    const Family& family = families_.at(index);
    FamilyStatistics statistics(aggregator_, settings_.orientation_adjustment);

    FamilyResult result;
    try {
        result.summary = statistics.summarize(family);
    } catch (const RmrError& e) {
        result.failure = UnitFailure{"family", family.label(), e.kind(), e.what()};
    }
    return result;
}

std::vector<StationResult> RmrAnalysis::scoreStations() const {
    std::vector<StationResult> results;
    for (size_t i = 0; i < stations_.size(); ++i) {
        results.push_back(scoreStation(i));
    }
    return results;
}

std::vector<FamilyResult> RmrAnalysis::scoreFamilies() const {
    std::vector<FamilyResult> results;
    for (size_t i = 0; i < families_.size(); ++i) {
        results.push_back(scoreFamily(i));
    }
    return results;
}

ProjectSummary RmrAnalysis::summarize(const std::vector<double>& station_totals) const {
    ProjectSummary summary;
    summary.record_count = record_count_;
    summary.valid_record_count = valid_.size();
    summary.station_count = stations_.size();
    summary.scored_station_count = station_totals.size();
    summary.family_count = families_.size();
    summary.unclustered_count = unclustered_.size();

    if (station_totals.empty()) {
        return summary;
    }

    double sum = 0.0;
    std::map<RockMassClass, int> counts;
    for (double total : station_totals) {
        sum += total;
        counts[classifyRockMass(total).rock_class]++;
    }
    summary.mean_rmr = sum / station_totals.size();

    // Map order runs from Class I down, so the first maximum is the better class
    RockMassClass dominant = counts.begin()->first;
    for (const auto& [rock_class, count] : counts) {
        if (count > counts.at(dominant)) {
            dominant = rock_class;
        }
    }

    // Representative total of the dominant class gives back its descriptor
    for (double total : station_totals) {
        Classification c = classifyRockMass(total);
        if (c.rock_class == dominant) {
            summary.dominant_class = c;
            break;
        }
    }

    return summary;
}

} // namespace RMRS
