#include "RatingAggregator.hpp"
#include "CodeDictionary.hpp"
#include "RmrErrors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace RMRS {

RmrScore::RmrScore()
    : strength_rating(0.0), rqd_rating(0.0), spacing_rating(0.0),
      condition_rating(0.0), groundwater_rating(0.0), orientation_adjustment(0.0),
      total(0.0), classification{RockMassClass::CLASS_V, "Very Poor"},
      rqd(0.0), rqd_derived(false), frequency(0.0), mean_spacing_mm(0.0),
      discontinuity_count(0), traverse_length(0.0) {}

RatingAggregator::RatingAggregator(const CodeDictionary& dictionary)
    : dictionary_(dictionary) {}

double RatingAggregator::lookup(RatingParameter param, const Discontinuity& member,
                                const std::string& unit) const {
    try {
        return dictionary_.ratingFor(param, member.code(param));
    } catch (const UnknownCodeError& e) {
        throw e.withContext(member.source_row, unit);
    }
}

// =============================================================================
// Individual parameters
// =============================================================================

double RatingAggregator::spacingRating(double spacing_mm) {
    if (spacing_mm >= 2000.0) return 20.0;
    if (spacing_mm >= 600.0) return 15.0;
    if (spacing_mm >= 200.0) return 10.0;
    if (spacing_mm >= 60.0) return 8.0;
    return 5.0;
}

double RatingAggregator::meanSpacing(const std::string& unit,
                                     const std::vector<Discontinuity>& members) const {
    if (members.empty()) {
        throw EmptyInputError(unit);
    }
    double sum = 0.0;
    for (const auto& member : members) {
        sum += lookup(RatingParameter::SPACING, member, unit);
    }
    return sum / members.size();
}

ConditionRatings RatingAggregator::worstCondition(const std::string& unit,
                                                  const std::vector<Discontinuity>& members) const {
    if (members.empty()) {
        throw EmptyInputError(unit);
    }

    const double inf = std::numeric_limits<double>::infinity();
    ConditionRatings worst;
    worst.persistence = worst.aperture = worst.roughness = worst.infill = worst.weathering = inf;

    for (const auto& member : members) {
        worst.persistence = std::min(worst.persistence,
                                     lookup(RatingParameter::PERSISTENCE, member, unit));
        worst.aperture = std::min(worst.aperture,
                                  lookup(RatingParameter::APERTURE, member, unit));
        worst.roughness = std::min(worst.roughness,
                                   lookup(RatingParameter::ROUGHNESS, member, unit));
        worst.infill = std::min(worst.infill,
                                lookup(RatingParameter::INFILL, member, unit));
        worst.weathering = std::min(worst.weathering,
                                    lookup(RatingParameter::WEATHERING, member, unit));
    }

    return worst;
}

std::string RatingAggregator::dominantGroundwaterCode(const std::vector<Discontinuity>& members) {
    std::map<std::string, int> counts;
    std::vector<std::string> first_seen;

    for (const auto& member : members) {
        if (counts[member.groundwater_code]++ == 0) {
            first_seen.push_back(member.groundwater_code);
        }
    }

    std::string dominant;
    int best = 0;
    for (const auto& code : first_seen) {
        if (counts[code] > best) {
            best = counts[code];
            dominant = code;
        }
    }
    return dominant;
}

// =============================================================================
// Aggregation
// =============================================================================

RmrScore RatingAggregator::aggregate(const std::string& unit,
                                     const std::vector<Discontinuity>& members,
                                     const RatingInputs& inputs) const {
    if (members.empty()) {
        throw EmptyInputError(unit);
    }

    if (!std::isfinite(inputs.orientation_adjustment) || inputs.orientation_adjustment > 0.0) {
        throw InvalidRangeError("orientation_adjustment", inputs.orientation_adjustment, -1, unit);
    }

    RmrScore score;
    score.unit = unit;
    score.discontinuity_count = members.size();
    score.ucs_class = CodeDictionary::canonicalCode(inputs.ucs_class);
    score.traverse_length = inputs.rqd.traverse_length.value_or(0.0);

    // 1. Strength
    try {
        score.strength_rating = dictionary_.ratingFor(RatingParameter::STRENGTH, inputs.ucs_class);
    } catch (const UnknownCodeError& e) {
        throw e.withContext(-1, unit);
    }

    // 2. RQD
    RQDInput rqd_input = inputs.rqd;
    rqd_input.discontinuity_count = members.size();
    RQDEstimate estimate = RQDEstimator::estimate(rqd_input, unit);
    score.rqd = estimate.rqd;
    score.rqd_derived = estimate.derived;
    score.frequency = estimate.frequency;
    score.rqd_rating = RQDEstimator::rating(estimate.rqd);

    // 3. Spacing
    score.mean_spacing_mm = meanSpacing(unit, members);
    score.spacing_rating = spacingRating(score.mean_spacing_mm);

    // 4. Condition (worst member per sub-parameter)
    score.condition = worstCondition(unit, members);
    score.condition_rating = score.condition.total();

    // 5. Groundwater
    score.dominant_groundwater_code = dominantGroundwaterCode(members);
    for (const auto& member : members) {
        if (member.groundwater_code == score.dominant_groundwater_code) {
            score.groundwater_rating = lookup(RatingParameter::GROUNDWATER, member, unit);
            break;
        }
    }

    // 6. Orientation
    score.orientation_adjustment = inputs.orientation_adjustment;

    score.total = score.strength_rating + score.rqd_rating + score.spacing_rating +
                  score.condition_rating + score.groundwater_rating +
                  score.orientation_adjustment;

    try {
        score.classification = classifyRockMass(score.total);
    } catch (const InvalidRangeError& e) {
        throw InvalidRangeError(e.field(), e.value(), -1, unit);
    }

    return score;
}

RmrScore RatingAggregator::scoreStation(const Station& station,
                                        double orientation_adjustment) const {
    RatingInputs inputs;
    inputs.ucs_class = station.ucs_class;
    inputs.orientation_adjustment = orientation_adjustment;
    inputs.rqd.rqd = station.rqd;

    double length = station.effectiveTraverseLength();
    if (length > 0.0) {
        inputs.rqd.traverse_length = length;
    }

    RmrScore score = aggregate("station " + station.id, station.discontinuities, inputs);
    score.unit = station.id;
    return score;
}

} // namespace RMRS
