#ifndef RATING_AGGREGATOR_HPP
#define RATING_AGGREGATOR_HPP

/**
 * @file RatingAggregator.hpp
 * @brief Six-parameter RMR aggregation for a station or a family
 *
 * Partial ratings:
 * 1. Strength       - dictionary rating of the UCS class
 * 2. RQD            - banded rating of the measured or estimated RQD
 * 3. Spacing        - banded rating of the mean member spacing (mm)
 * 4. Condition      - persistence + aperture + roughness + infill + weathering,
 *                     each taken from the worst (lowest rated) member
 * 5. Groundwater    - rating of the most frequent groundwater code
 * 6. Orientation    - configured penalty (<= 0)
 */

#include "RMRS.hpp"
#include "Discontinuity.hpp"
#include "RQDEstimator.hpp"
#include "RockMassClassification.hpp"
#include <string>
#include <vector>

namespace RMRS {

/**
 * @brief Condition-of-discontinuities sub-ratings
 */
struct ConditionRatings {
    double persistence;
    double aperture;
    double roughness;
    double infill;
    double weathering;

    ConditionRatings()
        : persistence(0.0), aperture(0.0), roughness(0.0), infill(0.0), weathering(0.0) {}

    double total() const {
        return persistence + aperture + roughness + infill + weathering;
    }
};

/**
 * @brief RMR result of one station or family
 */
struct RmrScore {
    std::string unit;                    ///< Station or family identifier

    // Partial ratings
    double strength_rating;
    double rqd_rating;
    double spacing_rating;
    double condition_rating;
    double groundwater_rating;
    double orientation_adjustment;

    ConditionRatings condition;          ///< Breakdown of condition_rating

    double total;
    Classification classification;

    // Inputs as resolved
    std::string ucs_class;
    double rqd;                          ///< RQD used (%)
    bool rqd_derived;                    ///< Estimated from frequency
    double frequency;                    ///< Discontinuities per metre (0 if RQD measured)
    double mean_spacing_mm;
    std::string dominant_groundwater_code;
    size_t discontinuity_count;
    double traverse_length;              ///< Scanline length used for the frequency (m)

    RmrScore();
};

/**
 * @brief Run-level inputs to an aggregation
 */
struct RatingInputs {
    std::string ucs_class;               ///< Strength code, e.g. "R4"
    RQDInput rqd;
    double orientation_adjustment;

    RatingInputs() : orientation_adjustment(DEFAULT_ORIENTATION_ADJUSTMENT) {}
};

class RatingAggregator {
public:
    explicit RatingAggregator(const CodeDictionary& dictionary);

    /**
     * @brief Aggregate the six parameters over a set of discontinuities
     * @param unit Station or family name, carried into errors and the score
     * @throws EmptyInputError if members is empty
     * @throws UnknownCodeError naming the member row and parameter
     * @throws InsufficientDataError if RQD cannot be determined
     * @throws InvalidRangeError for a positive orientation adjustment or a
     *         total outside [0,100]
     */
    RmrScore aggregate(const std::string& unit,
                       const std::vector<Discontinuity>& members,
                       const RatingInputs& inputs) const;

    /**
     * @brief Aggregate a station using its own UCS class, RQD and traverse length
     */
    RmrScore scoreStation(const Station& station, double orientation_adjustment) const;

    /**
     * @brief Worst member rating of each condition sub-parameter
     */
    ConditionRatings worstCondition(const std::string& unit,
                                    const std::vector<Discontinuity>& members) const;

    /**
     * @brief Mean spacing of the members in millimetres
     */
    double meanSpacing(const std::string& unit,
                       const std::vector<Discontinuity>& members) const;

    /**
     * @brief Banded spacing rating
     *
     * >= 2000 mm -> 20, >= 600 -> 15, >= 200 -> 10, >= 60 -> 8, else 5
     */
    static double spacingRating(double spacing_mm);

    /**
     * @brief Most frequent groundwater code; ties go to the code seen first
     */
    static std::string dominantGroundwaterCode(const std::vector<Discontinuity>& members);

private:
    double lookup(RatingParameter param, const Discontinuity& member,
                  const std::string& unit) const;

    const CodeDictionary& dictionary_;
};

} // namespace RMRS

#endif // RATING_AGGREGATOR_HPP
