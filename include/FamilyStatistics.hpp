#ifndef FAMILY_STATISTICS_HPP
#define FAMILY_STATISTICS_HPP

/**
 * @file FamilyStatistics.hpp
 * @brief Discontinuity families and their per-family RMR
 *
 * A family is re-rated with the station aggregator restricted to its
 * members. Its RQD comes from the family frequency: member count over the
 * summed traverse length of the stations that contribute members.
 */

#include "RMRS.hpp"
#include "Discontinuity.hpp"
#include "OrientationClustering.hpp"
#include "RatingAggregator.hpp"
#include <string>
#include <vector>

namespace RMRS {

/**
 * @brief Orientation family with its members resolved
 */
struct Family {
    int id;                                  ///< 1-based, in seed order
    Orientation mean;                        ///< Representative orientation
    double tolerance;                        ///< Tolerance used (deg)
    double fisher_kappa;
    double max_deviation;                    ///< Largest member deviation (deg)

    std::vector<size_t> member_indices;      ///< Indices into the clustered set
    std::vector<Discontinuity> members;      ///< In input order
    StructureType dominant_type;
    std::vector<std::string> stations;       ///< Contributing stations, first-seen order

    std::string ucs_class;                   ///< Strength code used for rating
    double traverse_length;                  ///< Summed traverse of contributing stations (m)

    Family();

    /// "F1", "F2", ...
    std::string label() const;
    size_t size() const { return members.size(); }
};

/**
 * @brief Family definition plus its RMR result
 */
struct FamilySummary {
    Family family;
    RmrScore score;
};

class FamilyStatistics {
public:
    FamilyStatistics(const RatingAggregator& aggregator, double orientation_adjustment);

    /**
     * @brief Resolve clustering output into families
     *
     * @param clustering Result over the orientations of @p discontinuities
     * @param discontinuities The clustered set, in clustering input order
     * @param stations Stations supplying traverse lengths and UCS classes
     */
    static std::vector<Family> buildFamilies(const ClusteringResult& clustering,
                                             const std::vector<Discontinuity>& discontinuities,
                                             const std::vector<Station>& stations);

    /**
     * @brief RMR of one family
     * @throws EmptyInputError, UnknownCodeError, InsufficientDataError, InvalidRangeError
     */
    RmrScore score(const Family& family) const;

    FamilySummary summarize(const Family& family) const;

    /// Most frequent structure type; ties go to the type seen first
    static StructureType dominantType(const std::vector<Discontinuity>& members);

    /// Station ids of the members in first-seen order
    static std::vector<std::string> contributingStations(const std::vector<Discontinuity>& members);

private:
    const RatingAggregator& aggregator_;
    double orientation_adjustment_;
};

} // namespace RMRS

#endif // FAMILY_STATISTICS_HPP
