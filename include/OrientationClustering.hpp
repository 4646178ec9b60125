#ifndef ORIENTATION_CLUSTERING_HPP
#define ORIENTATION_CLUSTERING_HPP

/**
 * @file OrientationClustering.hpp
 * @brief Greedy grouping of discontinuity orientations into families
 *
 * Clusters are grown concurrently in passes over the input. Each pass
 * visits the orientations not yet in a cluster in input order; an
 * orientation joins the first cluster, in seed order, whose current mean
 * admits it, and the mean is recomputed after every admission. An
 * orientation no cluster admits seeds a new cluster. After a pass, each
 * cluster evicts the member farthest outside the tolerance of its mean,
 * one at a time until all members are admitted again; an evicted
 * orientation may join any other cluster in the next pass but never the
 * one that evicted it. Passes repeat until a pass evicts nothing. Clusters
 * with fewer than the minimum membership are dissolved and their members
 * reported as unclustered.
 *
 * Under TWO_THRESHOLD dip direction is circular (distances wrap at 0/360
 * and the mean is taken over unit vectors) and dip is linear. Under
 * GREAT_CIRCLE the mean is the direction of the resultant of the
 * sign-aligned poles.
 */

#include "RMRS.hpp"
#include "Discontinuity.hpp"
#include <vector>

namespace RMRS {

/**
 * @brief Clustering parameters
 */
struct ClusteringOptions {
    double tolerance;            ///< Admission tolerance τ (degrees)
    int min_members;             ///< Minimum family membership m
    ClusterMetric metric;        ///< Admission rule

    ClusteringOptions()
        : tolerance(DEFAULT_CLUSTER_TOLERANCE),
          min_members(DEFAULT_MIN_FAMILY_MEMBERS),
          metric(ClusterMetric::TWO_THRESHOLD) {}

    /// @throws InvalidRangeError if tolerance is not in (0,180] or min_members < 1
    void validate() const;
};

/**
 * @brief One family found by the clustering
 */
struct OrientationCluster {
    Orientation mean;                    ///< Representative orientation
    std::vector<size_t> members;         ///< Input indices, ascending
    double fisher_kappa;                 ///< Concentration of the member poles
    double max_deviation;                ///< Largest member distance from the mean (deg)

    OrientationCluster() : fisher_kappa(0.0), max_deviation(0.0) {}
};

/**
 * @brief Output of a clustering run
 */
struct ClusteringResult {
    std::vector<OrientationCluster> families;    ///< In order of their seeds
    std::vector<size_t> unclustered;             ///< Input indices, ascending
    ClusteringOptions options;                   ///< Parameters used
};

class OrientationClustering {
public:
    explicit OrientationClustering(const ClusteringOptions& options = ClusteringOptions());

    /**
     * @brief Group orientations into families
     *
     * Deterministic for a given input order. Every input index appears in
     * exactly one family or in the unclustered list.
     */
    ClusteringResult cluster(const std::vector<Orientation>& orientations) const;

    /**
     * @brief Admission test of an orientation against a cluster mean
     */
    bool joinable(const Orientation& orientation, const Orientation& mean) const;

    /**
     * @brief Distance used for reporting deviations under the configured metric
     *
     * TWO_THRESHOLD: larger of the dip-direction and dip distances.
     * GREAT_CIRCLE: angle between poles.
     */
    double deviation(const Orientation& a, const Orientation& b) const;

    /**
     * @brief Fisher concentration estimate (n - 1) / (n - R) of plane poles
     *
     * Returns 0 for fewer than two orientations.
     */
    static double fisherKappa(const std::vector<Orientation>& orientations);

    /**
     * @brief Mean plane from the resultant of the poles, each flipped onto
     *        the side of the first one
     *
     * Steep planes recorded with opposite dip directions average to a steep
     * plane. Falls back to the first orientation when the poles cancel.
     *
     * @throws EmptyInputError if orientations is empty
     */
    static Orientation poleMean(const std::vector<Orientation>& orientations);

    const ClusteringOptions& options() const { return options_; }

private:
    /// Cluster mean of the given members under the configured metric
    Orientation meanOf(const std::vector<Orientation>& orientations,
                       const std::vector<size_t>& members) const;

    ClusteringOptions options_;
};

} // namespace RMRS

#endif // ORIENTATION_CLUSTERING_HPP
