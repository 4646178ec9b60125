#include "OrientationClustering.hpp"
#include "RmrErrors.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace RMRS {

namespace {

// Absorbs rounding in the mean so that a point exactly at τ is admitted
constexpr double ANGLE_EPS = 1e-9;
constexpr double KAPPA_CAP = 1.0e6;
constexpr double RAD_TO_DEG = 180.0 / M_PI;

struct WorkingCluster {
    std::vector<size_t> members;         // admission order
    Orientation mean;
    std::vector<char> banned;            // evicted from this cluster
};

// Sum of the poles, each flipped onto the side of the first one
std::array<double, 3> alignedResultant(const std::vector<Orientation>& orientations) {
    std::array<double, 3> R = {0.0, 0.0, 0.0};
    if (orientations.empty()) return R;

    auto reference = orientations.front().pole();
    for (const auto& o : orientations) {
        auto p = o.pole();
        double dot = p[0] * reference[0] + p[1] * reference[1] + p[2] * reference[2];
        double sign = (dot >= 0.0) ? 1.0 : -1.0;
        R[0] += sign * p[0];
        R[1] += sign * p[1];
        R[2] += sign * p[2];
    }
    return R;
}

} // namespace

// ============================================================================
// ClusteringOptions
// ============================================================================

void ClusteringOptions::validate() const {
    if (!std::isfinite(tolerance) || tolerance <= 0.0 || tolerance > 180.0) {
        throw InvalidRangeError("tolerance", tolerance);
    }
    if (min_members < 1) {
        throw InvalidRangeError("min_members", min_members);
    }
}

// ============================================================================
// OrientationClustering
// ============================================================================

OrientationClustering::OrientationClustering(const ClusteringOptions& options)
    : options_(options) {
    options_.validate();
}

bool OrientationClustering::joinable(const Orientation& orientation,
                                     const Orientation& mean) const {
    const double tol = options_.tolerance + ANGLE_EPS;

    if (options_.metric == ClusterMetric::GREAT_CIRCLE) {
        return greatCircleDistance(orientation, mean) <= tol;
    }

    return circularDistance(orientation.dip_direction, mean.dip_direction) <= tol &&
           std::abs(orientation.dip - mean.dip) <= tol;
}

double OrientationClustering::deviation(const Orientation& a, const Orientation& b) const {
    if (options_.metric == ClusterMetric::GREAT_CIRCLE) {
        return greatCircleDistance(a, b);
    }
    return std::max(circularDistance(a.dip_direction, b.dip_direction),
                    std::abs(a.dip - b.dip));
}

double OrientationClustering::fisherKappa(const std::vector<Orientation>& orientations) {
    const size_t n = orientations.size();
    if (n < 2) {
        return 0.0;
    }

    auto resultant = alignedResultant(orientations);
    double R = std::sqrt(resultant[0] * resultant[0] + resultant[1] * resultant[1] +
                         resultant[2] * resultant[2]);
    double spread = static_cast<double>(n) - R;

    if (spread < (n - 1) / KAPPA_CAP) {
        return KAPPA_CAP;
    }
    return (n - 1) / spread;
}

Orientation OrientationClustering::poleMean(const std::vector<Orientation>& orientations) {
    if (orientations.empty()) {
        throw EmptyInputError("orientations for pole mean");
    }

    auto R = alignedResultant(orientations);
    double horizontal = std::sqrt(R[0] * R[0] + R[1] * R[1]);
    if (horizontal + std::abs(R[2]) < 1e-12) {
        return orientations.front();
    }

    // Upward pole keeps the dip in [0,90]
    if (R[2] < 0.0) {
        R[0] = -R[0];
        R[1] = -R[1];
        R[2] = -R[2];
    }

    double dip = std::atan2(horizontal, R[2]) * RAD_TO_DEG;
    double dip_direction = horizontal < 1e-12
        ? orientations.front().dip_direction
        : normalizeDipDirection(std::atan2(R[0], R[1]) * RAD_TO_DEG);
    return Orientation(dip_direction, dip);
}

Orientation OrientationClustering::meanOf(const std::vector<Orientation>& orientations,
                                          const std::vector<size_t>& members) const {
    std::vector<Orientation> subset;
    subset.reserve(members.size());
    for (size_t idx : members) {
        subset.push_back(orientations[idx]);
    }
    if (options_.metric == ClusterMetric::GREAT_CIRCLE) {
        return poleMean(subset);
    }
    return meanOrientation(subset);
}

ClusteringResult OrientationClustering::cluster(const std::vector<Orientation>& orientations) const {
    ClusteringResult result;
    result.options = options_;

    const size_t n = orientations.size();
    const size_t unassigned = n;
    std::vector<size_t> assigned(n, unassigned);
    std::vector<WorkingCluster> clusters;

    bool evicted = true;
    while (evicted) {
        evicted = false;

        // First fit in input order: the earliest-seeded cluster whose current
        // mean admits the orientation takes it, otherwise it seeds a new one
        for (size_t i = 0; i < n; ++i) {
            if (assigned[i] != unassigned) continue;

            for (size_t c = 0; c < clusters.size(); ++c) {
                WorkingCluster& cl = clusters[c];
                if (cl.banned[i] || !joinable(orientations[i], cl.mean)) continue;
                cl.members.push_back(i);
                cl.mean = meanOf(orientations, cl.members);
                assigned[i] = c;
                break;
            }

            if (assigned[i] == unassigned) {
                WorkingCluster cl;
                cl.members.push_back(i);
                cl.mean = meanOf(orientations, cl.members);
                cl.banned.assign(n, 0);
                assigned[i] = clusters.size();
                clusters.push_back(cl);
            }
        }

        // Evict the member farthest outside the tolerance, one at a time.
        // An evicted orientation may join any other cluster but never this one.
        for (WorkingCluster& cl : clusters) {
            while (true) {
                size_t worst_pos = cl.members.size();
                double worst_dev = -1.0;
                for (size_t pos = 0; pos < cl.members.size(); ++pos) {
                    const Orientation& o = orientations[cl.members[pos]];
                    if (joinable(o, cl.mean)) continue;
                    double dev = deviation(o, cl.mean);
                    if (dev > worst_dev ||
                        (dev == worst_dev && cl.members[pos] < cl.members[worst_pos])) {
                        worst_dev = dev;
                        worst_pos = pos;
                    }
                }
                if (worst_pos == cl.members.size()) break;

                size_t out = cl.members[worst_pos];
                cl.members.erase(cl.members.begin() + worst_pos);
                cl.banned[out] = 1;
                assigned[out] = unassigned;
                // A lone member is its own mean, so a cluster never empties
                cl.mean = meanOf(orientations, cl.members);
                evicted = true;
            }
        }
    }

    for (WorkingCluster& cl : clusters) {
        std::sort(cl.members.begin(), cl.members.end());

        if (static_cast<int>(cl.members.size()) < options_.min_members) {
            result.unclustered.insert(result.unclustered.end(),
                                      cl.members.begin(), cl.members.end());
            continue;
        }

        OrientationCluster family;
        family.mean = cl.mean;
        family.members = cl.members;

        std::vector<Orientation> member_orientations;
        for (size_t idx : cl.members) {
            member_orientations.push_back(orientations[idx]);
            family.max_deviation = std::max(family.max_deviation,
                                            deviation(orientations[idx], cl.mean));
        }
        family.fisher_kappa = fisherKappa(member_orientations);

        result.families.push_back(family);
    }

    std::sort(result.unclustered.begin(), result.unclustered.end());
    return result;
}

} // namespace RMRS
