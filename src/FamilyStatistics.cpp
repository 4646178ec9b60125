#include "FamilyStatistics.hpp"
#include "RmrErrors.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace RMRS {

namespace {

template <typename Key>
Key mostFrequent(const std::vector<Key>& values) {
    std::map<Key, int> counts;
    std::vector<Key> order;
    for (const auto& v : values) {
        if (counts[v]++ == 0) {
            order.push_back(v);
        }
    }

    Key best = order.front();
    for (const auto& v : order) {
        if (counts[v] > counts[best]) {
            best = v;
        }
    }
    return best;
}

const Station* findStation(const std::vector<Station>& stations, const std::string& id) {
    for (const auto& s : stations) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

} // namespace

Family::Family()
    : id(0), tolerance(DEFAULT_CLUSTER_TOLERANCE), fisher_kappa(0.0),
      max_deviation(0.0), dominant_type(StructureType::JOINT),
      traverse_length(0.0) {}

std::string Family::label() const {
    return "F" + std::to_string(id);
}

FamilyStatistics::FamilyStatistics(const RatingAggregator& aggregator,
                                   double orientation_adjustment)
    : aggregator_(aggregator), orientation_adjustment_(orientation_adjustment) {}

StructureType FamilyStatistics::dominantType(const std::vector<Discontinuity>& members) {
    if (members.empty()) {
        return StructureType::OTHER;
    }
    std::vector<StructureType> types;
    for (const auto& m : members) {
        types.push_back(m.type);
    }
    return mostFrequent(types);
}

std::vector<std::string> FamilyStatistics::contributingStations(
    const std::vector<Discontinuity>& members) {
    std::vector<std::string> ids;
    for (const auto& m : members) {
        if (std::find(ids.begin(), ids.end(), m.station) == ids.end()) {
            ids.push_back(m.station);
        }
    }
    return ids;
}

std::vector<Family> FamilyStatistics::buildFamilies(const ClusteringResult& clustering,
                                                    const std::vector<Discontinuity>& discontinuities,
                                                    const std::vector<Station>& stations) {
    std::vector<Family> families;
    int next_id = 1;

    for (const auto& cluster : clustering.families) {
        Family family;
        family.id = next_id++;
        family.mean = cluster.mean;
        family.tolerance = clustering.options.tolerance;
        family.fisher_kappa = cluster.fisher_kappa;
        family.max_deviation = cluster.max_deviation;
        family.member_indices = cluster.members;

        for (size_t idx : cluster.members) {
            if (idx >= discontinuities.size()) {
                throw std::out_of_range("Family member index " + std::to_string(idx) +
                                        " outside the clustered set");
            }
            family.members.push_back(discontinuities[idx]);
        }

        family.dominant_type = dominantType(family.members);
        family.stations = contributingStations(family.members);

        // Strength of the station contributing most members
        std::vector<std::string> member_stations;
        for (const auto& m : family.members) {
            member_stations.push_back(m.station);
        }
        if (!member_stations.empty()) {
            const Station* major = findStation(stations, mostFrequent(member_stations));
            if (major) {
                family.ucs_class = major->ucs_class;
            }
        }

        for (const auto& id : family.stations) {
            const Station* station = findStation(stations, id);
            if (station) {
                family.traverse_length += station->effectiveTraverseLength();
            } else {
                double longest = 0.0;
                for (const auto& m : family.members) {
                    if (m.station == id) longest = std::max(longest, m.distance);
                }
                family.traverse_length += longest;
            }
        }

        families.push_back(family);
    }

    return families;
}

RmrScore FamilyStatistics::score(const Family& family) const {
    RatingInputs inputs;
    inputs.ucs_class = family.ucs_class;
    inputs.orientation_adjustment = orientation_adjustment_;
    if (family.traverse_length > 0.0) {
        inputs.rqd.traverse_length = family.traverse_length;
    }

    RmrScore result = aggregator_.aggregate("family " + family.label(), family.members, inputs);
    result.unit = family.label();
    return result;
}

FamilySummary FamilyStatistics::summarize(const Family& family) const {
    FamilySummary summary;
    summary.family = family;
    summary.score = score(family);
    return summary;
}

} // namespace RMRS
