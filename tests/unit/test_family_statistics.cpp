/**
 * @file test_family_statistics.cpp
 * @brief Unit tests for family resolution and per-family RMR
 */

#include <gtest/gtest.h>
#include "FamilyStatistics.hpp"
#include "CodeDictionary.hpp"
#include "RmrErrors.hpp"

using namespace RMRS;

namespace {

Discontinuity makeDisc(const std::string& station, int row, double distance,
                       double dip_direction, double dip, StructureType type,
                       const std::string& roughness = "2") {
    Discontinuity d;
    d.source_row = row;
    d.station = station;
    d.distance = distance;
    d.type = type;
    d.orientation = Orientation(dip_direction, dip);
    d.spacing_code = "4";
    d.persistence_code = "2";
    d.aperture_code = "2";
    d.roughness_code = roughness;
    d.infill_code = "1";
    d.weathering_code = "2";
    d.groundwater_code = "2";
    return d;
}

} // namespace

class FamilyStatisticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // ST-A: 5 m traverse, ST-B: 15 m traverse
        discs = {
            makeDisc("ST-A", 1, 1.0, 44.0, 64.0, StructureType::JOINT),
            makeDisc("ST-A", 2, 2.0, 46.0, 66.0, StructureType::FAULT),
            makeDisc("ST-A", 3, 5.0, 210.0, 30.0, StructureType::BEDDING),
            makeDisc("ST-B", 4, 3.0, 45.0, 65.0, StructureType::FAULT),
            makeDisc("ST-B", 5, 8.0, 47.0, 63.0, StructureType::JOINT, "4"),
            makeDisc("ST-B", 6, 15.0, 43.0, 67.0, StructureType::FAULT),
        };
        stations = groupByStation(discs, "R4");

        std::vector<Orientation> orientations;
        for (const auto& d : discs) orientations.push_back(d.orientation);
        clustering = OrientationClustering().cluster(orientations);
    }

    std::vector<Discontinuity> discs;
    std::vector<Station> stations;
    ClusteringResult clustering;
    CodeDictionary dict = CodeDictionary::createDefault();
};

TEST_F(FamilyStatisticsTest, BuildFamilies) {
    std::vector<Family> families = FamilyStatistics::buildFamilies(clustering, discs, stations);

    ASSERT_EQ(families.size(), 1u);
    const Family& f = families[0];
    EXPECT_EQ(f.id, 1);
    EXPECT_EQ(f.label(), "F1");
    EXPECT_EQ(f.size(), 5u);
    EXPECT_EQ(f.member_indices, (std::vector<size_t>{0, 1, 3, 4, 5}));
    EXPECT_EQ(f.stations, (std::vector<std::string>{"ST-A", "ST-B"}));
    EXPECT_EQ(f.dominant_type, StructureType::FAULT);
    EXPECT_DOUBLE_EQ(f.traverse_length, 5.0 + 15.0);
    EXPECT_EQ(f.ucs_class, "R4");
    EXPECT_DOUBLE_EQ(f.tolerance, 15.0);
    EXPECT_NEAR(f.mean.dip, 65.0, 1e-9);
}

TEST_F(FamilyStatisticsTest, DominantTypeTiesGoToFirstSeen) {
    std::vector<Discontinuity> members = {
        makeDisc("ST-A", 1, 1.0, 10.0, 10.0, StructureType::VEIN),
        makeDisc("ST-A", 2, 2.0, 10.0, 10.0, StructureType::JOINT),
        makeDisc("ST-A", 3, 3.0, 10.0, 10.0, StructureType::JOINT),
        makeDisc("ST-A", 4, 4.0, 10.0, 10.0, StructureType::VEIN)
    };
    EXPECT_EQ(FamilyStatistics::dominantType(members), StructureType::VEIN);
}

TEST_F(FamilyStatisticsTest, FamilyScoreUsesFamilyFrequency) {
    RatingAggregator aggregator(dict);
    FamilyStatistics statistics(aggregator, -5.0);

    std::vector<Family> families = FamilyStatistics::buildFamilies(clustering, discs, stations);
    ASSERT_EQ(families.size(), 1u);

    RmrScore score = statistics.score(families[0]);
    EXPECT_EQ(score.unit, "F1");
    EXPECT_EQ(score.discontinuity_count, 5u);
    EXPECT_TRUE(score.rqd_derived);
    EXPECT_DOUBLE_EQ(score.frequency, 5.0 / 20.0);
    EXPECT_DOUBLE_EQ(score.strength_rating, 12.0);
    // Member 5 has roughness 4 (smooth)
    EXPECT_DOUBLE_EQ(score.condition.roughness, 1.0);
    EXPECT_DOUBLE_EQ(score.orientation_adjustment, -5.0);

    double expected = 12.0 + 20.0 + 10.0 + (4.0 + 5.0 + 1.0 + 6.0 + 5.0) + 10.0 - 5.0;
    EXPECT_NEAR(score.total, expected, 1e-9);
}

TEST_F(FamilyStatisticsTest, SummaryCarriesFamilyAndScore) {
    RatingAggregator aggregator(dict);
    FamilyStatistics statistics(aggregator, -5.0);

    auto families = FamilyStatistics::buildFamilies(clustering, discs, stations);
    FamilySummary summary = statistics.summarize(families[0]);
    EXPECT_EQ(summary.family.label(), summary.score.unit);
    EXPECT_EQ(summary.score.classification.rock_class,
              classifyRockMass(summary.score.total).rock_class);
}

TEST_F(FamilyStatisticsTest, FamilyWithoutStrengthClassFails) {
    RatingAggregator aggregator(dict);
    FamilyStatistics statistics(aggregator, -5.0);

    auto families = FamilyStatistics::buildFamilies(clustering, discs, {});
    ASSERT_EQ(families.size(), 1u);
    EXPECT_TRUE(families[0].ucs_class.empty());
    // Without station records the traverse falls back to member distances
    EXPECT_DOUBLE_EQ(families[0].traverse_length, 2.0 + 15.0);

    EXPECT_THROW(statistics.score(families[0]), UnknownCodeError);
}

TEST_F(FamilyStatisticsTest, EmptyFamilyFails) {
    RatingAggregator aggregator(dict);
    FamilyStatistics statistics(aggregator, -5.0);

    Family empty;
    empty.id = 3;
    empty.ucs_class = "R4";
    empty.traverse_length = 10.0;
    EXPECT_THROW(statistics.score(empty), EmptyInputError);
}
