/**
 * @file test_discontinuity_validation.cpp
 * @brief Unit tests for record validation and station grouping
 */

#include <gtest/gtest.h>
#include "Discontinuity.hpp"
#include "CodeDictionary.hpp"
#include "RmrErrors.hpp"

using namespace RMRS;

class DiscontinuityValidationTest : public ::testing::Test {
protected:
    DiscontinuityRecord record(int row, const std::string& station = "ST-01") const {
        DiscontinuityRecord r;
        r.source_row = row;
        r.station = station;
        r.distance = "1.5";
        r.type = "J";
        r.dip_direction = "120";
        r.dip = "45";
        r.spacing = "4";
        r.persistence = "2";
        r.aperture = "3";
        r.roughness = "2";
        r.infill = "1";
        r.weathering = "2";
        r.groundwater = "1";
        return r;
    }

    CodeDictionary dict = CodeDictionary::createDefault();
    DiscontinuityValidator validator{dict};
};

TEST_F(DiscontinuityValidationTest, ValidRecord) {
    Discontinuity d = validator.validate(record(3));
    EXPECT_EQ(d.source_row, 3);
    EXPECT_EQ(d.station, "ST-01");
    EXPECT_DOUBLE_EQ(d.distance, 1.5);
    EXPECT_EQ(d.type, StructureType::JOINT);
    EXPECT_DOUBLE_EQ(d.orientation.dip_direction, 120.0);
    EXPECT_DOUBLE_EQ(d.orientation.dip, 45.0);
    EXPECT_EQ(d.code(RatingParameter::APERTURE), "3");
    EXPECT_THROW(d.code(RatingParameter::STRENGTH), std::invalid_argument);
}

TEST_F(DiscontinuityValidationTest, AnglesAreNormalised) {
    DiscontinuityRecord r = record(1);
    r.dip_direction = "-20";
    r.dip = "90.6";
    Discontinuity d = validator.validate(r);
    EXPECT_DOUBLE_EQ(d.orientation.dip_direction, 340.0);
    EXPECT_DOUBLE_EQ(d.orientation.dip, 90.0);

    r.dip_direction = "360";
    r.dip = "-0.4";
    d = validator.validate(r);
    EXPECT_DOUBLE_EQ(d.orientation.dip_direction, 0.0);
    EXPECT_DOUBLE_EQ(d.orientation.dip, 0.0);
}

TEST_F(DiscontinuityValidationTest, OutOfRangeDip) {
    DiscontinuityRecord r = record(4);
    r.dip = "95";
    try {
        validator.validate(r);
        FAIL() << "Expected InvalidRangeError";
    } catch (const InvalidRangeError& e) {
        EXPECT_EQ(e.field(), "dip");
        EXPECT_EQ(e.sourceRow(), 4);
        EXPECT_DOUBLE_EQ(e.value(), 95.0);
    }
}

TEST_F(DiscontinuityValidationTest, NonNumericAndNegativeValues) {
    DiscontinuityRecord r = record(5);
    r.dip_direction = "NE";
    EXPECT_THROW(validator.validate(r), InvalidRangeError);

    r = record(5);
    r.distance = "-1";
    EXPECT_THROW(validator.validate(r), InvalidRangeError);

    r = record(5);
    r.dip = "inf";
    EXPECT_THROW(validator.validate(r), InvalidRangeError);
}

TEST_F(DiscontinuityValidationTest, DistanceMustBePositive) {
    DiscontinuityRecord r = record(8);
    r.distance = "0";
    try {
        validator.validate(r);
        FAIL() << "Expected InvalidRangeError";
    } catch (const InvalidRangeError& e) {
        EXPECT_EQ(e.field(), "distance");
        EXPECT_EQ(e.sourceRow(), 8);
    }

    r.distance = "0.01";
    EXPECT_DOUBLE_EQ(validator.validate(r).distance, 0.01);
}

TEST_F(DiscontinuityValidationTest, CodesAreStoredInCanonicalForm) {
    DiscontinuityRecord r = record(9);
    r.roughness = " 3.0 ";
    r.spacing = "4.00";
    Discontinuity d = validator.validate(r);
    EXPECT_EQ(d.code(RatingParameter::ROUGHNESS), "3");
    EXPECT_EQ(d.code(RatingParameter::SPACING), "4");
}

TEST_F(DiscontinuityValidationTest, UnknownCodes) {
    DiscontinuityRecord r = record(6);
    r.weathering = "W9";
    try {
        validator.validate(r);
        FAIL() << "Expected UnknownCodeError";
    } catch (const UnknownCodeError& e) {
        EXPECT_EQ(e.parameter(), RatingParameter::WEATHERING);
        EXPECT_EQ(e.code(), "W9");
        EXPECT_EQ(e.sourceRow(), 6);
    }

    r = record(7);
    r.type = "Dyke";
    EXPECT_THROW(validator.validate(r), UnknownTypeError);
}

TEST_F(DiscontinuityValidationTest, StructureTypeNames) {
    EXPECT_EQ(parseStructureType("Joint"), StructureType::JOINT);
    EXPECT_EQ(parseStructureType("f"), StructureType::FAULT);
    EXPECT_EQ(parseStructureType("Sheeting"), StructureType::SPALLING);
    EXPECT_EQ(parseStructureType("SP"), StructureType::SPALLING);
    EXPECT_EQ(parseStructureType("Bedding"), StructureType::BEDDING);
    EXPECT_EQ(parseStructureType("FO"), StructureType::FOLIATION);
    EXPECT_EQ(parseStructureType(" vein "), StructureType::VEIN);
    EXPECT_EQ(parseStructureType("C"), StructureType::CONTACT);
    EXPECT_THROW(parseStructureType(""), UnknownTypeError);
}

TEST_F(DiscontinuityValidationTest, ValidateAllCollectsErrors) {
    std::vector<DiscontinuityRecord> records = {record(1), record(2), record(3), record(4)};
    records[1].roughness = "7";
    records[3].station = "  ";

    ValidationReport report = validator.validateAll(records);
    EXPECT_EQ(report.valid.size(), 2u);
    ASSERT_EQ(report.errors.size(), 2u);
    EXPECT_EQ(report.totalRecords(), 4u);

    EXPECT_EQ(report.errors[0].source_row, 2);
    EXPECT_EQ(report.errors[0].kind, "UnknownCode");
    EXPECT_EQ(report.errors[0].station, "ST-01");
    EXPECT_EQ(report.errors[1].source_row, 4);
    EXPECT_EQ(report.errors[1].kind, "EmptyInput");

    EXPECT_EQ(report.valid[0].source_row, 1);
    EXPECT_EQ(report.valid[1].source_row, 3);
}

TEST_F(DiscontinuityValidationTest, GroupByStationKeepsFirstSeenOrder) {
    std::vector<Discontinuity> discs = {
        validator.validate(record(1, "ST-02")),
        validator.validate(record(2, "ST-01")),
        validator.validate(record(3, "ST-02"))
    };

    std::vector<Station> stations = groupByStation(discs, "R3");
    ASSERT_EQ(stations.size(), 2u);
    EXPECT_EQ(stations[0].id, "ST-02");
    EXPECT_EQ(stations[0].discontinuities.size(), 2u);
    EXPECT_EQ(stations[0].ucs_class, "R3");
    EXPECT_EQ(stations[1].id, "ST-01");
    EXPECT_FALSE(stations[1].rqd.has_value());
}

TEST_F(DiscontinuityValidationTest, EffectiveTraverseLength) {
    DiscontinuityRecord far = record(2);
    far.distance = "12.5";

    Station station;
    station.discontinuities = {validator.validate(record(1)), validator.validate(far)};
    EXPECT_DOUBLE_EQ(station.effectiveTraverseLength(), 12.5);

    station.traverse_length = 30.0;
    EXPECT_DOUBLE_EQ(station.effectiveTraverseLength(), 30.0);
}
