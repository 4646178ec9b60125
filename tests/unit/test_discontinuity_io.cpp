/**
 * @file test_discontinuity_io.cpp
 * @brief Unit tests for field-sheet import and result-table export
 */

#include <gtest/gtest.h>
#include "DiscontinuityIO.hpp"
#include "CodeDictionary.hpp"
#include <mpi.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace RMRS;

TEST(DiscontinuityIOTest, SplitLineHandlesQuotes) {
    auto fields = DiscontinuityIO::splitLine(" a , \"b, c\" ,\"say \"\"hi\"\"\",");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b, c");
    EXPECT_EQ(fields[2], "say \"hi\"");
    EXPECT_EQ(fields[3], "");
}

TEST(DiscontinuityIOTest, EscapeField) {
    EXPECT_EQ(DiscontinuityIO::escapeField("plain"), "plain");
    EXPECT_EQ(DiscontinuityIO::escapeField("a,b"), "\"a,b\"");
    EXPECT_EQ(DiscontinuityIO::escapeField("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(DiscontinuityIOTest, ReadsAliasedHeaders) {
    std::istringstream in(
        "Station,Distance_m,Type,Dip_Direction_Degrees,Dip_Degrees,Spacing_mm,Persistence,"
        "Aperture_mm,Roughness,Infilling_Type,Weathering,Groundwater,Notes\n"
        "ST-01,0.5,J,120,45,4,2,3,2,1,2,1,first\n"
        "ST-01,1.2,F,125,50,3,2,3,2,1,2,1,\"fault, gouge\"\n");

    RecordTable table = DiscontinuityIO::readRecords(in, "field.csv");
    ASSERT_EQ(table.records.size(), 2u);
    EXPECT_TRUE(table.errors.empty());

    const DiscontinuityRecord& r = table.records[1];
    EXPECT_EQ(r.source_row, 2);
    EXPECT_EQ(r.station, "ST-01");
    EXPECT_EQ(r.distance, "1.2");
    EXPECT_EQ(r.type, "F");
    EXPECT_EQ(r.dip_direction, "125");
    EXPECT_EQ(r.dip, "50");
    EXPECT_EQ(r.spacing, "3");
    EXPECT_EQ(r.infill, "1");
    EXPECT_EQ(r.groundwater, "1");
}

TEST(DiscontinuityIOTest, ColumnOrderDoesNotMatter) {
    std::istringstream in(
        "groundwater,weathering,infill,roughness,aperture,persistence,spacing,dip,"
        "dip_direction,type,distance,station\n"
        "3,2,1,4,2,2,5,70,300,B,4.0,ST-09\n");

    RecordTable table = DiscontinuityIO::readRecords(in);
    ASSERT_EQ(table.records.size(), 1u);
    EXPECT_EQ(table.records[0].station, "ST-09");
    EXPECT_EQ(table.records[0].groundwater, "3");
    EXPECT_EQ(table.records[0].roughness, "4");
    EXPECT_EQ(table.records[0].dip_direction, "300");
}

TEST(DiscontinuityIOTest, MissingColumnIsFatal) {
    std::istringstream in("station,distance,type,dip_direction,dip\nST-01,1,J,10,20\n");
    try {
        DiscontinuityIO::readRecords(in, "short.csv");
        FAIL() << "Expected missing column error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("spacing"), std::string::npos);
    }

    std::istringstream empty("");
    EXPECT_THROW(DiscontinuityIO::readRecords(empty), std::runtime_error);
}

TEST(DiscontinuityIOTest, ShortRowsBecomeRecordErrors) {
    std::istringstream in(
        "station,distance,type,dip_direction,dip,spacing,persistence,aperture,"
        "roughness,infill,weathering,groundwater\n"
        "ST-01,0.5,J,120,45,4,2,3,2,1,2,1\n"
        "\n"
        "ST-01,0.9,J,120\n"
        "ST-02,1.5,J,122,47,4,2,3,2,1,2,1\n");

    RecordTable table = DiscontinuityIO::readRecords(in);
    ASSERT_EQ(table.records.size(), 2u);
    ASSERT_EQ(table.errors.size(), 1u);
    EXPECT_EQ(table.errors[0].source_row, 3);
    EXPECT_EQ(table.errors[0].station, "ST-01");
    EXPECT_EQ(table.errors[0].kind, "Malformed");
    EXPECT_EQ(table.records[1].source_row, 4);
}

TEST(DiscontinuityIOTest, StationRow) {
    RmrScore score;
    score.unit = "ST-01";
    score.discontinuity_count = 15;
    score.ucs_class = "R4";
    score.strength_rating = 12.0;
    score.rqd = 78.2;
    score.rqd_rating = 17.0;
    score.total = 63.1;
    score.classification = classifyRockMass(63.1);
    score.dominant_groundwater_code = "2";

    std::string row = DiscontinuityIO::stationRow(score);
    auto fields = DiscontinuityIO::splitLine(row);
    auto header = DiscontinuityIO::splitLine(DiscontinuityIO::stationHeader());

    ASSERT_EQ(fields.size(), header.size());
    EXPECT_EQ(fields[0], "ST-01");
    EXPECT_EQ(fields[1], "15");
    EXPECT_EQ(fields[2], "R4");
    EXPECT_EQ(fields[4], "78.2");
    EXPECT_EQ(fields[5], "no");
    EXPECT_EQ(header.back(), "descriptor");
    EXPECT_EQ(fields[fields.size() - 3], "63.1");
    EXPECT_EQ(fields[fields.size() - 2], "II");
    EXPECT_EQ(fields.back(), "Good");
}

TEST(DiscontinuityIOTest, FamilyAndErrorRows) {
    FamilySummary summary;
    summary.family.id = 2;
    summary.family.mean = Orientation(45.5, 65.0);
    summary.family.stations = {"ST-01", "ST-02"};
    summary.family.dominant_type = StructureType::SPALLING;
    summary.score.unit = "F2";

    auto fields = DiscontinuityIO::splitLine(DiscontinuityIO::familyRow(summary));
    auto header = DiscontinuityIO::splitLine(DiscontinuityIO::familyHeader());
    ASSERT_EQ(fields.size(), header.size());
    EXPECT_EQ(fields[0], "F2");
    EXPECT_EQ(fields[1], "45.5");
    EXPECT_EQ(fields[6], "Spalling/Sheeting");
    EXPECT_EQ(fields[7], "ST-01;ST-02");

    RecordError error{12, "ST-03", "UnknownCode", "Unknown roughness code '9' (row 12)"};
    auto error_fields = DiscontinuityIO::splitLine(DiscontinuityIO::errorRow(error));
    ASSERT_EQ(error_fields.size(), 5u);
    EXPECT_EQ(error_fields[0], "record");
    EXPECT_EQ(error_fields[1], "12");

    UnitFailure failure{"station", "ST-04", "InsufficientData", "no RQD, frequency, or length"};
    auto failure_fields = DiscontinuityIO::splitLine(DiscontinuityIO::errorRow(failure));
    ASSERT_EQ(failure_fields.size(), 5u);
    EXPECT_EQ(failure_fields[0], "station");
    EXPECT_EQ(failure_fields[1], "");
    EXPECT_EQ(failure_fields[4], "no RQD, frequency, or length");
}

TEST(DiscontinuityIOTest, WriteAndReadFile) {
    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    std::string filename = "test_io_rank" + std::to_string(rank) + ".csv";

    DiscontinuityIO::writeTable(filename,
        "station,distance,type,dip_direction,dip,spacing,persistence,aperture,"
        "roughness,infill,weathering,groundwater",
        {"ST-01,0.5,J,120,45,4,2,3,2,1,2,1", "ST-01,1.0,J,121,44,4,2,3,2,1,2,1"});

    RecordTable table = DiscontinuityIO::readRecords(filename);
    EXPECT_EQ(table.records.size(), 2u);
    std::remove(filename.c_str());

    EXPECT_THROW(DiscontinuityIO::readRecords("missing_field_sheet.csv"), std::runtime_error);
}
