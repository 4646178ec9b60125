/**
 * @file test_code_dictionary.cpp
 * @brief Unit tests for CodeDictionary
 */

#include <gtest/gtest.h>
#include "CodeDictionary.hpp"
#include "RmrErrors.hpp"
#include <sstream>
#include <stdexcept>

using namespace RMRS;

class CodeDictionaryTest : public ::testing::Test {
protected:
    CodeDictionary dict = CodeDictionary::createDefault();
};

TEST_F(CodeDictionaryTest, DefaultTableCoversEveryParameter) {
    for (RatingParameter param : allRatingParameters()) {
        EXPECT_FALSE(dict.getCodes(param).empty()) << toString(param);
    }
    EXPECT_EQ(dict.size(), 7u + 6u + 6u * 5u);
}

TEST_F(CodeDictionaryTest, DefaultRatings) {
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::STRENGTH, "R3"), 7.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::STRENGTH, "R4"), 12.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::STRENGTH, "R6"), 15.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::SPACING, "4"), 400.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::ROUGHNESS, "1"), 6.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::GROUNDWATER, "1"), 15.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::GROUNDWATER, "5"), 0.0);
}

TEST_F(CodeDictionaryTest, RatingForIsRepeatable) {
    for (RatingParameter param : allRatingParameters()) {
        for (const auto& code : dict.getCodes(param)) {
            double first = dict.ratingFor(param, code);
            for (int i = 0; i < 3; ++i) {
                EXPECT_EQ(dict.ratingFor(param, code), first);
            }
        }
    }
}

TEST_F(CodeDictionaryTest, CodesAreNormalised) {
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::STRENGTH, " r4 "), 12.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::ROUGHNESS, "3.0"), 3.0);
    EXPECT_EQ(CodeDictionary::canonicalCode("2.00"), "2");
    EXPECT_EQ(CodeDictionary::canonicalCode("2.5"), "2.5");
    EXPECT_EQ(CodeDictionary::canonicalCode(" r3"), "R3");
}

TEST_F(CodeDictionaryTest, UnknownCodeThrows) {
    EXPECT_THROW(dict.ratingFor(RatingParameter::ROUGHNESS, "9"), UnknownCodeError);
    EXPECT_THROW(dict.ratingFor(RatingParameter::STRENGTH, "R7"), UnknownCodeError);
    // Valid code, wrong parameter
    EXPECT_THROW(dict.ratingFor(RatingParameter::STRENGTH, "1"), UnknownCodeError);

    try {
        dict.ratingFor(RatingParameter::INFILL, "X");
        FAIL() << "Expected UnknownCodeError";
    } catch (const UnknownCodeError& e) {
        EXPECT_EQ(e.parameter(), RatingParameter::INFILL);
        EXPECT_EQ(e.code(), "X");
        EXPECT_EQ(e.kind(), "UnknownCode");
        EXPECT_NE(std::string(e.what()).find("infill"), std::string::npos);
    }
}

TEST_F(CodeDictionaryTest, GetEntryAndHasCode) {
    const CodeEntry* entry = dict.getEntry(RatingParameter::WEATHERING, "1");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->description, "Unweathered");
    EXPECT_EQ(dict.getEntry(RatingParameter::WEATHERING, "6"), nullptr);
    EXPECT_TRUE(dict.hasCode(RatingParameter::APERTURE, "3"));
    EXPECT_FALSE(dict.hasCode(RatingParameter::APERTURE, ""));
}

TEST(CodeDictionaryLoadTest, LoadFromStream) {
    std::istringstream in(
        "parameter,code,value,description\n"
        "# site-specific strength\n"
        "strength,R4,12,Strong\n"
        "ucs,R5,13\n"
        "roughness,1,6,Very rough\n"
        "infilling_type,2,4,Hard filling\n");

    CodeDictionary dict = CodeDictionary::loadFromStream(in, "site.csv");
    EXPECT_EQ(dict.size(), 4u);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::STRENGTH, "R4"), 12.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::STRENGTH, "R5"), 13.0);
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::INFILL, "2"), 4.0);
    EXPECT_THROW(dict.ratingFor(RatingParameter::SPACING, "1"), UnknownCodeError);
}

TEST(CodeDictionaryLoadTest, QuotedFields) {
    std::istringstream in(
        "parameter,code,value,description\n"
        "weathering,2,5,\"Slightly weathered, discoloured surfaces\"\n"
        "\"aperture\",\" 3 \",4,\"0.1-1 mm \"\"tight\"\"\"\n"
        "infill,1,6,None, clean walls\n");

    CodeDictionary dict = CodeDictionary::loadFromStream(in, "quoted.csv");
    EXPECT_EQ(dict.size(), 3u);
    EXPECT_EQ(dict.getEntry(RatingParameter::WEATHERING, "2")->description,
              "Slightly weathered, discoloured surfaces");
    EXPECT_DOUBLE_EQ(dict.ratingFor(RatingParameter::APERTURE, "3"), 4.0);
    EXPECT_EQ(dict.getEntry(RatingParameter::APERTURE, "3")->description, "0.1-1 mm \"tight\"");
    // Unquoted commas in the trailing description are kept
    EXPECT_EQ(dict.getEntry(RatingParameter::INFILL, "1")->description, "None,clean walls");
}

TEST(CodeDictionaryLoadTest, MalformedLinesAreRejected) {
    std::istringstream short_line("roughness,1\n");
    EXPECT_THROW(CodeDictionary::loadFromStream(short_line), std::runtime_error);

    std::istringstream bad_param("friction,1,6\n");
    EXPECT_THROW(CodeDictionary::loadFromStream(bad_param), std::runtime_error);

    std::istringstream bad_value("roughness,1,six\n");
    EXPECT_THROW(CodeDictionary::loadFromStream(bad_value), std::runtime_error);

    std::istringstream duplicate("roughness,1,6\nroughness,1.0,5\n");
    try {
        CodeDictionary::loadFromStream(duplicate, "codes.csv");
        FAIL() << "Expected duplicate code error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("codes.csv:2"), std::string::npos);
    }
}

TEST_F(CodeDictionaryTest, ExampleTableMatchesBuiltIn) {
    CodeDictionary shipped =
        CodeDictionary::loadFromFile(std::string(RMRS_DATA_DIR) + "/example_codes.csv");

    EXPECT_EQ(shipped.size(), dict.size());
    for (RatingParameter param : allRatingParameters()) {
        for (const auto& code : dict.getCodes(param)) {
            EXPECT_DOUBLE_EQ(shipped.ratingFor(param, code), dict.ratingFor(param, code))
                << toString(param) << " " << code;
        }
    }
}

TEST(CodeDictionaryLoadTest, MissingFileThrows) {
    EXPECT_THROW(CodeDictionary::loadFromFile("no_such_dictionary.csv"), std::runtime_error);
}

TEST_F(CodeDictionaryTest, WrittenTableLoadsBack) {
    std::stringstream table;
    dict.writeTable(table);

    CodeDictionary reloaded = CodeDictionary::loadFromStream(table);
    EXPECT_EQ(reloaded.size(), dict.size());
    EXPECT_DOUBLE_EQ(reloaded.ratingFor(RatingParameter::SPACING, "6"), 2000.0);
    EXPECT_EQ(reloaded.getEntry(RatingParameter::ROUGHNESS, "5")->description, "Slickensided");
}
