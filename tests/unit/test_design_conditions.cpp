/**
 * @file test_design_conditions.cpp
 * @brief Unit tests for the design-day catalog and outdoor design states
 */

#include <gtest/gtest.h>
#include "DesignConditions.hpp"
#include "AtmosphericModel.hpp"
#include <algorithm>
#include <stdexcept>

using namespace MASE;

class DesignConditionsTest : public ::testing::Test {
protected:
    void SetUp() override {}

    const DesignConditionsCatalog& catalog = DesignConditionsCatalog::standard();
};

// ============================================================================
// Catalog Tests
// ============================================================================

TEST_F(DesignConditionsTest, StandardCatalogContents) {
    EXPECT_EQ(catalog.size(), 15u);

    std::vector<std::string> keys = catalog.locations();
    ASSERT_EQ(keys.size(), 15u);
    EXPECT_EQ(keys.front(), "ABU DHABI");
    EXPECT_EQ(keys.back(), "CUSTOM");
    EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end() - 1));
}

TEST_F(DesignConditionsTest, LookupIsCaseInsensitive) {
    auto record = catalog.find("  abu dhabi ");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->key, "ABU DHABI");
    EXPECT_EQ(record->country, "UAE");
    EXPECT_DOUBLE_EQ(record->cooling_db_n20, 47.0);
    EXPECT_DOUBLE_EQ(record->heating_db_meanwb, 14.7);

    EXPECT_TRUE(catalog.contains("Johannesburg"));
    EXPECT_DOUBLE_EQ(catalog.get("johannesburg").altitude, 1694.0);
    EXPECT_FALSE(catalog.find("ATLANTIS").has_value());
    EXPECT_THROW(catalog.get("ATLANTIS"), std::runtime_error);
}

TEST_F(DesignConditionsTest, NormalizeKey) {
    EXPECT_EQ(DesignConditionsCatalog::normalizeKey(" hong kong\t"), "HONG KONG");
    EXPECT_EQ(DesignConditionsCatalog::normalizeKey("   "), "");
}

TEST_F(DesignConditionsTest, RecordPressureFollowsAltitude) {
    const DesignDayRecord& jnb = catalog.get("JOHANNESBURG");
    EXPECT_NEAR(jnb.standardPressure(), 82562.0, 5.0);
    EXPECT_DOUBLE_EQ(jnb.standardPressure(), AtmosphereUtils::standardPressure(1694.0));
}

TEST_F(DesignConditionsTest, AddToCopyLeavesStandardUntouched) {
    DesignConditionsCatalog copy = catalog;
    DesignDayRecord site = catalog.get("CUSTOM");
    site.key = "data hall 7";
    site.location = "Data Hall 7";
    site.altitude = 450.0;
    copy.add(site);

    EXPECT_TRUE(copy.contains("DATA HALL 7"));
    EXPECT_EQ(copy.locations().back(), "CUSTOM");
    EXPECT_EQ(copy.size(), catalog.size() + 1);
    EXPECT_FALSE(catalog.contains("DATA HALL 7"));

    DesignDayRecord unnamed;
    EXPECT_THROW(copy.add(unnamed), std::runtime_error);
}

// ============================================================================
// Design State Tests
// ============================================================================

TEST_F(DesignConditionsTest, DesignStatesInReportOrder) {
    StateTable states = DesignConditionsCatalog::designStates(catalog.get("ABU DHABI"));

    std::vector<std::string> labels = states.labels();
    ASSERT_EQ(labels.size(), 5u);
    EXPECT_EQ(labels[0], DesignStateLabel::MAX_N20);
    EXPECT_EQ(labels[1], DesignStateLabel::MAX_ENTHALPY);
    EXPECT_EQ(labels[2], DesignStateLabel::MAX_HUMIDITY);
    EXPECT_EQ(labels[3], DesignStateLabel::MIN_N20);
    EXPECT_EQ(labels[4], DesignStateLabel::MIN_HUMIDITY);
}

TEST_F(DesignConditionsTest, SummerStatesCarryTabulatedPairs) {
    const DesignDayRecord& record = catalog.get("ABU DHABI");
    StateTable states = DesignConditionsCatalog::designStates(record);

    const AirState& max = states.get(DesignStateLabel::MAX_N20);
    EXPECT_DOUBLE_EQ(max.dryBulb(), 47.0);
    EXPECT_NEAR(max.wetBulb(), 29.5, 1e-4);
    EXPECT_DOUBLE_EQ(max.pressure(), record.standardPressure());

    const AirState& humid = states.get(DesignStateLabel::MAX_HUMIDITY);
    EXPECT_NEAR(humid.wetBulb(), 30.2, 1e-4);
    EXPECT_GT(humid.humidityRatio(), max.humidityRatio());
}

TEST_F(DesignConditionsTest, WinterWetBulbIsCappedAtDryBulb) {
    const DesignDayRecord& record = catalog.get("LONDON");
    StateTable states = DesignConditionsCatalog::designStates(record);

    // Mean coincident wet-bulbs of 4.0 and 6.0 exceed -3.5 and -1.8
    const AirState& cold = states.get(DesignStateLabel::MIN_N20);
    EXPECT_DOUBLE_EQ(cold.dryBulb(), -3.5);
    EXPECT_NEAR(cold.relativeHumidity(), 1.0, 1e-6);

    const AirState& humid = states.get(DesignStateLabel::MIN_HUMIDITY);
    EXPECT_DOUBLE_EQ(humid.dryBulb(), -1.8);
    EXPECT_NEAR(humid.relativeHumidity(), 1.0, 1e-6);
}

TEST_F(DesignConditionsTest, WinterHumidityUsesRaisedWetBulb) {
    DesignDayRecord record = catalog.get("CUSTOM");
    record.heating_db_n20 = 12.0;
    record.heating_db_004 = 15.0;
    record.heating_db_meanwb = 8.0;

    StateTable states = DesignConditionsCatalog::designStates(record, 101325.0);
    EXPECT_NEAR(states.get(DesignStateLabel::MIN_N20).wetBulb(), 8.0, 1e-4);
    EXPECT_NEAR(states.get(DesignStateLabel::MIN_HUMIDITY).wetBulb(), 10.0, 1e-4);
    EXPECT_DOUBLE_EQ(states.get(DesignStateLabel::MIN_HUMIDITY).pressure(), 101325.0);
}

TEST_F(DesignConditionsTest, EveryLocationResolves) {
    for (const std::string& key : catalog.locations()) {
        StateTable states = DesignConditionsCatalog::designStates(catalog.get(key));
        EXPECT_EQ(states.size(), 5u) << key;
    }
}
