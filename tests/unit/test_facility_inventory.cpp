/**
 * @file test_facility_inventory.cpp
 * @brief Unit tests for table reading, facility inventory and efficiency table
 */

#include <gtest/gtest.h>
#include "FacilityInventory.hpp"
#include "TableIO.hpp"
#include <petscsys.h>
#include <fstream>
#include <cstdio>

using namespace FIOGT;

TEST(TableIOTest, SplitHandlesQuotes) {
    std::vector<std::string> f = splitCSVLine("a, \"b,c\" ,\"say \"\"hi\"\"\",");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b,c");
    EXPECT_EQ(f[2], "say \"hi\"");
    EXPECT_EQ(f[3], "");
}

TEST(TableIOTest, CsvFieldQuotesWhenNeeded) {
    EXPECT_EQ(csvField("plain"), "plain");
    EXPECT_EQ(csvField("a,b"), "\"a,b\"");
    EXPECT_EQ(csvField("x\"y"), "\"x\"\"y\"");
}

TEST(TableIOTest, ParseNumberRejectsGarbage) {
    double v = 0.0;
    EXPECT_TRUE(parseNumber("0.25", v));
    EXPECT_DOUBLE_EQ(v, 0.25);
    EXPECT_TRUE(parseNumber(" 3 ", v));
    EXPECT_DOUBLE_EQ(v, 3.0);
    EXPECT_FALSE(parseNumber("", v));
    EXPECT_FALSE(parseNumber("12abc", v));
    EXPECT_FALSE(parseNumber("n/a", v));
}

TEST(TableIOTest, ParseNumberRejectsNonFinite) {
    double v = 7.0;
    EXPECT_FALSE(parseNumber("NaN", v));
    EXPECT_FALSE(parseNumber("nan", v));
    EXPECT_FALSE(parseNumber("inf", v));
    EXPECT_FALSE(parseNumber("-Infinity", v));
    EXPECT_FALSE(parseNumber("1e400", v));
    EXPECT_DOUBLE_EQ(v, 7.0);
}

TEST(TableIOTest, FindColumnTriesCandidatesInOrder) {
    CSVTable table;
    table.header = {"facility_id", "latitude", "lat"};
    EXPECT_EQ(table.findColumn({"lat", "latitude"}), 2);
    EXPECT_EQ(table.findColumn({"latitude", "lat"}), 1);
    EXPECT_EQ(table.findColumn({"id", "facility_id"}), 0);
    EXPECT_EQ(table.findColumn({"long", "longitude"}), -1);
    EXPECT_EQ(table.column("latitude"), 1);
}

TEST(TableIOTest, MissingFileThrows) {
    EXPECT_THROW(readCSV("no_such_table.csv"), DataValidationError);
}

TEST(EfficiencyTableTest, Defaults) {
    EfficiencyTable eff;
    EXPECT_DOUBLE_EQ(eff.get(SanitationCategory::SEWERED), 0.80);
    EXPECT_DOUBLE_EQ(eff.get(SanitationCategory::PIT), 0.20);
    EXPECT_DOUBLE_EQ(eff.get(SanitationCategory::SEPTIC), 0.90);
    EXPECT_DOUBLE_EQ(eff.get(SanitationCategory::OPEN_DEFECATION), 0.00);
    EXPECT_DOUBLE_EQ(eff.centralizedTreatment(), 0.90);
    EXPECT_DOUBLE_EQ(eff.fsmHigh(), 0.80);
    EXPECT_NO_THROW(eff.validate());
}

TEST(EfficiencyTableTest, WithCategoryCopies) {
    EfficiencyTable eff;
    EfficiencyTable changed = eff.withCategory(SanitationCategory::PIT, 0.35);
    EXPECT_DOUBLE_EQ(changed.get(SanitationCategory::PIT), 0.35);
    EXPECT_DOUBLE_EQ(eff.get(SanitationCategory::PIT), 0.20);
    EXPECT_NE(eff, changed);
}

TEST(EfficiencyTableTest, OutOfRangeRejected) {
    EXPECT_THROW(EfficiencyTable(1.2, 0.2, 0.9, 0.0).validate(), ConfigurationError);
    EXPECT_THROW(EfficiencyTable(0.8, -0.1, 0.9, 0.0).validate(), ConfigurationError);
    EXPECT_THROW(EfficiencyTable(0.8, 0.2, 0.9, 0.0, 1.5).validate(), ConfigurationError);
}

TEST(SanitationCategoryTest, CodesAndNames) {
    SanitationCategory c;
    ASSERT_TRUE(parseSanitationCategory("1", c));
    EXPECT_EQ(c, SanitationCategory::SEWERED);
    ASSERT_TRUE(parseSanitationCategory("4", c));
    EXPECT_EQ(c, SanitationCategory::OPEN_DEFECATION);
    ASSERT_TRUE(parseSanitationCategory("Septic_Tank", c));
    EXPECT_EQ(c, SanitationCategory::SEPTIC);
    ASSERT_TRUE(parseSanitationCategory(" PIT ", c));
    EXPECT_EQ(c, SanitationCategory::PIT);
    EXPECT_FALSE(parseSanitationCategory("5", c));
    EXPECT_FALSE(parseSanitationCategory("Fosse_septique_\xC3\xA9tanche", c));
    EXPECT_FALSE(parseSanitationCategory("NaN", c));
    EXPECT_FALSE(parseSanitationCategory("bucket", c));

    EXPECT_EQ(sanitationCategoryName(SanitationCategory::OPEN_DEFECATION), "open_defecation");
}

class FacilityInventoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        good_file = "test_facilities_unit.csv";
        bad_file = "test_facilities_bad_unit.csv";

        if (rank == 0) {
            std::ofstream f(good_file);
            f << "\xEF\xBB\xBF" << "id,lat,long,category,population,efficiency\n";
            f << "F1,0.3476,32.5825,2,12,\n";
            f << "F2,0.3480,32.5830,septic,,0.5\n";
            f << "F3,,32.5840,1,5,\n";
            f << "\"F4,annex\",0.3490,32.5850,4,3,\n";
            f.close();

            std::ofstream b(bad_file);
            b << "id,lat,long,category\n";
            b << "B1,0.1,32.1,2\n";
            b << "B2,0.1,32.1,bucket\n";
            b.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(good_file.c_str());
            std::remove(bad_file.c_str());
        }
    }

    std::string good_file;
    std::string bad_file;
    int rank;
};

TEST_F(FacilityInventoryTest, LoadCSV) {
    FacilityInventory inv = FacilityInventory::loadCSV(good_file, EfficiencyTable(), 10.0);

    // F3 has no latitude and is dropped
    ASSERT_EQ(inv.size(), 3u);

    EXPECT_EQ(inv[0].facility_id, "F1");
    EXPECT_EQ(inv[0].category, SanitationCategory::PIT);
    EXPECT_DOUBLE_EQ(inv[0].population, 12.0);
    EXPECT_DOUBLE_EQ(inv[0].efficiency, 0.20);
    EXPECT_TRUE(inv[0].efficiency_from_default);

    EXPECT_EQ(inv[1].category, SanitationCategory::SEPTIC);
    EXPECT_DOUBLE_EQ(inv[1].population, 10.0);
    EXPECT_DOUBLE_EQ(inv[1].efficiency, 0.5);
    EXPECT_FALSE(inv[1].efficiency_from_default);

    EXPECT_EQ(inv[2].facility_id, "F4,annex");
    EXPECT_EQ(inv[2].category, SanitationCategory::OPEN_DEFECATION);

    EXPECT_EQ(inv.numSites(), 3u);
    EXPECT_DOUBLE_EQ(inv.totalPopulation(), 25.0);
    EXPECT_DOUBLE_EQ(inv.populationByCategory(SanitationCategory::PIT), 12.0);
}

TEST_F(FacilityInventoryTest, UnknownCategoryReportsIds) {
    try {
        FacilityInventory::loadCSV(bad_file, EfficiencyTable());
        FAIL() << "Expected DataValidationError";
    } catch (const DataValidationError& e) {
        ASSERT_EQ(e.offendingIds().size(), 1u);
        EXPECT_EQ(e.offendingIds()[0], "B2");
    }
}

TEST_F(FacilityInventoryTest, MissingColumnsReported) {
    const std::string file = "test_facilities_cols_unit.csv";
    if (rank == 0) {
        std::ofstream f(file);
        f << "id,lat,population\nX,0.1,3\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    try {
        FacilityInventory::loadCSV(file, EfficiencyTable());
        ADD_FAILURE() << "Expected DataValidationError";
    } catch (const DataValidationError& e) {
        EXPECT_EQ(e.offendingIds(), (std::vector<std::string>{"long", "category"}));
    }

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(file.c_str());
}

TEST_F(FacilityInventoryTest, AlternateHeadersAndNonFiniteCoordinates) {
    const std::string file = "test_facilities_alias_unit.csv";
    if (rank == 0) {
        std::ofstream f(file);
        f << "facility_id,latitude,longitude,toilet_category_id,household_population\n";
        f << "A,NaN,NaN,2,2\n";
        f << "B,5,5,2,2\n";
        f << "C,inf,1,2,2\n";
        f << "D,2,-Infinity,2,2\n";
        f << "E,-3,4,septic,6\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    FacilityInventory inv = FacilityInventory::loadCSV(file, EfficiencyTable());
    ASSERT_EQ(inv.size(), 2u);
    EXPECT_EQ(inv[0].facility_id, "B");
    EXPECT_DOUBLE_EQ(inv[0].lat, 5.0);
    EXPECT_DOUBLE_EQ(inv[0].lon, 5.0);
    EXPECT_DOUBLE_EQ(inv[0].population, 2.0);
    EXPECT_EQ(inv[1].facility_id, "E");
    EXPECT_EQ(inv[1].category, SanitationCategory::SEPTIC);
    EXPECT_DOUBLE_EQ(inv[1].lat, -3.0);
    EXPECT_DOUBLE_EQ(inv[1].lon, 4.0);
    EXPECT_DOUBLE_EQ(inv.totalPopulation(), 8.0);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(file.c_str());
}

TEST(FacilityInventoryRowsTest, ValidateNegativePopulation) {
    FacilityInventory inv;
    FacilityRow ok;
    ok.facility_id = "ok";
    ok.population = 4.0;
    inv.addRow(ok);

    FacilityRow bad;
    bad.facility_id = "neg";
    bad.population = -1.0;
    inv.addRow(bad);

    try {
        inv.validate();
        FAIL() << "Expected DataValidationError";
    } catch (const DataValidationError& e) {
        EXPECT_EQ(e.offendingIds(), std::vector<std::string>{"neg"});
    }
}

TEST(FacilityInventoryRowsTest, WithEfficienciesOnlyTouchesDefaults) {
    FacilityInventory inv;
    FacilityRow a;
    a.category = SanitationCategory::PIT;
    a.population = 1.0;
    a.efficiency = 0.2;
    a.efficiency_from_default = true;
    inv.addRow(a);

    FacilityRow b = a;
    b.efficiency = 0.6;
    b.efficiency_from_default = false;
    inv.addRow(b);

    FacilityInventory out =
        inv.withEfficiencies(EfficiencyTable().withCategory(SanitationCategory::PIT, 0.1));
    EXPECT_DOUBLE_EQ(out[0].efficiency, 0.1);
    EXPECT_DOUBLE_EQ(out[1].efficiency, 0.6);
    EXPECT_DOUBLE_EQ(inv[0].efficiency, 0.2);

    EXPECT_EQ(out[0].site, 0u);
    EXPECT_EQ(out[1].site, 1u);
}
