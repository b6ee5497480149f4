/**
 * @file test_receptor_network.cpp
 * @brief Unit tests for receptor classes, lab observations and receptor tables
 */

#include <gtest/gtest.h>
#include "ReceptorNetwork.hpp"
#include <petscsys.h>
#include <cmath>
#include <fstream>
#include <cstdio>

using namespace FIOGT;

TEST(ObservedConcentrationTest, LabConventions) {
    EXPECT_DOUBLE_EQ(parseObservedConcentration("Numerous"), 1000.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("numerous "), 1000.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("<1"), 0.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("< 1"), 0.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("Nil"), 0.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("-"), 0.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("42"), 42.0);
    EXPECT_DOUBLE_EQ(parseObservedConcentration("3.5"), 3.5);
    EXPECT_TRUE(std::isnan(parseObservedConcentration("")));
    EXPECT_TRUE(std::isnan(parseObservedConcentration("pending")));
}

TEST(ObservedConcentrationTest, NonAsciiBytes) {
    // UTF-8 no-break space before the qualifier, accented free text
    EXPECT_DOUBLE_EQ(parseObservedConcentration("\xC2\xA0<1"), 0.0);
    EXPECT_TRUE(std::isnan(parseObservedConcentration("\xC3\x89lev\xC3\xA9")));
    EXPECT_TRUE(std::isnan(parseObservedConcentration("nan")));
}

TEST(ReceptorClassTableTest, Defaults) {
    ReceptorClassTable classes;
    ASSERT_TRUE(classes.has("private"));
    ASSERT_TRUE(classes.has("government"));
    EXPECT_DOUBLE_EQ(classes.get("private").link_radius, 30.0);
    EXPECT_DOUBLE_EQ(classes.get("private").default_flux, 2000.0);
    EXPECT_DOUBLE_EQ(classes.get("government").link_radius, 100.0);
    EXPECT_DOUBLE_EQ(classes.get("government").default_flux, 20000.0);

    EXPECT_FALSE(classes.has("spring"));
    EXPECT_DOUBLE_EQ(classes.get("spring").link_radius, classes.fallback().link_radius);
    EXPECT_DOUBLE_EQ(classes.maxLinkRadius(), 100.0);
    EXPECT_NO_THROW(classes.validate());
}

TEST(ReceptorClassTableTest, ValidateRejectsNonPositive) {
    ReceptorClassTable classes;
    ReceptorClass bad;
    bad.name = "dry";
    bad.link_radius = 0.0;
    bad.default_flux = 100.0;
    classes.set(bad);
    EXPECT_THROW(classes.validate(), ConfigurationError);

    ReceptorClass no_flux;
    no_flux.name = "dry";
    no_flux.link_radius = 10.0;
    no_flux.default_flux = -1.0;
    classes.set(no_flux);
    EXPECT_THROW(classes.validate(), ConfigurationError);
}

class ReceptorNetworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_file = "test_receptors_unit.csv";

        if (rank == 0) {
            std::ofstream f(test_file);
            f << "id,lat,long,class,flux,observed\n";
            f << "R1,0.3476,32.5825,Private,,Numerous\n";
            f << "R2,0.3480,32.5830,government,15000,<1\n";
            f << "R3,0.3485,32.5835,spring,,\n";
            f << "R4,bad,32.5840,private,,12\n";
            f << "R5,0.3490,32.5845,,500,7\n";
            f.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_file.c_str());
        }
    }

    std::string test_file;
    int rank;
};

TEST_F(ReceptorNetworkTest, LoadCSV) {
    ReceptorClassTable classes;
    ReceptorNetwork net = ReceptorNetwork::loadCSV(test_file, classes);

    // R4 has an unparsable latitude
    ASSERT_EQ(net.size(), 4u);

    EXPECT_EQ(net[0].receptor_id, "R1");
    EXPECT_EQ(net[0].receptor_class, "private");
    EXPECT_DOUBLE_EQ(net[0].water_flux, 2000.0);
    EXPECT_DOUBLE_EQ(net[0].observed, 1000.0);

    EXPECT_DOUBLE_EQ(net[1].water_flux, 15000.0);
    EXPECT_DOUBLE_EQ(net[1].observed, 0.0);
    EXPECT_TRUE(net[1].hasObservation());

    // Unknown class takes the fallback flux
    EXPECT_DOUBLE_EQ(net[2].water_flux, classes.fallback().default_flux);
    EXPECT_FALSE(net[2].hasObservation());

    EXPECT_DOUBLE_EQ(net[3].water_flux, 500.0);
    EXPECT_EQ(net.numObserved(), 3u);

    std::vector<double> radii = net.linkRadii(classes);
    EXPECT_EQ(radii, (std::vector<double>{30.0, 100.0, 100.0, 100.0}));
}

TEST_F(ReceptorNetworkTest, MissingColumns) {
    const std::string file = "test_receptors_cols_unit.csv";
    if (rank == 0) {
        std::ofstream f(file);
        f << "name,lat\nA,0.1\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    EXPECT_THROW(ReceptorNetwork::loadCSV(file, ReceptorClassTable()), DataValidationError);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(file.c_str());
}

TEST_F(ReceptorNetworkTest, AlternateHeadersAndNonFiniteCoordinates) {
    const std::string file = "test_receptors_alias_unit.csv";
    if (rank == 0) {
        std::ofstream f(file);
        f << "receptor_id,latitude,lon,receptor_class,water_flux,observed_concentration\n";
        f << "R1,nan,1,private,,3\n";
        f << "R2,1,2,government,,NaN\n";
        f << "R3,1,inf,private,,4\n";
        f << "R4,2,3,private,,5\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    ReceptorClassTable classes;
    ReceptorNetwork net = ReceptorNetwork::loadCSV(file, classes);
    ASSERT_EQ(net.size(), 2u);
    EXPECT_EQ(net[0].receptor_id, "R2");
    EXPECT_DOUBLE_EQ(net[0].lat, 1.0);
    EXPECT_DOUBLE_EQ(net[0].lon, 2.0);
    EXPECT_DOUBLE_EQ(net[0].water_flux, 20000.0);
    // A NaN lab value counts as not sampled
    EXPECT_FALSE(net[0].hasObservation());
    EXPECT_EQ(net[1].receptor_id, "R4");
    EXPECT_DOUBLE_EQ(net[1].observed, 5.0);
    EXPECT_EQ(net.numObserved(), 1u);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(file.c_str());
}

TEST(ReceptorNetworkFluxTest, ValidateFlux) {
    ReceptorNetwork net;
    Receptor a;
    a.receptor_id = "A";
    a.water_flux = 10.0;
    net.addReceptor(a);
    EXPECT_NO_THROW(net.validateFlux());

    Receptor b;
    b.receptor_id = "B";
    b.water_flux = -5.0;
    net.addReceptor(b);
    try {
        net.validateFlux();
        FAIL() << "Expected DataValidationError";
    } catch (const DataValidationError& e) {
        EXPECT_EQ(e.offendingIds(), std::vector<std::string>{"B"});
    }
}
