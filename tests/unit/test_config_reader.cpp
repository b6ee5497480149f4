/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "FIOGT.hpp"
#include <petscsys.h>
#include <fstream>
#include <cstdio>

using namespace FIOGT;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit.config";

        if (rank == 0) {
            std::ofstream config(test_config_file);
            config << "# Kampala survey run\n";
            config << "[SIMULATION]\n";
            config << "name = kampala\n";
            config << "facilities_file = facilities.csv\n";
            config << "receptors_file = receptors.csv\n";
            config << "output_prefix = out/kampala\n";
            config << "model_crs = EPSG:32636\n";
            config << "household_population = 8\n";
            config << "write_links = yes\n";
            config << "\n[TRANSPORT]\n";
            config << "decay_rate = 80 1/km     # same as 0.08 1/m\n";
            config << "shedding_rate = 1e10\n";
            config << "link_radius = 0.05 km\n";
            config << "default_flux = 1 m3/day\n";
            config << "\n[EFFICIENCY]\n";
            config << "pit = 0.1\n";
            config << "septic = 0.3\n";
            config << "\n[RECEPTOR.Private]\n";
            config << "link_radius = 25 m\n";
            config << "\n[RECEPTOR.spring]\n";
            config << "link_radius = 60\n";
            config << "default_flux = 5000 L/day\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_config_file.c_str());
        }
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file)) << "Should load config file successfully";
    EXPECT_TRUE(reader.hasSection("SIMULATION"));
    EXPECT_TRUE(reader.hasKey("TRANSPORT", "decay_rate"));
    EXPECT_FALSE(reader.hasKey("TRANSPORT", "porosity"));
}

TEST_F(ConfigReaderTest, MissingFileFails) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, SimulationSection) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::SimulationConfig sim;
    ASSERT_TRUE(reader.parseSimulationConfig(sim));
    EXPECT_EQ(sim.name, "kampala");
    EXPECT_EQ(sim.facilities_file, "facilities.csv");
    EXPECT_EQ(sim.receptors_file, "receptors.csv");
    EXPECT_EQ(sim.output_prefix, "out/kampala");
    EXPECT_EQ(sim.input_crs, "EPSG:4326");
    EXPECT_EQ(sim.model_crs, "EPSG:32636");
    EXPECT_DOUBLE_EQ(sim.household_population, 8.0);
    EXPECT_TRUE(sim.write_links);
}

TEST_F(ConfigReaderTest, TransportValuesWithUnits) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    TransportParameters params;
    ASSERT_TRUE(reader.parseTransportParameters(params));
    EXPECT_NEAR(params.decay_rate, 0.08, 1e-12);
    EXPECT_DOUBLE_EQ(params.shedding_rate, 1e10);

    EXPECT_DOUBLE_EQ(params.efficiencies.get(SanitationCategory::PIT), 0.1);
    EXPECT_DOUBLE_EQ(params.efficiencies.get(SanitationCategory::SEPTIC), 0.3);
    EXPECT_DOUBLE_EQ(params.efficiencies.get(SanitationCategory::SEWERED), 0.8);
    EXPECT_DOUBLE_EQ(params.efficiencies.get(SanitationCategory::OPEN_DEFECATION), 0.0);
}

TEST_F(ConfigReaderTest, ReceptorClasses) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ReceptorClassTable classes = reader.parseReceptorClasses();

    // Section names are case-insensitive class names
    ASSERT_TRUE(classes.has("private"));
    EXPECT_NEAR(classes.get("private").link_radius, 25.0, 1e-12);
    EXPECT_NEAR(classes.get("private").default_flux, 2000.0, 1e-9);

    ASSERT_TRUE(classes.has("spring"));
    EXPECT_NEAR(classes.get("spring").link_radius, 60.0, 1e-12);
    EXPECT_NEAR(classes.get("spring").default_flux, 5000.0, 1e-9);

    EXPECT_NEAR(classes.get("government").link_radius, 100.0, 1e-12);

    // [TRANSPORT] sets the fallback class
    EXPECT_NEAR(classes.fallback().link_radius, 50.0, 1e-12);
    EXPECT_NEAR(classes.fallback().default_flux, 1000.0, 1e-9);
    EXPECT_NEAR(classes.get("unknown").link_radius, 50.0, 1e-12);
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_EQ(reader.getInt("SIMULATION", "missing", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("SIMULATION", "missing", 3.5), 3.5);
    EXPECT_EQ(reader.getString("NOPE", "key", "fallback"), "fallback");
    EXPECT_TRUE(reader.getBool("SIMULATION", "missing", true));
}

TEST_F(ConfigReaderTest, MalformedNumbersFallBackToDefault) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[A]\nn = lots\nx = many\n"));
    EXPECT_EQ(reader.getInt("A", "n", 7), 7);
    EXPECT_DOUBLE_EQ(reader.getDouble("A", "x", 1.5), 1.5);
}

TEST_F(ConfigReaderTest, ScenarioSections) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[SCENARIO]\n"
        "pop_factor = 1.5\n"
        "\n[SCENARIO.od_free]\n"
        "od_reduction_fraction = 1.0\n"
        "colour = blue\n"
        "\n[SCENARIO.upgrade]\n"
        "name = pit upgrade\n"
        "infrastructure_upgrade_fraction = 0.5\n"
        "centralized_treatment_enabled = true\n"
        "fsm_treatment_fraction = 0.25\n"));

    std::vector<ScenarioConfig> scenarios = reader.parseScenarios();
    ASSERT_EQ(scenarios.size(), 3u);

    EXPECT_EQ(scenarios[0].name, "baseline");
    EXPECT_DOUBLE_EQ(scenarios[0].pop_factor, 1.5);

    EXPECT_EQ(scenarios[1].name, "od_free");
    EXPECT_DOUBLE_EQ(scenarios[1].od_reduction_fraction, 1.0);
    EXPECT_DOUBLE_EQ(scenarios[1].pop_factor, 1.0);

    EXPECT_EQ(scenarios[2].name, "pit upgrade");
    EXPECT_DOUBLE_EQ(scenarios[2].infrastructure_upgrade_fraction, 0.5);
    EXPECT_TRUE(scenarios[2].centralized_treatment_enabled);
    EXPECT_DOUBLE_EQ(scenarios[2].fsm_treatment_fraction, 0.25);
}

TEST_F(ConfigReaderTest, BaselineScenarioWithoutSection) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[TRANSPORT]\ndecay_rate = 0.1\n"));

    std::vector<ScenarioConfig> scenarios = reader.parseScenarios();
    ASSERT_EQ(scenarios.size(), 1u);
    EXPECT_TRUE(scenarios[0].isBaseline());
}

TEST_F(ConfigReaderTest, CalibrationGrids) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[CALIBRATION]\n"
        "decay_rate_grid = 50 1/km, 0.1, 0.2 1/m\n"
        "efficiency_pit_grid = 0.1, 0.15, 0.2\n"
        "detection_threshold = 5\n"
        "receptor_class = Private\n"
        "apply_scenario = true\n"));

    CalibrationConfig calib;
    ASSERT_TRUE(reader.parseCalibrationConfig(calib));

    ASSERT_EQ(calib.decay_rate_grid.size(), 3u);
    EXPECT_NEAR(calib.decay_rate_grid[0], 0.05, 1e-12);
    EXPECT_NEAR(calib.decay_rate_grid[1], 0.1, 1e-12);
    EXPECT_NEAR(calib.decay_rate_grid[2], 0.2, 1e-12);

    EXPECT_EQ(calib.efficiency_grid[categoryIndex(SanitationCategory::PIT)].size(), 3u);
    // Unspecified grids keep their defaults
    EXPECT_EQ(calib.efficiency_grid[categoryIndex(SanitationCategory::SEPTIC)],
              (std::vector<double>{0.3, 0.5}));
    EXPECT_EQ(calib.shedding_rate_grid, (std::vector<double>{1.0e7}));

    EXPECT_DOUBLE_EQ(calib.detection_threshold, 5.0);
    EXPECT_EQ(calib.receptor_class, "private");
    EXPECT_TRUE(calib.apply_scenario);
}

TEST_F(ConfigReaderTest, RiskThresholds) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[RISK]\nhigh_threshold = 100\nprediction_scale_factor = 3.3\n"));

    RiskThresholds t = reader.parseRiskThresholds();
    EXPECT_DOUBLE_EQ(t.low, 10.0);
    EXPECT_DOUBLE_EQ(t.high, 100.0);
    EXPECT_DOUBLE_EQ(t.prediction_scale_factor, 3.3);
}

TEST_F(ConfigReaderTest, GetSectionsMatching) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    std::vector<std::string> receptors = reader.getSectionsMatching("RECEPTOR.");
    EXPECT_EQ(receptors.size(), 2u);
}

TEST_F(ConfigReaderTest, MergeFileOverrides) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString("[TRANSPORT]\ndecay_rate = 0.05\nshedding_rate = 1e9\n"));
    ASSERT_TRUE(reader.mergeFile(test_config_file));

    EXPECT_NEAR(reader.getDoubleWithUnit("TRANSPORT", "decay_rate", 0.0, "1/m"), 0.08, 1e-12);
    EXPECT_DOUBLE_EQ(reader.getDouble("TRANSPORT", "shedding_rate"), 1e10);
    EXPECT_TRUE(reader.hasSection("SIMULATION"));
}

TEST_F(ConfigReaderTest, ValidateAcceptsGoodConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ValidateReportsDomainErrors) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadString(
        "[SIMULATION]\n"
        "facilities_file = f.csv\n"
        "\n[TRANSPORT]\n"
        "decay_rate = -0.1\n"
        "\n[SCENARIO.bad]\n"
        "od_reduction_fraction = 1.5\n"
        "od_reduktion = 0.2\n"
        "\n[RECEPTOR.well]\n"
        "link_radius = 0\n"));

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_FALSE(result.valid);
    // receptors_file, decay rate, scenario fraction and link radius
    EXPECT_EQ(result.errors.size(), 4u);
    EXPECT_FALSE(result.warnings.empty());
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    const std::string tmpl = "test_template_unit.config";
    if (rank == 0) {
        ConfigReader::generateTemplate(tmpl);
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(tmpl));
    EXPECT_TRUE(reader.validate().valid);

    std::vector<ScenarioConfig> scenarios = reader.parseScenarios();
    EXPECT_EQ(scenarios.size(), 3u);

    CalibrationConfig calib;
    ASSERT_TRUE(reader.parseCalibrationConfig(calib));
    EXPECT_EQ(ParameterGrid(calib).size(), 16u);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) {
        std::remove(tmpl.c_str());
    }
}
