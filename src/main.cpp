#include "FIOGT.hpp"
#include "ConfigReader.hpp"
#include "TransportPipeline.hpp"
#include "CalibrationSearch.hpp"
#include "ScenarioComparison.hpp"
#include "ResultWriter.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "FIOGT - Faecal indicator organism transport to groundwater sources\n"
                    "Usage: fiogt -c <file> [options]\n\n"
                    "Options:\n"
                    "  -c <file>                 Configuration file (.config)\n"
                    "  -mode <run|calibrate|compare>\n"
                    "                            run: concentrations under [SCENARIO] (default)\n"
                    "                            calibrate: grid search against observations\n"
                    "                            compare: all [SCENARIO.<name>] sections\n"
                    "  -o <prefix>               Output prefix (overrides the config)\n"
                    "  -generate_config <file>   Write a template configuration\n\n"
                    "Examples:\n"
                    "  fiogt -c config/kampala.config\n\n"
                    "  # Grid search spread over 8 ranks\n"
                    "  mpirun -np 8 fiogt -c config/kampala.config -mode calibrate\n\n"
                    "  fiogt -generate_config my_config.config\n\n";

namespace {

PetscErrorCode runMode(MPI_Comm comm, const FIOGT::ConfigReader& config,
                       const FIOGT::ConfigReader::SimulationConfig& sim,
                       const FIOGT::TransportPipeline& pipeline,
                       const FIOGT::ResultWriter& writer) {
    PetscMPIInt rank;

    PetscFunctionBeginUser;
    PetscCallMPI(MPI_Comm_rank(comm, &rank));

    FIOGT::TransportParameters params;
    config.parseTransportParameters(params);
    const FIOGT::RiskThresholds thresholds = config.parseRiskThresholds();
    const FIOGT::ScenarioConfig scenario = config.parseScenarios().front();

    PetscCall(PetscPrintf(comm, "Scenario:      %s\n", scenario.name.c_str()));
    PetscCall(PetscPrintf(comm, "Decay rate:    %g 1/m\n", params.decay_rate));

    FIOGT::PipelineResult result = pipeline.run(params, &scenario, sim.write_links);

    FIOGT::ScenarioSummary summary =
        FIOGT::ScenarioComparison::summarize(scenario.name, result, thresholds);
    PetscCall(PetscPrintf(comm, "Rows evaluated:      %zu\n", summary.num_rows));
    PetscCall(PetscPrintf(comm, "Total population:    %.1f\n", summary.total_population));
    PetscCall(PetscPrintf(comm, "Total net load:      %.4e CFU/day\n", summary.total_load));
    PetscCall(PetscPrintf(comm, "Linked receptors:    %zu of %zu\n",
                          summary.linked_receptors, pipeline.receptors().size()));
    PetscCall(PetscPrintf(comm, "Risk tiers:          low %zu, medium %zu, high %zu\n",
                          summary.tier_counts[0], summary.tier_counts[1], summary.tier_counts[2]));

    if (rank == 0) {
        std::string f = writer.writeConcentrations(pipeline.receptors(), result, thresholds);
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Wrote %s\n", f.c_str()));
        f = writer.writeFacilityLoads(result);
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Wrote %s\n", f.c_str()));
        if (sim.write_links) {
            f = writer.writeLinks(pipeline.receptors(), result);
            PetscCall(PetscPrintf(PETSC_COMM_SELF, "Wrote %s\n", f.c_str()));
        }
    }
    PetscFunctionReturn(0);
}

PetscErrorCode calibrateMode(MPI_Comm comm, const FIOGT::ConfigReader& config,
                             const FIOGT::TransportPipeline& pipeline,
                             const FIOGT::ResultWriter& writer) {
    PetscMPIInt rank;

    PetscFunctionBeginUser;
    PetscCallMPI(MPI_Comm_rank(comm, &rank));

    FIOGT::CalibrationConfig calib;
    if (!config.parseCalibrationConfig(calib)) {
        PetscCall(PetscPrintf(comm, "No [CALIBRATION] section - using the default grids\n"));
    }
    FIOGT::TransportParameters params;
    config.parseTransportParameters(params);

    FIOGT::ScenarioConfig scenario = config.parseScenarios().front();
    FIOGT::CalibrationSearch search(pipeline, calib, params.efficiencies,
                                    calib.apply_scenario ? &scenario : nullptr);

    PetscCall(PetscPrintf(comm, "Grid points:       %zu\n", search.grid().size()));
    PetscCall(PetscPrintf(comm, "Matched receptors: %zu (observed > %g CFU/100mL)\n",
                          search.matchedReceptors().size(), calib.detection_threshold));

    FIOGT::CalibrationReport report;
    PetscCall(search.run(comm, report));

    if (report.has_best) {
        const FIOGT::CalibrationRecord& best = report.best();
        PetscCall(PetscPrintf(comm, "Best point %zu: decay_rate = %g, spearman = %.4f, "
                              "kendall = %.4f, rmse_log = %.4f, log_bias_shift = %.4f\n",
                              best.grid_index, best.parameters.decay_rate,
                              best.metrics.spearman_rho, best.metrics.kendall_tau,
                              best.metrics.rmse_log, best.metrics.log_bias_shift));
    } else {
        PetscCall(PetscPrintf(comm, "No grid point could be scored\n"));
    }

    if (rank == 0) {
        std::string f = writer.writeCalibrationReport(report);
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Wrote %s\n", f.c_str()));
        f = writer.writeCalibratedConfig(report, calib);
        if (!f.empty()) {
            PetscCall(PetscPrintf(PETSC_COMM_SELF, "Wrote %s\n", f.c_str()));
        }
    }
    PetscFunctionReturn(0);
}

PetscErrorCode compareMode(MPI_Comm comm, const FIOGT::ConfigReader& config,
                           const FIOGT::TransportPipeline& pipeline,
                           const FIOGT::ResultWriter& writer) {
    PetscMPIInt rank;

    PetscFunctionBeginUser;
    PetscCallMPI(MPI_Comm_rank(comm, &rank));

    FIOGT::TransportParameters params;
    config.parseTransportParameters(params);
    FIOGT::ScenarioComparison comparison(pipeline, params, config.parseRiskThresholds());

    std::vector<FIOGT::ScenarioSummary> summaries = comparison.compare(config.parseScenarios());

    PetscCall(PetscPrintf(comm, "%-24s %14s %14s %10s %8s\n",
                          "Scenario", "Population", "Load", "Reduction", "High"));
    for (const auto& s : summaries) {
        PetscCall(PetscPrintf(comm, "%-24s %14.1f %14.4e %9.1f%% %8zu\n",
                              s.name.c_str(), s.total_population, s.total_load,
                              100.0 * s.load_reduction, s.tier_counts[2]));
    }

    if (rank == 0) {
        std::string f = writer.writeScenarioComparison(summaries);
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Wrote %s\n", f.c_str()));
    }
    PetscFunctionReturn(0);
}

} // namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); if (ierr) return ierr;

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                FIOGT::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                PetscPrintf(comm, "Edit the input files and grids, then run fiogt -c %s\n",
                            generate_config);
            }
            ierr = PetscFinalize();
            return 0;
        }

        // Parse command line arguments
        char config_file[PETSC_MAX_PATH_LEN] = "";
        char output_prefix[PETSC_MAX_PATH_LEN] = "";
        char mode[64] = "run";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_prefix,
                                     sizeof(output_prefix), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-mode", mode,
                                     sizeof(mode), nullptr); CHKERRQ(ierr);

        if (!config_provided) {
            PetscPrintf(comm, "Error: Configuration file (-c) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: fiogt -generate_config template.config\n");
            ierr = PetscFinalize();
            return 1;
        }

        const std::string run_mode(mode);
        if (run_mode != "run" && run_mode != "calibrate" && run_mode != "compare") {
            PetscPrintf(comm, "Error: Unknown mode '%s' (expected run, calibrate or compare)\n", mode);
            ierr = PetscFinalize();
            return 1;
        }

        try {
            FIOGT::ConfigReader config;
            if (!config.loadFile(config_file)) {
                throw FIOGT::ConfigurationError(std::string("Cannot read configuration: ") +
                                                config_file);
            }

            FIOGT::ConfigReader::ValidationResult validation = config.validate();
            for (const auto& w : validation.warnings) {
                PetscPrintf(comm, "Warning: %s\n", w.c_str());
            }
            if (!validation.valid) {
                for (const auto& e : validation.errors) {
                    PetscPrintf(comm, "Error: %s\n", e.c_str());
                }
                ierr = PetscFinalize();
                return 1;
            }

            FIOGT::ConfigReader::SimulationConfig sim;
            config.parseSimulationConfig(sim);
            if (output_provided) {
                sim.output_prefix = output_prefix;
            }

            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  FIOGT - Groundwater Contamination Screening\n");
            PetscPrintf(comm, "  Version 1.0.0\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "Config file:   %s\n", config_file);
            PetscPrintf(comm, "Run name:      %s\n", sim.name.c_str());
            PetscPrintf(comm, "Mode:          %s\n", mode);
            PetscPrintf(comm, "Output prefix: %s\n", sim.output_prefix.c_str());
            PetscPrintf(comm, "\n");

            double start_time = MPI_Wtime();

            PetscPrintf(comm, "Loading inputs...\n");
            const FIOGT::EfficiencyTable efficiencies = config.parseEfficiencyTable();
            const FIOGT::ReceptorClassTable classes = config.parseReceptorClasses();

            FIOGT::FacilityInventory facilities = FIOGT::FacilityInventory::loadCSV(
                sim.facilities_file, efficiencies, sim.household_population);
            FIOGT::ReceptorNetwork receptors =
                FIOGT::ReceptorNetwork::loadCSV(sim.receptors_file, classes);

            PetscPrintf(comm, "Facilities:    %zu rows at %zu sites\n",
                        facilities.size(), facilities.numSites());
            PetscPrintf(comm, "Receptors:     %zu (%zu with observations)\n",
                        receptors.size(), receptors.numObserved());

            PetscPrintf(comm, "Linking facilities to receptors...\n");
            FIOGT::TransportPipeline pipeline(std::move(facilities), std::move(receptors),
                                              classes, sim.input_crs, sim.model_crs,
                                              sim.index_cell_size);
            PetscPrintf(comm, "Model CRS:     %s\n", pipeline.modelCRS().c_str());
            PetscPrintf(comm, "Links:         %zu\n", pipeline.adjacency().numLinks());
            PetscPrintf(comm, "------------------------------------------------------------\n");

            FIOGT::ResultWriter writer(sim.output_prefix);
            if (run_mode == "calibrate") {
                ierr = calibrateMode(comm, config, pipeline, writer); CHKERRQ(ierr);
            } else if (run_mode == "compare") {
                ierr = compareMode(comm, config, pipeline, writer); CHKERRQ(ierr);
            } else {
                ierr = runMode(comm, config, sim, pipeline, writer); CHKERRQ(ierr);
            }

            double end_time = MPI_Wtime();

            PetscPrintf(comm, "------------------------------------------------------------\n");
            PetscPrintf(comm, "Completed successfully\n");
            PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
            PetscPrintf(comm, "============================================================\n");

        } catch (const std::exception& e) {
            PetscPrintf(comm, "\nError: %s\n", e.what());
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return ierr;
}
