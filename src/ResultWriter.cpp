#include "ResultWriter.hpp"
#include "TableIO.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace FIOGT {

namespace {

std::ofstream openOutput(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    file << std::setprecision(10);
    return file;
}

// Empty cell for NaN
std::string num(double v) {
    if (std::isnan(v)) return "";
    std::ostringstream ss;
    ss << std::setprecision(10) << v;
    return ss.str();
}

} // namespace

ResultWriter::ResultWriter(const std::string& prefix)
    : prefix_(prefix) {}

std::string ResultWriter::path(const std::string& suffix) const {
    return prefix_ + "_" + suffix;
}

std::string ResultWriter::writeConcentrations(const ReceptorNetwork& receptors,
                                              const PipelineResult& result,
                                              const RiskThresholds& thresholds) const {
    const std::string filename = path("concentrations.csv");
    std::ofstream file = openOutput(filename);

    file << "receptor_id,class,flux_L_per_day,links,surviving_load,concentration,"
            "risk_tier,observed,observed_tier\n";

    for (std::size_t r = 0; r < receptors.size(); ++r) {
        const Receptor& rec = receptors[r];
        const double c = result.concentrations[r];
        file << csvField(rec.receptor_id) << ","
             << csvField(rec.receptor_class) << ","
             << rec.water_flux << ","
             << result.link_counts[r] << ","
             << result.surviving_loads[r] << ","
             << c << ","
             << riskTierName(thresholds.classifyPredicted(c)) << ","
             << num(rec.observed) << ","
             << (rec.hasObservation() ? riskTierName(thresholds.classifyObserved(rec.observed)) : "")
             << "\n";
    }
    return filename;
}

std::string ResultWriter::writeLinks(const ReceptorNetwork& receptors,
                                     const PipelineResult& result) const {
    const std::string filename = path("links.csv");
    std::ofstream file = openOutput(filename);

    file << "facility_id,category,receptor_id,distance_m,decay_weight,contributed_load\n";
    for (const auto& link : result.links) {
        const FacilityRow& row = result.inventory[link.row];
        file << csvField(row.facility_id) << ","
             << sanitationCategoryName(row.category) << ","
             << csvField(receptors[link.receptor].receptor_id) << ","
             << link.distance << ","
             << link.decay_weight << ","
             << link.contributed_load << "\n";
    }
    return filename;
}

std::string ResultWriter::writeFacilityLoads(const PipelineResult& result) const {
    const std::string filename = path("facility_loads.csv");
    std::ofstream file = openOutput(filename);

    file << "facility_id,lat,long,category,population,efficiency,net_load\n";
    for (std::size_t i = 0; i < result.inventory.size(); ++i) {
        const FacilityRow& row = result.inventory[i];
        file << csvField(row.facility_id) << ","
             << row.lat << ","
             << row.lon << ","
             << sanitationCategoryName(row.category) << ","
             << row.population << ","
             << row.efficiency << ","
             << result.loads[i] << "\n";
    }
    return filename;
}

std::string ResultWriter::writeCalibrationReport(const CalibrationReport& report) const {
    const std::string filename = path("calibration.csv");
    std::ofstream file = openOutput(filename);

    file << "rank,grid_index";
    for (int p = 0; p < ParameterGrid::NUM_PARAMETERS; ++p) {
        file << "," << ParameterGrid::parameterName(p);
    }
    file << ",n_matched,spearman_rho,kendall_tau,pearson_r_log,rmse_log,log_bias_shift,"
            "status,best,message\n";

    for (std::size_t i = 0; i < report.records.size(); ++i) {
        const CalibrationRecord& rec = report.records[i];
        const ParameterVector& v = rec.parameters;
        file << i + 1 << "," << rec.grid_index << ","
             << v.decay_rate << "," << v.shedding_rate;
        for (double e : v.efficiency) file << "," << e;
        file << "," << rec.metrics.n_matched
             << "," << num(rec.metrics.spearman_rho)
             << "," << num(rec.metrics.kendall_tau)
             << "," << num(rec.metrics.pearson_r_log)
             << "," << num(rec.metrics.rmse_log)
             << "," << num(rec.metrics.log_bias_shift)
             << "," << runStatusName(rec.status)
             << "," << ((i == 0 && report.has_best) ? "true" : "false")
             << "," << csvField(rec.message) << "\n";
    }
    return filename;
}

std::string ResultWriter::writeCalibratedConfig(const CalibrationReport& report,
                                                const CalibrationConfig& config) const {
    if (!report.has_best) return "";

    const std::string filename = path("calibrated.config");
    std::ofstream file = openOutput(filename);
    const CalibrationRecord& best = report.best();

    file << "# Calibrated parameters (best by trend)\n";
    file << "# grid_index = " << best.grid_index << " of " << report.records.size() << "\n";
    file << "# n_matched = " << best.metrics.n_matched
         << ", detection_threshold = " << config.detection_threshold << "\n";
    file << "# spearman_rho = " << num(best.metrics.spearman_rho)
         << ", kendall_tau = " << num(best.metrics.kendall_tau)
         << ", pearson_r_log = " << num(best.metrics.pearson_r_log)
         << ", rmse_log = " << num(best.metrics.rmse_log) << "\n";
    file << "# log_bias_shift = " << num(best.metrics.log_bias_shift)
         << " (log1p-space offset of predictions onto the observed mean)\n\n";

    file << "[TRANSPORT]\n";
    file << "decay_rate = " << best.parameters.decay_rate << "\n";
    file << "shedding_rate = " << best.parameters.shedding_rate << "\n\n";

    file << "[EFFICIENCY]\n";
    for (int c = 0; c < NUM_SANITATION_CATEGORIES; ++c) {
        file << sanitationCategoryName(categoryFromIndex(c)) << " = "
             << best.parameters.efficiency[c] << "\n";
    }
    return filename;
}

std::string ResultWriter::writeScenarioComparison(
    const std::vector<ScenarioSummary>& summaries) const {
    const std::string filename = path("scenario_comparison.csv");
    std::ofstream file = openOutput(filename);

    file << "scenario,rows,total_population,total_load,load_reduction_pct,linked_receptors,"
            "mean_concentration,median_concentration,low,medium,high\n";
    for (const auto& s : summaries) {
        file << csvField(s.name) << ","
             << s.num_rows << ","
             << s.total_population << ","
             << s.total_load << ","
             << 100.0 * s.load_reduction << ","
             << s.linked_receptors << ","
             << s.mean_concentration << ","
             << s.median_concentration << ","
             << s.tier_counts[0] << ","
             << s.tier_counts[1] << ","
             << s.tier_counts[2] << "\n";
    }
    return filename;
}

} // namespace FIOGT
