#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include "TransportPipeline.hpp"
#include "CalibrationSearch.hpp"
#include "ScenarioComparison.hpp"
#include <string>
#include <vector>

namespace FIOGT {

/**
 * @brief Writes result tables as <prefix>_<name>.csv
 *
 * All methods throw std::runtime_error if the file cannot be created.
 */
class ResultWriter {
public:
    explicit ResultWriter(const std::string& prefix);

    std::string path(const std::string& suffix) const;

    // receptor_id, class, flux, links, surviving_load, concentration, risk_tier, observed
    std::string writeConcentrations(const ReceptorNetwork& receptors,
                                    const PipelineResult& result,
                                    const RiskThresholds& thresholds) const;

    // facility_id, receptor_id, distance, decay_weight, contributed_load
    std::string writeLinks(const ReceptorNetwork& receptors,
                           const PipelineResult& result) const;

    // Evaluated inventory with net loads
    std::string writeFacilityLoads(const PipelineResult& result) const;

    // One row per grid point in ranking order
    std::string writeCalibrationReport(const CalibrationReport& report) const;

    /**
     * @brief Best parameters as an INI file that can be merged into a run config
     * @return Path written, empty if the report has no best point
     */
    std::string writeCalibratedConfig(const CalibrationReport& report,
                                      const CalibrationConfig& config) const;

    std::string writeScenarioComparison(const std::vector<ScenarioSummary>& summaries) const;

private:
    std::string prefix_;
};

} // namespace FIOGT

#endif // RESULT_WRITER_HPP
