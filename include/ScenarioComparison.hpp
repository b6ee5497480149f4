#ifndef SCENARIO_COMPARISON_HPP
#define SCENARIO_COMPARISON_HPP

#include "TransportPipeline.hpp"
#include <array>
#include <string>
#include <vector>

namespace FIOGT {

/**
 * @brief Headline numbers of one scenario run
 */
struct ScenarioSummary {
    std::string name;
    std::size_t num_rows = 0;
    double total_population = 0.0;
    double total_load = 0.0;            // CFU/day
    double load_reduction = 0.0;        // Fraction relative to the reference scenario
    std::size_t linked_receptors = 0;
    double mean_concentration = 0.0;    // Over all receptors
    double median_concentration = 0.0;
    std::array<std::size_t, 3> tier_counts{};  // Low, Medium, High (predicted thresholds)
};

/**
 * @brief Runs named scenarios with fixed transport parameters
 *
 * The first scenario is the reference for load reduction.
 */
class ScenarioComparison {
public:
    ScenarioComparison(const TransportPipeline& pipeline,
                       const TransportParameters& params,
                       const RiskThresholds& thresholds);

    ScenarioSummary evaluate(const ScenarioConfig& scenario) const;

    std::vector<ScenarioSummary> compare(const std::vector<ScenarioConfig>& scenarios) const;

    static ScenarioSummary summarize(const std::string& name,
                                     const PipelineResult& result,
                                     const RiskThresholds& thresholds);

private:
    const TransportPipeline& pipeline_;
    TransportParameters params_;
    RiskThresholds thresholds_;
};

} // namespace FIOGT

#endif // SCENARIO_COMPARISON_HPP
