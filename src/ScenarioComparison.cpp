#include "ScenarioComparison.hpp"
#include <algorithm>

namespace FIOGT {

ScenarioComparison::ScenarioComparison(const TransportPipeline& pipeline,
                                       const TransportParameters& params,
                                       const RiskThresholds& thresholds)
    : pipeline_(pipeline), params_(params), thresholds_(thresholds) {
    params_.validate();
    thresholds_.validate();
}

ScenarioSummary ScenarioComparison::evaluate(const ScenarioConfig& scenario) const {
    PipelineResult result = pipeline_.run(params_, &scenario);
    return summarize(scenario.name, result, thresholds_);
}

std::vector<ScenarioSummary> ScenarioComparison::compare(
    const std::vector<ScenarioConfig>& scenarios) const {
    std::vector<ScenarioSummary> summaries;
    summaries.reserve(scenarios.size());
    for (const auto& scenario : scenarios) {
        summaries.push_back(evaluate(scenario));
    }

    if (!summaries.empty() && summaries.front().total_load > 0.0) {
        const double reference = summaries.front().total_load;
        for (auto& s : summaries) {
            s.load_reduction = (reference - s.total_load) / reference;
        }
    }
    return summaries;
}

ScenarioSummary ScenarioComparison::summarize(const std::string& name,
                                              const PipelineResult& result,
                                              const RiskThresholds& thresholds) {
    ScenarioSummary s;
    s.name = name;
    s.num_rows = result.inventory.size();
    s.total_population = result.inventory.totalPopulation();
    s.total_load = result.totalLoad();
    s.linked_receptors = result.numLinkedReceptors();

    const auto& conc = result.concentrations;
    if (!conc.empty()) {
        double sum = 0.0;
        for (double c : conc) {
            sum += c;
            s.tier_counts[static_cast<int>(thresholds.classifyPredicted(c))]++;
        }
        s.mean_concentration = sum / static_cast<double>(conc.size());

        std::vector<double> sorted(conc);
        std::sort(sorted.begin(), sorted.end());
        const std::size_t n = sorted.size();
        s.median_concentration = (n % 2 == 1)
            ? sorted[n / 2]
            : 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
    }
    return s;
}

} // namespace FIOGT
