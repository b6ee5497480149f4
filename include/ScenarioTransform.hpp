#ifndef SCENARIO_TRANSFORM_HPP
#define SCENARIO_TRANSFORM_HPP

#include "FacilityInventory.hpp"
#include <string>

namespace FIOGT {

/**
 * @brief Intervention options of a scenario
 *
 * Each option defaults to a no-op.
 */
struct ScenarioConfig {
    std::string name = "baseline";
    double pop_factor = 1.0;
    double od_reduction_fraction = 0.0;
    double infrastructure_upgrade_fraction = 0.0;
    bool centralized_treatment_enabled = false;
    double fsm_treatment_fraction = 0.0;

    bool isBaseline() const;

    /**
     * @throws ConfigurationError for pop_factor <= 0 or a fraction outside [0,1]
     */
    void validate() const;
};

/**
 * @brief Applies scenario interventions to a facility inventory
 *
 * Steps run in a fixed order: population scaling, open-defecation
 * reduction, pit-to-septic upgrade, centralized treatment, faecal sludge
 * management. Splits append new rows to a fresh inventory; the input is
 * never modified. Rows left with zero population are dropped at the end.
 */
class ScenarioTransform {
public:
    explicit ScenarioTransform(const EfficiencyTable& efficiencies);

    /**
     * @throws ConfigurationError if the scenario or efficiency table is invalid
     * @throws DataValidationError if the inventory has negative populations
     */
    FacilityInventory apply(const FacilityInventory& base,
                            const ScenarioConfig& scenario) const;

    const EfficiencyTable& efficiencies() const { return efficiencies_; }

    // Individual steps, each returning a new inventory
    static FacilityInventory scalePopulation(const FacilityInventory& in, double factor);

    // Move `fraction` of every `from` row into a new row of category `to`
    // at efficiency `to_efficiency`
    static FacilityInventory splitCategory(const FacilityInventory& in,
                                           SanitationCategory from,
                                           SanitationCategory to,
                                           double to_efficiency,
                                           double fraction);

    static FacilityInventory applyCentralizedTreatment(const FacilityInventory& in,
                                                       double efficiency);

    // Septic rows below `high_efficiency` move `fraction` into a row at it
    static FacilityInventory applySludgeManagement(const FacilityInventory& in,
                                                   double high_efficiency,
                                                   double fraction);

    static FacilityInventory dropEmptyRows(const FacilityInventory& in);

private:
    EfficiencyTable efficiencies_;
};

} // namespace FIOGT

#endif // SCENARIO_TRANSFORM_HPP
