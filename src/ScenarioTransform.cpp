#include "ScenarioTransform.hpp"
#include <sstream>

namespace FIOGT {

namespace {

void checkFraction(const char* key, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        std::ostringstream msg;
        msg << "Scenario option " << key << " must lie in [0,1], got " << value;
        throw ConfigurationError(msg.str());
    }
}

} // namespace

bool ScenarioConfig::isBaseline() const {
    return pop_factor == 1.0 && od_reduction_fraction <= 0.0 &&
           infrastructure_upgrade_fraction <= 0.0 && !centralized_treatment_enabled &&
           fsm_treatment_fraction <= 0.0;
}

void ScenarioConfig::validate() const {
    if (!(pop_factor > 0.0)) {
        std::ostringstream msg;
        msg << "Scenario option pop_factor must be positive, got " << pop_factor;
        throw ConfigurationError(msg.str());
    }
    checkFraction("od_reduction_fraction", od_reduction_fraction);
    checkFraction("infrastructure_upgrade_fraction", infrastructure_upgrade_fraction);
    checkFraction("fsm_treatment_fraction", fsm_treatment_fraction);
}

ScenarioTransform::ScenarioTransform(const EfficiencyTable& efficiencies)
    : efficiencies_(efficiencies) {}

FacilityInventory ScenarioTransform::apply(const FacilityInventory& base,
                                           const ScenarioConfig& scenario) const {
    scenario.validate();
    efficiencies_.validate();
    base.validate();

    FacilityInventory out = scalePopulation(base, scenario.pop_factor);

    if (scenario.od_reduction_fraction > 0.0) {
        out = splitCategory(out, SanitationCategory::OPEN_DEFECATION,
                            SanitationCategory::SEPTIC,
                            efficiencies_.get(SanitationCategory::SEPTIC),
                            scenario.od_reduction_fraction);
    }

    if (scenario.infrastructure_upgrade_fraction > 0.0) {
        out = splitCategory(out, SanitationCategory::PIT, SanitationCategory::SEPTIC,
                            efficiencies_.get(SanitationCategory::SEPTIC),
                            scenario.infrastructure_upgrade_fraction);
    }

    if (scenario.centralized_treatment_enabled) {
        out = applyCentralizedTreatment(out, efficiencies_.centralizedTreatment());
    }

    if (scenario.fsm_treatment_fraction > 0.0) {
        out = applySludgeManagement(out, efficiencies_.fsmHigh(),
                                    scenario.fsm_treatment_fraction);
    }

    return dropEmptyRows(out);
}

FacilityInventory ScenarioTransform::scalePopulation(const FacilityInventory& in,
                                                     double factor) {
    FacilityInventory out;
    for (FacilityRow row : in) {
        row.population *= factor;
        out.addRow(std::move(row));
    }
    return out;
}

FacilityInventory ScenarioTransform::splitCategory(const FacilityInventory& in,
                                                   SanitationCategory from,
                                                   SanitationCategory to,
                                                   double to_efficiency,
                                                   double fraction) {
    FacilityInventory out;
    std::vector<FacilityRow> moved;

    for (FacilityRow row : in) {
        if (row.category != from) {
            out.addRow(std::move(row));
            continue;
        }

        FacilityRow upgraded = row;
        upgraded.category = to;
        upgraded.efficiency = to_efficiency;
        upgraded.efficiency_from_default = true;
        upgraded.population = row.population * fraction;

        row.population -= upgraded.population;
        out.addRow(std::move(row));
        moved.push_back(std::move(upgraded));
    }

    // New rows go after the existing ones
    for (auto& row : moved) {
        out.addRow(std::move(row));
    }
    return out;
}

FacilityInventory ScenarioTransform::applyCentralizedTreatment(const FacilityInventory& in,
                                                               double efficiency) {
    FacilityInventory out;
    for (FacilityRow row : in) {
        if (row.category == SanitationCategory::SEWERED) {
            row.efficiency = efficiency;
            row.efficiency_from_default = false;
        }
        out.addRow(std::move(row));
    }
    return out;
}

FacilityInventory ScenarioTransform::applySludgeManagement(const FacilityInventory& in,
                                                           double high_efficiency,
                                                           double fraction) {
    FacilityInventory out;
    std::vector<FacilityRow> treated;

    for (FacilityRow row : in) {
        if (row.category != SanitationCategory::SEPTIC || row.efficiency >= high_efficiency) {
            out.addRow(std::move(row));
            continue;
        }

        FacilityRow managed = row;
        managed.efficiency = high_efficiency;
        managed.efficiency_from_default = false;
        managed.population = row.population * fraction;

        row.population -= managed.population;
        out.addRow(std::move(row));
        treated.push_back(std::move(managed));
    }

    for (auto& row : treated) {
        out.addRow(std::move(row));
    }
    return out;
}

FacilityInventory ScenarioTransform::dropEmptyRows(const FacilityInventory& in) {
    FacilityInventory out;
    for (const auto& row : in) {
        if (row.population > 0.0) {
            out.addRow(row);
        }
    }
    return out;
}

} // namespace FIOGT
