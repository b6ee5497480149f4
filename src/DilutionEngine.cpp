#include "DilutionEngine.hpp"
#include "UnitSystem.hpp"

namespace FIOGT {

double DilutionEngine::unitConversion() {
    static const double litres_per_report_volume = convertUnits(1.0, "100mL", "L");
    return litres_per_report_volume;
}

std::vector<double> DilutionEngine::concentrations(const std::vector<double>& surviving_loads,
                                                   const ReceptorNetwork& receptors) {
    if (surviving_loads.size() != receptors.size()) {
        throw DataValidationError("Surviving load count does not match receptor count");
    }
    receptors.validateFlux();

    std::vector<double> conc(receptors.size());
    for (std::size_t r = 0; r < receptors.size(); ++r) {
        conc[r] = concentration(surviving_loads[r], receptors[r].water_flux);
    }
    return conc;
}

// =============================================================================
// Risk tiers
// =============================================================================

namespace {

RiskTier classify(double c, double low, double high) {
    if (c < low) return RiskTier::LOW;
    if (c < high) return RiskTier::MEDIUM;
    return RiskTier::HIGH;
}

} // namespace

RiskTier RiskThresholds::classifyObserved(double concentration) const {
    return classify(concentration, low, high);
}

RiskTier RiskThresholds::classifyPredicted(double concentration) const {
    return classify(concentration, low * prediction_scale_factor,
                    high * prediction_scale_factor);
}

void RiskThresholds::validate() const {
    if (!(low >= 0.0 && high >= low)) {
        throw ConfigurationError("Risk thresholds must satisfy 0 <= low <= high");
    }
    if (!(prediction_scale_factor > 0.0)) {
        throw ConfigurationError("Risk prediction scale factor must be positive");
    }
}

std::string riskTierName(RiskTier tier) {
    switch (tier) {
        case RiskTier::LOW: return "Low";
        case RiskTier::MEDIUM: return "Medium";
        case RiskTier::HIGH: return "High";
    }
    return "Unknown";
}

} // namespace FIOGT
