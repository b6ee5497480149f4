#ifndef DILUTION_ENGINE_HPP
#define DILUTION_ENGINE_HPP

#include "ReceptorNetwork.hpp"
#include <vector>

namespace FIOGT {

/**
 * @brief Converts surviving load at a receptor into a concentration
 *
 * concentration [CFU/100mL] = surviving_load [CFU/day] / flux [L/day]
 *                             * (L per 100 mL)
 */
class DilutionEngine {
public:
    // Litres per reporting volume (100 mL), from the unit database
    static double unitConversion();

    static double concentration(double surviving_load, double water_flux) {
        return surviving_load / water_flux * unitConversion();
    }

    /**
     * @brief Concentration at every receptor
     * @throws DataValidationError listing receptors with water_flux <= 0
     */
    static std::vector<double> concentrations(const std::vector<double>& surviving_loads,
                                              const ReceptorNetwork& receptors);
};

/**
 * @brief Low / Medium / High classification of concentrations
 */
enum class RiskTier {
    LOW,
    MEDIUM,
    HIGH
};

struct RiskThresholds {
    double low = 10.0;                      // CFU/100mL, Low below
    double high = 50.0;                     // CFU/100mL, High at or above
    double prediction_scale_factor = 1.0;   // Threshold multiplier for predictions

    RiskTier classifyObserved(double concentration) const;
    RiskTier classifyPredicted(double concentration) const;

    /**
     * @throws ConfigurationError unless 0 <= low <= high and the factor is positive
     */
    void validate() const;
};

std::string riskTierName(RiskTier tier);

} // namespace FIOGT

#endif // DILUTION_ENGINE_HPP
