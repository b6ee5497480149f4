#ifndef FIOGT_HPP
#define FIOGT_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <limits>
#include <utility>

namespace FIOGT {

// Forward declarations
class FacilityInventory;
class ReceptorNetwork;
class ScenarioTransform;
class SpatialLinker;
class TransportPipeline;
class CalibrationSearch;
class ConfigReader;

/**
 * @brief Sanitation facility category
 *
 * Numeric values match the category codes used by the household
 * sanitation survey tables.
 */
enum class SanitationCategory {
    SEWERED = 1,
    PIT = 2,
    SEPTIC = 3,
    OPEN_DEFECATION = 4
};

constexpr int NUM_SANITATION_CATEGORIES = 4;

// Zero-based slot of a category in per-category arrays
inline int categoryIndex(SanitationCategory category) {
    return static_cast<int>(category) - 1;
}

inline SanitationCategory categoryFromIndex(int index) {
    return static_cast<SanitationCategory>(index + 1);
}

/**
 * @brief Scenario or calibration parameter outside its valid domain
 *
 * Raised before any computation starts.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Corrupt or incomplete input data (negative population, non-positive
 * water flux, missing columns)
 *
 * Carries the identifiers of the offending rows so upstream enrichment can
 * be fixed.
 */
class DataValidationError : public std::runtime_error {
public:
    explicit DataValidationError(const std::string& what,
                                 std::vector<std::string> ids = {})
        : std::runtime_error(what), offending_ids_(std::move(ids)) {}

    const std::vector<std::string>& offendingIds() const { return offending_ids_; }

private:
    std::vector<std::string> offending_ids_;
};

inline double undefinedMetric() {
    return std::numeric_limits<double>::quiet_NaN();
}

} // namespace FIOGT

#endif // FIOGT_HPP
