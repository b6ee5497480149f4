#ifndef FACILITY_INVENTORY_HPP
#define FACILITY_INVENTORY_HPP

#include "FIOGT.hpp"
#include <array>
#include <string>
#include <vector>
#include <limits>
#include <cstddef>

namespace FIOGT {

/**
 * @brief Category-default containment efficiencies
 *
 * Immutable value object handed to the scenario transform and the load
 * engine. Defaults follow the survey calibration: sewered 0.80, pit 0.20,
 * septic 0.90, open defecation 0.00.
 */
class EfficiencyTable {
public:
    EfficiencyTable();
    EfficiencyTable(double sewered, double pit, double septic, double open_defecation,
                    double centralized_treatment = 0.90, double fsm_high = 0.80);

    double get(SanitationCategory category) const {
        return category_[categoryIndex(category)];
    }

    // Efficiency of sewered rows once centralized treatment is enabled
    double centralizedTreatment() const { return centralized_treatment_; }

    // Threshold and target efficiency for faecal sludge management
    double fsmHigh() const { return fsm_high_; }

    // Copy with one category default replaced
    EfficiencyTable withCategory(SanitationCategory category, double efficiency) const;

    /**
     * @throws ConfigurationError if any value lies outside [0,1]
     */
    void validate() const;

    bool operator==(const EfficiencyTable& other) const;
    bool operator!=(const EfficiencyTable& other) const { return !(*this == other); }

private:
    std::array<double, NUM_SANITATION_CATEGORIES> category_;
    double centralized_treatment_;
    double fsm_high_;
};

/**
 * @brief One sanitation facility row
 *
 * Split rows keep the facility_id and site of their parent row.
 */
struct FacilityRow {
    static constexpr std::size_t NO_SITE = std::numeric_limits<std::size_t>::max();

    std::string facility_id;
    double lat = 0.0;
    double lon = 0.0;
    SanitationCategory category = SanitationCategory::PIT;
    double population = 0.0;
    double efficiency = 0.0;
    bool efficiency_from_default = true;
    std::size_t site = NO_SITE;     // Base-inventory row this row derives from
};

/**
 * @brief Parse a category code ("1".."4") or name ("pit", "open_defecation", ...)
 * @return false if the text names no category
 */
bool parseSanitationCategory(const std::string& text, SanitationCategory& category);

std::string sanitationCategoryName(SanitationCategory category);

/**
 * @brief Table of sanitation facility rows
 *
 * Read-only once built; the scenario transform produces new inventories
 * instead of editing rows.
 */
class FacilityInventory {
public:
    using const_iterator = std::vector<FacilityRow>::const_iterator;

    FacilityInventory() = default;

    /**
     * @brief Append a row; rows without a site get the next row index
     */
    void addRow(FacilityRow row);

    /**
     * @brief Load a facility table
     *
     * Required columns: id, lat, long, category. Optional: population
     * (defaults to household_population), efficiency (defaults to the
     * category efficiency). Rows with unparsable coordinates are dropped
     * with a warning.
     *
     * @throws DataValidationError on a missing file, missing columns or
     * unknown categories
     */
    static FacilityInventory loadCSV(const std::string& filename,
                                     const EfficiencyTable& efficiencies,
                                     double household_population = 10.0);

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    const FacilityRow& operator[](std::size_t i) const { return rows_[i]; }
    const std::vector<FacilityRow>& rows() const { return rows_; }
    const_iterator begin() const { return rows_.begin(); }
    const_iterator end() const { return rows_.end(); }

    double totalPopulation() const;
    double populationByCategory(SanitationCategory category) const;

    // One past the largest site index
    std::size_t numSites() const;

    /**
     * @brief Copy in which default-efficiency rows take the table's values
     */
    FacilityInventory withEfficiencies(const EfficiencyTable& efficiencies) const;

    /**
     * @throws DataValidationError listing rows with negative population or
     * efficiency outside [0,1]
     */
    void validate() const;

private:
    std::vector<FacilityRow> rows_;
};

} // namespace FIOGT

#endif // FACILITY_INVENTORY_HPP
