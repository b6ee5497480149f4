#include "FacilityInventory.hpp"
#include "TableIO.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace FIOGT {

namespace {

bool inUnitInterval(double value) {
    return value >= 0.0 && value <= 1.0;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

// =============================================================================
// EfficiencyTable
// =============================================================================

EfficiencyTable::EfficiencyTable()
    : EfficiencyTable(0.80, 0.20, 0.90, 0.00) {}

EfficiencyTable::EfficiencyTable(double sewered, double pit, double septic,
                                 double open_defecation,
                                 double centralized_treatment, double fsm_high)
    : category_{{sewered, pit, septic, open_defecation}},
      centralized_treatment_(centralized_treatment),
      fsm_high_(fsm_high) {}

EfficiencyTable EfficiencyTable::withCategory(SanitationCategory category,
                                              double efficiency) const {
    EfficiencyTable copy(*this);
    copy.category_[categoryIndex(category)] = efficiency;
    return copy;
}

void EfficiencyTable::validate() const {
    for (int i = 0; i < NUM_SANITATION_CATEGORIES; ++i) {
        if (!inUnitInterval(category_[i])) {
            std::ostringstream msg;
            msg << "Efficiency for " << sanitationCategoryName(categoryFromIndex(i))
                << " must lie in [0,1], got " << category_[i];
            throw ConfigurationError(msg.str());
        }
    }
    if (!inUnitInterval(centralized_treatment_)) {
        throw ConfigurationError("Centralized treatment efficiency must lie in [0,1]");
    }
    if (!inUnitInterval(fsm_high_)) {
        throw ConfigurationError("FSM high efficiency must lie in [0,1]");
    }
}

bool EfficiencyTable::operator==(const EfficiencyTable& other) const {
    return category_ == other.category_ &&
           centralized_treatment_ == other.centralized_treatment_ &&
           fsm_high_ == other.fsm_high_;
}

// =============================================================================
// Categories
// =============================================================================

bool parseSanitationCategory(const std::string& text, SanitationCategory& category) {
    std::string t = toLower(text);
    t.erase(std::remove_if(t.begin(), t.end(),
                   [](unsigned char c) { return std::isspace(c) != 0; }), t.end());

    double code = 0.0;
    if (parseNumber(t, code)) {
        if (code == 1.0) { category = SanitationCategory::SEWERED; return true; }
        if (code == 2.0) { category = SanitationCategory::PIT; return true; }
        if (code == 3.0) { category = SanitationCategory::SEPTIC; return true; }
        if (code == 4.0) { category = SanitationCategory::OPEN_DEFECATION; return true; }
        return false;
    }

    if (t == "sewered" || t == "sewer") {
        category = SanitationCategory::SEWERED;
    } else if (t == "pit" || t == "pit_latrine") {
        category = SanitationCategory::PIT;
    } else if (t == "septic" || t == "septic_tank") {
        category = SanitationCategory::SEPTIC;
    } else if (t == "open_defecation" || t == "od" || t == "open-defecation") {
        category = SanitationCategory::OPEN_DEFECATION;
    } else {
        return false;
    }
    return true;
}

std::string sanitationCategoryName(SanitationCategory category) {
    switch (category) {
        case SanitationCategory::SEWERED: return "sewered";
        case SanitationCategory::PIT: return "pit";
        case SanitationCategory::SEPTIC: return "septic";
        case SanitationCategory::OPEN_DEFECATION: return "open_defecation";
    }
    return "unknown";
}

// =============================================================================
// FacilityInventory
// =============================================================================

void FacilityInventory::addRow(FacilityRow row) {
    if (row.site == FacilityRow::NO_SITE) {
        row.site = rows_.size();
    }
    rows_.push_back(std::move(row));
}

FacilityInventory FacilityInventory::loadCSV(const std::string& filename,
                                             const EfficiencyTable& efficiencies,
                                             double household_population) {
    CSVTable table = readCSV(filename);

    int col_id = table.findColumn({"id", "facility_id", "fid"});
    int col_lat = table.findColumn({"lat", "latitude"});
    int col_lon = table.findColumn({"long", "lon", "longitude"});
    int col_cat = table.findColumn({"category", "toilet_category_id"});
    int col_pop = table.findColumn({"population", "household_population"});
    int col_eff = table.findColumn({"efficiency", "pathogen_containment_efficiency"});

    std::vector<std::string> missing;
    if (col_id < 0) missing.push_back("id");
    if (col_lat < 0) missing.push_back("lat");
    if (col_lon < 0) missing.push_back("long");
    if (col_cat < 0) missing.push_back("category");
    if (!missing.empty()) {
        std::string msg = "Facility table " + filename + " is missing required columns:";
        for (const auto& m : missing) msg += " " + m;
        throw DataValidationError(msg, missing);
    }

    FacilityInventory inventory;
    std::vector<std::string> bad_categories;
    std::size_t dropped = 0;

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        FacilityRow row;
        row.facility_id = table.cell(r, col_id);

        if (!parseNumber(table.cell(r, col_lat), row.lat) ||
            !parseNumber(table.cell(r, col_lon), row.lon)) {
            ++dropped;
            continue;
        }

        if (!parseSanitationCategory(table.cell(r, col_cat), row.category)) {
            bad_categories.push_back(row.facility_id);
            continue;
        }

        if (!parseNumber(table.cell(r, col_pop), row.population)) {
            row.population = household_population;
        }

        if (parseNumber(table.cell(r, col_eff), row.efficiency)) {
            row.efficiency_from_default = false;
        } else {
            row.efficiency = efficiencies.get(row.category);
            row.efficiency_from_default = true;
        }

        inventory.addRow(std::move(row));
    }

    if (!bad_categories.empty()) {
        throw DataValidationError("Facility table " + filename +
                                  " has rows with unknown sanitation category",
                                  bad_categories);
    }

    if (dropped > 0) {
        std::cerr << "Warning: dropped " << dropped
                  << " facility rows with missing coordinates from " << filename << "\n";
    }

    inventory.validate();
    return inventory;
}

double FacilityInventory::totalPopulation() const {
    double total = 0.0;
    for (const auto& row : rows_) {
        total += row.population;
    }
    return total;
}

double FacilityInventory::populationByCategory(SanitationCategory category) const {
    double total = 0.0;
    for (const auto& row : rows_) {
        if (row.category == category) total += row.population;
    }
    return total;
}

std::size_t FacilityInventory::numSites() const {
    std::size_t n = 0;
    for (const auto& row : rows_) {
        n = std::max(n, row.site + 1);
    }
    return n;
}

FacilityInventory FacilityInventory::withEfficiencies(const EfficiencyTable& efficiencies) const {
    FacilityInventory copy(*this);
    for (auto& row : copy.rows_) {
        if (row.efficiency_from_default) {
            row.efficiency = efficiencies.get(row.category);
        }
    }
    return copy;
}

void FacilityInventory::validate() const {
    std::vector<std::string> negative;
    std::vector<std::string> out_of_range;

    for (const auto& row : rows_) {
        if (!(row.population >= 0.0)) negative.push_back(row.facility_id);
        if (!inUnitInterval(row.efficiency)) out_of_range.push_back(row.facility_id);
    }

    if (!negative.empty()) {
        throw DataValidationError("Facility rows with negative population", negative);
    }
    if (!out_of_range.empty()) {
        throw DataValidationError("Facility rows with efficiency outside [0,1]", out_of_range);
    }
}

} // namespace FIOGT
