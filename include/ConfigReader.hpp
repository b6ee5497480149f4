#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "FacilityInventory.hpp"
#include "ReceptorNetwork.hpp"
#include "ScenarioTransform.hpp"
#include "LoadDecayEngine.hpp"
#include "DilutionEngine.hpp"
#include "CalibrationSearch.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace FIOGT {

/**
 * @brief INI-style configuration reader
 *
 * A single file configures inputs, transport parameters, efficiencies,
 * receptor classes, scenarios, calibration grids and risk thresholds.
 * Numeric values may carry units ("30 m", "0.05 1/m", "2000 L/day").
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    struct SimulationConfig {
        std::string name;
        std::string facilities_file;
        std::string receptors_file;
        std::string output_prefix;
        std::string input_crs;          // EPSG code or LOCAL
        std::string model_crs;          // EPSG code, AUTO or LOCAL
        double household_population;    // Persons per facility without a count
        double index_cell_size;         // m, <= 0 for the largest link radius
        bool write_links;

        SimulationConfig() : name("fiogt"), output_prefix("fiogt_output"),
                             input_crs("EPSG:4326"), model_crs("AUTO"),
                             household_population(10.0), index_cell_size(0.0),
                             write_links(false) {}
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration from a string (same syntax as a file)
    bool loadString(const std::string& content);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    bool parseSimulationConfig(SimulationConfig& config) const;

    /**
     * @brief [TRANSPORT] decay_rate and shedding_rate with [EFFICIENCY] defaults
     */
    bool parseTransportParameters(TransportParameters& params) const;

    EfficiencyTable parseEfficiencyTable() const;

    /**
     * @brief Built-in classes overridden by [RECEPTOR.<class>] sections
     *
     * [TRANSPORT] link_radius and default_flux set the fallback class.
     */
    ReceptorClassTable parseReceptorClasses() const;

    /**
     * @brief Scenario options from one section; unknown keys are ignored
     */
    ScenarioConfig parseScenarioConfig(const std::string& section) const;

    /**
     * @brief [SCENARIO] followed by [SCENARIO.<name>] sections
     *
     * A baseline scenario comes first when [SCENARIO] is absent.
     */
    std::vector<ScenarioConfig> parseScenarios() const;

    bool parseCalibrationConfig(CalibrationConfig& config) const;

    RiskThresholds parseRiskThresholds() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to SI base units)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion to SI
     * @param default_val Default value (in SI units)
     * @param default_unit Unit assumed when the value has none
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                            double default_val = 0.0,
                            const std::string& default_unit = "") const;

    /**
     * @brief Value converted into a target unit ("L/day", "1/m", ...)
     *
     * Plain numbers are taken to be in the target unit already.
     */
    double getDoubleInUnit(const std::string& section, const std::string& key,
                           double default_val, const std::string& target_unit) const;

    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    bool parseStream(std::istream& in);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace FIOGT

#endif // CONFIG_READER_HPP
