#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace FIOGT {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    bool ok = parseStream(file);
    file.close();
    return ok;
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream in(content);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as number" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;

    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "'" << std::endl;
        return default_val;
    }

    const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
    if (unit.empty()) {
        // No unit given and none assumed: already SI
        return parsed_value;
    }

    try {
        return unit_system_.toBase(parsed_value, unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                 << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

double ConfigReader::getDoubleInUnit(const std::string& section, const std::string& key,
                                     double default_val, const std::string& target_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double si = getDoubleWithUnit(section, key, std::nan(""), target_unit);
    if (std::isnan(si)) {
        return default_val;
    }
    return unit_system_.fromBase(si, target_unit);
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& default_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        double parsed_value;
        std::string parsed_unit;

        if (!unit_system_.parseValueWithUnit(token, parsed_value, parsed_unit)) {
            std::cerr << "Warning: Cannot parse '" << token << "'" << std::endl;
            continue;
        }

        const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
        if (unit.empty()) {
            result.push_back(parsed_value);
            continue;
        }

        try {
            result.push_back(unit_system_.toBase(parsed_value, unit));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Cannot convert '" << token << "': "
                     << e.what() << std::endl;
        }
    }

    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Parsing Methods
// =============================================================================

bool ConfigReader::parseSimulationConfig(SimulationConfig& config) const {
    if (!hasSection("SIMULATION")) return false;

    config.name = getString("SIMULATION", "name", config.name);
    config.facilities_file = getString("SIMULATION", "facilities_file", config.facilities_file);
    config.receptors_file = getString("SIMULATION", "receptors_file", config.receptors_file);
    config.output_prefix = getString("SIMULATION", "output_prefix", config.output_prefix);
    config.input_crs = getString("SIMULATION", "input_crs", config.input_crs);
    config.model_crs = getString("SIMULATION", "model_crs", config.model_crs);
    config.household_population = getDouble("SIMULATION", "household_population",
                                             config.household_population);
    config.write_links = getBool("SIMULATION", "write_links", config.write_links);

    config.index_cell_size = getDoubleWithUnit("TRANSPORT", "index_cell_size",
                                               config.index_cell_size, "m");

    return true;
}

bool ConfigReader::parseTransportParameters(TransportParameters& params) const {
    params.efficiencies = parseEfficiencyTable();
    if (!hasSection("TRANSPORT")) return false;

    params.decay_rate = getDoubleWithUnit("TRANSPORT", "decay_rate", params.decay_rate, "1/m");
    params.shedding_rate = getDouble("TRANSPORT", "shedding_rate", params.shedding_rate);
    return true;
}

EfficiencyTable ConfigReader::parseEfficiencyTable() const {
    EfficiencyTable defaults;
    return EfficiencyTable(
        getDouble("EFFICIENCY", "sewered", defaults.get(SanitationCategory::SEWERED)),
        getDouble("EFFICIENCY", "pit", defaults.get(SanitationCategory::PIT)),
        getDouble("EFFICIENCY", "septic", defaults.get(SanitationCategory::SEPTIC)),
        getDouble("EFFICIENCY", "open_defecation",
                  defaults.get(SanitationCategory::OPEN_DEFECATION)),
        getDouble("EFFICIENCY", "centralized_treatment", defaults.centralizedTreatment()),
        getDouble("EFFICIENCY", "fsm_high", defaults.fsmHigh()));
}

ReceptorClassTable ConfigReader::parseReceptorClasses() const {
    ReceptorClassTable classes;

    ReceptorClass fallback = classes.fallback();
    fallback.link_radius = getDoubleWithUnit("TRANSPORT", "link_radius", fallback.link_radius, "m");
    fallback.default_flux = getDoubleInUnit("TRANSPORT", "default_flux",
                                            fallback.default_flux, "L/day");
    classes.setFallback(fallback);

    const std::string prefix = "RECEPTOR.";
    for (const auto& section : getSectionsMatching(prefix)) {
        std::string name = section.substr(prefix.size());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        ReceptorClass cls = classes.has(name) ? classes.get(name) : fallback;
        cls.name = name;
        cls.link_radius = getDoubleWithUnit(section, "link_radius", cls.link_radius, "m");
        cls.default_flux = getDoubleInUnit(section, "default_flux", cls.default_flux, "L/day");
        classes.set(cls);
    }

    return classes;
}

ScenarioConfig ConfigReader::parseScenarioConfig(const std::string& section) const {
    ScenarioConfig scenario;

    const std::string prefix = "SCENARIO.";
    if (section.compare(0, prefix.size(), prefix) == 0) {
        scenario.name = section.substr(prefix.size());
    }
    scenario.name = getString(section, "name", scenario.name);

    scenario.pop_factor = getDouble(section, "pop_factor", scenario.pop_factor);
    scenario.od_reduction_fraction = getDouble(section, "od_reduction_fraction",
                                               scenario.od_reduction_fraction);
    scenario.infrastructure_upgrade_fraction = getDouble(section, "infrastructure_upgrade_fraction",
                                                         scenario.infrastructure_upgrade_fraction);
    scenario.centralized_treatment_enabled = getBool(section, "centralized_treatment_enabled",
                                                     scenario.centralized_treatment_enabled);
    scenario.fsm_treatment_fraction = getDouble(section, "fsm_treatment_fraction",
                                                scenario.fsm_treatment_fraction);
    return scenario;
}

std::vector<ScenarioConfig> ConfigReader::parseScenarios() const {
    std::vector<ScenarioConfig> scenarios;

    if (hasSection("SCENARIO")) {
        scenarios.push_back(parseScenarioConfig("SCENARIO"));
    } else {
        scenarios.push_back(ScenarioConfig());
    }

    for (const auto& section : getSectionsMatching("SCENARIO.")) {
        scenarios.push_back(parseScenarioConfig(section));
    }

    return scenarios;
}

bool ConfigReader::parseCalibrationConfig(CalibrationConfig& config) const {
    if (!hasSection("CALIBRATION")) return false;

    const std::string sec = "CALIBRATION";

    if (hasKey(sec, "decay_rate_grid")) {
        config.decay_rate_grid = getDoubleArrayWithUnit(sec, "decay_rate_grid", "1/m");
    }
    if (hasKey(sec, "shedding_rate_grid")) {
        config.shedding_rate_grid = getDoubleArray(sec, "shedding_rate_grid");
    }
    for (int c = 0; c < NUM_SANITATION_CATEGORIES; ++c) {
        std::string key = "efficiency_" + sanitationCategoryName(categoryFromIndex(c)) + "_grid";
        if (hasKey(sec, key)) {
            config.efficiency_grid[c] = getDoubleArray(sec, key);
        }
    }

    config.detection_threshold = getDouble(sec, "detection_threshold", config.detection_threshold);
    config.log_floor = getDouble(sec, "log_floor", config.log_floor);
    config.min_distinct = static_cast<std::size_t>(
        std::max(0, getInt(sec, "min_distinct", static_cast<int>(config.min_distinct))));
    config.receptor_class = getString(sec, "receptor_class", config.receptor_class);
    std::transform(config.receptor_class.begin(), config.receptor_class.end(),
                   config.receptor_class.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    config.apply_scenario = getBool(sec, "apply_scenario", config.apply_scenario);

    return true;
}

RiskThresholds ConfigReader::parseRiskThresholds() const {
    RiskThresholds t;
    t.low = getDouble("RISK", "low_threshold", t.low);
    t.high = getDouble("RISK", "high_threshold", t.high);
    t.prediction_scale_factor = getDouble("RISK", "prediction_scale_factor",
                                          t.prediction_scale_factor);
    return t;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << "# FIOGT Configuration File\n";
    file << "# Values may carry units: 30 m, 0.05 1/m, 2000 L/day\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[SIMULATION]\n";
    file << "name = kampala_baseline\n";
    file << "facilities_file = facilities.csv       # id, lat, long, category[, population, efficiency]\n";
    file << "receptors_file = receptors.csv         # id, lat, long[, class, flux, observed]\n";
    file << "output_prefix = output/kampala\n";
    file << "input_crs = EPSG:4326                  # EPSG code, or LOCAL for planar metres\n";
    file << "model_crs = AUTO                       # AUTO picks the UTM zone of the data\n";
    file << "household_population = 10             # Persons per facility without a count\n";
    file << "write_links = false\n\n";

    file << "[TRANSPORT]\n";
    file << "decay_rate = 0.08 1/m                  # Spatial decay k\n";
    file << "shedding_rate = 1.28e10                # CFU/person/day\n";
    file << "link_radius = 100 m                    # Fallback for unknown receptor classes\n";
    file << "default_flux = 20000 L/day\n";
    file << "index_cell_size = 0                    # 0 = largest link radius\n\n";

    file << "[EFFICIENCY]\n";
    file << "sewered = 0.80\n";
    file << "pit = 0.20\n";
    file << "septic = 0.90\n";
    file << "open_defecation = 0.00\n";
    file << "centralized_treatment = 0.90           # Sewered efficiency with treatment\n";
    file << "fsm_high = 0.80                        # Septic efficiency after sludge management\n\n";

    file << "[RECEPTOR.private]\n";
    file << "link_radius = 30 m\n";
    file << "default_flux = 2000 L/day\n\n";

    file << "[RECEPTOR.government]\n";
    file << "link_radius = 100 m\n";
    file << "default_flux = 20000 L/day\n\n";

    file << "[SCENARIO]\n";
    file << "name = baseline\n";
    file << "pop_factor = 1.0\n";
    file << "od_reduction_fraction = 0.0\n";
    file << "infrastructure_upgrade_fraction = 0.0\n";
    file << "centralized_treatment_enabled = false\n";
    file << "fsm_treatment_fraction = 0.0\n\n";

    file << "[SCENARIO.od_elimination]\n";
    file << "od_reduction_fraction = 1.0\n\n";

    file << "[SCENARIO.pit_upgrade]\n";
    file << "infrastructure_upgrade_fraction = 0.5\n";
    file << "fsm_treatment_fraction = 0.3\n\n";

    file << "[CALIBRATION]\n";
    file << "decay_rate_grid = 0.05, 0.08, 0.10, 0.12\n";
    file << "shedding_rate_grid = 1.0e7\n";
    file << "efficiency_sewered_grid = 0.5\n";
    file << "efficiency_pit_grid = 0.1, 0.2\n";
    file << "efficiency_septic_grid = 0.3, 0.5\n";
    file << "efficiency_open_defecation_grid = 0.0\n";
    file << "detection_threshold = 10               # CFU/100mL\n";
    file << "log_floor = 1e-6\n";
    file << "receptor_class = private               # Empty to match every class\n";
    file << "apply_scenario = false\n\n";

    file << "[RISK]\n";
    file << "low_threshold = 10                     # CFU/100mL\n";
    file << "high_threshold = 50\n";
    file << "prediction_scale_factor = 1.0\n";
}

// =============================================================================
// Utility Methods
// =============================================================================

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Values in the merged file override existing ones
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto fail = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (!hasSection("SIMULATION")) {
        result.warnings.push_back("No [SIMULATION] section found - using defaults");
    } else {
        if (getString("SIMULATION", "facilities_file").empty()) {
            fail("[SIMULATION] facilities_file is required");
        }
        if (getString("SIMULATION", "receptors_file").empty()) {
            fail("[SIMULATION] receptors_file is required");
        }
        if (getDouble("SIMULATION", "household_population", 10.0) < 0.0) {
            fail("[SIMULATION] household_population must be non-negative");
        }
    }

    if (!hasSection("TRANSPORT")) {
        result.warnings.push_back("No [TRANSPORT] section found - using defaults");
    }

    // Domain checks reuse the validators of the parsed objects
    try {
        TransportParameters params;
        parseTransportParameters(params);
        params.validate();
    } catch (const ConfigurationError& e) {
        fail(e.what());
    }

    try {
        parseReceptorClasses().validate();
    } catch (const ConfigurationError& e) {
        fail(e.what());
    }

    for (const auto& scenario : parseScenarios()) {
        try {
            scenario.validate();
        } catch (const ConfigurationError& e) {
            fail("Scenario '" + scenario.name + "': " + e.what());
        }
    }

    if (hasSection("CALIBRATION")) {
        try {
            CalibrationConfig calib;
            parseCalibrationConfig(calib);
            calib.validate();
        } catch (const ConfigurationError& e) {
            fail(e.what());
        }
    }

    try {
        parseRiskThresholds().validate();
    } catch (const ConfigurationError& e) {
        fail(e.what());
    }

    // Keys the reader does not know about are ignored, but flag typos
    static const std::vector<std::string> scenario_keys = {
        "name", "pop_factor", "od_reduction_fraction", "infrastructure_upgrade_fraction",
        "centralized_treatment_enabled", "fsm_treatment_fraction"};
    for (const auto& section : getSections()) {
        if (section != "SCENARIO" && section.find("SCENARIO.") != 0) continue;
        for (const auto& key : getKeys(section)) {
            if (std::find(scenario_keys.begin(), scenario_keys.end(), key) == scenario_keys.end()) {
                result.warnings.push_back("Unrecognized key '" + key + "' in [" + section +
                                          "] is ignored");
            }
        }
    }

    return result;
}

} // namespace FIOGT
