#ifndef RECEPTOR_NETWORK_HPP
#define RECEPTOR_NETWORK_HPP

#include "FIOGT.hpp"
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace FIOGT {

/**
 * @brief Linking and flux defaults for a class of water source
 */
struct ReceptorClass {
    std::string name;
    double link_radius = 100.0;     // m
    double default_flux = 20000.0;  // L/day
};

/**
 * @brief Receptor classes keyed by name
 *
 * The default set has "private" (30 m, 2000 L/day) and "government"
 * (100 m, 20000 L/day) boreholes.
 */
class ReceptorClassTable {
public:
    ReceptorClassTable();

    // Empty table with a fallback for unknown class names
    explicit ReceptorClassTable(const ReceptorClass& fallback);

    void set(const ReceptorClass& cls);
    bool has(const std::string& name) const;

    // Class by name, the fallback when absent
    const ReceptorClass& get(const std::string& name) const;

    const ReceptorClass& fallback() const { return fallback_; }
    void setFallback(const ReceptorClass& cls) { fallback_ = cls; }

    double maxLinkRadius() const;
    std::vector<std::string> names() const;

    /**
     * @throws ConfigurationError for non-positive radius or flux
     */
    void validate() const;

private:
    std::map<std::string, ReceptorClass> classes_;
    ReceptorClass fallback_;
};

/**
 * @brief A groundwater source (borehole, well, spring)
 */
struct Receptor {
    std::string receptor_id;
    double lat = 0.0;
    double lon = 0.0;
    std::string receptor_class;
    double water_flux = 0.0;            // L/day
    double observed = std::nan("");     // CFU/100mL, NaN when not sampled

    bool hasObservation() const { return !std::isnan(observed); }
};

/**
 * @brief Parse a lab concentration string
 *
 * "Numerous" (too numerous to count) maps to 1000, values below the
 * detection limit ("<1") and "nil"/"none"/"-" map to 0. Empty or
 * unreadable strings give NaN.
 */
double parseObservedConcentration(const std::string& text);

/**
 * @brief Table of receptors, immutable within a run
 */
class ReceptorNetwork {
public:
    ReceptorNetwork() = default;

    void addReceptor(Receptor receptor);

    /**
     * @brief Load a receptor table
     *
     * Required columns: id, lat, long. Optional: class, flux (L/day,
     * defaults to the class flux), observed. Rows with unparsable
     * coordinates are dropped with a warning.
     *
     * @throws DataValidationError on a missing file or missing columns
     */
    static ReceptorNetwork loadCSV(const std::string& filename,
                                   const ReceptorClassTable& classes);

    std::size_t size() const { return receptors_.size(); }
    bool empty() const { return receptors_.empty(); }
    const Receptor& operator[](std::size_t i) const { return receptors_[i]; }
    const std::vector<Receptor>& receptors() const { return receptors_; }

    std::size_t numObserved() const;

    // Link radius of every receptor, from its class
    std::vector<double> linkRadii(const ReceptorClassTable& classes) const;

    /**
     * @throws DataValidationError listing receptors with water_flux <= 0
     */
    void validateFlux() const;

private:
    std::vector<Receptor> receptors_;
};

} // namespace FIOGT

#endif // RECEPTOR_NETWORK_HPP
