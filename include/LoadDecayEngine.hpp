#ifndef LOAD_DECAY_ENGINE_HPP
#define LOAD_DECAY_ENGINE_HPP

#include "FacilityInventory.hpp"
#include "SpatialLinker.hpp"
#include <cmath>
#include <vector>

namespace FIOGT {

/**
 * @brief Parameters of one transport evaluation
 */
struct TransportParameters {
    double decay_rate = 0.0;        // k, 1/m
    double shedding_rate = 1.28e10; // EFIO, CFU/person/day
    EfficiencyTable efficiencies;

    /**
     * @throws ConfigurationError for negative k or EFIO, or bad efficiencies
     */
    void validate() const;
};

/**
 * @brief One facility row to receptor contribution
 */
struct Link {
    std::size_t row;                // Row in the evaluated inventory
    std::size_t receptor;
    double distance;                // m
    double decay_weight;
    double contributed_load;        // CFU/day
};

/**
 * @brief Rows of an inventory grouped by site (compressed sparse rows)
 */
struct SiteRows {
    std::vector<std::size_t> offsets;
    std::vector<std::size_t> rows;

    static SiteRows build(const FacilityInventory& inventory, std::size_t num_sites);
};

/**
 * @brief Emission and first-order spatial decay
 *
 * load = population * shedding_rate * (1 - efficiency)
 * contributed_load = load * exp(-k * distance)
 */
class LoadDecayEngine {
public:
    explicit LoadDecayEngine(const TransportParameters& params);

    static double netLoad(double population, double shedding_rate, double efficiency) {
        return population * shedding_rate * (1.0 - efficiency);
    }

    static double decayWeight(double decay_rate, double distance) {
        return std::exp(-decay_rate * distance);
    }

    /**
     * @brief Net emitted load of every row (CFU/day)
     * @throws DataValidationError for rows with negative population
     */
    std::vector<double> computeLoads(const FacilityInventory& inventory) const;

    /**
     * @brief Surviving load per receptor
     * @param loads Net load per row of the inventory grouped by site_rows
     * @param[out] links Per-row link table (optional)
     */
    std::vector<double> survivingLoads(const Adjacency& adjacency,
                                       const SiteRows& site_rows,
                                       const std::vector<double>& loads,
                                       std::vector<Link>* links = nullptr) const;

    const TransportParameters& parameters() const { return params_; }

private:
    TransportParameters params_;
};

} // namespace FIOGT

#endif // LOAD_DECAY_ENGINE_HPP
