#include "LoadDecayEngine.hpp"
#include <sstream>

namespace FIOGT {

void TransportParameters::validate() const {
    if (!(decay_rate >= 0.0)) {
        std::ostringstream msg;
        msg << "Decay rate must be non-negative, got " << decay_rate;
        throw ConfigurationError(msg.str());
    }
    if (!(shedding_rate >= 0.0)) {
        std::ostringstream msg;
        msg << "Shedding rate must be non-negative, got " << shedding_rate;
        throw ConfigurationError(msg.str());
    }
    efficiencies.validate();
}

SiteRows SiteRows::build(const FacilityInventory& inventory, std::size_t num_sites) {
    SiteRows sr;
    sr.offsets.assign(num_sites + 1, 0);

    for (const auto& row : inventory) {
        if (row.site >= num_sites) {
            throw DataValidationError("Facility row references unknown site",
                                      {row.facility_id});
        }
        ++sr.offsets[row.site + 1];
    }
    for (std::size_t s = 0; s < num_sites; ++s) {
        sr.offsets[s + 1] += sr.offsets[s];
    }

    sr.rows.resize(inventory.size());
    std::vector<std::size_t> fill(sr.offsets.begin(), sr.offsets.end() - 1);
    for (std::size_t i = 0; i < inventory.size(); ++i) {
        sr.rows[fill[inventory[i].site]++] = i;
    }
    return sr;
}

LoadDecayEngine::LoadDecayEngine(const TransportParameters& params)
    : params_(params) {
    params_.validate();
}

std::vector<double> LoadDecayEngine::computeLoads(const FacilityInventory& inventory) const {
    inventory.validate();

    std::vector<double> loads;
    loads.reserve(inventory.size());
    for (const auto& row : inventory) {
        loads.push_back(netLoad(row.population, params_.shedding_rate, row.efficiency));
    }
    return loads;
}

std::vector<double> LoadDecayEngine::survivingLoads(const Adjacency& adjacency,
                                                    const SiteRows& site_rows,
                                                    const std::vector<double>& loads,
                                                    std::vector<Link>* links) const {
    const std::size_t num_sites = site_rows.offsets.empty() ? 0 : site_rows.offsets.size() - 1;

    // Rows at one site share the distance, so sum them first
    std::vector<double> site_load(num_sites, 0.0);
    for (std::size_t s = 0; s < num_sites; ++s) {
        for (std::size_t j = site_rows.offsets[s]; j < site_rows.offsets[s + 1]; ++j) {
            site_load[s] += loads[site_rows.rows[j]];
        }
    }

    if (links) links->clear();

    std::vector<double> surviving(adjacency.numReceptors(), 0.0);
    for (std::size_t r = 0; r < adjacency.numReceptors(); ++r) {
        double sum = 0.0;
        for (std::size_t e = adjacency.offsets[r]; e < adjacency.offsets[r + 1]; ++e) {
            const std::size_t s = adjacency.site[e];
            if (s >= num_sites) continue;

            const double d = adjacency.distance[e];
            const double w = decayWeight(params_.decay_rate, d);
            sum += site_load[s] * w;

            if (links) {
                for (std::size_t j = site_rows.offsets[s]; j < site_rows.offsets[s + 1]; ++j) {
                    const std::size_t row = site_rows.rows[j];
                    links->push_back(Link{row, r, d, w, loads[row] * w});
                }
            }
        }
        surviving[r] = sum;
    }
    return surviving;
}

} // namespace FIOGT
