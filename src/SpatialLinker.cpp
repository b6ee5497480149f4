#include "SpatialLinker.hpp"
#include "SpatialIndex.hpp"
#include "FIOGT.hpp"
#include <algorithm>

namespace FIOGT {

namespace {

void checkInputs(const std::vector<GeoPoint>& receptors, const std::vector<double>& radii) {
    if (receptors.size() != radii.size()) {
        throw ConfigurationError("Receptor and link radius counts differ");
    }
    for (double r : radii) {
        if (!(r > 0.0)) {
            throw ConfigurationError("Link radius must be positive");
        }
    }
}

} // namespace

SpatialLinker::SpatialLinker(double cell_size)
    : cell_size_(cell_size) {}

Adjacency SpatialLinker::link(const std::vector<GeoPoint>& sites,
                              const std::vector<GeoPoint>& receptors,
                              const std::vector<double>& radii) const {
    checkInputs(receptors, radii);

    Adjacency adj;
    adj.offsets.reserve(receptors.size() + 1);
    adj.offsets.push_back(0);
    if (receptors.empty()) return adj;

    double cell = cell_size_;
    if (cell <= 0.0) {
        cell = *std::max_element(radii.begin(), radii.end());
    }

    SpatialIndex index(sites, cell);
    std::vector<double> dist;

    for (std::size_t r = 0; r < receptors.size(); ++r) {
        std::vector<std::size_t> hits =
            index.queryRadius(receptors[r].x, receptors[r].y, radii[r], &dist);
        adj.site.insert(adj.site.end(), hits.begin(), hits.end());
        adj.distance.insert(adj.distance.end(), dist.begin(), dist.end());
        adj.offsets.push_back(adj.site.size());
    }

    return adj;
}

Adjacency SpatialLinker::linkBruteForce(const std::vector<GeoPoint>& sites,
                                        const std::vector<GeoPoint>& receptors,
                                        const std::vector<double>& radii) {
    checkInputs(receptors, radii);

    Adjacency adj;
    adj.offsets.push_back(0);
    for (std::size_t r = 0; r < receptors.size(); ++r) {
        for (std::size_t s = 0; s < sites.size(); ++s) {
            double d = SpatialIndex::distance(sites[s], receptors[r]);
            if (d <= radii[r]) {
                adj.site.push_back(s);
                adj.distance.push_back(d);
            }
        }
        adj.offsets.push_back(adj.site.size());
    }
    return adj;
}

} // namespace FIOGT
