#ifndef SPATIAL_LINKER_HPP
#define SPATIAL_LINKER_HPP

#include "CoordinateSystem.hpp"
#include <cstddef>
#include <vector>

namespace FIOGT {

/**
 * @brief Receptor-major site adjacency (compressed sparse rows)
 *
 * Sites linked to receptor r are site[offsets[r]] .. site[offsets[r+1]-1]
 * in ascending site order, with matching planar distances.
 */
struct Adjacency {
    std::vector<std::size_t> offsets;
    std::vector<std::size_t> site;
    std::vector<double> distance;

    std::size_t numReceptors() const { return offsets.empty() ? 0 : offsets.size() - 1; }
    std::size_t numLinks() const { return site.size(); }
    std::size_t degree(std::size_t r) const { return offsets[r + 1] - offsets[r]; }
};

/**
 * @brief Finds the facility sites within each receptor's link radius
 *
 * Geometry depends only on site and receptor locations, so the adjacency
 * is built once and reused for every scenario and parameter set; split
 * rows are mapped onto their site at evaluation time.
 */
class SpatialLinker {
public:
    /**
     * @param cell_size Index cell side in metres, <= 0 selects the largest radius
     */
    explicit SpatialLinker(double cell_size = 0.0);

    /**
     * @param sites Site locations in model coordinates (metres)
     * @param receptors Receptor locations in model coordinates
     * @param radii Link radius per receptor (metres)
     * @throws ConfigurationError on mismatched sizes or non-positive radii
     */
    Adjacency link(const std::vector<GeoPoint>& sites,
                   const std::vector<GeoPoint>& receptors,
                   const std::vector<double>& radii) const;

    /**
     * @brief Reference all-pairs linking, used to check the indexed join
     */
    static Adjacency linkBruteForce(const std::vector<GeoPoint>& sites,
                                    const std::vector<GeoPoint>& receptors,
                                    const std::vector<double>& radii);

private:
    double cell_size_;
};

} // namespace FIOGT

#endif // SPATIAL_LINKER_HPP
