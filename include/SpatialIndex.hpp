#ifndef SPATIAL_INDEX_HPP
#define SPATIAL_INDEX_HPP

#include "CoordinateSystem.hpp"
#include <cstdint>
#include <vector>

namespace FIOGT {

/**
 * @brief Uniform-grid bucket index over planar points
 *
 * Points are binned into square cells of side cell_size. A radius query
 * only inspects the cells overlapping the query square, so linking F
 * facilities to R receptors costs O((F + R) * points-per-neighbourhood)
 * instead of O(F * R). Cells are stored as a sorted (cell key, point)
 * list, which keeps memory proportional to the number of points no matter
 * how sparse the data is.
 */
class SpatialIndex {
public:
    /**
     * @param points Planar coordinates in metres
     * @param cell_size Cell side in metres (use the largest query radius)
     * @throws ConfigurationError if cell_size is not positive
     * @throws DataValidationError if a point has a NaN or infinite coordinate
     */
    SpatialIndex(const std::vector<GeoPoint>& points, double cell_size);

    std::size_t size() const { return points_.size(); }
    double cellSize() const { return cell_size_; }
    std::size_t numOccupiedCells() const;

    /**
     * @brief Indices of all points within `radius` of (x, y), ascending
     * @param[out] distances Matching planar distances (optional)
     */
    std::vector<std::size_t> queryRadius(double x, double y, double radius,
                                         std::vector<double>* distances = nullptr) const;

    static double distance(const GeoPoint& a, const GeoPoint& b);

private:
    std::vector<GeoPoint> points_;
    double cell_size_;
    double x0_;
    double y0_;

    std::vector<std::int64_t> cell_keys_;     // Sorted, one per point
    std::vector<std::size_t> cell_points_;    // Point index, same order

    std::int64_t cellCoord(double v, double origin) const;
    static std::int64_t packKey(std::int64_t ix, std::int64_t iy);
};

} // namespace FIOGT

#endif // SPATIAL_INDEX_HPP
