#include "SpatialIndex.hpp"
#include "FIOGT.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace FIOGT {

namespace {

// Cell coordinates are packed into one key; 2^31 cells per axis is far
// beyond any study area at metre resolution
constexpr std::int64_t KEY_SHIFT = 32;
constexpr std::int64_t KEY_OFFSET = std::int64_t(1) << 30;

} // namespace

SpatialIndex::SpatialIndex(const std::vector<GeoPoint>& points, double cell_size)
    : points_(points), cell_size_(cell_size), x0_(0.0), y0_(0.0) {
    if (!(cell_size > 0.0)) {
        throw ConfigurationError("Spatial index cell size must be positive");
    }

    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (!std::isfinite(points_[i].x) || !std::isfinite(points_[i].y)) {
            throw DataValidationError("Non-finite coordinate at point " + std::to_string(i));
        }
    }

    if (!points_.empty()) {
        x0_ = points_[0].x;
        y0_ = points_[0].y;
        for (const auto& p : points_) {
            x0_ = std::min(x0_, p.x);
            y0_ = std::min(y0_, p.y);
        }
    }

    std::vector<std::pair<std::int64_t, std::size_t>> binned;
    binned.reserve(points_.size());
    for (std::size_t i = 0; i < points_.size(); ++i) {
        binned.emplace_back(packKey(cellCoord(points_[i].x, x0_),
                                    cellCoord(points_[i].y, y0_)), i);
    }
    std::sort(binned.begin(), binned.end());

    cell_keys_.reserve(binned.size());
    cell_points_.reserve(binned.size());
    for (const auto& kv : binned) {
        cell_keys_.push_back(kv.first);
        cell_points_.push_back(kv.second);
    }
}

std::int64_t SpatialIndex::cellCoord(double v, double origin) const {
    return static_cast<std::int64_t>(std::floor((v - origin) / cell_size_));
}

std::int64_t SpatialIndex::packKey(std::int64_t ix, std::int64_t iy) {
    const std::uint64_t hi = static_cast<std::uint64_t>(ix + KEY_OFFSET) << KEY_SHIFT;
    const std::uint64_t lo = static_cast<std::uint32_t>(iy + KEY_OFFSET);
    return static_cast<std::int64_t>(hi | lo);
}

std::size_t SpatialIndex::numOccupiedCells() const {
    if (cell_keys_.empty()) return 0;
    std::size_t n = 1;
    for (std::size_t i = 1; i < cell_keys_.size(); ++i) {
        if (cell_keys_[i] != cell_keys_[i - 1]) ++n;
    }
    return n;
}

double SpatialIndex::distance(const GeoPoint& a, const GeoPoint& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

std::vector<std::size_t> SpatialIndex::queryRadius(double x, double y, double radius,
                                                   std::vector<double>* distances) const {
    std::vector<std::size_t> hits;
    if (distances) distances->clear();
    if (points_.empty() || radius < 0.0) return hits;
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(radius)) return hits;

    const std::int64_t ix_min = cellCoord(x - radius, x0_);
    const std::int64_t ix_max = cellCoord(x + radius, x0_);
    const std::int64_t iy_min = cellCoord(y - radius, y0_);
    const std::int64_t iy_max = cellCoord(y + radius, y0_);

    const GeoPoint centre(x, y);

    for (std::int64_t ix = ix_min; ix <= ix_max; ++ix) {
        for (std::int64_t iy = iy_min; iy <= iy_max; ++iy) {
            const std::int64_t key = packKey(ix, iy);
            auto range = std::equal_range(cell_keys_.begin(), cell_keys_.end(), key);
            for (auto it = range.first; it != range.second; ++it) {
                std::size_t idx = cell_points_[it - cell_keys_.begin()];
                if (distance(points_[idx], centre) <= radius) {
                    hits.push_back(idx);
                }
            }
        }
    }

    std::sort(hits.begin(), hits.end());

    if (distances) {
        distances->reserve(hits.size());
        for (std::size_t idx : hits) {
            distances->push_back(distance(points_[idx], centre));
        }
    }
    return hits;
}

} // namespace FIOGT
