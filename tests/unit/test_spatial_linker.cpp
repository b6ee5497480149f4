/**
 * @file test_spatial_linker.cpp
 * @brief Unit tests for the grid index and the facility-receptor join
 */

#include <gtest/gtest.h>
#include "SpatialIndex.hpp"
#include "SpatialLinker.hpp"
#include "FIOGT.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

using namespace FIOGT;

class SpatialLinkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 gen(20240611);
        std::uniform_real_distribution<double> coord(-500.0, 500.0);
        std::uniform_int_distribution<int> cls(0, 1);

        for (int i = 0; i < 400; ++i) {
            sites.emplace_back(coord(gen), coord(gen));
        }
        for (int i = 0; i < 120; ++i) {
            receptors.emplace_back(coord(gen), coord(gen));
            radii.push_back(cls(gen) == 0 ? 30.0 : 100.0);
        }
    }

    static void expectSameAdjacency(const Adjacency& a, const Adjacency& b) {
        ASSERT_EQ(a.offsets, b.offsets);
        ASSERT_EQ(a.site, b.site);
        ASSERT_EQ(a.distance.size(), b.distance.size());
        for (std::size_t i = 0; i < a.distance.size(); ++i) {
            EXPECT_NEAR(a.distance[i], b.distance[i], 1e-9);
        }
    }

    std::vector<GeoPoint> sites;
    std::vector<GeoPoint> receptors;
    std::vector<double> radii;
};

TEST_F(SpatialLinkerTest, IndexMatchesBruteForce) {
    Adjacency brute = SpatialLinker::linkBruteForce(sites, receptors, radii);
    Adjacency indexed = SpatialLinker().link(sites, receptors, radii);

    EXPECT_GT(brute.numLinks(), 0u);
    expectSameAdjacency(indexed, brute);
}

TEST_F(SpatialLinkerTest, ResultIndependentOfCellSize) {
    Adjacency brute = SpatialLinker::linkBruteForce(sites, receptors, radii);
    for (double cell : {7.5, 30.0, 250.0, 5000.0}) {
        SCOPED_TRACE(cell);
        expectSameAdjacency(SpatialLinker(cell).link(sites, receptors, radii), brute);
    }
}

TEST_F(SpatialLinkerTest, BoundaryDistanceIsLinked) {
    std::vector<GeoPoint> s = {GeoPoint(0.0, 0.0), GeoPoint(30.0, 0.0), GeoPoint(30.001, 0.0)};
    std::vector<GeoPoint> r = {GeoPoint(0.0, 0.0)};

    Adjacency adj = SpatialLinker().link(s, r, {30.0});
    ASSERT_EQ(adj.numReceptors(), 1u);
    EXPECT_EQ(adj.degree(0), 2u);
    EXPECT_EQ(adj.site, (std::vector<std::size_t>{0, 1}));
    EXPECT_DOUBLE_EQ(adj.distance[1], 30.0);
}

TEST_F(SpatialLinkerTest, NegativeCoordinates) {
    std::vector<GeoPoint> s = {GeoPoint(-1005.0, -2003.0), GeoPoint(-995.0, -1997.0)};
    std::vector<GeoPoint> r = {GeoPoint(-1000.0, -2000.0)};

    Adjacency adj = SpatialLinker(4.0).link(s, r, {10.0});
    EXPECT_EQ(adj.degree(0), 2u);
}

TEST_F(SpatialLinkerTest, EmptyInputs) {
    Adjacency none = SpatialLinker().link({}, receptors, radii);
    EXPECT_EQ(none.numReceptors(), receptors.size());
    EXPECT_EQ(none.numLinks(), 0u);

    Adjacency no_receptors = SpatialLinker().link(sites, {}, {});
    EXPECT_EQ(no_receptors.numReceptors(), 0u);
}

TEST_F(SpatialLinkerTest, InvalidRadiiRejected) {
    std::vector<double> bad(radii);
    bad[3] = 0.0;
    EXPECT_THROW(SpatialLinker().link(sites, receptors, bad), ConfigurationError);

    bad.pop_back();
    EXPECT_THROW(SpatialLinker().link(sites, receptors, bad), ConfigurationError);
}

TEST(SpatialIndexTest, QueryReturnsSortedIndices) {
    std::vector<GeoPoint> pts;
    for (int i = 0; i < 10; ++i) {
        for (int j = 0; j < 10; ++j) {
            pts.emplace_back(10.0 * i, 10.0 * j);
        }
    }
    SpatialIndex index(pts, 15.0);
    EXPECT_EQ(index.size(), 100u);
    EXPECT_GT(index.numOccupiedCells(), 1u);

    std::vector<double> dist;
    std::vector<std::size_t> hits = index.queryRadius(45.0, 45.0, 8.0, &dist);
    ASSERT_EQ(hits.size(), 4u);
    EXPECT_TRUE(std::is_sorted(hits.begin(), hits.end()));
    for (double d : dist) {
        EXPECT_NEAR(d, std::sqrt(50.0), 1e-12);
    }
}

TEST(SpatialIndexTest, NonPositiveCellRejected) {
    std::vector<GeoPoint> pts = {GeoPoint(0.0, 0.0)};
    EXPECT_THROW(SpatialIndex(pts, 0.0), ConfigurationError);
    EXPECT_THROW(SpatialIndex(pts, -5.0), ConfigurationError);
}

TEST(SpatialIndexTest, NonFiniteCoordinatesRejected) {
    std::vector<GeoPoint> pts = {GeoPoint(0.0, 0.0), GeoPoint(std::nan(""), 1.0)};
    EXPECT_THROW(SpatialIndex(pts, 10.0), DataValidationError);

    pts[1] = GeoPoint(1.0, std::numeric_limits<double>::infinity());
    EXPECT_THROW(SpatialIndex(pts, 10.0), DataValidationError);

    pts[1] = GeoPoint(1.0, 1.0);
    SpatialIndex index(pts, 10.0);
    EXPECT_TRUE(index.queryRadius(std::nan(""), 0.0, 5.0).empty());
    EXPECT_EQ(index.queryRadius(-1.0e9, -1.0e9, 5.0).size(), 0u);
    EXPECT_EQ(index.queryRadius(0.5, 0.5, 1.0).size(), 2u);
}
