#ifndef COORDINATE_SYSTEM_HPP
#define COORDINATE_SYSTEM_HPP

#include <string>
#include <vector>
#include <memory>
#include <cmath>

// Forward declaration for PROJ types (avoid including proj.h in header)
struct PJconsts;
typedef struct PJconsts PJ;
struct pj_ctx;
typedef struct pj_ctx PJ_CONTEXT;

namespace FIOGT {

/**
 * @brief Planar or geographic point
 *
 * Geographic points store longitude in x and latitude in y.
 */
struct GeoPoint {
    double x;       ///< Easting or longitude
    double y;       ///< Northing or latitude
    double z;       ///< Elevation

    GeoPoint() : x(0), y(0), z(0) {}
    GeoPoint(double xx, double yy, double zz = 0) : x(xx), y(yy), z(zz) {}
};

/**
 * @brief Coordinate Reference System definition
 */
struct CRSDefinition {
    std::string code;           ///< "EPSG:xxxx", a PROJ string, or LOCAL

    bool isGeographic() const;  ///< True if geographic (lat/lon degrees)
    bool isLocal() const;       ///< True if coordinates are already planar metres
    bool empty() const { return code.empty(); }

    CRSDefinition() = default;
    CRSDefinition(const std::string& c) : code(c) {}
};

/**
 * @brief Coordinate transformation between two CRS using PROJ
 *
 * Owns its PROJ context and pipeline; move-only. Axis order is normalised
 * so geographic input is always (longitude, latitude).
 *
 * @code
 * CoordinateTransformer transformer;
 * transformer.setSourceCRS("EPSG:4326");
 * transformer.setTargetCRS("EPSG:32736");   // UTM 36S
 * transformer.initialize();
 * GeoPoint utm = transformer.transform(GeoPoint(32.58, 0.31));
 * @endcode
 */
class CoordinateTransformer {
public:
    CoordinateTransformer();
    ~CoordinateTransformer();

    // PROJ handles are not copyable
    CoordinateTransformer(const CoordinateTransformer&) = delete;
    CoordinateTransformer& operator=(const CoordinateTransformer&) = delete;

    CoordinateTransformer(CoordinateTransformer&& other) noexcept;
    CoordinateTransformer& operator=(CoordinateTransformer&& other) noexcept;

    /**
     * @param crs EPSG code ("EPSG:4326" or "4326") or PROJ string
     */
    void setSourceCRS(const std::string& crs);
    void setTargetCRS(const std::string& crs);

    /**
     * @brief Build the PROJ pipeline
     * @return false on failure, see getLastError()
     */
    bool initialize();

    /**
     * @brief Transform a single point; returns the input on failure
     */
    GeoPoint transform(const GeoPoint& point) const;

    /**
     * @brief Transform coordinate arrays in place
     * @return true if every point transformed
     */
    bool transform(double* x, double* y, size_t n) const;

    GeoPoint inverseTransform(const GeoPoint& point) const;

    bool isValid() const { return is_valid_; }
    const CRSDefinition& getSourceCRS() const { return source_crs_; }
    const CRSDefinition& getTargetCRS() const { return target_crs_; }
    const std::string& getLastError() const { return last_error_; }

    static std::string getProjVersion();

private:
    CRSDefinition source_crs_;
    CRSDefinition target_crs_;

    PJ_CONTEXT* ctx_;
    PJ* transform_;

    bool is_valid_;
    mutable std::string last_error_;

    void cleanup();
    static std::string normalizeEPSG(const std::string& epsg);
};

/**
 * @brief Common CRS definitions
 */
namespace CRS {
    const std::string WGS84 = "EPSG:4326";
    const std::string LOCAL = "LOCAL";      ///< Planar metres, no transformation
    const std::string AUTO = "AUTO";        ///< WGS84 UTM zone of the data centroid

    /**
     * @brief EPSG code of a WGS84 UTM zone
     */
    inline std::string getUTMZone(int zone, bool north = true) {
        int base = north ? 32600 : 32700;
        return "EPSG:" + std::to_string(base + zone);
    }

    /**
     * @brief UTM zone number (1-60) containing a longitude
     */
    inline int calculateUTMZone(double longitude) {
        int zone = static_cast<int>(std::floor((longitude + 180.0) / 6.0)) + 1;
        if (zone < 1) zone = 1;
        if (zone > 60) zone = 60;
        return zone;
    }
}

/**
 * @brief Projects facility and receptor locations into the model CRS
 *
 * Linking distances are planar, so geographic input is projected into a
 * metric CRS first. With input CRS LOCAL the long/lat columns already hold
 * metres and are used as x/y directly.
 */
class CoordinateSystemManager {
public:
    CoordinateSystemManager();
    ~CoordinateSystemManager() = default;

    void setInputCRS(const std::string& crs);
    void setModelCRS(const std::string& crs);

    /**
     * @brief Select the UTM zone containing a geographic centroid
     * @return false if the input CRS is not geographic
     */
    bool useAutoLocalCRS(double centroid_lat, double centroid_lon);

    /**
     * @brief Prepare the PROJ pipeline for the configured CRS pair
     * @throws ConfigurationError if PROJ rejects the definitions
     */
    void initialize();

    /**
     * @brief Project (lat, long) pairs to model coordinates
     * @throws ConfigurationError if the manager is not initialised or PROJ fails
     */
    std::vector<GeoPoint> toModelCoords(const std::vector<double>& lat,
                                        const std::vector<double>& lon) const;

    GeoPoint toModelCoords(double lat, double lon) const;

    bool isConfigured() const;
    bool isIdentity() const;

    const CRSDefinition& getInputCRS() const { return input_crs_; }
    const CRSDefinition& getModelCRS() const { return model_crs_; }

private:
    CRSDefinition input_crs_;
    CRSDefinition model_crs_;

    std::unique_ptr<CoordinateTransformer> forward_transform_;
};

/**
 * @brief Geodetic calculation utilities
 */
namespace Geodetic {
    /**
     * @brief Great-circle distance (spherical Earth)
     * @return Distance in meters
     */
    double haversineDistance(double lat1, double lon1, double lat2, double lon2);

    inline double deg2rad(double degrees) {
        return degrees * M_PI / 180.0;
    }

    inline double rad2deg(double radians) {
        return radians * 180.0 / M_PI;
    }

    /**
     * @brief Point reached from (lat, lon) along a bearing
     * @param bearing Degrees clockwise from north
     * @param distance Meters
     * @return Destination as (lon, lat)
     */
    GeoPoint destinationPoint(double lat, double lon, double bearing, double distance);
}

} // namespace FIOGT

#endif // COORDINATE_SYSTEM_HPP
