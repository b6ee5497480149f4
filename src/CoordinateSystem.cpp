#include "CoordinateSystem.hpp"
#include "FIOGT.hpp"
#include <proj.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace FIOGT {

// ============================================================================
// CRSDefinition Implementation
// ============================================================================

bool CRSDefinition::isGeographic() const {
    if (code == "EPSG:4326" || code == "4326") return true;
    if (code == "EPSG:4269" || code == "4269") return true;
    if (code == "EPSG:4258" || code == "4258") return true;

    if (code.find("+proj=longlat") != std::string::npos) return true;
    if (code.find("+proj=latlong") != std::string::npos) return true;

    return false;
}

bool CRSDefinition::isLocal() const {
    std::string upper = code;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == CRS::LOCAL;
}

// ============================================================================
// CoordinateTransformer Implementation
// ============================================================================

CoordinateTransformer::CoordinateTransformer()
    : ctx_(proj_context_create()), transform_(nullptr), is_valid_(false) {
}

CoordinateTransformer::~CoordinateTransformer() {
    cleanup();
}

CoordinateTransformer::CoordinateTransformer(CoordinateTransformer&& other) noexcept
    : source_crs_(std::move(other.source_crs_)),
      target_crs_(std::move(other.target_crs_)),
      ctx_(other.ctx_),
      transform_(other.transform_),
      is_valid_(other.is_valid_),
      last_error_(std::move(other.last_error_)) {
    other.ctx_ = nullptr;
    other.transform_ = nullptr;
    other.is_valid_ = false;
}

CoordinateTransformer& CoordinateTransformer::operator=(CoordinateTransformer&& other) noexcept {
    if (this != &other) {
        cleanup();
        source_crs_ = std::move(other.source_crs_);
        target_crs_ = std::move(other.target_crs_);
        ctx_ = other.ctx_;
        transform_ = other.transform_;
        is_valid_ = other.is_valid_;
        last_error_ = std::move(other.last_error_);
        other.ctx_ = nullptr;
        other.transform_ = nullptr;
        other.is_valid_ = false;
    }
    return *this;
}

void CoordinateTransformer::cleanup() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    if (ctx_) {
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
    }
    is_valid_ = false;
}

std::string CoordinateTransformer::normalizeEPSG(const std::string& epsg) {
    if (epsg.compare(0, 5, "EPSG:") == 0) {
        return epsg;
    }
    // Bare number means an EPSG code; anything else is a PROJ string
    if (!epsg.empty() && std::all_of(epsg.begin(), epsg.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return "EPSG:" + epsg;
    }
    return epsg;
}

void CoordinateTransformer::setSourceCRS(const std::string& crs) {
    source_crs_.code = normalizeEPSG(crs);
    is_valid_ = false;
}

void CoordinateTransformer::setTargetCRS(const std::string& crs) {
    target_crs_.code = normalizeEPSG(crs);
    is_valid_ = false;
}

bool CoordinateTransformer::initialize() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    is_valid_ = false;

    if (!ctx_) {
        last_error_ = "PROJ context not available";
        return false;
    }
    if (source_crs_.empty()) {
        last_error_ = "Source CRS not specified";
        return false;
    }
    if (target_crs_.empty()) {
        last_error_ = "Target CRS not specified";
        return false;
    }

    transform_ = proj_create_crs_to_crs(ctx_, source_crs_.code.c_str(),
                                        target_crs_.code.c_str(), nullptr);
    if (!transform_) {
        const char* msg = proj_context_errno_string(ctx_, proj_context_errno(ctx_));
        last_error_ = std::string("Failed to create transformation: ") +
                      (msg ? msg : "unknown PROJ error");
        return false;
    }

    // Longitude/latitude ordering for geographic input
    PJ* norm = proj_normalize_for_visualization(ctx_, transform_);
    if (norm) {
        proj_destroy(transform_);
        transform_ = norm;
    }

    last_error_.clear();
    is_valid_ = true;
    return true;
}

GeoPoint CoordinateTransformer::transform(const GeoPoint& point) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        return point;
    }

    PJ_COORD in = proj_coord(point.x, point.y, point.z, 0.0);
    PJ_COORD out = proj_trans(transform_, PJ_FWD, in);

    if (proj_errno(transform_)) {
        last_error_ = proj_context_errno_string(ctx_, proj_errno(transform_));
        proj_errno_reset(transform_);
        return point;
    }

    return GeoPoint(out.xyz.x, out.xyz.y, out.xyz.z);
}

bool CoordinateTransformer::transform(double* x, double* y, size_t n) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        return false;
    }

    size_t result = proj_trans_generic(
        transform_, PJ_FWD,
        x, sizeof(double), n,
        y, sizeof(double), n,
        nullptr, 0, 0,
        nullptr, 0, 0
    );

    if (result != n) {
        last_error_ = "Not all points transformed successfully";
        return false;
    }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            last_error_ = "Transformation produced non-finite coordinates";
            return false;
        }
    }

    return true;
}

GeoPoint CoordinateTransformer::inverseTransform(const GeoPoint& point) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        return point;
    }

    PJ_COORD in = proj_coord(point.x, point.y, point.z, 0.0);
    PJ_COORD out = proj_trans(transform_, PJ_INV, in);

    if (proj_errno(transform_)) {
        last_error_ = proj_context_errno_string(ctx_, proj_errno(transform_));
        proj_errno_reset(transform_);
        return point;
    }

    return GeoPoint(out.xyz.x, out.xyz.y, out.xyz.z);
}

std::string CoordinateTransformer::getProjVersion() {
    return std::string(proj_info().version);
}

// ============================================================================
// CoordinateSystemManager Implementation
// ============================================================================

CoordinateSystemManager::CoordinateSystemManager()
    : input_crs_(CRS::WGS84), model_crs_(CRS::AUTO) {
}

void CoordinateSystemManager::setInputCRS(const std::string& crs) {
    input_crs_.code = crs;
    forward_transform_.reset();
}

void CoordinateSystemManager::setModelCRS(const std::string& crs) {
    model_crs_.code = crs;
    forward_transform_.reset();
}

bool CoordinateSystemManager::useAutoLocalCRS(double centroid_lat, double centroid_lon) {
    if (!input_crs_.isGeographic()) {
        return false;
    }

    int zone = CRS::calculateUTMZone(centroid_lon);
    bool north = (centroid_lat >= 0);
    setModelCRS(CRS::getUTMZone(zone, north));
    return true;
}

void CoordinateSystemManager::initialize() {
    forward_transform_.reset();
    if (isIdentity()) return;

    if (model_crs_.code == CRS::AUTO) {
        throw ConfigurationError("Model CRS AUTO must be resolved with useAutoLocalCRS()");
    }

    auto transformer = std::make_unique<CoordinateTransformer>();
    transformer->setSourceCRS(input_crs_.code);
    transformer->setTargetCRS(model_crs_.code);
    if (!transformer->initialize()) {
        throw ConfigurationError("Cannot project " + input_crs_.code + " to " +
                                 model_crs_.code + ": " + transformer->getLastError());
    }
    forward_transform_ = std::move(transformer);
}

std::vector<GeoPoint> CoordinateSystemManager::toModelCoords(const std::vector<double>& lat,
                                                             const std::vector<double>& lon) const {
    if (lat.size() != lon.size()) {
        throw ConfigurationError("Latitude and longitude arrays differ in length");
    }

    std::vector<double> x(lon);
    std::vector<double> y(lat);

    if (!isIdentity()) {
        if (!forward_transform_) {
            throw ConfigurationError("Coordinate system not initialized");
        }
        if (!x.empty() && !forward_transform_->transform(x.data(), y.data(), x.size())) {
            throw ConfigurationError("Projection to " + model_crs_.code + " failed: " +
                                     forward_transform_->getLastError());
        }
    }

    std::vector<GeoPoint> points;
    points.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        points.emplace_back(x[i], y[i]);
    }
    return points;
}

GeoPoint CoordinateSystemManager::toModelCoords(double lat, double lon) const {
    return toModelCoords(std::vector<double>{lat}, std::vector<double>{lon}).front();
}

bool CoordinateSystemManager::isConfigured() const {
    return isIdentity() || (forward_transform_ && forward_transform_->isValid());
}

bool CoordinateSystemManager::isIdentity() const {
    return input_crs_.isLocal() || model_crs_.isLocal() ||
           (!input_crs_.empty() && input_crs_.code == model_crs_.code);
}

// ============================================================================
// Geodetic Utilities Implementation
// ============================================================================

namespace Geodetic {

constexpr double EARTH_RADIUS = 6371000.0;      // Mean radius for spherical calculations

double haversineDistance(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = deg2rad(lat1);
    double phi2 = deg2rad(lat2);
    double dPhi = deg2rad(lat2 - lat1);
    double dLambda = deg2rad(lon2 - lon1);

    double a = std::sin(dPhi / 2) * std::sin(dPhi / 2) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(dLambda / 2) * std::sin(dLambda / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return EARTH_RADIUS * c;
}

GeoPoint destinationPoint(double lat, double lon, double bearing, double distance) {
    double phi1 = deg2rad(lat);
    double lambda1 = deg2rad(lon);
    double theta = deg2rad(bearing);
    double delta = distance / EARTH_RADIUS;

    double phi2 = std::asin(
        std::sin(phi1) * std::cos(delta) +
        std::cos(phi1) * std::sin(delta) * std::cos(theta)
    );

    double lambda2 = lambda1 + std::atan2(
        std::sin(theta) * std::sin(delta) * std::cos(phi1),
        std::cos(delta) - std::sin(phi1) * std::sin(phi2)
    );

    double lon2 = rad2deg(lambda2);
    while (lon2 > 180) lon2 -= 360;
    while (lon2 < -180) lon2 += 360;

    return GeoPoint(lon2, rad2deg(phi2));
}

} // namespace Geodetic

} // namespace FIOGT
