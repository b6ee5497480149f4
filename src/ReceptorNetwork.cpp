#include "ReceptorNetwork.hpp"
#include "TableIO.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace FIOGT {

// =============================================================================
// ReceptorClassTable
// =============================================================================

ReceptorClassTable::ReceptorClassTable() {
    ReceptorClass priv;
    priv.name = "private";
    priv.link_radius = 30.0;
    priv.default_flux = 2000.0;
    set(priv);

    ReceptorClass gov;
    gov.name = "government";
    gov.link_radius = 100.0;
    gov.default_flux = 20000.0;
    set(gov);

    fallback_ = gov;
    fallback_.name = "default";
}

ReceptorClassTable::ReceptorClassTable(const ReceptorClass& fallback)
    : fallback_(fallback) {}

void ReceptorClassTable::set(const ReceptorClass& cls) {
    classes_[cls.name] = cls;
}

bool ReceptorClassTable::has(const std::string& name) const {
    return classes_.find(name) != classes_.end();
}

const ReceptorClass& ReceptorClassTable::get(const std::string& name) const {
    auto it = classes_.find(name);
    if (it != classes_.end()) return it->second;
    return fallback_;
}

double ReceptorClassTable::maxLinkRadius() const {
    double r = fallback_.link_radius;
    for (const auto& kv : classes_) {
        r = std::max(r, kv.second.link_radius);
    }
    return r;
}

std::vector<std::string> ReceptorClassTable::names() const {
    std::vector<std::string> result;
    for (const auto& kv : classes_) result.push_back(kv.first);
    return result;
}

void ReceptorClassTable::validate() const {
    auto check = [](const ReceptorClass& cls) {
        if (!(cls.link_radius > 0.0)) {
            throw ConfigurationError("Link radius for receptor class '" + cls.name +
                                     "' must be positive");
        }
        if (!(cls.default_flux > 0.0)) {
            throw ConfigurationError("Default flux for receptor class '" + cls.name +
                                     "' must be positive");
        }
    };
    check(fallback_);
    for (const auto& kv : classes_) check(kv.second);
}

// =============================================================================
// Observation parsing
// =============================================================================

double parseObservedConcentration(const std::string& text) {
    std::string t = text;
    t.erase(std::remove_if(t.begin(), t.end(),
                   [](unsigned char c) { return std::isspace(c) != 0; }), t.end());
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (t.empty()) return std::nan("");
    if (t == "numerous" || t == "tntc") return 1000.0;
    if (t.find('<') != std::string::npos) return 0.0;
    if (t == "nil" || t == "none" || t == "-") return 0.0;

    double value = 0.0;
    if (parseNumber(t, value)) return value;
    return std::nan("");
}

// =============================================================================
// ReceptorNetwork
// =============================================================================

void ReceptorNetwork::addReceptor(Receptor receptor) {
    receptors_.push_back(std::move(receptor));
}

ReceptorNetwork ReceptorNetwork::loadCSV(const std::string& filename,
                                         const ReceptorClassTable& classes) {
    CSVTable table = readCSV(filename);

    int col_id = table.findColumn({"id", "receptor_id", "borehole_id"});
    int col_lat = table.findColumn({"lat", "latitude"});
    int col_lon = table.findColumn({"long", "lon", "longitude"});
    int col_cls = table.findColumn({"class", "receptor_class", "borehole_type"});
    int col_flux = table.findColumn({"flux", "water_flux", "Q_L_per_day"});
    int col_obs = table.findColumn({"observed", "observed_concentration", "fio_observed"});

    std::vector<std::string> missing;
    if (col_id < 0) missing.push_back("id");
    if (col_lat < 0) missing.push_back("lat");
    if (col_lon < 0) missing.push_back("long");
    if (!missing.empty()) {
        std::string msg = "Receptor table " + filename + " is missing required columns:";
        for (const auto& m : missing) msg += " " + m;
        throw DataValidationError(msg, missing);
    }

    ReceptorNetwork network;
    std::size_t dropped = 0;
    std::size_t unknown_class = 0;

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        Receptor rec;
        rec.receptor_id = table.cell(r, col_id);

        if (!parseNumber(table.cell(r, col_lat), rec.lat) ||
            !parseNumber(table.cell(r, col_lon), rec.lon)) {
            ++dropped;
            continue;
        }

        rec.receptor_class = table.cell(r, col_cls);
        std::transform(rec.receptor_class.begin(), rec.receptor_class.end(),
                       rec.receptor_class.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!rec.receptor_class.empty() && !classes.has(rec.receptor_class)) {
            ++unknown_class;
        }

        if (!parseNumber(table.cell(r, col_flux), rec.water_flux)) {
            rec.water_flux = classes.get(rec.receptor_class).default_flux;
        }

        rec.observed = parseObservedConcentration(table.cell(r, col_obs));

        network.addReceptor(std::move(rec));
    }

    if (dropped > 0) {
        std::cerr << "Warning: dropped " << dropped
                  << " receptor rows with missing coordinates from " << filename << "\n";
    }
    if (unknown_class > 0) {
        std::cerr << "Warning: " << unknown_class
                  << " receptors have an unknown class, using default radius and flux\n";
    }

    return network;
}

std::size_t ReceptorNetwork::numObserved() const {
    return static_cast<std::size_t>(
        std::count_if(receptors_.begin(), receptors_.end(),
                      [](const Receptor& r) { return r.hasObservation(); }));
}

std::vector<double> ReceptorNetwork::linkRadii(const ReceptorClassTable& classes) const {
    std::vector<double> radii;
    radii.reserve(receptors_.size());
    for (const auto& rec : receptors_) {
        radii.push_back(classes.get(rec.receptor_class).link_radius);
    }
    return radii;
}

void ReceptorNetwork::validateFlux() const {
    std::vector<std::string> bad;
    for (const auto& rec : receptors_) {
        if (!(rec.water_flux > 0.0)) bad.push_back(rec.receptor_id);
    }
    if (!bad.empty()) {
        std::ostringstream msg;
        msg << "Receptors with non-positive water flux:";
        for (std::size_t i = 0; i < bad.size() && i < 10; ++i) msg << " " << bad[i];
        if (bad.size() > 10) msg << " (+" << bad.size() - 10 << " more)";
        throw DataValidationError(msg.str(), bad);
    }
}

} // namespace FIOGT
