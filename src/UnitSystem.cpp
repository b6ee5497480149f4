#include "UnitSystem.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace FIOGT {

namespace {

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimmed(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

std::string Dimension::toString() const {
    if (L == 0 && T == 0) return "dimensionless";
    std::ostringstream ss;
    if (L != 0) ss << "L^" << L;
    if (L != 0 && T != 0) ss << " ";
    if (T != 0) ss << "T^" << T;
    return ss.str();
}

UnitSystem::UnitSystem() {
    const Dimension length(1, 0);
    add("m", length, 1.0);
    add("cm", length, 0.01);
    add("km", length, 1000.0);

    const Dimension time(0, 1);
    add("s", time, 1.0);
    add("h", time, 3600.0);
    add("day", time, 86400.0);

    const Dimension volume(3, 0);
    add("m3", volume, 1.0);
    add("L", volume, 1e-3);
    add("litre", volume, 1e-3);
    add("mL", volume, 1e-6);
    // Reporting volume for CFU/100mL
    add("100mL", volume, 1e-4);
    add("100 mL", volume, 1e-4);

    const Dimension rate(3, -1);
    add("m3/s", rate, 1.0);
    add("m3/day", rate, 1.0 / 86400.0);
    add("L/s", rate, 1e-3);
    add("L/h", rate, 1e-3 / 3600.0);
    add("L/day", rate, 1e-3 / 86400.0);

    const Dimension decay(-1, 0);
    add("1/m", decay, 1.0);
    add("1/km", decay, 1e-3);
}

void UnitSystem::add(const std::string& symbol, const Dimension& dimension, double to_base) {
    Unit unit(symbol, dimension, to_base);
    units_[symbol] = unit;
    // Case-insensitive fallback never shadows an exact symbol
    units_.insert(std::make_pair(lowered(symbol), unit));
}

const Unit* UnitSystem::getUnit(const std::string& symbol) const {
    auto it = units_.find(symbol);
    if (it == units_.end()) it = units_.find(lowered(symbol));
    return it == units_.end() ? nullptr : &it->second;
}

const Unit& UnitSystem::require(const std::string& symbol) const {
    const Unit* unit = getUnit(symbol);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + symbol);
    }
    return *unit;
}

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit& from = require(from_unit);
    const Unit& to = require(to_unit);
    if (from.dimension != to.dimension) {
        throw std::runtime_error("Cannot convert " + from_unit + " (" +
                                 from.dimension.toString() + ") to " + to_unit + " (" +
                                 to.dimension.toString() + ")");
    }
    return value * from.to_base / to.to_base;
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    return value * require(from_unit).to_base;
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    return value / require(to_unit).to_base;
}

bool UnitSystem::parseValueWithUnit(const std::string& text, double& value,
                                    std::string& unit) const {
    const std::string t = trimmed(text);
    if (t.empty()) return false;

    const char* begin = t.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(v)) return false;

    value = v;
    unit = trimmed(std::string(end));
    return true;
}

const UnitSystem& defaultUnits() {
    static const UnitSystem units;
    return units;
}

} // namespace FIOGT
