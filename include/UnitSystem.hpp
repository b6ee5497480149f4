#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <stdexcept>

namespace FIOGT {

/**
 * @brief Exponents of length and time
 *
 * Organism counts are dimensionless, so loads (CFU/day) carry T^-1 and
 * concentrations (CFU/100mL) carry L^-3. Nothing in the transport model
 * has a mass dimension.
 */
struct Dimension {
    int L;
    int T;

    Dimension(int length = 0, int time = 0) : L(length), T(time) {}

    bool operator==(const Dimension& other) const { return L == other.L && T == other.T; }
    bool operator!=(const Dimension& other) const { return !(*this == other); }

    std::string toString() const;
};

/**
 * @brief A unit and its factor to metre/second base units
 *
 * Volumes are stored in m3 and abstraction rates in m3/s.
 */
struct Unit {
    std::string symbol;
    Dimension dimension;
    double to_base;

    Unit() : to_base(1.0) {}
    Unit(const std::string& s, const Dimension& d, double factor)
        : symbol(s), dimension(d), to_base(factor) {}
};

/**
 * @brief Units that appear in config files and input tables
 *
 * Distances and link radii, decay rates (1/length), reporting volumes and
 * abstraction rates. Config values may carry a unit after the number
 * ("30 m", "2000 L/day", "0.001 1/m").
 */
class UnitSystem {
public:
    UnitSystem();

    // Lookup is exact first, then case-insensitive; nullptr when unknown
    const Unit* getUnit(const std::string& symbol) const;

    /**
     * @throws std::runtime_error if a unit is unknown or the dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;
    double fromBase(double value, const std::string& to_unit) const;

    /**
     * @brief Split "2000 L/day" into 2000 and "L/day"
     * @param[out] unit Empty when the text is a bare number
     * @return false when the text does not start with a finite number
     */
    bool parseValueWithUnit(const std::string& text, double& value, std::string& unit) const;

private:
    void add(const std::string& symbol, const Dimension& dimension, double to_base);
    const Unit& require(const std::string& symbol) const;

    std::map<std::string, Unit> units_;
};

// Shared read-only instance
const UnitSystem& defaultUnits();

inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return defaultUnits().convert(value, from, to);
}

} // namespace FIOGT

#endif // UNIT_SYSTEM_HPP
