#ifndef SFM_CNC_QUANTITY_H
#define SFM_CNC_QUANTITY_H

#include <string>

namespace sfm {
namespace cnc {

/**
 * Physical dimension as integer exponents over the base dimensions
 * length, mass, time and plane angle.
 *
 * Angle is kept as a base dimension so that "per revolution" quantities
 * (teeth per revolution, length per revolution) cancel against angular
 * velocities instead of silently disappearing.
 */
struct Dimension {
    int length;
    int mass;
    int time;
    int angle;

    Dimension(int l = 0, int m = 0, int t = 0, int a = 0)
        : length(l), mass(m), time(t), angle(a) {}

    // Named dimensions used throughout the engine
    static Dimension dimensionless() { return Dimension(); }
    static Dimension lengthDim() { return Dimension(1, 0, 0, 0); }
    static Dimension timeDim() { return Dimension(0, 0, 1, 0); }
    static Dimension angleDim() { return Dimension(0, 0, 0, 1); }
    static Dimension velocity() { return Dimension(1, 0, -1, 0); }
    static Dimension angularVelocity() { return Dimension(0, 0, -1, 1); }
    static Dimension power() { return Dimension(2, 1, -3, 0); }
    static Dimension volumetricFlowRate() { return Dimension(3, 0, -1, 0); }
    static Dimension powerDensity() { return Dimension(-1, 1, -2, 0); }
    static Dimension countPerRevolution() { return Dimension(0, 0, 0, -1); }

    bool isDimensionless() const {
        return length == 0 && mass == 0 && time == 0 && angle == 0;
    }

    Dimension operator*(const Dimension& other) const {
        return Dimension(length + other.length, mass + other.mass,
                         time + other.time, angle + other.angle);
    }

    Dimension operator/(const Dimension& other) const {
        return Dimension(length - other.length, mass - other.mass,
                         time - other.time, angle - other.angle);
    }

    bool operator==(const Dimension& other) const {
        return length == other.length && mass == other.mass &&
               time == other.time && angle == other.angle;
    }

    bool operator!=(const Dimension& other) const { return !(*this == other); }

    // Human readable form, e.g. "L T^-1"
    std::string toString() const;
};

/**
 * A unit of measure: a symbol, its dimension and the factor that converts
 * one of it into the coherent SI unit of that dimension (m, kg, s, rad).
 */
class Unit {
public:
    Unit();
    Unit(const std::string& symbol, const Dimension& dimension, double scale);

    const std::string& getSymbol() const { return m_symbol; }
    const Dimension& getDimension() const { return m_dimension; }
    double getScale() const { return m_scale; }

    bool isCompatibleWith(const Unit& other) const {
        return m_dimension == other.m_dimension;
    }

    // Derived units
    Unit operator*(const Unit& other) const;
    Unit operator/(const Unit& other) const;

    bool operator==(const Unit& other) const;
    bool operator!=(const Unit& other) const { return !(*this == other); }

private:
    std::string m_symbol;
    Dimension m_dimension;
    double m_scale;
};

/**
 * A magnitude tagged with a unit.
 *
 * Addition, subtraction and comparison require both operands to share a
 * dimension and throw DimensionMismatch otherwise. Multiplication and
 * division accept any pair and compose the dimensions.
 */
class Quantity {
public:
    Quantity();
    Quantity(double magnitude, const Unit& unit);

    double magnitude() const { return m_magnitude; }
    const Unit& unit() const { return m_unit; }
    const Dimension& dimension() const { return m_unit.getDimension(); }

    /**
     * Express this quantity in another unit of the same dimension
     * @param target The unit to convert to
     * @return The equivalent quantity in the target unit
     * @throws DimensionMismatch if the dimensions differ
     */
    Quantity convertTo(const Unit& target) const;

    // Magnitude in the given unit, shorthand for convertTo(target).magnitude()
    double in(const Unit& target) const;

    // Magnitude in coherent SI units of this dimension
    double siValue() const { return m_magnitude * m_unit.getScale(); }

    bool isDimensionless() const { return dimension().isDimensionless(); }
    bool isFinite() const;

    /**
     * Check for equality within a relative tolerance
     * @throws DimensionMismatch if the dimensions differ
     */
    bool approxEqual(const Quantity& other, double relTol = 1e-9) const;

    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;
    Quantity operator-() const;
    Quantity operator*(const Quantity& other) const;
    Quantity operator/(const Quantity& other) const;
    Quantity operator*(double scalar) const;
    Quantity operator/(double scalar) const;

    Quantity& operator+=(const Quantity& other);
    Quantity& operator-=(const Quantity& other);
    Quantity& operator*=(double scalar);

    bool operator<(const Quantity& other) const;
    bool operator>(const Quantity& other) const;
    bool operator<=(const Quantity& other) const;
    bool operator>=(const Quantity& other) const;
    bool operator==(const Quantity& other) const;
    bool operator!=(const Quantity& other) const;

    /**
     * Format as "<magnitude> <symbol>"
     * @param precision Digits after the decimal point
     */
    std::string toString(int precision = 3) const;

private:
    double m_magnitude;
    Unit m_unit;

    void requireSameDimension(const Quantity& other, const char* operation) const;
};

Quantity operator*(double scalar, const Quantity& quantity);
Quantity operator*(double magnitude, const Unit& unit);

Quantity abs(const Quantity& quantity);
Quantity min(const Quantity& a, const Quantity& b);
Quantity max(const Quantity& a, const Quantity& b);

// Throws DimensionMismatch unless the quantity has the expected dimension
void requireDimension(const Quantity& quantity, const Dimension& expected,
                      const std::string& what);

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_QUANTITY_H
