#include "sfm-cnc/quantity.h"
#include "sfm-cnc/errors.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace sfm {
namespace cnc {

namespace {

void appendExponent(std::ostringstream& ss, bool& first, const char* symbol, int exponent) {
    if (exponent == 0) {
        return;
    }
    if (!first) ss << " ";
    ss << symbol;
    if (exponent != 1) ss << "^" << exponent;
    first = false;
}

// Wrap a compound symbol in parentheses when it becomes a divisor
std::string wrapSymbol(const std::string& symbol) {
    if (symbol.find_first_of("*/") != std::string::npos) {
        return "(" + symbol + ")";
    }
    return symbol;
}

} // namespace

// Dimension

std::string Dimension::toString() const {
    std::ostringstream ss;
    bool first = true;

    appendExponent(ss, first, "L", length);
    appendExponent(ss, first, "M", mass);
    appendExponent(ss, first, "T", time);
    appendExponent(ss, first, "A", angle);

    return first ? "dimensionless" : ss.str();
}

// Unit

Unit::Unit()
    : m_symbol(""), m_dimension(), m_scale(1.0) {
}

Unit::Unit(const std::string& symbol, const Dimension& dimension, double scale)
    : m_symbol(symbol), m_dimension(dimension), m_scale(scale) {
}

Unit Unit::operator*(const Unit& other) const {
    std::string symbol;
    if (m_symbol.empty()) {
        symbol = other.m_symbol;
    } else if (other.m_symbol.empty()) {
        symbol = m_symbol;
    } else {
        symbol = m_symbol + "*" + other.m_symbol;
    }
    return Unit(symbol, m_dimension * other.m_dimension, m_scale * other.m_scale);
}

Unit Unit::operator/(const Unit& other) const {
    std::string symbol;
    if (other.m_symbol.empty()) {
        symbol = m_symbol;
    } else if (m_symbol.empty()) {
        symbol = "1/" + wrapSymbol(other.m_symbol);
    } else {
        symbol = m_symbol + "/" + wrapSymbol(other.m_symbol);
    }
    return Unit(symbol, m_dimension / other.m_dimension, m_scale / other.m_scale);
}

bool Unit::operator==(const Unit& other) const {
    return m_symbol == other.m_symbol && m_dimension == other.m_dimension &&
           m_scale == other.m_scale;
}

// Quantity

Quantity::Quantity()
    : m_magnitude(0.0), m_unit() {
}

Quantity::Quantity(double magnitude, const Unit& unit)
    : m_magnitude(magnitude), m_unit(unit) {
}

Quantity Quantity::convertTo(const Unit& target) const {
    if (!m_unit.isCompatibleWith(target)) {
        throw DimensionMismatch("Cannot convert '" + m_unit.getSymbol() + "' [" +
                                dimension().toString() + "] to '" + target.getSymbol() +
                                "' [" + target.getDimension().toString() + "]");
    }
    if (m_unit.getScale() == target.getScale()) {
        return Quantity(m_magnitude, target);
    }
    return Quantity(m_magnitude * m_unit.getScale() / target.getScale(), target);
}

double Quantity::in(const Unit& target) const {
    return convertTo(target).magnitude();
}

bool Quantity::isFinite() const {
    return std::isfinite(m_magnitude);
}

bool Quantity::approxEqual(const Quantity& other, double relTol) const {
    requireSameDimension(other, "compare");
    double a = siValue();
    double b = other.siValue();
    double scale = std::max(std::fabs(a), std::fabs(b));
    return std::fabs(a - b) <= relTol * scale;
}

void Quantity::requireSameDimension(const Quantity& other, const char* operation) const {
    if (dimension() != other.dimension()) {
        throw DimensionMismatch(std::string("Cannot ") + operation + " '" +
                                m_unit.getSymbol() + "' [" + dimension().toString() +
                                "] and '" + other.m_unit.getSymbol() + "' [" +
                                other.dimension().toString() + "]");
    }
}

Quantity Quantity::operator+(const Quantity& other) const {
    requireSameDimension(other, "add");
    return Quantity(m_magnitude + other.in(m_unit), m_unit);
}

Quantity Quantity::operator-(const Quantity& other) const {
    requireSameDimension(other, "subtract");
    return Quantity(m_magnitude - other.in(m_unit), m_unit);
}

Quantity Quantity::operator-() const {
    return Quantity(-m_magnitude, m_unit);
}

Quantity Quantity::operator*(const Quantity& other) const {
    return Quantity(m_magnitude * other.m_magnitude, m_unit * other.m_unit);
}

Quantity Quantity::operator/(const Quantity& other) const {
    return Quantity(m_magnitude / other.m_magnitude, m_unit / other.m_unit);
}

Quantity Quantity::operator*(double scalar) const {
    return Quantity(m_magnitude * scalar, m_unit);
}

Quantity Quantity::operator/(double scalar) const {
    return Quantity(m_magnitude / scalar, m_unit);
}

Quantity& Quantity::operator+=(const Quantity& other) {
    *this = *this + other;
    return *this;
}

Quantity& Quantity::operator-=(const Quantity& other) {
    *this = *this - other;
    return *this;
}

Quantity& Quantity::operator*=(double scalar) {
    m_magnitude *= scalar;
    return *this;
}

bool Quantity::operator<(const Quantity& other) const {
    requireSameDimension(other, "compare");
    return siValue() < other.siValue();
}

bool Quantity::operator>(const Quantity& other) const {
    requireSameDimension(other, "compare");
    return siValue() > other.siValue();
}

bool Quantity::operator<=(const Quantity& other) const {
    requireSameDimension(other, "compare");
    return siValue() <= other.siValue();
}

bool Quantity::operator>=(const Quantity& other) const {
    requireSameDimension(other, "compare");
    return siValue() >= other.siValue();
}

bool Quantity::operator==(const Quantity& other) const {
    requireSameDimension(other, "compare");
    return siValue() == other.siValue();
}

bool Quantity::operator!=(const Quantity& other) const {
    return !(*this == other);
}

std::string Quantity::toString(int precision) const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << m_magnitude;
    if (!m_unit.getSymbol().empty()) {
        ss << " " << m_unit.getSymbol();
    }
    return ss.str();
}

// Free functions

Quantity operator*(double scalar, const Quantity& quantity) {
    return quantity * scalar;
}

Quantity operator*(double magnitude, const Unit& unit) {
    return Quantity(magnitude, unit);
}

Quantity abs(const Quantity& quantity) {
    return Quantity(std::fabs(quantity.magnitude()), quantity.unit());
}

Quantity min(const Quantity& a, const Quantity& b) {
    return (b < a) ? b : a;
}

Quantity max(const Quantity& a, const Quantity& b) {
    return (a < b) ? b : a;
}

void requireDimension(const Quantity& quantity, const Dimension& expected,
                      const std::string& what) {
    if (quantity.dimension() != expected) {
        throw DimensionMismatch(what + " must have dimension [" + expected.toString() +
                                "], got '" + quantity.unit().getSymbol() + "' [" +
                                quantity.dimension().toString() + "]");
    }
}

} // namespace cnc
} // namespace sfm
