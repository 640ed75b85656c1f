#include "sfm-cnc/units.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace sfm {
namespace cnc {
namespace units {

namespace {

const double kInch = 0.0254;
const double kFoot = 0.3048;
const double kMinute = 60.0;
const double kRevolution = 2.0 * M_PI;
const double kHorsepower = 745.69987158227022;

std::string stripWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            result.push_back(static_cast<char>(c));
        }
    }
    return result;
}

std::string trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

const std::map<std::string, const Unit*>& unitTable() {
    static const std::map<std::string, const Unit*> table = {
        {"%", &percent()},
        {"m", &meter()},
        {"cm", &centimeter()},
        {"mm", &millimeter()},
        {"in", &inch()},
        {"inch", &inch()},
        {"inches", &inch()},
        {"ft", &foot()},
        {"s", &second()},
        {"min", &minute()},
        {"rad", &radian()},
        {"rev", &revolution()},
        {"m/s", &meterPerSecond()},
        {"m/min", &meterPerMinute()},
        {"mm/min", &millimeterPerMinute()},
        {"in/min", &inchPerMinute()},
        {"ipm", &inchPerMinute()},
        {"ft/min", &footPerMinute()},
        {"sfm", &footPerMinute()},
        {"rad/s", &radianPerSecond()},
        {"rpm", &revolutionPerMinute()},
        {"RPM", &revolutionPerMinute()},
        {"rev/min", &revolutionPerMinute()},
        {"W", &watt()},
        {"kW", &kilowatt()},
        {"hp", &horsepower()},
        {"in^3/min", &cubicInchPerMinute()},
        {"cm^3/min", &cubicCentimeterPerMinute()},
        {"mm^3/s", &cubicMillimeterPerSecond()},
        {"mm^3/min", &cubicMillimeterPerMinute()},
        {"hp/(in^3/min)", &horsepowerPerCubicInchPerMinute()},
        {"kW/(cm^3/min)", &kilowattPerCubicCentimeterPerMinute()},
        {"W/(mm^3/s)", &wattPerCubicMillimeterPerSecond()},
        {"J/mm^3", &wattPerCubicMillimeterPerSecond()},
        {"teeth/rev", &teethPerRevolution()},
    };
    return table;
}

} // namespace

const Unit& dimensionless() {
    static const Unit unit("", Dimension::dimensionless(), 1.0);
    return unit;
}

const Unit& percent() {
    static const Unit unit("%", Dimension::dimensionless(), 0.01);
    return unit;
}

const Unit& meter() {
    static const Unit unit("m", Dimension::lengthDim(), 1.0);
    return unit;
}

const Unit& centimeter() {
    static const Unit unit("cm", Dimension::lengthDim(), 0.01);
    return unit;
}

const Unit& millimeter() {
    static const Unit unit("mm", Dimension::lengthDim(), 0.001);
    return unit;
}

const Unit& inch() {
    static const Unit unit("in", Dimension::lengthDim(), kInch);
    return unit;
}

const Unit& foot() {
    static const Unit unit("ft", Dimension::lengthDim(), kFoot);
    return unit;
}

const Unit& second() {
    static const Unit unit("s", Dimension::timeDim(), 1.0);
    return unit;
}

const Unit& minute() {
    static const Unit unit("min", Dimension::timeDim(), kMinute);
    return unit;
}

const Unit& radian() {
    static const Unit unit("rad", Dimension::angleDim(), 1.0);
    return unit;
}

const Unit& revolution() {
    static const Unit unit("rev", Dimension::angleDim(), kRevolution);
    return unit;
}

const Unit& meterPerSecond() {
    static const Unit unit("m/s", Dimension::velocity(), 1.0);
    return unit;
}

const Unit& meterPerMinute() {
    static const Unit unit("m/min", Dimension::velocity(), 1.0 / kMinute);
    return unit;
}

const Unit& millimeterPerMinute() {
    static const Unit unit("mm/min", Dimension::velocity(), 0.001 / kMinute);
    return unit;
}

const Unit& inchPerMinute() {
    static const Unit unit("in/min", Dimension::velocity(), kInch / kMinute);
    return unit;
}

const Unit& footPerMinute() {
    static const Unit unit("ft/min", Dimension::velocity(), kFoot / kMinute);
    return unit;
}

const Unit& radianPerSecond() {
    static const Unit unit("rad/s", Dimension::angularVelocity(), 1.0);
    return unit;
}

const Unit& revolutionPerMinute() {
    static const Unit unit("rpm", Dimension::angularVelocity(), kRevolution / kMinute);
    return unit;
}

const Unit& watt() {
    static const Unit unit("W", Dimension::power(), 1.0);
    return unit;
}

const Unit& kilowatt() {
    static const Unit unit("kW", Dimension::power(), 1000.0);
    return unit;
}

const Unit& horsepower() {
    static const Unit unit("hp", Dimension::power(), kHorsepower);
    return unit;
}

const Unit& cubicInchPerMinute() {
    static const Unit unit("in^3/min", Dimension::volumetricFlowRate(),
                           kInch * kInch * kInch / kMinute);
    return unit;
}

const Unit& cubicCentimeterPerMinute() {
    static const Unit unit("cm^3/min", Dimension::volumetricFlowRate(), 1e-6 / kMinute);
    return unit;
}

const Unit& cubicMillimeterPerSecond() {
    static const Unit unit("mm^3/s", Dimension::volumetricFlowRate(), 1e-9);
    return unit;
}

const Unit& cubicMillimeterPerMinute() {
    static const Unit unit("mm^3/min", Dimension::volumetricFlowRate(), 1e-9 / kMinute);
    return unit;
}

const Unit& horsepowerPerCubicInchPerMinute() {
    static const Unit unit("hp/(in^3/min)", Dimension::powerDensity(),
                           kHorsepower / (kInch * kInch * kInch / kMinute));
    return unit;
}

const Unit& kilowattPerCubicCentimeterPerMinute() {
    static const Unit unit("kW/(cm^3/min)", Dimension::powerDensity(),
                           1000.0 / (1e-6 / kMinute));
    return unit;
}

const Unit& wattPerCubicMillimeterPerSecond() {
    static const Unit unit("W/(mm^3/s)", Dimension::powerDensity(), 1e9);
    return unit;
}

const Unit& teethPerRevolution() {
    static const Unit unit("teeth/rev", Dimension::countPerRevolution(), 1.0 / kRevolution);
    return unit;
}

const Unit* findUnit(const std::string& symbol) {
    const auto& table = unitTable();
    auto it = table.find(stripWhitespace(symbol));
    if (it == table.end()) {
        return nullptr;
    }
    return it->second;
}

bool parseQuantity(const std::string& text, Quantity& out, std::string* error) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        if (error) *error = "empty value";
        return false;
    }

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    double magnitude = std::strtod(begin, &end);
    if (end == begin) {
        if (error) *error = "expected a number in '" + trimmed + "'";
        return false;
    }
    if (!std::isfinite(magnitude)) {
        if (error) *error = "value is not finite: '" + trimmed + "'";
        return false;
    }

    std::string symbol = trim(std::string(end));
    if (symbol.empty()) {
        out = Quantity(magnitude, dimensionless());
        return true;
    }

    const Unit* unit = findUnit(symbol);
    if (unit == nullptr) {
        if (error) *error = "unknown unit '" + symbol + "'";
        return false;
    }

    out = Quantity(magnitude, *unit);
    return true;
}

bool parseQuantityList(const std::string& text, std::vector<Quantity>& out,
                       std::string* error) {
    std::vector<Quantity> parsed;
    std::vector<bool> hasUnit;
    const Unit* sharedUnit = nullptr;

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string token = trim(text.substr(start, comma == std::string::npos
                                                        ? std::string::npos
                                                        : comma - start));
        Quantity value;
        if (!parseQuantity(token, value, error)) {
            return false;
        }
        bool unitGiven = !value.unit().getSymbol().empty();
        parsed.push_back(value);
        hasUnit.push_back(unitGiven);
        if (unitGiven) {
            sharedUnit = findUnit(value.unit().getSymbol());
        }

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    if (sharedUnit != nullptr) {
        for (size_t i = 0; i < parsed.size(); i++) {
            if (!hasUnit[i]) {
                parsed[i] = Quantity(parsed[i].magnitude(), *sharedUnit);
            }
        }
    }

    out = parsed;
    return true;
}

} // namespace units
} // namespace cnc
} // namespace sfm
