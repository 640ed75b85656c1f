#ifndef SFM_CNC_UNITS_H
#define SFM_CNC_UNITS_H

#include "sfm-cnc/quantity.h"
#include <string>
#include <vector>

namespace sfm {
namespace cnc {
namespace units {

// Dimensionless
const Unit& dimensionless();
const Unit& percent();

// Length
const Unit& meter();
const Unit& centimeter();
const Unit& millimeter();
const Unit& inch();
const Unit& foot();

// Time
const Unit& second();
const Unit& minute();

// Plane angle
const Unit& radian();
const Unit& revolution();

// Velocity
const Unit& meterPerSecond();
const Unit& meterPerMinute();
const Unit& millimeterPerMinute();
const Unit& inchPerMinute();
const Unit& footPerMinute();

// Angular velocity
const Unit& radianPerSecond();
const Unit& revolutionPerMinute();

// Power
const Unit& watt();
const Unit& kilowatt();
const Unit& horsepower();

// Volumetric flow rate
const Unit& cubicInchPerMinute();
const Unit& cubicCentimeterPerMinute();
const Unit& cubicMillimeterPerSecond();
const Unit& cubicMillimeterPerMinute();

// Specific cutting power (power per unit removal rate)
const Unit& horsepowerPerCubicInchPerMinute();
const Unit& kilowattPerCubicCentimeterPerMinute();
const Unit& wattPerCubicMillimeterPerSecond();

// Teeth (or any count) per revolution
const Unit& teethPerRevolution();

/**
 * Look up a unit by symbol or alias, ignoring whitespace
 * @param symbol Unit symbol such as "in", "ft/min" or "hp/(in^3/min)"
 * @return Pointer to the unit, or nullptr if unknown
 */
const Unit* findUnit(const std::string& symbol);

/**
 * Parse "<number> [unit]" into a quantity. A missing unit means dimensionless.
 * @param text Text to parse
 * @param out Output quantity
 * @param error Optional output for a description of the failure
 * @return True if parsed successfully
 */
bool parseQuantity(const std::string& text, Quantity& out, std::string* error = nullptr);

/**
 * Parse a comma separated list such as "80, 135, 210 rpm". Entries without
 * a unit take the unit of the last entry.
 * @param text Text to parse
 * @param out Output quantities, in list order
 * @param error Optional output for a description of the failure
 * @return True if every entry parsed
 */
bool parseQuantityList(const std::string& text, std::vector<Quantity>& out,
                       std::string* error = nullptr);

} // namespace units
} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_UNITS_H
