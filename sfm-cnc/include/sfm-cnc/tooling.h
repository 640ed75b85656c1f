#ifndef SFM_CNC_TOOLING_H
#define SFM_CNC_TOOLING_H

#include "sfm-cnc/quantity.h"
#include <map>
#include <string>

namespace sfm {
namespace cnc {

/**
 * Surface speed multiplier per tool material class ("HSS/Cobalt", "Carbide", ...).
 * A harder tool material sustains a higher multiple of the work material's
 * base surface speed.
 */
typedef std::map<std::string, double> ToolMaterialTable;

/**
 * Structure to hold end mill information
 */
struct Tool {
    std::string name;               // Display name (may be empty)
    Quantity diameter;              // Cutting diameter (length)
    int toothCount;                 // Number of flutes
    std::string material;           // Tool material class, key into ToolMaterialTable

    Tool() : toothCount(0) {}
    Tool(const Quantity& diameter, int toothCount, const std::string& material,
         const std::string& name = "")
        : name(name), diameter(diameter), toothCount(toothCount), material(material) {}

    /**
     * Name used in reports: the display name when set, otherwise a
     * description such as 3/4" 4 fl. HSS/Cobalt
     */
    std::string getLabel() const;

    // Tooth count as a quantity in teeth per revolution
    Quantity getTeethPerRevolution() const;
};

/**
 * Work material reference data
 */
struct WorkMaterial {
    std::string name;               // Unique key
    Quantity surfaceSpeed;          // Maximum sustainable surface speed (velocity)
    Quantity unitPower;             // Specific cutting power (power per removal rate)

    WorkMaterial() = default;
    WorkMaterial(const std::string& name, const Quantity& surfaceSpeed, const Quantity& unitPower)
        : name(name), surfaceSpeed(surfaceSpeed), unitPower(unitPower) {}
};

/**
 * Check tool geometry
 * @throws DimensionMismatch if the diameter is not a length
 * @throws InvalidToolGeometry if diameter or tooth count is not positive
 */
void validateTool(const Tool& tool);

/**
 * Check work material data
 * @throws DimensionMismatch if a quantity has the wrong dimension
 * @throws InvalidMaterialSpec if surface speed or unit power is not positive
 */
void validateMaterial(const WorkMaterial& material);

/**
 * Surface speed multiplier for the tool's material class
 * @throws UnknownToolMaterial if the class is not in the table
 */
double lookupSurfaceSpeedMultiplier(const ToolMaterialTable& table, const Tool& tool);

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_TOOLING_H
