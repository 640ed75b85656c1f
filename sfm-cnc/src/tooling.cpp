#include "sfm-cnc/tooling.h"
#include "sfm-cnc/errors.h"
#include "sfm-cnc/units.h"
#include "sfm-cnc/utils.h"

#include <sstream>

namespace sfm {
namespace cnc {

std::string Tool::getLabel() const {
    if (!name.empty()) {
        return name;
    }

    std::ostringstream ss;
    if (diameter.dimension() == Dimension::lengthDim()) {
        ss << Utils::formatFraction(diameter.in(units::inch())) << "\"";
    } else {
        ss << diameter.toString();
    }
    ss << " " << toothCount << " fl. " << material;
    return ss.str();
}

Quantity Tool::getTeethPerRevolution() const {
    return Quantity(static_cast<double>(toothCount), units::teethPerRevolution());
}

void validateTool(const Tool& tool) {
    requireDimension(tool.diameter, Dimension::lengthDim(), "Tool diameter");

    if (!tool.diameter.isFinite() || tool.diameter.magnitude() <= 0.0) {
        throw InvalidToolGeometry("Tool '" + tool.getLabel() +
                                  "': diameter must be positive, got " +
                                  tool.diameter.toString());
    }
    if (tool.toothCount <= 0) {
        throw InvalidToolGeometry("Tool '" + tool.getLabel() +
                                  "': tooth count must be positive, got " +
                                  std::to_string(tool.toothCount));
    }
}

void validateMaterial(const WorkMaterial& material) {
    requireDimension(material.surfaceSpeed, Dimension::velocity(),
                     "Surface speed of '" + material.name + "'");
    requireDimension(material.unitPower, Dimension::powerDensity(),
                     "Specific cutting power of '" + material.name + "'");

    if (!material.surfaceSpeed.isFinite() || material.surfaceSpeed.magnitude() <= 0.0) {
        throw InvalidMaterialSpec("Material '" + material.name +
                                  "': surface speed must be positive, got " +
                                  material.surfaceSpeed.toString());
    }
    if (!material.unitPower.isFinite() || material.unitPower.magnitude() <= 0.0) {
        throw InvalidMaterialSpec("Material '" + material.name +
                                  "': specific cutting power must be positive, got " +
                                  material.unitPower.toString());
    }
}

double lookupSurfaceSpeedMultiplier(const ToolMaterialTable& table, const Tool& tool) {
    auto it = table.find(tool.material);
    if (it == table.end()) {
        throw UnknownToolMaterial("No surface speed multiplier for tool material '" +
                                  tool.material + "'");
    }
    return it->second;
}

} // namespace cnc
} // namespace sfm
