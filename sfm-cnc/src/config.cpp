#include "sfm-cnc/config.h"
#include "sfm-cnc/errors.h"
#include "sfm-cnc/units.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace sfm {
namespace cnc {

namespace {

enum class SectionKind {
    NONE,
    SETTINGS,
    TOOL_MATERIALS,
    MACHINE,
    TOOL,
    MATERIAL,
    UNKNOWN
};

// Values collected for a [machine:...] section until the section ends
struct PendingMachine {
    std::string name;
    Quantity power;
    Quantity maxFeed;
    Quantity maxSpeed;
    std::vector<Quantity> speeds;
    bool hasPower = false;
    bool hasMaxFeed = false;
    bool hasMaxSpeed = false;
};

struct PendingTool {
    std::string name;
    Quantity diameter;
    int teeth = 0;
    std::string material;
    bool hasDiameter = false;
    bool hasTeeth = false;
};

struct PendingMaterial {
    std::string name;
    Quantity surfaceSpeed;
    Quantity unitPower;
    bool hasSurfaceSpeed = false;
    bool hasUnitPower = false;
};

bool parseBool(const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "true" || lower == "yes" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parseNumber(const std::string& value, double& out, std::string& error) {
    Quantity quantity;
    if (!units::parseQuantity(value, quantity, &error)) {
        return false;
    }
    if (!quantity.unit().getSymbol().empty()) {
        error = "expected a plain number, got '" + value + "'";
        return false;
    }
    out = quantity.magnitude();
    return true;
}

bool parseInteger(const std::string& value, int& out, std::string& error) {
    double number = 0.0;
    if (!parseNumber(value, number, error)) {
        return false;
    }
    // Range check before any integer cast
    if (!std::isfinite(number) || std::fabs(number) > std::numeric_limits<int>::max() ||
        std::floor(number) != number) {
        error = "expected a whole number, got '" + value + "'";
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

// Shortest text that reads back to the same double
std::string formatValue(double value) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    std::string exact = ss.str();
    for (int precision = 6; precision < std::numeric_limits<double>::max_digits10; precision++) {
        std::ostringstream shortSs;
        shortSs << std::setprecision(precision) << value;
        if (std::stod(shortSs.str()) == value) {
            return shortSs.str();
        }
    }
    return exact;
}

std::string formatQuantity(const Quantity& quantity) {
    std::string text = formatValue(quantity.magnitude());
    if (!quantity.unit().getSymbol().empty()) {
        text += " " + quantity.unit().getSymbol();
    }
    return text;
}

} // namespace

FeedsConfig::FeedsConfig() {
    setDefaults();
}

FeedsConfig::~FeedsConfig() = default;

void FeedsConfig::setDefaults() {
    // Display
    m_units = MeasurementUnit::INCHES;

    // Calculation constants. Run the machine at half its rating so
    // approximation errors don't stall the motor, and assume a quarter of
    // the motor power is lost in the belt, bearings and spindle.
    m_chipLoad = 0.005;
    m_powerMargin = 0.5;
    m_efficiency = 0.75;

    // Carbide sustains a multiple of the HSS surface speed; 2.5x is a
    // conservative value, production shops run 4-5x
    m_toolMaterials.clear();
    m_toolMaterials["HSS/Cobalt"] = 1.0;
    m_toolMaterials["Carbide"] = 2.5;

    // Sampling. 1.5 D keeps the chart readable; 2-3 D only matters when
    // using most of the flute length.
    m_maxDocMultiple = 1.5;
    m_docStep = Quantity(0.01, units::inch());
    m_docFromZero = false;

    // Machines
    m_machines.clear();
    m_machines.push_back(Machine("Sharp LMV CNC Mill",
                                 Quantity(3.0, units::horsepower()),
                                 Quantity(60.0, units::inchPerMinute()),
                                 SpindleRange::variable(Quantity(3000.0, units::revolutionPerMinute()))));

    std::vector<Quantity> bridgeportSpeeds;
    const double steps[] = {80, 135, 210, 325, 660, 1115, 1750, 2720};
    for (double step : steps) {
        bridgeportSpeeds.push_back(Quantity(step, units::revolutionPerMinute()));
    }
    m_machines.push_back(Machine("Bridgeport J-Head Mill",
                                 Quantity(1.0, units::horsepower()),
                                 Quantity(30.0, units::inchPerMinute()),
                                 SpindleRange::stepped(bridgeportSpeeds)));

    // Tools
    m_tools.clear();
    m_tools.push_back(Tool(Quantity(2.0, units::inch()), 1, "HSS/Cobalt"));
    m_tools.push_back(Tool(Quantity(3.0 / 4.0, units::inch()), 4, "HSS/Cobalt"));
    m_tools.push_back(Tool(Quantity(5.0 / 8.0, units::inch()), 4, "HSS/Cobalt"));
    m_tools.push_back(Tool(Quantity(1.0 / 2.0, units::inch()), 4, "HSS/Cobalt"));
    m_tools.push_back(Tool(Quantity(1.0 / 2.0, units::inch()), 4, "Carbide"));
    m_tools.push_back(Tool(Quantity(3.0 / 8.0, units::inch()), 4, "Carbide"));
    m_tools.push_back(Tool(Quantity(3.0 / 8.0, units::inch()), 2, "HSS/Cobalt"));
    m_tools.push_back(Tool(Quantity(3.0 / 8.0, units::inch()), 2, "Carbide"));
    m_tools.push_back(Tool(Quantity(3.0 / 16.0, units::inch()), 2, "Carbide"));

    // Work materials
    const Unit& sfm = units::footPerMinute();
    const Unit& unitPower = units::horsepowerPerCubicInchPerMinute();
    m_materials.clear();
    m_materials.push_back(WorkMaterial("Aluminum", Quantity(300, sfm), Quantity(0.4, unitPower)));
    m_materials.push_back(WorkMaterial("Mild Steel", Quantity(100, sfm), Quantity(1.8, unitPower)));
    m_materials.push_back(WorkMaterial("4130 Steel", Quantity(80, sfm), Quantity(2.2, unitPower)));
    m_materials.push_back(WorkMaterial("4140 Steel, annealed", Quantity(60, sfm), Quantity(2.3, unitPower)));
    m_materials.push_back(WorkMaterial("4140 Steel, hardened", Quantity(30, sfm), Quantity(2.6, unitPower)));
    m_materials.push_back(WorkMaterial("304 Stainless", Quantity(50, sfm), Quantity(1.8, unitPower)));
}

void FeedsConfig::clearTables() {
    m_toolMaterials.clear();
    m_machines.clear();
    m_tools.clear();
    m_materials.clear();
}

bool FeedsConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool FeedsConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    bool ok = loadFromStream(file, filename);
    file.close();
    return ok;
}

bool FeedsConfig::loadFromStream(std::istream& in, const std::string& sourceName) {
    // First set defaults, then replace the tables with the ones in the file
    setDefaults();
    clearTables();

    bool ok = true;
    int lineNumber = 0;
    int sectionLine = 0;
    SectionKind section = SectionKind::NONE;
    std::string sectionName;

    PendingMachine machine;
    PendingTool tool;
    PendingMaterial material;

    auto reportError = [&](int line, const std::string& message) {
        std::cerr << "Error: " << sourceName << ":" << line << ": " << message << std::endl;
        ok = false;
    };

    // Turn the collected values of the section that just ended into a record
    auto finishSection = [&]() {
        try {
            if (section == SectionKind::MACHINE) {
                if (!machine.hasPower || !machine.hasMaxFeed) {
                    reportError(sectionLine, "machine '" + machine.name +
                                             "' needs both power and max_feed");
                    return;
                }
                if (machine.hasMaxSpeed == !machine.speeds.empty()) {
                    reportError(sectionLine, "machine '" + machine.name +
                                             "' needs exactly one of max_speed or speeds");
                    return;
                }
                SpindleRange spindle = machine.hasMaxSpeed
                                           ? SpindleRange::variable(machine.maxSpeed)
                                           : SpindleRange::stepped(machine.speeds);
                Machine record(machine.name, machine.power, machine.maxFeed, spindle);
                validateMachine(record);
                m_machines.push_back(record);
            } else if (section == SectionKind::TOOL) {
                if (!tool.hasDiameter || !tool.hasTeeth || tool.material.empty()) {
                    reportError(sectionLine, "tool '" + tool.name +
                                             "' needs diameter, teeth and material");
                    return;
                }
                Tool record(tool.diameter, tool.teeth, tool.material, tool.name);
                validateTool(record);
                m_tools.push_back(record);
            } else if (section == SectionKind::MATERIAL) {
                if (!material.hasSurfaceSpeed || !material.hasUnitPower) {
                    reportError(sectionLine, "material '" + material.name +
                                             "' needs surface_speed and unit_power");
                    return;
                }
                WorkMaterial record(material.name, material.surfaceSpeed, material.unitPower);
                validateMaterial(record);
                m_materials.push_back(record);
            }
        } catch (const CalculationError& e) {
            reportError(sectionLine, e.what());
        }
    };

    std::string line;
    while (std::getline(in, line)) {
        lineNumber++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Drop a trailing comment after a section header
        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close != std::string::npos) {
                std::string tail = trim(line.substr(close + 1));
                if (tail.empty() || tail[0] == '#' || tail[0] == ';') {
                    line = line.substr(0, close + 1);
                }
            }
        }

        // Check for section header
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            finishSection();

            std::string header = line.substr(1, line.length() - 2);
            size_t colon = header.find(':');
            std::string kind = trim(header.substr(0, colon));
            sectionName = (colon == std::string::npos) ? "" : trim(header.substr(colon + 1));
            sectionLine = lineNumber;

            machine = PendingMachine();
            tool = PendingTool();
            material = PendingMaterial();

            if (kind == "settings") section = SectionKind::SETTINGS;
            else if (kind == "tool_materials") section = SectionKind::TOOL_MATERIALS;
            else if (kind == "machine") section = SectionKind::MACHINE;
            else if (kind == "tool") section = SectionKind::TOOL;
            else if (kind == "material") section = SectionKind::MATERIAL;
            else {
                std::cerr << "Warning: " << sourceName << ":" << lineNumber
                          << ": unknown section [" << header << "] ignored" << std::endl;
                section = SectionKind::UNKNOWN;
            }

            machine.name = sectionName;
            tool.name = sectionName;
            material.name = sectionName;
            continue;
        }

        // Parse key=value
        std::string key, value;
        if (!parseLine(line, key, value)) {
            reportError(lineNumber, "expected key=value, got '" + line + "'");
            continue;
        }

        std::string error;
        bool parsed = true;
        bool known = true;

        // Process the key-value pair according to the section
        if (section == SectionKind::SETTINGS) {
            if (key == "units") setUnitsFromString(value);
            else if (key == "chip_load") parsed = parseNumber(value, m_chipLoad, error);
            else if (key == "power_margin") parsed = parseNumber(value, m_powerMargin, error);
            else if (key == "efficiency") parsed = parseNumber(value, m_efficiency, error);
            else if (key == "max_doc_multiple") parsed = parseNumber(value, m_maxDocMultiple, error);
            else if (key == "doc_step") parsed = units::parseQuantity(value, m_docStep, &error);
            else if (key == "doc_from_zero") {
                parsed = parseBool(value, m_docFromZero);
                if (!parsed) error = "expected true or false, got '" + value + "'";
            }
            else known = false;
        }
        else if (section == SectionKind::TOOL_MATERIALS) {
            double multiplier = 0.0;
            parsed = parseNumber(value, multiplier, error);
            if (parsed) m_toolMaterials[key] = multiplier;
        }
        else if (section == SectionKind::MACHINE) {
            if (key == "power") parsed = machine.hasPower = units::parseQuantity(value, machine.power, &error);
            else if (key == "max_feed") parsed = machine.hasMaxFeed = units::parseQuantity(value, machine.maxFeed, &error);
            else if (key == "max_speed") parsed = machine.hasMaxSpeed = units::parseQuantity(value, machine.maxSpeed, &error);
            else if (key == "speeds") parsed = units::parseQuantityList(value, machine.speeds, &error);
            else known = false;
        }
        else if (section == SectionKind::TOOL) {
            if (key == "diameter") parsed = tool.hasDiameter = units::parseQuantity(value, tool.diameter, &error);
            else if (key == "teeth") parsed = tool.hasTeeth = parseInteger(value, tool.teeth, error);
            else if (key == "material") tool.material = value;
            else known = false;
        }
        else if (section == SectionKind::MATERIAL) {
            if (key == "surface_speed") parsed = material.hasSurfaceSpeed = units::parseQuantity(value, material.surfaceSpeed, &error);
            else if (key == "unit_power") parsed = material.hasUnitPower = units::parseQuantity(value, material.unitPower, &error);
            else known = false;
        }
        else if (section == SectionKind::NONE) {
            reportError(lineNumber, "key '" + key + "' outside of a section");
            continue;
        }

        if (!parsed) {
            reportError(lineNumber, key + ": " + error);
        } else if (!known) {
            std::cerr << "Warning: " << sourceName << ":" << lineNumber
                      << ": unknown key '" << key << "' ignored" << std::endl;
        }
    }

    finishSection();
    return ok;
}

bool FeedsConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    saveToStream(file);
    file.close();
    return true;
}

void FeedsConfig::saveToStream(std::ostream& out) const {
    // Write file header
    out << "# SFM CNC Configuration File" << std::endl;
    out << "# Automatically generated" << std::endl << std::endl;

    // Settings section
    out << "[settings]" << std::endl;
    out << "units=" << getUnitsString() << std::endl;
    out << "chip_load=" << formatValue(m_chipLoad) << std::endl;
    out << "power_margin=" << formatValue(m_powerMargin) << std::endl;
    out << "efficiency=" << formatValue(m_efficiency) << std::endl;
    out << "max_doc_multiple=" << formatValue(m_maxDocMultiple) << std::endl;
    out << "doc_step=" << formatQuantity(m_docStep) << std::endl;
    out << "doc_from_zero=" << (m_docFromZero ? "true" : "false") << std::endl << std::endl;

    // Tool material section
    out << "[tool_materials]" << std::endl;
    for (const auto& entry : m_toolMaterials) {
        out << entry.first << "=" << formatValue(entry.second) << std::endl;
    }
    out << std::endl;

    for (const auto& machine : m_machines) {
        out << "[machine:" << machine.name << "]" << std::endl;
        out << "power=" << formatQuantity(machine.ratedPower) << std::endl;
        out << "max_feed=" << formatQuantity(machine.maxFeedRate) << std::endl;
        if (machine.spindle.isStepped()) {
            out << "speeds=";
            const auto& speeds = machine.spindle.getSpeeds();
            for (size_t i = 0; i < speeds.size(); i++) {
                if (i > 0) out << ", ";
                out << formatQuantity(speeds[i]);
            }
            out << std::endl;
        } else {
            out << "max_speed=" << formatQuantity(machine.spindle.getMaxSpeed()) << std::endl;
        }
        out << std::endl;
    }

    for (const auto& tool : m_tools) {
        if (tool.name.empty()) {
            out << "[tool]" << std::endl;
        } else {
            out << "[tool:" << tool.name << "]" << std::endl;
        }
        out << "diameter=" << formatQuantity(tool.diameter) << std::endl;
        out << "teeth=" << tool.toothCount << std::endl;
        out << "material=" << tool.material << std::endl << std::endl;
    }

    for (const auto& material : m_materials) {
        out << "[material:" << material.name << "]" << std::endl;
        out << "surface_speed=" << formatQuantity(material.surfaceSpeed) << std::endl;
        out << "unit_power=" << formatQuantity(material.unitPower) << std::endl << std::endl;
    }
}

CalculatorSettings FeedsConfig::getCalculatorSettings() const {
    CalculatorSettings settings;
    settings.surfaceSpeedMultipliers = m_toolMaterials;
    settings.chipLoad = m_chipLoad;
    settings.powerMargin = m_powerMargin;
    settings.efficiency = m_efficiency;
    return settings;
}

DepthSampling FeedsConfig::getDepthSampling() const {
    DepthSampling sampling;
    sampling.maxDiameterMultiple = m_maxDocMultiple;
    sampling.step = m_docStep;
    sampling.startAtZero = m_docFromZero;
    return sampling;
}

bool FeedsConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, pos));

    // Drop a trailing comment
    std::string rest = line.substr(pos + 1);
    size_t comment = rest.find_first_of(";#");
    value = trim(rest.substr(0, comment));

    return !key.empty();
}

std::string FeedsConfig::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string FeedsConfig::getUnitsString() const {
    return (m_units == MeasurementUnit::MILLIMETERS) ? "mm" : "in";
}

void FeedsConfig::setUnitsFromString(const std::string& units) {
    if (units == "mm" || units == "millimeter" || units == "millimeters") {
        m_units = MeasurementUnit::MILLIMETERS;
    } else {
        m_units = MeasurementUnit::INCHES;
    }
}

const Unit& FeedsConfig::getPrimaryLengthUnit() const {
    return (m_units == MeasurementUnit::MILLIMETERS) ? units::millimeter() : units::inch();
}

const Unit& FeedsConfig::getSecondaryLengthUnit() const {
    return (m_units == MeasurementUnit::MILLIMETERS) ? units::inch() : units::millimeter();
}

} // namespace cnc
} // namespace sfm
