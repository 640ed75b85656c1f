#ifndef SFM_CNC_CONFIG_H
#define SFM_CNC_CONFIG_H

#include "sfm-cnc/calculator.h"
#include "sfm-cnc/machine.h"
#include "sfm-cnc/quantity.h"
#include "sfm-cnc/stepover_curve.h"
#include "sfm-cnc/tooling.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace sfm {
namespace cnc {

/**
 * Enum for measurement units
 */
enum class MeasurementUnit {
    MILLIMETERS,
    INCHES
};

/**
 * Configuration class for machines, tools, materials and calculation constants
 */
class FeedsConfig {
public:
    FeedsConfig();
    ~FeedsConfig();

    /**
     * Initialize with default values: the shop's two mills, nine end mills
     * and six work materials
     */
    void setDefaults();

    // Remove all machines, tools, materials and tool material multipliers
    void clearTables();

    /**
     * Load configuration from file
     * @param filename Path to the config file
     * @return True if loaded successfully
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Load configuration from a stream
     * @param in Stream holding the configuration text
     * @param sourceName Name used in error messages
     * @return True if every line parsed and every record is valid
     */
    bool loadFromStream(std::istream& in, const std::string& sourceName = "<stream>");

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    void saveToStream(std::ostream& out) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    // Display units
    MeasurementUnit getUnits() const { return m_units; }
    void setUnits(MeasurementUnit units) { m_units = units; }
    std::string getUnitsString() const;
    void setUnitsFromString(const std::string& units);
    const Unit& getPrimaryLengthUnit() const;
    const Unit& getSecondaryLengthUnit() const;

    // Calculation constants
    double getChipLoad() const { return m_chipLoad; }
    void setChipLoad(double chipLoad) { m_chipLoad = chipLoad; }

    double getPowerMargin() const { return m_powerMargin; }
    void setPowerMargin(double margin) { m_powerMargin = margin; }

    double getEfficiency() const { return m_efficiency; }
    void setEfficiency(double efficiency) { m_efficiency = efficiency; }

    const ToolMaterialTable& getToolMaterials() const { return m_toolMaterials; }
    void setToolMaterialMultiplier(const std::string& material, double multiplier) {
        m_toolMaterials[material] = multiplier;
    }

    // Depth of cut sampling
    double getMaxDocMultiple() const { return m_maxDocMultiple; }
    void setMaxDocMultiple(double multiple) { m_maxDocMultiple = multiple; }

    const Quantity& getDocStep() const { return m_docStep; }
    void setDocStep(const Quantity& step) { m_docStep = step; }

    bool getDocFromZero() const { return m_docFromZero; }
    void setDocFromZero(bool fromZero) { m_docFromZero = fromZero; }

    // Reference tables
    const std::vector<Machine>& getMachines() const { return m_machines; }
    void addMachine(const Machine& machine) { m_machines.push_back(machine); }

    const std::vector<Tool>& getTools() const { return m_tools; }
    void addTool(const Tool& tool) { m_tools.push_back(tool); }

    const std::vector<WorkMaterial>& getMaterials() const { return m_materials; }
    void addMaterial(const WorkMaterial& material) { m_materials.push_back(material); }

    // Engine inputs assembled from the values above
    CalculatorSettings getCalculatorSettings() const;
    DepthSampling getDepthSampling() const;

private:
    // Display
    MeasurementUnit m_units;        // Primary length unit for reports

    // Calculation constants
    double m_chipLoad;              // Advance per tooth per rev, fraction of diameter
    double m_powerMargin;           // Fraction of rated power to plan for
    double m_efficiency;            // Fraction of motor power reaching the tool
    ToolMaterialTable m_toolMaterials;

    // Sampling
    double m_maxDocMultiple;        // Deepest axial DOC as a multiple of diameter
    Quantity m_docStep;             // Axial DOC sample spacing
    bool m_docFromZero;             // Start the grid at zero

    // Tables
    std::vector<Machine> m_machines;
    std::vector<Tool> m_tools;
    std::vector<WorkMaterial> m_materials;

    // Helper methods for parsing
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    static std::string trim(const std::string& str);
};

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_CONFIG_H
