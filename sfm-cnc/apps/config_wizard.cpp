#include "sfm-cnc/config.h"
#include "sfm-cnc/errors.h"
#include "sfm-cnc/units.h"
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sfm::cnc;

// Helper function to get numeric input with validation
template<typename T>
T getNumericInput(const std::string& prompt, T minValue, T maxValue) {
    T value;
    while (true) {
        std::cout << prompt;

        if (std::cin >> value) {
            if (value >= minValue && value <= maxValue) {
                break;
            } else {
                std::cout << "Error: Value must be between " << minValue << " and " << maxValue << std::endl;
            }
        } else {
            if (std::cin.eof()) {
                throw std::runtime_error("Input ended unexpectedly");
            }
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cout << "Error: Invalid input. Please enter a number." << std::endl;
        }
    }

    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return value;
}

// Helper function to get yes/no input
bool getYesNoInput(const std::string& prompt, bool defaultValue) {
    std::string input;
    std::string defaultStr = defaultValue ? "Y/n" : "y/N";

    std::cout << prompt << " [" << defaultStr << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return (input[0] == 'Y' || input[0] == 'y');
}

// Helper function to get string input with default value
std::string getStringInput(const std::string& prompt, const std::string& defaultValue) {
    std::string input;

    std::cout << prompt << " [" << defaultValue << "]: ";
    std::getline(std::cin, input);

    if (input.empty()) {
        return defaultValue;
    }

    return input;
}

// Helper function to get a quantity such as "3 hp" with a dimension check
Quantity getQuantityInput(const std::string& prompt, const std::string& defaultValue,
                          const Dimension& dimension) {
    while (true) {
        std::string text = getStringInput(prompt, defaultValue);

        Quantity value;
        std::string error;
        if (!units::parseQuantity(text, value, &error)) {
            std::cout << "Error: " << error << std::endl;
            continue;
        }
        if (value.dimension() != dimension) {
            std::cout << "Error: Expected a quantity of dimension " << dimension.toString()
                      << ", got " << value.dimension().toString() << std::endl;
            continue;
        }
        if (value.magnitude() <= 0.0) {
            std::cout << "Error: Value must be positive." << std::endl;
            continue;
        }
        return value;
    }
}

void addMachine(FeedsConfig& config) {
    std::cout << "\n--- New Machine ---" << std::endl;
    std::string name = getStringInput("Machine name", "My Mill");
    Quantity power = getQuantityInput("Spindle motor power", "1 hp", Dimension::power());
    Quantity maxFeed = getQuantityInput("Maximum feed rate", "30 in/min", Dimension::velocity());

    SpindleRange spindle;
    if (getYesNoInput("Does the spindle have fixed speed steps (belts or gears)?", false)) {
        while (true) {
            std::string text = getStringInput("Speed steps", "80, 135, 210, 325, 660, 1115, 1750, 2720 rpm");
            std::vector<Quantity> speeds;
            std::string error;
            if (!units::parseQuantityList(text, speeds, &error)) {
                std::cout << "Error: " << error << std::endl;
                continue;
            }
            try {
                spindle = SpindleRange::stepped(speeds);
                break;
            } catch (const CalculationError& e) {
                std::cout << "Error: " << e.what() << std::endl;
            }
        }
    } else {
        spindle = SpindleRange::variable(
            getQuantityInput("Maximum spindle speed", "3000 rpm", Dimension::angularVelocity()));
    }

    config.addMachine(Machine(name, power, maxFeed, spindle));
}

void addTool(FeedsConfig& config) {
    std::cout << "\n--- New End Mill ---" << std::endl;
    Quantity diameter = getQuantityInput("Diameter", "0.5 in", Dimension::lengthDim());
    int teeth = getNumericInput<int>("Number of flutes: ", 1, 16);

    std::string defaultMaterial = config.getToolMaterials().empty()
                                      ? "HSS/Cobalt"
                                      : config.getToolMaterials().begin()->first;
    std::string material = getStringInput("Tool material", defaultMaterial);
    if (config.getToolMaterials().count(material) == 0) {
        std::cout << "Tool material '" << material << "' is not in the table yet." << std::endl;
        config.setToolMaterialMultiplier(
            material, getNumericInput<double>("Surface speed multiplier: ", 0.1, 10.0));
    }

    std::string name = getStringInput("Display name (empty for automatic)", "");
    config.addTool(Tool(diameter, teeth, material, name));
}

void addMaterial(FeedsConfig& config) {
    std::cout << "\n--- New Work Material ---" << std::endl;
    std::string name = getStringInput("Material name", "6061 Aluminum");
    Quantity surfaceSpeed = getQuantityInput("Surface speed for HSS", "300 ft/min",
                                             Dimension::velocity());
    Quantity unitPower = getQuantityInput("Specific cutting power", "0.4 hp/(in^3/min)",
                                          Dimension::powerDensity());
    config.addMaterial(WorkMaterial(name, surfaceSpeed, unitPower));
}

void runConfigWizard(FeedsConfig& config) {
    std::cout << "\n====================================" << std::endl;
    std::cout << "SFM CNC Configuration Wizard" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "This wizard will help you set up your machines, tools and materials." << std::endl;
    std::cout << "Press Enter to accept default values shown in brackets." << std::endl;
    std::cout << "------------------------------------" << std::endl;

    std::string unitStr = getStringInput("Select report units (mm/in)", config.getUnitsString());
    config.setUnitsFromString(unitStr);

    // Calculation constants
    std::cout << "\n--- Calculation Settings ---" << std::endl;
    if (getYesNoInput("Change chip load, power margin or efficiency?", false)) {
        config.setChipLoad(getNumericInput<double>(
            "Chip load per tooth (fraction of diameter): ", 0.0001, 0.1));
        config.setPowerMargin(getNumericInput<double>(
            "Fraction of rated power to use (0-1): ", 0.01, 1.0));
        config.setEfficiency(getNumericInput<double>(
            "Drive efficiency (0-1): ", 0.01, 1.0));
    }

    while (getYesNoInput("Add a machine?", false)) {
        addMachine(config);
    }
    while (getYesNoInput("Add an end mill?", false)) {
        addTool(config);
    }
    while (getYesNoInput("Add a work material?", false)) {
        addMaterial(config);
    }

    std::cout << "\nConfiguration complete!" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configFile = "sfm-cnc.cfg";

    // Check for custom config file path
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
    }

    FeedsConfig config;

    try {
        // Check if this is the first run
        bool firstRun = FeedsConfig::isFirstRun(configFile);

        if (firstRun) {
            std::cout << "No configuration file found. Starting from the default tables..." << std::endl;
            runConfigWizard(config);

            // Save the configuration
            if (config.saveToFile(configFile)) {
                std::cout << "Configuration saved to: " << configFile << std::endl;
            } else {
                std::cerr << "Error: Failed to save configuration." << std::endl;
                return 1;
            }
        } else {
            // Load existing configuration
            if (!config.loadFromFile(configFile)) {
                std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
                return 1;
            }

            std::cout << "Configuration loaded from: " << configFile << std::endl;

            // Ask if the user wants to modify the configuration
            if (getYesNoInput("Would you like to modify the configuration?", false)) {
                runConfigWizard(config);

                // Save the updated configuration
                if (config.saveToFile(configFile)) {
                    std::cout << "Configuration updated and saved to: " << configFile << std::endl;
                } else {
                    std::cerr << "Error: Failed to save configuration." << std::endl;
                    return 1;
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Display the current configuration
    std::cout << "\n====================================" << std::endl;
    std::cout << "Current Configuration" << std::endl;
    std::cout << "====================================" << std::endl;
    std::cout << "Settings:" << std::endl;
    std::cout << "  Report Units: " << config.getUnitsString() << std::endl;
    std::cout << "  Chip Load: " << config.getChipLoad() << " x diameter" << std::endl;
    std::cout << "  Power Margin: " << config.getPowerMargin() * 100.0 << "%" << std::endl;
    std::cout << "  Efficiency: " << config.getEfficiency() * 100.0 << "%" << std::endl;
    std::cout << "  Depth of Cut: " << config.getDocStep().toString() << " steps up to "
              << config.getMaxDocMultiple() << " x diameter" << std::endl;
    std::cout << "Tool Materials:" << std::endl;
    for (const auto& entry : config.getToolMaterials()) {
        std::cout << "  " << entry.first << ": " << entry.second << " x SFM" << std::endl;
    }
    std::cout << "Machines:" << std::endl;
    for (const auto& machine : config.getMachines()) {
        std::cout << "  " << machine.name << ": " << machine.ratedPower.toString(1) << ", "
                  << machine.maxFeedRate.toString(0) << ", ";
        if (machine.spindle.isStepped()) {
            std::cout << machine.spindle.getSpeeds().size() << " speed steps up to ";
        } else {
            std::cout << "variable up to ";
        }
        std::cout << machine.spindle.getMaxSpeed().toString(0) << std::endl;
    }
    std::cout << "Tools:" << std::endl;
    for (const auto& tool : config.getTools()) {
        std::cout << "  " << tool.getLabel() << std::endl;
    }
    std::cout << "Materials:" << std::endl;
    for (const auto& material : config.getMaterials()) {
        std::cout << "  " << material.name << ": " << material.surfaceSpeed.toString(0) << ", "
                  << material.unitPower.toString(2) << std::endl;
    }

    return 0;
}
