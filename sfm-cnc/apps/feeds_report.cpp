#include "sfm-cnc/config.h"
#include "sfm-cnc/report.h"
#include "sfm-cnc/units.h"
#include "sfm-cnc/utils.h"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace sfm::cnc;

namespace {

// Axial depths of the summary columns, as multiples of the tool diameter
const double kSummaryDepths[] = {0.25, 0.5, 1.0, 1.5};

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>         Configuration file (default: sfm-cnc.cfg)" << std::endl;
    std::cout << "  --machine <name>        Only report this machine" << std::endl;
    std::cout << "  --tool <label>          Only report this tool" << std::endl;
    std::cout << "  --material <name>       Only report this work material" << std::endl;
    std::cout << "  --units <units>         Report units [in, mm] (default: from config)" << std::endl;
    std::cout << "  --csv <dir>             Write one CSV file per machine into <dir>" << std::endl;
    std::cout << "  --summary-only          Print speeds and feeds without stepover columns" << std::endl;
}

template <typename T, typename NameFn>
std::vector<T> filterByName(const std::vector<T>& records, const std::string& wanted, NameFn nameOf) {
    if (wanted.empty()) {
        return records;
    }
    std::vector<T> result;
    for (const auto& record : records) {
        if (nameOf(record) == wanted) {
            result.push_back(record);
        }
    }
    return result;
}

std::string describeSpindle(const SpindleRange& spindle) {
    if (spindle.isStepped()) {
        return std::to_string(spindle.getSpeeds().size()) + " steps up to " +
               spindle.getMaxSpeed().toString(0);
    }
    return "variable up to " + spindle.getMaxSpeed().toString(0);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "sfm-cnc.cfg";
    std::string machineFilter;
    std::string toolFilter;
    std::string materialFilter;
    std::string unitsOverride;
    std::string csvDirectory;
    bool summaryOnly = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        }
        else if (arg == "--machine" && i + 1 < argc) {
            machineFilter = argv[++i];
        }
        else if (arg == "--tool" && i + 1 < argc) {
            toolFilter = argv[++i];
        }
        else if (arg == "--material" && i + 1 < argc) {
            materialFilter = argv[++i];
        }
        else if (arg == "--units" && i + 1 < argc) {
            unitsOverride = argv[++i];
        }
        else if (arg == "--csv" && i + 1 < argc) {
            csvDirectory = argv[++i];
        }
        else if (arg == "--summary-only") {
            summaryOnly = true;
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Load configuration, or fall back to the built-in tables
    FeedsConfig config;
    if (FeedsConfig::isFirstRun(configFile)) {
        std::cout << "No configuration file found at " << configFile
                  << ", using the default tables." << std::endl;
    } else if (!config.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load configuration from: " << configFile << std::endl;
        return 1;
    }

    if (!unitsOverride.empty()) {
        if (unitsOverride != "in" && unitsOverride != "mm") {
            std::cerr << "Error: Units must be 'in' or 'mm', got '" << unitsOverride << "'" << std::endl;
            return 1;
        }
        config.setUnitsFromString(unitsOverride);
    }

    std::vector<Machine> machines = filterByName(config.getMachines(), machineFilter,
                                                 [](const Machine& m) { return m.name; });
    std::vector<Tool> tools = filterByName(config.getTools(), toolFilter,
                                           [](const Tool& t) { return t.getLabel(); });
    std::vector<WorkMaterial> materials = filterByName(config.getMaterials(), materialFilter,
                                                       [](const WorkMaterial& m) { return m.name; });

    if (machines.empty() || tools.empty() || materials.empty()) {
        std::cerr << "Error: Nothing to report (" << machines.size() << " machines, "
                  << tools.size() << " tools, " << materials.size() << " materials selected)."
                  << std::endl;
        return 1;
    }

    const Unit& primary = config.getPrimaryLengthUnit();
    const Unit& secondary = config.getSecondaryLengthUnit();
    const Unit& feedPrimary = Utils::feedUnitFor(primary);
    const Unit& feedSecondary = Utils::feedUnitFor(secondary);
    const Unit& rateUnit = Utils::removalRateUnitFor(primary);

    try {
        CuttingCalculator calculator(config.getCalculatorSettings());
        StepoverCurveGenerator generator(calculator, config.getDepthSampling());
        ReportBuilder builder(generator);

        ReportBundle bundle = builder.build(machines, tools, materials);

        std::cout << "\nEvaluated " << bundle.size() << " combinations ("
                  << machines.size() << " machines x " << tools.size() << " tools x "
                  << materials.size() << " materials)" << std::endl;

        for (const auto& machine : machines) {
            Quantity targetPower = calculator.targetPower(machine);

            std::cout << "\n====================================" << std::endl;
            std::cout << machine.name << std::endl;
            std::cout << "====================================" << std::endl;
            std::cout << "  Power: " << machine.ratedPower.toString(1)
                      << " rated, " << targetPower.toString(2) << " at the cutter" << std::endl;
            std::cout << "  Feed limit: " << Utils::formatDual(machine.maxFeedRate, feedPrimary, feedSecondary, 1, 0)
                      << " " << feedPrimary.getSymbol() << " [" << feedSecondary.getSymbol() << "]" << std::endl;
            std::cout << "  Spindle: " << describeSpindle(machine.spindle) << std::endl;

            for (const auto& toolLabel : bundle.getToolLabels(machine.name)) {
                std::vector<const ReportEntry*> group = bundle.getGroup(machine.name, toolLabel);
                if (group.empty()) {
                    continue;
                }
                const Tool& tool = tools[group.front()->toolIndex];

                std::cout << "\n  " << toolLabel << " ("
                          << Utils::formatDual(tool.diameter, primary, secondary, 4, 2) << " "
                          << primary.getSymbol() << " [" << secondary.getSymbol() << "])" << std::endl;

                std::cout << "    " << std::left << std::setw(24) << "Material"
                          << std::right << std::setw(7) << "RPM"
                          << std::setw(20) << ("Feed " + feedPrimary.getSymbol())
                          << std::setw(12) << ("MRR " + rateUnit.getSymbol());
                if (!summaryOnly) {
                    for (double multiple : kSummaryDepths) {
                        std::cout << std::setw(9) << (Utils::formatNumber(multiple, 2) + "D");
                    }
                }
                std::cout << std::endl;

                for (const ReportEntry* entry : group) {
                    const CuttingResult& result = entry->result;

                    std::string rpm = Utils::formatNumber(result.spindleSpeed.in(units::revolutionPerMinute()), 0);
                    std::string feed = Utils::formatDual(result.feedRate, feedPrimary, feedSecondary, 2, 0);
                    if (result.feedLimited) {
                        feed += "*";
                    }

                    std::cout << "    " << std::left << std::setw(24) << entry->key.material
                              << std::right << std::setw(7) << rpm
                              << std::setw(20) << feed
                              << std::setw(12) << Utils::formatNumber(result.removalRate.in(rateUnit), 3);

                    if (!summaryOnly) {
                        for (double multiple : kSummaryDepths) {
                            std::vector<Quantity> depth(1, tool.diameter * multiple);
                            std::vector<StepoverSample> samples = CuttingCalculator::stepoverCurve(
                                result.removalRate, result.feedRate, tool.diameter, depth);
                            std::string cell = samples.empty()
                                                   ? "-"
                                                   : Utils::formatNumber(samples.front().stepoverPercent, 1) + "%";
                            std::cout << std::setw(9) << cell;
                        }
                    }
                    std::cout << std::endl;
                }
            }

            if (!csvDirectory.empty()) {
                std::string csvFile = Utils::getCSVFilename(csvDirectory, machine.name);
                std::cout << "\nSaving stepover curves to: " << csvFile << std::endl;
                if (!Utils::saveReportToCSV(bundle, machine.name, csvFile, primary, secondary)) {
                    return 1;
                }
            }
        }

        std::cout << "\n* feed limited by the machine" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
