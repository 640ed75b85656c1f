// SFM CNC - Report Bundle Tests

#include <gtest/gtest.h>

#include "sfm-cnc/errors.h"
#include "sfm-cnc/report.h"
#include "sfm-cnc/units.h"

using namespace sfm::cnc;

namespace {

StepoverCurveGenerator shopGenerator() {
    CalculatorSettings settings;
    settings.surfaceSpeedMultipliers["HSS/Cobalt"] = 1.0;
    settings.surfaceSpeedMultipliers["Carbide"] = 2.5;
    settings.chipLoad = 0.005;
    settings.powerMargin = 0.5;
    settings.efficiency = 0.75;

    DepthSampling sampling;
    sampling.maxDiameterMultiple = 1.5;
    sampling.step = Quantity(0.05, units::inch());

    return StepoverCurveGenerator(CuttingCalculator(settings), sampling);
}

std::vector<Machine> shopMachines() {
    std::vector<Quantity> steps;
    for (double s : {80.0, 135.0, 210.0, 325.0, 660.0, 1115.0, 1750.0, 2720.0}) {
        steps.push_back(Quantity(s, units::revolutionPerMinute()));
    }
    std::vector<Machine> machines;
    machines.push_back(Machine("Sharp LMV CNC Mill", Quantity(3.0, units::horsepower()),
                               Quantity(60.0, units::inchPerMinute()),
                               SpindleRange::variable(Quantity(3000.0, units::revolutionPerMinute()))));
    machines.push_back(Machine("Bridgeport J-Head Mill", Quantity(1.0, units::horsepower()),
                               Quantity(30.0, units::inchPerMinute()), SpindleRange::stepped(steps)));
    return machines;
}

std::vector<Tool> shopTools() {
    std::vector<Tool> tools;
    tools.push_back(Tool(Quantity(0.75, units::inch()), 4, "HSS/Cobalt"));
    tools.push_back(Tool(Quantity(0.375, units::inch()), 2, "Carbide"));
    return tools;
}

std::vector<WorkMaterial> shopMaterials() {
    const Unit& unitPower = units::horsepowerPerCubicInchPerMinute();
    std::vector<WorkMaterial> materials;
    materials.push_back(WorkMaterial("Aluminum", Quantity(300, units::footPerMinute()), Quantity(0.4, unitPower)));
    materials.push_back(WorkMaterial("Mild Steel", Quantity(100, units::footPerMinute()), Quantity(1.8, unitPower)));
    materials.push_back(WorkMaterial("304 Stainless", Quantity(50, units::footPerMinute()), Quantity(1.8, unitPower)));
    return materials;
}

} // namespace

// ============================================================================
// Building
// ============================================================================

TEST(ReportBuilder, OneEntryPerCombinationInOrder) {
    ReportBuilder builder(shopGenerator());
    ReportBundle bundle = builder.build(shopMachines(), shopTools(), shopMaterials());

    ASSERT_EQ(bundle.size(), 2u * 2u * 3u);

    const auto& entries = bundle.getEntries();
    EXPECT_EQ(entries[0].key, ReportKey("Sharp LMV CNC Mill", "3/4\" 4 fl. HSS/Cobalt", "Aluminum"));
    EXPECT_EQ(entries[1].key.material, "Mild Steel");
    EXPECT_EQ(entries[3].key.tool, "3/8\" 2 fl. Carbide");
    EXPECT_EQ(entries[6].key.machine, "Bridgeport J-Head Mill");
    EXPECT_EQ(entries[11].key, ReportKey("Bridgeport J-Head Mill", "3/8\" 2 fl. Carbide", "304 Stainless"));

    for (size_t i = 0; i < entries.size(); i++) {
        EXPECT_EQ(entries[i].machineIndex, i / 6);
        EXPECT_EQ(entries[i].toolIndex, (i / 3) % 2);
        EXPECT_EQ(entries[i].materialIndex, i % 3);
    }
}

TEST(ReportBuilder, MatchesDirectCalculation) {
    StepoverCurveGenerator generator = shopGenerator();
    ReportBuilder builder(generator);
    std::vector<Machine> machines = shopMachines();
    std::vector<Tool> tools = shopTools();
    std::vector<WorkMaterial> materials = shopMaterials();

    ReportBundle bundle = builder.build(machines, tools, materials);
    CuttingResult direct = generator.generate(machines[1], tools[0], materials[0]);

    const CuttingResult* found = bundle.find(ReportKey(machines[1].name, tools[0].getLabel(),
                                                       materials[0].name));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->spindleSpeed, direct.spindleSpeed);
    EXPECT_EQ(found->feedRate, direct.feedRate);
    ASSERT_EQ(found->samples.size(), direct.samples.size());
    EXPECT_DOUBLE_EQ(found->samples.back().stepoverPercent, direct.samples.back().stepoverPercent);
}

TEST(ReportBuilder, EmptyInputGivesEmptyBundle) {
    ReportBuilder builder(shopGenerator());
    ReportBundle bundle = builder.build(shopMachines(), std::vector<Tool>(), shopMaterials());
    EXPECT_TRUE(bundle.empty());
}

TEST(ReportBuilder, ValidatesBeforeComputing) {
    ReportBuilder builder(shopGenerator());
    std::vector<WorkMaterial> materials = shopMaterials();
    materials.back().unitPower = Quantity(0.0, units::horsepowerPerCubicInchPerMinute());
    EXPECT_THROW(builder.build(shopMachines(), shopTools(), materials), InvalidMaterialSpec);

    std::vector<Tool> tools = shopTools();
    tools.push_back(Tool(Quantity(0.5, units::inch()), 4, "Ceramic"));
    EXPECT_THROW(builder.build(shopMachines(), tools, shopMaterials()), UnknownToolMaterial);
}

TEST(ReportBuilder, RejectsDuplicateNames) {
    ReportBuilder builder(shopGenerator());

    std::vector<Machine> machines = shopMachines();
    machines.push_back(machines.front());
    EXPECT_THROW(builder.build(machines, shopTools(), shopMaterials()), DuplicateReportKey);

    std::vector<Tool> tools = shopTools();
    tools.push_back(tools.front());
    EXPECT_THROW(builder.build(shopMachines(), tools, shopMaterials()), DuplicateReportKey);
}

TEST(ReportBuilder, NamedToolsUseTheirName) {
    ReportBuilder builder(shopGenerator());
    std::vector<Tool> tools;
    tools.push_back(Tool(Quantity(0.5, units::inch()), 3, "Carbide", "Roughing EM"));

    ReportBundle bundle = builder.build(shopMachines(), tools, shopMaterials());
    EXPECT_EQ(bundle.getEntries().front().key.tool, "Roughing EM");
}

// ============================================================================
// Lookup
// ============================================================================

TEST(ReportBundle, FindMissingKey) {
    ReportBuilder builder(shopGenerator());
    ReportBundle bundle = builder.build(shopMachines(), shopTools(), shopMaterials());
    EXPECT_EQ(bundle.find(ReportKey("Sharp LMV CNC Mill", "3/4\" 4 fl. HSS/Cobalt", "Titanium")), nullptr);
}

TEST(ReportBundle, GroupByMachineAndTool) {
    ReportBuilder builder(shopGenerator());
    ReportBundle bundle = builder.build(shopMachines(), shopTools(), shopMaterials());

    std::vector<const ReportEntry*> group = bundle.getGroup("Bridgeport J-Head Mill", "3/8\" 2 fl. Carbide");
    ASSERT_EQ(group.size(), 3u);
    EXPECT_EQ(group[0]->key.material, "Aluminum");
    EXPECT_EQ(group[2]->key.material, "304 Stainless");
}

TEST(ReportBundle, NamesInFirstSeenOrder) {
    ReportBuilder builder(shopGenerator());
    ReportBundle bundle = builder.build(shopMachines(), shopTools(), shopMaterials());

    std::vector<std::string> machines = bundle.getMachineNames();
    ASSERT_EQ(machines.size(), 2u);
    EXPECT_EQ(machines[0], "Sharp LMV CNC Mill");
    EXPECT_EQ(machines[1], "Bridgeport J-Head Mill");

    std::vector<std::string> tools = bundle.getToolLabels("Sharp LMV CNC Mill");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0], "3/4\" 4 fl. HSS/Cobalt");
}

TEST(ReportBundle, AddRejectsDuplicateKey) {
    ReportBundle bundle;
    ReportEntry entry;
    entry.key = ReportKey("Mill", "Tool", "Steel");
    bundle.add(entry);
    EXPECT_THROW(bundle.add(entry), DuplicateReportKey);
    EXPECT_EQ(bundle.size(), 1u);
}
