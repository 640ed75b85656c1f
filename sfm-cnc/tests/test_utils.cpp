// SFM CNC - Utils Tests

#include <gtest/gtest.h>

#include "sfm-cnc/errors.h"
#include "sfm-cnc/tooling.h"
#include "sfm-cnc/units.h"
#include "sfm-cnc/utils.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace sfm::cnc;

// ============================================================================
// Formatting
// ============================================================================

TEST(Utils, FormatNumber) {
    EXPECT_EQ(Utils::formatNumber(1527.887, 1), "1527.9");
    EXPECT_EQ(Utils::formatNumber(0.5), "0.5000");
    EXPECT_EQ(Utils::formatNumber(1750.0, 0), "1750");
}

TEST(Utils, FormatFraction) {
    EXPECT_EQ(Utils::formatFraction(2.0), "2");
    EXPECT_EQ(Utils::formatFraction(0.75), "3/4");
    EXPECT_EQ(Utils::formatFraction(0.625), "5/8");
    EXPECT_EQ(Utils::formatFraction(0.375), "3/8");
    EXPECT_EQ(Utils::formatFraction(0.1875), "3/16");
    EXPECT_EQ(Utils::formatFraction(1.25), "5/4");
    EXPECT_EQ(Utils::formatFraction(-0.5), "-1/2");
}

TEST(Utils, FormatFractionApproximates) {
    EXPECT_EQ(Utils::formatFraction(0.333, 8), "1/3");
    EXPECT_EQ(Utils::formatFraction(0.2, 4), "1/4");
    EXPECT_EQ(Utils::formatFraction(0.001), "0");
}

TEST(Utils, FormatFractionHugeValue) {
    EXPECT_EQ(Utils::formatFraction(1e300), Utils::formatNumber(1e300, 0));
    EXPECT_EQ(Utils::formatFraction(-1e20), "-100000000000000000000");

    Tool tool(Quantity(1e20, units::inch()), 2, "Carbide");
    EXPECT_EQ(tool.getLabel(), "100000000000000000000\" 2 fl. Carbide");
}

TEST(Utils, FormatDual) {
    Quantity d(0.5, units::inch());
    EXPECT_EQ(Utils::formatDual(d, units::inch(), units::millimeter()), "0.500 [12.70]");
    EXPECT_EQ(Utils::formatDual(d, units::millimeter(), units::inch(), 1, 3), "12.7 [0.500]");
    EXPECT_THROW(Utils::formatDual(d, units::inchPerMinute(), units::millimeter()), DimensionMismatch);
}

TEST(Utils, DisplayUnitsForLength) {
    EXPECT_EQ(Utils::feedUnitFor(units::inch()), units::inchPerMinute());
    EXPECT_EQ(Utils::feedUnitFor(units::millimeter()), units::millimeterPerMinute());
    EXPECT_EQ(Utils::removalRateUnitFor(units::inch()), units::cubicInchPerMinute());
    EXPECT_EQ(Utils::removalRateUnitFor(units::millimeter()), units::cubicCentimeterPerMinute());
}

TEST(Utils, FileSuffix) {
    EXPECT_EQ(Utils::fileSuffix("Sharp LMV CNC Mill"), "Sharp_LMV_CNC_Mill");
    EXPECT_EQ(Utils::fileSuffix("HSS/Cobalt"), "HSS-Cobalt");
}

TEST(Utils, CSVFilename) {
    EXPECT_EQ(Utils::getCSVFilename("out", "Bridgeport J-Head Mill"), "out/feeds_Bridgeport_J-Head_Mill.csv");
    EXPECT_EQ(Utils::getCSVFilename("out/", "Mill"), "out/feeds_Mill.csv");
    EXPECT_EQ(Utils::getCSVFilename("", "Mill"), "feeds_Mill.csv");
}

// ============================================================================
// CSV export
// ============================================================================

TEST(Utils, SaveReportToCSV) {
    CalculatorSettings settings;
    settings.surfaceSpeedMultipliers["HSS/Cobalt"] = 1.0;
    settings.chipLoad = 0.005;
    settings.powerMargin = 0.5;
    settings.efficiency = 0.75;

    DepthSampling sampling;
    sampling.maxDiameterMultiple = 1.0;
    sampling.step = Quantity(0.25, units::inch());

    std::vector<Machine> machines;
    machines.push_back(Machine("Sharp LMV CNC Mill", Quantity(3.0, units::horsepower()),
                               Quantity(60.0, units::inchPerMinute()),
                               SpindleRange::variable(Quantity(3000.0, units::revolutionPerMinute()))));
    machines.push_back(Machine("Other Mill", Quantity(1.0, units::horsepower()),
                               Quantity(30.0, units::inchPerMinute()),
                               SpindleRange::variable(Quantity(2000.0, units::revolutionPerMinute()))));
    std::vector<Tool> tools(1, Tool(Quantity(0.75, units::inch()), 4, "HSS/Cobalt"));
    std::vector<WorkMaterial> materials(1, WorkMaterial("Aluminum", Quantity(300, units::footPerMinute()),
                                                        Quantity(0.4, units::horsepowerPerCubicInchPerMinute())));

    ReportBuilder builder(StepoverCurveGenerator(CuttingCalculator(settings), sampling));
    ReportBundle bundle = builder.build(machines, tools, materials);

    std::string filename = ::testing::TempDir() + "sfm_cnc_report_test.csv";
    ASSERT_TRUE(Utils::saveReportToCSV(bundle, "Sharp LMV CNC Mill", filename,
                                       units::inch(), units::millimeter()));

    std::ifstream file(filename);
    ASSERT_TRUE(file.is_open());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    file.close();
    std::remove(filename.c_str());

    // Two comment lines, then depths 0.25, 0.5 and 0.75 in
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "# Speeds and feeds for Sharp LMV CNC Mill");
    EXPECT_NE(lines[1].find("feed_in/min"), std::string::npos);
    EXPECT_EQ(lines[2].find("\"3/4\"\" 4 fl. HSS/Cobalt\",\"Aluminum\",1528,22.92,2.8125,0.2500,6.3500,"), 0u);
    EXPECT_NE(lines[4].find(",0.7500,19.0500,"), std::string::npos);
    for (const auto& row : lines) {
        EXPECT_EQ(row.find("Other Mill"), std::string::npos);
    }
}

TEST(Utils, SaveReportToCSVBadPath) {
    ReportBundle bundle;
    EXPECT_FALSE(Utils::saveReportToCSV(bundle, "Mill", "/nonexistent/dir/out.csv",
                                        units::inch(), units::millimeter()));
}
