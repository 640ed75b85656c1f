#include "sfm-cnc/utils.h"
#include "sfm-cnc/units.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <iostream>

namespace sfm {
namespace cnc {

namespace {

// Quote a CSV field; tool labels carry inch marks
std::string csvField(const std::string& text) {
    std::string field = "\"";
    for (char c : text) {
        if (c == '"') {
            field += '"';
        }
        field += c;
    }
    return field + "\"";
}

} // namespace

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Utils::formatFraction(double value, int maxDenominator) {
    if (!std::isfinite(value)) {
        return formatNumber(value, 0);
    }

    bool negative = value < 0.0;
    double magnitude = std::fabs(value);

    // Too large for integer numerators
    long limit = std::numeric_limits<long>::max() / std::max(maxDenominator, 1);
    if (magnitude > static_cast<double>(limit)) {
        return formatNumber(value, 0);
    }

    // Smallest denominator wins among equally close candidates, which
    // also keeps the fraction reduced
    long bestNumerator = std::lround(magnitude);
    long bestDenominator = 1;
    double bestError = std::fabs(magnitude - static_cast<double>(bestNumerator));

    for (long denominator = 2; denominator <= maxDenominator && bestError > 1e-9; denominator++) {
        long numerator = std::lround(magnitude * static_cast<double>(denominator));
        double error = std::fabs(magnitude - static_cast<double>(numerator) / denominator);
        if (error < bestError - 1e-12) {
            bestNumerator = numerator;
            bestDenominator = denominator;
            bestError = error;
        }
    }

    std::stringstream ss;
    if (negative && bestNumerator != 0) {
        ss << "-";
    }
    ss << bestNumerator;
    if (bestDenominator != 1) {
        ss << "/" << bestDenominator;
    }
    return ss.str();
}

std::string Utils::formatDual(const Quantity& quantity, const Unit& primary,
                              const Unit& secondary, int primaryPrecision,
                              int secondaryPrecision) {
    return formatNumber(quantity.in(primary), primaryPrecision) + " [" +
           formatNumber(quantity.in(secondary), secondaryPrecision) + "]";
}

const Unit& Utils::feedUnitFor(const Unit& length) {
    if (length == units::inch()) {
        return units::inchPerMinute();
    }
    return units::millimeterPerMinute();
}

const Unit& Utils::removalRateUnitFor(const Unit& length) {
    if (length == units::inch()) {
        return units::cubicInchPerMinute();
    }
    return units::cubicCentimeterPerMinute();
}

std::string Utils::fileSuffix(const std::string& name) {
    std::string suffix = name;
    for (auto& c : suffix) {
        if (c == ' ') {
            c = '_';
        } else if (c == '/' || c == '\\') {
            c = '-';
        }
    }
    return suffix;
}

std::string Utils::getCSVFilename(const std::string& directory, const std::string& machine) {
    std::string filename = "feeds_" + fileSuffix(machine) + ".csv";
    if (directory.empty()) {
        return filename;
    }
    char last = directory[directory.length() - 1];
    if (last == '/' || last == '\\') {
        return directory + filename;
    }
    return directory + "/" + filename;
}

bool Utils::saveReportToCSV(const ReportBundle& bundle, const std::string& machine,
                            const std::string& filename, const Unit& primary,
                            const Unit& secondary) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    const Unit& feedUnit = feedUnitFor(primary);
    const Unit& rateUnit = removalRateUnitFor(primary);

    outFile << "# Speeds and feeds for " << machine << std::endl;
    outFile << "# Format: tool,material,spindle_rpm,feed_" << feedUnit.getSymbol()
            << ",mrr_" << rateUnit.getSymbol()
            << ",axial_" << primary.getSymbol() << ",axial_" << secondary.getSymbol()
            << ",radial_" << primary.getSymbol() << ",radial_" << secondary.getSymbol()
            << ",stepover_percent" << std::endl;

    for (const auto& entry : bundle.getEntries()) {
        if (entry.key.machine != machine) {
            continue;
        }

        const CuttingResult& result = entry.result;
        std::string prefix = csvField(entry.key.tool) + "," + csvField(entry.key.material) + "," +
                             formatNumber(result.spindleSpeed.in(units::revolutionPerMinute()), 0) + "," +
                             formatNumber(result.feedRate.in(feedUnit), 2) + "," +
                             formatNumber(result.removalRate.in(rateUnit), 4);

        for (const auto& sample : result.samples) {
            outFile << prefix << ","
                    << formatNumber(sample.axialDepth.in(primary), 4) << ","
                    << formatNumber(sample.axialDepth.in(secondary), 4) << ","
                    << formatNumber(sample.radialDepth.in(primary), 4) << ","
                    << formatNumber(sample.radialDepth.in(secondary), 4) << ","
                    << formatNumber(sample.stepoverPercent, 2) << std::endl;
        }
    }

    outFile.close();
    return true;
}

} // namespace cnc
} // namespace sfm
