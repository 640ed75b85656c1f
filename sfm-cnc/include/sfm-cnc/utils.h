#ifndef SFM_CNC_UTILS_H
#define SFM_CNC_UTILS_H

#include <string>
#include "sfm-cnc/quantity.h"
#include "sfm-cnc/report.h"

namespace sfm {
namespace cnc {

class Utils {
public:
    // Format a number with a specific precision
    static std::string formatNumber(double value, int precision = 4);

    /**
     * Format a value as the closest fraction with a bounded denominator,
     * e.g. 0.75 -> "3/4", 2.0 -> "2", 0.1875 -> "3/16"
     * @param value Value to format
     * @param maxDenominator Largest denominator to consider
     */
    static std::string formatFraction(double value, int maxDenominator = 64);

    /**
     * Format a quantity in a primary and a secondary unit, e.g. "0.500 [12.70]"
     * @throws DimensionMismatch if either unit does not match the quantity
     */
    static std::string formatDual(const Quantity& quantity, const Unit& primary,
                                  const Unit& secondary, int primaryPrecision = 3,
                                  int secondaryPrecision = 2);

    // Feed unit that goes with a display length unit (in/min or mm/min)
    static const Unit& feedUnitFor(const Unit& length);

    // Removal rate unit that goes with a display length unit (in^3/min or cm^3/min)
    static const Unit& removalRateUnitFor(const Unit& length);

    // Name usable in a filename: spaces become underscores, path separators dashes
    static std::string fileSuffix(const std::string& name);

    // Path of the CSV file holding one machine's results
    static std::string getCSVFilename(const std::string& directory, const std::string& machine);

    /**
     * Save one machine's results to a CSV file, one row per stepover sample
     * @param bundle Report bundle to read from
     * @param machine Machine name; only its entries are written
     * @param filename Output path
     * @param primary Primary display length unit
     * @param secondary Secondary display length unit
     * @return True if written successfully
     */
    static bool saveReportToCSV(const ReportBundle& bundle, const std::string& machine,
                                const std::string& filename, const Unit& primary,
                                const Unit& secondary);
};

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_UTILS_H
