#ifndef SFM_CNC_ERRORS_H
#define SFM_CNC_ERRORS_H

#include <stdexcept>
#include <string>

namespace sfm {
namespace cnc {

/**
 * Base class for every error raised by the cutting parameter engine
 */
class CalculationError : public std::runtime_error {
public:
    explicit CalculationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Quantity arithmetic or conversion across incompatible dimensions
 */
class DimensionMismatch : public CalculationError {
public:
    explicit DimensionMismatch(const std::string& message)
        : CalculationError(message) {}
};

// Tool diameter or tooth count is not strictly positive
class InvalidToolGeometry : public CalculationError {
public:
    explicit InvalidToolGeometry(const std::string& message)
        : CalculationError(message) {}
};

// Work material surface speed or specific cutting power is not strictly positive
class InvalidMaterialSpec : public CalculationError {
public:
    explicit InvalidMaterialSpec(const std::string& message)
        : CalculationError(message) {}
};

// Machine power, feed limit or spindle capability is malformed
class InvalidMachineSpec : public CalculationError {
public:
    explicit InvalidMachineSpec(const std::string& message)
        : CalculationError(message) {}
};

// Depth-of-cut sampling step or ceiling is malformed
class InvalidSamplingSpec : public CalculationError {
public:
    explicit InvalidSamplingSpec(const std::string& message)
        : CalculationError(message) {}
};

// Chip load, safety margin, efficiency or multiplier out of range
class InvalidCalculatorSettings : public CalculationError {
public:
    explicit InvalidCalculatorSettings(const std::string& message)
        : CalculationError(message) {}
};

// Tool material class missing from the surface speed multiplier table
class UnknownToolMaterial : public CalculationError {
public:
    explicit UnknownToolMaterial(const std::string& message)
        : CalculationError(message) {}
};

// Two report entries would share the same (machine, tool, material) key
class DuplicateReportKey : public CalculationError {
public:
    explicit DuplicateReportKey(const std::string& message)
        : CalculationError(message) {}
};

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_ERRORS_H
