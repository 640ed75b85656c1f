#include "sfm-cnc/stepover_curve.h"
#include "sfm-cnc/errors.h"

#include <cmath>
#include <sstream>

namespace sfm {
namespace cnc {

namespace {

// Absorbs rounding when stop lies exactly on the grid
const double kGridTolerance = 1e-9;

// Upper bound on the number of depth samples in one grid
const double kMaxGridPoints = 1e7;

} // namespace

DepthGrid::DepthGrid(const Quantity& start, const Quantity& stop, const Quantity& step)
    : m_start(0.0, step.unit()), m_step(step), m_count(0) {
    requireDimension(start, Dimension::lengthDim(), "Depth grid start");
    requireDimension(stop, Dimension::lengthDim(), "Depth grid stop");
    requireDimension(step, Dimension::lengthDim(), "Depth grid step");

    if (!step.isFinite() || step.magnitude() <= 0.0) {
        throw InvalidSamplingSpec("Depth step must be positive, got " + step.toString());
    }
    if (!start.isFinite() || !stop.isFinite()) {
        throw InvalidSamplingSpec("Depth grid bounds must be finite");
    }

    m_start = start.convertTo(step.unit());
    double span = stop.in(step.unit()) - m_start.magnitude();
    if (span >= 0.0) {
        double steps = std::floor(span / step.magnitude() + kGridTolerance);
        if (!std::isfinite(steps) || steps >= kMaxGridPoints) {
            std::ostringstream ss;
            ss << "Depth grid from " << start.toString() << " to " << stop.toString()
               << " in steps of " << step.toString() << " exceeds "
               << static_cast<long>(kMaxGridPoints) << " points";
            throw InvalidSamplingSpec(ss.str());
        }
        m_count = static_cast<size_t>(steps) + 1;
    }
}

Quantity DepthGrid::operator[](size_t index) const {
    double value = m_start.magnitude() + static_cast<double>(index) * m_step.magnitude();
    return Quantity(value, m_step.unit());
}

std::vector<Quantity> DepthGrid::toVector() const {
    return std::vector<Quantity>(begin(), end());
}

StepoverCurveGenerator::StepoverCurveGenerator(const CuttingCalculator& calculator,
                                               const DepthSampling& sampling)
    : m_calculator(calculator), m_sampling(sampling) {
    requireDimension(m_sampling.step, Dimension::lengthDim(), "Depth step");

    if (!m_sampling.step.isFinite() || m_sampling.step.magnitude() <= 0.0) {
        throw InvalidSamplingSpec("Depth step must be positive, got " +
                                  m_sampling.step.toString());
    }
    if (!std::isfinite(m_sampling.maxDiameterMultiple) || m_sampling.maxDiameterMultiple <= 0.0) {
        std::ostringstream ss;
        ss << "Maximum depth multiple must be positive, got " << m_sampling.maxDiameterMultiple;
        throw InvalidSamplingSpec(ss.str());
    }
}

DepthGrid StepoverCurveGenerator::depthGrid(const Tool& tool) const {
    validateTool(tool);

    Quantity stop = tool.diameter * m_sampling.maxDiameterMultiple;
    Quantity start = m_sampling.startAtZero ? Quantity(0.0, m_sampling.step.unit())
                                            : m_sampling.step;
    return DepthGrid(start, stop, m_sampling.step);
}

CuttingResult StepoverCurveGenerator::generate(const Machine& machine, const Tool& tool,
                                               const WorkMaterial& material) const {
    DepthGrid grid = depthGrid(tool);
    return m_calculator.calculate(machine, tool, material, grid.toVector());
}

} // namespace cnc
} // namespace sfm
