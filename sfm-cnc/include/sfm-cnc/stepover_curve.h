#ifndef SFM_CNC_STEPOVER_CURVE_H
#define SFM_CNC_STEPOVER_CURVE_H

#include "sfm-cnc/calculator.h"
#include "sfm-cnc/quantity.h"
#include <cstddef>
#include <iterator>
#include <vector>

namespace sfm {
namespace cnc {

/**
 * Configuration for axial depth-of-cut sampling
 */
struct DepthSampling {
    // Deepest sample as a multiple of tool diameter
    double maxDiameterMultiple = 0.0;

    // Distance between samples (length)
    Quantity step;

    // Begin the grid at zero instead of one step; the zero sample is
    // dropped by the calculator
    bool startAtZero = false;
};

/**
 * Ascending grid of axial depths, start + i * step up to and including stop.
 * Values are computed on demand; iterating again restarts from the first one.
 */
class DepthGrid {
public:
    class const_iterator {
    public:
        typedef std::input_iterator_tag iterator_category;
        typedef Quantity value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const Quantity* pointer;
        typedef Quantity reference;

        const_iterator() : m_grid(nullptr), m_index(0) {}
        const_iterator(const DepthGrid* grid, size_t index) : m_grid(grid), m_index(index) {}

        Quantity operator*() const { return (*m_grid)[m_index]; }

        const_iterator& operator++() {
            ++m_index;
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++m_index;
            return previous;
        }

        bool operator==(const const_iterator& other) const {
            return m_grid == other.m_grid && m_index == other.m_index;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const DepthGrid* m_grid;
        size_t m_index;
    };

    /**
     * @param start First depth
     * @param stop Last depth (included when it falls on the grid)
     * @param step Spacing, must be a positive length
     * @throws DimensionMismatch if an argument is not a length
     * @throws InvalidSamplingSpec if step is not positive
     *
     * The grid is empty when stop < start.
     */
    DepthGrid(const Quantity& start, const Quantity& stop, const Quantity& step);

    size_t size() const { return m_count; }
    bool empty() const { return m_count == 0; }

    // Depth at index, in the step's unit
    Quantity operator[](size_t index) const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, m_count); }

    std::vector<Quantity> toVector() const;

private:
    Quantity m_start;
    Quantity m_step;
    size_t m_count;
};

/**
 * Builds the axial depth grid for a tool and runs the calculator over it
 */
class StepoverCurveGenerator {
public:
    /**
     * @param calculator Calculator to evaluate each triple with
     * @param sampling Depth sampling parameters
     * @throws DimensionMismatch if the step is not a length
     * @throws InvalidSamplingSpec if step or ceiling multiple is not positive
     */
    StepoverCurveGenerator(const CuttingCalculator& calculator, const DepthSampling& sampling);

    const CuttingCalculator& getCalculator() const { return m_calculator; }
    const DepthSampling& getSampling() const { return m_sampling; }

    /**
     * Depth grid for a tool: from one step (or zero) to maxDiameterMultiple x diameter
     * @throws DimensionMismatch, InvalidToolGeometry on a malformed tool
     */
    DepthGrid depthGrid(const Tool& tool) const;

    // Cutting result with stepover samples over the tool's depth grid
    CuttingResult generate(const Machine& machine, const Tool& tool,
                           const WorkMaterial& material) const;

private:
    CuttingCalculator m_calculator;
    DepthSampling m_sampling;
};

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_STEPOVER_CURVE_H
