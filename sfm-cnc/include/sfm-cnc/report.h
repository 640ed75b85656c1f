#ifndef SFM_CNC_REPORT_H
#define SFM_CNC_REPORT_H

#include "sfm-cnc/calculator.h"
#include "sfm-cnc/machine.h"
#include "sfm-cnc/stepover_curve.h"
#include "sfm-cnc/tooling.h"
#include <map>
#include <string>
#include <vector>

namespace sfm {
namespace cnc {

/**
 * Identifies one (machine, tool, material) combination by name
 */
struct ReportKey {
    std::string machine;
    std::string tool;               // Tool::getLabel()
    std::string material;

    ReportKey() = default;
    ReportKey(const std::string& machine, const std::string& tool, const std::string& material)
        : machine(machine), tool(tool), material(material) {}

    bool operator<(const ReportKey& other) const;
    bool operator==(const ReportKey& other) const;
};

struct ReportEntry {
    ReportKey key;
    size_t machineIndex = 0;        // Position in the machine list the bundle was built from
    size_t toolIndex = 0;
    size_t materialIndex = 0;
    CuttingResult result;
};

/**
 * Results for a set of combinations, in machine, tool, material order
 */
class ReportBundle {
public:
    /**
     * Append an entry
     * @throws DuplicateReportKey if the key is already present
     */
    void add(const ReportEntry& entry);

    const std::vector<ReportEntry>& getEntries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Result for a key, or nullptr if absent
    const CuttingResult* find(const ReportKey& key) const;

    // Entries for one machine and tool, in material order (one chart page)
    std::vector<const ReportEntry*> getGroup(const std::string& machine,
                                             const std::string& tool) const;

    // Machine names in the order they first appear
    std::vector<std::string> getMachineNames() const;

    // Tool labels used with a machine, in the order they first appear
    std::vector<std::string> getToolLabels(const std::string& machine) const;

private:
    std::vector<ReportEntry> m_entries;
    std::map<ReportKey, size_t> m_index;
};

/**
 * Runs the stepover curve generator over every combination
 */
class ReportBuilder {
public:
    explicit ReportBuilder(const StepoverCurveGenerator& generator);

    /**
     * Evaluate machines x tools x materials.
     *
     * Every record is validated before the first combination is computed,
     * so a malformed table fails without partial output.
     *
     * @throws DimensionMismatch, InvalidToolGeometry, InvalidMaterialSpec,
     *         InvalidMachineSpec, UnknownToolMaterial, DuplicateReportKey
     */
    ReportBundle build(const std::vector<Machine>& machines,
                       const std::vector<Tool>& tools,
                       const std::vector<WorkMaterial>& materials) const;

private:
    StepoverCurveGenerator m_generator;
};

} // namespace cnc
} // namespace sfm

#endif // SFM_CNC_REPORT_H
