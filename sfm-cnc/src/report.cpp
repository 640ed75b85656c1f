#include "sfm-cnc/report.h"
#include "sfm-cnc/errors.h"

#include <algorithm>
#include <set>

namespace sfm {
namespace cnc {

namespace {

template <typename T, typename NameFn>
void requireUniqueNames(const std::vector<T>& records, const char* kind, NameFn nameOf) {
    std::set<std::string> seen;
    for (const auto& record : records) {
        std::string name = nameOf(record);
        if (!seen.insert(name).second) {
            throw DuplicateReportKey(std::string("Duplicate ") + kind + " '" + name + "'");
        }
    }
}

} // namespace

bool ReportKey::operator<(const ReportKey& other) const {
    if (machine != other.machine) return machine < other.machine;
    if (tool != other.tool) return tool < other.tool;
    return material < other.material;
}

bool ReportKey::operator==(const ReportKey& other) const {
    return machine == other.machine && tool == other.tool && material == other.material;
}

void ReportBundle::add(const ReportEntry& entry) {
    if (m_index.count(entry.key) != 0) {
        throw DuplicateReportKey("Duplicate report entry: " + entry.key.machine + " / " +
                                 entry.key.tool + " / " + entry.key.material);
    }
    m_index[entry.key] = m_entries.size();
    m_entries.push_back(entry);
}

const CuttingResult* ReportBundle::find(const ReportKey& key) const {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_entries[it->second].result;
}

std::vector<const ReportEntry*> ReportBundle::getGroup(const std::string& machine,
                                                       const std::string& tool) const {
    std::vector<const ReportEntry*> group;
    for (const auto& entry : m_entries) {
        if (entry.key.machine == machine && entry.key.tool == tool) {
            group.push_back(&entry);
        }
    }
    return group;
}

std::vector<std::string> ReportBundle::getMachineNames() const {
    std::vector<std::string> names;
    for (const auto& entry : m_entries) {
        if (std::find(names.begin(), names.end(), entry.key.machine) == names.end()) {
            names.push_back(entry.key.machine);
        }
    }
    return names;
}

std::vector<std::string> ReportBundle::getToolLabels(const std::string& machine) const {
    std::vector<std::string> labels;
    for (const auto& entry : m_entries) {
        if (entry.key.machine != machine) {
            continue;
        }
        if (std::find(labels.begin(), labels.end(), entry.key.tool) == labels.end()) {
            labels.push_back(entry.key.tool);
        }
    }
    return labels;
}

ReportBuilder::ReportBuilder(const StepoverCurveGenerator& generator)
    : m_generator(generator) {
}

ReportBundle ReportBuilder::build(const std::vector<Machine>& machines,
                                  const std::vector<Tool>& tools,
                                  const std::vector<WorkMaterial>& materials) const {
    const ToolMaterialTable& multipliers =
        m_generator.getCalculator().getSettings().surfaceSpeedMultipliers;

    for (const auto& machine : machines) {
        validateMachine(machine);
    }
    for (const auto& tool : tools) {
        validateTool(tool);
        lookupSurfaceSpeedMultiplier(multipliers, tool);
    }
    for (const auto& material : materials) {
        validateMaterial(material);
    }

    requireUniqueNames(machines, "machine", [](const Machine& m) { return m.name; });
    requireUniqueNames(tools, "tool", [](const Tool& t) { return t.getLabel(); });
    requireUniqueNames(materials, "material", [](const WorkMaterial& m) { return m.name; });

    ReportBundle bundle;
    for (size_t m = 0; m < machines.size(); m++) {
        for (size_t t = 0; t < tools.size(); t++) {
            for (size_t k = 0; k < materials.size(); k++) {
                ReportEntry entry;
                entry.key = ReportKey(machines[m].name, tools[t].getLabel(), materials[k].name);
                entry.machineIndex = m;
                entry.toolIndex = t;
                entry.materialIndex = k;
                entry.result = m_generator.generate(machines[m], tools[t], materials[k]);
                bundle.add(entry);
            }
        }
    }

    return bundle;
}

} // namespace cnc
} // namespace sfm
