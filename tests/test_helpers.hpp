#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cpu/ProcessTable.hpp"
#include "metrics/metrics.hpp"

// Entradas no formato {id, arrival, burst, priority}
inline ProcessTable makeTable(const std::vector<ProcessDescriptor> &descriptors) {
    ProcessTable table;
    for (const auto &d : descriptors) {
        table.registerProcess(d);
    }
    table.close();
    return table;
}

inline const ProcessMetrics &metricsFor(const SimulationReport &report, int id) {
    for (const auto &m : report.processes) {
        if (m.id == id) {
            return m;
        }
    }
    throw std::out_of_range("processo " + std::to_string(id) + " fora do relatório");
}

inline bool operator==(const ExecutionSlice &a, const ExecutionSlice &b) {
    return a.processId == b.processId && a.core == b.core && a.start == b.start && a.end == b.end;
}

inline std::ostream &operator<<(std::ostream &out, const ExecutionSlice &s) {
    return out << "{pid " << s.processId << ", core " << s.core << ", [" << s.start << ", " << s.end << ")}";
}

#endif // TEST_HELPERS_HPP
