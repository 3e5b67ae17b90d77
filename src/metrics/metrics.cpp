#include "metrics.hpp"

#include <algorithm>

#include "../errors/simulation_errors.hpp"

ProcessMetrics MetricsCalculator::processMetrics(const PCB &pcb) {
    if (!pcb.finished() || !pcb.completionTime || !pcb.firstRunTime) {
        throw IncompleteSimulationError(1);
    }

    ProcessMetrics m;
    m.id = pcb.id();
    m.priority = pcb.descriptor.priority;
    m.arrivalTime = pcb.descriptor.arrivalTime;
    m.burstTime = pcb.descriptor.burstTime;
    m.firstRunTime = *pcb.firstRunTime;
    m.completionTime = *pcb.completionTime;

    m.turnaroundTime = m.completionTime - m.arrivalTime;
    m.waitingTime = m.turnaroundTime - m.burstTime;
    m.responseTime = m.firstRunTime - m.arrivalTime;

    m.dispatches = pcb.dispatches;
    m.preemptions = pcb.preemptions;
    m.coresAssigned = pcb.coresAssigned;

    // Espera negativa significa um processo que terminou antes de executar todo o burst
    if (m.waitingTime < 0 || m.responseTime < 0) {
        throw InvariantViolation("métricas negativas para o processo " + std::to_string(m.id));
    }
    return m;
}

SimulationReport MetricsCalculator::compute(SchedulingPolicy policy,
                                            const std::vector<PCB> &processes,
                                            const SimulationStats &stats,
                                            const std::vector<ExecutionSlice> &timeline) {
    const auto pending = std::count_if(processes.begin(), processes.end(),
                                       [](const PCB &p) { return !p.finished(); });
    if (pending > 0) {
        throw IncompleteSimulationError(static_cast<int>(pending));
    }

    SimulationReport report;
    report.policy = policy;
    report.stats = stats;
    report.timeline = timeline;

    Tick totalWaiting = 0;
    Tick totalTurnaround = 0;
    Tick totalResponse = 0;

    report.processes.reserve(processes.size());
    for (const auto &pcb : processes) {
        ProcessMetrics m = processMetrics(pcb);
        totalWaiting += m.waitingTime;
        totalTurnaround += m.turnaroundTime;
        totalResponse += m.responseTime;
        report.processes.push_back(std::move(m));
    }
    std::sort(report.processes.begin(), report.processes.end(),
              [](const ProcessMetrics &a, const ProcessMetrics &b) { return a.id < b.id; });

    // Sem processos ou sem ticks, todas as médias ficam em zero
    const size_t n = report.processes.size();
    if (n > 0) {
        report.averageWaitingTime = static_cast<double>(totalWaiting) / n;
        report.averageTurnaroundTime = static_cast<double>(totalTurnaround) / n;
        report.averageResponseTime = static_cast<double>(totalResponse) / n;
    }

    if (stats.totalTicks > 0) {
        const double capacity = static_cast<double>(std::max(1, stats.cores)) * static_cast<double>(stats.totalTicks);
        report.cpuUtilization = (capacity - static_cast<double>(stats.idleTicks)) / capacity;
        report.throughput = static_cast<double>(n) / static_cast<double>(stats.totalTicks);
    }

    return report;
}
