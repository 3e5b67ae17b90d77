#ifndef METRICS_HPP
#define METRICS_HPP

#include <vector>

#include "../cpu/PCB.hpp"
#include "../process_scheduler/scheduler.hpp"

// Um despacho: [start, end) no core indicado
struct ExecutionSlice {
    int processId;
    int core;
    Tick start;
    Tick end;

    Tick length() const { return end - start; }
};

struct ProcessMetrics {
    int id = 0;
    int priority = 0;
    Tick arrivalTime = 0;
    Tick burstTime = 0;
    Tick firstRunTime = 0;
    Tick completionTime = 0;

    Tick turnaroundTime = 0;   // completionTime - arrivalTime
    Tick waitingTime = 0;      // turnaroundTime - burstTime
    Tick responseTime = 0;     // firstRunTime - arrivalTime

    int dispatches = 0;
    int preemptions = 0;
    std::vector<int> coresAssigned;
};

// Contabilidade do relógio ao fim da simulação
struct SimulationStats {
    Tick totalTicks = 0;
    Tick busyTicks = 0;    // ticks-core ocupados
    Tick idleTicks = 0;    // ticks-core ociosos
    int cores = 1;
};

struct SimulationReport {
    SchedulingPolicy policy = SchedulingPolicy::FIRST_COME_FIRST_SERVED;
    SimulationStats stats;

    std::vector<ProcessMetrics> processes;   // ordenado por id

    double averageWaitingTime = 0.0;
    double averageTurnaroundTime = 0.0;
    double averageResponseTime = 0.0;
    double cpuUtilization = 0.0;   // ocupado / (cores * totalTicks)
    double throughput = 0.0;       // processos / totalTicks

    std::vector<ExecutionSlice> timeline;
};

class MetricsCalculator {
public:
    // Lança IncompleteSimulationError se algum processo não está Terminated
    static SimulationReport compute(SchedulingPolicy policy,
                                    const std::vector<PCB> &processes,
                                    const SimulationStats &stats,
                                    const std::vector<ExecutionSlice> &timeline = {});

    static ProcessMetrics processMetrics(const PCB &pcb);
};

#endif // METRICS_HPP
