#ifndef SCHEDULER_ENGINE_HPP
#define SCHEDULER_ENGINE_HPP

#include <cstdint>
#include <ostream>
#include <vector>

#include "../cpu/PCB.hpp"
#include "../cpu/ProcessTable.hpp"
#include "../cpu/SimulationClock.hpp"
#include "../metrics/metrics.hpp"
#include "../process_scheduler/process_scheduler.hpp"

/**
 * SchedulerEngine - laço de eventos discretos de uma simulação.
 *
 * Cada instância tem sua própria cópia dos processos, sua fila de prontos e
 * seu relógio; instâncias diferentes podem rodar em paralelo sem
 * sincronização.
 *
 * A cada fronteira de tick:
 *   1. processos New cuja chegada foi atingida vão para Ready
 *   2. processos com quantum esgotado voltam para o fim da fila
 *   3. cores livres recebem decisões da política
 *   4. políticas preemptivas trocam o processo em execução, se preciso
 *   5. o relógio avança até o próximo evento (chegada ou fim de fatia)
 */
class SchedulerEngine {
public:
    // Lança InvalidCoreCountError e InvalidQuantumError
    SchedulerEngine(const ProcessTable &table,
                    SchedulingPolicy policy,
                    PolicyConfig config = {},
                    int cores = 1,
                    std::ostream *trace = nullptr);

    SchedulerEngine(const SchedulerEngine &) = delete;
    SchedulerEngine &operator=(const SchedulerEngine &) = delete;

    // Executa até todos os processos terminarem. Lança InvariantViolation
    // se o laço não terminar dentro de totalBurstTime + maxArrivalTime ticks.
    SimulationReport run();

    const std::vector<PCB> &processes() const { return processList; }
    const std::vector<ExecutionSlice> &timeline() const { return executionTimeline; }
    SimulationStats stats() const;
    SchedulingPolicy policy() const { return scheduler.policy(); }

private:
    struct CoreSlot {
        PCB *process = nullptr;
        Tick sliceStart = 0;
        Tick sliceLeft = 0;
    };

    void reset();
    void admitArrivals(Tick now);
    void requeueExpired(Tick now);
    void dispatch(Tick now);
    void applyPreemption(Tick now);
    Tick nextEventDelta(Tick now) const;
    void execute(Tick ticks);
    void completeFinished(Tick now);

    void makeReady(PCB &process, Tick now);
    void release(std::size_t core, Tick now);
    PCB *takeFromReady(int processId);

    ReadyQueue readyQueue() const;
    RunningSet runningSet() const;
    int busyCores() const;

    std::vector<ProcessDescriptor> descriptors;   // ordem de chegada, depois id
    std::vector<PCB> processList;
    std::vector<PCB *> readyList;                 // ordem de entrada em Ready
    std::vector<CoreSlot> cores;
    std::vector<ExecutionSlice> executionTimeline;

    ProcessScheduler scheduler;
    SimulationClock clock;

    std::uint64_t nextReadySequence = 0;
    std::size_t nextArrival = 0;
    std::size_t finishedProcesses = 0;
    Tick tickLimit = 0;

    std::ostream *trace;
};

#endif // SCHEDULER_ENGINE_HPP
