#ifndef PROCESS_SCHEDULER_HPP
#define PROCESS_SCHEDULER_HPP

#include "../cpu/PCB.hpp"
#include "scheduler.hpp"

#include <optional>
#include <vector>

struct PolicyConfig {
    Tick quantum = 1;   // só usado pelo Round-Robin
};

// Próxima unidade de trabalho: qual processo e por quantos ticks
struct Decision {
    int processId;
    Tick allottedTicks;
};

// Processos em Ready, em ordem de entrada na fila (readySequence crescente)
using ReadyQueue = std::vector<const PCB *>;
using RunningSet = std::vector<const PCB *>;

/**
 * ProcessScheduler - estratégias de escalonamento.
 *
 * Funções puras sobre os argumentos recebidos: não leem o relógio, não
 * alteram estado e não guardam referências ao motor. std::nullopt significa
 * Idle (nenhum processo pronto).
 */
class ProcessScheduler {
public:
    // Lança InvalidQuantumError se a política for Round-Robin e quantum <= 0
    ProcessScheduler(SchedulingPolicy policy, PolicyConfig config = {});

    std::optional<Decision> scheduler(Tick now,
                                      const ReadyQueue &ready,
                                      const RunningSet &running) const;

    // Processo em execução que deve ceder a CPU, ou nullptr
    const PCB *preemptionVictim(const ReadyQueue &ready, const RunningSet &running) const;

    SchedulingPolicy policy() const { return policy_; }
    const PolicyConfig &config() const { return config_; }
    bool preemptive() const { return isPreemptive(policy_); }

    static std::optional<Decision> first_come_first_served(const ReadyQueue &ready);
    static std::optional<Decision> shortest_job_next(const ReadyQueue &ready);
    static std::optional<Decision> shortest_remaining_time_first(const ReadyQueue &ready);
    static std::optional<Decision> round_robin(const ReadyQueue &ready, Tick quantum);
    static std::optional<Decision> priority(const ReadyQueue &ready);

private:
    SchedulingPolicy policy_;
    PolicyConfig config_;
};

#endif // PROCESS_SCHEDULER_HPP
