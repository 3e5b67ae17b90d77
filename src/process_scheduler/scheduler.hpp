#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <string>
#include <vector>

enum class SchedulingPolicy {
    FIRST_COME_FIRST_SERVED,
    SHORTEST_JOB_NEXT,
    SHORTEST_REMAINING_TIME_FIRST,
    ROUND_ROBIN,
    PRIORITY_PREEMPTIVE,
    PRIORITY_NON_PREEMPTIVE
};

// Todas as políticas, na ordem usada pelo modo de comparação
const std::vector<SchedulingPolicy> &allPolicies();

// Nome legível ("Round-Robin", ...)
std::string schedulerName(SchedulingPolicy policy);

// Identificador curto usado na configuração e nos arquivos de saída ("rr", ...)
std::string policyKey(SchedulingPolicy policy);

// Aceita fcfs, sjn/sjf, srtf, rr/round_robin, priority, priority_np.
// Lança UnknownPolicyError.
SchedulingPolicy parsePolicy(const std::string &name);

// Políticas que reavaliam o processo em execução a cada fronteira de tick.
// Round-Robin não entra aqui: só devolve a CPU ao fim do quantum.
bool isPreemptive(SchedulingPolicy policy);

#endif // SCHEDULER_HPP
