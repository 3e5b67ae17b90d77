#include "process_scheduler.hpp"

#include <algorithm>

#include "../errors/simulation_errors.hpp"

namespace {
// Desempate comum: quem entrou em Ready primeiro, depois o menor id
bool readiedFirst(const PCB *a, const PCB *b) {
    if (a->readySince != b->readySince) {
        return a->readySince < b->readySince;
    }
    return a->id() < b->id();
}

bool shorterRemaining(const PCB *a, const PCB *b) {
    if (a->remainingTime != b->remainingTime) {
        return a->remainingTime < b->remainingTime;
    }
    return readiedFirst(a, b);
}

bool moreUrgent(const PCB *a, const PCB *b) {
    if (a->descriptor.priority != b->descriptor.priority) {
        return a->descriptor.priority < b->descriptor.priority;
    }
    return readiedFirst(a, b);
}

// Roda até terminar
Decision runToCompletion(const PCB *p) {
    return Decision{p->id(), p->remainingTime};
}
} // namespace

ProcessScheduler::ProcessScheduler(SchedulingPolicy policy, PolicyConfig config)
    : policy_(policy),
      config_(config) {
    if (policy_ == SchedulingPolicy::ROUND_ROBIN && config_.quantum <= 0) {
        throw InvalidQuantumError(config_.quantum);
    }
}

std::optional<Decision> ProcessScheduler::scheduler(Tick /*now*/,
                                                    const ReadyQueue &ready,
                                                    const RunningSet & /*running*/) const {
    switch (policy_) {
    case SchedulingPolicy::FIRST_COME_FIRST_SERVED:
        return first_come_first_served(ready);
    case SchedulingPolicy::SHORTEST_JOB_NEXT:
        return shortest_job_next(ready);
    case SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST:
        return shortest_remaining_time_first(ready);
    case SchedulingPolicy::ROUND_ROBIN:
        return round_robin(ready, config_.quantum);
    case SchedulingPolicy::PRIORITY_PREEMPTIVE:
    case SchedulingPolicy::PRIORITY_NON_PREEMPTIVE:
        return priority(ready);
    }
    return std::nullopt;
}

const PCB *ProcessScheduler::preemptionVictim(const ReadyQueue &ready, const RunningSet &running) const {
    if (ready.empty() || running.empty()) {
        return nullptr;
    }

    switch (policy_) {
    case SchedulingPolicy::PRIORITY_PREEMPTIVE: {
        const PCB *candidate = *std::min_element(ready.begin(), ready.end(), moreUrgent);
        // O menos urgente em execução; empate pelo maior id
        const PCB *victim = *std::max_element(running.begin(), running.end(), [](const PCB *a, const PCB *b) {
            if (a->descriptor.priority != b->descriptor.priority) {
                return a->descriptor.priority < b->descriptor.priority;
            }
            return a->id() < b->id();
        });
        return (candidate->descriptor.priority < victim->descriptor.priority) ? victim : nullptr;
    }
    case SchedulingPolicy::SHORTEST_REMAINING_TIME_FIRST: {
        const PCB *candidate = *std::min_element(ready.begin(), ready.end(), shorterRemaining);
        const PCB *victim = *std::max_element(running.begin(), running.end(), [](const PCB *a, const PCB *b) {
            if (a->remainingTime != b->remainingTime) {
                return a->remainingTime < b->remainingTime;
            }
            return a->id() < b->id();
        });
        return (candidate->remainingTime < victim->remainingTime) ? victim : nullptr;
    }
    default:
        return nullptr;
    }
}

std::optional<Decision> ProcessScheduler::first_come_first_served(const ReadyQueue &ready) {
    if (ready.empty()) return std::nullopt;

    return runToCompletion(*std::min_element(ready.begin(), ready.end(), readiedFirst));
}

std::optional<Decision> ProcessScheduler::shortest_job_next(const ReadyQueue &ready) {
    if (ready.empty()) return std::nullopt;

    return runToCompletion(*std::min_element(ready.begin(), ready.end(), shorterRemaining));
}

std::optional<Decision> ProcessScheduler::shortest_remaining_time_first(const ReadyQueue &ready) {
    // Mesma escolha do SJN; a diferença está em preemptionVictim()
    return shortest_job_next(ready);
}

std::optional<Decision> ProcessScheduler::round_robin(const ReadyQueue &ready, Tick quantum) {
    if (ready.empty()) return std::nullopt;

    // Cabeça da rotação
    const PCB *head = *std::min_element(ready.begin(), ready.end(), [](const PCB *a, const PCB *b) {
        return a->readySequence < b->readySequence;
    });
    return Decision{head->id(), std::min(head->remainingTime, quantum)};
}

std::optional<Decision> ProcessScheduler::priority(const ReadyQueue &ready) {
    if (ready.empty()) return std::nullopt;

    return runToCompletion(*std::min_element(ready.begin(), ready.end(), moreUrgent));
}
