#include "scheduler_engine.hpp"

#include <algorithm>
#include <limits>

#include "../errors/simulation_errors.hpp"

namespace {
int validatedCores(int cores) {
    if (cores <= 0) {
        throw InvalidCoreCountError(cores);
    }
    return cores;
}
} // namespace

SchedulerEngine::SchedulerEngine(const ProcessTable &table,
                                 SchedulingPolicy policy,
                                 PolicyConfig config,
                                 int numCores,
                                 std::ostream *trace)
    : descriptors(table.all()),
      cores(static_cast<std::size_t>(validatedCores(numCores))),
      scheduler(policy, config),
      tickLimit(table.totalBurstTime() + table.maxArrivalTime()),
      trace(trace) {
    // Os ticks ociosos somam um valor por núcleo; o total precisa caber em Tick
    if (tickLimit > std::numeric_limits<Tick>::max() / static_cast<Tick>(cores.size())) {
        throw SetupError("Erro: horizonte de " + std::to_string(tickLimit) + " ticks grande demais para " +
                         std::to_string(cores.size()) + " núcleos");
    }
    reset();
}

SimulationStats SchedulerEngine::stats() const {
    SimulationStats s;
    s.totalTicks = clock.currentCycle();
    s.busyTicks = clock.busyTicks();
    s.idleTicks = clock.idleTicks();
    s.cores = static_cast<int>(cores.size());
    return s;
}

void SchedulerEngine::reset() {
    clock.reset();
    processList.clear();
    // Reserva antes de preencher: readyList e cores guardam ponteiros para cá
    processList.reserve(descriptors.size());
    for (const auto &d : descriptors) {
        processList.emplace_back(d);
    }
    readyList.clear();
    std::fill(cores.begin(), cores.end(), CoreSlot{});
    executionTimeline.clear();
    nextReadySequence = 0;
    nextArrival = 0;
    finishedProcesses = 0;
}

SimulationReport SchedulerEngine::run() {
    reset();

    if (trace) {
        *trace << "[Escalonador] Iniciando " << schedulerName(scheduler.policy())
               << " com " << processList.size() << " processo(s) em "
               << cores.size() << " core(s)\n";
    }

    while (finishedProcesses < processList.size()) {
        const Tick now = clock.currentCycle();

        admitArrivals(now);
        requeueExpired(now);
        dispatch(now);
        if (scheduler.preemptive()) {
            applyPreemption(now);
        }

        const Tick delta = nextEventDelta(now);
        if (delta > tickLimit - now) {
            throw InvariantViolation("simulação não terminou em " + std::to_string(tickLimit) + " ticks");
        }

        if (trace && busyCores() == 0) {
            *trace << "[Escalonador] t=" << now << " CPU ociosa até t=" << now + delta << "\n";
        }

        execute(delta);
        completeFinished(clock.currentCycle());
    }

    const SimulationStats finalStats = stats();
    Tick totalBurst = 0;
    for (const auto &p : processList) {
        totalBurst += p.descriptor.burstTime;
    }
    if (finalStats.busyTicks != totalBurst) {
        throw InvariantViolation("ticks ocupados (" + std::to_string(finalStats.busyTicks) +
                                 ") diferem da soma dos bursts (" + std::to_string(totalBurst) + ")");
    }

    if (trace) {
        *trace << "[Escalonador] Todos os processos finalizados em t=" << finalStats.totalTicks << "\n";
    }

    return MetricsCalculator::compute(scheduler.policy(), processList, finalStats, executionTimeline);
}

void SchedulerEngine::admitArrivals(Tick now) {
    while (nextArrival < processList.size() &&
           processList[nextArrival].descriptor.arrivalTime <= now) {
        PCB &process = processList[nextArrival++];
        makeReady(process, now);
        if (trace) {
            *trace << "[Escalonador] t=" << now << " processo " << process.id() << " chegou\n";
        }
    }
}

void SchedulerEngine::requeueExpired(Tick now) {
    for (std::size_t core = 0; core < cores.size(); ++core) {
        PCB *process = cores[core].process;
        if (process == nullptr || cores[core].sliceLeft > 0) {
            continue;
        }
        release(core, now);
        makeReady(*process, now);
        if (trace) {
            *trace << "[Escalonador] t=" << now << " quantum do processo " << process->id()
                   << " expirou. Voltando para a fila.\n";
        }
    }
}

void SchedulerEngine::dispatch(Tick now) {
    for (std::size_t core = 0; core < cores.size(); ++core) {
        if (cores[core].process != nullptr) {
            continue;
        }

        auto decision = scheduler.scheduler(now, readyQueue(), runningSet());
        if (!decision) {
            return;   // Idle
        }

        PCB *process = takeFromReady(decision->processId);
        if (decision->allottedTicks <= 0 || decision->allottedTicks > process->remainingTime) {
            throw InvariantViolation("fatia de " + std::to_string(decision->allottedTicks) +
                                     " ticks para o processo " + std::to_string(process->id()) +
                                     " com " + std::to_string(process->remainingTime) + " restantes");
        }

        process->state = State::Running;
        if (!process->firstRunTime) {
            process->firstRunTime = now;
        }
        process->dispatches++;
        if (std::find(process->coresAssigned.begin(), process->coresAssigned.end(),
                      static_cast<int>(core)) == process->coresAssigned.end()) {
            process->coresAssigned.push_back(static_cast<int>(core));
        }

        cores[core].process = process;
        cores[core].sliceStart = now;
        cores[core].sliceLeft = decision->allottedTicks;

        if (trace) {
            *trace << "[Escalonador] t=" << now << " processo " << process->id()
                   << " despachado no core " << core << " por " << decision->allottedTicks << " tick(s)\n";
        }
    }
}

void SchedulerEngine::applyPreemption(Tick now) {
    while (const PCB *victim = scheduler.preemptionVictim(readyQueue(), runningSet())) {
        auto slot = std::find_if(cores.begin(), cores.end(),
                                 [victim](const CoreSlot &s) { return s.process == victim; });
        if (slot == cores.end()) {
            throw InvariantViolation("processo " + std::to_string(victim->id()) +
                                     " escolhido para preempção não está em execução");
        }

        PCB *process = slot->process;
        const std::size_t core = static_cast<std::size_t>(slot - cores.begin());
        release(core, now);
        process->preemptions++;
        makeReady(*process, now);

        if (trace) {
            *trace << "[Escalonador] t=" << now << " processo " << process->id()
                   << " preemptado no core " << core << " (restante " << process->remainingTime << ")\n";
        }

        dispatch(now);
    }
}

Tick SchedulerEngine::nextEventDelta(Tick now) const {
    Tick delta = std::numeric_limits<Tick>::max();

    if (nextArrival < processList.size()) {
        delta = processList[nextArrival].descriptor.arrivalTime - now;
    }
    for (const auto &slot : cores) {
        if (slot.process != nullptr) {
            delta = std::min(delta, slot.sliceLeft);
        }
    }

    if (delta == std::numeric_limits<Tick>::max() || delta <= 0) {
        throw InvariantViolation("nenhum evento pendente em t=" + std::to_string(now) +
                                 " com processos não finalizados");
    }
    return delta;
}

void SchedulerEngine::execute(Tick ticks) {
    const int busy = busyCores();
    clock.advance(ticks, busy, static_cast<int>(cores.size()) - busy);

    for (auto &slot : cores) {
        if (slot.process == nullptr) {
            continue;
        }
        slot.process->remainingTime -= ticks;
        slot.sliceLeft -= ticks;
        if (slot.process->remainingTime < 0) {
            throw InvariantViolation("tempo restante negativo para o processo " +
                                     std::to_string(slot.process->id()));
        }
    }
}

void SchedulerEngine::completeFinished(Tick now) {
    for (std::size_t core = 0; core < cores.size(); ++core) {
        PCB *process = cores[core].process;
        if (process == nullptr || process->remainingTime > 0) {
            continue;
        }
        release(core, now);
        process->state = State::Terminated;
        process->completionTime = now;
        finishedProcesses++;

        if (trace) {
            *trace << "[Escalonador] t=" << now << " processo " << process->id() << " finalizado.\n";
        }
    }
}

void SchedulerEngine::makeReady(PCB &process, Tick now) {
    process.state = State::Ready;
    process.readySince = now;
    process.readySequence = nextReadySequence++;
    readyList.push_back(&process);
}

void SchedulerEngine::release(std::size_t core, Tick now) {
    CoreSlot &slot = cores[core];
    executionTimeline.push_back(ExecutionSlice{slot.process->id(), static_cast<int>(core), slot.sliceStart, now});
    slot = CoreSlot{};
}

PCB *SchedulerEngine::takeFromReady(int processId) {
    auto it = std::find_if(readyList.begin(), readyList.end(),
                           [processId](const PCB *p) { return p->id() == processId; });
    if (it == readyList.end()) {
        throw InvariantViolation("política escolheu o processo " + std::to_string(processId) +
                                 ", que não está em Ready");
    }
    PCB *process = *it;
    readyList.erase(it);
    return process;
}

ReadyQueue SchedulerEngine::readyQueue() const {
    return ReadyQueue(readyList.begin(), readyList.end());
}

RunningSet SchedulerEngine::runningSet() const {
    RunningSet running;
    for (const auto &slot : cores) {
        if (slot.process != nullptr) {
            running.push_back(slot.process);
        }
    }
    return running;
}

int SchedulerEngine::busyCores() const {
    return static_cast<int>(std::count_if(cores.begin(), cores.end(),
                                          [](const CoreSlot &s) { return s.process != nullptr; }));
}
