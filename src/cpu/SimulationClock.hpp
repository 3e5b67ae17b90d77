#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

#include "PCB.hpp"

/**
 * SimulationClock - contador lógico de ticks de uma simulação.
 *
 * Pertence a uma única instância do SchedulerEngine: é zerado na entrada de
 * run() e só avança dentro do laço principal. Nunca é decrementado.
 *
 * Além do tempo corrente, contabiliza ticks ocupados e ociosos por core
 * para o cálculo de utilização.
 */
class SimulationClock {
public:
    SimulationClock() = default;

    Tick currentCycle() const;

    // Volta ao ciclo 0 e zera a contabilidade
    void reset();

    // Avança `ticks` ciclos; busyCores + idleCores = total de cores
    void advance(Tick ticks, int busyCores, int idleCores);

    Tick busyTicks() const { return busyTicks_; }
    Tick idleTicks() const { return idleTicks_; }

private:
    Tick cycle_{0};
    Tick busyTicks_{0};
    Tick idleTicks_{0};
};

inline Tick SimulationClock::currentCycle() const {
    return cycle_;
}

#endif // SIMULATION_CLOCK_HPP
