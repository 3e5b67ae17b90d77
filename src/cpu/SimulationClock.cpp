#include "SimulationClock.hpp"

#include "../errors/simulation_errors.hpp"

void SimulationClock::reset() {
    cycle_ = 0;
    busyTicks_ = 0;
    idleTicks_ = 0;
}

void SimulationClock::advance(Tick ticks, int busyCores, int idleCores) {
    if (ticks <= 0) {
        throw InvariantViolation("relógio avançado em " + std::to_string(ticks) + " ticks");
    }
    cycle_ += ticks;
    busyTicks_ += ticks * busyCores;
    idleTicks_ += ticks * idleCores;
}
