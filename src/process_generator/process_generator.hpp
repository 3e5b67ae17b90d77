#ifndef PROCESS_GENERATOR_HPP
#define PROCESS_GENERATOR_HPP

#include <vector>

#include "../cpu/PCB.hpp"

struct GeneratorConfig {
    int count = 0;
    unsigned seed = 42;
    Tick arrivalMax = 0;
    Tick burstMin = 1;
    Tick burstMax = 10;
    int priorityMax = 5;
};

// Carga sintética determinística: ids 1..count, mesma semente gera a mesma carga.
// Lança InvalidGeneratorError para faixas inválidas.
std::vector<ProcessDescriptor> generateProcesses(const GeneratorConfig &config);

#endif // PROCESS_GENERATOR_HPP
