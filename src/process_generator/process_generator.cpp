#include "process_generator.hpp"

#include <random>

#include "../errors/simulation_errors.hpp"

namespace {
void validate(const GeneratorConfig &config) {
    if (config.count < 0) {
        throw InvalidGeneratorError("count negativo (" + std::to_string(config.count) + ")");
    }
    if (config.burstMin <= 0) {
        throw InvalidGeneratorError("burst_min deve ser positivo");
    }
    if (config.burstMin > config.burstMax) {
        throw InvalidGeneratorError("burst_min maior que burst_max");
    }
    if (config.arrivalMax < 0) {
        throw InvalidGeneratorError("arrival_max negativo");
    }
    if (config.priorityMax < 0) {
        throw InvalidGeneratorError("priority_max negativo");
    }
}
} // namespace

std::vector<ProcessDescriptor> generateProcesses(const GeneratorConfig &config) {
    validate(config);

    std::vector<ProcessDescriptor> processes;
    processes.reserve(static_cast<std::size_t>(config.count));

    for (int i = 0; i < config.count; i++) {
        // Semente fixa por processo para reprodutibilidade
        std::mt19937 rng(config.seed + static_cast<unsigned>(i));

        std::uniform_int_distribution<Tick> arrival(0, config.arrivalMax);
        std::uniform_int_distribution<Tick> burst(config.burstMin, config.burstMax);
        std::uniform_int_distribution<int> priority(0, config.priorityMax);

        ProcessDescriptor d;
        d.id = i + 1;
        d.arrivalTime = arrival(rng);
        d.burstTime = burst(rng);
        d.priority = priority(rng);
        processes.push_back(d);
    }
    return processes;
}
