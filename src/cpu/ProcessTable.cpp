#include "ProcessTable.hpp"

#include <algorithm>
#include <limits>

#include "../errors/simulation_errors.hpp"

void ProcessTable::registerProcess(const ProcessDescriptor &descriptor) {
    if (closed) {
        throw InvariantViolation("registro do processo " + std::to_string(descriptor.id) +
                                 " após o fechamento da tabela");
    }
    if (indexById.count(descriptor.id)) {
        throw DuplicateIdError(descriptor.id);
    }
    if (descriptor.burstTime <= 0) {
        throw InvalidBurstError(descriptor.id, descriptor.burstTime);
    }
    if (descriptor.arrivalTime < 0) {
        throw InvalidArrivalError(descriptor.id, descriptor.arrivalTime);
    }

    // O horizonte da simulação (soma dos bursts + maior chegada) precisa caber em Tick
    constexpr Tick maxTick = std::numeric_limits<Tick>::max();
    if (descriptor.burstTime > maxTick - burstTotal - latestArrival) {
        throw InvalidBurstError(descriptor.id, descriptor.burstTime);
    }
    const Tick newTotal = burstTotal + descriptor.burstTime;
    if (descriptor.arrivalTime > maxTick - newTotal) {
        throw InvalidArrivalError(descriptor.id, descriptor.arrivalTime);
    }

    indexById[descriptor.id] = descriptors.size();
    descriptors.push_back(descriptor);
    burstTotal = newTotal;
    latestArrival = std::max(latestArrival, descriptor.arrivalTime);
}

std::vector<ProcessDescriptor> ProcessTable::all() const {
    std::vector<ProcessDescriptor> ordered = descriptors;
    std::sort(ordered.begin(), ordered.end(),
              [](const ProcessDescriptor &a, const ProcessDescriptor &b) {
                  if (a.arrivalTime != b.arrivalTime) {
                      return a.arrivalTime < b.arrivalTime;
                  }
                  return a.id < b.id;
              });
    return ordered;
}

const ProcessDescriptor *ProcessTable::find(int id) const {
    auto it = indexById.find(id);
    return (it != indexById.end()) ? &descriptors[it->second] : nullptr;
}

