#ifndef PROCESS_TABLE_HPP
#define PROCESS_TABLE_HPP

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "PCB.hpp"

/**
 * ProcessTable - armazena os descritores de todos os processos da simulação.
 *
 * Cada instância pertence a uma única simulação; não existe tabela global.
 * O registro valida id, burst, chegada e se o horizonte da simulação cabe
 * em Tick. Depois de close() a tabela não aceita mais
 * processos.
 */
class ProcessTable {
public:
    ProcessTable() = default;

    // Lança DuplicateIdError, InvalidBurstError ou InvalidArrivalError
    void registerProcess(const ProcessDescriptor &descriptor);

    // Ordenado por tempo de chegada e depois por id
    std::vector<ProcessDescriptor> all() const;

    const ProcessDescriptor *find(int id) const;

    std::size_t size() const { return descriptors.size(); }
    bool empty() const { return descriptors.empty(); }

    void close() { closed = true; }
    bool isClosed() const { return closed; }

    Tick totalBurstTime() const { return burstTotal; }
    Tick maxArrivalTime() const { return latestArrival; }

private:
    std::vector<ProcessDescriptor> descriptors;
    std::unordered_map<int, std::size_t> indexById;
    Tick burstTotal = 0;
    Tick latestArrival = 0;
    bool closed = false;
};

#endif // PROCESS_TABLE_HPP
