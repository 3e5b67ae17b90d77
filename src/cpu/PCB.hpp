#ifndef PCB_HPP
#define PCB_HPP
/*
  PCB.hpp
  Bloco de controle de processo (PCB) usado pelo motor de escalonamento.
  Separa os atributos de entrada imutáveis (ProcessDescriptor) da contabilidade
  de execução (tempo restante, estado e marcas de tempo).
*/
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Unidade indivisível de tempo simulado.
using Tick = std::int64_t;

// Estados possíveis do processo
enum class State {
    New,
    Ready,
    Running,
    Terminated
};

std::string stateName(State state);

struct ProcessDescriptor {
    int id = 0;
    Tick arrivalTime = 0;
    Tick burstTime = 0;
    int priority = 0;   // menor valor = mais urgente
};

struct PCB {
    explicit PCB(const ProcessDescriptor &descriptor);

    const ProcessDescriptor descriptor;

    Tick remainingTime;             // 0 <= remainingTime <= burstTime
    State state = State::New;
    std::optional<Tick> firstRunTime;    // primeiro despacho
    std::optional<Tick> completionTime;  // término
    Tick readySince = 0;            // último instante em que entrou em Ready
    std::uint64_t readySequence = 0;  // ordem de entrada na fila de prontos

    std::vector<int> coresAssigned;
    int dispatches = 0;
    int preemptions = 0;

    int id() const { return descriptor.id; }
    Tick executedTime() const { return descriptor.burstTime - remainingTime; }
    bool finished() const { return state == State::Terminated; }
};

#endif // PCB_HPP
