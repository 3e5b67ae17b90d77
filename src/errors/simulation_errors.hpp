#ifndef SIMULATION_ERRORS_HPP
#define SIMULATION_ERRORS_HPP

#include <stdexcept>
#include <string>

// Erros recuperáveis: o chamador corrige a entrada e tenta de novo.
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string &message)
        : std::runtime_error(message) {}
};

// Detectados antes de qualquer tick ser simulado.
class SetupError : public SimulationError {
public:
    explicit SetupError(const std::string &message)
        : SimulationError(message) {}
};

class DuplicateIdError : public SetupError {
public:
    explicit DuplicateIdError(int id)
        : SetupError("Erro: processo com id " + std::to_string(id) + " já registrado"),
          processId(id) {}

    int processId;
};

class InvalidBurstError : public SetupError {
public:
    InvalidBurstError(int id, long long burst)
        : SetupError("Erro: burst inválido (" + std::to_string(burst) +
                     ") para o processo " + std::to_string(id)),
          processId(id) {}

    int processId;
};

class InvalidArrivalError : public SetupError {
public:
    InvalidArrivalError(int id, long long arrival)
        : SetupError("Erro: tempo de chegada inválido (" + std::to_string(arrival) +
                     ") para o processo " + std::to_string(id)),
          processId(id) {}

    int processId;
};

class InvalidQuantumError : public SetupError {
public:
    explicit InvalidQuantumError(long long quantum)
        : SetupError("Erro: quantum deve ser positivo, recebido " + std::to_string(quantum)) {}
};

class InvalidCoreCountError : public SetupError {
public:
    explicit InvalidCoreCountError(int cores)
        : SetupError("Erro: número de cores deve ser positivo, recebido " + std::to_string(cores)) {}
};

class UnknownPolicyError : public SetupError {
public:
    explicit UnknownPolicyError(const std::string &name)
        : SetupError("Erro: algoritmo de escalonamento desconhecido: " + name) {}
};

class InvalidGeneratorError : public SetupError {
public:
    explicit InvalidGeneratorError(const std::string &message)
        : SetupError("Erro: gerador de processos inválido: " + message) {}
};

// Métricas pedidas antes de todos os processos terminarem.
class IncompleteSimulationError : public SimulationError {
public:
    explicit IncompleteSimulationError(int pendingProcesses)
        : SimulationError("Erro: simulação incompleta, " + std::to_string(pendingProcesses) +
                          " processo(s) ainda não terminaram") {}
};

// Defeito no motor ou numa política. Nunca deve ser tratado dentro do núcleo.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string &message)
        : std::logic_error("Invariante violada: " + message) {}
};

#endif // SIMULATION_ERRORS_HPP
