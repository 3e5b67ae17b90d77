#include "report.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

void printReport(const SimulationReport &report, std::ostream &out) {
    out << "\n=== ESCALONADOR " << schedulerName(report.policy) << " ===\n";
    out << "Cores: " << report.stats.cores << " | Ticks totais: " << report.stats.totalTicks << "\n";

    out << "\n--- METRICAS POR PROCESSO ---\n";
    out << std::left
        << std::setw(6) << "PID"
        << std::setw(9) << "Chegada"
        << std::setw(7) << "Burst"
        << std::setw(6) << "Prio"
        << std::setw(8) << "Inicio"
        << std::setw(8) << "Fim"
        << std::setw(12) << "Turnaround"
        << std::setw(8) << "Espera"
        << std::setw(10) << "Resposta"
        << "Preempcoes\n";
    for (const auto &p : report.processes) {
        out << std::setw(6) << p.id
            << std::setw(9) << p.arrivalTime
            << std::setw(7) << p.burstTime
            << std::setw(6) << p.priority
            << std::setw(8) << p.firstRunTime
            << std::setw(8) << p.completionTime
            << std::setw(12) << p.turnaroundTime
            << std::setw(8) << p.waitingTime
            << std::setw(10) << p.responseTime
            << p.preemptions << "\n";
    }
    out << std::right;

    if (!report.timeline.empty()) {
        out << "\n--- LINHA DO TEMPO ---\n";
        for (const auto &slice : report.timeline) {
            out << "  core " << slice.core << ": [" << slice.start << ", " << slice.end
                << ") processo " << slice.processId << "\n";
        }
    }

    out << "\n=== MÉTRICAS GLOBAIS ===\n";
    out << std::fixed << std::setprecision(2);
    out << "Tempo médio de espera: " << report.averageWaitingTime << " ticks\n";
    out << "Tempo médio de turnaround: " << report.averageTurnaroundTime << " ticks\n";
    out << "Tempo médio de resposta: " << report.averageResponseTime << " ticks\n";
    out << "Utilização da CPU: " << report.cpuUtilization * 100 << " %\n";
    out << std::setprecision(4);
    out << "Throughput: " << report.throughput << " processos/tick\n";
    out << std::defaultfloat;
}

void printComparison(const std::vector<SimulationReport> &reports, std::ostream &out) {
    out << "\n=== COMPARAÇÃO DE ESCALONADORES ===\n";
    out << std::left << std::setw(34) << "Escalonador"
        << std::setw(10) << "Espera"
        << std::setw(12) << "Turnaround"
        << std::setw(10) << "Resposta"
        << std::setw(10) << "CPU(%)"
        << "Throughput\n";

    out << std::fixed;
    for (const auto &r : reports) {
        out << std::setw(34) << schedulerName(r.policy)
            << std::setprecision(2)
            << std::setw(10) << r.averageWaitingTime
            << std::setw(12) << r.averageTurnaroundTime
            << std::setw(10) << r.averageResponseTime
            << std::setw(10) << r.cpuUtilization * 100
            << std::setprecision(4) << r.throughput << "\n";
    }
    out << std::right << std::defaultfloat;
}

bool saveReport(const SimulationReport &report, const std::string &directory) {
    // cria a pasta de saída se não existir
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "Erro ao criar diretório de saída '" << directory << "': " << ec.message() << "\n";
        return false;
    }

    const std::filesystem::path base(directory);
    const std::string key = policyKey(report.policy);

    const std::string processesPath = (base / (key + "_processos.csv")).string();
    std::ofstream processes(processesPath);
    if (!processes.is_open()) {
        std::cerr << "Erro ao abrir arquivo para salvar métricas: " << processesPath << "\n";
        return false;
    }
    processes << "PID,Arrival,Burst,Priority,FirstRun,Completion,Turnaround,Waiting,Response,Dispatches,Preemptions\n";
    for (const auto &p : report.processes) {
        processes << p.id << "," << p.arrivalTime << "," << p.burstTime << "," << p.priority << ","
                  << p.firstRunTime << "," << p.completionTime << "," << p.turnaroundTime << ","
                  << p.waitingTime << "," << p.responseTime << "," << p.dispatches << ","
                  << p.preemptions << "\n";
    }

    const std::string timelinePath = (base / (key + "_timeline.csv")).string();
    std::ofstream timeline(timelinePath);
    if (!timeline.is_open()) {
        std::cerr << "Erro ao abrir arquivo para salvar linha do tempo: " << timelinePath << "\n";
        return false;
    }
    timeline << "Core,PID,Start,End\n";
    for (const auto &slice : report.timeline) {
        timeline << slice.core << "," << slice.processId << "," << slice.start << "," << slice.end << "\n";
    }

    std::cout << "Métricas salvas em: " << processesPath << " e " << timelinePath << "\n";
    return true;
}
