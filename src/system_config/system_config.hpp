#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../cpu/PCB.hpp"
#include "../process_generator/process_generator.hpp"

using json = nlohmann::json;

struct CpuConfig {
    int cores = 1;
};

struct SchedulingConfig {
    std::string algorithm = "fcfs";   // "all" roda todas as políticas
    Tick quantum = 1;

    bool compareAll() const;
};

struct WorkloadConfig {
    std::string file;                          // arquivo JSON de processos
    std::optional<GeneratorConfig> generator;  // ou carga sintética
};

struct OutputConfig {
    std::string directory = "output";
    bool verbose = false;
};

class SystemConfig {
public:
    CpuConfig cpu;
    SchedulingConfig scheduling;
    WorkloadConfig workload;
    OutputConfig output;

    static SystemConfig loadFromFile(const std::string &filePath);
    static SystemConfig fromJson(const json &j);
};

#endif // SYSTEM_CONFIG_HPP
