#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include <ostream>
#include <string>
#include <vector>

#include "../cpu/ProcessTable.hpp"
#include "../metrics/metrics.hpp"
#include "../process_scheduler/process_scheduler.hpp"
#include "../system_config/system_config.hpp"

class Simulator {
public:
    explicit Simulator(const std::string &configPath = "src/system_config/system_config.json");
    explicit Simulator(SystemConfig config);

    int run();

    // Lê o arquivo de processos ou usa o gerador; a tabela retorna fechada
    ProcessTable loadWorkload() const;

    // Uma simulação por política, cada uma em sua thread e com seu próprio
    // motor. Os relatórios saem na ordem de allPolicies(). Se verbose, os
    // traces de cada execução são impressos em `log` depois do join.
    static std::vector<SimulationReport> runAll(const ProcessTable &table,
                                                const PolicyConfig &policyConfig,
                                                int cores,
                                                bool verbose = false,
                                                std::ostream *log = nullptr);

private:
    SystemConfig config;
};

#endif // SIMULATOR_HPP
