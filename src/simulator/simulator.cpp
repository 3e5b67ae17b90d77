#include "simulator.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <utility>

#include "../metrics/report.hpp"
#include "../parser_json/parser_json.hpp"
#include "../process_generator/process_generator.hpp"
#include "scheduler_engine.hpp"
#include "worker_group.hpp"

Simulator::Simulator(const std::string &configPath)
    : config(SystemConfig::loadFromFile(configPath)) {}

Simulator::Simulator(SystemConfig config)
    : config(std::move(config)) {}

int Simulator::run() {
    std::cout << "Inicializando o simulador...\n";

    ProcessTable table = loadWorkload();
    std::cout << "Total de " << table.size() << " processo(s) carregado(s).\n";

    const PolicyConfig policyConfig{config.scheduling.quantum};
    const bool verbose = config.output.verbose;
    bool saved = true;

    if (config.scheduling.compareAll()) {
        std::cout << "\nComparando todos os escalonadores...\n";
        auto reports = runAll(table, policyConfig, config.cpu.cores, verbose, &std::cout);
        for (const auto &report : reports) {
            printReport(report, std::cout);
            saved &= saveReport(report, config.output.directory);
        }
        printComparison(reports, std::cout);
    } else {
        const SchedulingPolicy policy = parsePolicy(config.scheduling.algorithm);
        SchedulerEngine engine(table, policy, policyConfig, config.cpu.cores,
                               verbose ? &std::cout : nullptr);

        std::cout << "\nIniciando escalonador " << schedulerName(policy) << "...\n";
        SimulationReport report = engine.run();
        printReport(report, std::cout);
        saved = saveReport(report, config.output.directory);
    }

    std::cout << "\nTodos os processos foram finalizados. Encerrando o simulador.\n";
    return saved ? 0 : 1;
}

ProcessTable Simulator::loadWorkload() const {
    std::vector<ProcessDescriptor> descriptors;
    if (config.workload.generator) {
        std::cout << "Gerando " << config.workload.generator->count << " processo(s) (semente "
                  << config.workload.generator->seed << ")\n";
        descriptors = generateProcesses(*config.workload.generator);
    } else {
        std::cout << "Carregando processos de: " << config.workload.file << "\n";
        descriptors = loadProcessFile(config.workload.file);
    }

    ProcessTable table;
    registerAll(descriptors, table);
    table.close();
    return table;
}

std::vector<SimulationReport> Simulator::runAll(const ProcessTable &table,
                                                const PolicyConfig &policyConfig,
                                                int cores,
                                                bool verbose,
                                                std::ostream *log) {
    const auto &policies = allPolicies();
    const std::size_t n = policies.size();

    std::vector<std::ostringstream> traces(n);
    std::vector<std::unique_ptr<SchedulerEngine>> engines;
    engines.reserve(n);

    // Erros de configuração aparecem aqui, antes de qualquer thread iniciar
    for (std::size_t i = 0; i < n; ++i) {
        engines.push_back(std::make_unique<SchedulerEngine>(table, policies[i], policyConfig, cores,
                                                            verbose ? &traces[i] : nullptr));
    }

    std::vector<SimulationReport> reports(n);
    std::vector<std::exception_ptr> errors(n);
    {
        WorkerGroup workers;
        workers.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            workers.spawn([&, i]() {
                try {
                    reports[i] = engines[i]->run();
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
    }

    if (verbose && log) {
        for (const auto &trace : traces) {
            *log << trace.str();
        }
    }

    for (const auto &error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return reports;
}
