#include "system_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

bool SchedulingConfig::compareAll() const {
    std::string key = algorithm;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
    return key == "all";
}

SystemConfig SystemConfig::loadFromFile(const std::string &filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Erro: Não foi possível abrir o arquivo de configuração: " + filePath);
    }

    try {
        json j;
        file >> j;
        return fromJson(j);
    } catch (const json::exception &e) {
        throw std::runtime_error("Erro: configuração inválida em " + filePath + ": " + e.what());
    }
}

SystemConfig SystemConfig::fromJson(const json &j) {
    SystemConfig config;

    if (j.contains("cpu")) {
        config.cpu.cores = j.at("cpu").value("cores", 1);
    }

    const json &scheduling = j.at("scheduling");
    config.scheduling.algorithm = scheduling.at("algorithm").get<std::string>();
    config.scheduling.quantum = scheduling.value("quantum", Tick{1});

    const json &workload = j.at("workload");
    if (workload.contains("generator")) {
        const json &g = workload.at("generator");
        GeneratorConfig generator;
        generator.count = g.at("count").get<int>();
        generator.seed = g.value("seed", 42u);
        generator.arrivalMax = g.value("arrival_max", Tick{0});
        generator.burstMin = g.value("burst_min", Tick{1});
        generator.burstMax = g.value("burst_max", Tick{10});
        generator.priorityMax = g.value("priority_max", 5);
        config.workload.generator = generator;
    } else {
        config.workload.file = workload.at("file").get<std::string>();
    }

    if (j.contains("output")) {
        const json &output = j.at("output");
        config.output.directory = output.value("directory", std::string("output"));
        config.output.verbose = output.value("verbose", false);
    }

    return config;
}
