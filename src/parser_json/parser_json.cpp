#include "parser_json.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

using nlohmann::json;

namespace {
std::runtime_error outOfRange(const char *field, const json &value) {
    return std::runtime_error(std::string("Erro: campo '") + field + "' fora do intervalo: " + value.dump());
}

Tick readTick(const json &value, const char *field) {
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("Erro: campo '") + field + "' deve ser um inteiro");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<Tick>::max())) {
        throw outOfRange(field, value);
    }
    return value.get<Tick>();
}

// id e prioridade são int; valores maiores não podem ser truncados
int readInt(const json &value, const char *field) {
    const Tick v = readTick(value, field);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw outOfRange(field, value);
    }
    return static_cast<int>(v);
}

ProcessDescriptor parseProcess(const json &entry) {
    ProcessDescriptor d;
    d.id = readInt(entry.at("id"), "id");
    d.arrivalTime = readTick(entry.at("arrival"), "arrival");
    d.burstTime = readTick(entry.at("burst"), "burst");
    d.priority = entry.contains("priority") ? readInt(entry.at("priority"), "priority") : 0;
    return d;
}
} // namespace

std::vector<ProcessDescriptor> parseProcessList(const json &j) {
    const json &list = j.is_array() ? j : j.at("processes");
    if (!list.is_array()) {
        throw std::runtime_error("Erro: campo 'processes' deve ser uma lista");
    }

    std::vector<ProcessDescriptor> processes;
    processes.reserve(list.size());
    for (const auto &entry : list) {
        processes.push_back(parseProcess(entry));
    }
    return processes;
}

std::vector<ProcessDescriptor> loadProcessFile(const std::string &filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Erro: Não foi possível abrir o arquivo de processos: " + filePath);
    }

    try {
        json j;
        file >> j;
        return parseProcessList(j);
    } catch (const json::exception &e) {
        throw std::runtime_error("Erro: arquivo de processos inválido " + filePath + ": " + e.what());
    } catch (const std::runtime_error &e) {
        throw std::runtime_error("Erro: arquivo de processos inválido " + filePath + ": " + e.what());
    }
}

void registerAll(const std::vector<ProcessDescriptor> &descriptors, ProcessTable &table) {
    for (const auto &d : descriptors) {
        table.registerProcess(d);
    }
}
