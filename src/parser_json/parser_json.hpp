#ifndef PARSER_JSON_HPP
#define PARSER_JSON_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../cpu/PCB.hpp"
#include "../cpu/ProcessTable.hpp"

// Aceita um array de processos ou um objeto com o campo "processes".
// Cada entrada: { "id", "arrival", "burst", "priority" (opcional) }
std::vector<ProcessDescriptor> parseProcessList(const nlohmann::json &j);

// Lança std::runtime_error com o nome do arquivo se não for possível ler
std::vector<ProcessDescriptor> loadProcessFile(const std::string &filePath);

// Registra todos na tabela; os erros de registro são propagados
void registerAll(const std::vector<ProcessDescriptor> &descriptors, ProcessTable &table);

#endif // PARSER_JSON_HPP
