#ifndef REPORT_HPP
#define REPORT_HPP

#include <ostream>
#include <string>
#include <vector>

#include "metrics.hpp"

void printReport(const SimulationReport &report, std::ostream &out);

// Uma linha por política, na ordem recebida
void printComparison(const std::vector<SimulationReport> &reports, std::ostream &out);

// Grava <directory>/<politica>_processos.csv e <directory>/<politica>_timeline.csv.
// Retorna false se algum arquivo não puder ser aberto.
bool saveReport(const SimulationReport &report, const std::string &directory);

#endif // REPORT_HPP
