#ifndef REPORT_HPP
#define REPORT_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "../comparison/comparison.hpp"

std::string formatSequence(const std::vector<int> &order);

void print_schedule(std::ostream &out, Policy policy, const PolicyOutcome &outcome);
void print_head_movement(std::ostream &out, Policy policy, const std::vector<int> &order);
void print_comparison(std::ostream &out, const ComparisonResult &result);

void write_comparison_csv(std::ostream &out, const ComparisonResult &result);
// Cria o diretório pai se preciso; retorna false se o arquivo não abrir
bool save_comparison_csv(const std::string &path, const ComparisonResult &result);

#endif
