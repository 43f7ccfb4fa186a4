#ifndef DISK_SCHEDULER_HPP
#define DISK_SCHEDULER_HPP
/*
  disk_scheduler.hpp
  Políticas de escalonamento do braço do disco (FCFS, SSTF, SCAN, C-SCAN).
  Cada política é uma função pura: recebe as requisições pendentes (cilindros),
  a posição inicial da cabeça e o tamanho do disco, e devolve a ordem de
  atendimento junto com o deslocamento total da cabeça.
*/
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Políticas suportadas
enum class Policy {
    FCFS,
    SSTF,
    SCAN,
    C_SCAN
};

constexpr std::array<Policy, 4> ALL_POLICIES = {
    Policy::FCFS, Policy::SSTF, Policy::SCAN, Policy::C_SCAN
};

struct ScheduleResult {
    std::vector<int> order;   // order[0] é sempre a cabeça
    int64_t seekCost = 0;     // soma de |order[i] - order[i-1]|
};

std::string policyName(Policy policy);
std::optional<Policy> parsePolicy(const std::string &name);

// Soma dos deslocamentos entre posições consecutivas
int64_t seekCost(const std::vector<int> &order);

ScheduleResult fcfs(const std::vector<int> &requests, int head, int diskSize);
ScheduleResult sstf(const std::vector<int> &requests, int head, int diskSize);
ScheduleResult scan(const std::vector<int> &requests, int head, int diskSize);
ScheduleResult cScan(const std::vector<int> &requests, int head, int diskSize);

ScheduleResult schedule(Policy policy, const std::vector<int> &requests, int head, int diskSize);

#endif
