#ifndef COMPARISON_HPP
#define COMPARISON_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../disk_scheduler/disk_scheduler.hpp"
#include "../metrics/metrics.hpp"

struct PolicyOutcome {
    ScheduleResult schedule;
    std::optional<Metrics> metrics;  // vazio quando a métrica falhou
    std::string error;

    bool ok() const { return metrics.has_value(); }
};

using ComparisonResult = std::map<Policy, PolicyOutcome>;

PolicyOutcome runPolicy(Policy policy,
                        const std::vector<int> &requests,
                        int head,
                        int diskSize);

/**
 * compareAll - executa as quatro políticas sobre a mesma entrada.
 *
 * Com parallel = true cada política roda na sua própria thread e grava apenas
 * o seu slot; o mapa é montado depois do join, portanto a posição de cada
 * resultado depende da política e não da ordem de término.
 * Uma política cuja métrica falha não impede as demais: o erro fica no
 * próprio PolicyOutcome.
 */
ComparisonResult compareAll(const std::vector<int> &requests,
                            int head,
                            int diskSize,
                            bool parallel = true);

#endif
