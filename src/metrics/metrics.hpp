#ifndef METRICS_HPP
#define METRICS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "../disk_scheduler/disk_scheduler.hpp"

// Média e vazão não existem para uma lista vazia de requisições
class EmptyInputError : public std::domain_error {
public:
    explicit EmptyInputError(const std::string &what)
        : std::domain_error(what) {}
};

struct Metrics {
    int64_t totalSeek = 0;
    double averageSeek = 0.0;
    double throughput = 0.0;   // 0 quando totalSeek == 0 (execução sem custo)
};

double averageSeekTime(int64_t totalSeek, std::size_t requestCount);
double throughput(int64_t totalSeek, std::size_t requestCount);

Metrics computeMetrics(const ScheduleResult &result, std::size_t requestCount);

#endif
