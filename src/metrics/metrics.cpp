#include "metrics.hpp"

double averageSeekTime(int64_t totalSeek, std::size_t requestCount) {
    if (requestCount == 0) {
        throw EmptyInputError("Tempo medio de busca indefinido: nenhuma requisicao");
    }
    return static_cast<double>(totalSeek) / static_cast<double>(requestCount);
}

double throughput(int64_t totalSeek, std::size_t requestCount) {
    if (requestCount == 0) {
        throw EmptyInputError("Vazao indefinida: nenhuma requisicao");
    }
    if (totalSeek == 0) {
        return 0.0;
    }
    return static_cast<double>(requestCount) / static_cast<double>(totalSeek);
}

Metrics computeMetrics(const ScheduleResult &result, std::size_t requestCount) {
    Metrics metrics;
    metrics.totalSeek = result.seekCost;
    metrics.averageSeek = averageSeekTime(result.seekCost, requestCount);
    metrics.throughput = throughput(result.seekCost, requestCount);
    return metrics;
}
