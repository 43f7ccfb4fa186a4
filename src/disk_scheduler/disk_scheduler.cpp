#include "disk_scheduler.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace {
// Separa as requisições em abaixo da cabeça (left) e a partir dela (right), ambas crescentes
void splitAroundHead(const std::vector<int> &requests, int head,
                     std::vector<int> &left, std::vector<int> &right) {
    for (int r : requests) {
        if (r < head) {
            left.push_back(r);
        } else {
            right.push_back(r);
        }
    }
    std::sort(left.begin(), left.end());
    std::sort(right.begin(), right.end());
}

ScheduleResult finish(std::vector<int> order) {
    ScheduleResult result;
    result.seekCost = seekCost(order);
    result.order = std::move(order);
    return result;
}
} // namespace

std::string policyName(Policy policy) {
    switch (policy) {
    case Policy::FCFS:
        return "FCFS";
    case Policy::SSTF:
        return "SSTF";
    case Policy::SCAN:
        return "SCAN";
    case Policy::C_SCAN:
        return "C-SCAN";
    }
    throw std::logic_error("Politica de escalonamento desconhecida");
}

std::optional<Policy> parsePolicy(const std::string &name) {
    std::string upper;
    for (unsigned char c : name) {
        if (!std::isspace(c)) {
            upper.push_back(static_cast<char>(std::toupper(c)));
        }
    }

    if (upper == "FCFS") return Policy::FCFS;
    if (upper == "SSTF") return Policy::SSTF;
    if (upper == "SCAN") return Policy::SCAN;
    if (upper == "C-SCAN" || upper == "CSCAN" || upper == "C_SCAN") return Policy::C_SCAN;
    return std::nullopt;
}

int64_t seekCost(const std::vector<int> &order) {
    int64_t total = 0;
    for (std::size_t i = 1; i < order.size(); ++i) {
        total += std::llabs(static_cast<int64_t>(order[i]) - order[i - 1]);
    }
    return total;
}

ScheduleResult fcfs(const std::vector<int> &requests, int head, int /*diskSize*/) {
    std::vector<int> order;
    order.reserve(requests.size() + 1);
    order.push_back(head);
    order.insert(order.end(), requests.begin(), requests.end());
    return finish(std::move(order));
}

ScheduleResult sstf(const std::vector<int> &requests, int head, int /*diskSize*/) {
    // Cópia privada: a lista do chamador nunca é alterada
    std::vector<int> pending(requests);
    std::vector<int> order;
    order.reserve(requests.size() + 1);
    order.push_back(head);

    int current = head;
    while (!pending.empty()) {
        std::size_t closest = 0;
        int64_t minDistance = std::llabs(static_cast<int64_t>(pending[0]) - current);
        for (std::size_t i = 1; i < pending.size(); ++i) {
            int64_t distance = std::llabs(static_cast<int64_t>(pending[i]) - current);
            // '<' estrito: em empate fica o primeiro encontrado
            if (distance < minDistance) {
                minDistance = distance;
                closest = i;
            }
        }
        current = pending[closest];
        order.push_back(current);
        pending.erase(pending.begin() + static_cast<std::ptrdiff_t>(closest));
    }
    return finish(std::move(order));
}

ScheduleResult scan(const std::vector<int> &requests, int head, int diskSize) {
    if (requests.empty()) {
        return finish({head});
    }
    std::vector<int> left, right;
    splitAroundHead(requests, head, left, right);

    std::vector<int> order;
    order.reserve(requests.size() + 2);
    order.push_back(head);
    order.insert(order.end(), right.begin(), right.end());
    // Vai até o último cilindro mesmo sem requisição lá e então inverte
    order.push_back(diskSize - 1);
    order.insert(order.end(), left.rbegin(), left.rend());
    return finish(std::move(order));
}

ScheduleResult cScan(const std::vector<int> &requests, int head, int diskSize) {
    if (requests.empty()) {
        return finish({head});
    }
    std::vector<int> left, right;
    splitAroundHead(requests, head, left, right);

    std::vector<int> order;
    order.reserve(requests.size() + 3);
    order.push_back(head);
    order.insert(order.end(), right.begin(), right.end());
    // Salta para o cilindro 0 e continua subindo (os dois limites entram sempre)
    order.push_back(diskSize - 1);
    order.push_back(0);
    order.insert(order.end(), left.begin(), left.end());
    return finish(std::move(order));
}

ScheduleResult schedule(Policy policy, const std::vector<int> &requests, int head, int diskSize) {
    switch (policy) {
    case Policy::FCFS:
        return fcfs(requests, head, diskSize);
    case Policy::SSTF:
        return sstf(requests, head, diskSize);
    case Policy::SCAN:
        return scan(requests, head, diskSize);
    case Policy::C_SCAN:
        return cScan(requests, head, diskSize);
    }
    throw std::logic_error("Politica de escalonamento desconhecida");
}
