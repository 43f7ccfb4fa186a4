#include "report.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
std::string formatFixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}
} // namespace

std::string formatSequence(const std::vector<int> &order) {
    std::ostringstream out;
    out << "[";
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (i > 0) out << ", ";
        out << order[i];
    }
    out << "]";
    return out.str();
}

void print_schedule(std::ostream &out, Policy policy, const PolicyOutcome &outcome) {
    out << "\n--- RESULTADO DO ESCALONAMENTO ---\n";
    out << "Algoritmo:              " << policyName(policy) << "\n";
    out << "Sequencia:              " << formatSequence(outcome.schedule.order) << "\n";
    out << "Tempo total de busca:   " << outcome.schedule.seekCost << "\n";
    if (outcome.ok()) {
        out << "Tempo medio de busca:   " << formatFixed(outcome.metrics->averageSeek, 2) << "\n";
        out << "Vazao do sistema:       " << formatFixed(outcome.metrics->throughput, 4)
            << " requisicoes/unidade\n";
    } else {
        out << "Tempo medio de busca:   N/A\n";
        out << "Vazao do sistema:       N/A (" << outcome.error << ")\n";
    }
    out << "----------------------------------\n";
}

void print_head_movement(std::ostream &out, Policy policy, const std::vector<int> &order) {
    out << "\nMovimento da cabeca (" << policyName(policy) << "):\n";
    if (order.size() < 2) {
        out << "  (cabeca parada em " << (order.empty() ? 0 : order.front()) << ")\n";
        return;
    }
    for (std::size_t i = 1; i < order.size(); ++i) {
        const long long distance = std::llabs(static_cast<long long>(order[i]) - order[i - 1]);
        out << "  " << std::setw(3) << i << ": " << std::setw(5) << order[i - 1]
            << " -> " << std::setw(5) << order[i] << "  (" << distance << ")\n";
    }
}

void print_comparison(std::ostream &out, const ComparisonResult &result) {
    out << "\n=== COMPARACAO DE DESEMPENHO ===\n";
    out << std::left << std::setw(10) << "Algoritmo"
        << std::right << std::setw(18) << "Tempo Total"
        << std::setw(16) << "Tempo Medio"
        << std::setw(14) << "Vazao" << "\n";

    for (const auto &[policy, outcome] : result) {
        out << std::left << std::setw(10) << policyName(policy)
            << std::right << std::setw(18) << outcome.schedule.seekCost;
        if (outcome.ok()) {
            out << std::setw(16) << formatFixed(outcome.metrics->averageSeek, 2)
                << std::setw(14) << formatFixed(outcome.metrics->throughput, 4) << "\n";
        } else {
            out << std::setw(16) << "N/A" << std::setw(14) << "N/A" << "\n";
        }
    }

    for (const auto &[policy, outcome] : result) {
        if (!outcome.ok()) {
            out << "Aviso [" << policyName(policy) << "]: " << outcome.error << "\n";
        }
    }
    for (const auto &[policy, outcome] : result) {
        out << "Sequencia " << std::left << std::setw(7) << policyName(policy) << std::right
            << formatSequence(outcome.schedule.order) << "\n";
    }
}

void write_comparison_csv(std::ostream &out, const ComparisonResult &result) {
    out << "Algorithm,Total Seek Time,Average Seek Time,Throughput (req/unit time)\n";
    for (const auto &[policy, outcome] : result) {
        out << policyName(policy) << "," << outcome.schedule.seekCost << ",";
        if (outcome.ok()) {
            out << outcome.metrics->averageSeek << "," << outcome.metrics->throughput << "\n";
        } else {
            out << "N/A,N/A\n";
        }
    }
}

bool save_comparison_csv(const std::string &path, const ComparisonResult &result) {
    const std::filesystem::path filePath(path);
    std::error_code ec;
    if (filePath.has_parent_path()) {
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            std::cerr << "Erro ao criar diretorio '" << filePath.parent_path().string()
                      << "': " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Erro ao abrir arquivo para salvar resultados: " << path << "\n";
        return false;
    }
    write_comparison_csv(file, result);
    return static_cast<bool>(file);
}
