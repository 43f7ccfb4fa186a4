#include "simulator.hpp"

#include <utility>

Simulator::Simulator(const std::string &configPath)
    : Simulator(SystemConfig::loadFromFile(configPath)) {}

Simulator::Simulator(SystemConfig config, std::ostream &out, std::ostream &err)
    : config(std::move(config)), out(out), err(err) {}

int Simulator::run() {
    out << "Inicializando o simulador...\n";
    if (!loadRequests()) {
        return 1;
    }

    out << "Disco: " << config.disk.size << " cilindros | Cabeca inicial: " << config.disk.head << "\n";
    out << "Requisicoes (" << requests.size() << "): " << formatRequests(requests) << "\n";
    if (config.disk.head >= config.disk.size) {
        err << "Aviso: a cabeca (" << config.disk.head << ") esta fora do disco [0, "
            << config.disk.size << ").\n";
    }

    if (config.scheduling.compare_all) {
        runComparison();
    } else {
        runSingle();
    }
    return 0;
}

bool Simulator::loadRequests() {
    if (config.requests.random) {
        try {
            requests = generateRandomRequests(static_cast<std::size_t>(config.requests.random_count),
                                              config.disk.size,
                                              config.requests.seed);
        } catch (const std::invalid_argument &e) {
            err << "Erro: " << e.what() << "\n";
            return false;
        }
        out << "Requisicoes aleatorias geradas (seed " << config.requests.seed << "): "
            << formatRequests(requests) << "\n";
        return true;
    }

    ParseResult parsed = parseRequests(config.requests.input);
    if (!parsed.ok()) {
        err << parsed.error << "\n";
        return false;
    }
    requests = std::move(parsed.requests);
    if (requests.empty()) {
        err << "Aviso: nenhuma requisicao informada.\n";
    }
    return true;
}

void Simulator::runSingle() {
    const Policy policy = config.scheduling.algorithm;
    out << "\nExecutando " << policyName(policy) << "...\n";

    PolicyOutcome outcome = runPolicy(policy, requests, config.disk.head, config.disk.size);
    print_schedule(out, policy, outcome);
    if (config.output.trace) {
        print_head_movement(out, policy, outcome.schedule.order);
    }
}

void Simulator::runComparison() {
    out << "\nComparando todos os algoritmos"
        << (config.scheduling.parallel ? " (em paralelo)" : "") << "...\n";

    ComparisonResult result = compareAll(requests, config.disk.head, config.disk.size,
                                         config.scheduling.parallel);
    print_comparison(out, result);

    if (config.output.trace) {
        for (const auto &[policy, outcome] : result) {
            print_head_movement(out, policy, outcome.schedule.order);
        }
    }

    if (!config.output.csv.empty()) {
        if (save_comparison_csv(config.output.csv, result)) {
            out << "\nResultados salvos em: " << config.output.csv << "\n";
        }
    }
}
