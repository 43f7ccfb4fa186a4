#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include <string>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "../disk_scheduler/disk_scheduler.hpp"

using json = nlohmann::json;

struct DiskConfig {
    int size;
    int head;
};

struct RequestsConfig {
    std::string input;
    bool random;
    int random_count;
    unsigned seed;
};

struct SchedulingConfig {
    Policy algorithm;
    bool compare_all;
    bool parallel;
};

struct OutputConfig {
    std::string csv;
    bool trace;
};

class SystemConfig {
public:
    DiskConfig disk;
    RequestsConfig requests;
    SchedulingConfig scheduling;
    OutputConfig output;

    static SystemConfig fromJson(const json &j) {
        SystemConfig config;

        config.disk.size = j.at("disk").at("size").get<int>();
        config.disk.head = j.at("disk").at("head").get<int>();

        config.requests.input = j.at("requests").at("input").get<std::string>();
        config.requests.random = j.at("requests").value("random", false);
        config.requests.random_count = j.at("requests").value("random_count", 8);
        config.requests.seed = j.at("requests").value("seed", 42u);

        const std::string algorithm = j.at("scheduling").at("algorithm").get<std::string>();
        auto policy = parsePolicy(algorithm);
        if (!policy) {
            throw std::runtime_error("Erro: algoritmo de escalonamento desconhecido: " + algorithm);
        }
        config.scheduling.algorithm = *policy;
        config.scheduling.compare_all = j.at("scheduling").value("compare_all", false);
        config.scheduling.parallel = j.at("scheduling").value("parallel", true);

        config.output.csv = j.at("output").value("csv", std::string());
        config.output.trace = j.at("output").value("trace", false);

        if (config.disk.size < 1) {
            throw std::runtime_error("Erro: disk.size deve ser positivo");
        }
        if (config.disk.head < 0) {
            throw std::runtime_error("Erro: disk.head nao pode ser negativo");
        }
        if (config.requests.random_count < 0) {
            throw std::runtime_error("Erro: requests.random_count nao pode ser negativo");
        }

        return config;
    }

    static SystemConfig loadFromFile(const std::string& filePath) {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            throw std::runtime_error("Erro: Não foi possível abrir o arquivo de configuração: " + filePath);
        }

        json j;
        file >> j;

        return fromJson(j);
    }
};

#endif
