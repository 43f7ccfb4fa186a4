#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "../comparison/comparison.hpp"
#include "../disk_scheduler/disk_scheduler.hpp"
#include "../report/report.hpp"
#include "../request_parser/request_parser.hpp"
#include "../system_config/system_config.hpp"

class Simulator {
public:
    explicit Simulator(const std::string &configPath = "src/system_config/system_config.json");
    explicit Simulator(SystemConfig config, std::ostream &out = std::cout, std::ostream &err = std::cerr);
    int run();

private:
    bool loadRequests();
    void runSingle();
    void runComparison();

    SystemConfig config;
    std::ostream &out;
    std::ostream &err;
    std::vector<int> requests;
};

#endif // SIMULATOR_HPP
