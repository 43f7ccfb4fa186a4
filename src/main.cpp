#include <exception>
#include <iostream>

#include "simulator/simulator.hpp"

int main(int argc, char *argv[]) {
    std::cout << "I------------------------------------------------I\n";
    std::cout << "I---  Simulador de Escalonamento de Disco     ---I\n";
    std::cout << "I------------------------------------------------I\n";

    try {
        Simulator simulator = argc > 1 ? Simulator(std::string(argv[1])) : Simulator();
        return simulator.run();
    } catch (const std::exception &ex) {
        std::cerr << "Erro fatal: " << ex.what() << "\n";
    }

    return 1;
}
