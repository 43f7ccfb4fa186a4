#ifndef REQUEST_PARSER_HPP
#define REQUEST_PARSER_HPP

#include <cstddef>
#include <string>
#include <vector>

// Resultado da leitura da lista de requisições digitada pelo usuário
struct ParseResult {
    std::vector<int> requests;
    std::string error;   // preenchido quando a entrada é inválida

    bool ok() const { return error.empty(); }
};

// "82, 170, 43" -> {82, 170, 43}. Entrada em branco gera lista vazia.
ParseResult parseRequests(const std::string &text);

// count cilindros distintos em [0, diskSize), reprodutível pela seed
std::vector<int> generateRandomRequests(std::size_t count, int diskSize, unsigned seed);

std::string formatRequests(const std::vector<int> &requests);

#endif
