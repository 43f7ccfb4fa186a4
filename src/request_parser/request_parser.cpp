#include "request_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace {
string stripSpaces(const string &s) {
    string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (!isspace(c)) out.push_back(static_cast<char>(c));
    }
    return out;
}
} // namespace

ParseResult parseRequests(const string &text) {
    ParseResult result;
    const string compact = stripSpaces(text);
    if (compact.empty()) {
        return result;
    }

    size_t start = 0;
    while (start <= compact.size()) {
        size_t comma = compact.find(',', start);
        if (comma == string::npos) comma = compact.size();
        string token = compact.substr(start, comma - start);

        // from_chars não aceita '+', mas o usuário pode digitar "+5"
        const char *first = token.data();
        const char *last = token.data() + token.size();
        if (!token.empty() && token[0] == '+') ++first;

        int value = 0;
        auto [ptr, ec] = from_chars(first, last, value);
        if (token.empty() || first == last || ec != errc() || ptr != last) {
            result.requests.clear();
            result.error = "Entrada invalida: '" + token + "' nao e um numero inteiro. "
                           "Digite numeros separados por virgula.";
            return result;
        }
        if (value < 0) {
            result.requests.clear();
            result.error = "Entrada invalida: cilindro negativo (" + token + ")";
            return result;
        }
        result.requests.push_back(value);
        start = comma + 1;
    }
    return result;
}

vector<int> generateRandomRequests(size_t count, int diskSize, unsigned seed) {
    if (diskSize <= 0 || count > static_cast<size_t>(diskSize)) {
        throw invalid_argument("Nao ha cilindros distintos suficientes para gerar " +
                               to_string(count) + " requisicoes em um disco de " +
                               to_string(diskSize) + " cilindros");
    }

    vector<int> cylinders(static_cast<size_t>(diskSize));
    iota(cylinders.begin(), cylinders.end(), 0);

    mt19937 rng(seed);
    // Fisher-Yates parcial: só as primeiras count posições interessam
    for (size_t i = 0; i < count; ++i) {
        uniform_int_distribution<size_t> dist(i, cylinders.size() - 1);
        swap(cylinders[i], cylinders[dist(rng)]);
    }
    cylinders.resize(count);
    return cylinders;
}

string formatRequests(const vector<int> &requests) {
    ostringstream out;
    for (size_t i = 0; i < requests.size(); ++i) {
        if (i > 0) out << ", ";
        out << requests[i];
    }
    return out.str();
}
