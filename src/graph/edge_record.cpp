#include "graph/edge_record.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

namespace fcg {

namespace {

std::string trim_copy(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string strip_quotes(const std::string& s) {
    if (s.size() >= 2) {
        char first = s.front();
        char last = s.back();
        if ((first == '\'' || first == '"') && first == last) {
            return trim_copy(s.substr(1, s.size() - 2));
        }
    }
    return s;
}

std::string row_suffix(size_t row_number) {
    if (row_number == 0) return "";
    return " (row " + std::to_string(row_number) + ")";
}

} // namespace

// ==========================================
// Errors
// ==========================================

MalformedPairError::MalformedPairError(const std::string& text, size_t row_number)
    : std::runtime_error("Malformed neuron pair '" + text + "'" + row_suffix(row_number)),
      text_(text), row_number_(row_number) {}

InvalidWeightError::InvalidWeightError(const std::string& text, size_t row_number,
                                       const std::string& reason)
    : std::runtime_error("Invalid edge weight '" + text + "'" + row_suffix(row_number) +
                         ": " + reason),
      text_(text), row_number_(row_number) {}

// ==========================================
// Parsing
// ==========================================

std::pair<NeuronId, NeuronId> parse_neuron_pair(const std::string& text, size_t row_number) {
    std::string body = trim_copy(text);

    // Tuple or list wrapper, one level only
    if (body.size() >= 2) {
        char open = body.front();
        char close = body.back();
        if ((open == '(' && close == ')') || (open == '[' && close == ']')) {
            body = body.substr(1, body.size() - 2);
        }
    }

    std::vector<std::string> parts;
    std::stringstream ss(body);
    std::string item;
    while (std::getline(ss, item, ',')) {
        parts.push_back(strip_quotes(trim_copy(item)));
    }
    // getline drops a trailing empty field, "(1, 2,)" must still fail
    if (!body.empty() && body.back() == ',') {
        parts.emplace_back();
    }

    if (parts.size() != 2 || parts[0].empty() || parts[1].empty()) {
        throw MalformedPairError(text, row_number);
    }
    return {parts[0], parts[1]};
}

double parse_edge_weight(const std::string& text, size_t row_number) {
    const std::string t = trim_copy(text);
    if (t.empty()) {
        throw InvalidWeightError(text, row_number, "empty cell");
    }

    std::istringstream iss(t);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    iss >> value;
    if (!iss) {
        throw InvalidWeightError(text, row_number, "not a number");
    }
    iss >> std::ws;
    if (!iss.eof()) {
        throw InvalidWeightError(text, row_number, "trailing characters");
    }
    if (!std::isfinite(value)) {
        throw InvalidWeightError(text, row_number, "weight must be finite");
    }
    return value;
}

std::vector<EdgeRecord> parse_edge_records(const std::vector<RawEdgeRow>& rows) {
    std::vector<EdgeRecord> records;
    records.reserve(rows.size());

    for (size_t i = 0; i < rows.size(); ++i) {
        const RawEdgeRow& row = rows[i];
        size_t row_number = row.row_number > 0 ? row.row_number : i + 1;

        auto [source, target] = parse_neuron_pair(row.pair, row_number);

        EdgeRecord record;
        std::string animal = trim_copy(row.animal);
        record.animal = animal.empty() ? kDefaultAnimal : animal;
        record.source = std::move(source);
        record.target = std::move(target);
        record.weight = parse_edge_weight(row.weight, row_number);
        records.push_back(std::move(record));
    }

    return records;
}

} // namespace fcg
