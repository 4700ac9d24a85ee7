#include "io/edge_table.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace fcg {

namespace {

std::string to_lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim_copy(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

size_t count_outside_quotes(const std::string& s, char delim) {
    bool in_quotes = false;
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"') {
            if (in_quotes && i + 1 < s.size() && s[i + 1] == '"') {
                ++i;
                continue;
            }
            in_quotes = !in_quotes;
            continue;
        }
        if (!in_quotes && c == delim) ++count;
    }
    return count;
}

bool is_skippable(const std::string& line) {
    std::string t = trim_copy(line);
    return t.empty() || t[0] == '#';
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    std::string wanted = to_lower_copy(trim_copy(name));
    for (size_t i = 0; i < header.size(); ++i) {
        if (to_lower_copy(trim_copy(header[i])) == wanted) return static_cast<int>(i);
    }
    return -1;
}

} // namespace

char detect_delimiter(const std::string& header_line) {
    size_t n_comma = count_outside_quotes(header_line, ',');
    size_t n_semi = count_outside_quotes(header_line, ';');
    size_t n_tab = count_outside_quotes(header_line, '\t');

    char best = ',';
    size_t best_n = n_comma;
    if (n_semi > best_n) {
        best = ';';
        best_n = n_semi;
    }
    if (n_tab > best_n) {
        best = '\t';
    }
    return best;
}

std::vector<std::string> split_delimited_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
            continue;
        }
        if (c == delimiter && !in_quotes) {
            fields.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    fields.push_back(current);
    return fields;
}

EdgeTable EdgeTableReader::read(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw EdgeTableError("Cannot open edge table: " + path);
    }
    return parse(file);
}

EdgeTable EdgeTableReader::parse(std::istream& in) const {
    EdgeTable table;
    std::string line;

    // Header: first non-comment line
    bool have_header = false;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_skippable(line)) continue;
        // UTF-8 byte order mark from spreadsheet exports
        if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
        table.delimiter = detect_delimiter(line);
        table.header = split_delimited_line(line, table.delimiter);
        have_header = true;
        break;
    }
    if (!have_header) {
        throw EdgeTableError("Edge table is empty");
    }

    int animal_col = find_column(table.header, columns_.animal);
    int pair_col = find_column(table.header, columns_.pair);
    int weight_col = find_column(table.header, columns_.weight);
    if (pair_col < 0) {
        throw EdgeTableError("Missing required column: " + columns_.pair);
    }
    if (weight_col < 0) {
        throw EdgeTableError("Missing required column: " + columns_.weight);
    }
    table.has_animal_column = animal_col >= 0;

    size_t required = static_cast<size_t>(std::max({animal_col, pair_col, weight_col})) + 1;
    size_t row_number = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_skippable(line)) continue;
        ++row_number;

        auto fields = split_delimited_line(line, table.delimiter);
        if (fields.size() < required) {
            throw EdgeTableError("Row " + std::to_string(row_number) + " has " +
                                 std::to_string(fields.size()) + " fields, expected at least " +
                                 std::to_string(required));
        }

        RawEdgeRow row;
        if (animal_col >= 0) row.animal = trim_copy(fields[animal_col]);
        row.pair = fields[pair_col];
        row.weight = fields[weight_col];
        row.row_number = row_number;
        table.rows.push_back(std::move(row));
    }

    return table;
}

} // namespace fcg
