#include "report/result_table.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

using json = nlohmann::json;

namespace fcg {

namespace {

bool needs_quoting(const std::string& cell, char delimiter) {
    for (char c : cell) {
        if (c == delimiter || c == '"' || c == '\n' || c == '\r') return true;
    }
    return false;
}

std::string quote_cell(const std::string& cell) {
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

void write_line(std::ostream& out, const std::vector<std::string>& cells, char delimiter) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) out << delimiter;
        out << (needs_quoting(cells[i], delimiter) ? quote_cell(cells[i]) : cells[i]);
    }
    out << "\n";
}

bool is_iterative(MetricKind kind) {
    return kind == MetricKind::PAGERANK || kind == MetricKind::HITS ||
           kind == MetricKind::EIGENVECTOR;
}

void write_json_file(const std::string& path, const json& j) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    file << j.dump(2);
}

} // namespace

std::string format_number(double value) {
    if (std::isnan(value)) return "";
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(10) << value;
    return oss.str();
}

// ============================================================================
// ResultTable
// ============================================================================

void ResultTable::add_row(std::vector<std::string> row) {
    if (row.size() != columns_.size()) {
        throw std::invalid_argument("Row width " + std::to_string(row.size()) +
                                    " does not match " + std::to_string(columns_.size()) +
                                    " columns of table " + name_);
    }
    std::vector<json> values(row.begin(), row.end());
    rows_.push_back(std::move(row));
    values_.push_back(std::move(values));
}

void ResultTable::add_scores(std::vector<std::string> labels, const std::vector<double>& scores) {
    if (labels.size() + scores.size() != columns_.size()) {
        throw std::invalid_argument("Row width " + std::to_string(labels.size() + scores.size()) +
                                    " does not match " + std::to_string(columns_.size()) +
                                    " columns of table " + name_);
    }
    std::vector<json> values(labels.begin(), labels.end());
    for (double v : scores) {
        labels.push_back(format_number(v));
        values.push_back(std::isnan(v) ? json(nullptr) : json(v));
    }
    rows_.push_back(std::move(labels));
    values_.push_back(std::move(values));
}

void ResultTable::write_delimited(std::ostream& out, char delimiter) const {
    write_line(out, columns_, delimiter);
    for (const auto& row : rows_) {
        write_line(out, row, delimiter);
    }
}

void ResultTable::write_delimited(const std::string& path, char delimiter) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    write_delimited(file, delimiter);
}

json ResultTable::to_json() const {
    json arr = json::array();
    for (const auto& row : values_) {
        json obj = json::object();
        for (size_t i = 0; i < columns_.size(); ++i) {
            obj[columns_[i]] = row[i];
        }
        arr.push_back(obj);
    }
    return arr;
}

// ============================================================================
// ResultSet
// ============================================================================

void ResultSet::add(MetricResult result) {
    results_.push_back(std::move(result));
}

void ResultSet::add_skipped(const AnimalId& animal, MetricKind kind, std::string reason) {
    skipped_.push_back({animal, kind, std::move(reason)});
}

std::vector<MetricKind> ResultSet::metrics() const {
    std::vector<MetricKind> kinds;
    auto add_kind = [&kinds](MetricKind kind) {
        if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) kinds.push_back(kind);
    };
    for (MetricKind k : requested_) add_kind(k);
    for (const auto& r : results_) add_kind(r.kind);
    for (const auto& s : skipped_) add_kind(s.kind);
    return kinds;
}

std::vector<AnimalId> ResultSet::animals() const {
    std::vector<AnimalId> ids;
    auto add_animal = [&ids](const AnimalId& animal) {
        if (std::find(ids.begin(), ids.end(), animal) == ids.end()) ids.push_back(animal);
    };
    for (const auto& r : results_) add_animal(r.animal);
    for (const auto& s : skipped_) add_animal(s.animal);
    return ids;
}

bool ResultSet::include_animal_column() const {
    return input_has_animal_column_ || animals().size() > 1;
}

ResultTable ResultSet::table(MetricKind kind) const {
    const bool with_animal = include_animal_column();

    std::vector<std::string> columns;
    if (with_animal) columns.push_back("Animal");
    columns.push_back("Neuron");
    const size_t labels = columns.size();

    std::vector<std::string> score_columns = metric_score_columns(kind);
    for (const auto& r : results_) {
        if (r.kind != kind) continue;
        score_columns = r.columns;
        break;
    }
    columns.insert(columns.end(), score_columns.begin(), score_columns.end());

    ResultTable table(metric_kind_to_string(kind), columns);
    for (const auto& r : results_) {
        if (r.kind != kind) continue;
        for (const auto& scores : r.rows) {
            std::vector<std::string> row;
            if (with_animal) row.push_back(r.animal);
            row.push_back(scores.neuron);
            std::vector<double> values = scores.values;
            values.resize(columns.size() - labels, std::numeric_limits<double>::quiet_NaN());
            table.add_scores(std::move(row), values);
        }
    }
    return table;
}

ResultTable ResultSet::summary_table() const {
    ResultTable table("summary", {"Animal", "Metric", "Statistic", "Value"});
    for (const auto& r : results_) {
        const std::string metric = metric_kind_to_string(r.kind);
        for (const auto& [key, value] : r.summary) {
            table.add_scores({r.animal, metric, key}, {value});
        }
        if (is_iterative(r.kind)) {
            table.add_scores({r.animal, metric, "Converged"}, {r.converged ? 1.0 : 0.0});
            table.add_scores({r.animal, metric, "Iterations"}, {static_cast<double>(r.iterations)});
        }
    }
    for (const auto& s : skipped_) {
        table.add_scores({s.animal, metric_kind_to_string(s.kind), "Skipped"}, {1.0});
    }
    return table;
}

json ResultSet::to_json() const {
    json j;
    j["include_animal_column"] = include_animal_column();
    j["animals"] = animals();

    json tables = json::object();
    for (MetricKind kind : metrics()) {
        tables[metric_kind_to_string(kind)] = table(kind).to_json();
    }
    j["tables"] = tables;
    j["summary"] = summary_table().to_json();

    json skipped = json::array();
    for (const auto& entry : skipped_) {
        skipped.push_back({{"animal", entry.animal},
                           {"metric", metric_kind_to_string(entry.kind)},
                           {"reason", entry.reason}});
    }
    j["skipped"] = skipped;
    return j;
}

std::vector<std::string> ResultSet::save(const std::string& directory,
                                         const std::string& format,
                                         bool write_json) const {
    char delimiter;
    if (format == "csv") {
        delimiter = ',';
    } else if (format == "tsv") {
        delimiter = '\t';
    } else {
        throw std::runtime_error("Unknown output format: " + format);
    }

    ensure_directory(directory);

    std::vector<ResultTable> tables;
    for (MetricKind kind : metrics()) {
        tables.push_back(table(kind));
    }
    tables.push_back(summary_table());

    std::vector<std::string> written;
    for (const auto& t : tables) {
        std::string base = directory + "/" + t.name();
        t.write_delimited(base + "." + format, delimiter);
        written.push_back(base + "." + format);
        if (write_json) {
            write_json_file(base + ".json", t.to_json());
            written.push_back(base + ".json");
        }
    }
    return written;
}

void ensure_directory(const std::string& path) {
    if (path.empty()) return;

    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string prefix = path.substr(0, pos);
        if (prefix.empty()) continue;

        struct stat st;
        if (stat(prefix.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                throw std::runtime_error("Not a directory: " + prefix);
            }
            continue;
        }
        if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            throw std::runtime_error("Failed to create directory " + prefix + ": " +
                                     std::strerror(errno));
        }
    }
}

} // namespace fcg
