#pragma once

#include "metrics/metric_result.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace fcg {

/**
 * @brief Format a score for tabular output
 *
 * 10 significant digits in the classic locale; NaN becomes an empty cell.
 */
std::string format_number(double value);

/**
 * @brief Named table of cells
 *
 * Each cell keeps its text for delimited output and a JSON value for the
 * mirror: labels stay strings, scores are numbers and NaN is null.
 */
class ResultTable {
public:
    ResultTable() = default;
    ResultTable(std::string name, std::vector<std::string> columns)
        : name_(std::move(name)), columns_(std::move(columns)) {}

    const std::string& name() const { return name_; }
    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }
    size_t num_rows() const { return rows_.size(); }

    /**
     * @brief Append a row
     * @throws std::invalid_argument if the row width differs from the header
     */
    void add_row(std::vector<std::string> row);

    /**
     * @brief Append text labels followed by numeric scores
     * @throws std::invalid_argument if the row width differs from the header
     */
    void add_scores(std::vector<std::string> labels, const std::vector<double>& scores);

    /**
     * @brief Header line then one line per row; cells holding the delimiter,
     * quotes or line breaks are quoted
     */
    void write_delimited(std::ostream& out, char delimiter) const;
    void write_delimited(const std::string& path, char delimiter) const;

    /**
     * @brief Array of row objects keyed by column name
     */
    nlohmann::json to_json() const;

private:
    std::string name_;
    std::vector<std::string> columns_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<std::vector<nlohmann::json>> values_;
};

// A metric that produced no result for one animal
struct SkippedMetric {
    AnimalId animal;
    MetricKind kind;
    std::string reason;
};

/**
 * @brief Per-animal metric results collected into one table per metric
 *
 * Tables are laid out when requested: the "Animal" column is present when the
 * input carried one or when the results span more than one animal. Every
 * requested metric gets a table, even when all animals were skipped.
 */
class ResultSet {
public:
    explicit ResultSet(bool input_has_animal_column = false,
                       std::vector<MetricKind> requested = {})
        : input_has_animal_column_(input_has_animal_column),
          requested_(std::move(requested)) {}

    void add(MetricResult result);
    void add_skipped(const AnimalId& animal, MetricKind kind, std::string reason);

    const std::vector<MetricResult>& results() const { return results_; }
    const std::vector<SkippedMetric>& skipped() const { return skipped_; }
    bool empty() const { return results_.empty(); }

    /**
     * @brief Requested metrics, then any other metric present in order of
     * first addition
     */
    std::vector<MetricKind> metrics() const;

    /**
     * @brief Distinct animals, in order of first addition
     */
    std::vector<AnimalId> animals() const;

    bool include_animal_column() const;

    /**
     * @brief Rows of every animal for one metric
     */
    ResultTable table(MetricKind kind) const;

    /**
     * @brief Graph-level scalars: Animal, Metric, Statistic, Value
     *
     * Iterative metrics also report "Converged" (1/0) and "Iterations";
     * skipped metrics report "Skipped" = 1.
     */
    ResultTable summary_table() const;

    nlohmann::json to_json() const;

    /**
     * @brief Write <metric>.<format> per metric plus summary.<format>, and the
     * JSON mirrors when requested
     * @param format "csv" or "tsv"
     * @return Paths written
     * @throws std::runtime_error on I/O failure or unknown format
     */
    std::vector<std::string> save(const std::string& directory,
                                  const std::string& format = "csv",
                                  bool write_json = true) const;

private:
    bool input_has_animal_column_;
    std::vector<MetricKind> requested_;
    std::vector<MetricResult> results_;
    std::vector<SkippedMetric> skipped_;
};

/**
 * @brief Create a directory and its missing parents
 * @throws std::runtime_error if a component cannot be created
 */
void ensure_directory(const std::string& path);

} // namespace fcg
