#pragma once

#include "graph/edge_record.hpp"
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fcg {

/**
 * @brief Structural problem with an input table (missing file, column, ragged row)
 */
class EdgeTableError : public std::runtime_error {
public:
    explicit EdgeTableError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Header names of the input columns (matched case-insensitively)
 */
struct EdgeTableColumns {
    std::string animal = "Animal";                     ///< Optional column
    std::string pair = "Neuron Pair";
    std::string weight = "Mean Edge Weight";
};

/**
 * @brief Undecoded content of one input table
 */
struct EdgeTable {
    std::vector<std::string> header;
    std::vector<RawEdgeRow> rows;
    bool has_animal_column = false;
    char delimiter = ',';
};

/**
 * @brief Reads delimited-text edge tables (CSV, TSV, semicolon separated)
 *
 * The delimiter is detected from the header line. Fields may be quoted with
 * '"' (doubled quotes escape), which is how pair cells such as "(1, 2)" survive
 * a comma delimiter. Blank lines and lines starting with '#' are skipped.
 * Records span a single line.
 */
class EdgeTableReader {
public:
    explicit EdgeTableReader(EdgeTableColumns columns = EdgeTableColumns{})
        : columns_(std::move(columns)) {}

    /**
     * @brief Read a table from disk
     * @throws EdgeTableError
     */
    EdgeTable read(const std::string& path) const;

    /**
     * @brief Read a table from a stream
     * @throws EdgeTableError
     */
    EdgeTable parse(std::istream& in) const;

private:
    EdgeTableColumns columns_;
};

/**
 * @brief Pick ',', ';' or '\t' by counting occurrences outside quotes
 */
char detect_delimiter(const std::string& header_line);

/**
 * @brief Split one line into fields, honouring double-quoted fields
 */
std::vector<std::string> split_delimited_line(const std::string& line, char delimiter);

} // namespace fcg
