#ifndef EDGE_RECORD_HPP
#define EDGE_RECORD_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fcg {

using NeuronId = std::string;
using AnimalId = std::string;

// Animal key used when the input table carries no animal column
inline const AnimalId kDefaultAnimal = "all";

/**
 * @brief One weighted connection between two neurons of one animal
 */
struct EdgeRecord {
    AnimalId animal = kDefaultAnimal;
    NeuronId source;
    NeuronId target;
    double weight = 0.0;                               // Always finite
};

/**
 * @brief Undecoded row as delivered by the table reader
 */
struct RawEdgeRow {
    std::string animal;                                // Empty -> kDefaultAnimal
    std::string pair;                                  // e.g. "(1, 2)"
    std::string weight;                                // e.g. "0.42"
    size_t row_number = 0;                             // 1-based data row, 0 if unknown
};

// ==========================================
// Parser Errors
// ==========================================

/**
 * @brief The pair cell could not be decoded into exactly two identifiers
 */
class MalformedPairError : public std::runtime_error {
public:
    MalformedPairError(const std::string& text, size_t row_number);

    const std::string& text() const { return text_; }
    size_t row_number() const { return row_number_; }

private:
    std::string text_;
    size_t row_number_;
};

/**
 * @brief The weight cell is non-numeric or not finite
 */
class InvalidWeightError : public std::runtime_error {
public:
    InvalidWeightError(const std::string& text, size_t row_number, const std::string& reason);

    const std::string& text() const { return text_; }
    size_t row_number() const { return row_number_; }

private:
    std::string text_;
    size_t row_number_;
};

// ==========================================
// Parsing
// ==========================================

/**
 * @brief Decode a pair cell such as "(1, 2)", "[a, b]" or "('x', 'y')"
 * @throws MalformedPairError unless exactly two non-empty identifiers remain
 */
std::pair<NeuronId, NeuronId> parse_neuron_pair(const std::string& text, size_t row_number = 0);

/**
 * @brief Parse a weight cell in the classic locale, rejecting NaN and infinities
 * @throws InvalidWeightError
 */
double parse_edge_weight(const std::string& text, size_t row_number = 0);

/**
 * @brief Validate and normalize raw rows into edge records
 *
 * The first bad row aborts the whole load.
 */
std::vector<EdgeRecord> parse_edge_records(const std::vector<RawEdgeRow>& rows);

} // namespace fcg

#endif // EDGE_RECORD_HPP
