#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mailclass {

/**
 * Counts of (true category, predicted category) pairs. Predictions below
 * the threshold are counted under UNK.
 */
class ConfusionMatrix {
public:
    using Row = std::map<std::string, uint64_t>;

    ConfusionMatrix() = default;

    // One row per category, each with a zero cell for every category and UNK.
    explicit ConfusionMatrix(const std::vector<std::string>& categories);

    void add(const std::string& actual, const std::string& predicted);

    uint64_t count(const std::string& actual, const std::string& predicted) const;
    uint64_t row_total(const std::string& actual) const;
    uint64_t total() const;

    // Fraction of documents on the diagonal; 0 for an empty matrix.
    double accuracy() const;
    // Fraction of the row predicted correctly; 0 for an empty row.
    double row_accuracy(const std::string& actual) const;

    const std::map<std::string, Row>& rows() const { return rows_; }

    // One line per true category: "CAT\t: 93.10%\tCAT: 27\tOTHER: 1\tUNK: 1"
    std::string report() const;

private:
    std::map<std::string, Row> rows_;
};

} // namespace mailclass
