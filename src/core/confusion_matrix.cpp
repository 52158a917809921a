#include "mailclass/confusion_matrix.hpp"

#include <iomanip>
#include <sstream>
#include "mailclass/types.hpp"

namespace mailclass {

ConfusionMatrix::ConfusionMatrix(const std::vector<std::string>& categories) {
    for (const auto& actual : categories) {
        Row& row = rows_[actual];
        row[kUnknownCategory] = 0;
        for (const auto& predicted : categories) {
            row[predicted] = 0;
        }
    }
}

void ConfusionMatrix::add(const std::string& actual, const std::string& predicted) {
    ++rows_[actual][predicted];
}

uint64_t ConfusionMatrix::count(const std::string& actual, const std::string& predicted) const {
    auto row = rows_.find(actual);
    if (row == rows_.end()) return 0;
    auto cell = row->second.find(predicted);
    return cell == row->second.end() ? 0 : cell->second;
}

uint64_t ConfusionMatrix::row_total(const std::string& actual) const {
    auto row = rows_.find(actual);
    if (row == rows_.end()) return 0;
    uint64_t sum = 0;
    for (const auto& cell : row->second) sum += cell.second;
    return sum;
}

uint64_t ConfusionMatrix::total() const {
    uint64_t sum = 0;
    for (const auto& row : rows_) sum += row_total(row.first);
    return sum;
}

double ConfusionMatrix::accuracy() const {
    const uint64_t n = total();
    if (n == 0) return 0.0;
    uint64_t correct = 0;
    for (const auto& row : rows_) correct += count(row.first, row.first);
    return static_cast<double>(correct) / static_cast<double>(n);
}

double ConfusionMatrix::row_accuracy(const std::string& actual) const {
    const uint64_t n = row_total(actual);
    if (n == 0) return 0.0;
    return static_cast<double>(count(actual, actual)) / static_cast<double>(n);
}

std::string ConfusionMatrix::report() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    for (const auto& [actual, row] : rows_) {
        out << actual << "\t: " << row_accuracy(actual) * 100.0 << "%";
        for (const auto& [predicted, n] : row) {
            out << "\t" << predicted << ": " << n;
        }
        out << "\n";
    }
    return out.str();
}

} // namespace mailclass
