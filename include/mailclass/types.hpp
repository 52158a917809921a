#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mailclass {

// Reserved output category: no category met the confidence threshold.
inline const std::string kUnknownCategory = "UNK";

using Token = std::string;
using TokenSet = std::set<Token>;

// category -> occurrence count of one token
using CountRecord = std::map<std::string, uint64_t>;

struct Predictor {
    double probability = 0.0;
    double significance = 0.0;   // probability squared

    bool operator==(const Predictor& other) const {
        return probability == other.probability && significance == other.significance;
    }
};

// category -> cached predictor of one token
using PredictorRecord = std::map<std::string, Predictor>;

struct CategoryScore {
    std::string category;
    double probability = 0.0;
};

// Sorted descending by probability.
using Scores = std::vector<CategoryScore>;

// A token chosen as evidence while scoring, in rank order.
struct InterestingWord {
    Token token;
    double significance = 0.0;
    PredictorRecord predictors;
};

struct ScoreDetails {
    std::vector<InterestingWord> words;
};

enum class CombinerKind {
    ChiSquare,
    OddsProduct
};

} // namespace mailclass
