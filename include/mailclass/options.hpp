#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "mailclass/config.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

/**
 * Typed classifier options.
 *
 * Option names in config files match the field names. `number_of_predictors`
 * left at 0 selects the combiner's default (41 for chi-square, 15 for the
 * odds product).
 */
struct ClassifierOptions {
    int debug = 0;
    bool on_disk = false;
    int64_t n_observations_required = 5;
    int number_of_predictors = 0;
    double minimum_word_prob = 0.01;
    double maximum_word_prob = 0.99;
    int64_t score_delay = 1;
    std::vector<std::string> ignored_tokens;
    CombinerKind combiner = CombinerKind::ChiSquare;
    uint32_t random_seed = 23;

    int effective_predictors() const;

    // Throws ConfigurationError on out-of-range values.
    void validate() const;

    static ClassifierOptions from_config(const Config& config);
    Config to_config() const;
};

const char* combiner_name(CombinerKind kind);

// Throws ConfigurationError for unknown names.
CombinerKind parse_combiner(const std::string& name);

} // namespace mailclass
