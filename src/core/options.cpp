#include "mailclass/options.hpp"

#include <sstream>

namespace mailclass {

static constexpr int kChiSquarePredictors = 41;
static constexpr int kOddsProductPredictors = 15;

const char* combiner_name(CombinerKind kind) {
    switch (kind) {
        case CombinerKind::ChiSquare: return "chi-square";
        case CombinerKind::OddsProduct: return "odds-product";
    }
    return "unknown";
}

CombinerKind parse_combiner(const std::string& name) {
    if (name == "chi-square" || name == "robinson-fisher") return CombinerKind::ChiSquare;
    if (name == "odds-product" || name == "graham") return CombinerKind::OddsProduct;
    throw ConfigurationError("Unknown combiner '" + name + "'", "parse_combiner",
                             "Use 'chi-square' or 'odds-product'");
}

int ClassifierOptions::effective_predictors() const {
    if (number_of_predictors > 0) return number_of_predictors;
    return combiner == CombinerKind::ChiSquare ? kChiSquarePredictors : kOddsProductPredictors;
}

void ClassifierOptions::validate() const {
    MAILCLASS_CHECK_CONFIG(debug >= 0, "debug must be >= 0");
    MAILCLASS_CHECK_CONFIG(n_observations_required >= 0, "n_observations_required must be >= 0");
    MAILCLASS_CHECK_CONFIG(number_of_predictors >= 0, "number_of_predictors must be >= 0");
    MAILCLASS_CHECK_CONFIG(score_delay >= 0, "score_delay must be >= 0");
    MAILCLASS_CHECK_CONFIG(minimum_word_prob > 0.0 && minimum_word_prob < 1.0,
                           "minimum_word_prob must lie in (0,1)");
    MAILCLASS_CHECK_CONFIG(maximum_word_prob > 0.0 && maximum_word_prob < 1.0,
                           "maximum_word_prob must lie in (0,1)");
    MAILCLASS_CHECK_CONFIG(minimum_word_prob <= maximum_word_prob,
                           "minimum_word_prob must not exceed maximum_word_prob");
}

ClassifierOptions ClassifierOptions::from_config(const Config& config) {
    ClassifierOptions opts;
    opts.debug = config.get_strict<int>("debug", opts.debug);
    opts.on_disk = config.get_strict<bool>("on_disk", opts.on_disk);
    opts.n_observations_required = config.get_strict<long long>(
        "n_observations_required", opts.n_observations_required);
    opts.number_of_predictors = config.get_strict<int>("number_of_predictors", opts.number_of_predictors);
    opts.minimum_word_prob = config.get_strict<double>("minimum_word_prob", opts.minimum_word_prob);
    opts.maximum_word_prob = config.get_strict<double>("maximum_word_prob", opts.maximum_word_prob);
    opts.score_delay = config.get_strict<long long>("score_delay", opts.score_delay);
    opts.ignored_tokens = config.get_list("ignored_tokens");
    if (config.has("combiner")) {
        opts.combiner = parse_combiner(config.get<std::string>("combiner"));
    }
    long long seed = config.get_strict<long long>("random_seed", opts.random_seed);
    MAILCLASS_CHECK_CONFIG(seed >= 0, "random_seed must be >= 0");
    opts.random_seed = static_cast<uint32_t>(seed);

    opts.validate();
    return opts;
}

Config ClassifierOptions::to_config() const {
    Config config;
    config.set("debug", std::to_string(debug));
    config.set("on_disk", on_disk ? "1" : "0");
    config.set("n_observations_required", std::to_string(n_observations_required));
    config.set("number_of_predictors", std::to_string(number_of_predictors));

    std::ostringstream min_p, max_p;
    min_p.precision(17);
    max_p.precision(17);
    min_p << minimum_word_prob;
    max_p << maximum_word_prob;
    config.set("minimum_word_prob", min_p.str());
    config.set("maximum_word_prob", max_p.str());

    config.set("score_delay", std::to_string(score_delay));

    std::string ignored;
    for (const auto& token : ignored_tokens) {
        if (!ignored.empty()) ignored += ",";
        ignored += token;
    }
    config.set("ignored_tokens", ignored);
    config.set("combiner", combiner_name(combiner));
    config.set("random_seed", std::to_string(random_seed));
    return config;
}

} // namespace mailclass
