#include "mailclass/bayes_classifier.hpp"

#include <algorithm>
#include "mailclass/logging.hpp"
#include "mailclass/snapshot.hpp"

namespace mailclass {

BayesClassifier::BayesClassifier(const ClassifierOptions& options)
    : Classifier(options)
    , tokenizer_(options.ignored_tokens)
    , store_(options.on_disk)
    , cache_(options.on_disk)
    , scorer_(std::make_unique<Scorer>(store_, bias_, cache_, options_)) {}

void BayesClassifier::on_options_changed() {
    tokenizer_ = TokenExtractor(options_.ignored_tokens);
    scorer_ = std::make_unique<Scorer>(store_, bias_, cache_, options_);
}

bool BayesClassifier::is_valid(const Document& doc) const {
    return std::any_of(doc.parts.begin(), doc.parts.end(),
                       [](const BodyPart& part) { return part.is_text(); });
}

TokenSet BayesClassifier::parse(const Document& doc) const {
    auto guard = read_options();
    return tokenize(doc);
}

TokenSet BayesClassifier::tokenize(const Document& doc) const {
    TokenSet tokens = tokenizer_.extract(doc);
    if (trace_enabled(options_.debug, TraceLevel::Token)) {
        for (const auto& token : tokens) {
            LOG_INFO("Token: ", token);
        }
    }
    return tokens;
}

void BayesClassifier::learn(const std::string& category, const Document& doc) {
    FrequencyStore::check_category(category);
    auto guard = read_options();
    TokenSet tokens = tokenize(doc);
    LOG_TRACE(options_.debug, Flow, "Learning ", doc.id.empty() ? "message" : doc.id, " as ", category,
              " (", tokens.size(), " tokens)");
    store_.learn(category, tokens);
}

void BayesClassifier::unlearn(const std::string& category, const Document& doc) {
    FrequencyStore::check_category(category);
    auto guard = read_options();
    TokenSet tokens = tokenize(doc);
    LOG_TRACE(options_.debug, Flow, "Unlearning ", doc.id.empty() ? "message" : doc.id, " as ", category);
    store_.unlearn(category, tokens);
}

Scores BayesClassifier::score(const Document& doc) {
    ScoreDetails details;
    return score(doc, details);
}

Scores BayesClassifier::score(const Document& doc, ScoreDetails& details) {
    auto guard = read_options();
    Scores scores = scorer_->score(tokenize(doc), &details);
    if (!scores.empty()) {
        LOG_TRACE(options_.debug, Flow, "Scored ", doc.id.empty() ? "message" : doc.id, ": ",
                  scores.front().category, " ", scores.front().probability, " from ",
                  details.words.size(), " predictors");
    }
    return scores;
}

void BayesClassifier::forget() {
    auto guard = read_options();
    {
        auto all = lock_all();
        store_.category_table().backend().clear();
        store_.word_table().backend().clear();
        store_.meta().reset_unlocked();
        cache_.table().backend().clear();
    }
    LOG_TRACE(options_.debug, Flow, "Forgot all learned messages");
}

bool BayesClassifier::empty() const {
    return store_.meta().messages_processed() == 0 && store_.category_table().size() == 0;
}

size_t BayesClassifier::update_predictors() {
    auto guard = read_options();
    return cache_.refresh(store_, bias_, refresh_params(options_));
}

bool BayesClassifier::set_bias(const std::string& category, double value) {
    FrequencyStore::check_category(category);
    return bias_.set(category, value);
}

BayesClassifier::AllTablesLock BayesClassifier::lock_all() const {
    return AllTablesLock(store_.category_table().mutex(), store_.word_table().mutex(),
                         store_.meta().mutex(), bias_.table().mutex(), cache_.table().mutex());
}

std::unique_ptr<Classifier> BayesClassifier::clone() const {
    auto guard = read_options();
    auto copy = std::make_unique<BayesClassifier>(options_);

    auto all = lock_all();
    copy->store_.category_table().replace_all(store_.category_table().rows_unlocked());
    copy->store_.word_table().replace_all(store_.word_table().rows_unlocked());
    copy->bias_.table().replace_all(bias_.table().rows_unlocked());
    copy->cache_.table().replace_all(cache_.table().rows_unlocked());

    const CacheMeta& meta = store_.meta();
    std::unique_lock<std::shared_mutex> copy_meta(copy->store_.meta().mutex());
    copy->store_.meta().restore_unlocked(meta.processed_unlocked(), meta.scored_unlocked());
    return copy;
}

void BayesClassifier::save(const std::string& path) const {
    auto guard = read_options();
    SnapshotWriter writer(classifier_kind_name(kind()));
    writer.write_options(options_.to_config());
    {
        auto all = lock_all();
        writer.write_table(store_.category_table());
        writer.write_table(bias_.table());
        writer.write_u64(store_.meta().processed_unlocked());
        writer.write_u64(store_.meta().scored_unlocked());
        writer.write_table(store_.word_table());
        writer.write_table(cache_.table());
    }
    writer.commit(path);
    LOG_TRACE(options_.debug, Flow, "Saved classifier to ", path);
}

void BayesClassifier::restore(SnapshotReader& reader) {
    auto all = lock_all();
    reader.read_table(store_.category_table());
    reader.read_table(bias_.table());
    const uint64_t processed = reader.read_u64();
    const uint64_t scored = reader.read_u64();
    store_.meta().restore_unlocked(processed, scored);
    reader.read_table(store_.word_table());
    reader.read_table(cache_.table());
    reader.finish();
}

} // namespace mailclass
