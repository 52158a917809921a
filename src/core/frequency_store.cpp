#include "mailclass/frequency_store.hpp"
#include "mailclass/error.hpp"

namespace mailclass {

FrequencyStore::FrequencyStore(bool on_disk)
    : categories_("categories", false)
    , words_("word_count", on_disk) {}

void FrequencyStore::check_category(const std::string& category) {
    if (category == kUnknownCategory) {
        throw ReservedCategoryError(category, "FrequencyStore");
    }
    if (category.empty()) {
        throw ConfigurationError("Category name must not be empty", "FrequencyStore");
    }
}

void FrequencyStore::learn(const std::string& category, const TokenSet& tokens) {
    check_category(category);

    std::unique_lock<std::shared_mutex> cats(categories_.mutex(), std::defer_lock);
    std::unique_lock<std::shared_mutex> words(words_.mutex(), std::defer_lock);
    std::lock(cats, words);

    auto& cb = categories_.backend();
    cb.put(category, cb.get(category).value_or(0) + 1);

    auto& wb = words_.backend();
    for (const auto& token : tokens) {
        CountRecord record = wb.get(token).value_or(CountRecord{});
        ++record[category];
        wb.put(token, record);
    }

    meta_.note_processed();
}

void FrequencyStore::unlearn(const std::string& category, const TokenSet& tokens) {
    check_category(category);

    std::unique_lock<std::shared_mutex> cats(categories_.mutex(), std::defer_lock);
    std::unique_lock<std::shared_mutex> words(words_.mutex(), std::defer_lock);
    std::lock(cats, words);

    auto& cb = categories_.backend();
    if (auto n = cb.get(category); n && *n > 1) {
        cb.put(category, *n - 1);
    } else if (n) {
        cb.erase(category);
    }

    auto& wb = words_.backend();
    for (const auto& token : tokens) {
        auto record = wb.get(token);
        if (!record) continue;
        auto it = record->find(category);
        if (it == record->end()) continue;

        if (it->second > 1) {
            --it->second;
        } else {
            record->erase(it);
        }

        if (record->empty()) {
            wb.erase(token);
        } else {
            wb.put(token, *record);
        }
    }

    // Unlearning is still learning activity as far as the cache is concerned.
    meta_.note_processed();
}

void FrequencyStore::forget() {
    std::unique_lock<std::shared_mutex> cats(categories_.mutex(), std::defer_lock);
    std::unique_lock<std::shared_mutex> words(words_.mutex(), std::defer_lock);
    std::unique_lock<std::shared_mutex> meta(meta_.mutex(), std::defer_lock);
    std::lock(cats, words, meta);

    categories_.backend().clear();
    words_.backend().clear();
    meta_.reset_unlocked();
}

uint64_t FrequencyStore::category_count(const std::string& category) const {
    return categories_.get(category).value_or(0);
}

std::map<std::string, uint64_t> FrequencyStore::categories() const {
    std::map<std::string, uint64_t> out;
    for (auto& [name, count] : categories_.rows()) {
        out[name] = count;
    }
    return out;
}

std::vector<std::string> FrequencyStore::category_names() const {
    std::vector<std::string> names;
    for (const auto& entry : categories()) {
        names.push_back(entry.first);
    }
    return names;
}

std::optional<CountRecord> FrequencyStore::counts(const Token& token) const {
    return words_.get(token);
}

uint64_t FrequencyStore::count(const Token& token, const std::string& category) const {
    auto record = words_.get(token);
    if (!record) return 0;
    auto it = record->find(category);
    return it == record->end() ? 0 : it->second;
}

size_t FrequencyStore::vocabulary_size() const {
    return words_.size();
}

FrequencyStore::Snapshot FrequencyStore::snapshot() const {
    std::shared_lock<std::shared_mutex> cats(categories_.mutex(), std::defer_lock);
    std::shared_lock<std::shared_mutex> words(words_.mutex(), std::defer_lock);
    std::lock(cats, words);

    Snapshot snap;
    for (auto& [name, count] : categories_.rows_unlocked()) {
        snap.categories[name] = count;
    }
    snap.words = words_.rows_unlocked();
    snap.messages_processed = meta_.messages_processed();
    return snap;
}

} // namespace mailclass
