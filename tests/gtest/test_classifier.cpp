// =============================================================================
// Classifier Variant Tests
// =============================================================================

#include <atomic>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "mailclass/bayes_classifier.hpp"
#include "mailclass/error.hpp"
#include "mailclass/trivial_classifier.hpp"
#include "test_support.hpp"

using namespace mailclass;
using mailclass::testing::binary_doc;
using mailclass::testing::text_doc;

class BayesClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.n_observations_required = 1;
        options_.combiner = CombinerKind::OddsProduct;
        options_.number_of_predictors = 1;
    }

    void learn_viagra_corpus(Classifier& classifier) {
        for (int i = 0; i < 4; ++i) classifier.learn("SPAM", text_doc("viagra now"));
        classifier.learn("SPAM", text_doc("now"));
        for (int i = 0; i < 5; ++i) classifier.learn("NOTSPAM", text_doc("quarterly meeting"));
    }

    ClassifierOptions options_;
};

// Test validity requires a text part
TEST_F(BayesClassifierTest, Validity) {
    BayesClassifier classifier(options_);
    EXPECT_TRUE(classifier.is_valid(text_doc("hello")));
    EXPECT_FALSE(classifier.is_valid(binary_doc()));
    EXPECT_FALSE(classifier.is_valid(Document{}));
}

// Test learning and scoring whole documents
TEST_F(BayesClassifierTest, LearnAndScore) {
    BayesClassifier classifier(options_);
    EXPECT_TRUE(classifier.empty());
    learn_viagra_corpus(classifier);
    EXPECT_FALSE(classifier.empty());

    ScoreDetails details;
    Scores scores = classifier.score(text_doc("viagra"), details);
    ASSERT_FALSE(scores.empty());
    EXPECT_EQ(scores[0].category, "SPAM");
    EXPECT_NEAR(scores[0].probability, 0.99, 1e-12);
    ASSERT_EQ(details.words.size(), 1u);
    EXPECT_EQ(details.words[0].token, "viagra");
}

// Test scoring an untrained classifier yields nothing
TEST_F(BayesClassifierTest, ScoreUntrained) {
    BayesClassifier classifier(options_);
    EXPECT_TRUE(classifier.score(text_doc("viagra")).empty());
}

// Test the reserved category is refused without side effects
TEST_F(BayesClassifierTest, ReservedCategory) {
    BayesClassifier classifier(options_);
    EXPECT_THROW(classifier.learn("UNK", text_doc("viagra")), ConfigurationError);
    EXPECT_THROW(classifier.unlearn("UNK", text_doc("viagra")), ConfigurationError);
    EXPECT_THROW(classifier.set_bias("UNK", 2.0), ConfigurationError);
    EXPECT_TRUE(classifier.empty());
}

// Test unlearn undoes learn
TEST_F(BayesClassifierTest, Unlearn) {
    BayesClassifier classifier(options_);
    learn_viagra_corpus(classifier);
    auto before = classifier.store().snapshot();

    Document doc = text_doc("viagra cheap pills");
    classifier.learn("SPAM", doc);
    classifier.unlearn("SPAM", doc);

    auto after = classifier.store().snapshot();
    EXPECT_EQ(after.categories, before.categories);
    EXPECT_EQ(after.words.size(), before.words.size());
    EXPECT_EQ(after.messages_processed, before.messages_processed + 2);
}

// Test forget clears counts and predictors but keeps biases and options
TEST_F(BayesClassifierTest, Forget) {
    BayesClassifier classifier(options_);
    learn_viagra_corpus(classifier);
    classifier.set_bias("SPAM", 2.0);
    classifier.update_predictors();
    EXPECT_GT(classifier.predictors().size(), 0u);

    classifier.forget();
    EXPECT_TRUE(classifier.empty());
    EXPECT_EQ(classifier.predictors().size(), 0u);
    EXPECT_EQ(classifier.store().vocabulary_size(), 0u);
    EXPECT_EQ(classifier.store().meta().messages_processed(), 0u);
    EXPECT_DOUBLE_EQ(classifier.bias("SPAM"), 2.0);
    EXPECT_EQ(classifier.options().number_of_predictors, 1);
}

// Test biases shift scores toward the biased category
TEST_F(BayesClassifierTest, BiasShiftsScores) {
    options_.combiner = CombinerKind::ChiSquare;
    options_.number_of_predictors = 0;
    BayesClassifier classifier(options_);
    for (int i = 0; i < 3; ++i) {
        classifier.learn("A", text_doc("shared alpha"));
        classifier.learn("B", text_doc("shared beta"));
    }
    auto a_score = [&]() {
        for (const auto& s : classifier.score(text_doc("shared"))) {
            if (s.category == "A") return s.probability;
        }
        return -1.0;
    };

    double neutral = a_score();
    EXPECT_FALSE(classifier.set_bias("A", -1.0));
    EXPECT_TRUE(classifier.set_bias("A", 4.0));
    classifier.update_predictors();
    EXPECT_GT(a_score(), neutral);
}

// Test a bias change is used by the next score without a manual rebuild
TEST_F(BayesClassifierTest, BiasAppliesOnNextScore) {
    options_.combiner = CombinerKind::ChiSquare;
    options_.number_of_predictors = 0;
    options_.score_delay = 1000;
    BayesClassifier classifier(options_);
    for (int i = 0; i < 3; ++i) {
        classifier.learn("A", text_doc("shared alpha"));
        classifier.learn("B", text_doc("shared beta"));
    }
    auto a_score = [&]() {
        for (const auto& s : classifier.score(text_doc("shared"))) {
            if (s.category == "A") return s.probability;
        }
        return -1.0;
    };

    double neutral = a_score();
    ASSERT_TRUE(classifier.set_bias("A", 4.0));
    EXPECT_GT(a_score(), neutral);
}

// Test clones are deep copies
TEST_F(BayesClassifierTest, Clone) {
    BayesClassifier classifier(options_);
    learn_viagra_corpus(classifier);
    classifier.set_bias("NOTSPAM", 3.0);

    auto copy = classifier.clone();
    auto* bayes_copy = dynamic_cast<BayesClassifier*>(copy.get());
    ASSERT_NE(bayes_copy, nullptr);
    EXPECT_EQ(bayes_copy->store().categories(), classifier.store().categories());
    EXPECT_EQ(bayes_copy->store().meta().messages_processed(),
              classifier.store().meta().messages_processed());
    EXPECT_DOUBLE_EQ(bayes_copy->bias("NOTSPAM"), 3.0);

    copy->learn("SPAM", text_doc("viagra"));
    EXPECT_EQ(bayes_copy->store().category_count("SPAM"), 6u);
    EXPECT_EQ(classifier.store().category_count("SPAM"), 5u);
}

// Test disk-backed tables give the same scores as memory tables
TEST_F(BayesClassifierTest, DiskBackedMatchesMemory) {
    BayesClassifier memory(options_);
    ClassifierOptions disk_options = options_;
    disk_options.on_disk = true;
    BayesClassifier disk(disk_options);
    EXPECT_TRUE(disk.store().word_table().on_disk());
    EXPECT_TRUE(disk.predictors().table().on_disk());

    learn_viagra_corpus(memory);
    learn_viagra_corpus(disk);

    Scores a = memory.score(text_doc("viagra meeting"));
    Scores b = disk.score(text_doc("viagra meeting"));
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].category, b[i].category);
        EXPECT_DOUBLE_EQ(a[i].probability, b[i].probability);
    }
}

// Test a combiner change takes effect on the next score
TEST_F(BayesClassifierTest, CombinerSwitch) {
    BayesClassifier classifier(options_);
    learn_viagra_corpus(classifier);
    for (const auto& s : classifier.score(text_doc("unseen"))) {
        EXPECT_DOUBLE_EQ(s.probability, 0.0);
    }
    Config config;
    config.set("combiner", "chi-square");
    classifier.set_config(config);
    for (const auto& s : classifier.score(text_doc("unseen"))) {
        EXPECT_DOUBLE_EQ(s.probability, 0.5);
    }
}

// Test concurrent learners and scorers keep consistent counts
TEST_F(BayesClassifierTest, ConcurrentLearnAndScore) {
    options_.score_delay = 0;
    BayesClassifier classifier(options_);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&classifier, t]() {
            const std::string category = t % 2 == 0 ? "SPAM" : "NOTSPAM";
            for (int i = 0; i < kPerThread; ++i) {
                classifier.learn(category, text_doc(t % 2 == 0 ? "viagra offer" : "meeting notes"));
                classifier.score(text_doc("viagra meeting"));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(classifier.store().category_count("SPAM"), 100u);
    EXPECT_EQ(classifier.store().category_count("NOTSPAM"), 100u);
    EXPECT_EQ(classifier.store().count("viagra", "SPAM"), 100u);
    EXPECT_EQ(classifier.store().meta().messages_processed(), 200u);
}

// Test options can change while other threads score and learn
TEST_F(BayesClassifierTest, ConcurrentSetConfig) {
    options_.score_delay = 0;
    BayesClassifier classifier(options_);
    learn_viagra_corpus(classifier);

    std::atomic<bool> done{false};
    std::vector<std::thread> threads;
    threads.emplace_back([&]() {
        while (!done) {
            Scores scores = classifier.score(text_doc("viagra meeting"));
            ASSERT_FALSE(scores.empty());
        }
    });
    threads.emplace_back([&]() {
        for (int i = 0; i < 200; ++i) {
            classifier.learn("SPAM", text_doc("viagra offer"));
        }
    });

    Config chi;
    chi.set("combiner", "chi-square");
    chi.set("ignored_tokens", "offer");
    Config odds;
    odds.set("combiner", "odds-product");
    odds.set("ignored_tokens", "");
    for (int i = 0; i < 200; ++i) {
        classifier.set_config(i % 2 == 0 ? chi : odds);
        classifier.set_debug(0);
    }
    threads[1].join();
    done = true;
    threads[0].join();

    EXPECT_EQ(classifier.options().combiner, CombinerKind::OddsProduct);
    EXPECT_EQ(classifier.debug(), 0);
    EXPECT_EQ(classifier.store().category_count("SPAM"), 205u);
    EXPECT_EQ(classifier.store().count("viagra", "SPAM"), 204u);
}

// Test the kind names and factory
TEST(ClassifierFactoryTest, Kinds) {
    EXPECT_EQ(make_classifier(ClassifierKind::Bayes)->kind(), ClassifierKind::Bayes);
    EXPECT_EQ(make_classifier(ClassifierKind::Trivial)->kind(), ClassifierKind::Trivial);
    EXPECT_EQ(parse_classifier_kind("trivial"), ClassifierKind::Trivial);
    EXPECT_STREQ(classifier_kind_name(ClassifierKind::Bayes), "bayes");
    EXPECT_THROW(parse_classifier_kind("neural"), ConfigurationError);

    ClassifierOptions bad;
    bad.minimum_word_prob = 2.0;
    EXPECT_THROW(make_classifier(ClassifierKind::Bayes, bad), ConfigurationError);
}

// =============================================================================
// Trivial classifier
// =============================================================================

class TrivialClassifierTest : public ::testing::Test {};

// Test an untrained baseline answers UNK
TEST_F(TrivialClassifierTest, Untrained) {
    TrivialClassifier classifier;
    Scores scores = classifier.score(text_doc("anything"));
    ASSERT_EQ(scores.size(), 1u);
    EXPECT_EQ(scores[0].category, kUnknownCategory);
    EXPECT_DOUBLE_EQ(scores[0].probability, 1.0);
}

// Test a single category is always picked
TEST_F(TrivialClassifierTest, SingleCategory) {
    TrivialClassifier classifier;
    classifier.learn("SPAM", text_doc("x1"));
    classifier.learn("SPAM", text_doc("x2"));
    for (int i = 0; i < 10; ++i) {
        Scores scores = classifier.score(text_doc("y"));
        ASSERT_EQ(scores.size(), 1u);
        EXPECT_EQ(scores[0].category, "SPAM");
        EXPECT_DOUBLE_EQ(scores[0].probability, 1.0);
    }
}

// Test the same seed gives the same picks
TEST_F(TrivialClassifierTest, Reproducible) {
    ClassifierOptions options;
    options.random_seed = 7;
    TrivialClassifier a(options);
    TrivialClassifier b(options);
    for (auto* c : {&a, &b}) {
        for (int i = 0; i < 3; ++i) c->learn("SPAM", text_doc("s"));
        for (int i = 0; i < 2; ++i) c->learn("HAM", text_doc("h"));
    }
    int spam = 0;
    for (int i = 0; i < 200; ++i) {
        std::string pick = a.score(text_doc("q"))[0].category;
        EXPECT_EQ(pick, b.score(text_doc("q"))[0].category);
        if (pick == "SPAM") ++spam;
    }
    // Weighted 3:2
    EXPECT_GT(spam, 80);
    EXPECT_LT(spam, 160);
}

// Test counts, unlearn and forget
TEST_F(TrivialClassifierTest, Counts) {
    TrivialClassifier classifier;
    EXPECT_TRUE(classifier.is_valid(binary_doc()));
    EXPECT_TRUE(classifier.parse(text_doc("words here")).empty());
    classifier.learn("HAM", text_doc("a1"));
    classifier.unlearn("HAM", text_doc("a1"));
    classifier.unlearn("HAM", text_doc("a1"));
    EXPECT_EQ(classifier.category_count("HAM"), 0u);
    EXPECT_THROW(classifier.learn("UNK", text_doc("a1")), ReservedCategoryError);

    classifier.learn("HAM", text_doc("a1"));
    classifier.forget();
    EXPECT_TRUE(classifier.empty());
}
