// =============================================================================
// Configuration and Option Tests
// =============================================================================

#include <fstream>
#include <gtest/gtest.h>
#include "mailclass/classifier.hpp"
#include "mailclass/config.hpp"
#include "mailclass/error.hpp"
#include "mailclass/options.hpp"
#include "test_support.hpp"

using namespace mailclass;
using mailclass::testing::TempPath;

class ConfigTest : public ::testing::Test {
protected:
    static void write_file(const std::string& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }
};

// Test typed access and lenient fallback
TEST_F(ConfigTest, TypedGet) {
    Config config;
    config.set("n", "42");
    config.set("p", "0.25");
    config.set("flag", "yes");
    config.set("bad", "4x");

    EXPECT_EQ(config.get<int>("n"), 42);
    EXPECT_DOUBLE_EQ(config.get<double>("p"), 0.25);
    EXPECT_TRUE(config.get<bool>("flag"));
    EXPECT_EQ(config.get<int>("bad", 7), 7);
    EXPECT_EQ(config.get<int>("missing", 3), 3);
}

// Test strict access rejects malformed values
TEST_F(ConfigTest, StrictGet) {
    Config config;
    config.set("bad", "4x");
    config.set("flag", "maybe");
    EXPECT_THROW(config.get_strict<int>("bad"), ConfigurationError);
    EXPECT_THROW(config.get_strict<bool>("flag"), ConfigurationError);
    EXPECT_EQ(config.get_strict<int>("missing", 9), 9);
}

// Test list values split on commas and whitespace
TEST_F(ConfigTest, Lists) {
    Config config;
    config.set("ignored_tokens", "foo, bar  baz,,qux");
    std::vector<std::string> expected = {"foo", "bar", "baz", "qux"};
    EXPECT_EQ(config.get_list("ignored_tokens"), expected);
    EXPECT_TRUE(config.get_list("missing").empty());
}

// Test file loading skips comments and blank lines
TEST_F(ConfigTest, LoadFile) {
    TempPath path("load.cfg");
    write_file(path.str(),
               "# options\n"
               "\n"
               "  debug = 3   # trailing comment\n"
               "minimum_word_prob=0.05\n"
               "no equals sign here\n");

    Config config;
    config.load_file(path.str());
    EXPECT_EQ(config.get<int>("debug"), 3);
    EXPECT_DOUBLE_EQ(config.get<double>("minimum_word_prob"), 0.05);
    EXPECT_EQ(config.values().size(), 2u);
}

// Test a missing file is a resource error
TEST_F(ConfigTest, LoadMissingFile) {
    Config config;
    EXPECT_THROW(config.load_file("/nonexistent/mailclass.cfg"), ResourceError);
}

// Test saved files load back to the same values
TEST_F(ConfigTest, SaveAndLoad) {
    TempPath path("save.cfg");
    Config config;
    config.set("alpha", "1");
    config.set("beta", "two words");
    config.save_file(path.str());

    std::ifstream in(path.str());
    std::string header;
    std::getline(in, header);
    EXPECT_EQ(header.rfind("# mailclass options file created", 0), 0u);

    Config loaded;
    loaded.load_file(path.str());
    EXPECT_EQ(loaded.values(), config.values());
}

// =============================================================================
// ClassifierOptions
// =============================================================================

// Test defaults
TEST_F(ConfigTest, OptionDefaults) {
    ClassifierOptions opts;
    EXPECT_EQ(opts.debug, 0);
    EXPECT_FALSE(opts.on_disk);
    EXPECT_EQ(opts.n_observations_required, 5);
    EXPECT_DOUBLE_EQ(opts.minimum_word_prob, 0.01);
    EXPECT_DOUBLE_EQ(opts.maximum_word_prob, 0.99);
    EXPECT_EQ(opts.score_delay, 1);
    EXPECT_TRUE(opts.ignored_tokens.empty());
    EXPECT_EQ(opts.combiner, CombinerKind::ChiSquare);
    EXPECT_EQ(opts.effective_predictors(), 41);

    opts.combiner = CombinerKind::OddsProduct;
    EXPECT_EQ(opts.effective_predictors(), 15);
    opts.number_of_predictors = 5;
    EXPECT_EQ(opts.effective_predictors(), 5);
}

// Test conversion through a Config keeps every field
TEST_F(ConfigTest, OptionsThroughConfig) {
    ClassifierOptions opts;
    opts.debug = 2;
    opts.n_observations_required = 1;
    opts.number_of_predictors = 7;
    opts.minimum_word_prob = 0.1;
    opts.maximum_word_prob = 0.9;
    opts.score_delay = 10;
    opts.ignored_tokens = {"foo", "bar"};
    opts.combiner = CombinerKind::OddsProduct;
    opts.random_seed = 99;

    ClassifierOptions back = ClassifierOptions::from_config(opts.to_config());
    EXPECT_EQ(back.debug, 2);
    EXPECT_EQ(back.n_observations_required, 1);
    EXPECT_EQ(back.number_of_predictors, 7);
    EXPECT_DOUBLE_EQ(back.minimum_word_prob, 0.1);
    EXPECT_DOUBLE_EQ(back.maximum_word_prob, 0.9);
    EXPECT_EQ(back.score_delay, 10);
    EXPECT_EQ(back.ignored_tokens, opts.ignored_tokens);
    EXPECT_EQ(back.combiner, CombinerKind::OddsProduct);
    EXPECT_EQ(back.random_seed, 99u);
}

// Test out-of-range options are rejected
TEST_F(ConfigTest, OptionValidation) {
    Config config;
    config.set("minimum_word_prob", "0");
    EXPECT_THROW(ClassifierOptions::from_config(config), ConfigurationError);

    config.set("minimum_word_prob", "0.8");
    config.set("maximum_word_prob", "0.2");
    EXPECT_THROW(ClassifierOptions::from_config(config), ConfigurationError);

    Config negative;
    negative.set("score_delay", "-1");
    EXPECT_THROW(ClassifierOptions::from_config(negative), ConfigurationError);

    Config combiner;
    combiner.set("combiner", "majority-vote");
    EXPECT_THROW(ClassifierOptions::from_config(combiner), ConfigurationError);
}

// Test combiner names and aliases
TEST_F(ConfigTest, CombinerNames) {
    EXPECT_EQ(parse_combiner("chi-square"), CombinerKind::ChiSquare);
    EXPECT_EQ(parse_combiner("robinson-fisher"), CombinerKind::ChiSquare);
    EXPECT_EQ(parse_combiner("odds-product"), CombinerKind::OddsProduct);
    EXPECT_EQ(parse_combiner("graham"), CombinerKind::OddsProduct);
    EXPECT_STREQ(combiner_name(CombinerKind::ChiSquare), "chi-square");
}

// Test a rejected update leaves the classifier options untouched
TEST_F(ConfigTest, ClassifierSetConfig) {
    auto classifier = make_classifier(ClassifierKind::Bayes);

    Config good;
    good.set("number_of_predictors", "3");
    classifier->set_config(good);
    EXPECT_EQ(classifier->options().number_of_predictors, 3);

    Config bad;
    bad.set("number_of_predictors", "4");
    bad.set("maximum_word_prob", "1.5");
    EXPECT_THROW(classifier->set_config(bad), ConfigurationError);
    EXPECT_EQ(classifier->options().number_of_predictors, 3);
    EXPECT_DOUBLE_EQ(classifier->options().maximum_word_prob, 0.99);

    // on_disk is fixed once the tables exist
    Config disk;
    disk.set("on_disk", "1");
    classifier->set_config(disk);
    EXPECT_FALSE(classifier->options().on_disk);
}

// Test option files written by one classifier configure another
TEST_F(ConfigTest, ClassifierConfigFiles) {
    TempPath path("classifier.cfg");
    ClassifierOptions opts;
    opts.score_delay = 25;
    opts.combiner = CombinerKind::OddsProduct;
    auto source = make_classifier(ClassifierKind::Bayes, opts);
    source->save_config(path.str());

    auto target = make_classifier(ClassifierKind::Bayes);
    target->load_config(path.str());
    EXPECT_EQ(target->options().score_delay, 25);
    EXPECT_EQ(target->options().combiner, CombinerKind::OddsProduct);
}
