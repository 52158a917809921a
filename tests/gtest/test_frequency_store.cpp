// =============================================================================
// Frequency Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include "mailclass/error.hpp"
#include "mailclass/frequency_store.hpp"

using namespace mailclass;

class FrequencyStoreTest : public ::testing::Test {
protected:
    FrequencyStore store_;
};

// Test learn increments category, token counts and processed messages
TEST_F(FrequencyStoreTest, Learn) {
    store_.learn("SPAM", {"viagra", "cheap"});
    store_.learn("SPAM", {"viagra"});
    store_.learn("NOTSPAM", {"meeting"});

    EXPECT_EQ(store_.category_count("SPAM"), 2u);
    EXPECT_EQ(store_.category_count("NOTSPAM"), 1u);
    EXPECT_EQ(store_.count("viagra", "SPAM"), 2u);
    EXPECT_EQ(store_.count("cheap", "SPAM"), 1u);
    EXPECT_EQ(store_.count("viagra", "NOTSPAM"), 0u);
    EXPECT_EQ(store_.vocabulary_size(), 3u);
    EXPECT_EQ(store_.meta().messages_processed(), 3u);

    std::vector<std::string> expected = {"NOTSPAM", "SPAM"};
    EXPECT_EQ(store_.category_names(), expected);
}

// Test unlearn right after learn restores the counts but not the counter
TEST_F(FrequencyStoreTest, UnlearnRestores) {
    store_.learn("SPAM", {"viagra"});
    auto categories_before = store_.categories();
    auto vocabulary_before = store_.vocabulary_size();
    auto viagra_before = store_.counts("viagra");
    uint64_t processed_before = store_.meta().messages_processed();

    store_.learn("SPAM", {"viagra", "fresh"});
    store_.unlearn("SPAM", {"viagra", "fresh"});

    EXPECT_EQ(store_.categories(), categories_before);
    EXPECT_EQ(store_.vocabulary_size(), vocabulary_before);
    EXPECT_EQ(store_.counts("viagra"), viagra_before);
    EXPECT_FALSE(store_.counts("fresh").has_value());
    EXPECT_EQ(store_.meta().messages_processed(), processed_before + 2);
}

// Test unlearn of a category that was first seen in that learn
TEST_F(FrequencyStoreTest, UnlearnNewCategory) {
    store_.learn("HAM", {"lunch"});
    store_.unlearn("HAM", {"lunch"});
    EXPECT_TRUE(store_.categories().empty());
    EXPECT_EQ(store_.vocabulary_size(), 0u);
}

// Test unlearn saturates at zero
TEST_F(FrequencyStoreTest, UnlearnSaturates) {
    store_.unlearn("SPAM", {"viagra"});
    EXPECT_EQ(store_.category_count("SPAM"), 0u);
    EXPECT_EQ(store_.count("viagra", "SPAM"), 0u);
    EXPECT_EQ(store_.meta().messages_processed(), 1u);

    store_.learn("SPAM", {"viagra"});
    store_.unlearn("SPAM", {"viagra", "never-seen"});
    store_.unlearn("SPAM", {"viagra"});
    EXPECT_EQ(store_.category_count("SPAM"), 0u);
    EXPECT_EQ(store_.count("viagra", "SPAM"), 0u);
}

// Test forget clears everything including the staleness counters
TEST_F(FrequencyStoreTest, Forget) {
    store_.learn("SPAM", {"viagra"});
    store_.meta().mark_scored(1);
    store_.forget();
    EXPECT_TRUE(store_.categories().empty());
    EXPECT_EQ(store_.vocabulary_size(), 0u);
    EXPECT_EQ(store_.meta().messages_processed(), 0u);
    EXPECT_EQ(store_.meta().messages_scored_as_of(), 0u);
}

// Test reserved and empty category names
TEST_F(FrequencyStoreTest, ReservedCategory) {
    EXPECT_THROW(store_.learn("UNK", {"x1"}), ReservedCategoryError);
    EXPECT_THROW(store_.learn("UNK", {"x1"}), ConfigurationError);
    EXPECT_THROW(store_.unlearn("", {"x1"}), ConfigurationError);
    EXPECT_EQ(store_.meta().messages_processed(), 0u);
}

// Test snapshots agree with the counters
TEST_F(FrequencyStoreTest, Snapshot) {
    store_.learn("SPAM", {"viagra", "cheap"});
    store_.learn("NOTSPAM", {"meeting"});
    auto snap = store_.snapshot();
    EXPECT_EQ(snap.categories.size(), 2u);
    EXPECT_EQ(snap.words.size(), 3u);
    EXPECT_EQ(snap.messages_processed, 2u);
}

// Test scored counter never passes processed and never goes back
TEST(CacheMetaTest, Monotonic) {
    CacheMeta meta;
    meta.note_processed();
    meta.note_processed();
    meta.mark_scored(5);
    EXPECT_EQ(meta.messages_scored_as_of(), 2u);
    meta.mark_scored(1);
    EXPECT_EQ(meta.messages_scored_as_of(), 2u);
    EXPECT_EQ(meta.staleness(), 0u);
    meta.note_processed();
    EXPECT_EQ(meta.staleness(), 1u);
}

// Test the disk backend gives the same counts
TEST(FrequencyStoreDiskTest, Learn) {
    FrequencyStore store(true);
    EXPECT_TRUE(store.word_table().on_disk());
    EXPECT_FALSE(store.category_table().on_disk());
    store.learn("SPAM", {"viagra"});
    store.learn("SPAM", {"viagra"});
    EXPECT_EQ(store.count("viagra", "SPAM"), 2u);
}
