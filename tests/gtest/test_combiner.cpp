// =============================================================================
// Combiner Tests
// =============================================================================

#include <cmath>
#include <gtest/gtest.h>
#include "mailclass/combiner.hpp"
#include "mailclass/error.hpp"

using namespace mailclass;

class CombinerTest : public ::testing::Test {
protected:
    ChiSquareCombiner chi_;
    OddsProductCombiner odds_;
};

// Test the chi-square survival function against closed forms
TEST_F(CombinerTest, ChiSquareSurvival) {
    // dof 2: Q = exp(-x/2)
    EXPECT_NEAR(chi_square_survival(2.0, 2.0), std::exp(-1.0), 1e-12);
    EXPECT_NEAR(chi_square_survival(10.0, 2.0), std::exp(-5.0), 1e-12);
    // dof 4: Q = exp(-x/2) (1 + x/2)
    EXPECT_NEAR(chi_square_survival(3.0, 4.0), std::exp(-1.5) * 2.5, 1e-12);
    EXPECT_DOUBLE_EQ(chi_square_survival(0.0, 6.0), 1.0);
    EXPECT_DOUBLE_EQ(chi_square_survival(INFINITY, 6.0), 0.0);
    EXPECT_THROW(chi_square_survival(1.0, 0.0), MailclassException);
}

// Test neutral scores for empty evidence differ between strategies
TEST_F(CombinerTest, NeutralValues) {
    EXPECT_DOUBLE_EQ(chi_.combine({}), 0.5);
    EXPECT_DOUBLE_EQ(odds_.combine({}), 0.0);
    EXPECT_DOUBLE_EQ(chi_.neutral(), 0.5);
    EXPECT_DOUBLE_EQ(odds_.neutral(), 0.0);
}

// Test the odds product
TEST_F(CombinerTest, OddsProduct) {
    EXPECT_NEAR(odds_.combine({0.99}), 0.99, 1e-12);
    EXPECT_NEAR(odds_.combine({0.5, 0.5}), 0.5, 1e-12);
    // 0.9 * 0.8 / (0.9 * 0.8 + 0.1 * 0.2)
    EXPECT_NEAR(odds_.combine({0.9, 0.8}), 0.72 / 0.74, 1e-12);
}

// Test chi-square combination is symmetric and follows the evidence
TEST_F(CombinerTest, ChiSquare) {
    EXPECT_NEAR(chi_.combine({0.5}), 0.5, 1e-12);

    double spammy = chi_.combine({0.99, 0.95, 0.9, 0.99});
    double hammy = chi_.combine({0.01, 0.05, 0.1, 0.01});
    EXPECT_GT(spammy, 0.9);
    EXPECT_LT(hammy, 0.1);
    EXPECT_NEAR(spammy + hammy, 1.0, 1e-9);

    // Mixed evidence stays uncertain
    double mixed = chi_.combine({0.99, 0.01});
    EXPECT_NEAR(mixed, 0.5, 1e-9);
}

// Test results stay within [0, 1]
TEST_F(CombinerTest, Bounds) {
    std::vector<double> extreme(200, 0.9999);
    for (const Combiner* c : {static_cast<const Combiner*>(&chi_), static_cast<const Combiner*>(&odds_)}) {
        double s = c->combine(extreme);
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, 1.0);
    }
}

// Test the factory
TEST_F(CombinerTest, Factory) {
    EXPECT_EQ(make_combiner(CombinerKind::ChiSquare)->kind(), CombinerKind::ChiSquare);
    EXPECT_EQ(make_combiner(CombinerKind::OddsProduct)->kind(), CombinerKind::OddsProduct);
}
