#pragma once

#include <memory>
#include <vector>
#include "mailclass/types.hpp"

namespace mailclass {

/**
 * Folds the per-word probabilities of one category into a single score.
 *
 * The two strategies disagree on the score of an empty list, so each one
 * reports its own neutral().
 */
class Combiner {
public:
    virtual ~Combiner() = default;

    virtual double combine(const std::vector<double>& probabilities) const = 0;
    virtual double neutral() const = 0;
    virtual CombinerKind kind() const = 0;
};

/**
 * Robinson-Fisher inverse chi-square combination.
 *
 *   P = Q(2N, -2 sum ln(1 - p))
 *   Q = Q(2N, -2 sum ln p)
 *   score = (1 + Q - P) / 2
 *
 * where Q(dof, x) is the chi-square survival function. Empty lists score 0.5.
 */
class ChiSquareCombiner : public Combiner {
public:
    double combine(const std::vector<double>& probabilities) const override;
    double neutral() const override { return 0.5; }
    CombinerKind kind() const override { return CombinerKind::ChiSquare; }
};

/**
 * Graham's product of odds: prod p / (prod p + prod (1 - p)).
 * Empty lists score 0.
 */
class OddsProductCombiner : public Combiner {
public:
    double combine(const std::vector<double>& probabilities) const override;
    double neutral() const override { return 0.0; }
    CombinerKind kind() const override { return CombinerKind::OddsProduct; }
};

std::unique_ptr<Combiner> make_combiner(CombinerKind kind);

// Upper tail of the chi-square distribution with `dof` degrees of freedom.
double chi_square_survival(double statistic, double dof);

} // namespace mailclass
