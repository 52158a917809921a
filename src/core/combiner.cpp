#include "mailclass/combiner.hpp"

#include <algorithm>
#include <cmath>

#include <boost/math/special_functions/gamma.hpp>

#include "mailclass/error.hpp"

namespace mailclass {

double chi_square_survival(double statistic, double dof) {
    if (!(dof > 0.0)) {
        throw MailclassException(ErrorCode::INVALID_ARGUMENT,
                                 "chi-square degrees of freedom must be positive",
                                 "chi_square_survival");
    }
    if (statistic <= 0.0) return 1.0;
    if (std::isinf(statistic)) return 0.0;
    // Q(dof/2, x/2) is the regularized upper incomplete gamma function.
    return boost::math::gamma_q(dof / 2.0, statistic / 2.0);
}

double ChiSquareCombiner::combine(const std::vector<double>& probabilities) const {
    if (probabilities.empty()) return neutral();

    double sum_ln_f = 0.0;
    double sum_ln_1_minus_f = 0.0;
    for (double p : probabilities) {
        sum_ln_f += std::log(p);
        sum_ln_1_minus_f += std::log1p(-p);
    }

    const double dof = 2.0 * static_cast<double>(probabilities.size());
    const double P = chi_square_survival(-2.0 * sum_ln_1_minus_f, dof);
    const double Q = chi_square_survival(-2.0 * sum_ln_f, dof);
    return std::clamp((1.0 + Q - P) / 2.0, 0.0, 1.0);
}

double OddsProductCombiner::combine(const std::vector<double>& probabilities) const {
    if (probabilities.empty()) return neutral();

    double f = 1.0;
    double notf = 1.0;
    for (double p : probabilities) {
        f *= p;
        notf *= 1.0 - p;
    }
    if (f + notf <= 0.0) return neutral();
    return f / (f + notf);
}

std::unique_ptr<Combiner> make_combiner(CombinerKind kind) {
    switch (kind) {
        case CombinerKind::ChiSquare: return std::make_unique<ChiSquareCombiner>();
        case CombinerKind::OddsProduct: return std::make_unique<OddsProductCombiner>();
    }
    throw ConfigurationError("Unknown combiner kind", "make_combiner");
}

} // namespace mailclass
