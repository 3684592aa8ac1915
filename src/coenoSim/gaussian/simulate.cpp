#include "simulate.hpp"
#include "errors.hpp"
#include "response.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace {

void requireFinite(const Eigen::VectorXd& v, const char* name)
{
    for (Eigen::Index i = 0; i < v.size(); ++i)
        if (!std::isfinite(v(i)))
            throw InvalidParameter(
                std::string(name) + "[" + std::to_string(i) +
                "] must be finite, got " + std::to_string(v(i)));
}

void requireHeights(const Eigen::VectorXd& h, double upper)
{
    for (Eigen::Index i = 0; i < h.size(); ++i)
        if (!(h(i) >= 0.0 && h(i) <= upper))
            throw InvalidParameter(
                "h[" + std::to_string(i) + "] must lie in [0, " +
                std::to_string(upper) + "], got " + std::to_string(h(i)));
}

// Site and species counts must agree across the two gradients. Checked
// before any other argument.
void requireMatchingGradients(const Eigen::VectorXd& x1,
                              const Eigen::VectorXd& x2,
                              const Eigen::VectorXd& opt1,
                              const Eigen::VectorXd& opt2)
{
    if (x1.size() != x2.size())
        throw DimensionMismatch(
            "x1 has " + std::to_string(x1.size()) + " sites but x2 has " +
            std::to_string(x2.size()));
    if (opt1.size() != opt2.size())
        throw DimensionMismatch(
            "opt1 has " + std::to_string(opt1.size()) + " species but opt2 has " +
            std::to_string(opt2.size()));
}

// Evaluate the two-gradient surface. Both expansions share the same species
// and site ordering, so their rows line up one to one.
Eigen::VectorXd twoGradientSurface(const Eigen::VectorXd& x1,
                                   const Eigen::VectorXd& x2,
                                   const Eigen::VectorXd& opt1,
                                   const Eigen::VectorXd& tol1,
                                   const Eigen::VectorXd& opt2,
                                   const Eigen::VectorXd& tol2,
                                   const Eigen::VectorXd& h,
                                   double corr)
{
    requireFinite(x1, "x1");
    requireFinite(x2, "x2");
    requireFinite(opt1, "opt1");
    requireFinite(opt2, "opt2");

    const ExpandedGrid ex1 = expandGauss(x1, opt1, tol1, h);
    const ExpandedGrid ex2 = expandGauss(x2, opt2, tol2);

    return biGaussianResponse(ex1.x, ex1.opt, ex1.tol,
                              ex2.x, ex2.opt, ex2.tol,
                              ex1.h, corr);
}

} // namespace

Sampler makeSampler(const Parameters& p)
{
    if (p.seeded)
        return Sampler(p.seed);
    return Sampler();
}

Eigen::MatrixXd simulateSingleGradientCounts(Sampler& sampler,
                                             const Eigen::VectorXd& x,
                                             const Eigen::VectorXd& opt,
                                             const Eigen::VectorXd& tol,
                                             const Eigen::VectorXd& h,
                                             double alpha,
                                             bool expectation)
{
    requireFinite(x, "x");
    requireFinite(opt, "opt");
    requireHeights(h, std::numeric_limits<double>::max());
    if (!expectation)
        validateDispersion(alpha);

    const ExpandedGrid ex = expandGauss(x, opt, tol, h);
    const Eigen::VectorXd mu = gaussianResponse(ex.x, ex.opt, ex.tol, ex.h);

    if (expectation)
        return toSiteBySpecies(mu, ex.sites, ex.species);

    return toSiteBySpecies(sampler.negativeBinomial(mu, alpha),
                           ex.sites, ex.species);
}

Eigen::MatrixXd simulateTwoGradientCounts(Sampler& sampler,
                                          const Eigen::VectorXd& x1,
                                          const Eigen::VectorXd& x2,
                                          const Eigen::VectorXd& opt1,
                                          const Eigen::VectorXd& tol1,
                                          const Eigen::VectorXd& opt2,
                                          const Eigen::VectorXd& tol2,
                                          const Eigen::VectorXd& h,
                                          double corr,
                                          double alpha,
                                          bool expectation)
{
    requireMatchingGradients(x1, x2, opt1, opt2);
    requireHeights(h, std::numeric_limits<double>::max());
    if (!expectation)
        validateDispersion(alpha);

    const Eigen::VectorXd mu =
        twoGradientSurface(x1, x2, opt1, tol1, opt2, tol2, h, corr);

    if (expectation)
        return toSiteBySpecies(mu, x1.size(), opt1.size());

    return toSiteBySpecies(sampler.negativeBinomial(mu, alpha),
                           x1.size(), opt1.size());
}

Eigen::MatrixXd simulateTwoGradientOccurrence(Sampler& sampler,
                                              const Eigen::VectorXd& x1,
                                              const Eigen::VectorXd& x2,
                                              const Eigen::VectorXd& opt1,
                                              const Eigen::VectorXd& tol1,
                                              const Eigen::VectorXd& opt2,
                                              const Eigen::VectorXd& tol2,
                                              const Eigen::VectorXd& h,
                                              double corr,
                                              bool expectation)
{
    requireMatchingGradients(x1, x2, opt1, opt2);
    requireHeights(h, 1.0);

    const Eigen::VectorXd p =
        twoGradientSurface(x1, x2, opt1, tol1, opt2, tol2, h, corr);

    if (expectation)
        return toSiteBySpecies(p, x1.size(), opt1.size());

    return toSiteBySpecies(sampler.bernoulli(p),
                           x1.size(), opt1.size());
}
