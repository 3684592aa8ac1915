#include "response.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

namespace {

void requireSameLength(const Eigen::VectorXd& a, const char* aName,
                       const Eigen::VectorXd& b, const char* bName)
{
    if (a.size() != b.size())
        throw DimensionMismatch(
            std::string(aName) + " has length " + std::to_string(a.size()) +
            " but " + bName + " has length " + std::to_string(b.size()));
}

void requirePositive(const Eigen::VectorXd& v, const char* name)
{
    for (Eigen::Index i = 0; i < v.size(); ++i)
        if (!(v(i) > 0.0) || !std::isfinite(v(i)))
            throw InvalidParameter(
                std::string(name) + "[" + std::to_string(i) +
                "] must be positive and finite, got " + std::to_string(v(i)));
}

void requireCorrelation(double corr)
{
    if (!(corr > -1.0 && corr < 1.0))
        throw InvalidParameter(
            "corr must lie strictly between -1 and 1, got " +
            std::to_string(corr));
}

// Site i of species j lands on row i + sites * j.
void fillExpanded(ExpandedGrid& g,
                  const Eigen::VectorXd& x,
                  const Eigen::VectorXd& opt,
                  const Eigen::VectorXd& tol)
{
    g.sites   = x.size();
    g.species = opt.size();

    g.x.resize(g.rows());
    g.opt.resize(g.rows());
    g.tol.resize(g.rows());

    for (Eigen::Index j = 0; j < g.species; ++j)
    {
        const Eigen::Index base = j * g.sites;
        g.x.segment(base, g.sites) = x;
        g.opt.segment(base, g.sites).setConstant(opt(j));
        g.tol.segment(base, g.sites).setConstant(tol(j));
    }
}

} // namespace

ExpandedGrid expandGauss(const Eigen::VectorXd& x,
                         const Eigen::VectorXd& opt,
                         const Eigen::VectorXd& tol,
                         const Eigen::VectorXd& h)
{
    requireSameLength(opt, "opt", tol, "tol");
    requireSameLength(opt, "opt", h, "h");

    ExpandedGrid g;
    fillExpanded(g, x, opt, tol);

    g.h.resize(g.rows());
    for (Eigen::Index j = 0; j < g.species; ++j)
        g.h.segment(j * g.sites, g.sites).setConstant(h(j));

    return g;
}

ExpandedGrid expandGauss(const Eigen::VectorXd& x,
                         const Eigen::VectorXd& opt,
                         const Eigen::VectorXd& tol)
{
    requireSameLength(opt, "opt", tol, "tol");

    ExpandedGrid g;
    fillExpanded(g, x, opt, tol);
    return g;
}

Eigen::VectorXd gaussianResponse(const Eigen::VectorXd& x,
                                 const Eigen::VectorXd& opt,
                                 const Eigen::VectorXd& tol,
                                 const Eigen::VectorXd& h)
{
    requireSameLength(x, "x", opt, "opt");
    requireSameLength(x, "x", tol, "tol");
    requireSameLength(x, "x", h, "h");
    requirePositive(tol, "tol");

    const Eigen::ArrayXd z = (x - opt).array() / tol.array();
    return (h.array() * (-0.5 * z.square()).exp()).matrix();
}

Eigen::VectorXd biGaussianResponse(const Eigen::VectorXd& x1,
                                   const Eigen::VectorXd& opt1,
                                   const Eigen::VectorXd& tol1,
                                   const Eigen::VectorXd& x2,
                                   const Eigen::VectorXd& opt2,
                                   const Eigen::VectorXd& tol2,
                                   const Eigen::VectorXd& h,
                                   double corr)
{
    requireSameLength(x1, "x1", opt1, "opt1");
    requireSameLength(x1, "x1", tol1, "tol1");
    requireSameLength(x1, "x1", x2, "x2");
    requireSameLength(x1, "x1", opt2, "opt2");
    requireSameLength(x1, "x1", tol2, "tol2");
    requireSameLength(x1, "x1", h, "h");
    requireCorrelation(corr);
    requirePositive(tol1, "tol1");
    requirePositive(tol2, "tol2");

    const Eigen::ArrayXd z1 = (x1 - opt1).array() / tol1.array();
    const Eigen::ArrayXd z2 = (x2 - opt2).array() / tol2.array();

    const double scale = -1.0 / (2.0 * (1.0 - corr * corr));
    const Eigen::ArrayXd q = z1.square() + z2.square() - 2.0 * corr * z1 * z2;

    return (h.array() * (scale * q).exp()).matrix();
}

Eigen::MatrixXd toSiteBySpecies(const Eigen::VectorXd& flat,
                                Eigen::Index sites,
                                Eigen::Index species)
{
    if (sites < 0 || species < 0 || flat.size() != sites * species)
        throw DimensionMismatch(
            "cannot reshape " + std::to_string(flat.size()) + " values into " +
            std::to_string(sites) + " x " + std::to_string(species));

    return Eigen::Map<const Eigen::MatrixXd>(flat.data(), sites, species);
}
