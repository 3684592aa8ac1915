#pragma once

#include <Eigen/Dense>

// ---- Expanded parameter grid ---- //
// One row per (site, species) pair. Species-major: the site index varies
// fastest, so row r = i + sites * j holds site i and species j. This is
// Eigen's column-major layout for a sites x species matrix.
struct ExpandedGrid {
    Eigen::VectorXd x;
    Eigen::VectorXd opt;
    Eigen::VectorXd tol;
    Eigen::VectorXd h;    // empty for the second gradient of a 2D model

    Eigen::Index sites{0};
    Eigen::Index species{0};

    Eigen::Index rows() const noexcept { return sites * species; }
};

// Cross product of site coordinates and species parameter triples.
// Throws DimensionMismatch if opt, tol and h differ in length.
ExpandedGrid expandGauss(const Eigen::VectorXd& x,
                         const Eigen::VectorXd& opt,
                         const Eigen::VectorXd& tol,
                         const Eigen::VectorXd& h);

// Same as expandGauss but without a height column.
ExpandedGrid expandGauss(const Eigen::VectorXd& x,
                         const Eigen::VectorXd& opt,
                         const Eigen::VectorXd& tol);

// mu = h * exp(-0.5 * ((x - opt) / tol)^2), elementwise.
// Throws InvalidParameter if any tol <= 0.
Eigen::VectorXd gaussianResponse(const Eigen::VectorXd& x,
                                 const Eigen::VectorXd& opt,
                                 const Eigen::VectorXd& tol,
                                 const Eigen::VectorXd& h);

// Correlated bivariate Gaussian kernel scaled by h, elementwise.
// Throws InvalidParameter unless -1 < corr < 1 and every tolerance is positive.
Eigen::VectorXd biGaussianResponse(const Eigen::VectorXd& x1,
                                   const Eigen::VectorXd& opt1,
                                   const Eigen::VectorXd& tol1,
                                   const Eigen::VectorXd& x2,
                                   const Eigen::VectorXd& opt2,
                                   const Eigen::VectorXd& tol2,
                                   const Eigen::VectorXd& h,
                                   double corr);

// Reshape a flat species-major vector into a sites x species matrix.
Eigen::MatrixXd toSiteBySpecies(const Eigen::VectorXd& flat,
                                Eigen::Index sites,
                                Eigen::Index species);
