#pragma once

#include "sampler.hpp"

#include <Eigen/Dense>
#include <cstdint>

// ---- Parameters ---- //
struct Parameters {
    double alpha{1.0};          // negative binomial dispersion
    double corr{0.0};           // correlation between the two gradients
    bool expectation{false};    // return the mean response, no sampling
    std::uint32_t seed{0};
    bool seeded{false};         // false: seed from std::random_device
};

// Build a sampler according to the seeding fields of p.
Sampler makeSampler(const Parameters& p);

// ---- Simulation drivers ---- //
// Each returns a sites x species matrix: rows follow the order of x (x1),
// columns follow the order of the species parameters. With expectation set
// the sampler is never touched.

// Negative binomial counts along one gradient.
Eigen::MatrixXd simulateSingleGradientCounts(Sampler& sampler,
                                             const Eigen::VectorXd& x,
                                             const Eigen::VectorXd& opt,
                                             const Eigen::VectorXd& tol,
                                             const Eigen::VectorXd& h,
                                             double alpha,
                                             bool expectation = false);

// Negative binomial counts along two, possibly correlated, gradients.
// Throws DimensionMismatch if x1 and x2 differ in length.
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
                                          bool expectation = false);

// Presence/absence along two gradients; h is the occurrence probability at
// the optimum and must lie in [0, 1].
Eigen::MatrixXd simulateTwoGradientOccurrence(Sampler& sampler,
                                              const Eigen::VectorXd& x1,
                                              const Eigen::VectorXd& x2,
                                              const Eigen::VectorXd& opt1,
                                              const Eigen::VectorXd& tol1,
                                              const Eigen::VectorXd& opt2,
                                              const Eigen::VectorXd& tol2,
                                              const Eigen::VectorXd& h,
                                              double corr = 0.0,
                                              bool expectation = false);
