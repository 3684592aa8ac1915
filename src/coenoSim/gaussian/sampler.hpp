#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <random>

// ---- Sampling modes ---- //
enum class SamplingMode : uint8_t {
    NegativeBinomial = 0,   // Poisson over a mean-one Gamma multiplier
    Bernoulli        = 1    // response used directly as a probability
};

// Largest Poisson mean drawn. Means above it are rejected; a Gamma
// multiplier pushing a mean past it is saturated at this value.
constexpr double kMaxPoissonMean = 1e15;

// ---- Sampler ---- //
// Owns the pseudorandom stream shared by the Gamma, Poisson and Bernoulli
// draws of one simulation session.
class Sampler {
private:
    std::mt19937 rng;
    std::size_t draws{0};

public:
    Sampler();
    explicit Sampler(std::uint32_t seed);

    void seed(std::uint32_t value);

    // Counts per row. All n*k Gamma multipliers are drawn first, then the
    // n*k Poisson counts, both in row order. Throws InvalidParameter if
    // alpha <= 0 or any mean is negative or above kMaxPoissonMean.
    Eigen::VectorXd negativeBinomial(const Eigen::VectorXd& mu, double alpha);

    // 0/1 outcome per row. Throws InvalidParameter if any p is outside [0,1].
    Eigen::VectorXd bernoulli(const Eigen::VectorXd& p);

    // Dispatch on mode; alpha is ignored in Bernoulli mode.
    Eigen::VectorXd sample(const Eigen::VectorXd& mu,
                           SamplingMode mode,
                           double alpha = 1.0);

    // ---- Accessors ---- //
    std::size_t drawCount() const noexcept { return draws; }
    const std::mt19937& engine() const noexcept { return rng; }
};

// Validation shared with the simulation drivers so they can fail before any
// draw is made.
void validateDispersion(double alpha);
void validateProbabilities(const Eigen::VectorXd& p);
