#include "sampler.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

void validateDispersion(double alpha)
{
    if (!(alpha > 0.0) || !std::isfinite(alpha))
        throw InvalidParameter(
            "alpha must be positive and finite, got " + std::to_string(alpha));
}

void validateProbabilities(const Eigen::VectorXd& p)
{
    for (Eigen::Index i = 0; i < p.size(); ++i)
        if (!(p(i) >= 0.0 && p(i) <= 1.0))
            throw InvalidParameter(
                "probability[" + std::to_string(i) +
                "] must lie in [0, 1], got " + std::to_string(p(i)));
}

Sampler::Sampler()
{
    std::random_device rd;
    rng.seed(rd());
}

Sampler::Sampler(std::uint32_t value)
    : rng(value)
{
}

void Sampler::seed(std::uint32_t value)
{
    rng.seed(value);
    draws = 0;
}

Eigen::VectorXd Sampler::negativeBinomial(const Eigen::VectorXd& mu, double alpha)
{
    validateDispersion(alpha);
    for (Eigen::Index i = 0; i < mu.size(); ++i)
        if (!(mu(i) >= 0.0) || !std::isfinite(mu(i)))
            throw InvalidParameter(
                "mu[" + std::to_string(i) +
                "] must be non-negative and finite, got " +
                std::to_string(mu(i)));
        else if (mu(i) > kMaxPoissonMean)
            throw InvalidParameter(
                "mu[" + std::to_string(i) + "] must not exceed " +
                std::to_string(kMaxPoissonMean) + ", got " +
                std::to_string(mu(i)));

    const Eigen::Index nr = mu.size();

    // shape alpha, rate alpha: mean 1, variance 1/alpha
    std::gamma_distribution<double> gamma(alpha, 1.0 / alpha);
    Eigen::VectorXd lambda(nr);
    for (Eigen::Index i = 0; i < nr; ++i)
        lambda(i) = std::min(mu(i) * gamma(rng), kMaxPoissonMean);
    draws += static_cast<std::size_t>(nr);

    Eigen::VectorXd counts(nr);
    for (Eigen::Index i = 0; i < nr; ++i)
    {
        // poisson_distribution requires a strictly positive mean
        if (lambda(i) <= 0.0)
        {
            counts(i) = 0.0;
            continue;
        }
        std::poisson_distribution<long long> poisson(lambda(i));
        counts(i) = static_cast<double>(poisson(rng));
        ++draws;
    }
    return counts;
}

Eigen::VectorXd Sampler::bernoulli(const Eigen::VectorXd& p)
{
    validateProbabilities(p);

    Eigen::VectorXd outcome(p.size());
    for (Eigen::Index i = 0; i < p.size(); ++i)
    {
        std::bernoulli_distribution trial(p(i));
        outcome(i) = trial(rng) ? 1.0 : 0.0;
    }
    draws += static_cast<std::size_t>(p.size());
    return outcome;
}

Eigen::VectorXd Sampler::sample(const Eigen::VectorXd& mu,
                                SamplingMode mode,
                                double alpha)
{
    switch (mode)
    {
    case SamplingMode::NegativeBinomial:
        return negativeBinomial(mu, alpha);
    case SamplingMode::Bernoulli:
        return bernoulli(mu);
    }
    throw std::invalid_argument("unknown sampling mode");
}
