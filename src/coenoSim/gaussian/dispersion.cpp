#include "dispersion.hpp"
#include "errors.hpp"

#include <cmath>
#include <limits>
#include <string>

Eigen::VectorXd columnMeans(const Eigen::MatrixXd& y)
{
    if (y.rows() == 0)
        return Eigen::VectorXd::Constant(y.cols(),
                                         std::numeric_limits<double>::quiet_NaN());
    return y.colwise().mean().transpose();
}

Eigen::VectorXd columnVariances(const Eigen::MatrixXd& y)
{
    const Eigen::Index n = y.rows();
    if (n < 2)
        throw InvalidParameter(
            "variance needs at least two sites, got " + std::to_string(n));

    const Eigen::RowVectorXd ybar = y.colwise().mean();
    Eigen::VectorXd s2(y.cols());
    for (Eigen::Index j = 0; j < y.cols(); ++j)
        s2(j) = (y.col(j).array() - ybar(j)).square().sum() / double(n - 1);

    return s2;
}

double estimateAlpha(double mean, double variance)
{
    if (!(mean >= 0.0) || !std::isfinite(mean))
        throw InvalidParameter("mean must be non-negative and finite, got " +
                               std::to_string(mean));
    if (!(variance >= 0.0) || !std::isfinite(variance))
        throw InvalidParameter("variance must be non-negative and finite, got " +
                               std::to_string(variance));

    const double excess = variance - mean;
    if (excess <= 0.0)
        return std::numeric_limits<double>::infinity();

    return mean * mean / excess;
}
