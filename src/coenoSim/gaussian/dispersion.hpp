#pragma once

#include <Eigen/Dense>

// Per-species (column) summaries of a sites x species matrix.
Eigen::VectorXd columnMeans(const Eigen::MatrixXd& y);

// Unbiased (n - 1) column variances. Throws InvalidParameter with fewer
// than two sites.
Eigen::VectorXd columnVariances(const Eigen::MatrixXd& y);

// Method-of-moments negative binomial dispersion, mean^2 / (var - mean).
// Returns +inf when var <= mean, i.e. no overdispersion.
double estimateAlpha(double mean, double variance);
