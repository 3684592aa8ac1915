#include <gtest/gtest.h>

#include <cmath>

#include "errors.hpp"
#include "simulate.hpp"

namespace {

Eigen::VectorXd vec(std::initializer_list<double> values)
{
    Eigen::VectorXd v(values.size());
    Eigen::Index i = 0;
    for (double x : values)
        v(i++) = x;
    return v;
}

// Fixture with a small two-gradient community: 7 sites, 4 species.
class TwoGradientTest : public ::testing::Test {
protected:
    Eigen::VectorXd x1   = Eigen::VectorXd::LinSpaced(7, 4.0, 6.0);
    Eigen::VectorXd x2   = Eigen::VectorXd::LinSpaced(7, 2.0, 20.0);
    Eigen::VectorXd opt1 = Eigen::VectorXd::LinSpaced(4, 4.0, 6.0);
    Eigen::VectorXd tol1 = Eigen::VectorXd::Constant(4, 0.25);
    Eigen::VectorXd opt2 = Eigen::VectorXd::LinSpaced(4, 2.0, 20.0);
    Eigen::VectorXd tol2 = Eigen::VectorXd::Constant(4, 1.0);
    Eigen::VectorXd h    = Eigen::VectorXd::Constant(4, 20.0);
    Eigen::VectorXd p    = Eigen::VectorXd::Constant(4, 0.8);
};

} // namespace

// ---- Single gradient ---- //

TEST(SingleGradientTest, ExpectationWorkedExample) {
    Sampler sampler(1u);
    const Eigen::MatrixXd y = simulateSingleGradientCounts(
        sampler, vec({4, 5, 6}), vec({5}), vec({1}), vec({20}), 1.1, true);

    ASSERT_EQ(y.rows(), 3);
    ASSERT_EQ(y.cols(), 1);
    EXPECT_DOUBLE_EQ(y(0, 0), 20.0 * std::exp(-0.5));
    EXPECT_DOUBLE_EQ(y(1, 0), 20.0);
    EXPECT_DOUBLE_EQ(y(2, 0), 20.0 * std::exp(-0.5));
}

TEST(SingleGradientTest, ExpectationMakesNoDraws) {
    Sampler sampler(99u);
    const std::mt19937 before = sampler.engine();

    simulateSingleGradientCounts(sampler, Eigen::VectorXd::LinSpaced(100, 4, 6),
                                 Eigen::VectorXd::LinSpaced(5, 4, 6),
                                 Eigen::VectorXd::Constant(5, 0.25),
                                 Eigen::VectorXd::Constant(5, 20.0), 1.1, true);

    EXPECT_EQ(sampler.drawCount(), 0u);
    EXPECT_TRUE(sampler.engine() == before);
}

TEST(SingleGradientTest, ColumnsFollowSpeciesOrder) {
    Sampler sampler(1u);
    const Eigen::MatrixXd y = simulateSingleGradientCounts(
        sampler, vec({1, 2, 3, 4}), vec({1, 4}), vec({1, 1}), vec({5, 50}), 1.0, true);

    ASSERT_EQ(y.rows(), 4);
    ASSERT_EQ(y.cols(), 2);
    EXPECT_EQ(y(0, 0), 5.0);
    EXPECT_EQ(y(3, 1), 50.0);
    EXPECT_LT(y(3, 0), y(0, 0));
    EXPECT_LT(y(0, 1), y(3, 1));
}

TEST(SingleGradientTest, SampledCountsShapeAndReproducibility) {
    Parameters params;
    params.seed = 1;
    params.seeded = true;
    params.alpha = 1.1;

    Sampler a = makeSampler(params);
    Sampler b = makeSampler(params);

    const Eigen::VectorXd x   = Eigen::VectorXd::LinSpaced(100, 4, 6);
    const Eigen::VectorXd opt = Eigen::VectorXd::LinSpaced(5, 4, 6);
    const Eigen::VectorXd tol = Eigen::VectorXd::Constant(5, 0.25);
    const Eigen::VectorXd h   = Eigen::VectorXd::Constant(5, 20.0);

    const Eigen::MatrixXd ya = simulateSingleGradientCounts(a, x, opt, tol, h, params.alpha);
    const Eigen::MatrixXd yb = simulateSingleGradientCounts(b, x, opt, tol, h, params.alpha);

    EXPECT_EQ(ya.rows(), 100);
    EXPECT_EQ(ya.cols(), 5);
    EXPECT_EQ(ya, yb);
    EXPECT_GE(ya.minCoeff(), 0.0);
    EXPECT_GT(a.drawCount(), 0u);
}

TEST(SingleGradientTest, RejectsInvalidInputsBeforeDrawing) {
    Sampler sampler(4u);
    const std::mt19937 before = sampler.engine();

    EXPECT_THROW(simulateSingleGradientCounts(sampler, vec({1}), vec({1}), vec({1}), vec({1}), 0.0),
                 InvalidParameter);
    EXPECT_THROW(simulateSingleGradientCounts(sampler, vec({1}), vec({1}), vec({0}), vec({1}), 1.0),
                 InvalidParameter);
    EXPECT_THROW(simulateSingleGradientCounts(sampler, vec({1}), vec({1, 2}), vec({1}), vec({1}), 1.0),
                 DimensionMismatch);
    EXPECT_THROW(simulateSingleGradientCounts(sampler, vec({1}), vec({1}), vec({1}), vec({-3}), 1.0),
                 InvalidParameter);

    EXPECT_EQ(sampler.drawCount(), 0u);
    EXPECT_TRUE(sampler.engine() == before);
}

TEST(SingleGradientTest, RejectsHeightBeyondPoissonRange) {
    Sampler sampler(1u);
    const std::mt19937 before = sampler.engine();

    for (double height : {1e19, 1e25, 1e300})
        EXPECT_THROW(simulateSingleGradientCounts(sampler, vec({5}), vec({5}), vec({1}),
                                                  vec({height}), 1000.0),
                     InvalidParameter);

    EXPECT_EQ(sampler.drawCount(), 0u);
    EXPECT_TRUE(sampler.engine() == before);
}

TEST(SingleGradientTest, ExpectationIgnoresDispersion) {
    Sampler sampler(4u);
    const Eigen::MatrixXd y = simulateSingleGradientCounts(
        sampler, vec({5}), vec({5}), vec({1}), vec({3}), 0.0, true);
    EXPECT_EQ(y(0, 0), 3.0);
}

TEST(SingleGradientTest, EmptyCommunity) {
    Sampler sampler(4u);
    const Eigen::MatrixXd y = simulateSingleGradientCounts(
        sampler, vec({1, 2, 3}), Eigen::VectorXd(0), Eigen::VectorXd(0),
        Eigen::VectorXd(0), 1.0);
    EXPECT_EQ(y.rows(), 3);
    EXPECT_EQ(y.cols(), 0);
    EXPECT_EQ(sampler.drawCount(), 0u);
}

// ---- Two gradients, counts ---- //

TEST_F(TwoGradientTest, CountsShape) {
    Sampler sampler(8u);
    const Eigen::MatrixXd y =
        simulateTwoGradientCounts(sampler, x1, x2, opt1, tol1, opt2, tol2, h, 0.5, 1.1);
    EXPECT_EQ(y.rows(), 7);
    EXPECT_EQ(y.cols(), 4);
    EXPECT_GT(sampler.drawCount(), 0u);
}

TEST_F(TwoGradientTest, ExpectationMatchesBivariateSurface) {
    Sampler sampler(8u);
    const std::mt19937 before = sampler.engine();

    const Eigen::MatrixXd y =
        simulateTwoGradientCounts(sampler, x1, x2, opt1, tol1, opt2, tol2, h, 0.0, 1.1, true);

    for (Eigen::Index i = 0; i < 7; ++i)
        for (Eigen::Index j = 0; j < 4; ++j)
        {
            const double z1 = (x1(i) - opt1(j)) / tol1(j);
            const double z2 = (x2(i) - opt2(j)) / tol2(j);
            EXPECT_NEAR(y(i, j), h(j) * std::exp(-0.5 * (z1 * z1 + z2 * z2)), 1e-12);
        }

    EXPECT_EQ(sampler.drawCount(), 0u);
    EXPECT_TRUE(sampler.engine() == before);
}

TEST_F(TwoGradientTest, MismatchedGradientsMakeNoDraws) {
    Sampler sampler(8u);
    const std::mt19937 before = sampler.engine();
    const Eigen::VectorXd shortX2 = x2.head(5);

    EXPECT_THROW(simulateTwoGradientCounts(sampler, x1, shortX2, opt1, tol1, opt2, tol2, h, 0.0, 1.1),
                 DimensionMismatch);
    EXPECT_THROW(simulateTwoGradientOccurrence(sampler, x1, shortX2, opt1, tol1, opt2, tol2, p),
                 DimensionMismatch);

    EXPECT_EQ(sampler.drawCount(), 0u);
    EXPECT_TRUE(sampler.engine() == before);
}

TEST_F(TwoGradientTest, MismatchedGradientsReportedBeforeOtherErrors) {
    Sampler sampler(8u);
    const Eigen::VectorXd shortX2 = x2.head(5);

    EXPECT_THROW(simulateTwoGradientCounts(sampler, x1, shortX2, opt1, tol1, opt2, tol2, h, 0.0, 0.0),
                 DimensionMismatch);
    EXPECT_THROW(simulateTwoGradientOccurrence(sampler, x1, shortX2, opt1, tol1, opt2, tol2,
                                               Eigen::VectorXd::Constant(4, 1.5)),
                 DimensionMismatch);
    EXPECT_THROW(simulateTwoGradientCounts(sampler, x1, x2, opt1, tol1, opt2.head(3), tol2.head(3),
                                           -h, 0.0, 0.0),
                 DimensionMismatch);
    EXPECT_EQ(sampler.drawCount(), 0u);
}

TEST_F(TwoGradientTest, MismatchedSpeciesAcrossGradients) {
    Sampler sampler(8u);
    EXPECT_THROW(simulateTwoGradientCounts(sampler, x1, x2, opt1, tol1,
                                           opt2.head(3), tol2.head(3), h, 0.0, 1.1),
                 DimensionMismatch);
}

TEST_F(TwoGradientTest, RejectsBadCorrelationAndDispersion) {
    Sampler sampler(8u);
    EXPECT_THROW(simulateTwoGradientCounts(sampler, x1, x2, opt1, tol1, opt2, tol2, h, 1.0, 1.1),
                 InvalidParameter);
    EXPECT_THROW(simulateTwoGradientCounts(sampler, x1, x2, opt1, tol1, opt2, tol2, h, 0.2, -2.0),
                 InvalidParameter);
    EXPECT_EQ(sampler.drawCount(), 0u);
}

// ---- Two gradients, occurrence ---- //

TEST_F(TwoGradientTest, OccurrenceShapeAndValues) {
    Sampler sampler(13u);
    const Eigen::MatrixXd y =
        simulateTwoGradientOccurrence(sampler, x1, x2, opt1, tol1, opt2, tol2, p, 0.3);

    EXPECT_EQ(y.rows(), 7);
    EXPECT_EQ(y.cols(), 4);
    for (Eigen::Index i = 0; i < y.size(); ++i)
        EXPECT_TRUE(y(i) == 0.0 || y(i) == 1.0);
}

TEST_F(TwoGradientTest, OccurrenceExpectationIsProbability) {
    Sampler sampler(13u);
    const Eigen::MatrixXd y =
        simulateTwoGradientOccurrence(sampler, x1, x2, opt1, tol1, opt2, tol2, p, -0.4, true);

    EXPECT_GE(y.minCoeff(), 0.0);
    EXPECT_LE(y.maxCoeff(), 0.8);
    EXPECT_EQ(sampler.drawCount(), 0u);
}

TEST(OccurrenceTest, CertainPresenceAtJointOptimum) {
    Sampler sampler(21u);
    const Eigen::VectorXd x1 = Eigen::VectorXd::Constant(50, 3.0);
    const Eigen::VectorXd x2 = Eigen::VectorXd::Constant(50, -1.0);

    const Eigen::MatrixXd y = simulateTwoGradientOccurrence(
        sampler, x1, x2, vec({3, 3}), vec({0.5, 2}), vec({-1, -1}), vec({1, 0.1}),
        vec({1, 1}), 0.9);

    EXPECT_EQ(y.rows(), 50);
    EXPECT_EQ(y.cols(), 2);
    EXPECT_EQ(y.minCoeff(), 1.0);
}

TEST(OccurrenceTest, RejectsHeightAboveOne) {
    Sampler sampler(21u);
    EXPECT_THROW(simulateTwoGradientOccurrence(sampler, vec({1}), vec({1}), vec({1}), vec({1}),
                                               vec({1}), vec({1}), vec({1.5})),
                 InvalidParameter);
    EXPECT_EQ(sampler.drawCount(), 0u);
}
