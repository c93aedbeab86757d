#include "mediamix/Distribution.hpp"
#include <eris/Random.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace mediamix;
using namespace Eigen;

using Family = Distribution::Family;

TEST(Distribution, Families) {
    EXPECT_EQ(Distribution::parseFamily("half_normal"), Family::HalfNormal);
    EXPECT_EQ(Distribution::parseFamily("HalfNormal"), Family::HalfNormal);
    EXPECT_EQ(Distribution::parseFamily("BETA"), Family::Beta);
    EXPECT_THROW(Distribution::parseFamily("cauchy"), std::invalid_argument);
    EXPECT_EQ(Distribution::familyName(Family::Gamma), "Gamma");
}

TEST(Distribution, FromPositional) {
    auto g = Distribution::fromPositional(Family::Gamma, {2.0});
    EXPECT_EQ(g, Distribution::gamma(2.0, 1.0));

    auto n = Distribution::fromPositional(Family::Normal, {});
    EXPECT_EQ(n, Distribution::normal(0.0, 1.0));

    auto b = Distribution::fromPositional(Family::Beta, {3.0, 2.0});
    EXPECT_EQ(b.parameter("concentration1")(0, 0), 3.0);
    EXPECT_EQ(b.parameter("concentration0")(0, 0), 2.0);

    EXPECT_THROW(Distribution::fromPositional(Family::Beta, {3.0}), std::invalid_argument);
    EXPECT_THROW(Distribution::fromPositional(Family::HalfNormal, {1.0, 2.0}), std::invalid_argument);
}

TEST(Distribution, FromNamed) {
    auto h = Distribution::fromNamed(Family::HalfNormal, {{"scale", 3.0}});
    EXPECT_EQ(h, Distribution::halfNormal(3.0));
    auto g = Distribution::fromNamed(Family::Gamma, {{"concentration", 2.0}, {"rate", 0.5}});
    EXPECT_EQ(g, Distribution::gamma(2.0, 0.5));
    EXPECT_THROW(Distribution::fromNamed(Family::Gamma, {{"rate", 0.5}}), std::invalid_argument);
    EXPECT_THROW(Distribution::fromNamed(Family::Normal, {{"mean", 0.0}}), std::invalid_argument);
    EXPECT_THROW(Distribution::beta(1, 1).parameter("scale"), std::invalid_argument);
}

TEST(Distribution, LogDensity) {
    ArrayXXd x(1, 1);
    x << 0;
    EXPECT_NEAR(Distribution::normal(0, 1).logDensity(x)(0, 0), -0.918938533204673, 1e-12);
    EXPECT_NEAR(Distribution::halfNormal(1).logDensity(x)(0, 0), std::log(2.0) - 0.918938533204673, 1e-12);

    x << 0.5;
    EXPECT_NEAR(Distribution::beta(2, 1).logDensity(x)(0, 0), 0.0, 1e-12);
    x << 2;
    EXPECT_NEAR(Distribution::gamma(1, 1).logDensity(x)(0, 0), -2.0, 1e-12);
    EXPECT_NEAR(Distribution::gamma(2, 0.5).logDensity(x)(0, 0), 2 * std::log(0.5) + std::log(2.0) - 1.0, 1e-12);

    const double neg_inf = -std::numeric_limits<double>::infinity();
    x << -1;
    EXPECT_EQ(Distribution::halfNormal(1).logDensity(x)(0, 0), neg_inf);
    EXPECT_EQ(Distribution::gamma(1, 1).logDensity(x)(0, 0), neg_inf);
    EXPECT_EQ(Distribution::beta(1, 1).logDensity(x)(0, 0), neg_inf);
    EXPECT_EQ(Distribution::delta(-1).logDensity(x)(0, 0), 0.0);
    EXPECT_EQ(Distribution::delta(1).logDensity(x)(0, 0), neg_inf);
}

TEST(Distribution, LogDensitySupportEdges) {
    ArrayXXd x(1, 1);
    x << 1;
    EXPECT_NEAR(Distribution::beta(9, 1).logDensity(x)(0, 0), std::log(9.0), 1e-12);
    EXPECT_NEAR(Distribution::beta(2, 1).logDensity(x)(0, 0), std::log(2.0), 1e-12);
    EXPECT_EQ(Distribution::beta(1, 2).logDensity(x)(0, 0), -std::numeric_limits<double>::infinity());

    x << 0;
    EXPECT_NEAR(Distribution::beta(1, 1).logDensity(x)(0, 0), 0.0, 1e-12);
    EXPECT_NEAR(Distribution::beta(1, 3).logDensity(x)(0, 0), std::log(3.0), 1e-12);
    EXPECT_NEAR(Distribution::gamma(1, 1).logDensity(x)(0, 0), 0.0, 1e-12);
    EXPECT_NEAR(Distribution::gamma(1, 2).logDensity(x)(0, 0), std::log(2.0), 1e-12);
    EXPECT_EQ(Distribution::gamma(2, 1).logDensity(x)(0, 0), -std::numeric_limits<double>::infinity());
}

TEST(Distribution, SampleSupport) {
    eris::Random::rng_t rng(123);
    ArrayXXd b = Distribution::beta(2, 1).sample(rng, 50, 3);
    EXPECT_EQ(b.rows(), 50);
    EXPECT_EQ(b.cols(), 3);
    EXPECT_TRUE((b >= 0).all() and (b <= 1).all());

    ArrayXXd h = Distribution::halfNormal(2).sample(rng, 100, 1);
    EXPECT_TRUE((h >= 0).all());

    ArrayXXd g = Distribution::gamma(1, 1).sample(rng, 100, 1);
    EXPECT_TRUE((g > 0).all());

    ArrayXXd d = Distribution::delta(4.25).sample(rng, 3, 2);
    EXPECT_TRUE((d == 4.25).all());
}

TEST(Distribution, SampleIsReproducible) {
    eris::Random::rng_t rng1(99), rng2(99);
    ArrayXXd a = Distribution::normal(1, 2).sample(rng1, 4, 2);
    ArrayXXd b = Distribution::normal(1, 2).sample(rng2, 4, 2);
    EXPECT_TRUE((a == b).all());
}

TEST(Distribution, Broadcasting) {
    eris::Random::rng_t rng(5);
    ArrayXXd loc(3, 1), scale(1, 1);
    loc << -100, 0, 100;
    scale << 0.001;
    auto n = Distribution::normal(loc, scale);

    ArrayXXd draws = n.sample(rng, 3, 4);
    for (int c = 0; c < 4; c++) {
        EXPECT_NEAR(draws(0, c), -100, 0.1);
        EXPECT_NEAR(draws(1, c), 0, 0.1);
        EXPECT_NEAR(draws(2, c), 100, 0.1);
    }

    EXPECT_THROW(n.sample(rng, 2, 1), mediamix::Array::ShapeError);
    EXPECT_THROW(n.logDensity(ArrayXXd::Zero(4, 1)), mediamix::Array::ShapeError);
}

TEST(Distribution, Printing) {
    std::ostringstream s;
    s << Distribution::beta(2, 1);
    EXPECT_EQ(s.str(), "Beta(concentration1=2, concentration0=1)");
}
