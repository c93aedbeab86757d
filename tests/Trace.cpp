#include "mediamix/Trace.hpp"
#include <eris/Random.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

using namespace mediamix;
using namespace Eigen;

TEST(Tracer, SampleShapes) {
    eris::Random::rng_t rng(1);
    Tracer tracer(rng);
    ArrayXXd a = tracer.sample("a", Distribution::normal(0, 1), {{"a_plate", 4, -1}});
    EXPECT_EQ(a.rows(), 4);
    EXPECT_EQ(a.cols(), 1);
    ArrayXXd b = tracer.sample("b", Distribution::normal(0, 1), {{"c_plate", 4, -2}, {"g_plate", 3, -1}});
    EXPECT_EQ(b.rows(), 4);
    EXPECT_EQ(b.cols(), 3);
    ArrayXXd c = tracer.sample("c", Distribution::normal(0, 1), {});
    EXPECT_EQ(c.size(), 1);

    const Trace &t = tracer.trace();
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t["a"].value.shape(), Shape({4}));
    EXPECT_EQ(t["b"].value.shape(), Shape({4, 3}));
    EXPECT_EQ(t["c"].value.rank(), 0u);
    EXPECT_EQ(t["b"].plates[1].name, "g_plate");
    EXPECT_EQ(t["a"].type, Site::Type::Sample);
    EXPECT_THROW(t["d"], std::out_of_range);

    PlateStack three{{"x", 1, -3}, {"y", 1, -2}, {"z", 1, -1}};
    EXPECT_THROW(tracer.sample("d", Distribution::normal(0, 1), three), std::logic_error);
}

TEST(Tracer, Substitute) {
    Tracer tracer;
    tracer.substitute("a", ArrayXXd::Constant(2, 1, 0.25));
    ArrayXXd a = tracer.sample("a", Distribution::beta(2, 1), {{"a_plate", 2, -1}});
    EXPECT_TRUE((a == 0.25).all());
    // log Beta(2,1) density at 0.25 is log(0.5)
    EXPECT_NEAR(tracer.trace()["a"].log_density, 2 * std::log(0.5), 1e-12);

    tracer.substitute("b", ArrayXXd::Zero(3, 1));
    EXPECT_THROW(tracer.sample("b", Distribution::normal(0, 1), {{"b_plate", 2, -1}}), mediamix::Array::ShapeError);
}

TEST(Tracer, DuplicateAndReset) {
    Tracer tracer;
    tracer.sample("a", Distribution::normal(0, 1), {});
    EXPECT_THROW(tracer.sample("a", Distribution::normal(0, 1), {}), std::logic_error);
    EXPECT_THROW(tracer.deterministic("a", mediamix::Array()), std::logic_error);
    tracer.reset();
    EXPECT_TRUE(tracer.trace().empty());
    tracer.sample("a", Distribution::normal(0, 1), {});
    EXPECT_EQ(tracer.trace().size(), 1u);
}

TEST(Tracer, ObserveAndLogJoint) {
    Tracer tracer;
    tracer.substitute("mu", ArrayXXd::Zero(1, 1));
    tracer.sample("mu", Distribution::normal(0, 1), {});
    VectorXd y = VectorXd::Zero(2);
    tracer.observe("y", Distribution::normal(0, 1), mediamix::Array(y));
    VectorXd d = VectorXd::Ones(2);
    tracer.deterministic("d", mediamix::Array(d));

    const Trace &t = tracer.trace();
    EXPECT_EQ(t.names(), (std::vector<std::string>{"mu", "y", "d"}));
    EXPECT_EQ(t["y"].type, Site::Type::Observed);
    EXPECT_EQ(t["d"].type, Site::Type::Deterministic);
    EXPECT_EQ(t["d"].log_density, 0);
    EXPECT_FALSE(t["d"].fn);
    EXPECT_NEAR(t["y"].log_density, 2 * -0.918938533204673, 1e-12);
    EXPECT_NEAR(t.logJoint(), 3 * -0.918938533204673, 1e-12);
}
