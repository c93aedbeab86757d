#include "mediamix/transform/MediaTransform.hpp"
#include "mediamix/PriorCatalog.hpp"
#include "mediamix/Trace.hpp"
#include <eris/Random.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <map>
#include <string>
#include <vector>

using namespace mediamix;
using namespace mediamix::transform;
using namespace Eigen;

namespace {

// Positive (time, channel) media with a distinct value in each cell
mediamix::Array nationalMedia(Index T = 12, Index C = 3) {
    MatrixXd m(T, C);
    for (Index t = 0; t < T; t++) for (Index c = 0; c < C; c++) m(t, c) = 1 + 0.5 * t + c;
    return mediamix::Array(m);
}

// (time, channel, geo) media whose every geo slice equals nationalMedia()
mediamix::Array geoMedia(Index G, Index T = 12, Index C = 3) {
    Tensor<double, 3> x(T, C, G);
    ArrayXXd n = nationalMedia(T, C).matrix();
    for (Index g = 0; g < G; g++) for (Index c = 0; c < C; c++) for (Index t = 0; t < T; t++) x(t, c, g) = n(t, c);
    return mediamix::Array(x);
}

mediamix::Array series(const std::vector<double> &v) {
    MatrixXd m(v.size(), 1);
    for (size_t i = 0; i < v.size(); i++) m((Index) i, 0) = v[i];
    return mediamix::Array(m);
}

std::vector<std::string> sampleSites(const Trace &t) {
    std::vector<std::string> names;
    for (const auto &s : t.sites()) if (s.type == Site::Type::Sample) names.push_back(s.name);
    return names;
}

}

TEST(MediaTransform, PreservesShape) {
    for (auto kind : kinds()) {
        auto transform = MediaTransform::create(kind);
        EXPECT_EQ(transform->kind(), kind);

        Tracer national;
        mediamix::Array n = (*transform)(national, nationalMedia(), PriorSpec());
        EXPECT_EQ(n.shape(), Shape({12, 3})) << name(kind);

        Tracer geo;
        mediamix::Array g = (*transform)(geo, geoMedia(5), PriorSpec());
        EXPECT_EQ(g.shape(), Shape({12, 3, 5})) << name(kind);
        EXPECT_TRUE(g.values().allFinite()) << name(kind);
    }
}

TEST(MediaTransform, DeclaredParameters) {
    std::map<Kind, std::vector<std::string>> expected{
        {Kind::Adstock, {"lag_weight", "exponent"}},
        {Kind::HillAdstock, {"lag_weight", "half_max_effective_concentration", "slope"}},
        {Kind::Carryover, {"ad_effect_retention_rate", "peak_effect_delay", "exponent"}},
        {Kind::ExponentialAdstock, {"lag_weight", "slope"}},
        {Kind::ExponentialAdstockStaticDim, {"lag_weight"}},
        {Kind::ExponentialAdstockStaticDecay, {"slope"}},
        {Kind::ExponentialAdstockStaticDimDecay, {}}
    };
    for (const auto &e : expected) {
        for (auto media : {nationalMedia(), geoMedia(4)}) {
            Tracer tracer;
            (*MediaTransform::create(e.first))(tracer, media, PriorSpec());
            EXPECT_EQ(sampleSites(tracer.trace()), e.second) << name(e.first);
            for (const auto &site : tracer.trace().sites()) {
                // Transform parameters are per channel only, even in geo mode
                ASSERT_EQ(site.plates.size(), 1u);
                EXPECT_EQ(site.plates[0].name, site.name + "_plate");
                EXPECT_EQ(site.plates[0].size, 3);
                EXPECT_EQ(site.value.shape(), Shape({3}));
            }
        }
    }
}

TEST(MediaTransform, Bindings) {
    auto b = MediaTransform::create(Kind::ExponentialAdstockStaticDim)->bindings(PriorSpec());
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].first, "lag_weight");
    EXPECT_TRUE(b[0].second.isSampled());
    EXPECT_EQ(b[0].second.prior(), Distribution::beta(2, 1));
    EXPECT_EQ(b[1].first, "slope");
    EXPECT_FALSE(b[1].second.isSampled());
    EXPECT_EQ(b[1].second.value(), 1.0);
    EXPECT_THROW(b[1].second.prior(), std::logic_error);

    PriorSpec custom{{"lag_weight", std::vector<double>{3, 1}}, {"slope", 2.0}};
    auto c = MediaTransform::create(Kind::ExponentialAdstockStaticDim)->bindings(custom);
    EXPECT_EQ(c[0].second, ParameterBinding::sampled(Distribution::fromPositional(Distribution::Family::Beta, {3.0, 1.0})));
    EXPECT_EQ(c[1].second, ParameterBinding::fixed(2.0));
}

TEST(MediaTransform, UnknownName) {
    EXPECT_THROW(MediaTransform::create("transform_adstock"), UnknownTransformName);
    EXPECT_THROW(MediaTransform::create("hill"), UnknownTransformName);
}

TEST(MediaTransform, StaticVariantsMatchPinnedPriors) {
    const mediamix::Array media = nationalMedia();
    Tracer t1, t2;

    PriorSpec pinned{{"lag_weight", Distribution::delta(1)}, {"slope", Distribution::delta(1)}};
    mediamix::Array full = (*MediaTransform::create(Kind::ExponentialAdstock))(t1, media, pinned);
    mediamix::Array fixed = (*MediaTransform::create(Kind::ExponentialAdstockStaticDimDecay))(t2, media, PriorSpec());
    EXPECT_TRUE(fixed.values().isApprox(full.values()));
    EXPECT_TRUE(t2.trace().empty());

    // static_dim: slope fixed at 1, lag_weight sampled
    Tracer t3, t4;
    ArrayXXd lag = ArrayXXd::Constant(3, 1, 0.3);
    t3.substitute("lag_weight", lag);
    t4.substitute("lag_weight", lag);
    mediamix::Array dim = (*MediaTransform::create(Kind::ExponentialAdstockStaticDim))(t3, media, PriorSpec());
    mediamix::Array dim_full = (*MediaTransform::create(Kind::ExponentialAdstock))(t4, media, PriorSpec{{"slope", Distribution::delta(1)}});
    EXPECT_TRUE(dim.values().isApprox(dim_full.values()));

    // static_decay: lag weight fixed at 1, slope sampled
    Tracer t5, t6;
    ArrayXXd slope = ArrayXXd::Constant(3, 1, 0.05);
    t5.substitute("slope", slope);
    t6.substitute("slope", slope);
    mediamix::Array decay = (*MediaTransform::create(Kind::ExponentialAdstockStaticDecay))(t5, media, PriorSpec());
    mediamix::Array decay_full = (*MediaTransform::create(Kind::ExponentialAdstock))(t6, media, PriorSpec{{"lag_weight", Distribution::delta(1)}});
    EXPECT_TRUE(decay.values().isApprox(decay_full.values()));
}

TEST(MediaTransform, PinnedConstantOverride) {
    const mediamix::Array media = nationalMedia();
    Tracer t1, t2;
    mediamix::Array overridden = (*MediaTransform::create(Kind::ExponentialAdstockStaticDimDecay))(t1, media, PriorSpec{{"slope", 0.1}, {"lag_weight", 0.5}});
    mediamix::Array pinned = (*MediaTransform::create(Kind::ExponentialAdstock))(t2, media,
            PriorSpec{{"lag_weight", Distribution::delta(0.5)}, {"slope", Distribution::delta(0.1)}});
    EXPECT_TRUE(overridden.values().isApprox(pinned.values()));

    Tracer t3;
    EXPECT_THROW((*MediaTransform::create(Kind::ExponentialAdstockStaticDim))(t3, media, PriorSpec{{"slope", Distribution::gamma(1, 1)}}),
            PriorError);
}

TEST(MediaTransform, IgnoresIrrelevantPriors) {
    eris::Random::rng_t rng1(7), rng2(7);
    Tracer t1(rng1), t2(rng2);
    const mediamix::Array media = nationalMedia();
    mediamix::Array plain = (*MediaTransform::create(Kind::Adstock))(t1, media, PriorSpec());
    mediamix::Array extra = (*MediaTransform::create(Kind::Adstock))(t2, media, PriorSpec{{"peak_effect_delay", 1.0}, {"slope", Distribution::gamma(2, 2)}});
    EXPECT_TRUE((plain.values() == extra.values()).all());
    EXPECT_EQ(t1.trace().names(), t2.trace().names());
}

TEST(MediaTransform, NormaliseDefaults) {
    const mediamix::Array media = series({1, 0, 0});
    PriorSpec custom{{"lag_weight", Distribution::delta(0.5)}, {"exponent", Distribution::delta(1)}};

    Tracer t1;
    mediamix::Array normalised = (*MediaTransform::create(Kind::Adstock))(t1, media, custom);
    EXPECT_DOUBLE_EQ(normalised.values()[0], 0.5);
    EXPECT_DOUBLE_EQ(normalised.values()[1], 0.25);

    Options raw;
    raw.normalise = false;
    Tracer t2;
    mediamix::Array plain = (*MediaTransform::create(Kind::Adstock))(t2, media, custom, raw);
    EXPECT_DOUBLE_EQ(plain.values()[0], 1);
    EXPECT_DOUBLE_EQ(plain.values()[1], 0.5);

    // The exponential family does not normalise unless asked to
    PriorSpec exp_custom{{"lag_weight", Distribution::delta(0.5)}, {"slope", Distribution::delta(1)}};
    Tracer t3, t4;
    mediamix::Array e = (*MediaTransform::create(Kind::ExponentialAdstock))(t3, media, exp_custom);
    EXPECT_NEAR(e.values()[1], 1 - std::exp(-0.5), 1e-12);
    Options norm;
    norm.normalise = true;
    mediamix::Array en = (*MediaTransform::create(Kind::ExponentialAdstock))(t4, media, exp_custom, norm);
    EXPECT_NEAR(en.values()[1], 1 - std::exp(-0.25), 1e-12);
}

TEST(MediaTransform, CarryoverLags) {
    const mediamix::Array media = series({1, 2, 3, 4});
    PriorSpec custom{
        {"ad_effect_retention_rate", Distribution::delta(0.5)},
        {"peak_effect_delay", Distribution::delta(0)},
        {"exponent", Distribution::delta(1)}};
    Options one_lag;
    one_lag.number_lags = 1;
    Tracer t1;
    mediamix::Array out = (*MediaTransform::create(Kind::Carryover))(t1, media, custom, one_lag);
    EXPECT_TRUE(out.values().isApprox(media.values()));

    // Two lags: weights 1 and 0.5
    Options two_lags;
    two_lags.number_lags = 2;
    Tracer t2;
    mediamix::Array two = (*MediaTransform::create(Kind::Carryover))(t2, media, custom, two_lags);
    EXPECT_NEAR(two.values()[0], 1 / 1.5, 1e-12);
    EXPECT_NEAR(two.values()[1], (2 + 0.5) / 1.5, 1e-12);
}

TEST(MediaTransform, GeoSlicesMatchNational) {
    const mediamix::Array national = nationalMedia(), geo = geoMedia(4);
    for (auto kind : kinds()) {
        auto transform = MediaTransform::create(kind);
        eris::Random::rng_t rng1(2024), rng2(2024);
        Tracer tn(rng1), tg(rng2);
        mediamix::Array n = (*transform)(tn, national, PriorSpec());
        mediamix::Array g = (*transform)(tg, geo, PriorSpec());

        // Same per-channel parameters are drawn in both modes
        for (const auto &site : tn.trace().sites())
            EXPECT_TRUE((site.value.values() == tg.trace()[site.name].value.values()).all()) << name(kind);

        const Index slice = n.size();
        for (Index s = 0; s < 4; s++)
            EXPECT_TRUE((g.values().segment(s * slice, slice) == n.values()).all()) << name(kind) << " geo " << s;
    }
}

TEST(MediaTransform, PinnedEdgeValuesHaveFiniteDensity) {
    // exponent = 1 and lag_weight = 1 lie on the edge of their default Beta priors
    Tracer tracer;
    tracer.substitute("lag_weight", ArrayXXd::Ones(3, 1));
    tracer.substitute("exponent", ArrayXXd::Ones(3, 1));
    (*MediaTransform::create(Kind::Adstock))(tracer, nationalMedia(), PriorSpec());
    EXPECT_NEAR(tracer.trace().logJoint(), 3 * (std::log(2.0) + std::log(9.0)), 1e-12);
}
