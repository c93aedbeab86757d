#include "mediamix/PriorCatalog.hpp"
#include "mediamix/PriorResolver.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

using namespace mediamix;
using transform::Kind;

TEST(PriorCatalog, ModelDefaults) {
    auto d = PriorCatalog::defaultModelPriors();
    ASSERT_EQ(d.size(), 4u);
    EXPECT_EQ(d.at("intercept"), Distribution::halfNormal(2));
    EXPECT_EQ(d.at("coef_trend"), Distribution::normal(0, 1));
    EXPECT_EQ(d.at("sigma"), Distribution::gamma(1, 1));
    EXPECT_EQ(d.at("coef_extra_features"), Distribution::normal(0, 1));
    EXPECT_EQ(PriorCatalog::modelPriorNames(), (std::set<std::string>{"intercept", "coef_trend", "sigma", "coef_extra_features"}));
}

TEST(PriorCatalog, TransformDefaults) {
    auto carry = PriorCatalog::defaultTransformPriors("carryover");
    ASSERT_EQ(carry.size(), 3u);
    EXPECT_EQ(carry.at("ad_effect_retention_rate"), Distribution::beta(1, 1));
    EXPECT_EQ(carry.at("peak_effect_delay"), Distribution::halfNormal(2));
    EXPECT_EQ(carry.at("exponent"), Distribution::beta(9, 1));

    auto ad = PriorCatalog::defaultTransformPriors("adstock");
    ASSERT_EQ(ad.size(), 2u);
    EXPECT_EQ(ad.at("exponent"), Distribution::beta(9, 1));
    EXPECT_EQ(ad.at("lag_weight"), Distribution::beta(2, 1));

    auto hill = PriorCatalog::defaultTransformPriors("hill_adstock");
    ASSERT_EQ(hill.size(), 3u);
    EXPECT_EQ(hill.at("lag_weight"), Distribution::beta(2, 1));
    EXPECT_EQ(hill.at("half_max_effective_concentration"), Distribution::gamma(1, 1));
    EXPECT_EQ(hill.at("slope"), Distribution::gamma(1, 1));

    auto exp = PriorCatalog::defaultTransformPriors("exponential_adstock");
    ASSERT_EQ(exp.size(), 2u);
    EXPECT_EQ(exp.at("lag_weight"), Distribution::beta(2, 1));
    EXPECT_EQ(exp.at("slope"), Distribution::gamma(1, 1));

    auto dim = PriorCatalog::defaultTransformPriors("exponential_adstock_static_dim");
    ASSERT_EQ(dim.size(), 1u);
    EXPECT_EQ(dim.at("lag_weight"), Distribution::beta(2, 1));

    auto decay = PriorCatalog::defaultTransformPriors("exponential_adstock_static_decay");
    ASSERT_EQ(decay.size(), 1u);
    EXPECT_EQ(decay.at("slope"), Distribution::gamma(1, 1));

    EXPECT_TRUE(PriorCatalog::defaultTransformPriors("exponential_adstock_static_dim_decay").empty());
}

TEST(PriorCatalog, UnknownTransform) {
    EXPECT_THROW(PriorCatalog::defaultTransformPriors("logistic"), transform::UnknownTransformName);
    EXPECT_THROW(PriorCatalog::defaultTransformPriors(""), transform::UnknownTransformName);
    try {
        PriorCatalog::defaultTransformPriors("Adstock");
        FAIL() << "Expected UnknownTransformName";
    }
    catch (const transform::UnknownTransformName &e) {
        EXPECT_NE(std::string(e.what()).find("Adstock"), std::string::npos);
    }
}

TEST(PriorCatalog, TransformNames) {
    for (auto k : transform::kinds()) EXPECT_EQ(transform::parse(transform::name(k)), k);
    EXPECT_EQ(transform::kinds().size(), 7u);

    EXPECT_EQ(PriorCatalog::transformPriorNames(Kind::Adstock), (std::set<std::string>{"lag_weight", "exponent"}));
    EXPECT_EQ(PriorCatalog::transformPriorNames(Kind::ExponentialAdstockStaticDimDecay), (std::set<std::string>{"lag_weight", "slope"}));
}

TEST(PriorCatalog, UnusedPriorNames) {
    PriorSpec custom{
        {"intercept", 1.0},
        {"lag_weight", Distribution::beta(3, 1)},
        {"slope", 2.0},
        {"peak_effect_delay", 1.0}
    };
    EXPECT_EQ(PriorCatalog::unusedPriorNames(custom, Kind::Adstock), (std::vector<std::string>{"peak_effect_delay", "slope"}));
    EXPECT_EQ(PriorCatalog::unusedPriorNames(custom, Kind::Carryover), (std::vector<std::string>{"lag_weight", "slope"}));
    EXPECT_TRUE(PriorCatalog::unusedPriorNames(PriorSpec(), Kind::HillAdstock).empty());

    PriorSpec terms{{"sigma", 2.0}, {"coef_trend", 1.0}, {"coef_extra_features", 1.0}};
    EXPECT_EQ(PriorCatalog::unusedPriorNames(terms, Kind::Adstock), (std::vector<std::string>{"coef_extra_features", "coef_trend"}));
    EXPECT_EQ(PriorCatalog::unusedPriorNames(terms, Kind::Adstock, true), (std::vector<std::string>{"coef_extra_features"}));
    EXPECT_EQ(PriorCatalog::unusedPriorNames(terms, Kind::Adstock, false, true), (std::vector<std::string>{"coef_trend"}));
    EXPECT_TRUE(PriorCatalog::unusedPriorNames(terms, Kind::Adstock, true, true).empty());
}

TEST(PriorResolver, DefaultWhenAbsent) {
    auto defaults = PriorCatalog::defaultModelPriors();
    EXPECT_EQ(PriorResolver::resolve("intercept", PriorSpec(), defaults), Distribution::halfNormal(2));

    // Every catalog entry resolves to itself when there are no custom priors
    for (auto k : transform::kinds()) {
        auto table = PriorCatalog::defaultTransformPriors(k);
        for (const auto &p : table) EXPECT_EQ(PriorResolver::resolve(p.first, PriorSpec(), table), p.second);
    }
}

TEST(PriorResolver, CustomOverrides) {
    auto defaults = PriorCatalog::defaultModelPriors();
    PriorSpec custom{
        {"intercept", Distribution::normal(1, 3)},
        {"sigma", std::vector<double>{2, 3}},
        {"coef_extra_features", std::map<std::string, double>{{"scale", 0.5}}},
        {"unrelated", 7.0}
    };
    EXPECT_EQ(PriorResolver::resolve("intercept", custom, defaults), Distribution::normal(1, 3));
    EXPECT_EQ(PriorResolver::resolve("sigma", custom, defaults), Distribution::gamma(2, 3));
    EXPECT_EQ(PriorResolver::resolve("coef_extra_features", custom, defaults), Distribution::normal(0, 0.5));
    EXPECT_EQ(PriorResolver::resolve("coef_trend", custom, defaults), Distribution::normal(0, 1));

    // Every transform parameter can be overridden
    for (auto k : transform::kinds()) {
        auto table = PriorCatalog::defaultTransformPriors(k);
        for (const auto &p : table) {
            const Distribution replacement = Distribution::delta(0.25);
            PriorSpec one{{p.first, replacement}};
            EXPECT_EQ(PriorResolver::resolve(p.first, one, table), replacement) << transform::name(k) << ": " << p.first;
        }
    }
}

TEST(PriorResolver, Errors) {
    auto defaults = PriorCatalog::defaultModelPriors();
    EXPECT_THROW(PriorResolver::resolve("no_such_parameter", PriorSpec(), defaults), std::logic_error);
    PriorSpec literal{{"no_such_parameter", 1.0}};
    EXPECT_THROW(PriorResolver::resolve("no_such_parameter", literal, defaults), PriorError);
    PriorSpec dist{{"no_such_parameter", Distribution::delta(1)}};
    EXPECT_EQ(PriorResolver::resolve("no_such_parameter", dist, defaults), Distribution::delta(1));
    PriorSpec bad{{"intercept", std::vector<double>{1, 2}}};
    EXPECT_THROW(PriorResolver::resolve("intercept", bad, defaults), PriorError);
}

TEST(PriorResolver, Constants) {
    EXPECT_EQ(PriorResolver::resolveConstant("slope", PriorSpec(), 1.0), 1.0);
    EXPECT_EQ(PriorResolver::resolveConstant("slope", PriorSpec{{"slope", 2.5}}, 1.0), 2.5);
    EXPECT_EQ(PriorResolver::resolveConstant("slope", PriorSpec{{"slope", Distribution::delta(0.5)}}, 1.0), 0.5);
    EXPECT_THROW(PriorResolver::resolveConstant("slope", PriorSpec{{"slope", Distribution::gamma(1, 1)}}, 1.0), PriorError);
    EXPECT_THROW(PriorResolver::resolveConstant("slope", PriorSpec{{"slope", std::vector<double>{1, 2}}}, 1.0), PriorError);
}
