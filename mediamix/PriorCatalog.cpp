#include "mediamix/PriorCatalog.hpp"

namespace mediamix {

using transform::Kind;

PriorTable PriorCatalog::defaultModelPriors() {
    return {
        {param::INTERCEPT, Distribution::halfNormal(2.0)},
        {param::COEF_TREND, Distribution::normal(0.0, 1.0)},
        {param::SIGMA, Distribution::gamma(1.0, 1.0)},
        {param::COEF_EXTRA_FEATURES, Distribution::normal(0.0, 1.0)}
    };
}

PriorTable PriorCatalog::defaultTransformPriors(Kind kind) {
    switch (kind) {
        case Kind::Carryover:
            return {
                {param::AD_EFFECT_RETENTION_RATE, Distribution::beta(1.0, 1.0)},
                {param::PEAK_EFFECT_DELAY, Distribution::halfNormal(2.0)},
                {param::EXPONENT, Distribution::beta(9.0, 1.0)}
            };
        case Kind::Adstock:
            return {
                {param::EXPONENT, Distribution::beta(9.0, 1.0)},
                {param::LAG_WEIGHT, Distribution::beta(2.0, 1.0)}
            };
        case Kind::HillAdstock:
            return {
                {param::LAG_WEIGHT, Distribution::beta(2.0, 1.0)},
                {param::HALF_MAX_EFFECTIVE_CONCENTRATION, Distribution::gamma(1.0, 1.0)},
                {param::SLOPE, Distribution::gamma(1.0, 1.0)}
            };
        case Kind::ExponentialAdstock:
            return {
                {param::LAG_WEIGHT, Distribution::beta(2.0, 1.0)},
                {param::SLOPE, Distribution::gamma(1.0, 1.0)}
            };
        case Kind::ExponentialAdstockStaticDim:
            return {{param::LAG_WEIGHT, Distribution::beta(2.0, 1.0)}};
        case Kind::ExponentialAdstockStaticDecay:
            return {{param::SLOPE, Distribution::gamma(1.0, 1.0)}};
        case Kind::ExponentialAdstockStaticDimDecay:
            return {};
    }
    throw std::logic_error("PriorCatalog::defaultTransformPriors: invalid transform kind");
}

PriorTable PriorCatalog::defaultTransformPriors(const std::string &name) {
    return defaultTransformPriors(transform::parse(name));
}

const std::set<std::string>& PriorCatalog::modelPriorNames() {
    static const std::set<std::string> names{param::INTERCEPT, param::COEF_TREND, param::SIGMA, param::COEF_EXTRA_FEATURES};
    return names;
}

std::set<std::string> PriorCatalog::transformPriorNames(Kind kind) {
    switch (kind) {
        case Kind::ExponentialAdstockStaticDim:
        case Kind::ExponentialAdstockStaticDecay:
        case Kind::ExponentialAdstockStaticDimDecay:
            return {param::LAG_WEIGHT, param::SLOPE};
        default:
            break;
    }
    std::set<std::string> names;
    for (const auto &p : defaultTransformPriors(kind)) names.insert(p.first);
    return names;
}

std::vector<std::string> PriorCatalog::unusedPriorNames(const PriorSpec &custom, Kind kind, bool trend, bool extra_features) {
    auto used = transformPriorNames(kind);
    used.insert(param::INTERCEPT);
    used.insert(param::SIGMA);
    if (trend) used.insert(param::COEF_TREND);
    if (extra_features) used.insert(param::COEF_EXTRA_FEATURES);
    std::vector<std::string> unused;
    for (const auto &c : custom) {
        if (not used.count(c.first)) unused.push_back(c.first);
    }
    return unused;
}

}
