#pragma once
#include "mediamix/Distribution.hpp"
#include "mediamix/Prior.hpp"
#include "mediamix/transform/Kind.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mediamix {

/// Parameter names used by the model and its transforms; these are also the declared site names.
namespace param {
    constexpr const char
        INTERCEPT[] = "intercept",
        COEF_TREND[] = "coef_trend",
        SIGMA[] = "sigma",
        COEF_EXTRA_FEATURES[] = "coef_extra_features",
        EXPONENT[] = "exponent",
        LAG_WEIGHT[] = "lag_weight",
        HALF_MAX_EFFECTIVE_CONCENTRATION[] = "half_max_effective_concentration",
        SLOPE[] = "slope",
        AD_EFFECT_RETENTION_RATE[] = "ad_effect_retention_rate",
        PEAK_EFFECT_DELAY[] = "peak_effect_delay";
}

/// A table of default priors, keyed by parameter name
using PriorTable = std::map<std::string, Distribution>;

/** Catalog of default priors.  The model-level table covers the parameters shared by every model;
 * each transform has its own table covering the parameters it samples.  Parameters a transform
 * pins to a constant have no entry in its table.
 *
 * | parameter                          | default                  |
 * |------------------------------------|--------------------------|
 * | intercept                          | HalfNormal(2)            |
 * | coef_trend                         | Normal(0, 1)             |
 * | sigma                              | Gamma(1, 1)              |
 * | coef_extra_features                | Normal(0, 1)             |
 * | lag_weight                         | Beta(2, 1)               |
 * | exponent                           | Beta(9, 1)               |
 * | half_max_effective_concentration   | Gamma(1, 1)              |
 * | slope                              | Gamma(1, 1)              |
 * | ad_effect_retention_rate           | Beta(1, 1)               |
 * | peak_effect_delay                  | HalfNormal(2)            |
 */
class PriorCatalog {
    public:
        /// Not constructible: all methods are static
        PriorCatalog() = delete;

        /// Returns the default priors of intercept, coef_trend, sigma and coef_extra_features
        static PriorTable defaultModelPriors();

        /// Returns the default priors of the parameters the given transform samples
        static PriorTable defaultTransformPriors(transform::Kind kind);

        /** Returns the default priors of the parameters the named transform samples.
         *
         * \throws transform::UnknownTransformName if `name` is not a transform name
         */
        static PriorTable defaultTransformPriors(const std::string &name);

        /// The names of the model-level parameters
        static const std::set<std::string>& modelPriorNames();

        /** The parameter names the given transform accepts custom priors for.  For the static
         * exponential variants this includes the pinned parameters, whose constant value can be
         * overridden.
         */
        static std::set<std::string> transformPriorNames(transform::Kind kind);

        /** Returns the names in `custom` that a model using the given transform does not use.
         * Such names are ignored when declaring the model; this is only useful for reporting.
         * `coef_trend` is used only when `trend` is true, and `coef_extra_features` only when
         * `extra_features` is true.
         */
        static std::vector<std::string> unusedPriorNames(const PriorSpec &custom, transform::Kind kind,
                bool trend = false, bool extra_features = false);
};

}
