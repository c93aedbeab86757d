#pragma once
#include "mediamix/Distribution.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediamix {

/** Exception thrown when a custom prior cannot be turned into a distribution: a literal with
 * parameters its family does not have, or a non-constant value for a pinned parameter.
 */
class PriorError : public std::invalid_argument {
    public:
        /// Constructs with the given message
        explicit PriorError(const std::string &what);
};

/** A custom prior for one model parameter.  This is either a full Distribution or a convenience
 * literal: a single value, a sequence of positional values, or a mapping of parameter names to
 * values.  Literals have no family of their own; they are turned into a distribution of the same
 * family as the parameter's default prior by toDistribution().
 *
 * Priors are implicitly constructible from each of these, so that a PriorSpec can be written as:
 *
 *     PriorSpec custom{
 *         {"lag_weight", Distribution::beta(3, 1)},
 *         {"slope", 2.0},                                      // Gamma(2, 1)
 *         {"exponent", std::vector<double>{8, 2}},              // Beta(8, 2)
 *         {"intercept", std::map<std::string, double>{{"scale", 3}}}
 *     };
 */
class Prior {
    public:
        /// The kinds of prior value
        enum class Type { Distribution, Scalar, Sequence, Mapping };

        /// Not default constructible
        Prior() = delete;
        /// Wraps a full distribution
        Prior(Distribution d);
        /// A single value: the first parameter of the default family
        Prior(double v);
        /// Positional parameter values of the default family
        Prior(std::vector<double> values);
        /// Named parameter values of the default family
        Prior(std::map<std::string, double> values);

        /// Returns the kind of value this prior holds
        Type type() const { return type_; }

        /** Returns the wrapped distribution.
         *
         * \throws std::logic_error if type() is not Type::Distribution
         */
        const Distribution& distribution() const;

        /** Returns the single value of a Type::Scalar prior.
         *
         * \throws std::logic_error if type() is not Type::Scalar
         */
        double scalar() const;

        /** Returns this prior as a distribution.  A wrapped distribution is returned as is; a
         * literal becomes a distribution of the same family as `family_default` (the parameter
         * values of `family_default` itself are not used).
         *
         * \throws PriorError if the literal does not fit the family's parameters
         */
        Distribution toDistribution(const Distribution &family_default) const;

        /** Parses a prior from a string.  Accepted forms are:
         *
         * - `family(a, b)`, e.g. `beta(2,1)` or `half_normal(2)`: a full distribution with
         *   positional parameters
         * - `1.5`: a scalar literal
         * - `2,1`: a sequence literal
         * - `concentration=2;rate=0.5`: a mapping literal
         *
         * \throws PriorError if the string is not in one of these forms
         */
        static Prior parse(const std::string &spec);

        /// Prints the prior value
        friend std::ostream& operator<<(std::ostream &os, const Prior &p);

    private:
        Type type_;
        std::shared_ptr<const Distribution> dist_;
        std::vector<double> values_;
        std::map<std::string, double> named_;
};

/** Custom priors keyed by parameter name.  Names that do not apply to the model being declared are
 * ignored.
 */
using PriorSpec = std::map<std::string, Prior>;

}
