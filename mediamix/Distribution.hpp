#pragma once
#include "mediamix/Array.hpp"
#include <eris/Random.hpp>
#include <Eigen/Core>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace mediamix {

/** A probability distribution for a latent or observed model value.  The set of families is
 * closed: it covers the priors of the default catalog, the Normal media coefficient prior and
 * likelihood, and a point mass (Delta) used to pin a parameter to a value.
 *
 * Each family parameter is stored as a 2D array that broadcasts against the value it describes: a
 * 1x1 parameter applies to every element, an n x 1 parameter varies over the leading (channel or
 * time) axis, a 1 x g parameter over the trailing (geo) axis.
 *
 * Parameter support (positive scales, concentrations) is not checked: invalid parameters produce
 * whatever the underlying boost::random distribution or the log density formula produce.
 */
class Distribution {
    public:
        /// The supported distribution families
        enum class Family { Normal, HalfNormal, Gamma, Beta, Delta };

        /// Not default constructible
        Distribution() = delete;

        /// Normal distribution with the given location and scale
        static Distribution normal(double loc, double scale);
        /// Normal distribution with broadcastable location and scale arrays
        static Distribution normal(Eigen::ArrayXXd loc, Eigen::ArrayXXd scale);
        /// Half-normal distribution (the absolute value of a N(0, scale))
        static Distribution halfNormal(double scale);
        /// Gamma distribution with shape `concentration` and inverse-scale `rate`
        static Distribution gamma(double concentration, double rate);
        /// Beta distribution with \f$\alpha\f$ = `concentration1`, \f$\beta\f$ = `concentration0`
        static Distribution beta(double concentration1, double concentration0);
        /// Point mass at `value`
        static Distribution delta(double value);

        /** Constructs a distribution of the given family from positional parameter values, in the
         * order given by parameterNames().  Trailing parameters that have a family default (see
         * parameterDefault()) may be omitted.
         *
         * \throws std::invalid_argument if too many values are given or a required parameter is
         * missing
         */
        static Distribution fromPositional(Family family, const std::vector<double> &values);

        /** Constructs a distribution of the given family from named parameter values.  Parameters
         * with a family default may be omitted.
         *
         * \throws std::invalid_argument if a name is not a parameter of the family or a required
         * parameter is missing
         */
        static Distribution fromNamed(Family family, const std::map<std::string, double> &values);

        /// Returns the family of this distribution
        Family family() const { return family_; }

        /// Returns the family name, such as "HalfNormal"
        static const std::string& familyName(Family family);

        /** Parses a family name, ignoring case and underscores ("half_normal" and "HalfNormal" are
         * both accepted).
         *
         * \throws std::invalid_argument for an unknown family
         */
        static Family parseFamily(const std::string &name);

        /// The parameter names of a family, in positional order
        static const std::vector<std::string>& parameterNames(Family family);

        /// The default value of a family parameter, or NaN if the parameter is required
        static double parameterDefault(Family family, const std::string &name);

        /** Accesses a parameter by name.
         *
         * \throws std::invalid_argument if `name` is not a parameter of this distribution's family
         */
        const Eigen::ArrayXXd& parameter(const std::string &name) const;

        /// Accesses all parameters, in positional order
        const std::vector<Eigen::ArrayXXd>& parameters() const { return params_; }

        /// Returns true if this is a Delta distribution
        bool isDelta() const { return family_ == Family::Delta; }

        /** Draws a `rows` x `cols` array of independent values, broadcasting each parameter over
         * the drawn shape.
         *
         * \throws Array::ShapeError if a parameter cannot be broadcast to `rows` x `cols`
         */
        Eigen::ArrayXXd sample(eris::Random::rng_t &rng, Eigen::Index rows, Eigen::Index cols) const;

        /** Returns the elementwise log density of `x`.  Values outside the support have a log
         * density of negative infinity.
         *
         * \throws Array::ShapeError if a parameter cannot be broadcast to the shape of `x`
         */
        Eigen::ArrayXXd logDensity(const Eigen::ArrayXXd &x) const;

        /// Two distributions are equal if they have the same family and identical parameters
        bool operator==(const Distribution &other) const;
        /// Negation of ==
        bool operator!=(const Distribution &other) const { return not(*this == other); }

        /** Prints the distribution such as "Beta(concentration1=2, concentration0=1)".  Array
         * parameters print their shape instead of their values.
         */
        friend std::ostream& operator<<(std::ostream &os, const Distribution &d);

    private:
        Distribution(Family family, std::vector<Eigen::ArrayXXd> params);

        // Throws if a parameter does not broadcast to rows x cols
        void checkBroadcast(Eigen::Index rows, Eigen::Index cols) const;

        Family family_;
        std::vector<Eigen::ArrayXXd> params_;
};

}
