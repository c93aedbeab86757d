#pragma once
#include "mediamix/Handler.hpp"
#include <eris/noncopyable.hpp>
#include <eris/Random.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mediamix {

/** One site of a model declaration. */
struct Site {
    /// The kind of declaration that produced the site
    enum class Type { Sample, Deterministic, Observed };

    /// The site name
    std::string name;
    /// The kind of site
    Type type;
    /// The distribution of a Sample or Observed site; null for a Deterministic site
    std::shared_ptr<const Distribution> fn;
    /// The plates enclosing a Sample site
    PlateStack plates;
    /// The site value: the latent value, the deterministic value, or the observed data
    Array value;
    /// The summed log density of the value under `fn`; 0 for a Deterministic site
    double log_density = 0;
};

/** The ordered list of sites produced by one model declaration. */
class Trace {
    public:
        /// Returns true if a site with the given name was declared
        bool has(const std::string &name) const { return index_.count(name) > 0; }

        /** Accesses a site by name.
         *
         * \throws std::out_of_range if there is no such site
         */
        const Site& operator[](const std::string &name) const;

        /// The sites, in declaration order
        const std::vector<Site>& sites() const { return sites_; }

        /// The site names, in declaration order
        std::vector<std::string> names() const;

        /// The number of declared sites
        size_t size() const { return sites_.size(); }

        /// True if nothing was declared
        bool empty() const { return sites_.empty(); }

        /// The log joint density: the sum of the log densities of all Sample and Observed sites
        double logJoint() const;

        /** Appends a site.
         *
         * \throws std::logic_error if a site with the same name was already added
         */
        void add(Site site);

    private:
        std::vector<Site> sites_;
        std::map<std::string, size_t> index_;
};

/** Handler that records a Trace of a model declaration.  Latent values are drawn from their
 * distributions using the given random number generator, except for sites given a value with
 * substitute(), which take that value instead.
 *
 * A Tracer records a single declaration: declaring the model again into the same Tracer fails with
 * duplicate site names.  Use a fresh Tracer (or reset()) per declaration.
 */
class Tracer : public Handler, private eris::noncopyable {
    public:
        /** Constructs a Tracer drawing latent values with `rng`, which defaults to the eris
         * thread-local generator.
         */
        explicit Tracer(eris::Random::rng_t &rng = eris::Random::rng());

        /** Fixes the value of the named latent site.  The value must have the shape of the site's
         * plates.  Substituted values are kept by reset().
         */
        void substitute(const std::string &name, Eigen::ArrayXXd value);

        /// Discards the recorded trace, so that the model can be declared again
        void reset();

        /// The recorded trace
        const Trace& trace() const { return trace_; }

        Eigen::ArrayXXd sample(const std::string &name, const Distribution &fn, const PlateStack &plates) override;

        void deterministic(const std::string &name, const Array &value) override;

        void observe(const std::string &name, const Distribution &fn, const Array &observed) override;

    private:
        eris::Random::rng_t &rng_;
        std::map<std::string, Eigen::ArrayXXd> substitutes_;
        Trace trace_;
};

}
