#pragma once
#include "mediamix/cmdargs/CmdArgs.hpp"
#include "mediamix/ModelAssembler.hpp"
#include <eris/Random.hpp>
#include <string>
#include <vector>

namespace boost { namespace program_options { class variables_map; } }

namespace mediamix { namespace cmdargs {

/** CmdArgs subclass for mediamix-prior-check, which declares the model for the given data and
 * prints draws from the prior.
 */
class PriorCheck : public CmdArgs {
    public:
        /// The CSV file containing the media data
        std::string media;

        /// The CSV file containing the target data
        std::string target;

        /// The CSV file containing extra features; empty for none
        std::string extra_features;

        /// The number of geos: 0 for national data
        unsigned int geos = 0;

        /// The per-channel prior mean of the media coefficients
        std::vector<double> media_prior;

        /** The per-channel prior scale of the media coefficients.  A single value applies to every
         * channel.
         */
        std::vector<double> media_sigma{{1.0}};

        /** The model settings: the transform, custom priors, transform options and trend.  Set
         * from --transform, --prior, --normalise, --number-lags and --trend.
         */
        ModelSettings settings;

        /// The number of prior draws to print
        unsigned int draws = 10;

        /** The seed.  The default is whatever eris::Random::seed() returns, which is random
         * (unless overridden with ERIS_RNG_SEED).  This value can be ignored: it is handled by
         * parse().
         */
        typename eris::Random::rng_t::result_type seed = eris::Random::seed();

        /// Names the required arguments
        virtual std::string usage() const override;

        /// Overridden to describe the output
        virtual std::string help() const override;

        /// Overridden to add " -- prior predictive check"
        virtual std::string versionSuffix() const override;

    protected:
        /// Adds the data, model and output options
        virtual void addOptions() override;

        /** Overridden to check that the required files are given, to parse the --prior,
         * --normalise and --transform values, and to set the seed.
         */
        virtual void postParse(boost::program_options::variables_map &vars) override;

    private:
        // Raw values that need parsing in postParse
        std::vector<std::string> prior_args_;
        std::string normalise_ = "auto";
};

}}
