#pragma once
#include "mediamix/Distribution.hpp"
#include "mediamix/Handler.hpp"
#include "mediamix/ShapeBroadcaster.hpp"
#include <Eigen/Core>
#include <memory>
#include <string>
#include <utility>

namespace mediamix { namespace transform {

/** How a transform obtains one of its per-channel parameters: either sampled from a prior, or fixed
 * to a constant.  Both kinds yield one value per channel; a fixed parameter declares no site.
 */
class ParameterBinding {
    public:
        /// Not default constructible
        ParameterBinding() = delete;

        /// A parameter sampled once per channel from `prior`
        static ParameterBinding sampled(Distribution prior);

        /// A parameter fixed to `value` for every channel
        static ParameterBinding fixed(double value);

        /// True for a sampled parameter
        bool isSampled() const { return bool(prior_); }

        /** The prior of a sampled parameter.
         *
         * \throws std::logic_error if the parameter is fixed
         */
        const Distribution& prior() const;

        /** The constant of a fixed parameter.
         *
         * \throws std::logic_error if the parameter is sampled
         */
        double value() const;

        /** Returns the per-channel values of the parameter.  A sampled parameter is declared into
         * `handler` as site `name` under the plate `<name>_plate` of size channels.
         */
        Eigen::ArrayXd bind(Handler &handler, const std::string &name, const ShapeBroadcaster &shapes) const;

        /// Two bindings are equal if both are fixed to the same value or sampled from equal priors
        bool operator==(const ParameterBinding &other) const;

    private:
        ParameterBinding(std::shared_ptr<const Distribution> prior, double value) : prior_(std::move(prior)), value_(value) {}

        std::shared_ptr<const Distribution> prior_;
        double value_;
};

}}
