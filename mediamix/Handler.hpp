#pragma once
#include "mediamix/Array.hpp"
#include "mediamix/Distribution.hpp"
#include <Eigen/Core>
#include <string>
#include <vector>

namespace mediamix {

/** A declared repetition of a random variable along one axis.  `dim` is the axis the plate indexes,
 * counted from the right as in the value shape (-1 is the last axis).
 */
struct Plate {
    /// The plate name, such as "channel_media_plate"
    std::string name;
    /// The number of repetitions
    Eigen::Index size;
    /// The (negative) axis the plate indexes
    int dim;
};

/// Plates enclosing a site, outermost first.  The site value has one axis per plate, in this order.
using PlateStack = std::vector<Plate>;

/** Interface through which a model is declared.  A model declaration is a sequence of calls to
 * sample(), deterministic() and observe(); the Handler decides what a latent value is (a prior
 * draw, a value proposed by a sampler, a substituted value) and what is done with the declared
 * sites.
 *
 * Inference engines implement this interface; Tracer is the implementation shipped with the
 * library.
 */
class Handler {
    public:
        /// Virtual destructor
        virtual ~Handler() = default;

        /** Declares a latent random variable with distribution `fn`, repeated over `plates`, and
         * returns its value.  The returned array has `plates[0].size` rows and `plates[1].size`
         * columns (1 if there is no such plate); at most two plates are supported.
         */
        virtual Eigen::ArrayXXd sample(const std::string &name, const Distribution &fn, const PlateStack &plates) = 0;

        /// Declares a value fully determined by earlier sites and the model inputs.
        virtual void deterministic(const std::string &name, const Array &value) = 0;

        /// Declares an observed random variable with distribution `fn` conditioned on `observed`.
        virtual void observe(const std::string &name, const Distribution &fn, const Array &observed) = 0;
};

}
