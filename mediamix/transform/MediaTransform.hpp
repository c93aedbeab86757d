#pragma once
#include "mediamix/Array.hpp"
#include "mediamix/Handler.hpp"
#include "mediamix/Prior.hpp"
#include "mediamix/ShapeBroadcaster.hpp"
#include "mediamix/transform/Kind.hpp"
#include "mediamix/transform/ParameterBinding.hpp"
#include "mediamix/transform/Primitives.hpp"
#include <boost/optional.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mediamix { namespace transform {

/// Options controlling the numerical behaviour of a transform.
struct Options {
    /** Whether adstock output is normalised by \f$1 - w\f$.  If unset, adstock and hill_adstock
     * normalise and the exponential family does not.
     */
    boost::optional<bool> normalise;
    /// The number of lags of the carryover window
    unsigned int number_lags = 13;
};

/// The bindings of a transform's parameters, in declaration order.
using Bindings = std::vector<std::pair<std::string, ParameterBinding>>;

/** Abstract base class of the media transforms.  A transform declares its per-channel parameters
 * into a Handler and converts media data into effective media exposure of the same shape.
 *
 * Subclasses list their parameters (sampled or pinned to a constant) at construction and implement
 * apply(); the parameter declaration, prior resolution and national/geo broadcasting are done
 * here, so every transform handles national and geo media the same way.
 */
class MediaTransform {
    public:
        /// Virtual destructor
        virtual ~MediaTransform() = default;

        /// Creates the transform of the given kind
        static std::unique_ptr<MediaTransform> create(Kind kind);

        /** Creates the transform with the given name.
         *
         * \throws UnknownTransformName if `name` is not a transform name
         */
        static std::unique_ptr<MediaTransform> create(const std::string &name);

        /// The kind of this transform
        Kind kind() const { return kind_; }

        /** Resolves the binding of each parameter of the transform.  A sampled parameter takes its
         * prior from `custom` if present, the catalog default otherwise.  A pinned parameter is
         * fixed to its constant, which a scalar or Delta entry in `custom` overrides.  Entries of
         * `custom` for parameters the transform does not have are ignored.
         *
         * \throws PriorError if a custom prior cannot be used for its parameter
         */
        Bindings bindings(const PriorSpec &custom) const;

        /** Declares the transform parameters into `handler` and returns the transformed media,
         * with the same shape as `media`.
         *
         * \throws UnsupportedMediaRank if `media` is not rank 2 or 3
         * \throws PriorError if a custom prior cannot be used for its parameter
         */
        Array operator()(Handler &handler, const Array &media, const PriorSpec &custom, const Options &options = Options()) const;

        /** Same as operator(), but operating on the internal (time, channel, geo) media tensor of
         * `shapes`.
         */
        Tensor3 transform(Handler &handler, const ShapeBroadcaster &shapes, const Tensor3 &media,
                const PriorSpec &custom, const Options &options) const;

    protected:
        /// One parameter of a transform
        struct Slot {
            /// The parameter (and site) name
            std::string name;
            /// True if the parameter is pinned to `constant` instead of sampled
            bool pinned;
            /// The value of a pinned parameter
            double constant;
        };

        /// Constructs a transform of the given kind with the given parameters, in declaration order
        MediaTransform(Kind kind, std::vector<Slot> slots);

        /// Shorthand for the parameter values passed to apply(), keyed by parameter name
        using Parameters = std::map<std::string, Tensor3>;

        /** Computes the transformed media from the (time, channel, geo) media tensor and the
         * (1, channel, 1) parameter tensors.
         */
        virtual Tensor3 apply(const Tensor3 &media, const Parameters &params, const Options &options) const = 0;

    private:
        Kind kind_;
        std::vector<Slot> slots_;
};

}}
