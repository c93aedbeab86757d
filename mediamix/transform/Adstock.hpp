#pragma once
#include "mediamix/transform/MediaTransform.hpp"

namespace mediamix { namespace transform {

/** Geometric adstock followed by a power: `applyExponentSafe(adstock(media, lag_weight), exponent)`.
 * Samples `lag_weight` and `exponent` per channel.  Normalises the adstock by default.
 */
class Adstock : public MediaTransform {
    public:
        /// Constructs the transform
        Adstock();

    protected:
        virtual Tensor3 apply(const Tensor3 &media, const Parameters &params, const Options &options) const override;
};

}}
