#pragma once
#include "mediamix/transform/MediaTransform.hpp"

namespace mediamix { namespace transform {

/** Geometric adstock followed by hill saturation:
 * `hill(adstock(media, lag_weight), half_max_effective_concentration, slope)`.  Samples all three
 * parameters per channel.  Normalises the adstock by default.
 */
class HillAdstock : public MediaTransform {
    public:
        /// Constructs the transform
        HillAdstock();

    protected:
        virtual Tensor3 apply(const Tensor3 &media, const Parameters &params, const Options &options) const override;
};

}}
