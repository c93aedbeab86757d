#pragma once
#include "mediamix/transform/MediaTransform.hpp"

namespace mediamix { namespace transform {

/** Delayed-peak carryover followed by a power:
 * `applyExponentSafe(carryover(media, ad_effect_retention_rate, peak_effect_delay, number_lags), exponent)`.
 * Samples the retention rate, the peak delay and the exponent per channel; the number of lags
 * comes from Options::number_lags.
 */
class Carryover : public MediaTransform {
    public:
        /// Constructs the transform
        Carryover();

    protected:
        virtual Tensor3 apply(const Tensor3 &media, const Parameters &params, const Options &options) const override;
};

}}
