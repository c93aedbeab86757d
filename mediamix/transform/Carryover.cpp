#include "mediamix/transform/Carryover.hpp"
#include "mediamix/PriorCatalog.hpp"

namespace mediamix { namespace transform {

Carryover::Carryover() : MediaTransform(Kind::Carryover, {
        {param::AD_EFFECT_RETENTION_RATE, false, 0},
        {param::PEAK_EFFECT_DELAY, false, 0},
        {param::EXPONENT, false, 0}})
{}

Tensor3 Carryover::apply(const Tensor3 &media, const Parameters &params, const Options &options) const {
    return applyExponentSafe(
            carryover(media, params.at(param::AD_EFFECT_RETENTION_RATE), params.at(param::PEAK_EFFECT_DELAY), options.number_lags),
            params.at(param::EXPONENT));
}

}}
