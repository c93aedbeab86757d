#include "mediamix/transform/HillAdstock.hpp"
#include "mediamix/PriorCatalog.hpp"

namespace mediamix { namespace transform {

HillAdstock::HillAdstock() : MediaTransform(Kind::HillAdstock, {
        {param::LAG_WEIGHT, false, 0},
        {param::HALF_MAX_EFFECTIVE_CONCENTRATION, false, 0},
        {param::SLOPE, false, 0}})
{}

Tensor3 HillAdstock::apply(const Tensor3 &media, const Parameters &params, const Options &options) const {
    return hill(
            adstock(media, params.at(param::LAG_WEIGHT), options.normalise.value_or(true)),
            params.at(param::HALF_MAX_EFFECTIVE_CONCENTRATION),
            params.at(param::SLOPE));
}

}}
