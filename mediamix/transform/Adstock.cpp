#include "mediamix/transform/Adstock.hpp"
#include "mediamix/PriorCatalog.hpp"

namespace mediamix { namespace transform {

Adstock::Adstock() : MediaTransform(Kind::Adstock, {{param::LAG_WEIGHT, false, 0}, {param::EXPONENT, false, 0}}) {}

Tensor3 Adstock::apply(const Tensor3 &media, const Parameters &params, const Options &options) const {
    return applyExponentSafe(
            adstock(media, params.at(param::LAG_WEIGHT), options.normalise.value_or(true)),
            params.at(param::EXPONENT));
}

}}
