#include "mediamix/transform/ExponentialAdstock.hpp"
#include "mediamix/PriorCatalog.hpp"
#include <stdexcept>

namespace mediamix { namespace transform {

ExponentialAdstock::ExponentialAdstock(Kind kind) : MediaTransform(kind, slots(kind)) {}

std::vector<MediaTransform::Slot> ExponentialAdstock::slots(Kind kind) {
    bool decay_pinned, dim_pinned;
    switch (kind) {
        case Kind::ExponentialAdstock:
            decay_pinned = false; dim_pinned = false;
            break;
        case Kind::ExponentialAdstockStaticDim:
            decay_pinned = false; dim_pinned = true;
            break;
        case Kind::ExponentialAdstockStaticDecay:
            decay_pinned = true; dim_pinned = false;
            break;
        case Kind::ExponentialAdstockStaticDimDecay:
            decay_pinned = true; dim_pinned = true;
            break;
        default:
            throw std::invalid_argument("ExponentialAdstock: `" + name(kind) + "' is not an exponential adstock transform");
    }
    return {{param::LAG_WEIGHT, decay_pinned, 1.0}, {param::SLOPE, dim_pinned, 1.0}};
}

Tensor3 ExponentialAdstock::apply(const Tensor3 &media, const Parameters &params, const Options &options) const {
    return exponential(
            adstock(media, params.at(param::LAG_WEIGHT), options.normalise.value_or(false)),
            params.at(param::SLOPE));
}

}}
