#include "mediamix/transform/MediaTransform.hpp"
#include "mediamix/transform/Adstock.hpp"
#include "mediamix/transform/Carryover.hpp"
#include "mediamix/transform/ExponentialAdstock.hpp"
#include "mediamix/transform/HillAdstock.hpp"
#include "mediamix/PriorCatalog.hpp"
#include "mediamix/PriorResolver.hpp"
#include <eris/debug.hpp>
#include <stdexcept>

namespace mediamix { namespace transform {

MediaTransform::MediaTransform(Kind kind, std::vector<Slot> slots) : kind_(kind), slots_(std::move(slots)) {}

std::unique_ptr<MediaTransform> MediaTransform::create(Kind kind) {
    std::unique_ptr<MediaTransform> t;
    switch (kind) {
        case Kind::Adstock:
            t.reset(new Adstock());
            break;
        case Kind::HillAdstock:
            t.reset(new HillAdstock());
            break;
        case Kind::Carryover:
            t.reset(new Carryover());
            break;
        case Kind::ExponentialAdstock:
        case Kind::ExponentialAdstockStaticDim:
        case Kind::ExponentialAdstockStaticDecay:
        case Kind::ExponentialAdstockStaticDimDecay:
            t.reset(new ExponentialAdstock(kind));
            break;
    }
    if (not t) throw std::logic_error("MediaTransform::create: invalid transform kind");
    return t;
}

std::unique_ptr<MediaTransform> MediaTransform::create(const std::string &name) {
    return create(parse(name));
}

Bindings MediaTransform::bindings(const PriorSpec &custom) const {
    const PriorTable defaults = PriorCatalog::defaultTransformPriors(kind_);
    Bindings b;
    for (const auto &slot : slots_) {
        if (slot.pinned)
            b.emplace_back(slot.name, ParameterBinding::fixed(PriorResolver::resolveConstant(slot.name, custom, slot.constant)));
        else
            b.emplace_back(slot.name, ParameterBinding::sampled(PriorResolver::resolve(slot.name, custom, defaults)));
    }
    return b;
}

Array MediaTransform::operator()(Handler &handler, const Array &media, const PriorSpec &custom, const Options &options) const {
    ShapeBroadcaster shapes(media);
    return shapes.media(transform(handler, shapes, shapes.storage(media), custom, options));
}

Tensor3 MediaTransform::transform(Handler &handler, const ShapeBroadcaster &shapes, const Tensor3 &media,
        const PriorSpec &custom, const Options &options) const {
    ERIS_DBG("declaring " << name(kind_) << " transform for " << shapes.channels() << " channels");
    Parameters params;
    for (const auto &b : bindings(custom)) {
        params.emplace(b.first, shapes.expandForGeo(b.second.bind(handler, b.first, shapes)));
    }
    return apply(media, params, options);
}

}}
