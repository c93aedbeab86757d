#include "mediamix/transform/Kind.hpp"

namespace mediamix { namespace transform {

UnknownTransformName::UnknownTransformName(const std::string &name)
    : std::invalid_argument("Unknown media transform `" + name + "'")
{}

const std::vector<Kind>& kinds() {
    static const std::vector<Kind> all{
        Kind::Adstock, Kind::HillAdstock, Kind::Carryover, Kind::ExponentialAdstock,
        Kind::ExponentialAdstockStaticDim, Kind::ExponentialAdstockStaticDecay, Kind::ExponentialAdstockStaticDimDecay};
    return all;
}

const std::string& name(Kind kind) {
    static const std::string
        adstock("adstock"),
        hill_adstock("hill_adstock"),
        carryover("carryover"),
        exponential_adstock("exponential_adstock"),
        static_dim("exponential_adstock_static_dim"),
        static_decay("exponential_adstock_static_decay"),
        static_dim_decay("exponential_adstock_static_dim_decay");
    switch (kind) {
        case Kind::Adstock: return adstock;
        case Kind::HillAdstock: return hill_adstock;
        case Kind::Carryover: return carryover;
        case Kind::ExponentialAdstock: return exponential_adstock;
        case Kind::ExponentialAdstockStaticDim: return static_dim;
        case Kind::ExponentialAdstockStaticDecay: return static_decay;
        case Kind::ExponentialAdstockStaticDimDecay: return static_dim_decay;
    }
    throw std::logic_error("transform::name: invalid transform kind");
}

Kind parse(const std::string &n) {
    for (auto k : kinds()) {
        if (name(k) == n) return k;
    }
    throw UnknownTransformName(n);
}

}}
