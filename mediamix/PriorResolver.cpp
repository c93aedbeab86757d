#include "mediamix/PriorResolver.hpp"
#include <sstream>

namespace mediamix {

Distribution PriorResolver::resolve(const std::string &name, const PriorSpec &custom, const PriorTable &defaults) {
    auto def = defaults.find(name);
    auto c = custom.find(name);
    if (c != custom.end()) {
        if (c->second.type() == Prior::Type::Distribution) return c->second.distribution();
        if (def != defaults.end()) return c->second.toDistribution(def->second);
        throw PriorError("Custom prior for `" + name + "' is a literal, but `" + name + "' has no default prior to take its family from");
    }
    if (def == defaults.end())
        throw std::logic_error("PriorResolver: no default prior for `" + name + "'");
    return def->second;
}

double PriorResolver::resolveConstant(const std::string &name, const PriorSpec &custom, double fallback) {
    auto c = custom.find(name);
    if (c == custom.end()) return fallback;
    const Prior &p = c->second;
    if (p.type() == Prior::Type::Scalar) return p.scalar();
    if (p.type() == Prior::Type::Distribution and p.distribution().isDelta()) {
        const auto &v = p.distribution().parameter("value");
        if (v.size() == 1) return v(0, 0);
    }
    std::ostringstream msg;
    msg << "`" << name << "' is a pinned constant in this model; expected a constant value, not " << p;
    throw PriorError(msg.str());
}

}
