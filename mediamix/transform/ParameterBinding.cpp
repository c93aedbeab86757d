#include "mediamix/transform/ParameterBinding.hpp"
#include <limits>
#include <stdexcept>

namespace mediamix { namespace transform {

using namespace Eigen;

ParameterBinding ParameterBinding::sampled(Distribution prior) {
    return ParameterBinding(std::make_shared<Distribution>(std::move(prior)), std::numeric_limits<double>::quiet_NaN());
}

ParameterBinding ParameterBinding::fixed(double value) {
    return ParameterBinding(nullptr, value);
}

const Distribution& ParameterBinding::prior() const {
    if (not prior_) throw std::logic_error("ParameterBinding::prior() called on a fixed parameter");
    return *prior_;
}

double ParameterBinding::value() const {
    if (prior_) throw std::logic_error("ParameterBinding::value() called on a sampled parameter");
    return value_;
}

ArrayXd ParameterBinding::bind(Handler &handler, const std::string &name, const ShapeBroadcaster &shapes) const {
    if (not prior_) return ArrayXd::Constant(shapes.channels(), value_);
    ArrayXXd draw = handler.sample(name, *prior_, shapes.channelPlate(name));
    return draw.col(0);
}

bool ParameterBinding::operator==(const ParameterBinding &other) const {
    if (isSampled() != other.isSampled()) return false;
    return isSampled() ? *prior_ == *other.prior_ : value_ == other.value_;
}

}}
