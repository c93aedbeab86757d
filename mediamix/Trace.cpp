#include "mediamix/Trace.hpp"
#include <eris/debug.hpp>
#include <stdexcept>

namespace mediamix {

using namespace Eigen;

const Site& Trace::operator[](const std::string &name) const {
    auto found = index_.find(name);
    if (found == index_.end()) throw std::out_of_range("Trace: no site named `" + name + "'");
    return sites_[found->second];
}

std::vector<std::string> Trace::names() const {
    std::vector<std::string> n;
    n.reserve(sites_.size());
    for (const auto &s : sites_) n.push_back(s.name);
    return n;
}

double Trace::logJoint() const {
    double lj = 0;
    for (const auto &s : sites_) lj += s.log_density;
    return lj;
}

void Trace::add(Site site) {
    if (has(site.name)) throw std::logic_error("Trace: duplicate site `" + site.name + "'");
    index_.emplace(site.name, sites_.size());
    sites_.push_back(std::move(site));
}

Tracer::Tracer(eris::Random::rng_t &rng) : rng_(rng) {}

void Tracer::substitute(const std::string &name, ArrayXXd value) {
    substitutes_[name] = std::move(value);
}

void Tracer::reset() {
    trace_ = Trace();
}

ArrayXXd Tracer::sample(const std::string &name, const Distribution &fn, const PlateStack &plates) {
    if (plates.size() > 2) throw std::logic_error("Tracer: site `" + name + "' is nested in more than two plates");
    Index rows = plates.size() >= 1 ? plates[0].size : 1, cols = plates.size() == 2 ? plates[1].size : 1;
    Shape shape;
    for (const auto &p : plates) shape.push_back(p.size);

    ArrayXXd value;
    auto sub = substitutes_.find(name);
    if (sub != substitutes_.end()) {
        value = sub->second;
        if (value.rows() != rows or value.cols() != cols)
            throw Array::ShapeError("Tracer: substituted value for `" + name + "' has shape (" + std::to_string(value.rows()) + ", " +
                    std::to_string(value.cols()) + "), but the site has shape " + to_string(shape));
    }
    else {
        value = fn.sample(rng_, rows, cols);
    }

    Site site;
    site.name = name;
    site.type = Site::Type::Sample;
    site.fn = std::make_shared<Distribution>(fn);
    site.plates = plates;
    site.value = Array(shape, Map<const ArrayXd>(value.data(), value.size()));
    site.log_density = fn.logDensity(value).sum();
    ERIS_DBG("sample " << name << " ~ " << fn << ", shape " << to_string(shape));
    trace_.add(std::move(site));
    return value;
}

void Tracer::deterministic(const std::string &name, const Array &value) {
    Site site;
    site.name = name;
    site.type = Site::Type::Deterministic;
    site.value = value;
    ERIS_DBG("deterministic " << name << ", shape " << to_string(value.shape()));
    trace_.add(std::move(site));
}

void Tracer::observe(const std::string &name, const Distribution &fn, const Array &observed) {
    Site site;
    site.name = name;
    site.type = Site::Type::Observed;
    site.fn = std::make_shared<Distribution>(fn);
    site.value = observed;
    site.log_density = fn.logDensity(observed.matrix()).sum();
    ERIS_DBG("observe " << name << " ~ " << fn << ", shape " << to_string(observed.shape()));
    trace_.add(std::move(site));
}

}
