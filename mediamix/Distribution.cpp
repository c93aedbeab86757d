#include "mediamix/Distribution.hpp"
#include <boost/random/normal_distribution.hpp>
#include <boost/random/gamma_distribution.hpp>
#include <boost/random/beta_distribution.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <stdexcept>

namespace mediamix {

using namespace Eigen;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr double neg_inf = -std::numeric_limits<double>::infinity();
const double log_sqrt_2pi = 0.5 * std::log(2 * 3.14159265358979323846);

// Broadcast element (r,c) of a parameter array
inline double at(const ArrayXXd &p, Index r, Index c) {
    return p(p.rows() == 1 ? 0 : r, p.cols() == 1 ? 0 : c);
}

// c * log(v), taken as 0 when c is 0 (including at v == 0)
inline double xlog(double c, double logv) {
    return c == 0 ? 0.0 : c * logv;
}

double normalLogDensity(double x, double loc, double scale) {
    double z = (x - loc) / scale;
    return -0.5 * z * z - std::log(scale) - log_sqrt_2pi;
}

}

Distribution::Distribution(Family family, std::vector<ArrayXXd> params)
    : family_{family}, params_(std::move(params))
{
    if (params_.size() != parameterNames(family_).size())
        throw std::logic_error("Distribution: wrong number of parameters for " + familyName(family_));
}

Distribution Distribution::normal(double loc, double scale) {
    return Distribution(Family::Normal, {ArrayXXd::Constant(1, 1, loc), ArrayXXd::Constant(1, 1, scale)});
}

Distribution Distribution::normal(ArrayXXd loc, ArrayXXd scale) {
    return Distribution(Family::Normal, {std::move(loc), std::move(scale)});
}

Distribution Distribution::halfNormal(double scale) {
    return Distribution(Family::HalfNormal, {ArrayXXd::Constant(1, 1, scale)});
}

Distribution Distribution::gamma(double concentration, double rate) {
    return Distribution(Family::Gamma, {ArrayXXd::Constant(1, 1, concentration), ArrayXXd::Constant(1, 1, rate)});
}

Distribution Distribution::beta(double concentration1, double concentration0) {
    return Distribution(Family::Beta, {ArrayXXd::Constant(1, 1, concentration1), ArrayXXd::Constant(1, 1, concentration0)});
}

Distribution Distribution::delta(double value) {
    return Distribution(Family::Delta, {ArrayXXd::Constant(1, 1, value)});
}

Distribution Distribution::fromPositional(Family family, const std::vector<double> &values) {
    const auto &names = parameterNames(family);
    if (values.size() > names.size())
        throw std::invalid_argument(familyName(family) + " takes at most " + std::to_string(names.size()) +
                " parameters, " + std::to_string(values.size()) + " given");
    std::map<std::string, double> named;
    for (size_t i = 0; i < values.size(); i++) named[names[i]] = values[i];
    return fromNamed(family, named);
}

Distribution Distribution::fromNamed(Family family, const std::map<std::string, double> &values) {
    const auto &names = parameterNames(family);
    for (const auto &v : values) {
        if (std::find(names.begin(), names.end(), v.first) == names.end())
            throw std::invalid_argument("`" + v.first + "' is not a parameter of " + familyName(family));
    }
    std::vector<ArrayXXd> params;
    params.reserve(names.size());
    for (const auto &n : names) {
        auto found = values.find(n);
        double v = found == values.end() ? parameterDefault(family, n) : found->second;
        if (std::isnan(v))
            throw std::invalid_argument(familyName(family) + " requires a value for `" + n + "'");
        params.push_back(ArrayXXd::Constant(1, 1, v));
    }
    return Distribution(family, std::move(params));
}

const std::string& Distribution::familyName(Family family) {
    static const std::string normal("Normal"), half_normal("HalfNormal"), gamma("Gamma"), beta("Beta"), delta("Delta");
    switch (family) {
        case Family::Normal: return normal;
        case Family::HalfNormal: return half_normal;
        case Family::Gamma: return gamma;
        case Family::Beta: return beta;
        case Family::Delta: return delta;
    }
    throw std::logic_error("Distribution::familyName: invalid family");
}

Distribution::Family Distribution::parseFamily(const std::string &name) {
    std::string n;
    for (char c : name) {
        if (c != '_') n += std::tolower(static_cast<unsigned char>(c));
    }
    for (auto f : {Family::Normal, Family::HalfNormal, Family::Gamma, Family::Beta, Family::Delta}) {
        std::string fname = familyName(f);
        std::transform(fname.begin(), fname.end(), fname.begin(), [](unsigned char c) { return std::tolower(c); });
        if (fname == n) return f;
    }
    throw std::invalid_argument("Unknown distribution family `" + name + "'");
}

const std::vector<std::string>& Distribution::parameterNames(Family family) {
    static const std::vector<std::string>
        normal{"loc", "scale"},
        half_normal{"scale"},
        gamma{"concentration", "rate"},
        beta{"concentration1", "concentration0"},
        delta{"value"};
    switch (family) {
        case Family::Normal: return normal;
        case Family::HalfNormal: return half_normal;
        case Family::Gamma: return gamma;
        case Family::Beta: return beta;
        case Family::Delta: return delta;
    }
    throw std::logic_error("Distribution::parameterNames: invalid family");
}

double Distribution::parameterDefault(Family family, const std::string &name) {
    switch (family) {
        case Family::Normal:
            if (name == "loc") return 0.0;
            if (name == "scale") return 1.0;
            break;
        case Family::HalfNormal:
            if (name == "scale") return 1.0;
            break;
        case Family::Gamma:
            if (name == "rate") return 1.0;
            break;
        case Family::Beta:
        case Family::Delta:
            break;
    }
    return NaN;
}

const ArrayXXd& Distribution::parameter(const std::string &name) const {
    const auto &names = parameterNames(family_);
    for (size_t i = 0; i < names.size(); i++) {
        if (names[i] == name) return params_[i];
    }
    throw std::invalid_argument("`" + name + "' is not a parameter of " + familyName(family_));
}

void Distribution::checkBroadcast(Index rows, Index cols) const {
    const auto &names = parameterNames(family_);
    for (size_t i = 0; i < params_.size(); i++) {
        const auto &p = params_[i];
        if (not broadcastable(p.rows(), p.cols(), rows, cols))
            throw Array::ShapeError(familyName(family_) + " parameter `" + names[i] + "' of shape (" + std::to_string(p.rows()) +
                    ", " + std::to_string(p.cols()) + ") cannot be broadcast to (" + std::to_string(rows) + ", " + std::to_string(cols) + ")");
    }
}

ArrayXXd Distribution::sample(eris::Random::rng_t &rng, Index rows, Index cols) const {
    checkBroadcast(rows, cols);
    ArrayXXd draws(rows, cols);
    // Column-major loop order: the draw sequence follows the flat storage order of the result
    for (Index c = 0; c < cols; c++) for (Index r = 0; r < rows; r++) {
        double &d = draws(r, c);
        switch (family_) {
            case Family::Normal:
                d = boost::random::normal_distribution<double>(at(params_[0], r, c), at(params_[1], r, c))(rng);
                break;
            case Family::HalfNormal:
                d = std::fabs(boost::random::normal_distribution<double>(0.0, at(params_[0], r, c))(rng));
                break;
            case Family::Gamma:
                // boost wants (shape, scale); scale = 1/rate
                d = boost::random::gamma_distribution<double>(at(params_[0], r, c), 1.0 / at(params_[1], r, c))(rng);
                break;
            case Family::Beta:
                d = boost::random::beta_distribution<double>(at(params_[0], r, c), at(params_[1], r, c))(rng);
                break;
            case Family::Delta:
                d = at(params_[0], r, c);
                break;
        }
    }
    return draws;
}

ArrayXXd Distribution::logDensity(const ArrayXXd &x) const {
    checkBroadcast(x.rows(), x.cols());
    ArrayXXd ld(x.rows(), x.cols());
    for (Index c = 0; c < x.cols(); c++) for (Index r = 0; r < x.rows(); r++) {
        const double v = x(r, c);
        double &l = ld(r, c);
        switch (family_) {
            case Family::Normal:
                l = normalLogDensity(v, at(params_[0], r, c), at(params_[1], r, c));
                break;
            case Family::HalfNormal:
                l = v < 0 ? neg_inf : std::log(2.0) + normalLogDensity(v, 0.0, at(params_[0], r, c));
                break;
            case Family::Gamma:
                {
                    const double k = at(params_[0], r, c), rate = at(params_[1], r, c);
                    l = v < 0 ? neg_inf : k * std::log(rate) + xlog(k - 1, std::log(v)) - rate * v - std::lgamma(k);
                }
                break;
            case Family::Beta:
                {
                    const double a = at(params_[0], r, c), b = at(params_[1], r, c);
                    l = (v < 0 or v > 1) ? neg_inf :
                        xlog(a - 1, std::log(v)) + xlog(b - 1, std::log1p(-v)) + std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b);
                }
                break;
            case Family::Delta:
                l = v == at(params_[0], r, c) ? 0.0 : neg_inf;
                break;
        }
    }
    return ld;
}

bool Distribution::operator==(const Distribution &other) const {
    if (family_ != other.family_) return false;
    for (size_t i = 0; i < params_.size(); i++) {
        const auto &a = params_[i], &b = other.params_[i];
        if (a.rows() != b.rows() or a.cols() != b.cols() or not (a == b).all()) return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream &os, const Distribution &d) {
    const auto &names = Distribution::parameterNames(d.family_);
    os << Distribution::familyName(d.family_) << "(";
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) os << ", ";
        const auto &p = d.params_[i];
        os << names[i] << "=";
        if (p.size() == 1) os << p(0, 0);
        else os << "[" << p.rows() << "x" << p.cols() << "]";
    }
    return os << ")";
}

}
