#include "mediamix/Prior.hpp"
#include <regex>
#include <sstream>

namespace mediamix {

PriorError::PriorError(const std::string &what) : std::invalid_argument(what) {}

Prior::Prior(Distribution d) : type_{Type::Distribution}, dist_{std::make_shared<Distribution>(std::move(d))} {}

Prior::Prior(double v) : type_{Type::Scalar}, values_{v} {}

Prior::Prior(std::vector<double> values) : type_{Type::Sequence}, values_(std::move(values)) {}

Prior::Prior(std::map<std::string, double> values) : type_{Type::Mapping}, named_(std::move(values)) {}

const Distribution& Prior::distribution() const {
    if (type_ != Type::Distribution) throw std::logic_error("Prior::distribution() called on a literal prior");
    return *dist_;
}

double Prior::scalar() const {
    if (type_ != Type::Scalar) throw std::logic_error("Prior::scalar() called on a non-scalar prior");
    return values_.front();
}

Distribution Prior::toDistribution(const Distribution &family_default) const {
    if (type_ == Type::Distribution) return *dist_;

    auto family = family_default.family();
    try {
        if (type_ == Type::Mapping) return Distribution::fromNamed(family, named_);
        return Distribution::fromPositional(family, values_);
    }
    catch (const std::invalid_argument &e) {
        std::ostringstream msg;
        msg << "Invalid custom prior " << *this << " for a " << Distribution::familyName(family) << " parameter: " << e.what();
        throw PriorError(msg.str());
    }
}

namespace {

const std::string re_double("\\s*[-+]?(?:[0-9]+\\.?[0-9]*|\\.[0-9]+)(?:[eE][-+]?[0-9]+)?\\s*");

double parseDouble(const std::string &value) {
    try {
        return std::stod(value);
    }
    catch (const std::out_of_range &) {
        throw PriorError("Prior value `" + value + "' is out of range");
    }
}

std::vector<double> parseList(const std::string &list, char sep) {
    std::vector<double> values;
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, sep)) values.push_back(parseDouble(item));
    return values;
}

}

Prior Prior::parse(const std::string &spec) {
    static const std::regex
        re_scalar("^" + re_double + "$"),
        re_sequence("^" + re_double + "(?:," + re_double + ")+$"),
        re_family("^\\s*([A-Za-z_]+)\\s*\\(((?:" + re_double + "(?:," + re_double + ")*)?)\\)\\s*$"),
        re_mapping("^\\s*[A-Za-z_][A-Za-z0-9_]*\\s*=" + re_double + "(?:;\\s*[A-Za-z_][A-Za-z0-9_]*\\s*=" + re_double + ")*$"),
        re_pair("\\s*([A-Za-z_][A-Za-z0-9_]*)\\s*=(" + re_double + ")");

    std::smatch m;
    if (std::regex_match(spec, re_scalar)) return Prior(parseDouble(spec));
    if (std::regex_match(spec, re_sequence)) return Prior(parseList(spec, ','));
    if (std::regex_match(spec, m, re_family)) {
        try {
            auto family = Distribution::parseFamily(m[1].str());
            return Prior(Distribution::fromPositional(family, m[2].length() > 0 ? parseList(m[2].str(), ',') : std::vector<double>()));
        }
        catch (const std::invalid_argument &e) {
            throw PriorError("Invalid prior `" + spec + "': " + e.what());
        }
    }
    if (std::regex_match(spec, re_mapping)) {
        std::map<std::string, double> named;
        std::istringstream iss(spec);
        std::string item;
        while (std::getline(iss, item, ';')) {
            std::smatch pm;
            if (not std::regex_match(item, pm, re_pair)) throw PriorError("Invalid prior `" + spec + "'");
            named[pm[1].str()] = parseDouble(pm[2].str());
        }
        return Prior(std::move(named));
    }
    throw PriorError("Unable to parse prior `" + spec + "'");
}

std::ostream& operator<<(std::ostream &os, const Prior &p) {
    switch (p.type_) {
        case Prior::Type::Distribution:
            return os << *p.dist_;
        case Prior::Type::Scalar:
            return os << p.values_.front();
        case Prior::Type::Sequence:
            os << "[";
            for (size_t i = 0; i < p.values_.size(); i++) os << (i > 0 ? ", " : "") << p.values_[i];
            return os << "]";
        case Prior::Type::Mapping:
            {
                os << "{";
                bool first = true;
                for (const auto &v : p.named_) {
                    os << (first ? "" : ", ") << v.first << ": " << v.second;
                    first = false;
                }
                return os << "}";
            }
    }
    return os;
}

}
