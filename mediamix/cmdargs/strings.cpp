#include "mediamix/cmdargs/strings.hpp"
#include <regex>
#include <stdexcept>
#include <utility>

namespace mediamix { namespace cmdargs {

template <>
std::string output_string(double v) {
    return std::regex_replace(
            std::regex_replace(std::to_string(v),
                std::regex("(\\.\\d*?)0+$"),
                "$1"),
            std::regex("\\.$"),
            "");
}

std::string join(const std::vector<std::string> &values, const std::string &separator) {
    std::string result;
    for (const auto &v : values) {
        if (not result.empty()) result += separator;
        result += v;
    }
    return result;
}

std::pair<std::string, std::string> splitAssignment(const std::string &arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos or eq == 0)
        throw std::invalid_argument("expected NAME=VALUE, got `" + arg + "'");
    return std::make_pair(arg.substr(0, eq), arg.substr(eq + 1));
}

}}
