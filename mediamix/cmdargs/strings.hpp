#pragma once
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace mediamix { namespace cmdargs {

/** Returns an argument name for T: ℝ for floating point values, ℕ for unsigned integer types, ℤ
 * for signed integer types, and "arg" for anything else.
 */
template <typename T>
std::string type_string() {
    return std::is_floating_point<T>::value ? u8"ℝ" :
        std::is_integral<T>::value ? std::is_unsigned<T>::value ? u8"ℕ" : u8"ℤ" :
        u8"arg";
}

/** Returns a value converted to a string via std::to_string. */
template <typename T, typename = typename std::enable_if<std::is_arithmetic<T>::value>::type>
std::string output_string(T v) {
    return std::to_string(v);
}

/** Specialization of output_string for doubles that trims trailing 0's and a trailing decimal
 * point.
 */
template <> std::string output_string(double v);

/** Joins strings with the given separator, for listing the accepted values of an option. */
std::string join(const std::vector<std::string> &values, const std::string &separator = ", ");

/** Splits a `NAME=VALUE` argument at the first `=`.
 *
 * \throws std::invalid_argument if there is no `=` or the name is empty
 */
std::pair<std::string, std::string> splitAssignment(const std::string &arg);

}}
