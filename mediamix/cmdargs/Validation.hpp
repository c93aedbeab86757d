#pragma once
#include "mediamix/cmdargs/strings.hpp"
#include <boost/any.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace mediamix { namespace cmdargs {

/** Validation tag; any Validation class must (ultimately) inherit from this class.  This class does
 * nothing.
 */
class ValidationTag {};

/** Validation wrapper base class.  This base class does no value validation except one: if `T` is
 * an unsigned type, the given value must not be negative (boost would otherwise cast -1 to
 * 4294967295 for an unsigned int).
 *
 * This should be inherited from virtually so that subclasses can inherit from multiple Validation
 * subclasses to enforce multiple validations at once.
 */
template <typename T>
class Validation : public ValidationTag {
    public:
        /// Constructs with an initial value
        Validation(T v) : val_(v) {}
        /// Implicit conversion to the stored value
        operator const T& () const { return val_; }
        /// The type T that this object validates
        using value_type = T;
        /// Returns a string representation of this validation object
        static std::string validationString() {
            if (std::is_unsigned<T>::value) { return type_string<T>() + u8"⩾0"; }
            return type_string<T>();
        }
        /// Virtual destructor
        virtual ~Validation() = default;

    protected:
        /// The stored value
        T val_;
};

/** Validation wrapper for options that have a minimum value, given as a fraction of longs
 * (non-type template parameters cannot be doubles).
 *
 * \param T any numeric type.
 * \param min the minimum accepted value, or its numerator if fractional
 * \param denom the denominator of the minimum value; defaults to 1.
 */
template <typename T, long min, long denom = 1>
class Min : public virtual Validation<T> {
    public:
        /// Constructor.  Throws if `v < min`.
        Min(T v) : Validation<T>(v) {
            if (*this < min / (double) denom)
                throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value);
        }

        /// Returns string representation of this validation
        static std::string validationString() { return type_string<T>() + u8"⩾" + (denom == 1 ? output_string(min) : output_string(min / (double) denom)); }
};

/** Validation wrapper for options that must be strictly above a bound, such as the scale of a
 * prior: \f$v > 0\f$.
 *
 * \param T any numeric type
 * \param lower the lower bound that the value must be above (or its numerator)
 * \param denom the denominator under `lower`.  Defaults to 1.
 */
template <typename T, long lower, long denom = 1>
class Above : public virtual Validation<T> {
    public:
        /// Constructor.  Throws if `v <= lower`.
        Above(T v) : Validation<T>(v) {
            if (*this <= lower / (double) denom)
                throw boost::program_options::validation_error(boost::program_options::validation_error::invalid_option_value);
        }

        /// Returns string representation of this validation
        static std::string validationString() { return type_string<T>() + u8">" + (denom == 1 ? output_string(lower) : output_string(lower / (double) denom)); }
};

/** Parses a Validation-wrapped option value: converts the given string to the wrapped value type,
 * then constructs the wrapper (which throws if the value is not acceptable).  Found by
 * boost::program_options through argument-dependent lookup.
 */
template <typename V, typename = typename std::enable_if<std::is_base_of<ValidationTag, V>::value>::type>
void validate(boost::any &v, const std::vector<std::string> &values, V*, int) {
    namespace po = boost::program_options;
    po::validators::check_first_occurrence(v);
    const std::string &s = po::validators::get_single_string(values);
    typename V::value_type parsed;
    try {
        parsed = boost::lexical_cast<typename V::value_type>(s);
    }
    catch (const boost::bad_lexical_cast &) {
        throw po::validation_error(po::validation_error::invalid_option_value);
    }
    if (std::is_unsigned<typename V::value_type>::value and s.find('-') != std::string::npos)
        throw po::validation_error(po::validation_error::invalid_option_value);
    v = boost::any(V(parsed));
}

}}
