#pragma once
#include "mediamix/cmdargs/Validation.hpp"
#include "mediamix/cmdargs/strings.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace boost { namespace program_options { class variables_map; } }

namespace mediamix {
/// Namespace for command-line argument handling classes.
namespace cmdargs {

/** Base class of the command line front ends.  A subclass exposes the parsed settings as public
 * members, registers its options in addOptions() with value() or min(), which store directly into
 * those members, and checks or converts the stored values in postParse().
 */
class CmdArgs {

    protected:
        /// Default constructor is protected; use a suitable subclass.
        CmdArgs() = default;

    public:
        /// Virtual destructor
        virtual ~CmdArgs() = default;

        /** Parses and checks the arguments, storing the values into the subclass members.
         *
         * --help and --version print to stdout and exit the program with status 0.
         *
         * \throws boost::program_options::error (or a subclass) for unknown options, values that
         * fail validation, or missing required values
         *
         * \param argc the argc as received by main
         * \param argv the argv as received by main
         */
        void parse(int argc, char const* const* argv);

        /** Creates an option value object without any special validation wrapper class.  This
         * function participates only when `T` is not an unsigned type.
         *
         * \param store the default value and the location to store a specified value.
         */
        template <typename T>
        static typename std::enable_if<not std::is_unsigned<T>::value and not std::is_same<T, bool>::value,
                                       boost::program_options::typed_value<T>*
                                      >::type
        value(T& store) {
            return boost::program_options::value<T>(&store)->default_value(store)->value_name(type_string<T>());
        }

        /** Creates an option value object around an unsigned primitive type, which rejects negative
         * values but does not otherwise restrict the value.
         */
        template <typename T>
        static typename std::enable_if<std::is_unsigned<T>::value and not std::is_same<T, bool>::value,
                        boost::program_options::typed_value<Validation<T>>*>::type
        value(T &storage) {
            return value<Validation<T>>(storage);
        }

        /** Creates an option value for a switch without an argument, with default value as given
         * in `store`.
         */
        static boost::program_options::typed_value<bool>* value(bool& store) {
            return boost::program_options::bool_switch(&store)->default_value(store);
        }

        /** Creates an option value object with explicit validation wrapper class V.  `store` is
         * used for both the default and the location to store a command-line provided value.
         *
         * \tparam V a class that throws during construction if the given value isn't valid, and
         * exposes a value type in `value_type` matching `store`.
         */
        template <typename V>
        static boost::program_options::typed_value<V>*
        value(typename V::value_type &store) {
            return boost::program_options::value<V>()->default_value(store)->value_name(V::validationString())
                ->notifier([&store](const V &v) { store = v; /* NB: implicit conversion */ });
        }

        /** Creates an option value object around a vector of options with validation wrapper class
         * V applied to each element of the vector.  A given value replaces the whole of `store`.
         */
        template <typename V, typename A>
        static boost::program_options::typed_value<std::vector<V>>*
        value(std::vector<typename V::value_type, A> &store) {
            return boost::program_options::value<std::vector<V>>()->multitoken()->value_name(
                    V::validationString() + " [" + V::validationString() + " ...]")
                ->notifier([&store](const std::vector<V> &v) {
                        store.clear();
                        store.reserve(v.size());
                        for (const auto &val : v) store.push_back((const typename V::value_type) val);
                    });
        }

        /** Takes a std::vector of values for options that store multiple values. This function
         * participates only when the vector stores non-unsigned types. */
        template <typename T, typename A>
        static typename std::enable_if<not std::is_unsigned<T>::value, boost::program_options::typed_value<std::vector<T, A>>*>::type
        value(std::vector<T, A> &store) {
            return boost::program_options::value<std::vector<T, A>>(&store)->multitoken()->value_name(
                    type_string<T>() + " [" + type_string<T>() + " ...]");
        }

        /// Shortcut for `value<Min<T, n, d>>(val)` with `T` last (so that it can be inferred from `val`)
        template <long minimum, long denom = 1, typename T>
        static boost::program_options::typed_value<Min<T, minimum, denom>>* min(T &store) { return value<Min<T, minimum, denom>>(store); }


        /// Returns a version string: the program version followed by versionSuffix().
        virtual std::string version() const;

        /// Returns a string to append to the version; empty by default.
        virtual std::string versionSuffix() const;

        /** Returns a usage string such as "Usage: program [ARGS]".  Called by help().  Subclasses
         * should override to change the string as needed.
         */
        virtual std::string usage() const;

        /// Returns a argument help message.
        virtual std::string help() const;

    protected:
        /** Adds options.  This method is called automatically by parse() before parsing arguments
         * if nothing has been set in the options_ object; the default implementation adds --help
         * and --version options.  Subclasses should override and enhance to also populate
         * `options_` appropriately.
         */
        virtual void addOptions();

        /** The program name, populated by parse(). */
        std::string prog_name_;

        /// The options descriptions variable for all options.
        boost::program_options::options_description options_;

        /** Called once all values are stored (after --help and --version are handled).  The
         * default does nothing.
         *
         * \param vars the parsed variables
         */
        virtual void postParse(boost::program_options::variables_map &vars);
};

}}
