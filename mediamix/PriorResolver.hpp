#pragma once
#include "mediamix/PriorCatalog.hpp"
#include "mediamix/Prior.hpp"
#include <string>

namespace mediamix {

/** Chooses the prior of a parameter: the caller's custom prior if one was given, otherwise the
 * catalog default.  Stateless.
 */
class PriorResolver {
    public:
        /// Not constructible: all methods are static
        PriorResolver() = delete;

        /** Returns `custom[name]` if present, otherwise `defaults[name]`.  A custom literal is
         * converted to a distribution of the default's family.  A custom Distribution is returned
         * as is even when there is no default for `name`.
         *
         * \throws PriorError if a custom literal cannot be converted
         * \throws std::logic_error if `name` is in neither table (a missing default is a programming
         * error, not an input error)
         */
        static Distribution resolve(const std::string &name, const PriorSpec &custom, const PriorTable &defaults);

        /** Returns the constant value for a parameter that is pinned rather than sampled: the value
         * of a scalar custom prior or of a Delta custom prior if present, `fallback` otherwise.
         *
         * \throws PriorError if the custom prior for `name` is any other kind of prior
         */
        static double resolveConstant(const std::string &name, const PriorSpec &custom, double fallback);
};

}
