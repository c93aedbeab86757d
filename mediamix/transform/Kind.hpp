#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace mediamix {
/// Namespace for the media transforms and their numerical primitives.
namespace transform {

/** The media transforms a model can be declared with.  The set is closed: MediaTransform::create()
 * handles every value.
 */
enum class Kind {
    Adstock,
    HillAdstock,
    Carryover,
    ExponentialAdstock,
    /// exponential_adstock with the saturation slope pinned to 1
    ExponentialAdstockStaticDim,
    /// exponential_adstock with the lag weight pinned to 1
    ExponentialAdstockStaticDecay,
    /// exponential_adstock with both the lag weight and the slope pinned to 1
    ExponentialAdstockStaticDimDecay
};

/// Exception thrown when a transform name is not one of the recognized transforms.
class UnknownTransformName : public std::invalid_argument {
    public:
        /// Constructs the exception for the given (unrecognized) name
        explicit UnknownTransformName(const std::string &name);
};

/// Returns all transform kinds, in declaration order
const std::vector<Kind>& kinds();

/// Returns the name of a transform, such as "hill_adstock"
const std::string& name(Kind kind);

/** Returns the transform kind with the given name.
 *
 * \throws UnknownTransformName if `name` is not the name of a transform
 */
Kind parse(const std::string &name);

}}
