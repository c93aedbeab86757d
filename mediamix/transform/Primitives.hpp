#pragma once
#include <unsupported/Eigen/CXX11/Tensor>

namespace mediamix { namespace transform {

/** \file
 * Numerical primitives the media transforms are composed from.  Every primitive takes time-indexed
 * data as a (time, channel, geo) tensor and returns a tensor of the same shape.  Parameter tensors
 * broadcast against the data: each of their extents must either equal the data's or be 1.  The
 * per-channel parameters the transforms pass have shape (1, channel, 1).
 *
 * All primitives throw Array::ShapeError if a parameter does not broadcast to the data.
 */

/// Shorthand for the tensor type of the primitives
using Tensor3 = Eigen::Tensor<double, 3>;

/** Geometric adstock along the time axis:
 *
 * \f[ out_0 = x_0, \qquad out_t = x_t + w \cdot out_{t-1} \f]
 *
 * When `normalise` is true the result is multiplied by \f$1 - w\f$, so that a constant input
 * converges to itself.
 */
Tensor3 adstock(const Tensor3 &media, const Tensor3 &lag_weight, bool normalise);

/** Carryover with a delayed peak along the time axis.  The lag weights are
 * \f$w_l = r^{(l - \delta)^2}\f$ for \f$l = 0, \ldots, L-1\f$, where \f$r\f$ is the retention
 * rate, \f$\delta\f$ the peak effect delay and \f$L\f$ the number of lags, and:
 *
 * \f[ out_t = \frac{\sum_{l=0}^{\min(L-1, t)} w_l x_{t-l}}{\sum_{l=0}^{L-1} w_l} \f]
 *
 * `ad_effect_retention_rate` and `peak_effect_delay` must have a time extent of 1.
 *
 * \throws std::invalid_argument if `number_lags` is 0
 */
Tensor3 carryover(const Tensor3 &media, const Tensor3 &ad_effect_retention_rate, const Tensor3 &peak_effect_delay, unsigned number_lags);

/** Hill saturation: \f$1 / (1 + (x / K)^{-s})\f$ with half-max concentration \f$K\f$ and slope
 * \f$s\f$; 0 where \f$x = 0\f$.
 */
Tensor3 hill(const Tensor3 &data, const Tensor3 &half_max_effective_concentration, const Tensor3 &slope);

/// Exponential saturation: \f$1 - e^{-s x}\f$.
Tensor3 exponential(const Tensor3 &data, const Tensor3 &slope);

/** Sign-preserving power: \f$\mathrm{sign}(x) |x|^e\f$, and 0 (for any exponent, including
 * negative ones) where \f$x = 0\f$.
 */
Tensor3 applyExponentSafe(const Tensor3 &data, const Tensor3 &exponent);

/** Broadcasts `param` to the given extents.
 *
 * \throws Array::ShapeError if an extent of `param` is neither 1 nor the target extent
 */
Tensor3 broadcastTo(const Tensor3 &param, Eigen::Index d0, Eigen::Index d1, Eigen::Index d2);

}}
