#pragma once
#include "mediamix/Array.hpp"
#include "mediamix/Handler.hpp"
#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>
#include <stdexcept>

namespace mediamix {

/// Exception thrown when media data is neither rank 2 (national) nor rank 3 (geo).
class UnsupportedMediaRank : public std::invalid_argument {
    public:
        /// Constructs the exception for media of the given rank
        explicit UnsupportedMediaRank(size_t rank);
};

/** Derives every shape used by a model declaration from the rank and extents of the media data,
 * and converts between the logical shapes of declared values and their internal representation.
 *
 * Internally, time-indexed data is always held as a (time, axis, geo) tensor, with a geo extent of 1
 * for national (rank 2) data, and per-channel parameters as a (1, channel, 1) tensor that
 * broadcasts against it.  This class is the only place where the national/geo distinction is
 * made: everything downstream works on the internal representation and asks this class for the
 * shapes and plates to declare.
 */
class ShapeBroadcaster {
    public:
        /// Not default constructible
        ShapeBroadcaster() = delete;

        /** Constructs the broadcaster for the given media data.
         *
         * \throws UnsupportedMediaRank if `media` is not rank 2 or 3
         */
        explicit ShapeBroadcaster(const Array &media);

        /// True for geo (rank 3) media
        bool geoMode() const { return geo_; }

        /// The number of timesteps
        Eigen::Index dataSize() const { return data_size_; }

        /// The number of media channels
        Eigen::Index channels() const { return channels_; }

        /// The number of geos: the extent of the third media axis, or 1 for national media
        Eigen::Index geos() const { return geos_; }

        /// The geo part of value shapes: `(geos,)` in geo mode, `()` otherwise
        Shape geoShape() const;

        /// Returns the logical shape of the media (and transformed media)
        Shape mediaShape() const;

        /// Returns the logical shape of a prediction: (time, geo) in geo mode, (time) otherwise
        Shape predictionShape() const;

        /// The plate of a parameter sampled once per geo (one value for national models)
        PlateStack geoPlate(const std::string &name) const;

        /// The plate of a transform parameter sampled once per channel: `<name>_plate`
        PlateStack channelPlate(const std::string &name) const;

        /** The plates of the media coefficient: the channel plate, and in geo mode the nested
         * per-geo plate (when `nested` is true).
         */
        PlateStack mediaPlates(bool nested) const;

        /** The plates of the extra feature coefficients for the given extra feature data: the
         * feature plate, plus a geo plate when the features are rank 3.
         */
        PlateStack extraFeaturePlates(const Array &extra_features) const;

        /** Converts time-indexed data (media or extra features) to its internal (time, axis, geo)
         * tensor.
         *
         * \throws Array::ShapeError if `data` has rank greater than 3
         */
        Eigen::Tensor<double, 3> storage(const Array &data) const;

        /** Converts an internal (time, channel, geo) tensor to an Array with the logical rank of
         * the media.
         */
        Array media(const Eigen::Tensor<double, 3> &storage) const;

        /** Converts an internal (time, geo) prediction to an Array with the logical shape of a
         * prediction.
         */
        Array prediction(const Eigen::ArrayXXd &storage) const;

        /** Lays out a per-channel parameter vector as a (1, channel, 1) tensor, which broadcasts
         * across time and across the geo axis of the internal media tensor.  This is the trailing
         * unit axis every per-channel value receives in geo mode; national media has a unit geo
         * axis internally, so the same layout serves both.
         *
         * \throws Array::ShapeError if `per_channel` does not have one value per channel
         */
        Eigen::Tensor<double, 3> expandForGeo(const Eigen::ArrayXd &per_channel) const;

        /** Contracts a (time, k, geo) tensor against a (k, geo) coefficient array over the middle
         * axis, returning a (time, geo) array: \f$out_{tg} = \sum_k x_{tkg} c_{kg}\f$.  Either
         * operand may have a geo extent of 1, in which case it is broadcast across geos.
         *
         * \throws Array::ShapeError if the `k` extents differ or a geo extent is neither 1 nor
         * geos()
         */
        Eigen::ArrayXXd contract(const Eigen::Tensor<double, 3> &x, const Eigen::ArrayXXd &coef) const;

    private:
        bool geo_;
        Eigen::Index data_size_, channels_, geos_;
};

}
