#include "mediamix/ShapeBroadcaster.hpp"

namespace mediamix {

using namespace Eigen;

UnsupportedMediaRank::UnsupportedMediaRank(size_t rank)
    : std::invalid_argument("Media data must be rank 2 (time, channel) or rank 3 (time, channel, geo); got rank " + std::to_string(rank))
{}

ShapeBroadcaster::ShapeBroadcaster(const Array &media) {
    if (media.rank() != 2 and media.rank() != 3) throw UnsupportedMediaRank(media.rank());
    geo_ = media.rank() == 3;
    data_size_ = media.dim(0);
    channels_ = media.dim(1);
    geos_ = geo_ ? media.dim(2) : 1;
}

Shape ShapeBroadcaster::geoShape() const {
    return geo_ ? Shape{geos_} : Shape();
}

Shape ShapeBroadcaster::mediaShape() const {
    Shape s{data_size_, channels_};
    if (geo_) s.push_back(geos_);
    return s;
}

Shape ShapeBroadcaster::predictionShape() const {
    Shape s{data_size_};
    if (geo_) s.push_back(geos_);
    return s;
}

PlateStack ShapeBroadcaster::geoPlate(const std::string &name) const {
    return {{name + "_plate", geos_, -1}};
}

PlateStack ShapeBroadcaster::channelPlate(const std::string &name) const {
    return {{name + "_plate", channels_, -1}};
}

PlateStack ShapeBroadcaster::mediaPlates(bool nested) const {
    PlateStack plates{{"channel_media_plate", channels_, geo_ ? -2 : -1}};
    if (geo_ and nested) plates.push_back({"geo_media_plate", geos_, -1});
    return plates;
}

PlateStack ShapeBroadcaster::extraFeaturePlates(const Array &extra_features) const {
    if (extra_features.rank() == 3)
        return {{"extra_feature_plate", extra_features.dim(1), -2}, {"geo_plate", geos_, -1}};
    return {{"extra_feature_plate", extra_features.dim(1), -1}};
}

Tensor<double, 3> ShapeBroadcaster::storage(const Array &data) const {
    return data.tensor();
}

Array ShapeBroadcaster::media(const Tensor<double, 3> &storage) const {
    return Array(mediaShape(), Map<const ArrayXd>(storage.data(), storage.size()));
}

Array ShapeBroadcaster::prediction(const ArrayXXd &storage) const {
    return Array(predictionShape(), Map<const ArrayXd>(storage.data(), storage.size()));
}

Tensor<double, 3> ShapeBroadcaster::expandForGeo(const ArrayXd &per_channel) const {
    if (per_channel.size() != channels_)
        throw Array::ShapeError("expandForGeo: expected " + std::to_string(channels_) + " per-channel values, got " + std::to_string(per_channel.size()));
    Tensor<double, 3> t(1, channels_, 1);
    for (Index c = 0; c < channels_; c++) t(0, c, 0) = per_channel[c];
    return t;
}

ArrayXXd ShapeBroadcaster::contract(const Tensor<double, 3> &x, const ArrayXXd &coef) const {
    const Index T = x.dimension(0), K = x.dimension(1), Gx = x.dimension(2);
    if (coef.rows() != K)
        throw Array::ShapeError("contract: data has " + std::to_string(K) + " columns but there are " + std::to_string(coef.rows()) + " coefficients");
    if (not broadcastable(1, Gx, 1, geos_) or not broadcastable(1, coef.cols(), 1, geos_))
        throw Array::ShapeError("contract: geo extents " + std::to_string(Gx) + " (data) and " + std::to_string(coef.cols()) +
                " (coefficients) do not broadcast to " + std::to_string(geos_) + " geos");

    ArrayXXd out(T, geos_);
    for (Index g = 0; g < geos_; g++) {
        Map<const MatrixXd> slice(x.data() + (Gx == 1 ? 0 : g) * T * K, T, K);
        out.col(g) = (slice * coef.col(coef.cols() == 1 ? 0 : g).matrix()).array();
    }
    return out;
}

}
