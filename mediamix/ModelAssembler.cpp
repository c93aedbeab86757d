#include "mediamix/ModelAssembler.hpp"
#include "mediamix/PriorCatalog.hpp"
#include "mediamix/PriorResolver.hpp"
#include <eris/debug.hpp>

namespace mediamix {

using namespace Eigen;

ModelAssembler::ModelAssembler(Array media, Array target, Array media_prior, Array media_sigma,
        ModelSettings settings, boost::optional<Array> extra_features)
    : media_(std::move(media)), target_(std::move(target)), media_prior_(std::move(media_prior)), media_sigma_(std::move(media_sigma)),
    settings_(std::move(settings)), extra_features_(std::move(extra_features))
{}

void ModelAssembler::operator()(Handler &handler) const {
    // Resolve the transform first: an unknown name must fail before anything is declared
    auto media_transform = transform::MediaTransform::create(settings_.transform);
    ShapeBroadcaster shapes(media_);
    const PriorSpec &custom = settings_.custom_priors;
    const PriorTable defaults = PriorCatalog::defaultModelPriors();

    ERIS_DBG("declaring " << (shapes.geoMode() ? "geo" : "national") << " model: " << shapes.dataSize() << " periods, " <<
            shapes.channels() << " channels, " << shapes.geos() << " geos, transform " << settings_.transform);

    // Each of these is geos x 1
    ArrayXXd intercept = handler.sample(param::INTERCEPT, PriorResolver::resolve(param::INTERCEPT, custom, defaults), shapes.geoPlate(param::INTERCEPT));
    ArrayXXd sigma = handler.sample(param::SIGMA, PriorResolver::resolve(param::SIGMA, custom, defaults), shapes.geoPlate(param::SIGMA));

    const Distribution coef_prior = Distribution::normal(media_prior_.matrix(), media_sigma_.matrix());
    ArrayXXd coef_media; // channels x geos
    if (shapes.geoMode()) {
        handler.sample("channel_coef_media", coef_prior, shapes.mediaPlates(false));
        coef_media = handler.sample("coef_media", coef_prior, shapes.mediaPlates(true));
    }
    else {
        coef_media = handler.sample("coef_media", coef_prior, shapes.mediaPlates(false));
    }

    const Tensor<double, 3> media_transformed = media_transform->transform(
            handler, shapes, shapes.storage(media_), custom, settings_.transform_options);
    handler.deterministic("media_transformed", shapes.media(media_transformed));

    // time x geos
    ArrayXXd prediction = shapes.contract(media_transformed, coef_media);
    prediction.rowwise() += intercept.col(0).transpose();

    if (settings_.trend) {
        ArrayXXd coef_trend = handler.sample(param::COEF_TREND, PriorResolver::resolve(param::COEF_TREND, custom, defaults),
                shapes.geoPlate(param::COEF_TREND));
        const VectorXd t = VectorXd::LinSpaced(shapes.dataSize(), 0, shapes.dataSize() - 1);
        prediction += (t * coef_trend.col(0).matrix().transpose()).array();
    }

    if (extra_features_) {
        const Array &extra = *extra_features_;
        if (extra.rank() != 2 and extra.rank() != 3)
            throw Array::ShapeError("Extra features must be rank 2 (time, feature) or rank 3 (time, feature, geo); got shape " + to_string(extra.shape()));
        ArrayXXd coef_extra = handler.sample(param::COEF_EXTRA_FEATURES,
                PriorResolver::resolve(param::COEF_EXTRA_FEATURES, custom, defaults), shapes.extraFeaturePlates(extra));
        ArrayXXd effect = shapes.contract(shapes.storage(extra), coef_extra);
        if (effect.rows() != prediction.rows())
            throw Array::ShapeError("Extra features have " + std::to_string(effect.rows()) + " periods but the media has " + std::to_string(prediction.rows()));
        prediction += effect;
    }

    handler.deterministic("mu", shapes.prediction(prediction));

    ArrayXXd sigma_row = sigma.col(0).transpose();
    handler.observe("target", Distribution::normal(prediction, sigma_row), target_);
}

void mediaMixModel(Handler &handler, const Array &media, const Array &target, const Array &media_prior, const Array &media_sigma,
        const std::string &transform_name, const PriorSpec &custom_priors, const transform::Options &transform_options,
        const Array *extra_features) {
    ModelSettings settings;
    settings.transform = transform_name;
    settings.custom_priors = custom_priors;
    settings.transform_options = transform_options;
    boost::optional<Array> extra;
    if (extra_features) extra = *extra_features;
    const ModelAssembler model(media, target, media_prior, media_sigma, std::move(settings), std::move(extra));
    model(handler);
}

}
