#pragma once
#include "mediamix/Array.hpp"
#include "mediamix/Handler.hpp"
#include "mediamix/Prior.hpp"
#include "mediamix/ShapeBroadcaster.hpp"
#include "mediamix/transform/MediaTransform.hpp"
#include <boost/optional.hpp>
#include <string>

namespace mediamix {

/// Model choices that are not data: the transform, custom priors and optional model terms.
struct ModelSettings {
    /// The name of the media transform, such as "hill_adstock" (the default)
    std::string transform = "hill_adstock";
    /// Custom priors; names the model does not use are ignored
    PriorSpec custom_priors;
    /// Options passed to the media transform
    transform::Options transform_options;
    /// If true, adds a linear time trend `coef_trend[g] * t` to the prediction
    bool trend = false;
};

/** Declares the media mix model for a fixed set of inputs.  The model is:
 *
 * \f[ target_{tg} \sim N(\mu_{tg}, \sigma_g), \qquad
 *     \mu_{tg} = \alpha_g + \sum_c m_{tcg} \beta_{cg} + \tau_g t + \sum_f x_{tfg} \gamma_{fg} \f]
 *
 * where \f$m\f$ is the transformed media, \f$\beta\f$ the media coefficients with prior
 * \f$N(\textrm{media\_prior}_c, \textrm{media\_sigma}_c)\f$, \f$\tau\f$ the (optional) trend
 * coefficient and \f$x\f$ the (optional) extra features.  For national (rank 2) media the geo
 * index is dropped.
 *
 * The sites are declared in this order: `intercept`, `sigma`, (`channel_coef_media` in geo mode),
 * `coef_media`, the transform parameters, `media_transformed`, (`coef_trend`),
 * (`coef_extra_features`), `mu`, `target`.
 *
 * The assembler holds its inputs and never changes after construction: invoking it again with a
 * fresh handler declares an identical model structure.
 */
class ModelAssembler {
    public:
        /// Not default constructible
        ModelAssembler() = delete;

        /** Constructs the model for the given inputs.  Nothing is validated until the model is
         * declared.
         *
         * \param media rank 2 (time, channel) or rank 3 (time, channel, geo) media data
         * \param target rank 1 (time) or rank 2 (time, geo) target data
         * \param media_prior the per-channel location of the media coefficient prior
         * \param media_sigma the per-channel (or single) scale of the media coefficient prior
         * \param settings the transform, custom priors and optional terms
         * \param extra_features rank 2 (time, feature) or rank 3 (time, feature, geo) extra
         * regressors, if any
         */
        ModelAssembler(Array media, Array target, Array media_prior, Array media_sigma,
                ModelSettings settings = ModelSettings(), boost::optional<Array> extra_features = boost::none);

        /** Declares the model into `handler`.
         *
         * \throws transform::UnknownTransformName if the transform name is not recognized.  This
         * is checked before anything is declared.
         * \throws UnsupportedMediaRank if the media is not rank 2 or 3
         * \throws PriorError if a custom prior cannot be used for its parameter
         * \throws Array::ShapeError if the shapes of the inputs do not conform
         */
        void operator()(Handler &handler) const;

        /// The media data
        const Array& media() const { return media_; }
        /// The target data
        const Array& target() const { return target_; }
        /// The extra features, if any
        const boost::optional<Array>& extraFeatures() const { return extra_features_; }
        /// The model settings
        const ModelSettings& settings() const { return settings_; }

    private:
        Array media_, target_, media_prior_, media_sigma_;
        ModelSettings settings_;
        boost::optional<Array> extra_features_;
};

/** Declares the media mix model into `handler`.  This is a shortcut for constructing a
 * ModelAssembler (without a trend term) and invoking it once.
 *
 * \param handler the handler receiving the declared sites
 * \param media rank 2 (time, channel) or rank 3 (time, channel, geo) media data
 * \param target rank 1 (time) or rank 2 (time, geo) target data
 * \param media_prior the per-channel location of the media coefficient prior
 * \param media_sigma the per-channel scale of the media coefficient prior
 * \param transform_name the media transform, such as "adstock"
 * \param custom_priors custom priors; names the model does not use are ignored
 * \param transform_options options passed to the media transform
 * \param extra_features extra regressors, or nullptr for none
 */
void mediaMixModel(Handler &handler, const Array &media, const Array &target, const Array &media_prior, const Array &media_sigma,
        const std::string &transform_name, const PriorSpec &custom_priors = PriorSpec(),
        const transform::Options &transform_options = transform::Options(), const Array *extra_features = nullptr);

}
