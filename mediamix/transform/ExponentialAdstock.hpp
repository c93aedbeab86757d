#pragma once
#include "mediamix/transform/MediaTransform.hpp"

namespace mediamix { namespace transform {

/** Geometric adstock followed by exponential saturation:
 * `exponential(adstock(media, lag_weight), slope)`.  This class implements the four members of the
 * exponential family, which differ only in which of `lag_weight` and `slope` are sampled per
 * channel and which are pinned to 1:
 *
 * | kind                                 | lag_weight | slope   |
 * |--------------------------------------|------------|---------|
 * | exponential_adstock                  | sampled    | sampled |
 * | exponential_adstock_static_dim       | sampled    | 1       |
 * | exponential_adstock_static_decay     | 1          | sampled |
 * | exponential_adstock_static_dim_decay | 1          | 1       |
 *
 * The adstock is not normalised by default.
 */
class ExponentialAdstock : public MediaTransform {
    public:
        /** Constructs the transform of the given kind.
         *
         * \throws std::invalid_argument if `kind` is not one of the exponential kinds
         */
        explicit ExponentialAdstock(Kind kind);

    protected:
        virtual Tensor3 apply(const Tensor3 &media, const Parameters &params, const Options &options) const override;

    private:
        // The sampled and pinned parameters of the given exponential kind
        static std::vector<Slot> slots(Kind kind);
};

}}
