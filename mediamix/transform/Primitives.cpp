#include "mediamix/transform/Primitives.hpp"
#include "mediamix/Array.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace mediamix { namespace transform {

using namespace Eigen;

namespace {
std::string dims(const Tensor3 &t) {
    return to_string(Shape{t.dimension(0), t.dimension(1), t.dimension(2)});
}
}

Tensor3 broadcastTo(const Tensor3 &param, Index d0, Index d1, Index d2) {
    const Index p0 = param.dimension(0), p1 = param.dimension(1), p2 = param.dimension(2);
    if ((p0 != d0 and p0 != 1) or (p1 != d1 and p1 != 1) or (p2 != d2 and p2 != 1))
        throw Array::ShapeError("Cannot broadcast parameter of shape " + dims(param) + " to " + to_string(Shape{d0, d1, d2}));
    if (p0 == d0 and p1 == d1 and p2 == d2) return param;

    Tensor3 out(d0, d1, d2);
    for (Index k = 0; k < d2; k++) for (Index j = 0; j < d1; j++) for (Index i = 0; i < d0; i++)
        out(i, j, k) = param(p0 == 1 ? 0 : i, p1 == 1 ? 0 : j, p2 == 1 ? 0 : k);
    return out;
}

Tensor3 adstock(const Tensor3 &media, const Tensor3 &lag_weight, bool normalise) {
    const Index T = media.dimension(0), C = media.dimension(1), G = media.dimension(2);
    const Tensor3 w = broadcastTo(lag_weight, T, C, G);

    Tensor3 out(T, C, G);
    for (Index g = 0; g < G; g++) for (Index c = 0; c < C; c++) {
        double prev = 0;
        for (Index t = 0; t < T; t++) {
            prev = media(t, c, g) + (t > 0 ? w(t, c, g) * prev : 0);
            out(t, c, g) = prev;
        }
        if (normalise) {
            for (Index t = 0; t < T; t++) out(t, c, g) *= 1 - w(t, c, g);
        }
    }
    return out;
}

Tensor3 carryover(const Tensor3 &media, const Tensor3 &ad_effect_retention_rate, const Tensor3 &peak_effect_delay, unsigned number_lags) {
    if (number_lags == 0) throw std::invalid_argument("carryover: number_lags must be at least 1");
    const Index T = media.dimension(0), C = media.dimension(1), G = media.dimension(2);
    const Tensor3 rate = broadcastTo(ad_effect_retention_rate, 1, C, G),
          delay = broadcastTo(peak_effect_delay, 1, C, G);

    Tensor3 out(T, C, G);
    std::vector<double> weight(number_lags);
    for (Index g = 0; g < G; g++) for (Index c = 0; c < C; c++) {
        double total = 0;
        for (unsigned l = 0; l < number_lags; l++) {
            const double d = l - delay(0, c, g);
            weight[l] = std::pow(rate(0, c, g), d * d);
            total += weight[l];
        }
        for (Index t = 0; t < T; t++) {
            double sum = 0;
            for (Index l = 0; l < number_lags and l <= t; l++) sum += weight[l] * media(t - l, c, g);
            out(t, c, g) = sum / total;
        }
    }
    return out;
}

Tensor3 applyExponentSafe(const Tensor3 &data, const Tensor3 &exponent) {
    const Index T = data.dimension(0), C = data.dimension(1), G = data.dimension(2);
    const Tensor3 e = broadcastTo(exponent, T, C, G);

    Tensor3 out(T, C, G);
    for (Index i = 0; i < data.size(); i++) {
        const double x = data.data()[i];
        out.data()[i] = x == 0 ? 0.0 : std::copysign(std::pow(std::fabs(x), e.data()[i]), x);
    }
    return out;
}

Tensor3 hill(const Tensor3 &data, const Tensor3 &half_max_effective_concentration, const Tensor3 &slope) {
    const Index T = data.dimension(0), C = data.dimension(1), G = data.dimension(2);
    const Tensor3 k = broadcastTo(half_max_effective_concentration, T, C, G), s = broadcastTo(slope, T, C, G);

    Tensor3 scaled(T, C, G), neg_slope(T, C, G);
    for (Index i = 0; i < data.size(); i++) {
        scaled.data()[i] = data.data()[i] / k.data()[i];
        neg_slope.data()[i] = -s.data()[i];
    }
    Tensor3 out = applyExponentSafe(scaled, neg_slope);
    for (Index i = 0; i < out.size(); i++) {
        double &v = out.data()[i];
        v = v == 0 ? 0.0 : 1.0 / (1.0 + v);
    }
    return out;
}

Tensor3 exponential(const Tensor3 &data, const Tensor3 &slope) {
    const Index T = data.dimension(0), C = data.dimension(1), G = data.dimension(2);
    const Tensor3 s = broadcastTo(slope, T, C, G);

    Tensor3 out(T, C, G);
    for (Index i = 0; i < data.size(); i++) out.data()[i] = 1.0 - std::exp(-s.data()[i] * data.data()[i]);
    return out;
}

}}
