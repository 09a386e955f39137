#ifndef OSTIAMESH_CURVE_SAMPLING_HPP
#define OSTIAMESH_CURVE_SAMPLING_HPP

#include <math/vec3.hpp>
#include <common/errors.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace ostiamesh {

// A point found along a sequence of Hermite segments
struct CurvePoint {
    Vec3 position;
    Vec3 derivative;
    std::size_t element = 0;  // Index of the segment starting at nx[element]
    double xi = 0.0;
};

// Result of resampling Hermite segments. Entry n of elements/xis gives the
// source segment and local xi each output point came from; scale_factors
// converts derivatives from source to output xi spacing.
struct CurveSamples {
    std::vector<Vec3> positions;
    std::vector<Vec3> derivatives;
    std::vector<std::size_t> elements;
    std::vector<double> xis;
    std::vector<double> scale_factors;

    std::size_t size() const { return positions.size(); }
};

// Locate the point at arc_distance along the segments through nx with
// derivatives nd. Clamped to the first or last point outside the curve.
CurvePoint cubic_hermite_curves_point_at_arc_distance(const std::vector<Vec3>& nx,
                                                      const std::vector<Vec3>& nd,
                                                      double arc_distance);

// Sample elements_count_out + 1 points along the segments through nx, spaced
// so element sizes vary smoothly between the optional end derivative
// magnitudes (which are per output element). With neither magnitude the
// points are at equal arc length; with one the other is inferred.
CurveSamples sample_cubic_hermite_curves_smooth(
    const std::vector<Vec3>& nx, const std::vector<Vec3>& nd,
    std::size_t elements_count_out,
    std::optional<double> derivative_magnitude_start = std::nullopt,
    std::optional<double> derivative_magnitude_end = std::nullopt);

// Linearly interpolate per-node values (scalar or Vec3) at the sample
// locations of a CurveSamples taken from the same nodes.
template <typename T>
std::vector<T> interpolate_sample_linear(const std::vector<T>& values,
                                         const CurveSamples& samples) {
    if (values.size() < 2) {
        throw PreconditionViolation("interpolate_sample_linear: need at least two values");
    }
    std::vector<T> result;
    result.reserve(samples.size());
    for (std::size_t n = 0; n < samples.size(); ++n) {
        std::size_t e = samples.elements[n];
        if (e + 1 >= values.size()) {
            throw PreconditionViolation("interpolate_sample_linear: sample element out of range");
        }
        double wp = samples.xis[n];
        double wm = 1.0 - wp;
        result.push_back(values[e] * wm + values[e + 1] * wp);
    }
    return result;
}

}  // namespace ostiamesh

#endif // OSTIAMESH_CURVE_SAMPLING_HPP
