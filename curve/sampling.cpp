#include "sampling.hpp"
#include "hermite.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <string>

namespace ostiamesh {

namespace {

constexpr double XI_DELTA = 1.0e-6;
constexpr double XI_TOLERANCE = 1.0e-6;
constexpr int MAX_NEWTON_ITERATIONS = 100;

void check_curve(const std::vector<Vec3>& nx, const std::vector<Vec3>& nd,
                 const char* caller) {
    if (nx.size() < 2) {
        throw PreconditionViolation(std::string(caller) + ": need at least two points");
    }
    if (nd.size() != nx.size()) {
        throw PreconditionViolation(std::string(caller) + ": positions and derivatives differ in count");
    }
}

}  // namespace

CurvePoint cubic_hermite_curves_point_at_arc_distance(const std::vector<Vec3>& nx,
                                                      const std::vector<Vec3>& nd,
                                                      double arc_distance) {
    check_curve(nx, nd, "cubic_hermite_curves_point_at_arc_distance");
    std::size_t elements_count = nx.size() - 1;

    if (arc_distance <= 0.0) {
        return {nx.front(), nd.front(), 0, 0.0};
    }

    double length = 0.0;
    for (std::size_t e = 0; e < elements_count; ++e) {
        const Vec3& v1 = nx[e];
        const Vec3& d1 = nd[e];
        const Vec3& v2 = nx[e + 1];
        const Vec3& d2 = nd[e + 1];
        double part_distance = arc_distance - length;
        double arc_length = cubic_hermite_arc_length(v1, d1, v2, d2);

        if (part_distance <= arc_length) {
            if (arc_length <= 0.0) {
                return {v1, d1, e, 0.0};
            }
            // Newton iteration on xi, distance gradient by central difference
            double xi = part_distance / arc_length;
            for (int iter = 0; iter < MAX_NEWTON_ITERATIONS; ++iter) {
                double xi_last = xi;
                double dist = cubic_hermite_arc_length_to_xi(v1, d1, v2, d2, xi);
                double dist_p = cubic_hermite_arc_length_to_xi(v1, d1, v2, d2, xi + XI_DELTA);
                double dist_m = cubic_hermite_arc_length_to_xi(v1, d1, v2, d2, xi - XI_DELTA);
                if (dist_p == dist_m) {
                    break;
                }
                xi -= (2.0 * XI_DELTA) / (dist_p - dist_m) * (dist - part_distance);
                if (std::abs(xi - xi_last) <= XI_TOLERANCE) {
                    return {interpolate_cubic_hermite(v1, d1, v2, d2, xi),
                            interpolate_cubic_hermite_derivative(v1, d1, v2, d2, xi),
                            e, xi};
                }
            }
            logging::get_logger()->warn(
                "cubic_hermite_curves_point_at_arc_distance: no convergence in element {} at xi {}",
                e, xi);
            return {interpolate_cubic_hermite(v1, d1, v2, d2, xi),
                    interpolate_cubic_hermite_derivative(v1, d1, v2, d2, xi),
                    e, xi};
        }
        length += arc_length;
    }
    return {nx.back(), nd.back(), elements_count - 1, 1.0};
}

CurveSamples sample_cubic_hermite_curves_smooth(
    const std::vector<Vec3>& nx, const std::vector<Vec3>& nd,
    std::size_t elements_count_out,
    std::optional<double> derivative_magnitude_start,
    std::optional<double> derivative_magnitude_end) {
    check_curve(nx, nd, "sample_cubic_hermite_curves_smooth");
    if (elements_count_out < 1) {
        throw PreconditionViolation("sample_cubic_hermite_curves_smooth: need at least one output element");
    }

    std::size_t elements_count_in = nx.size() - 1;
    std::vector<double> length_to_node{0.0};
    double length = 0.0;
    for (std::size_t e = 0; e < elements_count_in; ++e) {
        length += cubic_hermite_arc_length(nx[e], nd[e], nx[e + 1], nd[e + 1]);
        length_to_node.push_back(length);
    }

    double count_out = static_cast<double>(elements_count_out);
    double magnitude_start;
    double magnitude_end;
    if (derivative_magnitude_start && derivative_magnitude_end) {
        magnitude_start = *derivative_magnitude_start;
        magnitude_end = *derivative_magnitude_end;
    } else if (derivative_magnitude_end) {
        magnitude_end = *derivative_magnitude_end;
        magnitude_start = (2.0 * length - count_out * magnitude_end) / count_out;
    } else if (derivative_magnitude_start) {
        magnitude_start = *derivative_magnitude_start;
        magnitude_end = (2.0 * length - count_out * magnitude_start) / count_out;
    } else {
        magnitude_start = magnitude_end = length / count_out;
    }

    // Distance along the curve is itself a cubic Hermite in output xi
    double x1 = 0.0;
    double d1 = magnitude_start * count_out;
    double x2 = length;
    double d2 = magnitude_end * count_out;

    CurveSamples samples;
    std::size_t e = 0;
    std::size_t last_element_in = elements_count_in - 1;
    for (std::size_t n = 0; n <= elements_count_out; ++n) {
        double xi = static_cast<double>(n) / count_out;
        double distance = cubic_hermite_basis(xi).combine(x1, d1, x2, d2);
        double magnitude = cubic_hermite_basis_derivatives(xi).combine(x1, d1, x2, d2) / count_out;

        while (e < last_element_in && distance >= length_to_node[e + 1]) {
            ++e;
        }
        std::vector<Vec3> segment_x{nx[e], nx[e + 1]};
        std::vector<Vec3> segment_d{nd[e], nd[e + 1]};
        CurvePoint point = cubic_hermite_curves_point_at_arc_distance(
            segment_x, segment_d, distance - length_to_node[e]);

        double derivative_length = point.derivative.length();
        double scale_factor = (derivative_length > 0.0) ? magnitude / derivative_length : 0.0;
        samples.positions.push_back(point.position);
        samples.derivatives.push_back(point.derivative * scale_factor);
        samples.elements.push_back(e);
        samples.xis.push_back(point.xi);
        samples.scale_factors.push_back(scale_factor);
    }
    return samples;
}

}  // namespace ostiamesh
