#include "hermite.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <array>
#include <cmath>

namespace ostiamesh {

namespace {

// 4-point Gauss-Legendre rule mapped to [0, 1]
constexpr std::array<double, 4> GAUSS_XI_4 = {
    0.069431844202973712, 0.33000947820757187,
    0.66999052179242813, 0.93056815579702629};
constexpr std::array<double, 4> GAUSS_WT_4 = {
    0.17392742256872693, 0.32607257743127307,
    0.32607257743127307, 0.17392742256872693};

constexpr int MAX_ITERATIONS = 100;
constexpr double RELATIVE_TOLERANCE = 1.0e-6;

}  // namespace

HermiteBasis cubic_hermite_basis(double xi) {
    double xi2 = xi * xi;
    double xi3 = xi2 * xi;
    return {1.0 - 3.0 * xi2 + 2.0 * xi3,
            xi - 2.0 * xi2 + xi3,
            3.0 * xi2 - 2.0 * xi3,
            -xi2 + xi3};
}

HermiteBasis cubic_hermite_basis_derivatives(double xi) {
    double xi2 = xi * xi;
    return {-6.0 * xi + 6.0 * xi2,
            1.0 - 4.0 * xi + 3.0 * xi2,
            6.0 * xi - 6.0 * xi2,
            -2.0 * xi + 3.0 * xi2};
}

HermiteBasis cubic_hermite_basis_second_derivatives(double xi) {
    return {-6.0 + 12.0 * xi,
            -4.0 + 6.0 * xi,
            6.0 - 12.0 * xi,
            -2.0 + 6.0 * xi};
}

Vec3 interpolate_cubic_hermite(const Vec3& v1, const Vec3& d1,
                               const Vec3& v2, const Vec3& d2, double xi) {
    return cubic_hermite_basis(xi).combine(v1, d1, v2, d2);
}

Vec3 interpolate_cubic_hermite_derivative(const Vec3& v1, const Vec3& d1,
                                          const Vec3& v2, const Vec3& d2, double xi) {
    return cubic_hermite_basis_derivatives(xi).combine(v1, d1, v2, d2);
}

Vec3 interpolate_cubic_hermite_second_derivative(const Vec3& v1, const Vec3& d1,
                                                 const Vec3& v2, const Vec3& d2, double xi) {
    return cubic_hermite_basis_second_derivatives(xi).combine(v1, d1, v2, d2);
}

Vec3 interpolate_hermite_lagrange_derivative(const Vec3& v1, const Vec3& d1,
                                             const Vec3& v2, double xi) {
    return v1 * (-2.0 * xi) + d1 * (1.0 - 2.0 * xi) + v2 * (2.0 * xi);
}

Vec3 interpolate_lagrange_hermite_derivative(const Vec3& v1, const Vec3& v2,
                                             const Vec3& d2, double xi) {
    return v1 * (-2.0 + 2.0 * xi) + v2 * (2.0 - 2.0 * xi) + d2 * (-1.0 + 2.0 * xi);
}

double cubic_hermite_arc_length(const Vec3& v1, const Vec3& d1,
                                const Vec3& v2, const Vec3& d2) {
    double arc_length = 0.0;
    for (std::size_t i = 0; i < GAUSS_XI_4.size(); ++i) {
        Vec3 dm = interpolate_cubic_hermite_derivative(v1, d1, v2, d2, GAUSS_XI_4[i]);
        arc_length += GAUSS_WT_4[i] * dm.length();
    }
    return arc_length;
}

double cubic_hermite_arc_length_to_xi(const Vec3& v1, const Vec3& d1,
                                      const Vec3& v2, const Vec3& d2, double xi) {
    // Same curve reparameterized over [0, xi]
    Vec3 v2m = interpolate_cubic_hermite(v1, d1, v2, d2, xi);
    Vec3 d2m = interpolate_cubic_hermite_derivative(v1, d1, v2, d2, xi) * xi;
    return cubic_hermite_arc_length(v1, d1 * xi, v2m, d2m);
}

double compute_cubic_hermite_arc_length(const Vec3& v1, const Vec3& d1,
                                        const Vec3& v2, const Vec3& d2,
                                        bool rescale_derivatives) {
    double last_arc_length = rescale_derivatives
        ? v1.distance_to(v2)
        : cubic_hermite_arc_length(v1, d1, v2, d2);
    Vec3 unit_d1 = d1.normalized();
    Vec3 unit_d2 = d2.normalized();

    double arc_length = last_arc_length;
    for (int iter = 0; iter < MAX_ITERATIONS; ++iter) {
        arc_length = cubic_hermite_arc_length(v1, unit_d1 * last_arc_length,
                                              v2, unit_d2 * last_arc_length);
        if (iter > 9) {
            // Damp oscillation between two lengths
            arc_length = 0.8 * arc_length + 0.2 * last_arc_length;
        }
        if (std::abs(arc_length - last_arc_length) <= RELATIVE_TOLERANCE * arc_length) {
            return arc_length;
        }
        last_arc_length = arc_length;
    }

    logging::get_logger()->warn(
        "compute_cubic_hermite_arc_length: max iterations reached, arc length = {}",
        arc_length);
    return arc_length;
}

double compute_cubic_hermite_derivative_scaling(const Vec3& v1, const Vec3& d1,
                                                const Vec3& v2, const Vec3& d2) {
    double original_magnitude = 0.5 * (d1.length() + d2.length());
    if (original_magnitude <= 0.0) {
        return 1.0;
    }

    double scaling = 1.0;
    for (int iter = 0; iter < MAX_ITERATIONS; ++iter) {
        double magnitude = original_magnitude * scaling;
        double arc_length = cubic_hermite_arc_length(v1, d1 * scaling, v2, d2 * scaling);
        if (std::abs(arc_length - magnitude) <= RELATIVE_TOLERANCE * arc_length) {
            return scaling;
        }
        scaling *= arc_length / magnitude;
    }

    logging::get_logger()->warn(
        "compute_cubic_hermite_derivative_scaling: max iterations reached, scaling = {}",
        scaling);
    return scaling;
}

double cubic_hermite_curves_length(const std::vector<Vec3>& nx,
                                   const std::vector<Vec3>& nd,
                                   bool loop) {
    if (nx.size() != nd.size()) {
        throw PreconditionViolation("cubic_hermite_curves_length: positions and derivatives differ in count");
    }
    if (nx.size() < 2) {
        return 0.0;
    }

    std::size_t elements_count = loop ? nx.size() : nx.size() - 1;
    double length = 0.0;
    for (std::size_t e = 0; e < elements_count; ++e) {
        std::size_t next = (e + 1) % nx.size();
        length += cubic_hermite_arc_length(nx[e], nd[e], nx[next], nd[next]);
    }
    return length;
}

double cubic_hermite_curvature(const Vec3& v1, const Vec3& d1,
                               const Vec3& v2, const Vec3& d2,
                               const Vec3& radial_vector, double xi) {
    Vec3 tangent = interpolate_cubic_hermite_derivative(v1, d1, v2, d2, xi);
    double tangent_length_squared = tangent.length_squared();
    if (tangent_length_squared < 1e-24) {
        return 0.0;
    }
    Vec3 d_tangent = interpolate_cubic_hermite_second_derivative(v1, d1, v2, d2, xi);
    return d_tangent.dot(radial_vector) / tangent_length_squared;
}

}  // namespace ostiamesh
