#ifndef OSTIAMESH_CURVE_HERMITE_HPP
#define OSTIAMESH_CURVE_HERMITE_HPP

#include <math/vec3.hpp>
#include <vector>

namespace ostiamesh {

// Weights of the four cubic Hermite basis functions at one xi, in the
// order: value at xi=0, derivative at xi=0, value at xi=1, derivative at xi=1.
struct HermiteBasis {
    double f1 = 0.0;
    double f2 = 0.0;
    double f3 = 0.0;
    double f4 = 0.0;

    // Works for scalars and Vec3
    template <typename T>
    T combine(const T& v1, const T& d1, const T& v2, const T& d2) const {
        return v1 * f1 + d1 * f2 + v2 * f3 + d2 * f4;
    }
};

HermiteBasis cubic_hermite_basis(double xi);
HermiteBasis cubic_hermite_basis_derivatives(double xi);
HermiteBasis cubic_hermite_basis_second_derivatives(double xi);

// Segment from v1 with derivative d1 (xi=0) to v2 with derivative d2 (xi=1)
Vec3 interpolate_cubic_hermite(const Vec3& v1, const Vec3& d1,
                               const Vec3& v2, const Vec3& d2, double xi);
Vec3 interpolate_cubic_hermite_derivative(const Vec3& v1, const Vec3& d1,
                                          const Vec3& v2, const Vec3& d2, double xi);
Vec3 interpolate_cubic_hermite_second_derivative(const Vec3& v1, const Vec3& d1,
                                                 const Vec3& v2, const Vec3& d2, double xi);

// Derivative of the quadratic through v1 (with derivative d1) and v2
Vec3 interpolate_hermite_lagrange_derivative(const Vec3& v1, const Vec3& d1,
                                             const Vec3& v2, double xi);

// Derivative of the quadratic through v1 and v2 (with derivative d2)
Vec3 interpolate_lagrange_hermite_derivative(const Vec3& v1, const Vec3& v2,
                                             const Vec3& d2, double xi);

// Arc length by 4-point Gauss quadrature, with derivatives as supplied
double cubic_hermite_arc_length(const Vec3& v1, const Vec3& d1,
                                const Vec3& v2, const Vec3& d2);

// Arc length from xi=0 up to xi
double cubic_hermite_arc_length_to_xi(const Vec3& v1, const Vec3& d1,
                                      const Vec3& v2, const Vec3& d2, double xi);

// Arc length with both derivative directions kept and their magnitudes
// iterated to equal the arc length. When rescale_derivatives is set the
// iteration starts from the chord length rather than the supplied magnitudes.
double compute_cubic_hermite_arc_length(const Vec3& v1, const Vec3& d1,
                                        const Vec3& v2, const Vec3& d2,
                                        bool rescale_derivatives);

// Factor for d1 and d2 making their mean magnitude equal the arc length
double compute_cubic_hermite_derivative_scaling(const Vec3& v1, const Vec3& d1,
                                                const Vec3& v2, const Vec3& d2);

// Total length of consecutive segments through nx, closing back to the
// first point when loop is set
double cubic_hermite_curves_length(const std::vector<Vec3>& nx,
                                   const std::vector<Vec3>& nd,
                                   bool loop = false);

// Curvature (1/R) at xi measured along radial_vector, a unit vector normal
// to the tangent. Positive when the curve bends towards radial_vector.
// A zero tangent gives zero curvature.
double cubic_hermite_curvature(const Vec3& v1, const Vec3& d1,
                               const Vec3& v2, const Vec3& d2,
                               const Vec3& radial_vector, double xi);

}  // namespace ostiamesh

#endif // OSTIAMESH_CURVE_HERMITE_HPP
