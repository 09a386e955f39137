#ifndef OSTIAMESH_SURFACE_TRACK_SURFACE_HPP
#define OSTIAMESH_SURFACE_TRACK_SURFACE_HPP

#include <math/vec3.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace ostiamesh {

// Location on a TrackSurface: element indices plus local xi in that element.
// xi is nominally in [0, 1]; predictor steps may evaluate slightly outside.
struct SurfacePosition {
    int element_u = 0;
    int element_v = 0;
    double xi_u = 0.0;
    double xi_v = 0.0;
};

// Fractions across the whole grid in u and v, each in [0, 1]
struct SurfaceProportion {
    double u = 0.0;
    double v = 0.0;
};

struct SurfaceEvaluation {
    Vec3 position;
    Vec3 d_u;  // d(position)/d(xi_u)
    Vec3 d_v;  // d(position)/d(xi_v)
};

// Orthonormal frame at a surface point
struct SurfaceAxes {
    Vec3 along;   // In-plane, in the requested direction
    Vec3 across;  // In-plane, normal x along
    Vec3 normal;  // Unit d_u x d_v
};

// Element faces of the unit xi square
enum class SquareFace {
    None,
    XiU0,  // xi_u == 0
    XiU1,  // xi_u == 1
    XiV0,  // xi_v == 0
    XiV1   // xi_v == 1
};

// Result of stepping within one element. When the step leaves the unit square
// it is cut back to the first face crossed: face names it and proportion is
// the fraction of the step taken (1 when no face is hit). Both xi are always
// updated consistently with proportion.
struct XiIncrement {
    double xi_u = 0.0;
    double xi_v = 0.0;
    double proportion = 1.0;
    SquareFace face = SquareFace::None;
};

XiIncrement increment_xi_on_square(double xi_u, double xi_v, double dxi_u, double dxi_v);

struct DeltaXi {
    double u = 0.0;
    double v = 0.0;
};

// Least-squares xi increment whose image is closest to direction.
// Throws DegenerateSurface when d_u, d_v span zero area.
DeltaXi surface_delta_xi(const Vec3& d_u, const Vec3& d_v, const Vec3& direction);

// Throws DegenerateSurface when d_u, d_v span zero area.
SurfaceAxes surface_axes(const Vec3& d_u, const Vec3& d_v, const Vec3& direction);

// Points sampled along a curve constrained to a TrackSurface.
// d1 is along the curve, d2 across it in the surface plane with the same
// magnitude, d3 the unit surface normal.
struct SurfaceCurvePoints {
    std::vector<Vec3> positions;
    std::vector<Vec3> d1;
    std::vector<Vec3> d2;
    std::vector<Vec3> d3;
    std::vector<SurfaceProportion> proportions;
};

// Result of moving a position by a xi increment across element faces
struct AdvanceResult {
    SurfacePosition position;
    bool on_boundary = false;
    double dxi_u = 0.0;  // Increment actually applied
    double dxi_v = 0.0;
};

// A grid of bicubic Hermite patches with zero cross derivative. Node arrays
// are flattened with u varying fastest. Immutable after construction and
// safe to evaluate from several threads.
class TrackSurface {
public:
    TrackSurface(int elements_count_u, int elements_count_v,
                 std::vector<Vec3> positions,
                 std::vector<Vec3> d_u,
                 std::vector<Vec3> d_v);

    int elements_count_u() const { return elements_count_u_; }
    int elements_count_v() const { return elements_count_v_; }
    const std::vector<Vec3>& positions() const { return positions_; }
    const std::vector<Vec3>& d_u() const { return d_u_; }
    const std::vector<Vec3>& d_v() const { return d_v_; }

    // Throws PreconditionViolation for element indices outside the grid
    Vec3 evaluate(const SurfacePosition& position) const;
    SurfaceEvaluation evaluate_with_derivatives(const SurfacePosition& position) const;

    // Throws PreconditionViolation for proportions outside [0, 1]
    SurfacePosition position_from_proportions(double proportion_u, double proportion_v) const;
    SurfaceProportion proportions(const SurfacePosition& position) const;

    // Move position across face into the neighbouring element. At the edge
    // of the grid xi is clamped instead and true is returned.
    bool cross_face(SurfacePosition& position, SquareFace face) const;

    // Apply a xi increment (limited to max_magnitude) across elements,
    // stopping at the grid boundary
    AdvanceResult advance_position(const SurfacePosition& start,
                                   double dxi_u, double dxi_v,
                                   double max_magnitude = 0.5) const;

    // Position whose point is nearest to target, by Gauss-Newton iteration
    // from start (grid centre when omitted)
    SurfacePosition find_nearest_position(const Vec3& target,
                                          std::optional<SurfacePosition> start = std::nullopt) const;

    // Sample elements_count + 1 points on a smooth curve between proportions
    // a and b. Optional 3-D end derivatives are matched by the curve.
    SurfaceCurvePoints create_hermite_curve_points(const SurfaceProportion& a,
                                                   const SurfaceProportion& b,
                                                   std::size_t elements_count,
                                                   std::optional<Vec3> derivative_start = std::nullopt,
                                                   std::optional<Vec3> derivative_end = std::nullopt) const;

    // Respace points in 3-D to the given end derivative magnitudes, then pull
    // interior points back onto the surface and recompute d2, d3
    SurfaceCurvePoints resample_hermite_curve_points_smooth(
        const SurfaceCurvePoints& points,
        std::optional<double> derivative_magnitude_start = std::nullopt,
        std::optional<double> derivative_magnitude_end = std::nullopt) const;

private:
    void check_position(const SurfacePosition& position) const;
    std::size_t node_index(int node_u, int node_v) const;

    // Non-zero outward xi direction when position lies on the grid boundary
    std::optional<DeltaXi> boundary_direction(const SurfacePosition& position) const;

    int elements_count_u_;
    int elements_count_v_;
    std::vector<Vec3> positions_;
    std::vector<Vec3> d_u_;
    std::vector<Vec3> d_v_;
};

}  // namespace ostiamesh

#endif // OSTIAMESH_SURFACE_TRACK_SURFACE_HPP
