#include "track_surface.hpp"
#include <curve/hermite.hpp>
#include <curve/sampling.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace ostiamesh {

namespace {

constexpr double NEAREST_XI_TOLERANCE = 1.0e-7;
constexpr int NEAREST_MAX_ITERATIONS = 100;
constexpr double BOUNDARY_TOLERANCE = 1.0e-5;

// Weights for the value and derivative of one corner along one xi direction
struct CornerWeights {
    double value;
    double derivative;
};

CornerWeights corner_weights(const HermiteBasis& basis, int corner) {
    return corner ? CornerWeights{basis.f3, basis.f4} : CornerWeights{basis.f1, basis.f2};
}

}  // namespace

XiIncrement increment_xi_on_square(double xi_u, double xi_v, double dxi_u, double dxi_v) {
    XiIncrement result;
    result.xi_u = xi_u + dxi_u;
    result.xi_v = xi_v + dxi_v;
    if (result.xi_u >= 0.0 && result.xi_u <= 1.0 && result.xi_v >= 0.0 && result.xi_v <= 1.0) {
        return result;
    }

    // Come back along the step to the first face crossed
    double proportion = 1.0;
    auto consider = [&](double this_proportion, SquareFace face) {
        if (this_proportion < proportion) {
            proportion = this_proportion;
            result.face = face;
        }
    };
    if (result.xi_u < 0.0 && dxi_u < 0.0) {
        consider(-xi_u / dxi_u, SquareFace::XiU0);
    } else if (result.xi_u > 1.0 && dxi_u > 0.0) {
        consider((1.0 - xi_u) / dxi_u, SquareFace::XiU1);
    }
    if (result.xi_v < 0.0 && dxi_v < 0.0) {
        consider(-xi_v / dxi_v, SquareFace::XiV0);
    } else if (result.xi_v > 1.0 && dxi_v > 0.0) {
        consider((1.0 - xi_v) / dxi_v, SquareFace::XiV1);
    }

    result.proportion = proportion;
    result.xi_u = xi_u + proportion * dxi_u;
    result.xi_v = xi_v + proportion * dxi_v;
    switch (result.face) {
        case SquareFace::XiU0: result.xi_u = 0.0; break;
        case SquareFace::XiU1: result.xi_u = 1.0; break;
        case SquareFace::XiV0: result.xi_v = 0.0; break;
        case SquareFace::XiV1: result.xi_v = 1.0; break;
        case SquareFace::None: break;
    }
    return result;
}

DeltaXi surface_delta_xi(const Vec3& d_u, const Vec3& d_v, const Vec3& direction) {
    // Normal equations A^T A x = A^T b for the 3x2 system
    double a00 = d_u.dot(d_u);
    double a01 = d_u.dot(d_v);
    double a11 = d_v.dot(d_v);
    double b0 = d_u.dot(direction);
    double b1 = d_v.dot(direction);

    double det = a00 * a11 - a01 * a01;
    if (!(det > 1e-12 * a00 * a11)) {
        throw DegenerateSurface("surface_delta_xi: tangents span zero area");
    }
    return {(a11 * b0 - a01 * b1) / det, (a00 * b1 - a01 * b0) / det};
}

SurfaceAxes surface_axes(const Vec3& d_u, const Vec3& d_v, const Vec3& direction) {
    DeltaXi delta = surface_delta_xi(d_u, d_v, direction);
    SurfaceAxes axes;
    axes.along = (d_u * delta.u + d_v * delta.v).normalized();
    axes.normal = d_u.cross(d_v).normalized();
    axes.across = axes.normal.cross(axes.along).normalized();
    return axes;
}

TrackSurface::TrackSurface(int elements_count_u, int elements_count_v,
                           std::vector<Vec3> positions,
                           std::vector<Vec3> d_u,
                           std::vector<Vec3> d_v)
    : elements_count_u_(elements_count_u),
      elements_count_v_(elements_count_v),
      positions_(std::move(positions)),
      d_u_(std::move(d_u)),
      d_v_(std::move(d_v)) {
    if (elements_count_u_ < 1 || elements_count_v_ < 1) {
        throw PreconditionViolation("TrackSurface: element counts must be at least 1");
    }
    std::size_t nodes_count = static_cast<std::size_t>(elements_count_u_ + 1) *
                              static_cast<std::size_t>(elements_count_v_ + 1);
    if (positions_.size() != nodes_count || d_u_.size() != nodes_count ||
        d_v_.size() != nodes_count) {
        throw PreconditionViolation("TrackSurface: expected " + std::to_string(nodes_count) +
                                    " nodes for " + std::to_string(elements_count_u_) + "x" +
                                    std::to_string(elements_count_v_) + " elements");
    }
}

void TrackSurface::check_position(const SurfacePosition& position) const {
    if (position.element_u < 0 || position.element_u >= elements_count_u_ ||
        position.element_v < 0 || position.element_v >= elements_count_v_) {
        throw PreconditionViolation("TrackSurface: element (" +
                                    std::to_string(position.element_u) + ", " +
                                    std::to_string(position.element_v) + ") outside grid");
    }
}

std::size_t TrackSurface::node_index(int node_u, int node_v) const {
    return static_cast<std::size_t>(node_v) * static_cast<std::size_t>(elements_count_u_ + 1) +
           static_cast<std::size_t>(node_u);
}

Vec3 TrackSurface::evaluate(const SurfacePosition& position) const {
    check_position(position);
    HermiteBasis basis_u = cubic_hermite_basis(position.xi_u);
    HermiteBasis basis_v = cubic_hermite_basis(position.xi_v);

    Vec3 x;
    for (int j = 0; j < 2; ++j) {
        CornerWeights wv = corner_weights(basis_v, j);
        for (int i = 0; i < 2; ++i) {
            CornerWeights wu = corner_weights(basis_u, i);
            std::size_t n = node_index(position.element_u + i, position.element_v + j);
            x += positions_[n] * (wu.value * wv.value) +
                 d_u_[n] * (wu.derivative * wv.value) +
                 d_v_[n] * (wu.value * wv.derivative);
        }
    }
    return x;
}

SurfaceEvaluation TrackSurface::evaluate_with_derivatives(const SurfacePosition& position) const {
    check_position(position);
    HermiteBasis basis_u = cubic_hermite_basis(position.xi_u);
    HermiteBasis basis_v = cubic_hermite_basis(position.xi_v);
    HermiteBasis dbasis_u = cubic_hermite_basis_derivatives(position.xi_u);
    HermiteBasis dbasis_v = cubic_hermite_basis_derivatives(position.xi_v);

    SurfaceEvaluation result;
    for (int j = 0; j < 2; ++j) {
        CornerWeights wv = corner_weights(basis_v, j);
        CornerWeights dwv = corner_weights(dbasis_v, j);
        for (int i = 0; i < 2; ++i) {
            CornerWeights wu = corner_weights(basis_u, i);
            CornerWeights dwu = corner_weights(dbasis_u, i);
            std::size_t n = node_index(position.element_u + i, position.element_v + j);
            const Vec3& x = positions_[n];
            const Vec3& du = d_u_[n];
            const Vec3& dv = d_v_[n];
            result.position += x * (wu.value * wv.value) +
                               du * (wu.derivative * wv.value) +
                               dv * (wu.value * wv.derivative);
            result.d_u += x * (dwu.value * wv.value) +
                          du * (dwu.derivative * wv.value) +
                          dv * (dwu.value * wv.derivative);
            result.d_v += x * (wu.value * dwv.value) +
                          du * (wu.derivative * dwv.value) +
                          dv * (wu.value * dwv.derivative);
        }
    }
    return result;
}

SurfacePosition TrackSurface::position_from_proportions(double proportion_u,
                                                        double proportion_v) const {
    if (!(proportion_u >= 0.0 && proportion_u <= 1.0) ||
        !(proportion_v >= 0.0 && proportion_v <= 1.0)) {
        throw PreconditionViolation("TrackSurface::position_from_proportions: proportion out of range");
    }

    SurfacePosition position;
    double pe_u = proportion_u * elements_count_u_;
    if (pe_u < elements_count_u_) {
        position.element_u = static_cast<int>(pe_u);
        position.xi_u = pe_u - position.element_u;
    } else {
        position.element_u = elements_count_u_ - 1;
        position.xi_u = 1.0;
    }
    double pe_v = proportion_v * elements_count_v_;
    if (pe_v < elements_count_v_) {
        position.element_v = static_cast<int>(pe_v);
        position.xi_v = pe_v - position.element_v;
    } else {
        position.element_v = elements_count_v_ - 1;
        position.xi_v = 1.0;
    }
    return position;
}

SurfaceProportion TrackSurface::proportions(const SurfacePosition& position) const {
    return {(position.element_u + position.xi_u) / elements_count_u_,
            (position.element_v + position.xi_v) / elements_count_v_};
}

bool TrackSurface::cross_face(SurfacePosition& position, SquareFace face) const {
    switch (face) {
        case SquareFace::XiU0:
            if (position.element_u > 0) {
                --position.element_u;
                position.xi_u = 1.0;
                return false;
            }
            position.xi_u = 0.0;
            return true;
        case SquareFace::XiU1:
            if (position.element_u < elements_count_u_ - 1) {
                ++position.element_u;
                position.xi_u = 0.0;
                return false;
            }
            position.xi_u = 1.0;
            return true;
        case SquareFace::XiV0:
            if (position.element_v > 0) {
                --position.element_v;
                position.xi_v = 1.0;
                return false;
            }
            position.xi_v = 0.0;
            return true;
        case SquareFace::XiV1:
            if (position.element_v < elements_count_v_ - 1) {
                ++position.element_v;
                position.xi_v = 0.0;
                return false;
            }
            position.xi_v = 1.0;
            return true;
        case SquareFace::None:
            break;
    }
    return false;
}

AdvanceResult TrackSurface::advance_position(const SurfacePosition& start,
                                             double dxi_u, double dxi_v,
                                             double max_magnitude) const {
    SurfaceProportion start_proportion = proportions(start);
    double magnitude = std::sqrt(dxi_u * dxi_u + dxi_v * dxi_v);
    if (magnitude > max_magnitude) {
        double factor = max_magnitude / magnitude;
        dxi_u *= factor;
        dxi_v *= factor;
    }

    // Work in proportions so the step may span several elements
    double proportion_u = start_proportion.u + dxi_u / elements_count_u_;
    double proportion_v = start_proportion.v + dxi_v / elements_count_v_;

    AdvanceResult result;
    if (proportion_u < 0.0 || proportion_u > 1.0 || proportion_v < 0.0 || proportion_v > 1.0) {
        result.on_boundary = true;
        proportion_u = std::clamp(proportion_u, 0.0, 1.0);
        proportion_v = std::clamp(proportion_v, 0.0, 1.0);
        dxi_u = (proportion_u - start_proportion.u) * elements_count_u_;
        dxi_v = (proportion_v - start_proportion.v) * elements_count_v_;
    }
    result.position = position_from_proportions(proportion_u, proportion_v);
    result.dxi_u = dxi_u;
    result.dxi_v = dxi_v;
    return result;
}

std::optional<DeltaXi> TrackSurface::boundary_direction(const SurfacePosition& position) const {
    SurfaceProportion proportion = proportions(position);
    if (proportion.u < BOUNDARY_TOLERANCE) return DeltaXi{-1.0, 0.0};
    if (proportion.u > 1.0 - BOUNDARY_TOLERANCE) return DeltaXi{1.0, 0.0};
    if (proportion.v < BOUNDARY_TOLERANCE) return DeltaXi{0.0, -1.0};
    if (proportion.v > 1.0 - BOUNDARY_TOLERANCE) return DeltaXi{0.0, 1.0};
    return std::nullopt;
}

SurfacePosition TrackSurface::find_nearest_position(const Vec3& target,
                                                    std::optional<SurfacePosition> start) const {
    SurfacePosition position = start ? *start : position_from_proportions(0.5, 0.5);
    check_position(position);

    double applied = 0.0;
    for (int iter = 0; iter < NEAREST_MAX_ITERATIONS; ++iter) {
        SurfaceEvaluation eval = evaluate_with_derivatives(position);
        Vec3 r = target - eval.position;
        DeltaXi dxi = surface_delta_xi(eval.d_u, eval.d_v, r);

        // On the boundary with the target outside: slide along the edge
        if (auto outward_xi = boundary_direction(position)) {
            Vec3 outward = (eval.d_u * outward_xi->u + eval.d_v * outward_xi->v).normalized();
            if (r.dot(outward) > 0.0) {
                if (outward_xi->u != 0.0) {
                    dxi = {0.0, eval.d_v.dot(r) / eval.d_v.length_squared()};
                } else {
                    dxi = {eval.d_u.dot(r) / eval.d_u.length_squared(), 0.0};
                }
            }
        }
        if (dxi.u == 0.0 && dxi.v == 0.0) {
            return position;
        }

        AdvanceResult advance = advance_position(position, dxi.u, dxi.v);
        position = advance.position;
        applied = std::sqrt(advance.dxi_u * advance.dxi_u + advance.dxi_v * advance.dxi_v);
        if (applied < NEAREST_XI_TOLERANCE) {
            return position;
        }
    }

    logging::get_logger()->warn(
        "TrackSurface::find_nearest_position: max iterations reached, last xi step {}", applied);
    return position;
}

SurfaceCurvePoints TrackSurface::create_hermite_curve_points(const SurfaceProportion& a,
                                                             const SurfaceProportion& b,
                                                             std::size_t elements_count,
                                                             std::optional<Vec3> derivative_start,
                                                             std::optional<Vec3> derivative_end) const {
    if (elements_count < 1) {
        throw PreconditionViolation("TrackSurface::create_hermite_curve_points: need at least one element");
    }
    double count = static_cast<double>(elements_count);
    Vec3 pa(a.u, a.v, 0.0);
    Vec3 pb(b.u, b.v, 0.0);

    // Convert a 3-D derivative at a proportion into a derivative in proportion
    // space per output element
    auto proportion_derivative = [&](const SurfaceProportion& p, const Vec3& derivative) {
        SurfaceEvaluation eval = evaluate_with_derivatives(position_from_proportions(p.u, p.v));
        DeltaXi delta = surface_delta_xi(eval.d_u, eval.d_v, derivative);
        return Vec3(delta.u / elements_count_u_, delta.v / elements_count_v_, 0.0);
    };

    Vec3 dp_start;
    Vec3 dp_end;
    double magnitude_start = 0.0;
    double magnitude_end = 0.0;
    if (derivative_start) {
        dp_start = proportion_derivative(a, *derivative_start);
        magnitude_start = dp_start.length();
        dp_start *= count;
    }
    if (derivative_end) {
        dp_end = proportion_derivative(b, *derivative_end);
        magnitude_end = dp_end.length();
        dp_end *= count;
    }
    if (!derivative_start) {
        dp_start = derivative_end ? interpolate_lagrange_hermite_derivative(pa, pb, dp_end, 0.0)
                                  : pb - pa;
        magnitude_start = dp_start.length() / count;
    }
    if (!derivative_end) {
        dp_end = derivative_start ? interpolate_hermite_lagrange_derivative(pa, dp_start, pb, 1.0)
                                  : pb - pa;
        magnitude_end = dp_end.length() / count;
    }

    CurveSamples samples = sample_cubic_hermite_curves_smooth(
        {pa, pb}, {dp_start, dp_end}, elements_count, magnitude_start, magnitude_end);

    SurfaceCurvePoints points;
    for (std::size_t n = 0; n < samples.size(); ++n) {
        SurfaceProportion proportion{std::clamp(samples.positions[n].x, 0.0, 1.0),
                                     std::clamp(samples.positions[n].y, 0.0, 1.0)};
        SurfaceEvaluation eval = evaluate_with_derivatives(
            position_from_proportions(proportion.u, proportion.v));
        const Vec3& dp = samples.derivatives[n];
        Vec3 d1 = eval.d_u * (dp.x * elements_count_u_) + eval.d_v * (dp.y * elements_count_v_);
        Vec3 d3 = eval.d_u.cross(eval.d_v).normalized();
        points.positions.push_back(eval.position);
        points.d1.push_back(d1);
        points.d2.push_back(d3.cross(d1));
        points.d3.push_back(d3);
        points.proportions.push_back(proportion);
    }
    return points;
}

SurfaceCurvePoints TrackSurface::resample_hermite_curve_points_smooth(
    const SurfaceCurvePoints& points,
    std::optional<double> derivative_magnitude_start,
    std::optional<double> derivative_magnitude_end) const {
    std::size_t points_count = points.positions.size();
    if (points_count < 2 || points.d1.size() != points_count || points.d2.size() != points_count ||
        points.d3.size() != points_count || points.proportions.size() != points_count) {
        throw PreconditionViolation("TrackSurface::resample_hermite_curve_points_smooth: inconsistent points");
    }
    std::size_t elements_count = points_count - 1;

    CurveSamples samples = sample_cubic_hermite_curves_smooth(
        points.positions, points.d1, elements_count,
        derivative_magnitude_start, derivative_magnitude_end);

    SurfaceCurvePoints result = points;
    result.positions = samples.positions;
    result.d1 = samples.derivatives;
    result.d2.front() = result.d2.front().with_length(result.d1.front().length());
    result.d2.back() = result.d2.back().with_length(result.d1.back().length());

    for (std::size_t n = 1; n < elements_count; ++n) {
        SurfacePosition start = position_from_proportions(points.proportions[n].u,
                                                          points.proportions[n].v);
        SurfacePosition nearest = find_nearest_position(result.positions[n], start);
        SurfaceEvaluation eval = evaluate_with_derivatives(nearest);
        SurfaceAxes axes = surface_axes(eval.d_u, eval.d_v, result.d1[n].normalized());
        result.positions[n] = eval.position;
        result.proportions[n] = proportions(nearest);
        result.d2[n] = axes.across.with_length(result.d1[n].length());
        result.d3[n] = axes.normal;
    }
    return result;
}

}  // namespace ostiamesh
