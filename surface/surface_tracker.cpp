#include "surface_tracker.hpp"
#include <curve/hermite.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>

namespace ostiamesh {

const char* to_string(TrackStatus status) {
    switch (status) {
        case TrackStatus::Completed: return "completed";
        case TrackStatus::BoundaryReached: return "boundary_reached";
        case TrackStatus::TrackingDegenerate: return "tracking_degenerate";
        case TrackStatus::TrackingFailed: return "tracking_failed";
    }
    return "unknown";
}

SurfaceTracker::SurfaceTracker(const TrackSurface& surface, TrackerConfig config)
    : surface_(surface), config_(config) {
    if (!(config_.max_xi_step > 0.0)) {
        throw PreconditionViolation("SurfaceTracker: max_xi_step must be positive");
    }
    if (config_.max_steps < 1) {
        throw PreconditionViolation("SurfaceTracker: max_steps must be at least 1");
    }
}

std::optional<DeltaXi> SurfaceTracker::scaled_step(const DeltaXi& delta) const {
    double magnitude = std::sqrt(delta.u * delta.u + delta.v * delta.v);
    if (!(magnitude > 0.0)) {
        return std::nullopt;
    }
    double scale = config_.max_xi_step / magnitude;
    return DeltaXi{scale * delta.u, scale * delta.v};
}

TrackResult SurfaceTracker::track(const SurfacePosition& start, const Vec3& direction,
                                  double distance) const {
    auto log = logging::get_logger();

    Vec3 use_direction = direction;
    double use_distance = distance;
    if (distance < 0.0) {
        use_direction = -direction;
        use_distance = -distance;
    }

    TrackResult result;
    result.position = start;
    // Throws for a start outside the grid
    surface_.evaluate(start);
    if (use_distance == 0.0) {
        return result;
    }
    double distance_limit = config_.distance_limit_factor * use_distance;
    SurfacePosition& position = result.position;

    while (true) {
        if (result.steps >= config_.max_steps) {
            log->warn("SurfaceTracker: gave up after {} steps, covered {} of {}",
                      result.steps, result.distance, use_distance);
            result.status = TrackStatus::TrackingFailed;
            break;
        }
        ++result.steps;

        double xi_u = position.xi_u;
        double xi_v = position.xi_v;
        SurfaceEvaluation a = surface_.evaluate_with_derivatives(position);
        DeltaXi a_delta = surface_delta_xi(a.d_u, a.d_v, use_direction);
        std::optional<DeltaXi> a_step = scaled_step(a_delta);
        if (!a_step) {
            log->debug("SurfaceTracker: direction normal to surface after {}", result.distance);
            result.status = TrackStatus::TrackingDegenerate;
            break;
        }

        // Predictor may step slightly outside the element
        SurfacePosition predicted = position;
        predicted.xi_u = xi_u + a_step->u;
        predicted.xi_v = xi_v + a_step->v;
        SurfaceEvaluation p = surface_.evaluate_with_derivatives(predicted);
        DeltaXi p_delta = surface_delta_xi(p.d_u, p.d_v, use_direction);

        // Corrector: mean of start and predicted gradients
        std::optional<DeltaXi> step = scaled_step(
            {0.5 * (a_delta.u + p_delta.u), 0.5 * (a_delta.v + p_delta.v)});
        if (!step) {
            result.status = TrackStatus::TrackingDegenerate;
            break;
        }

        XiIncrement increment = increment_xi_on_square(xi_u, xi_v, step->u, step->v);
        position.xi_u = increment.xi_u;
        position.xi_v = increment.xi_v;

        SurfaceEvaluation b = surface_.evaluate_with_derivatives(position);
        std::optional<DeltaXi> b_step = scaled_step(surface_delta_xi(b.d_u, b.d_v, use_direction));
        DeltaXi b_xi = b_step.value_or(DeltaXi{});
        Vec3 ad = (a.d_u * a_step->u + a.d_v * a_step->v) * increment.proportion;
        Vec3 bd = (b.d_u * b_xi.u + b.d_v * b_xi.v) * increment.proportion;
        double arc_length = cubic_hermite_arc_length(a.position, ad, b.position, bd);

        if (result.distance + arc_length >= distance_limit) {
            // Take the fraction of this step that covers the remaining distance
            double r = increment.proportion * (use_distance - result.distance) / arc_length;
            position.xi_u = std::clamp(xi_u + r * step->u, 0.0, 1.0);
            position.xi_v = std::clamp(xi_v + r * step->v, 0.0, 1.0);
            result.distance = use_distance;
            break;
        }
        if (arc_length == 0.0 && increment.face == SquareFace::None) {
            log->debug("SurfaceTracker: no increment at element ({}, {}) after {} of {}",
                       position.element_u, position.element_v, result.distance, use_distance);
            result.status = TrackStatus::TrackingDegenerate;
            break;
        }
        result.distance += arc_length;

        if (increment.face != SquareFace::None && surface_.cross_face(position, increment.face)) {
            log->debug("SurfaceTracker: boundary reached at element ({}, {}) after {} of {}",
                       position.element_u, position.element_v, result.distance, use_distance);
            result.status = TrackStatus::BoundaryReached;
            break;
        }
    }
    return result;
}

}  // namespace ostiamesh
