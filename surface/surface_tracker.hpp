#ifndef OSTIAMESH_SURFACE_SURFACE_TRACKER_HPP
#define OSTIAMESH_SURFACE_SURFACE_TRACKER_HPP

#include "track_surface.hpp"
#include <math/vec3.hpp>
#include <optional>

namespace ostiamesh {

// How a track ended. Anything other than Completed means the requested
// distance was not covered and position is where tracking stopped.
enum class TrackStatus {
    Completed,
    BoundaryReached,     // Hit the edge of the grid; xi clamped there
    TrackingDegenerate,  // A step made no progress
    TrackingFailed       // Exceeded TrackerConfig::max_steps
};

const char* to_string(TrackStatus status);

struct TrackerConfig {
    double max_xi_step = 0.02;             // Magnitude of each xi increment
    double distance_limit_factor = 0.9999; // Finish once this fraction is covered
    int max_steps = 100000;
};

struct TrackResult {
    SurfacePosition position;
    TrackStatus status = TrackStatus::Completed;
    double distance = 0.0;  // Distance actually covered
    int steps = 0;

    bool completed() const { return status == TrackStatus::Completed; }
};

// Walks a TrackSurface along a 3-D direction projected into the surface,
// using an improved Euler (predictor-corrector) step in xi and measuring
// progress by Hermite arc length. Holds a reference to the surface, which
// must outlive the tracker.
class SurfaceTracker {
public:
    explicit SurfaceTracker(const TrackSurface& surface, TrackerConfig config = {});

    // Track distance along direction from start. A negative distance tracks
    // along -direction.
    TrackResult track(const SurfacePosition& start, const Vec3& direction, double distance) const;

    const TrackSurface& surface() const { return surface_; }
    const TrackerConfig& config() const { return config_; }

private:
    // Delta xi scaled to max_xi_step; empty when it has no magnitude
    std::optional<DeltaXi> scaled_step(const DeltaXi& delta) const;

    const TrackSurface& surface_;
    TrackerConfig config_;
};

}  // namespace ostiamesh

#endif // OSTIAMESH_SURFACE_SURFACE_TRACKER_HPP
