#ifndef OSTIAMESH_ANNULUS_ANNULUS_BUILDER_HPP
#define OSTIAMESH_ANNULUS_ANNULUS_BUILDER_HPP

#include "annulus_mesh.hpp"
#include "ring.hpp"
#include <surface/track_surface.hpp>
#include <optional>

namespace ostiamesh {

struct BridgeOptions {
    int radial_subdivisions = 1;              // Elements from start to end ring
    std::optional<double> max_start_thickness; // Caps wall thickness at the start
    std::optional<double> max_end_thickness;   // Caps wall thickness at the end

    // Through-wall interpolation is linear at an end that lacks d3, or where
    // forced. The middle is linear when both ends are, or when one end is
    // and force_mid_linear_through_wall is set.
    bool force_start_linear_through_wall = false;
    bool force_mid_linear_through_wall = false;
    bool force_end_linear_through_wall = false;

    // 0 samples radially with equal end derivatives; 1 keeps each end's own
    // derivative magnitude
    double sample_blend = 0.0;
};

// Bridge two rings with a band of elements radial_subdivisions deep.
// Interior rings follow Hermite curves between matching start and end
// nodes, placed on surface when one is given (both rings then need surface
// proportions). Inputs are not modified.
//
// Throws ShapeMismatch when the rings differ in node or layer counts,
// PreconditionViolation for other invalid inputs and DegenerateSurface when
// a surface normal cannot be formed at an interior node.
AnnulusMesh build_annulus(const Ring& start, const Ring& end,
                          const BridgeOptions& options,
                          const TrackSurface* surface = nullptr);

}  // namespace ostiamesh

#endif // OSTIAMESH_ANNULUS_ANNULUS_BUILDER_HPP
