#ifndef OSTIAMESH_ANNULUS_RING_HPP
#define OSTIAMESH_ANNULUS_RING_HPP

#include "derivative_map.hpp"
#include <math/vec3.hpp>
#include <surface/track_surface.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ostiamesh {

using NodeId = uint32_t;

// Boundary node: position, around derivative d1, radial derivative d2 and
// optional through-wall derivative d3
struct RingNode {
    Vec3 x;
    Vec3 d1;
    Vec3 d2;
    std::optional<Vec3> d3;
};

// One wall layer of a ring, nodes in order around (wrapping). Derivative
// maps and node ids are each either empty or one per node.
struct RingLayer {
    std::vector<RingNode> nodes;
    std::vector<DerivativeMap> derivative_maps;
    std::vector<NodeId> node_ids;

    bool has_node_ids() const { return !node_ids.empty(); }
    const DerivativeMap& derivative_map(std::size_t index) const;
};

// Closed loop of boundary nodes with one or two wall layers, inner first.
// surface_proportions locate the outer layer on a host TrackSurface when
// bridging is constrained to it.
struct Ring {
    std::vector<RingLayer> layers;
    std::vector<SurfaceProportion> surface_proportions;

    std::size_t layers_count() const { return layers.size(); }
    std::size_t nodes_count() const { return layers.empty() ? 0 : layers.front().nodes.size(); }
    const RingLayer& inner() const { return layers.front(); }
    const RingLayer& outer() const { return layers.back(); }

    // True when every node carries d3
    bool has_d3() const;

    // A collapsed derivative map at index on any layer
    bool collapsed_at(std::size_t index) const;

    // Throws PreconditionViolation naming the ring when the invariants
    // (1-2 layers, equal node counts, per-node maps and ids, consistent
    // d3) do not hold
    void validate(const std::string& name) const;
};

}  // namespace ostiamesh

#endif // OSTIAMESH_ANNULUS_RING_HPP
