#ifndef OSTIAMESH_ANNULUS_MESH_SINK_HPP
#define OSTIAMESH_ANNULUS_MESH_SINK_HPP

#include "derivative_map.hpp"
#include "ring.hpp"
#include <math/vec3.hpp>
#include <optional>
#include <vector>

namespace ostiamesh {

// Node record handed to a sink
struct AnnulusNode {
    Vec3 x;
    Vec3 d1;
    Vec3 d2;
    std::optional<Vec3> d3;
};

enum class CellShape {
    Hexahedron,     // 8 nodes, two wall layers
    Wedge,          // 6 nodes, hexahedron with one collapsed edge
    Quadrilateral,  // 4 nodes, single layer
    Triangle        // 3 nodes, quadrilateral with one collapsed edge
};

const char* to_string(CellShape shape);

// Cell connectivity handed to a sink. node_ids lists the distinct corners
// in local order: wall layer slowest, then radial, then around.
// corner_mappings is aligned with node_ids.
struct CellRecord {
    CellShape shape = CellShape::Hexahedron;
    int radial_step = 0;
    int index_around = 0;
    bool linear_through_wall = false;
    std::vector<NodeId> node_ids;
    std::vector<CornerMapping> corner_mappings;
};

// Consumer of generated nodes and cells, typically an adapter onto a
// finite-element backend. add_node returns the id the sink assigned.
class MeshSink {
public:
    virtual ~MeshSink() = default;

    virtual NodeId add_node(const AnnulusNode& node) = 0;
    virtual void add_cell(const CellRecord& cell) = 0;
};

// Sink that keeps everything in memory and numbers nodes sequentially
class InMemoryMeshSink : public MeshSink {
public:
    struct StoredNode {
        NodeId id = 0;
        AnnulusNode node;
    };

    explicit InMemoryMeshSink(NodeId first_node_id = 1);

    NodeId add_node(const AnnulusNode& node) override;
    void add_cell(const CellRecord& cell) override;

    const std::vector<StoredNode>& nodes() const { return nodes_; }
    const std::vector<CellRecord>& cells() const { return cells_; }
    NodeId next_node_id() const { return next_node_id_; }

private:
    NodeId next_node_id_;
    std::vector<StoredNode> nodes_;
    std::vector<CellRecord> cells_;
};

}  // namespace ostiamesh

#endif // OSTIAMESH_ANNULUS_MESH_SINK_HPP
