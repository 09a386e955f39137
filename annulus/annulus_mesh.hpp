#ifndef OSTIAMESH_ANNULUS_ANNULUS_MESH_HPP
#define OSTIAMESH_ANNULUS_ANNULUS_MESH_HPP

#include "derivative_map.hpp"
#include "mesh_sink.hpp"
#include "ring.hpp"
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace ostiamesh {

// Address of a node in an AnnulusMesh grid
struct GridIndex {
    std::size_t layer = 0;
    std::size_t ring = 0;   // 0 = start ring, rings_count - 1 = end ring
    std::size_t index = 0;  // Around

    bool operator==(const GridIndex& other) const {
        return layer == other.layer && ring == other.ring && index == other.index;
    }
};

struct GridNode {
    AnnulusNode data;
    std::optional<NodeId> id;  // Preset for reused boundary nodes, else set by emit
    std::optional<GridIndex> merged_into;  // Never emitted when set
};

// Cell in grid terms. corners always has the full 8 (or 4 for a single
// layer) slots in local order, each resolved through merges; for a wedge the
// collapsed slots refer to the same grid node. mappings is aligned with corners.
struct AnnulusCell {
    int radial_step = 0;
    int index_around = 0;
    CellShape shape = CellShape::Hexahedron;
    bool linear_through_wall = false;
    std::vector<GridIndex> corners;
    std::vector<CornerMapping> mappings;
};

// Node grid and cells of one bridge, indexed node[layer][ring][index]
class AnnulusMesh {
public:
    struct EmitResult {
        std::size_t nodes_created = 0;
        std::size_t cells_created = 0;
    };

    AnnulusMesh(std::size_t layers_count, std::size_t rings_count, std::size_t nodes_count_around);

    std::size_t layers_count() const { return layers_count_; }
    std::size_t rings_count() const { return rings_count_; }
    std::size_t nodes_count_around() const { return nodes_count_around_; }

    GridNode& node(const GridIndex& at);
    const GridNode& node(const GridIndex& at) const;
    GridNode& node(std::size_t layer, std::size_t ring, std::size_t index) {
        return node(GridIndex{layer, ring, index});
    }
    const GridNode& node(std::size_t layer, std::size_t ring, std::size_t index) const {
        return node(GridIndex{layer, ring, index});
    }

    // Node standing in for at once merges are followed
    GridIndex resolve(const GridIndex& at) const;

    // Make from an alias of into so every cell built afterwards shares one
    // node. Throws std::logic_error when both already resolve to the same node.
    void merge(const GridIndex& from, const GridIndex& into);

    const std::vector<AnnulusCell>& cells() const { return cells_; }
    void add_cell(AnnulusCell cell) { cells_.push_back(std::move(cell)); }

    // Nodes that will be created on emit, merged nodes excluded
    std::size_t new_nodes_count() const;

    // Send unmerged nodes without an id to the sink (ring by ring, inner layer first),
    // record the ids it assigns, then send every cell
    EmitResult emit(MeshSink& sink);

    // Distinct corners of a cell, in local order, and their ids. Only valid
    // once every referenced node has an id.
    CellRecord cell_record(const AnnulusCell& cell) const;

private:
    std::size_t flat_index(const GridIndex& at) const;

    std::size_t layers_count_;
    std::size_t rings_count_;
    std::size_t nodes_count_around_;
    std::vector<GridNode> nodes_;
    std::vector<AnnulusCell> cells_;
};

}  // namespace ostiamesh

#endif // OSTIAMESH_ANNULUS_ANNULUS_MESH_HPP
