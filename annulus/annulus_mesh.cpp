#include "annulus_mesh.hpp"
#include <algorithm>
#include <stdexcept>

namespace ostiamesh {

AnnulusMesh::AnnulusMesh(std::size_t layers_count, std::size_t rings_count,
                         std::size_t nodes_count_around)
    : layers_count_(layers_count),
      rings_count_(rings_count),
      nodes_count_around_(nodes_count_around),
      nodes_(layers_count * rings_count * nodes_count_around) {}

std::size_t AnnulusMesh::flat_index(const GridIndex& at) const {
    if (at.layer >= layers_count_ || at.ring >= rings_count_ || at.index >= nodes_count_around_) {
        throw std::out_of_range("AnnulusMesh::node: grid index out of range");
    }
    return (at.layer * rings_count_ + at.ring) * nodes_count_around_ + at.index;
}

GridNode& AnnulusMesh::node(const GridIndex& at) {
    return nodes_[flat_index(at)];
}

const GridNode& AnnulusMesh::node(const GridIndex& at) const {
    return nodes_[flat_index(at)];
}

GridIndex AnnulusMesh::resolve(const GridIndex& at) const {
    GridIndex current = at;
    while (const auto& next = node(current).merged_into) {
        current = *next;
    }
    return current;
}

void AnnulusMesh::merge(const GridIndex& from, const GridIndex& into) {
    GridIndex source = resolve(from);
    GridIndex target = resolve(into);
    if (source == target) {
        throw std::logic_error("AnnulusMesh::merge: nodes are already the same");
    }
    GridNode& alias = node(source);
    alias.data = node(target).data;
    alias.merged_into = target;
}

std::size_t AnnulusMesh::new_nodes_count() const {
    return static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const GridNode& n) { return !n.id.has_value() && !n.merged_into.has_value(); }));
}

CellRecord AnnulusMesh::cell_record(const AnnulusCell& cell) const {
    CellRecord record;
    record.shape = cell.shape;
    record.radial_step = cell.radial_step;
    record.index_around = cell.index_around;
    record.linear_through_wall = cell.linear_through_wall;

    std::vector<GridIndex> seen;
    for (std::size_t c = 0; c < cell.corners.size(); ++c) {
        const GridIndex& corner = cell.corners[c];
        if (std::find(seen.begin(), seen.end(), corner) != seen.end()) {
            continue;
        }
        seen.push_back(corner);
        const GridNode& grid_node = node(corner);
        if (!grid_node.id) {
            throw std::logic_error("AnnulusMesh::cell_record: node has no id yet");
        }
        record.node_ids.push_back(*grid_node.id);
        record.corner_mappings.push_back(cell.mappings[c]);
    }
    return record;
}

AnnulusMesh::EmitResult AnnulusMesh::emit(MeshSink& sink) {
    EmitResult result;
    for (std::size_t ring = 0; ring < rings_count_; ++ring) {
        for (std::size_t layer = 0; layer < layers_count_; ++layer) {
            for (std::size_t index = 0; index < nodes_count_around_; ++index) {
                GridNode& grid_node = node(layer, ring, index);
                if (!grid_node.id && !grid_node.merged_into) {
                    grid_node.id = sink.add_node(grid_node.data);
                    ++result.nodes_created;
                }
            }
        }
    }
    for (const auto& cell : cells_) {
        sink.add_cell(cell_record(cell));
        ++result.cells_created;
    }
    return result;
}

}  // namespace ostiamesh
