#include "mesh_sink.hpp"

namespace ostiamesh {

const char* to_string(CellShape shape) {
    switch (shape) {
        case CellShape::Hexahedron: return "hexahedron";
        case CellShape::Wedge: return "wedge";
        case CellShape::Quadrilateral: return "quadrilateral";
        case CellShape::Triangle: return "triangle";
    }
    return "unknown";
}

InMemoryMeshSink::InMemoryMeshSink(NodeId first_node_id)
    : next_node_id_(first_node_id) {}

NodeId InMemoryMeshSink::add_node(const AnnulusNode& node) {
    NodeId id = next_node_id_++;
    nodes_.push_back({id, node});
    return id;
}

void InMemoryMeshSink::add_cell(const CellRecord& cell) {
    cells_.push_back(cell);
}

}  // namespace ostiamesh
