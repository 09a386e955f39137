#ifndef OSTIAMESH_SERIALIZATION_MESH_JSON_HPP
#define OSTIAMESH_SERIALIZATION_MESH_JSON_HPP

#include <nlohmann/json.hpp>
#include <annulus/mesh_sink.hpp>
#include "config_json.hpp"
#include "ring_json.hpp"

namespace ostiamesh {

NLOHMANN_JSON_SERIALIZE_ENUM(CellShape, {
    {CellShape::Hexahedron, "hexahedron"},
    {CellShape::Wedge, "wedge"},
    {CellShape::Quadrilateral, "quadrilateral"},
    {CellShape::Triangle, "triangle"},
})

// CornerMapping serialization, as 3 slots null or [c1, c2, c3]
inline void to_json(nlohmann::json& j, const CornerMapping& mapping) {
    j = nlohmann::json::array({optional_to_json(mapping.d1),
                               optional_to_json(mapping.d2),
                               optional_to_json(mapping.d3)});
}

// AnnulusNode serialization
inline void to_json(nlohmann::json& j, const AnnulusNode& node) {
    j["x"] = node.x;
    j["d1"] = node.d1;
    j["d2"] = node.d2;
    if (node.d3) {
        j["d3"] = *node.d3;
    }
}

// CellRecord serialization. Corner mappings are listed only when one of
// them differs from the stored derivatives.
inline void to_json(nlohmann::json& j, const CellRecord& cell) {
    j["shape"] = cell.shape;
    j["radial_step"] = cell.radial_step;
    j["index_around"] = cell.index_around;
    j["linear_through_wall"] = cell.linear_through_wall;
    j["node_ids"] = cell.node_ids;
    bool mapped = false;
    for (const auto& mapping : cell.corner_mappings) {
        mapped = mapped || !mapping.is_identity();
    }
    if (mapped) {
        j["corner_mappings"] = cell.corner_mappings;
    }
}

inline nlohmann::json mesh_sink_to_json(const InMemoryMeshSink& sink) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& stored : sink.nodes()) {
        nlohmann::json node = stored.node;
        node["id"] = stored.id;
        nodes.push_back(node);
    }
    return {
        {"nodes", nodes},
        {"cells", sink.cells()}
    };
}

}  // namespace ostiamesh

#endif // OSTIAMESH_SERIALIZATION_MESH_JSON_HPP
