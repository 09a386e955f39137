#ifndef OSTIAMESH_SERIALIZATION_RING_JSON_HPP
#define OSTIAMESH_SERIALIZATION_RING_JSON_HPP

#include <nlohmann/json.hpp>
#include <annulus/derivative_map.hpp>
#include <annulus/ring.hpp>
#include <common/errors.hpp>
#include "config_json.hpp"
#include "surface_json.hpp"

namespace ostiamesh {

// DerivativeCombination serialization, as [c1, c2, c3]
inline void to_json(nlohmann::json& j, const DerivativeCombination& combination) {
    j = combination.coefficients();
}

inline void from_json(const nlohmann::json& j, DerivativeCombination& combination) {
    if (!j.is_array() || j.size() != 3) {
        throw PreconditionViolation("derivative combination must be an array of 3 coefficients");
    }
    combination = DerivativeCombination(j[0].get<int>(), j[1].get<int>(), j[2].get<int>());
}

// DerivativeMap serialization: up to 4 slots (d1, d2, d3, other side d1),
// each null or [c1, c2, c3]. The fourth slot is written only when present.
inline void to_json(nlohmann::json& j, const DerivativeMap& map) {
    j = nlohmann::json::array({optional_to_json(map.d1),
                               optional_to_json(map.d2),
                               optional_to_json(map.d3)});
    if (map.has_other_side_d1) {
        j.push_back(optional_to_json(map.other_side_d1));
    }
}

inline void from_json(const nlohmann::json& j, DerivativeMap& map) {
    if (!j.is_array() || j.size() > 4) {
        throw PreconditionViolation("derivative map must be an array of at most 4 slots");
    }
    auto slot = [&j](std::size_t i) -> std::optional<DerivativeCombination> {
        if (i >= j.size() || j[i].is_null()) {
            return std::nullopt;
        }
        return j[i].get<DerivativeCombination>();
    };
    map.d1 = slot(0);
    map.d2 = slot(1);
    map.d3 = slot(2);
    map.has_other_side_d1 = j.size() == 4;
    map.other_side_d1 = slot(3);
}

// RingNode serialization
inline void to_json(nlohmann::json& j, const RingNode& node) {
    j["x"] = node.x;
    j["d1"] = node.d1;
    j["d2"] = node.d2;
    if (node.d3) {
        j["d3"] = *node.d3;
    }
}

inline void from_json(const nlohmann::json& j, RingNode& node) {
    node.x = j.at("x").get<Vec3>();
    node.d1 = j.at("d1").get<Vec3>();
    node.d2 = j.at("d2").get<Vec3>();
    node.d3 = optional_from_json<Vec3>(j, "d3");
}

// RingLayer serialization
inline void to_json(nlohmann::json& j, const RingLayer& layer) {
    j["nodes"] = layer.nodes;
    if (!layer.derivative_maps.empty()) {
        j["derivative_maps"] = layer.derivative_maps;
    }
    if (layer.has_node_ids()) {
        j["node_ids"] = layer.node_ids;
    }
}

inline void from_json(const nlohmann::json& j, RingLayer& layer) {
    layer.nodes = j.at("nodes").get<std::vector<RingNode>>();
    layer.derivative_maps = j.value("derivative_maps", std::vector<DerivativeMap>{});
    layer.node_ids = j.value("node_ids", std::vector<NodeId>{});
}

// Ring serialization
inline void to_json(nlohmann::json& j, const Ring& ring) {
    j["layers"] = ring.layers;
    if (!ring.surface_proportions.empty()) {
        j["surface_proportions"] = ring.surface_proportions;
    }
}

inline void from_json(const nlohmann::json& j, Ring& ring) {
    ring.layers = j.at("layers").get<std::vector<RingLayer>>();
    ring.surface_proportions = j.value("surface_proportions", std::vector<SurfaceProportion>{});
}

}  // namespace ostiamesh

#endif // OSTIAMESH_SERIALIZATION_RING_JSON_HPP
