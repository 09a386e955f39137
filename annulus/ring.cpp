#include "ring.hpp"
#include <common/errors.hpp>

namespace ostiamesh {

const DerivativeMap& RingLayer::derivative_map(std::size_t index) const {
    static const DerivativeMap identity;
    return derivative_maps.empty() ? identity : derivative_maps.at(index);
}

bool Ring::has_d3() const {
    for (const auto& layer : layers) {
        for (const auto& node : layer.nodes) {
            if (!node.d3) {
                return false;
            }
        }
    }
    return !layers.empty();
}

bool Ring::collapsed_at(std::size_t index) const {
    for (const auto& layer : layers) {
        if (layer.derivative_map(index).collapsed()) {
            return true;
        }
    }
    return false;
}

void Ring::validate(const std::string& name) const {
    if (layers.empty() || layers.size() > 2) {
        throw PreconditionViolation(name + ": ring must have 1 or 2 layers, has " +
                                    std::to_string(layers.size()));
    }
    std::size_t count = nodes_count();
    if (count < 2) {
        throw PreconditionViolation(name + ": ring needs at least 2 nodes around");
    }

    std::size_t with_d3 = 0;
    for (std::size_t l = 0; l < layers.size(); ++l) {
        const RingLayer& layer = layers[l];
        std::string where = name + " layer " + std::to_string(l);
        if (layer.nodes.size() != count) {
            throw ShapeMismatch(where + ": has " + std::to_string(layer.nodes.size()) +
                                " nodes, expected " + std::to_string(count));
        }
        if (!layer.derivative_maps.empty() && layer.derivative_maps.size() != count) {
            throw PreconditionViolation(where + ": derivative maps must be one per node");
        }
        if (!layer.node_ids.empty() && layer.node_ids.size() != count) {
            throw PreconditionViolation(where + ": node ids must be one per node");
        }
        for (const auto& node : layer.nodes) {
            if (node.d3) {
                ++with_d3;
            }
        }
    }
    if (with_d3 != 0 && with_d3 != count * layers.size()) {
        throw PreconditionViolation(name + ": d3 must be given on all nodes or none");
    }
    if (!surface_proportions.empty() && surface_proportions.size() != count) {
        throw PreconditionViolation(name + ": surface proportions must be one per node");
    }
}

}  // namespace ostiamesh
