#ifndef OSTIAMESH_SERIALIZATION_SURFACE_JSON_HPP
#define OSTIAMESH_SERIALIZATION_SURFACE_JSON_HPP

#include <nlohmann/json.hpp>
#include <surface/track_surface.hpp>
#include <surface/surface_tracker.hpp>
#include "config_json.hpp"
#include <vector>

namespace ostiamesh {

NLOHMANN_JSON_SERIALIZE_ENUM(TrackStatus, {
    {TrackStatus::Completed, "completed"},
    {TrackStatus::BoundaryReached, "boundary_reached"},
    {TrackStatus::TrackingDegenerate, "tracking_degenerate"},
    {TrackStatus::TrackingFailed, "tracking_failed"},
})

// SurfacePosition serialization
inline void to_json(nlohmann::json& j, const SurfacePosition& position) {
    j = {
        {"element_u", position.element_u},
        {"element_v", position.element_v},
        {"xi_u", position.xi_u},
        {"xi_v", position.xi_v}
    };
}

inline void from_json(const nlohmann::json& j, SurfacePosition& position) {
    position.element_u = j.value("element_u", 0);
    position.element_v = j.value("element_v", 0);
    position.xi_u = j.value("xi_u", 0.0);
    position.xi_v = j.value("xi_v", 0.0);
}

// SurfaceProportion serialization, as [u, v]
inline void to_json(nlohmann::json& j, const SurfaceProportion& proportion) {
    j = nlohmann::json::array({proportion.u, proportion.v});
}

inline void from_json(const nlohmann::json& j, SurfaceProportion& proportion) {
    proportion.u = j.at(0).get<double>();
    proportion.v = j.at(1).get<double>();
}

// TrackSurface serialization
inline nlohmann::json track_surface_to_json(const TrackSurface& surface) {
    return {
        {"elements_count_u", surface.elements_count_u()},
        {"elements_count_v", surface.elements_count_v()},
        {"positions", surface.positions()},
        {"d_u", surface.d_u()},
        {"d_v", surface.d_v()}
    };
}

// Throws PreconditionViolation when the arrays do not fit the element counts
inline TrackSurface track_surface_from_json(const nlohmann::json& j) {
    return TrackSurface(j.at("elements_count_u").get<int>(),
                        j.at("elements_count_v").get<int>(),
                        j.at("positions").get<std::vector<Vec3>>(),
                        j.at("d_u").get<std::vector<Vec3>>(),
                        j.at("d_v").get<std::vector<Vec3>>());
}

// TrackResult serialization (output only)
inline void to_json(nlohmann::json& j, const TrackResult& result) {
    j = {
        {"position", result.position},
        {"status", result.status},
        {"distance", result.distance},
        {"steps", result.steps}
    };
}

}  // namespace ostiamesh

#endif // OSTIAMESH_SERIALIZATION_SURFACE_JSON_HPP
