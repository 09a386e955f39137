#ifndef OSTIAMESH_SERIALIZATION_CONFIG_JSON_HPP
#define OSTIAMESH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <curve/smoothing.hpp>
#include <surface/surface_tracker.hpp>
#include <annulus/annulus_builder.hpp>
#include <optional>
#include <string>

namespace ostiamesh {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.at(2).get<double>();
}

// Optional values are written as null when absent
template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optional_from_json(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

NLOHMANN_JSON_SERIALIZE_ENUM(DerivativeScalingMode, {
    {DerivativeScalingMode::ArithmeticMean, "arithmetic_mean"},
    {DerivativeScalingMode::HarmonicMean, "harmonic_mean"},
})

// TrackerConfig serialization
inline void to_json(nlohmann::json& j, const TrackerConfig& config) {
    j = {
        {"max_xi_step", config.max_xi_step},
        {"distance_limit_factor", config.distance_limit_factor},
        {"max_steps", config.max_steps}
    };
}

inline void from_json(const nlohmann::json& j, TrackerConfig& config) {
    config.max_xi_step = j.value("max_xi_step", 0.02);
    config.distance_limit_factor = j.value("distance_limit_factor", 0.9999);
    config.max_steps = j.value("max_steps", 100000);
}

// LineSmoothingConfig serialization
inline void to_json(nlohmann::json& j, const LineSmoothingConfig& config) {
    j = {
        {"fix_all_directions", config.fix_all_directions},
        {"fix_start_derivative", config.fix_start_derivative},
        {"fix_end_derivative", config.fix_end_derivative},
        {"fix_start_direction", config.fix_start_direction},
        {"fix_end_direction", config.fix_end_direction},
        {"magnitude_scaling_mode", config.magnitude_scaling_mode},
        {"max_iterations", config.max_iterations},
        {"tolerance", config.tolerance}
    };
}

inline void from_json(const nlohmann::json& j, LineSmoothingConfig& config) {
    config.fix_all_directions = j.value("fix_all_directions", false);
    config.fix_start_derivative = j.value("fix_start_derivative", false);
    config.fix_end_derivative = j.value("fix_end_derivative", false);
    config.fix_start_direction = j.value("fix_start_direction", false);
    config.fix_end_direction = j.value("fix_end_direction", false);
    config.magnitude_scaling_mode = j.value("magnitude_scaling_mode", DerivativeScalingMode::ArithmeticMean);
    config.max_iterations = j.value("max_iterations", 100);
    config.tolerance = j.value("tolerance", 1e-6);
}

// BridgeOptions serialization
inline void to_json(nlohmann::json& j, const BridgeOptions& options) {
    j = {
        {"radial_subdivisions", options.radial_subdivisions},
        {"max_start_thickness", optional_to_json(options.max_start_thickness)},
        {"max_end_thickness", optional_to_json(options.max_end_thickness)},
        {"force_start_linear_through_wall", options.force_start_linear_through_wall},
        {"force_mid_linear_through_wall", options.force_mid_linear_through_wall},
        {"force_end_linear_through_wall", options.force_end_linear_through_wall},
        {"sample_blend", options.sample_blend}
    };
}

inline void from_json(const nlohmann::json& j, BridgeOptions& options) {
    options.radial_subdivisions = j.value("radial_subdivisions", 1);
    options.max_start_thickness = optional_from_json<double>(j, "max_start_thickness");
    options.max_end_thickness = optional_from_json<double>(j, "max_end_thickness");
    options.force_start_linear_through_wall = j.value("force_start_linear_through_wall", false);
    options.force_mid_linear_through_wall = j.value("force_mid_linear_through_wall", false);
    options.force_end_linear_through_wall = j.value("force_end_linear_through_wall", false);
    options.sample_blend = j.value("sample_blend", 0.0);
}

}  // namespace ostiamesh

#endif // OSTIAMESH_SERIALIZATION_CONFIG_JSON_HPP
