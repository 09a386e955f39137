#ifndef OSTIAMESH_CURVE_SMOOTHING_HPP
#define OSTIAMESH_CURVE_SMOOTHING_HPP

#include <math/vec3.hpp>
#include <vector>

namespace ostiamesh {

// How a node derivative magnitude is formed from the arc lengths of the
// segments on either side of it
enum class DerivativeScalingMode {
    ArithmeticMean,  // Half the sum of the two arc lengths
    HarmonicMean     // Reciprocal of the mean of reciprocals; favours the shorter side
};

struct LineSmoothingConfig {
    bool fix_all_directions = false;    // Smooth magnitudes only
    bool fix_start_derivative = false;  // Keep first derivative unchanged
    bool fix_end_derivative = false;    // Keep last derivative unchanged
    bool fix_start_direction = false;   // Keep direction of first derivative
    bool fix_end_direction = false;     // Keep direction of last derivative
    DerivativeScalingMode magnitude_scaling_mode = DerivativeScalingMode::ArithmeticMean;
    int max_iterations = 100;
    double tolerance = 1e-6;            // Relative to mean arc length
};

struct LoopSmoothingConfig {
    bool fix_all_directions = false;
    DerivativeScalingMode magnitude_scaling_mode = DerivativeScalingMode::ArithmeticMean;
    int max_iterations = 100;
    double tolerance = 1e-6;
};

// Return derivatives for the open curve through nx that vary smoothly and
// approximate arc length. Positions are never changed. Interior directions
// become the arc-length weighted mean of the chords either side; free ends
// follow the quadratic through the neighbouring node.
std::vector<Vec3> smooth_cubic_hermite_derivatives_line(const std::vector<Vec3>& nx,
                                                        const std::vector<Vec3>& nd,
                                                        const LineSmoothingConfig& config = {});

// As above for a closed loop where the first point follows the last.
std::vector<Vec3> smooth_cubic_hermite_derivatives_loop(const std::vector<Vec3>& nx,
                                                        const std::vector<Vec3>& nd,
                                                        const LoopSmoothingConfig& config = {});

}  // namespace ostiamesh

#endif // OSTIAMESH_CURVE_SMOOTHING_HPP
