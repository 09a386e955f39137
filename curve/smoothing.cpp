#include "smoothing.hpp"
#include "hermite.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <numeric>

namespace ostiamesh {

namespace {

double mean_magnitude(double arc_length_m, double arc_length_p, DerivativeScalingMode mode) {
    if (mode == DerivativeScalingMode::ArithmeticMean) {
        return 0.5 * (arc_length_m + arc_length_p);
    }
    // 2/(1/a + 1/b), zero when either side has zero length
    double sum = arc_length_m + arc_length_p;
    if (sum <= 0.0) {
        return 0.0;
    }
    return 2.0 * arc_length_m * arc_length_p / sum;
}

// Direction at node n from the chords to its neighbours, each weighted by
// the fraction of arc length towards the other side
Vec3 mean_chord_direction(const Vec3& xm, const Vec3& x, const Vec3& xp,
                          double arc_length_m, double arc_length_p) {
    double sum = arc_length_m + arc_length_p;
    double wm = (sum > 0.0) ? arc_length_p / sum : 0.5;
    double wp = (sum > 0.0) ? arc_length_m / sum : 0.5;
    return (x - xm) * wm + (xp - x) * wp;
}

bool converged(const std::vector<Vec3>& current, const std::vector<Vec3>& last,
               const std::vector<double>& arc_lengths, double tolerance) {
    double mean_arc_length = std::accumulate(arc_lengths.begin(), arc_lengths.end(), 0.0) /
                             static_cast<double>(arc_lengths.size());
    double dtol = tolerance * mean_arc_length;
    for (std::size_t n = 0; n < current.size(); ++n) {
        for (std::size_t c = 0; c < 3; ++c) {
            if (std::abs(current[n][c] - last[n][c]) > dtol) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace

std::vector<Vec3> smooth_cubic_hermite_derivatives_line(const std::vector<Vec3>& nx,
                                                        const std::vector<Vec3>& nd,
                                                        const LineSmoothingConfig& config) {
    std::size_t nodes_count = nx.size();
    if (nodes_count < 2) {
        throw PreconditionViolation("smooth_cubic_hermite_derivatives_line: too few nodes");
    }
    if (nd.size() != nodes_count) {
        throw PreconditionViolation("smooth_cubic_hermite_derivatives_line: mismatched number of derivatives");
    }
    std::size_t elements_count = nodes_count - 1;

    // A single element with free ends gets equal end magnitudes
    bool equal_derivatives = (elements_count == 1) &&
                             !(config.fix_start_derivative || config.fix_end_derivative);

    std::vector<Vec3> md = nd;
    std::vector<double> arc_lengths(elements_count);
    for (int iter = 0; iter < config.max_iterations; ++iter) {
        std::vector<Vec3> last = md;
        for (std::size_t e = 0; e < elements_count; ++e) {
            arc_lengths[e] = cubic_hermite_arc_length(nx[e], last[e], nx[e + 1], last[e + 1]);
        }

        // Start
        if (!config.fix_start_derivative) {
            if (config.fix_all_directions || config.fix_start_direction) {
                md[0] = last[0].with_length(2.0 * arc_lengths[0] - last[1].length());
            } else {
                md[0] = interpolate_lagrange_hermite_derivative(nx[0], nx[1], last[1], 0.0);
            }
        }

        // Middle
        for (std::size_t n = 1; n + 1 < nodes_count; ++n) {
            if (!config.fix_all_directions) {
                md[n] = mean_chord_direction(nx[n - 1], nx[n], nx[n + 1],
                                             arc_lengths[n - 1], arc_lengths[n]);
            }
            md[n] = md[n].with_length(mean_magnitude(arc_lengths[n - 1], arc_lengths[n],
                                                     config.magnitude_scaling_mode));
        }

        // End
        if (!config.fix_end_derivative) {
            if (config.fix_all_directions || config.fix_end_direction) {
                md[nodes_count - 1] = last[nodes_count - 1].with_length(
                    2.0 * arc_lengths[elements_count - 1] - last[nodes_count - 2].length());
            } else {
                md[nodes_count - 1] = interpolate_hermite_lagrange_derivative(
                    nx[nodes_count - 2], last[nodes_count - 2], nx[nodes_count - 1], 1.0);
            }
        }

        if (equal_derivatives) {
            double magnitude = cubic_hermite_arc_length(nx[0], md[0], nx[1], md[1]);
            md[0] = md[0].with_length(magnitude);
            md[1] = md[1].with_length(magnitude);
        }

        if (converged(md, last, arc_lengths, config.tolerance)) {
            return md;
        }
    }

    logging::get_logger()->warn(
        "smooth_cubic_hermite_derivatives_line: max iterations ({}) reached for {} nodes",
        config.max_iterations, nodes_count);
    return md;
}

std::vector<Vec3> smooth_cubic_hermite_derivatives_loop(const std::vector<Vec3>& nx,
                                                        const std::vector<Vec3>& nd,
                                                        const LoopSmoothingConfig& config) {
    std::size_t nodes_count = nx.size();
    if (nodes_count < 2) {
        throw PreconditionViolation("smooth_cubic_hermite_derivatives_loop: too few nodes");
    }
    if (nd.size() != nodes_count) {
        throw PreconditionViolation("smooth_cubic_hermite_derivatives_loop: mismatched number of derivatives");
    }

    std::vector<Vec3> md = nd;
    std::vector<double> arc_lengths(nodes_count);
    for (int iter = 0; iter < config.max_iterations; ++iter) {
        std::vector<Vec3> last = md;
        for (std::size_t e = 0; e < nodes_count; ++e) {
            std::size_t next = (e + 1) % nodes_count;
            arc_lengths[e] = cubic_hermite_arc_length(nx[e], last[e], nx[next], last[next]);
        }

        for (std::size_t n = 0; n < nodes_count; ++n) {
            std::size_t prev = (n + nodes_count - 1) % nodes_count;
            std::size_t next = (n + 1) % nodes_count;
            if (!config.fix_all_directions) {
                md[n] = mean_chord_direction(nx[prev], nx[n], nx[next],
                                             arc_lengths[prev], arc_lengths[n]);
            }
            md[n] = md[n].with_length(mean_magnitude(arc_lengths[prev], arc_lengths[n],
                                                     config.magnitude_scaling_mode));
        }

        if (converged(md, last, arc_lengths, config.tolerance)) {
            return md;
        }
    }

    logging::get_logger()->warn(
        "smooth_cubic_hermite_derivatives_loop: max iterations ({}) reached for {} nodes",
        config.max_iterations, nodes_count);
    return md;
}

}  // namespace ostiamesh
