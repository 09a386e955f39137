#include "annulus_builder.hpp"
#include <curve/hermite.hpp>
#include <curve/sampling.hpp>
#include <curve/smoothing.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace ostiamesh {

namespace {

void check_inputs(const Ring& start, const Ring& end, const BridgeOptions& options,
                  const TrackSurface* surface) {
    if (options.radial_subdivisions < 1) {
        throw PreconditionViolation("build_annulus: radial_subdivisions must be at least 1, got " +
                                    std::to_string(options.radial_subdivisions));
    }
    if (options.sample_blend < 0.0 || options.sample_blend > 1.0) {
        throw PreconditionViolation("build_annulus: sample_blend must be in [0, 1]");
    }
    if ((options.max_start_thickness && *options.max_start_thickness < 0.0) ||
        (options.max_end_thickness && *options.max_end_thickness < 0.0)) {
        throw PreconditionViolation("build_annulus: maximum thickness must not be negative");
    }
    start.validate("build_annulus: start");
    end.validate("build_annulus: end");
    if (start.layers_count() != end.layers_count()) {
        throw ShapeMismatch("build_annulus: start has " + std::to_string(start.layers_count()) +
                            " layers, end has " + std::to_string(end.layers_count()));
    }
    if (start.nodes_count() != end.nodes_count()) {
        throw ShapeMismatch("build_annulus: start has " + std::to_string(start.nodes_count()) +
                            " nodes around, end has " + std::to_string(end.nodes_count()));
    }
    if (surface && (start.surface_proportions.empty() || end.surface_proportions.empty())) {
        throw PreconditionViolation("build_annulus: surface proportions required on both rings");
    }
}

MappedDerivatives ring_mapped_derivatives(const Ring& ring, std::size_t layer, std::size_t index) {
    const RingNode& node = ring.layers[layer].nodes[index];
    return mapped_derivatives(node.d1, node.d2, node.d3.value_or(Vec3{}),
                              ring.layers[layer].derivative_map(index));
}

double ring_thickness(const Ring& ring, std::size_t index, const std::optional<double>& max_thickness) {
    double thickness = ring.outer().nodes[index].x.distance_to(ring.inner().nodes[index].x);
    return max_thickness ? std::min(thickness, *max_thickness) : thickness;
}

// A single layer carries its wall thickness in d3; an end without d3 takes
// the other end's
double single_layer_thickness(const Ring& ring, const Ring& other, std::size_t index,
                              const std::optional<double>& max_thickness) {
    const auto& d3 = ring.outer().nodes[index].d3;
    const auto& other_d3 = other.outer().nodes[index].d3;
    double thickness = d3 ? d3->length() : (other_d3 ? other_d3->length() : 0.0);
    return max_thickness ? std::min(thickness, *max_thickness) : thickness;
}

}  // namespace

AnnulusMesh build_annulus(const Ring& start, const Ring& end,
                          const BridgeOptions& options,
                          const TrackSurface* surface) {
    auto log = logging::get_logger();
    check_inputs(start, end, options, surface);

    const std::size_t layers_count = start.layers_count();
    const std::size_t nodes_count = start.nodes_count();
    const std::size_t elements_radial = static_cast<std::size_t>(options.radial_subdivisions);
    const std::size_t rings_count = elements_radial + 1;
    const std::size_t outer = layers_count - 1;
    const bool two_layers = layers_count == 2;

    const bool start_linear = !start.has_d3() || options.force_start_linear_through_wall;
    const bool end_linear = !end.has_d3() || options.force_end_linear_through_wall;
    const bool mid_linear = (start_linear && end_linear) ||
                            ((start_linear || end_linear) && options.force_mid_linear_through_wall);
    auto row_linear = [&](std::size_t ring) {
        if (ring == 0) return start_linear;
        if (ring == elements_radial) return end_linear;
        return mid_linear;
    };

    log->debug("build_annulus: {} layers, {} nodes around, {} radial elements, linear through wall {}/{}/{}",
               layers_count, nodes_count, elements_radial, start_linear, mid_linear, end_linear);

    AnnulusMesh mesh(layers_count, rings_count, nodes_count);

    // Boundary rings are copied as given
    for (std::size_t l = 0; l < layers_count; ++l) {
        for (std::size_t i = 0; i < nodes_count; ++i) {
            const RingNode& a = start.layers[l].nodes[i];
            GridNode& first = mesh.node(l, 0, i);
            first.data = {a.x, a.d1, a.d2, a.d3};
            if (start.layers[l].has_node_ids()) {
                first.id = start.layers[l].node_ids[i];
            }
            const RingNode& b = end.layers[l].nodes[i];
            GridNode& last = mesh.node(l, elements_radial, i);
            last.data = {b.x, b.d1, b.d2, b.d3};
            if (end.layers[l].has_node_ids()) {
                last.id = end.layers[l].node_ids[i];
            }
        }
    }

    // Effective radial derivative, with boundary maps applied
    auto radial_derivative = [&](std::size_t l, std::size_t ring, std::size_t i) {
        if (ring == 0) return ring_mapped_derivatives(start, l, i).d2;
        if (ring == elements_radial) return ring_mapped_derivatives(end, l, i).d2;
        return mesh.node(l, ring, i).data.d2;
    };

    if (elements_radial > 1) {
        // thickness[ring][index]
        std::vector<std::vector<double>> thickness(rings_count, std::vector<double>(nodes_count, 0.0));
        for (std::size_t i = 0; i < nodes_count; ++i) {
            if (two_layers) {
                thickness.front()[i] = ring_thickness(start, i, options.max_start_thickness);
                thickness.back()[i] = ring_thickness(end, i, options.max_end_thickness);
            } else {
                thickness.front()[i] = single_layer_thickness(start, end, i, options.max_start_thickness);
                thickness.back()[i] = single_layer_thickness(end, start, i, options.max_end_thickness);
            }
        }

        // Sample the outer layer radially between matching boundary nodes
        for (std::size_t i = 0; i < nodes_count; ++i) {
            const Vec3& ax = start.outer().nodes[i].x;
            const Vec3& bx = end.outer().nodes[i].x;
            MappedDerivatives ad = ring_mapped_derivatives(start, outer, i);
            MappedDerivatives bd = ring_mapped_derivatives(end, outer, i);

            // Scaling end derivatives to arc length gives even curvature along the curve
            double a_mag = ad.d2.length();
            double b_mag = bd.d2.length();
            double blend = options.sample_blend;
            Vec3 ad2_scaled = ad.d2.with_length(0.5 * ((1.0 + blend) * a_mag + (1.0 - blend) * b_mag));
            Vec3 bd2_scaled = bd.d2.with_length(0.5 * ((1.0 + blend) * b_mag + (1.0 - blend) * a_mag));
            double scaling = compute_cubic_hermite_derivative_scaling(ax, ad2_scaled, bx, bd2_scaled);
            ad2_scaled *= scaling;
            bd2_scaled *= scaling;

            std::vector<Vec3> mx;
            std::vector<Vec3> md1;
            std::vector<Vec3> md2;
            std::vector<double> thi;
            if (surface) {
                SurfaceCurvePoints points = surface->create_hermite_curve_points(
                    start.surface_proportions[i], end.surface_proportions[i], elements_radial,
                    ad2_scaled / static_cast<double>(elements_radial),
                    bd2_scaled / static_cast<double>(elements_radial));
                points = surface->resample_hermite_curve_points_smooth(points, a_mag, b_mag);
                mx = points.positions;
                md2 = points.d1;
                md1 = points.d2;

                // Thickness varies with arc length along the radial curve
                std::vector<double> arc_to_point{0.0};
                for (std::size_t r = 0; r < elements_radial; ++r) {
                    arc_to_point.push_back(arc_to_point.back() +
                        cubic_hermite_arc_length(mx[r], md2[r], mx[r + 1], md2[r + 1]));
                }
                double total = arc_to_point.back();
                for (std::size_t r = 0; r < rings_count; ++r) {
                    double xi = (total > 0.0) ? arc_to_point[r] / total
                                              : static_cast<double>(r) / elements_radial;
                    thi.push_back(thickness.back()[i] * xi + thickness.front()[i] * (1.0 - xi));
                }
            } else {
                CurveSamples samples = sample_cubic_hermite_curves_smooth(
                    {ax, bx}, {ad2_scaled, bd2_scaled}, elements_radial, a_mag, b_mag);
                mx = samples.positions;
                md2 = samples.derivatives;
                md1 = interpolate_sample_linear(std::vector<Vec3>{ad.d1, bd.d1}, samples);
                thi = interpolate_sample_linear(
                    std::vector<double>{thickness.front()[i], thickness.back()[i]}, samples);
            }

            for (std::size_t r = 1; r < elements_radial; ++r) {
                mesh.node(outer, r, i).data = {mx[r], md1[r], md2[r], std::nullopt};
                thickness[r][i] = thi[r];
            }
        }

        LoopSmoothingConfig loop_config;
        loop_config.magnitude_scaling_mode = DerivativeScalingMode::HarmonicMean;

        for (std::size_t r = 1; r < elements_radial; ++r) {
            // Smooth d1 around the outer loop
            std::vector<Vec3> ox(nodes_count);
            std::vector<Vec3> od1(nodes_count);
            for (std::size_t i = 0; i < nodes_count; ++i) {
                ox[i] = mesh.node(outer, r, i).data.x;
                od1[i] = mesh.node(outer, r, i).data.d1;
            }
            od1 = smooth_cubic_hermite_derivatives_loop(ox, od1, loop_config);
            for (std::size_t i = 0; i < nodes_count; ++i) {
                mesh.node(outer, r, i).data.d1 = od1[i];
            }

            std::vector<Vec3> normals(nodes_count);
            for (std::size_t i = 0; i < nodes_count; ++i) {
                const AnnulusNode& o = mesh.node(outer, r, i).data;
                normals[i] = o.d1.cross(o.d2).normalized();
                if (normals[i].is_zero()) {
                    throw DegenerateSurface("build_annulus: zero normal at ring " + std::to_string(r) +
                                            " index " + std::to_string(i));
                }
            }

            if (!two_layers) {
                if (!mid_linear) {
                    for (std::size_t i = 0; i < nodes_count; ++i) {
                        mesh.node(outer, r, i).data.d3 = normals[i] * thickness[r][i];
                    }
                }
                continue;
            }

            // Inner layer offset along the normal, derivatives scaled by curvature
            std::vector<Vec3> ix(nodes_count);
            std::vector<Vec3> id1(nodes_count);
            for (std::size_t i = 0; i < nodes_count; ++i) {
                std::size_t im = (i + nodes_count - 1) % nodes_count;
                std::size_t ip = (i + 1) % nodes_count;
                const AnnulusNode& o = mesh.node(outer, r, i).data;
                const AnnulusNode& om = mesh.node(outer, r, im).data;
                const AnnulusNode& op = mesh.node(outer, r, ip).data;
                const Vec3& normal = normals[i];
                double t = thickness[r][i];

                double curvature_around = 0.5 * (
                    cubic_hermite_curvature(om.x, om.d1, o.x, o.d1, normal, 1.0) +
                    cubic_hermite_curvature(o.x, o.d1, op.x, op.d1, normal, 0.0));

                const Vec3& xm = mesh.node(outer, r - 1, i).data.x;
                const Vec3& xp = mesh.node(outer, r + 1, i).data.x;
                Vec3 d2m = radial_derivative(outer, r - 1, i);
                Vec3 d2p = radial_derivative(outer, r + 1, i);
                double curvature_radial = 0.5 * (
                    cubic_hermite_curvature(xm, d2m, o.x, o.d2, normal, 1.0) +
                    cubic_hermite_curvature(o.x, o.d2, xp, d2p, normal, 0.0));

                AnnulusNode& inner = mesh.node(0, r, i).data;
                inner.x = o.x - normal * t;
                // Around the loop the factor keeps its sign, so d1 reverses where
                // the wall is thicker than the radius of curvature; radially the
                // direction is kept even where the wall folds over
                inner.d1 = o.d1 * (1.0 + curvature_around * t);
                inner.d2 = o.d2 * std::abs(1.0 + curvature_radial * t);
                if (!mid_linear) {
                    inner.d3 = normal * t;
                    mesh.node(outer, r, i).data.d3 = normal * t;
                }
                ix[i] = inner.x;
                id1[i] = inner.d1;
            }

            id1 = smooth_cubic_hermite_derivatives_loop(ix, id1, loop_config);
            for (std::size_t i = 0; i < nodes_count; ++i) {
                mesh.node(0, r, i).data.d1 = id1[i];
            }
        }

        // Smooth inner d2 along each radial line, ends fixed
        if (two_layers) {
            LineSmoothingConfig line_config;
            line_config.fix_all_directions = true;
            line_config.fix_start_derivative = true;
            line_config.fix_end_derivative = true;
            line_config.magnitude_scaling_mode = DerivativeScalingMode::HarmonicMean;
            for (std::size_t i = 0; i < nodes_count; ++i) {
                std::vector<Vec3> mx(rings_count);
                std::vector<Vec3> md2(rings_count);
                for (std::size_t r = 0; r < rings_count; ++r) {
                    mx[r] = mesh.node(0, r, i).data.x;
                    md2[r] = radial_derivative(0, r, i);
                }
                md2 = smooth_cubic_hermite_derivatives_line(mx, md2, line_config);
                for (std::size_t r = 1; r < elements_radial; ++r) {
                    mesh.node(0, r, i).data.d2 = md2[r];
                }
            }
        }
    }

    // A pinch at index i of a boundary ring closes the edge from i to i + 1
    // on that ring and on every second ring from it, so each radial step at i
    // has exactly one closed edge and becomes a wedge. collapsed[ring][i]
    std::vector<std::vector<bool>> collapsed(rings_count, std::vector<bool>(nodes_count, false));
    std::size_t wedge_columns = 0;
    for (std::size_t i = 0; i < nodes_count; ++i) {
        bool at_start = start.collapsed_at(i);
        bool at_end = end.collapsed_at(i);
        if (at_start && at_end && elements_radial % 2 == 1) {
            throw PreconditionViolation("build_annulus: index " + std::to_string(i) +
                                        " collapses on both rings across an odd number of radial elements");
        }
        for (std::size_t ring = 0; ring < rings_count; ++ring) {
            collapsed[ring][i] = (at_start && ring % 2 == 0) ||
                                 (at_end && (elements_radial - ring) % 2 == 0);
        }
        if (at_start || at_end) {
            ++wedge_columns;
        }
    }

    // Node i + 1 becomes an alias of node i on every closed edge so that
    // neighbouring cells share it. Interior pinches sit midway between the
    // two sampled nodes.
    for (std::size_t ring = 0; ring < rings_count; ++ring) {
        bool interior = ring != 0 && ring != elements_radial;
        for (std::size_t i = 0; i < nodes_count; ++i) {
            if (!collapsed[ring][i]) {
                continue;
            }
            std::size_t ip = (i + 1) % nodes_count;
            for (std::size_t l = 0; l < layers_count; ++l) {
                GridIndex keep = mesh.resolve({l, ring, i});
                GridIndex gone = mesh.resolve({l, ring, ip});
                if (keep == gone) {
                    throw PreconditionViolation("build_annulus: ring " + std::to_string(ring) +
                                                " collapses to a single node");
                }
                if (interior) {
                    AnnulusNode& a = mesh.node(keep).data;
                    const AnnulusNode& b = mesh.node(gone).data;
                    a.x = (a.x + b.x) * 0.5;
                    a.d2 = (a.d2 + b.d2) * 0.5;
                    if (a.d3 && b.d3) {
                        a.d3 = (*a.d3 + *b.d3) * 0.5;
                    }
                }
                mesh.merge(gone, keep);
            }
        }
    }

    // Cells, one per radial step and index around
    for (std::size_t r = 0; r < elements_radial; ++r) {
        for (std::size_t i = 0; i < nodes_count; ++i) {
            std::size_t ip = (i + 1) % nodes_count;
            bool wedge = collapsed[r][i] || collapsed[r + 1][i];

            AnnulusCell cell;
            cell.radial_step = static_cast<int>(r);
            cell.index_around = static_cast<int>(i);
            cell.linear_through_wall = row_linear(r) && row_linear(r + 1);
            if (two_layers) {
                cell.shape = wedge ? CellShape::Wedge : CellShape::Hexahedron;
            } else {
                cell.shape = wedge ? CellShape::Triangle : CellShape::Quadrilateral;
            }

            for (std::size_t l = 0; l < layers_count; ++l) {
                for (std::size_t ring : {r, r + 1}) {
                    for (std::size_t around : {i, ip}) {
                        bool lower_corner = (around == i);
                        GridIndex corner = mesh.resolve({l, ring, around});
                        cell.corners.push_back(corner);

                        CornerMapping mapping;
                        if (ring == 0) {
                            mapping = corner_mapping(start.layers[l].derivative_map(corner.index), lower_corner);
                        } else if (ring == elements_radial) {
                            mapping = corner_mapping(end.layers[l].derivative_map(corner.index), lower_corner);
                        } else if (collapsed[ring][i]) {
                            // Closed edge has no length around
                            mapping.d1 = DerivativeCombination(0, 0, 0);
                        }
                        cell.mappings.push_back(mapping);
                    }
                }
            }
            mesh.add_cell(std::move(cell));
        }
    }

    if (wedge_columns > 0) {
        log->debug("build_annulus: {} pinched indices around, wedges in every radial step", wedge_columns);
    }
    log->debug("build_annulus: {} cells, {} new nodes", mesh.cells().size(), mesh.new_nodes_count());
    return mesh;
}

}  // namespace ostiamesh
