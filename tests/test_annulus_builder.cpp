#include <gtest/gtest.h>
#include <annulus/annulus_builder.hpp>
#include <annulus/mesh_sink.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

using namespace ostiamesh;

namespace {

// Mark node index on every layer of ring as a pinch
void collapse_at(Ring& ring, std::size_t index) {
    for (auto& layer : ring.layers) {
        layer.derivative_maps.resize(layer.nodes.size());
        DerivativeMap& map = layer.derivative_maps[index];
        map.d1 = DerivativeCombination(0, 0, 0);
        map.has_other_side_d1 = true;
        map.other_side_d1 = DerivativeCombination(0, 0, 0);
    }
}

double radius(const Vec3& x) {
    return std::sqrt(x.x * x.x + x.y * x.y);
}

std::size_t shared_ids(const CellRecord& a, const CellRecord& b) {
    std::set<NodeId> ids(a.node_ids.begin(), a.node_ids.end());
    return static_cast<std::size_t>(std::count_if(b.node_ids.begin(), b.node_ids.end(),
        [&](NodeId id) { return ids.count(id) > 0; }));
}

}  // namespace

TEST(AnnulusBuilderTest, SingleStepReusesBoundaryIds) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 1.0);
    NodeId next = test::assign_node_ids(start, 1);
    test::assign_node_ids(end, next);

    AnnulusMesh mesh = build_annulus(start, end, BridgeOptions{});
    EXPECT_EQ(mesh.rings_count(), 2u);
    EXPECT_EQ(mesh.new_nodes_count(), 0u);
    ASSERT_EQ(mesh.cells().size(), 8u);

    InMemoryMeshSink sink(100);
    AnnulusMesh::EmitResult emitted = mesh.emit(sink);
    EXPECT_EQ(emitted.nodes_created, 0u);
    EXPECT_EQ(emitted.cells_created, 8u);
    ASSERT_EQ(sink.cells().size(), 8u);

    const CellRecord& cell = sink.cells()[0];
    EXPECT_EQ(cell.shape, CellShape::Hexahedron);
    EXPECT_FALSE(cell.linear_through_wall);
    // Layer slowest, then radial, then around
    std::vector<NodeId> expected{1, 2, 17, 18, 9, 10, 25, 26};
    EXPECT_EQ(cell.node_ids, expected);

    // Last cell wraps around to index 0
    const CellRecord& last = sink.cells()[7];
    EXPECT_EQ(last.index_around, 7);
    EXPECT_EQ(last.node_ids[0], 8u);
    EXPECT_EQ(last.node_ids[1], 1u);
}

TEST(AnnulusBuilderTest, InteriorRingsAndCells) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 3.0);
    NodeId next = test::assign_node_ids(start, 1);
    test::assign_node_ids(end, next);

    BridgeOptions options;
    options.radial_subdivisions = 3;
    AnnulusMesh mesh = build_annulus(start, end, options);
    EXPECT_EQ(mesh.new_nodes_count(), 32u);
    ASSERT_EQ(mesh.cells().size(), 24u);
    for (const auto& cell : mesh.cells()) {
        EXPECT_EQ(cell.shape, CellShape::Hexahedron);
    }

    InMemoryMeshSink sink(33);
    AnnulusMesh::EmitResult emitted = mesh.emit(sink);
    EXPECT_EQ(emitted.nodes_created, 32u);
    EXPECT_EQ(sink.nodes().front().id, 33u);
    EXPECT_EQ(sink.nodes().back().id, 64u);
    std::set<NodeId> used;
    for (const auto& cell : sink.cells()) {
        ASSERT_EQ(cell.node_ids.size(), 8u);
        used.insert(cell.node_ids.begin(), cell.node_ids.end());
    }
    EXPECT_EQ(used.size(), 64u);
}

TEST(AnnulusBuilderTest, CoaxialTube) {
    Ring start = test::make_tube_ring(12, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(12, 1.0, 0.9, 5.0);
    BridgeOptions options;
    options.radial_subdivisions = 5;
    AnnulusMesh mesh = build_annulus(start, end, options);

    for (std::size_t r = 1; r < 5; ++r) {
        double z_sum = 0.0;
        for (std::size_t i = 0; i < 12; ++i) {
            const AnnulusNode& inner = mesh.node(0, r, i).data;
            const AnnulusNode& outer = mesh.node(1, r, i).data;
            z_sum += inner.x.z + outer.x.z;
            EXPECT_NEAR(radius(outer.x), 1.0, 1e-3);
            EXPECT_NEAR(radius(inner.x), 0.9, 1e-3);
            ASSERT_TRUE(outer.d3.has_value());
            EXPECT_NEAR(outer.d3->length(), 0.1, 1e-6);
            // Around derivative shrinks with the radius
            EXPECT_NEAR(inner.d1.length() / outer.d1.length(), 0.9, 0.01);
        }
        EXPECT_NEAR(z_sum / 24.0, static_cast<double>(r), 1e-6);
    }
}

TEST(AnnulusBuilderTest, ThicknessLimitedAtEnds) {
    Ring start = test::make_tube_ring(8, 1.0, 0.8, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.8, 2.0);
    BridgeOptions options;
    options.radial_subdivisions = 2;
    options.max_start_thickness = 0.1;
    options.max_end_thickness = 0.1;
    AnnulusMesh mesh = build_annulus(start, end, options);
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_NEAR(radius(mesh.node(0, 1, i).data.x), 0.9, 1e-3);
    }
}

TEST(AnnulusBuilderTest, LinearThroughWallWithoutD3) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0, false);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 2.0, false);
    BridgeOptions options;
    options.radial_subdivisions = 2;
    AnnulusMesh mesh = build_annulus(start, end, options);
    for (const auto& cell : mesh.cells()) {
        EXPECT_TRUE(cell.linear_through_wall);
    }
    EXPECT_FALSE(mesh.node(1, 1, 0).data.d3.has_value());
}

TEST(AnnulusBuilderTest, ForcedLinearEnds) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 2.0);
    BridgeOptions options;
    options.radial_subdivisions = 2;
    options.force_start_linear_through_wall = true;
    AnnulusMesh mesh = build_annulus(start, end, options);
    // Mid stays cubic unless forced
    for (const auto& cell : mesh.cells()) {
        EXPECT_FALSE(cell.linear_through_wall);
    }

    options.force_mid_linear_through_wall = true;
    AnnulusMesh forced = build_annulus(start, end, options);
    for (const auto& cell : forced.cells()) {
        EXPECT_EQ(cell.linear_through_wall, cell.radial_step == 0);
    }
    EXPECT_FALSE(forced.node(1, 1, 0).data.d3.has_value());
}

TEST(AnnulusBuilderTest, SingleLayerQuadrilaterals) {
    Ring start;
    start.layers.push_back(test::make_circle_layer(6, 1.0, 0.0, vec3::unit_z()));
    Ring end;
    end.layers.push_back(test::make_circle_layer(6, 1.0, 2.0, vec3::unit_z()));
    BridgeOptions options;
    options.radial_subdivisions = 2;
    AnnulusMesh mesh = build_annulus(start, end, options);
    EXPECT_EQ(mesh.layers_count(), 1u);
    ASSERT_EQ(mesh.cells().size(), 12u);
    EXPECT_EQ(mesh.cells()[0].shape, CellShape::Quadrilateral);
    EXPECT_EQ(mesh.cells()[0].corners.size(), 4u);
    EXPECT_NEAR(mesh.node(0, 1, 3).data.x.z, 1.0, 1e-6);
}

TEST(AnnulusBuilderTest, CollapsedNodeMakesWedge) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 1.0);
    collapse_at(start, 3);

    AnnulusMesh mesh = build_annulus(start, end, BridgeOptions{});
    InMemoryMeshSink sink;
    mesh.emit(sink);
    ASSERT_EQ(sink.cells().size(), 8u);
    for (const auto& cell : sink.cells()) {
        if (cell.index_around == 3) {
            EXPECT_EQ(cell.shape, CellShape::Wedge);
            EXPECT_EQ(cell.node_ids.size(), 6u);
            EXPECT_EQ(cell.corner_mappings.size(), 6u);
        } else {
            EXPECT_EQ(cell.shape, CellShape::Hexahedron);
            EXPECT_EQ(cell.node_ids.size(), 8u);
        }
    }

    // Collapsed corners refer to the same grid node
    const AnnulusCell& wedge = mesh.cells()[3];
    EXPECT_EQ(wedge.corners[0], wedge.corners[1]);
    EXPECT_EQ(mesh.node(wedge.corners[0]).data.x, mesh.node(wedge.corners[1]).data.x);
    EXPECT_FALSE(wedge.corners[2] == wedge.corners[3]);
    // Pinched corner takes the other side d/dxi1
    ASSERT_TRUE(wedge.mappings[0].d1.has_value());
    EXPECT_TRUE(wedge.mappings[0].d1->is_zero());

    // The next cell around uses the merged node, so the shared face has
    // all four of its nodes in common
    const CellRecord& pinched = sink.cells()[3];
    const CellRecord& next = sink.cells()[4];
    EXPECT_EQ(next.node_ids[0], pinched.node_ids[0]);
    EXPECT_EQ(shared_ids(pinched, next), 4u);
    EXPECT_EQ(shared_ids(sink.cells()[2], pinched), 4u);
    EXPECT_EQ(sink.nodes().size(), 30u);
}

TEST(AnnulusBuilderTest, WedgeAtEveryRadialStep) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 3.0);
    collapse_at(start, 3);
    BridgeOptions options;
    options.radial_subdivisions = 3;
    AnnulusMesh mesh = build_annulus(start, end, options);

    // Edge 3-4 closes on rings 0 and 2, one node per layer each
    EXPECT_EQ(mesh.new_nodes_count(), 60u);
    for (std::size_t l = 0; l < 2; ++l) {
        EXPECT_EQ(mesh.resolve({l, 2, 4}), (GridIndex{l, 2, 3}));
        EXPECT_EQ(mesh.node(l, 2, 4).data.x, mesh.node(l, 2, 3).data.x);
        EXPECT_EQ(mesh.resolve({l, 1, 4}), (GridIndex{l, 1, 4}));
    }

    InMemoryMeshSink sink;
    mesh.emit(sink);
    ASSERT_EQ(sink.cells().size(), 24u);
    for (const auto& cell : sink.cells()) {
        if (cell.index_around == 3) {
            EXPECT_EQ(cell.shape, CellShape::Wedge) << "step " << cell.radial_step;
            EXPECT_EQ(cell.node_ids.size(), 6u);
        } else {
            EXPECT_EQ(cell.shape, CellShape::Hexahedron);
            EXPECT_EQ(cell.node_ids.size(), 8u);
        }
    }

    // Conforming with the neighbours around at every step
    for (int r = 0; r < 3; ++r) {
        const CellRecord& before = sink.cells()[r * 8 + 2];
        const CellRecord& pinched = sink.cells()[r * 8 + 3];
        const CellRecord& after = sink.cells()[r * 8 + 4];
        EXPECT_EQ(shared_ids(before, pinched), 4u) << "step " << r;
        EXPECT_EQ(shared_ids(pinched, after), 4u) << "step " << r;
    }
    // Steps meet on ring 1 across a full face
    EXPECT_EQ(shared_ids(sink.cells()[3], sink.cells()[11]), 4u);

    // Interior closed corner has no length around
    const AnnulusCell& middle = mesh.cells()[8 + 3];
    ASSERT_TRUE(middle.mappings[2].d1.has_value());
    EXPECT_TRUE(middle.mappings[2].d1->is_zero());
    EXPECT_TRUE(middle.mappings[0].is_identity());
}

TEST(AnnulusBuilderTest, SingleLayerCollapseMakesTriangle) {
    Ring start;
    start.layers.push_back(test::make_circle_layer(6, 1.0, 0.0, vec3::unit_z()));
    Ring end;
    end.layers.push_back(test::make_circle_layer(6, 1.0, 1.0, vec3::unit_z()));
    collapse_at(start, 0);
    AnnulusMesh mesh = build_annulus(start, end, BridgeOptions{});
    InMemoryMeshSink sink;
    mesh.emit(sink);
    EXPECT_EQ(sink.cells()[0].shape, CellShape::Triangle);
    EXPECT_EQ(sink.cells()[0].node_ids.size(), 3u);
}

TEST(AnnulusBuilderTest, CollapsedAtBothEnds) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 1.0);
    collapse_at(start, 2);
    collapse_at(end, 2);
    EXPECT_THROW(build_annulus(start, end, BridgeOptions{}), PreconditionViolation);

    BridgeOptions options;
    options.radial_subdivisions = 3;
    EXPECT_THROW(build_annulus(start, end, options), PreconditionViolation);

    // An even count closes the same edges from both ends
    options.radial_subdivisions = 2;
    AnnulusMesh mesh = build_annulus(start, end, options);
    for (const auto& cell : mesh.cells()) {
        EXPECT_EQ(cell.shape, cell.index_around == 2 ? CellShape::Wedge : CellShape::Hexahedron);
    }
    EXPECT_EQ(mesh.resolve({0, 1, 3}), (GridIndex{0, 1, 3}));
}

TEST(AnnulusBuilderTest, RingCollapsedToPointThrows) {
    Ring start = test::make_tube_ring(4, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(4, 1.0, 0.9, 1.0);
    for (std::size_t i = 0; i < 4; ++i) {
        collapse_at(start, i);
    }
    EXPECT_THROW(build_annulus(start, end, BridgeOptions{}), PreconditionViolation);
}

TEST(AnnulusBuilderTest, RemappedBoundaryDerivatives) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 2.0);
    BridgeOptions options;
    options.radial_subdivisions = 2;
    AnnulusMesh expected = build_annulus(start, end, options);

    // Start stores d1 and d2 swapped, end stores d1 reversed; the maps undo it
    Ring swapped = start;
    for (auto& layer : swapped.layers) {
        for (auto& node : layer.nodes) {
            std::swap(node.d1, node.d2);
        }
        DerivativeMap map;
        map.d1 = DerivativeCombination(0, 1, 0);
        map.d2 = DerivativeCombination(1, 0, 0);
        layer.derivative_maps.assign(layer.nodes.size(), map);
    }
    Ring reversed = end;
    for (auto& layer : reversed.layers) {
        for (auto& node : layer.nodes) {
            node.d1 = -node.d1;
        }
        DerivativeMap map;
        map.d1 = DerivativeCombination(-1, 0, 0);
        layer.derivative_maps.assign(layer.nodes.size(), map);
    }
    AnnulusMesh mesh = build_annulus(swapped, reversed, options);

    for (std::size_t l = 0; l < 2; ++l) {
        for (std::size_t i = 0; i < 8; ++i) {
            const AnnulusNode& a = mesh.node(l, 1, i).data;
            const AnnulusNode& b = expected.node(l, 1, i).data;
            EXPECT_NEAR(a.x.distance_to(b.x), 0.0, 1e-12);
            EXPECT_NEAR(a.d1.distance_to(b.d1), 0.0, 1e-12);
            EXPECT_NEAR(a.d2.distance_to(b.d2), 0.0, 1e-12);
        }
    }

    // Boundary nodes go out as stored, cells carry the maps
    InMemoryMeshSink sink;
    mesh.emit(sink);
    EXPECT_EQ(sink.nodes()[0].node.d1, vec3::unit_z());
    EXPECT_EQ(sink.nodes()[0].node.d2, swapped.layers[0].nodes[0].d2);
    const CellRecord& first = sink.cells()[0];
    ASSERT_TRUE(first.corner_mappings[0].d1.has_value());
    EXPECT_EQ(*first.corner_mappings[0].d1, DerivativeCombination(0, 1, 0));
    EXPECT_EQ(*first.corner_mappings[0].d2, DerivativeCombination(1, 0, 0));
    // Corners on the interior ring are unmapped
    EXPECT_TRUE(first.corner_mappings[2].is_identity());
    const CellRecord& last_step = sink.cells()[8];
    ASSERT_TRUE(last_step.corner_mappings[2].d1.has_value());
    EXPECT_EQ(*last_step.corner_mappings[2].d1, DerivativeCombination(-1, 0, 0));
}

TEST(AnnulusBuilderTest, SingleLayerCarriesThroughWallDerivative) {
    Ring start;
    start.layers.push_back(test::make_circle_layer(8, 1.0, 0.0, vec3::unit_z(), 0.2));
    Ring end;
    end.layers.push_back(test::make_circle_layer(8, 1.0, 2.0, vec3::unit_z(), 0.2));
    BridgeOptions options;
    options.radial_subdivisions = 2;
    AnnulusMesh mesh = build_annulus(start, end, options);
    for (std::size_t i = 0; i < 8; ++i) {
        const AnnulusNode& node = mesh.node(0, 1, i).data;
        ASSERT_TRUE(node.d3.has_value());
        EXPECT_NEAR(node.d3->length(), 0.2, 1e-6);
        Vec3 radial(node.x.x, node.x.y, 0.0);
        EXPECT_NEAR(node.d3->dot(radial.normalized()), 0.2, 1e-3);
    }
    for (const auto& cell : mesh.cells()) {
        EXPECT_FALSE(cell.linear_through_wall);
    }

    // Linear ends leave interior nodes without d3
    options.force_start_linear_through_wall = true;
    options.force_end_linear_through_wall = true;
    AnnulusMesh linear = build_annulus(start, end, options);
    EXPECT_FALSE(linear.node(0, 1, 0).data.d3.has_value());
}

TEST(AnnulusBuilderTest, RejectsMismatchedRings) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring fewer = test::make_tube_ring(6, 1.0, 0.9, 1.0);
    EXPECT_THROW(build_annulus(start, fewer, BridgeOptions{}), ShapeMismatch);

    Ring one_layer;
    one_layer.layers.push_back(test::make_circle_layer(8, 1.0, 1.0, vec3::unit_z()));
    EXPECT_THROW(build_annulus(start, one_layer, BridgeOptions{}), ShapeMismatch);
}

TEST(AnnulusBuilderTest, RejectsBadOptions) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 1.0);
    BridgeOptions options;
    options.radial_subdivisions = 0;
    EXPECT_THROW(build_annulus(start, end, options), PreconditionViolation);

    options = BridgeOptions{};
    options.sample_blend = 1.5;
    EXPECT_THROW(build_annulus(start, end, options), PreconditionViolation);

    TrackSurface surface = test::make_plane_surface(2, 2, 2.0, 2.0);
    EXPECT_THROW(build_annulus(start, end, BridgeOptions{}, &surface), PreconditionViolation);
}

TEST(AnnulusBuilderTest, InputsNotModified) {
    Ring start = test::make_tube_ring(8, 1.0, 0.9, 0.0);
    Ring end = test::make_tube_ring(8, 1.0, 0.9, 2.0);
    Ring start_copy = start;
    BridgeOptions options;
    options.radial_subdivisions = 2;
    build_annulus(start, end, options);
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(start.layers[1].nodes[i].x, start_copy.layers[1].nodes[i].x);
        EXPECT_EQ(start.layers[1].nodes[i].d2, start_copy.layers[1].nodes[i].d2);
    }
}

TEST(AnnulusBuilderTest, SurfaceConstrainedBridge) {
    // Cylinder of radius 1 covering the full circle
    TrackSurface surface = test::make_cylinder_surface(12, 3, 1.0, 2.0 * test::PI, 3.0);
    Ring start;
    start.layers.push_back(test::make_circle_layer(12, 1.0, 0.0, vec3::unit_z()));
    Ring end;
    end.layers.push_back(test::make_circle_layer(12, 1.0, 3.0, vec3::unit_z()));
    for (std::size_t i = 0; i < 12; ++i) {
        start.surface_proportions.push_back({i / 12.0, 0.0});
        end.surface_proportions.push_back({i / 12.0, 1.0});
    }
    BridgeOptions options;
    options.radial_subdivisions = 3;
    AnnulusMesh mesh = build_annulus(start, end, options, &surface);
    for (std::size_t r = 1; r < 3; ++r) {
        for (std::size_t i = 0; i < 12; ++i) {
            const Vec3& x = mesh.node(0, r, i).data.x;
            EXPECT_NEAR(radius(x), 1.0, 1e-3);
            EXPECT_NEAR(x.z, static_cast<double>(r), 1e-3);
        }
    }
}
