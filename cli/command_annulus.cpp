#include "cli_common.hpp"
#include <annulus/annulus_builder.hpp>
#include <annulus/mesh_sink.hpp>
#include <surface/track_surface.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/surface_json.hpp>
#include <serialization/ring_json.hpp>
#include <serialization/mesh_json.hpp>
#include <common/logging.hpp>
#include <exception>
#include <optional>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ostiamesh::cli {

namespace {

struct BridgeJob {
    Ring start;
    Ring end;
    BridgeOptions options;
};

void print_annulus_usage() {
    std::cerr << "Usage: ostiamesh annulus <job.json> [-o <mesh.json>] [-v]\n";
    std::cerr << "\n";
    std::cerr << "Job file:\n";
    std::cerr << "  surface        Optional track surface constraining the bridges\n";
    std::cerr << "  first_node_id  First id given to new nodes (default 1)\n";
    std::cerr << "  bridges        List of {start, end, options}\n";
}

}  // namespace

int command_annulus(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            print_annulus_usage();
            return ctx.help ? 0 : 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".mesh.json", ctx.output_path);
        log->info("Building annulus bridges from job: {}", ctx.input_path);

        nlohmann::json job = json::read_json_file(ctx.input_path);
        std::optional<TrackSurface> surface;
        if (job.contains("surface") && !job["surface"].is_null()) {
            surface = track_surface_from_json(job["surface"]);
        }
        NodeId first_node_id = job.value("first_node_id", NodeId{1});

        std::vector<BridgeJob> bridges;
        for (const auto& entry : job.at("bridges")) {
            BridgeJob bridge;
            bridge.start = entry.at("start").get<Ring>();
            bridge.end = entry.at("end").get<Ring>();
            if (entry.contains("options")) {
                bridge.options = entry["options"].get<BridgeOptions>();
            }
            bridges.push_back(std::move(bridge));
        }
        log->debug("Read {} bridges", bridges.size());

        // Bridges are independent; build them in parallel and keep the
        // first failure to rethrow outside the parallel region
        const TrackSurface* surface_ptr = surface ? &*surface : nullptr;
        std::vector<std::optional<AnnulusMesh>> meshes(bridges.size());
        std::vector<std::exception_ptr> errors(bridges.size());
        const int bridge_count = static_cast<int>(bridges.size());

#ifdef _OPENMP
        log->debug("Building with up to {} OpenMP threads", omp_get_max_threads());
        #pragma omp parallel for schedule(dynamic)
#endif
        for (int b = 0; b < bridge_count; ++b) {
            try {
                meshes[b] = build_annulus(bridges[b].start, bridges[b].end, bridges[b].options, surface_ptr);
            } catch (const std::exception&) {
                errors[b] = std::current_exception();
            }
        }
        for (int b = 0; b < bridge_count; ++b) {
            if (errors[b]) {
                log->error("Bridge {} failed", b);
                std::rethrow_exception(errors[b]);
            }
        }

        // Emit in job order so node ids do not depend on scheduling
        InMemoryMeshSink sink(first_node_id);
        nlohmann::json bridge_stats = nlohmann::json::array();
        for (int b = 0; b < bridge_count; ++b) {
            AnnulusMesh::EmitResult emitted = meshes[b]->emit(sink);
            bridge_stats.push_back({
                {"nodes_created", emitted.nodes_created},
                {"cells_created", emitted.cells_created}
            });
        }

        json::OutputEnvelope data = json::make_envelope("annulus", ctx.input_path);
        nlohmann::json options = nlohmann::json::array();
        for (const auto& bridge : bridges) {
            options.push_back(bridge.options);
        }
        data.config = {
            {"first_node_id", first_node_id},
            {"surface_constrained", surface.has_value()},
            {"options", options}
        };
        data.data = mesh_sink_to_json(sink);
        data.stats = {
            {"bridge_count", bridges.size()},
            {"node_count", sink.nodes().size()},
            {"cell_count", sink.cells().size()},
            {"bridges", bridge_stats}
        };

        json::write_envelope(output_path, data);

        log->info("Wrote annulus mesh to {}", output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << sink.nodes().size() << " nodes, "
                  << sink.cells().size() << " cells)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace ostiamesh::cli
