#include "cli_common.hpp"
#include <surface/track_surface.hpp>
#include <surface/surface_tracker.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/surface_json.hpp>
#include <common/logging.hpp>
#include <cmath>

namespace ostiamesh::cli {

namespace {

void print_track_usage() {
    std::cerr << "Usage: ostiamesh track <job.json> [-o <tracks.json>] [-v]\n";
    std::cerr << "\n";
    std::cerr << "Job file:\n";
    std::cerr << "  surface   Track surface (elements_count_u/v, positions, d_u, d_v)\n";
    std::cerr << "  tracker   Optional tracker config (max_xi_step, distance_limit_factor, max_steps)\n";
    std::cerr << "  tracks    List of {start | proportions, direction, distance}\n";
}

SurfacePosition track_start(const TrackSurface& surface, const nlohmann::json& track) {
    if (track.contains("proportions")) {
        SurfaceProportion proportion = track["proportions"].get<SurfaceProportion>();
        return surface.position_from_proportions(proportion.u, proportion.v);
    }
    return track.at("start").get<SurfacePosition>();
}

}  // namespace

int command_track(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            print_track_usage();
            return ctx.help ? 0 : 1;
        }

        std::string output_path = resolve_output_path(ctx.input_path, ".tracks.json", ctx.output_path);
        log->info("Tracking from job: {}", ctx.input_path);

        nlohmann::json job = json::read_json_file(ctx.input_path);
        TrackSurface surface = track_surface_from_json(job.at("surface"));
        TrackerConfig config;
        if (job.contains("tracker")) {
            config = job["tracker"].get<TrackerConfig>();
            log->debug("Using tracker config from job file");
        }
        SurfaceTracker tracker(surface, config);

        nlohmann::json tracks = nlohmann::json::array();
        int completed = 0;
        for (const auto& entry : job.at("tracks")) {
            SurfacePosition start = track_start(surface, entry);
            Vec3 direction = entry.at("direction").get<Vec3>();
            double distance = entry.at("distance").get<double>();

            TrackResult result = tracker.track(start, direction, distance);
            if (result.completed()) {
                ++completed;
            } else {
                log->info("Track {} ended with {} after {:.6g} of {:.6g}",
                          tracks.size(), to_string(result.status), result.distance, std::abs(distance));
            }

            nlohmann::json out = result;
            out["proportions"] = surface.proportions(result.position);
            out["x"] = surface.evaluate(result.position);
            tracks.push_back(out);
        }

        json::OutputEnvelope data = json::make_envelope("track", ctx.input_path);
        data.config = {{"tracker", config}};
        data.data = {{"tracks", tracks}};
        data.stats = {
            {"track_count", tracks.size()},
            {"completed_count", completed}
        };

        json::write_envelope(output_path, data);

        log->info("Wrote {} tracks to {}", tracks.size(), output_path);
        std::cerr << "Wrote " << output_path << " ("
                  << tracks.size() << " tracks, " << completed << " completed)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace ostiamesh::cli
