#include "cli_common.hpp"
#include "cli_config.hpp"
#include <kinematics/kinematics.hpp>
#include <linkage/linkage_builder.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/linkage_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace rearlink::cli {

int command_validate(int argc, char** argv) {
    auto log = rearlink::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty()) {
            std::cerr << "Usage: rearlink validate <bike.json> [-v] [--log-level <name>]\n";
            std::cerr << "Checks points and bodies and reports the compiled linkage.\n";
            return 1;
        }
        resolve_config(ctx);

        log->info("Validating linkage from: {}", ctx.input_path);

        BikeDocument bike = json::read_json_file(ctx.input_path).get<BikeDocument>();
        auto scale = resolve_scale(bike.geometry, bike.points);
        CompiledLinkage linkage =
            LinkageBuilder::build(bike.points, prepare_bodies(bike, scale));

        std::cout << "Linkage OK: " << linkage.point_count() << " points ("
                  << linkage.pinned_count() << " pinned), "
                  << linkage.edge_count() << " edges\n";
        std::cout << "  driver: " << linkage.point_id(linkage.driver_edge().point_a)
                  << " - " << linkage.point_id(linkage.driver_edge().point_b)
                  << ", rest " << linkage.driver_rest_length()
                  << " px, stroke " << linkage.driver_stroke() << " px\n";
        std::cout << "  rear axle: " << linkage.rear_axle_id().value_or("(none)") << "\n";
        if (scale) {
            std::cout << "  scale: " << *scale << " mm/px\n";
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace rearlink::cli
