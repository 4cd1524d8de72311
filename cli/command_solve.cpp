#include "cli_common.hpp"
#include "cli_config.hpp"
#include <kinematics/kinematics.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/linkage_json.hpp>
#include <serialization/output_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace rearlink::cli {

int command_solve(int argc, char** argv) {
    auto log = rearlink::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: rearlink solve <bike.json> -o <result.json|-> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>  Configuration file ({\"solve\": {...}})\n";
            std::cerr << "  --steps N            Stroke increments (default: from config or 80)\n";
            std::cerr << "  --iterations N       Relaxation sweeps per step (default: from config or 100)\n";
            std::cerr << "  -v, --verbose        Debug logging\n";
            std::cerr << "  --log-level <name>   trace, debug, info, warn, error or off\n";
            return 1;
        }

        ResolvedConfig config = resolve_config(ctx);

        log->info("Solving linkage from: {}", ctx.input_path);

        BikeDocument bike = json::read_json_file(ctx.input_path).get<BikeDocument>();
        BikeSolution solution = solve_bike(bike, config.solve);

        json::write_json_file(ctx.output_path,
                              solution_document(ctx.input_path, bike, solution, config.solve));

        log->info("Wrote linkage solution to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << solution.result.steps.size() << " steps";
        if (solution.summary.total_travel) {
            std::cerr << ", " << *solution.summary.total_travel << " "
                      << solution.units() << " rear travel";
        }
        std::cerr << ")\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace rearlink::cli
