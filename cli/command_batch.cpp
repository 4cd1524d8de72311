#include "cli_common.hpp"
#include "cli_config.hpp"
#include <kinematics/kinematics.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/linkage_json.hpp>
#include <serialization/output_json.hpp>
#include <common/logging.hpp>
#include <iostream>

namespace rearlink::cli {

int command_batch(int argc, char** argv) {
    auto log = rearlink::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: rearlink batch <bikes.json> -o <results.json|-> [options]\n";
            std::cerr << "Input: {\"bikes\": {\"<name>\": <bike document>, ...}}\n";
            std::cerr << "Options:\n";
            std::cerr << "  -c, --config <file>  Configuration file ({\"solve\": {...}, \"batch\": {...}})\n";
            std::cerr << "  --steps N            Stroke increments (default: from config or 80)\n";
            std::cerr << "  --iterations N       Relaxation sweeps per step (default: from config or 100)\n";
            std::cerr << "  --threads N          Worker threads (default: from config or OpenMP default)\n";
            std::cerr << "  -v, --verbose        Debug logging\n";
            std::cerr << "  --log-level <name>   trace, debug, info, warn, error or off\n";
            return 1;
        }

        ResolvedConfig config = resolve_config(ctx);

        log->info("Solving bike batch from: {}", ctx.input_path);

        BikeBatch input = read_bike_batch(json::read_json_file(ctx.input_path));

        std::vector<BatchEntry> entries = solve_batch(input.bikes, config.solve, config.batch);
        entries.insert(entries.end(), input.rejected.begin(), input.rejected.end());

        size_t failed = 0;
        for (const auto& entry : entries) {
            if (entry.error) ++failed;
        }

        json::write_json_file(ctx.output_path,
                              batch_document(ctx.input_path, entries, config.solve, config.batch));

        log->info("Wrote batch results to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << entries.size() - failed << " solved, "
                  << failed << " failed)\n";

        // Partial output is still written, but failures are reported
        return failed == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace rearlink::cli
