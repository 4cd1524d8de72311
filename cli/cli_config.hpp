#ifndef REARLINK_CLI_CONFIG_HPP
#define REARLINK_CLI_CONFIG_HPP

#include "cli_common.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <common/logging.hpp>

namespace rearlink::cli {

// Configuration resolved from the -c file and command-line overrides
struct ResolvedConfig {
    SolveConfig solve;
    BatchConfig batch;
};

inline ResolvedConfig resolve_config(const CommandContext& ctx) {
    auto log = rearlink::logging::get_logger();
    ResolvedConfig resolved;

    // An explicit level wins over -v
    if (ctx.log_level.has_value()) {
        logging::set_level(ctx.log_level.value());
    } else if (ctx.verbose) {
        logging::set_level("debug");
    }

    if (ctx.config_path.has_value()) {
        nlohmann::json config = json::read_json_file(ctx.config_path.value());
        if (config.contains("solve")) {
            resolved.solve = config["solve"].get<SolveConfig>();
        }
        if (config.contains("batch")) {
            resolved.batch = config["batch"].get<BatchConfig>();
        }
        log->info("Loaded configuration from: {}", ctx.config_path.value());
    }

    // Override with command-line arguments
    if (ctx.n_steps.has_value()) {
        resolved.solve.n_steps = ctx.n_steps.value();
    }
    if (ctx.iterations.has_value()) {
        resolved.solve.iterations = ctx.iterations.value();
    }
    if (ctx.num_threads.has_value()) {
        resolved.batch.num_threads = ctx.num_threads.value();
    }

    return resolved;
}

}  // namespace rearlink::cli

#endif // REARLINK_CLI_CONFIG_HPP
