#ifndef REARLINK_SERIALIZATION_CONFIG_JSON_HPP
#define REARLINK_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <solver/linkage_solver.hpp>
#include <kinematics/kinematics.hpp>

namespace rearlink {

// SolveConfig serialization
inline void to_json(nlohmann::json& j, const SolveConfig& config) {
    j = {
        {"n_steps", config.n_steps},
        {"iterations", config.iterations}
    };
}

inline void from_json(const nlohmann::json& j, SolveConfig& config) {
    config.n_steps = j.value("n_steps", 80);
    config.iterations = j.value("iterations", 100);
}

// BatchConfig serialization
inline void to_json(nlohmann::json& j, const BatchConfig& config) {
    j = {
        {"num_threads", config.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, BatchConfig& config) {
    config.num_threads = j.value("num_threads", 0);
}

}  // namespace rearlink

#endif // REARLINK_SERIALIZATION_CONFIG_JSON_HPP
