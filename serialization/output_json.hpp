#ifndef REARLINK_SERIALIZATION_OUTPUT_JSON_HPP
#define REARLINK_SERIALIZATION_OUTPUT_JSON_HPP

#include <nlohmann/json.hpp>
#include <kinematics/kinematics.hpp>
#include <units/bike_scale.hpp>
#include "json_serialization.hpp"
#include "config_json.hpp"
#include "linkage_json.hpp"
#include "result_json.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rearlink {

// Version of the output document layout
constexpr const char* kOutputVersion = "1.0";

enum class OutputKind {
    Solution,  // one bike: data is a solution
    Batch      // many bikes: data holds results and errors by name
};

inline const char* output_kind_name(OutputKind kind) {
    switch (kind) {
        case OutputKind::Solution: return "linkage_solution";
        case OutputKind::Batch: return "linkage_batch";
    }
    return "unknown";
}

// Document written by the solve and batch commands.
// The solver settings that produced it travel with the data.
struct OutputDocument {
    OutputKind kind = OutputKind::Solution;
    std::string created_at;
    std::string source_file;
    SolveConfig solve;
    std::optional<BatchConfig> batch;
    std::optional<BikeGeometry> geometry;
    std::optional<ShockUnits> shock_units;
    nlohmann::json stats;
    nlohmann::json data;
};

inline void to_json(nlohmann::json& j, const OutputDocument& doc) {
    nlohmann::json config = {{"solve", doc.solve}};
    if (doc.batch) config["batch"] = *doc.batch;
    if (doc.geometry) config["geometry"] = *doc.geometry;
    if (doc.shock_units) config["shock_units"] = shock_units_name(*doc.shock_units);

    j = {
        {"format", "rearlink"},
        {"version", kOutputVersion},
        {"kind", output_kind_name(doc.kind)},
        {"created_at", doc.created_at},
        {"source_file", doc.source_file},
        {"config", config},
        {"stats", doc.stats.is_null() ? nlohmann::json::object() : doc.stats},
        {"data", doc.data}
    };
}

inline OutputDocument solution_document(const std::string& source_file,
                                        const BikeDocument& bike,
                                        const BikeSolution& solution,
                                        const SolveConfig& config) {
    OutputDocument doc;
    doc.kind = OutputKind::Solution;
    doc.created_at = json::utc_timestamp();
    doc.source_file = source_file;
    doc.solve = config;
    doc.geometry = bike.geometry;
    doc.shock_units = bike.shock_units;
    doc.stats = solution.summary;
    doc.data = solution_to_json(solution);
    return doc;
}

// Every entry lands in data.results or data.errors; summaries of the solved
// bikes go to stats.
inline OutputDocument batch_document(const std::string& source_file,
                                     const std::vector<BatchEntry>& entries,
                                     const SolveConfig& config,
                                     const BatchConfig& batch) {
    nlohmann::json results = nlohmann::json::object();
    nlohmann::json summaries = nlohmann::json::object();
    nlohmann::json errors = nlohmann::json::object();
    for (const auto& entry : entries) {
        if (entry.solution) {
            results[entry.name] = solution_to_json(*entry.solution);
            summaries[entry.name] = entry.solution->summary;
        } else {
            errors[entry.name] = entry.error.value_or("unknown error");
        }
    }

    OutputDocument doc;
    doc.kind = OutputKind::Batch;
    doc.created_at = json::utc_timestamp();
    doc.source_file = source_file;
    doc.solve = config;
    doc.batch = batch;
    doc.stats = {
        {"bike_count", entries.size()},
        {"failed_count", errors.size()},
        {"summaries", summaries}
    };
    doc.data = {
        {"results", results},
        {"errors", errors}
    };
    return doc;
}

}  // namespace rearlink

#endif // REARLINK_SERIALIZATION_OUTPUT_JSON_HPP
