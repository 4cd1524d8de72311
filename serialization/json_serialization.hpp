#ifndef REARLINK_SERIALIZATION_JSON_SERIALIZATION_HPP
#define REARLINK_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rearlink::json {

// Output path that writes to stdout instead of a file
constexpr const char* kStdoutPath = "-";

// UTC time as ISO 8601, second resolution
inline std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json(std::ostream& out, const nlohmann::json& j) {
    out << j.dump(2) << '\n';
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    if (path == kStdoutPath) {
        write_json(std::cout, j);
        return;
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    write_json(file, j);
}

// Parse errors name the file they came from
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

// Optional fields: absent or null maps to nullopt
template <typename T>
std::optional<T> optional_value(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

// nullopt is written as null so that every record has the same keys
template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

}  // namespace rearlink::json

#endif // REARLINK_SERIALIZATION_JSON_SERIALIZATION_HPP
