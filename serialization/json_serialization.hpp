#ifndef OSTIAMESH_SERIALIZATION_JSON_SERIALIZATION_HPP
#define OSTIAMESH_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ostiamesh::json {

constexpr const char* OUTPUT_FORMAT_VERSION = "0.1.0";

// Envelope written around every command output:
// {version, step, timestamp, source_file, config, stats, data}
struct OutputEnvelope {
    std::string version = OUTPUT_FORMAT_VERSION;
    std::string step;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;
};

// Current time in ISO 8601 (UTC)
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Envelope for the output of command step, stamped now
inline OutputEnvelope make_envelope(const std::string& step, const std::string& source_file) {
    OutputEnvelope envelope;
    envelope.step = step;
    envelope.timestamp = get_timestamp();
    envelope.source_file = source_file;
    return envelope;
}

// Empty optional members are left out; data is always present
inline void to_json(nlohmann::json& j, const OutputEnvelope& envelope) {
    j = nlohmann::json{
        {"version", envelope.version},
        {"step", envelope.step}
    };
    if (!envelope.timestamp.empty()) j["timestamp"] = envelope.timestamp;
    if (!envelope.source_file.empty()) j["source_file"] = envelope.source_file;
    if (!envelope.config.is_null()) j["config"] = envelope.config;
    if (!envelope.stats.is_null()) j["stats"] = envelope.stats;
    j["data"] = envelope.data;
}

// Job files are plain JSON objects
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

inline void write_envelope(const std::string& path, const OutputEnvelope& envelope) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << nlohmann::json(envelope).dump(2);
}

}  // namespace ostiamesh::json

#endif // OSTIAMESH_SERIALIZATION_JSON_SERIALIZATION_HPP
