#ifndef QUILTBLOCK_SERIALIZATION_JSON_SERIALIZATION_HPP
#define QUILTBLOCK_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace quiltblock::json {

// Current time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);  // Pretty print with 2-space indent
}

// Read JSON from file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

// Read a whole text file
inline std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

// Write a whole text file
inline void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

}  // namespace quiltblock::json

#endif // QUILTBLOCK_SERIALIZATION_JSON_SERIALIZATION_HPP
