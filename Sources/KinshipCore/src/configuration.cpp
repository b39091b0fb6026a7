#include "kinship/configuration.hpp"
#include "kinship/errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace kinship {

using json = nlohmann::json;

log_level parse_log_level(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    throw kinship_error("Unknown log level: " + name);
}

configuration parse_configuration(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw kinship_error(std::string("Invalid configuration: ") + e.what());
    }
    if (!j.is_object()) {
        throw kinship_error("Invalid configuration: expected a JSON object");
    }

    configuration config;
    try {
        if (j.contains("path")) {
            config.path = j.at("path").get<std::string>();
        }
        if (j.contains("log_level")) {
            config.logging = parse_log_level(j.at("log_level").get<std::string>());
        }
        if (j.contains("strict_one_to_one")) {
            config.strict_one_to_one = j.at("strict_one_to_one").get<bool>();
        }
        if (j.contains("cascade_delete")) {
            config.cascade_delete = j.at("cascade_delete").get<bool>();
        }
    } catch (const json::type_error& e) {
        throw kinship_error(std::string("Invalid configuration: ") + e.what());
    }
    return config;
}

configuration load_configuration(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw kinship_error("Cannot read configuration file " + file_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_configuration(buffer.str());
}

} // namespace kinship
