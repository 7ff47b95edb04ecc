#include "actiscope/EngineConfig.h"
#include "actiscope/Errors.h"

#include <cmath>
#include <fstream>

#include <yaml-cpp/yaml.h>

namespace actiscope {

namespace {

EngineConfig parse_config(const YAML::Node& root) {
    EngineConfig config{};
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw ValidationError("engine config: top-level node must be a map");

    config.projectName = root["project_name"].as<std::string>(config.projectName);
    config.version = root["version"].as<std::string>(config.version);

    const auto detection = root["detection"];
    if (detection)
        config.activityDetectionThreshold =
            detection["activity_threshold"].as<double>(config.activityDetectionThreshold);

    const auto output = root["output"];
    if (output)
        config.includePatterns = output["include_patterns"].as<bool>(config.includePatterns);

    const auto storage = root["storage"];
    if (storage)
        config.databasePath = storage["database_path"].as<std::string>(config.databasePath);

    const double thr = config.activityDetectionThreshold;
    if (!std::isfinite(thr) || thr < 0.0 || thr > 1.0) {
        throw ValidationError("engine config: detection.activity_threshold must be in [0,1]");
    }
    return config;
}

YAML::Node to_node(const EngineConfig& config) {
    YAML::Node root;
    root["project_name"] = config.projectName;
    root["version"] = config.version;

    YAML::Node detection;
    detection["activity_threshold"] = config.activityDetectionThreshold;
    root["detection"] = detection;

    YAML::Node output;
    output["include_patterns"] = config.includePatterns;
    root["output"] = output;

    YAML::Node storage;
    storage["database_path"] = config.databasePath;
    root["storage"] = storage;
    return root;
}

} // namespace

EngineConfig parse_engine_config(const std::string& yamlText) {
    try {
        return parse_config(YAML::Load(yamlText));
    } catch (const YAML::Exception& e) {
        throw ValidationError(std::string("engine config: ") + e.what());
    }
}

EngineConfig load_engine_config(const std::string& path) {
    try {
        return parse_config(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ValidationError("engine config " + path + ": " + e.what());
    }
}

std::string serialize_engine_config(const EngineConfig& config) {
    YAML::Emitter out;
    out << to_node(config);
    return std::string(out.c_str());
}

void save_engine_config(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) throw std::runtime_error("Failed to open " + path + " for writing");
    file << serialize_engine_config(config) << '\n';
    if (!file) throw std::runtime_error("Failed to write " + path);
}

}  // namespace actiscope
