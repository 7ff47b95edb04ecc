#pragma once

#include "actiscope/CoreContract.h"

#include <string>

namespace actiscope {

/**
 * EngineConfig: runtime settings of the engine and its front ends
 *
 * YAML layout (all keys optional):
 *
 *   project_name: actiscope
 *   version: 1.0.0
 *   detection:
 *     activity_threshold: 0.3
 *   output:
 *     include_patterns: true
 *   storage:
 *     database_path: results.sqlite
 *
 * The classifier table and pattern thresholds are contract constants and
 * are not part of the configuration.
 */
struct EngineConfig {
    std::string projectName{"actiscope"};
    std::string version{contract::CORE_CONTRACT_VERSION};
    double activityDetectionThreshold{contract::DEFAULT_ACTIVITY_THRESHOLD};
    bool includePatterns{true};
    std::string databasePath;   // empty = no persistence
};

// Throw ValidationError on unreadable or ill-formed input.
EngineConfig parse_engine_config(const std::string& yamlText);
EngineConfig load_engine_config(const std::string& path);

std::string serialize_engine_config(const EngineConfig& config);
void save_engine_config(const EngineConfig& config, const std::string& path);

}  // namespace actiscope
