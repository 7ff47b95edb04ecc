#include "actiscope/ActivityEngine.h"
#include "actiscope/EngineConfig.h"
#include "actiscope/Errors.h"
#include "Fixtures.h"
#include "TestSupport.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace actiscope;
using namespace actiscope_test;

int main() {
    // test 1 empty document -> defaults
    {
        const EngineConfig c = parse_engine_config("");
        check("defaults.projectName", c.projectName == "actiscope");
        check("defaults.version", c.version == contract::CORE_CONTRACT_VERSION);
        check_near("defaults.threshold", c.activityDetectionThreshold, 0.3);
        check("defaults.includePatterns", c.includePatterns);
        check("defaults.noDatabase", c.databasePath.empty());
    }

    // test 2 every key set
    {
        const EngineConfig c = parse_engine_config(
            "project_name: ward-monitor\n"
            "version: 2.1.0\n"
            "detection:\n"
            "  activity_threshold: 0.45\n"
            "output:\n"
            "  include_patterns: false\n"
            "storage:\n"
            "  database_path: /var/lib/actiscope/results.sqlite\n");
        check("full.projectName", c.projectName == "ward-monitor");
        check("full.version", c.version == "2.1.0");
        check_near("full.threshold", c.activityDetectionThreshold, 0.45);
        check("full.includePatterns", !c.includePatterns);
        check("full.databasePath", c.databasePath == "/var/lib/actiscope/results.sqlite");
    }

    // test 3 partial document keeps the other defaults
    {
        const EngineConfig c = parse_engine_config("detection:\n  activity_threshold: 0.1\n");
        check_near("partial.threshold", c.activityDetectionThreshold, 0.1);
        check("partial.includePatterns", c.includePatterns);
    }

    // test 4 rejected documents
    check_throws<ValidationError>("invalid.thresholdAboveOne",
                                  [] { parse_engine_config("detection:\n  activity_threshold: 1.5\n"); });
    check_throws<ValidationError>("invalid.thresholdNegative",
                                  [] { parse_engine_config("detection:\n  activity_threshold: -0.1\n"); });
    check_throws<ValidationError>("invalid.rootSequence", [] { parse_engine_config("- a\n- b\n"); });
    check_throws<ValidationError>("invalid.syntax", [] { parse_engine_config("detection: [0.3\n"); });
    check_throws<ValidationError>("invalid.missingFile",
                                  [] { load_engine_config("/nonexistent/actiscope/engine.yaml"); });

    // test 5 save then load gives the same settings
    {
        EngineConfig c;
        c.projectName = "round-trip";
        c.activityDetectionThreshold = 0.25;
        c.includePatterns = false;
        c.databasePath = "trip.sqlite";

        const auto path = std::filesystem::temp_directory_path() / "actiscope_test_config.yaml";
        save_engine_config(c, path.string());
        const EngineConfig back = load_engine_config(path.string());
        std::filesystem::remove(path);

        check("roundTrip.projectName", back.projectName == c.projectName);
        check_near("roundTrip.threshold", back.activityDetectionThreshold, 0.25);
        check("roundTrip.includePatterns", back.includePatterns == c.includePatterns);
        check("roundTrip.databasePath", back.databasePath == c.databasePath);
        check("roundTrip.serializedHasKey",
              serialize_engine_config(c).find("activity_threshold") != std::string::npos);
    }

    // test 6 threshold reaches the metrics of an engine
    {
        // constant 2 g: intensity 2/3 on every sample
        const auto batch = make_batch(constant_signal(11, 0.0, 0.0, 2.0), 1);
        EngineConfig strict;
        strict.activityDetectionThreshold = 0.9;
        check_near("engine.defaultThreshold.active", ActivityEngine().compute_metrics(batch).activeMinutes,
                   10.0 / 60.0);
        check_near("engine.strictThreshold.active", ActivityEngine(strict).compute_metrics(batch).activeMinutes,
                   0.0);
        const auto r = ActivityEngine(strict).recognize(batch, false);
        check("engine.strictThreshold.segments",
              !r.segments.empty() && r.segments.front().metrics.activeMinutes == 0.0);
    }

    return finish();
}
