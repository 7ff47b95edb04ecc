#include "actiscope/ActivityEngine.h"
#include "actiscope/CsvBatchReader.h"
#include "actiscope/EngineConfig.h"
#include "actiscope/Errors.h"
#include "actiscope/Utility.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <cxxopts.hpp>

using namespace actiscope;

namespace {

struct CliOptions {
    std::string samplesPath;
    int rateHz{50};
    std::optional<std::string> configPath;
    std::optional<std::string> dbPath;
    std::string userId{"local"};
    bool noPatterns{false};
    bool metricsOnly{false};
    bool labelsOnly{false};
    bool help{false};
};

cxxopts::Options make_options() {
    cxxopts::Options options("actiscope_analyze", "Infer an activity timeline from accelerometer samples (CSV)");
    options.positional_help("<samples.csv>");
    options.add_options()
        ("samples", "Input CSV file (timestamp,x,y,z)", cxxopts::value<std::string>())
        ("r,rate", "Sampling rate in Hz", cxxopts::value<int>()->default_value("50"))
        ("c,config", "Engine configuration (YAML)", cxxopts::value<std::string>())
        ("db", "SQLite database to store the result in", cxxopts::value<std::string>())
        ("u,user", "User id for stored results", cxxopts::value<std::string>()->default_value("local"))
        ("no-patterns", "Skip pattern detection")
        ("metrics-only", "Print only the overall metrics")
        ("labels", "List the supported activity labels")
        ("h,help", "Print help");
    options.parse_positional({"samples"});
    return options;
}

// nullopt => no samples file and nothing else to do
std::optional<CliOptions> parse_args(cxxopts::Options& options, int argc, char** argv) {
    CliOptions opt;
    try {
        const auto result = options.parse(argc, argv);
        if (result.count("help")) {
            opt.help = true;
            return opt;
        }

        if (result.count("samples")) opt.samplesPath = result["samples"].as<std::string>();
        opt.rateHz = result["rate"].as<int>();
        if (result.count("config")) opt.configPath = result["config"].as<std::string>();
        if (result.count("db")) opt.dbPath = result["db"].as<std::string>();
        opt.userId = result["user"].as<std::string>();
        opt.noPatterns = result.count("no-patterns") > 0;
        opt.metricsOnly = result.count("metrics-only") > 0;
        opt.labelsOnly = result.count("labels") > 0;
    } catch (const cxxopts::exceptions::exception& e) {
        throw ValidationError(e.what());
    }

    if (!opt.labelsOnly && opt.samplesPath.empty()) return std::nullopt;
    return opt;
}

void print_metrics(const char* title, const ActivityMetrics& m) {
    std::printf("%s\n", title);
    std::printf("  avg_intensity        %.4f\n", m.avgIntensity);
    std::printf("  peak_intensity       %.4f\n", m.peakIntensity);
    std::printf("  movement_consistency %.4f\n", m.movementConsistency);
    std::printf("  active_minutes       %.4f\n", m.activeMinutes);
    std::printf("  total_duration       %.3f s\n", m.totalDuration);
}

void print_header(const EngineConfig& config, const std::string& samplesPath) {
    std::printf("%s %s: %s\n", config.projectName.c_str(), config.version.c_str(), samplesPath.c_str());
}

void print_result(const RecognitionResult& r) {
    std::printf("status: %s\n", r.status.c_str());
    std::printf("dominant_activity: %s\n", activity_type_to_string(r.dominantActivity).c_str());
    std::printf("segments: %zu\n", r.segments.size());
    for (std::size_t i = 0; i < r.segments.size(); ++i) {
        const auto& s = r.segments[i];
        std::printf("  [%3zu] %10.3f .. %10.3f  %-8s conf=%.2f avg=%.3f peak=%.3f\n", i, s.startTime, s.endTime,
                    activity_type_to_string(s.type).c_str(), s.confidence, s.metrics.avgIntensity,
                    s.metrics.peakIntensity);
    }
    if (r.overallMetrics) print_metrics("overall_metrics:", *r.overallMetrics);
    std::printf("patterns: %zu\n", r.patterns.size());
    for (const auto& p : r.patterns) {
        std::printf("  %-9s %.2f min, %zu segments - %s\n", p.patternType.c_str(), p.totalDuration,
                    p.segmentIndices.size(), p.description.c_str());
    }
}

int run(const CliOptions& opt) {
    if (opt.labelsOnly) {
        for (ActivityType t : ActivityEngine::list_supported_labels()) {
            std::printf("%s\n", activity_type_to_string(t).c_str());
        }
        return EXIT_SUCCESS;
    }

    EngineConfig config = opt.configPath ? load_engine_config(*opt.configPath) : EngineConfig{};
    if (opt.dbPath) config.databasePath = *opt.dbPath;
    if (opt.noPatterns) config.includePatterns = false;

    ActivityEngine engine(config);
    AccelerationBatch batch = load_csv_batch(opt.samplesPath, opt.rateHz);
    print_header(config, opt.samplesPath);

    if (opt.metricsOnly) {
        print_metrics("metrics:", engine.compute_metrics(batch));
        return EXIT_SUCCESS;
    }

    RecognitionRequest request;
    request.batch = std::move(batch);
    request.includePatterns = config.includePatterns;
    request.userId = opt.userId;

    const RecognitionResult result =
        config.databasePath.empty() ? engine.recognize(request) : engine.recognize_and_store(request);
    print_result(result);
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto options = make_options();
        const auto opt = parse_args(options, argc, argv);
        if (!opt) {
            std::fprintf(stderr, "%s\n", options.help().c_str());
            return 2;
        }
        if (opt->help) {
            std::printf("%s\n", options.help().c_str());
            return EXIT_SUCCESS;
        }
        return run(*opt);
    } catch (const ValidationError& e) {
        std::fprintf(stderr, "actiscope_analyze: invalid input: %s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "actiscope_analyze: error: %s\n", e.what());
        return 1;
    }
}
