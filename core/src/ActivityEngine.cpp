#include "actiscope/ActivityEngine.h"
#include "actiscope/Errors.h"
#include "actiscope/Utility.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace actiscope {

void validate_batch(const AccelerationBatch& batch) {
    if (batch.samplingRateHz <= 0) {
        throw ValidationError("sampling_rate_hz must be positive, got " + std::to_string(batch.samplingRateHz));
    }
    for (std::size_t i = 0; i < batch.samples.size(); ++i) {
        const Sample& s = batch.samples[i];
        if (!std::isfinite(s.timestamp) || !std::isfinite(s.x) || !std::isfinite(s.y) || !std::isfinite(s.z)) {
            throw ValidationError("sample " + std::to_string(i) + " has a non-finite value");
        }
        if (i > 0 && s.timestamp < batch.samples[i - 1].timestamp) {
            throw ValidationError("sample " + std::to_string(i) + " timestamp decreases");
        }
    }
}

ActivityEngine::ActivityEngine() : ActivityEngine(EngineConfig{}) {}

ActivityEngine::ActivityEngine(const EngineConfig& config)
    : config_(config),
      metricsEngine_(config.activityDetectionThreshold),
      segmenter_(metricsEngine_) {
    if (!config_.databasePath.empty()) {
        store_ = std::make_unique<SQLiteStore>(config_.databasePath);
        store_->initialize();
    }
}

RecognitionResult ActivityEngine::recognize(const RecognitionRequest& request) const {
    return run(request.batch, request.includeMetrics, request.includePatterns);
}

RecognitionResult ActivityEngine::recognize(const AccelerationBatch& batch, bool includePatterns) const {
    return run(batch, true, includePatterns);
}

RecognitionResult ActivityEngine::run(const AccelerationBatch& batch, bool includeMetrics, bool includePatterns) const {
    validate_batch(batch);

    RecognitionResult result;
    result.status = "success";

    // Step 1: Overall metrics over the whole batch
    if (includeMetrics) {
        result.overallMetrics = metricsEngine_.compute(batch.samples, batch.samplingRateHz);
    }

    // Step 2: Windows → labels → segments
    const auto windows = extractor_.extract(batch.samples);
    result.segments = segmenter_.segment(batch, windows);

    // Step 3: Dominant activity by summed duration
    result.dominantActivity = select_dominant_activity(result.segments);

    // Step 4: Patterns over the finished timeline
    if (includePatterns) {
        result.patterns = patternDetector_.detect(result.segments);
    }

    return result;
}

RecognitionResult ActivityEngine::recognize_and_store(const RecognitionRequest& request) {
    if (!store_) {
        throw std::logic_error("recognize_and_store: no database configured");
    }
    RecognitionResult result = recognize(request);
    store_->save_recognition(request, result);
    return result;
}

ActivityMetrics ActivityEngine::compute_metrics(const AccelerationBatch& batch) const {
    validate_batch(batch);
    return metricsEngine_.compute(batch.samples, batch.samplingRateHz);
}

std::vector<ActivityType> ActivityEngine::list_supported_labels() {
    return all_activity_types();
}

}  // namespace actiscope
