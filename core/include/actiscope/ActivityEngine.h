#pragma once

#include "actiscope/EngineConfig.h"
#include "actiscope/MetricsEngine.h"
#include "actiscope/PatternDetector.h"
#include "actiscope/SQLiteStore.h"
#include "actiscope/features/WindowFeatures.h"
#include "actiscope/segmentation/ActivitySegmenter.h"

#include <memory>
#include <string>
#include <vector>

namespace actiscope {

/**
 * Check the batch invariants the pipeline relies on.
 * @throws ValidationError on non-positive sampling rate, non-finite values,
 *         or decreasing timestamps. An empty batch is valid.
 */
void validate_batch(const AccelerationBatch& batch);

/**
 * ActivityEngine: complete activity inference pipeline
 *
 * Orchestrates: Windows → Labels → Segments → {Dominant activity, Metrics, Patterns} → Storage
 *
 * Holds no per-call state; recognize/compute_metrics may run concurrently on
 * one engine. recognize_and_store shares one SQLite connection and must not.
 */
class ActivityEngine {
  public:
    ActivityEngine();
    explicit ActivityEngine(const EngineConfig& config);

    /**
     * Analyze a batch
     * @param request Batch plus output switches
     * @return Result with status "success"
     */
    RecognitionResult recognize(const RecognitionRequest& request) const;

    RecognitionResult recognize(const AccelerationBatch& batch, bool includePatterns) const;

    /**
     * Analyze and persist
     * @throws std::logic_error if the engine has no database configured
     */
    RecognitionResult recognize_and_store(const RecognitionRequest& request);

    ActivityMetrics compute_metrics(const AccelerationBatch& batch) const;

    static std::vector<ActivityType> list_supported_labels();

    const EngineConfig& config() const { return config_; }

  private:
    RecognitionResult run(const AccelerationBatch& batch, bool includeMetrics, bool includePatterns) const;

    EngineConfig config_;

    features::WindowFeatureExtractor extractor_;
    MetricsEngine metricsEngine_;
    segmentation::ActivitySegmenter segmenter_;
    PatternDetector patternDetector_;

    // Storage
    std::unique_ptr<SQLiteStore> store_;
};

}  // namespace actiscope
