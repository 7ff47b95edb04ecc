#pragma once

#include "../ActivityTypes.h"
#include "../MetricsEngine.h"
#include "../classification/WindowClassifier.h"
#include "../features/WindowFeatures.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace actiscope {
namespace segmentation {

/**
 * ActivitySegmenter: merge consecutive same-label windows into segments
 *
 * States: no open segment / open segment(label, start).
 *
 * For each window (in time order) the classifier label is compared with the
 * open segment:
 *   - same label: the window is absorbed.
 *   - different label (or nothing open): the open segment, if any, is closed
 *     at the current window's startTime. Its metrics cover the samples with
 *     timestamp in [segment start, window startTime] and its confidence is
 *     the confidence of the window that forced the boundary. A new segment
 *     opens at the window's startTime.
 * After the last window the open segment is closed at that window's endTime
 * with contract::FINAL_SEGMENT_CONFIDENCE.
 *
 * No windows => no segments.
 */
class ActivitySegmenter {
public:
    ActivitySegmenter() = default;
    explicit ActivitySegmenter(MetricsEngine metrics) : metrics_(metrics) {}

    /**
     * Extract windows from the batch and segment them
     * @param batch Batch with non-decreasing sample timestamps
     * @return Segments in time order
     */
    std::vector<ActivitySegment> segment(const AccelerationBatch& batch) const;

    /**
     * Segment pre-computed windows of the batch
     * @param batch Batch the windows were extracted from (for segment metrics)
     * @param windows Feature vectors in time order
     */
    std::vector<ActivitySegment> segment(const AccelerationBatch& batch,
                                         const std::vector<FeatureVector>& windows) const;

private:
    struct OpenSegment {
        ActivityType type{ActivityType::Unknown};
        double startTime{0.0};
    };

    ActivitySegment closeSegment(const AccelerationBatch& batch,
                                 const OpenSegment& open,
                                 double endTime,
                                 double confidence) const;

    features::WindowFeatureExtractor extractor_;
    classification::WindowClassifier classifier_;
    MetricsEngine metrics_;
};

}  // namespace segmentation
}  // namespace actiscope
