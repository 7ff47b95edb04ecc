#include "actiscope/segmentation/ActivitySegmenter.h"
#include "actiscope/CoreContract.h"

#include <algorithm>
#include <utility>

namespace actiscope {
namespace segmentation {

namespace {

// [first, last) indices of samples with startTime <= timestamp <= endTime.
// Relies on non-decreasing timestamps.
std::pair<std::size_t, std::size_t> sample_range(const std::vector<Sample>& samples,
                                                 double startTime,
                                                 double endTime) {
    const auto lo = std::lower_bound(samples.begin(), samples.end(), startTime,
                                     [](const Sample& s, double t) { return s.timestamp < t; });
    const auto hi = std::upper_bound(lo, samples.end(), endTime,
                                     [](double t, const Sample& s) { return t < s.timestamp; });
    return {static_cast<std::size_t>(lo - samples.begin()), static_cast<std::size_t>(hi - samples.begin())};
}

} // namespace

std::vector<ActivitySegment> ActivitySegmenter::segment(const AccelerationBatch& batch) const {
    return segment(batch, extractor_.extract(batch.samples));
}

std::vector<ActivitySegment> ActivitySegmenter::segment(const AccelerationBatch& batch,
                                                        const std::vector<FeatureVector>& windows) const {
    std::vector<ActivitySegment> segments;
    if (windows.empty()) return segments;

    std::optional<OpenSegment> open;
    for (const auto& window : windows) {
        const WindowLabel label = classifier_.classify(window);
        if (open && open->type == label.type) continue;

        if (open) {
            segments.push_back(closeSegment(batch, *open, window.startTime, label.confidence));
        }
        open = OpenSegment{label.type, window.startTime};
    }

    segments.push_back(closeSegment(batch, *open, windows.back().endTime,
                                    contract::FINAL_SEGMENT_CONFIDENCE));
    return segments;
}

ActivitySegment ActivitySegmenter::closeSegment(const AccelerationBatch& batch,
                                                const OpenSegment& open,
                                                double endTime,
                                                double confidence) const {
    const auto [first, last] = sample_range(batch.samples, open.startTime, endTime);

    ActivitySegment seg;
    seg.startTime = open.startTime;
    seg.endTime = endTime;
    seg.type = open.type;
    seg.confidence = confidence;
    seg.metrics = metrics_.compute_range(batch.samples, first, last, batch.samplingRateHz);
    return seg;
}

}  // namespace segmentation
}  // namespace actiscope
