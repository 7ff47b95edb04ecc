#include "actiscope/MetricsEngine.h"
#include "actiscope/Errors.h"
#include "actiscope/Normalization.h"

#include <algorithm>
#include <cmath>

namespace actiscope {

namespace {

std::size_t consistency_block(int samplingRateHz) {
    const double n = std::round(static_cast<double>(samplingRateHz) * contract::CONSISTENCY_BLOCK_SECONDS);
    return (n >= 1.0) ? static_cast<std::size_t>(n) : 1;
}

void ensure_finite(const ActivityMetrics& m) {
    if (!std::isfinite(m.avgIntensity) || !std::isfinite(m.peakIntensity) ||
        !std::isfinite(m.movementConsistency) || !std::isfinite(m.activeMinutes) ||
        !std::isfinite(m.totalDuration)) {
        throw ComputationError("non-finite activity metric");
    }
}

} // namespace

ActivityMetrics MetricsEngine::compute(const std::vector<Sample>& samples, int samplingRateHz) const {
    return compute_range(samples, 0, samples.size(), samplingRateHz);
}

ActivityMetrics MetricsEngine::compute_range(const std::vector<Sample>& samples,
                                             std::size_t first,
                                             std::size_t last,
                                             int samplingRateHz) const {
    ActivityMetrics m;
    last = std::min(last, samples.size());
    if (first >= last) return m;

    std::vector<double> intensity;
    intensity.reserve(last - first);
    for (std::size_t k = first; k < last; ++k) intensity.push_back(intensity01(samples[k]));

    m.avgIntensity = clamp01(mean(intensity));
    m.peakIntensity = *std::max_element(intensity.begin(), intensity.end());

    const auto blocks = block_means(intensity, consistency_block(samplingRateHz));
    const double blockMean = mean(blocks);
    if (blockMean > contract::EPS) {
        m.movementConsistency = clamp01(1.0 / (1.0 + stddev(blocks) / blockMean));
    } else {
        m.movementConsistency = 1.0;
    }

    double activeSeconds = 0.0;
    for (std::size_t k = first + 1; k < last; ++k) {
        if (intensity[k - first] > activityThreshold_) {
            activeSeconds += std::max(0.0, samples[k].timestamp - samples[k - 1].timestamp);
        }
    }
    m.activeMinutes = activeSeconds / 60.0;
    m.totalDuration = std::max(0.0, samples[last - 1].timestamp - samples[first].timestamp);

    ensure_finite(m);
    return m;
}

}  // namespace actiscope
