#pragma once

#include "actiscope/ActivityTypes.h"
#include "actiscope/CoreContract.h"

#include <cstddef>
#include <vector>

namespace actiscope {

/**
 * MetricsEngine: reduce a run of samples to an ActivityMetrics tuple
 *
 * Per-sample intensity I = clamp01(|mag - 1g| / 1.5g).
 *   avgIntensity        = mean(I)
 *   peakIntensity       = max(I)
 *   movementConsistency = 1 / (1 + CV of per-second mean intensity)
 *   activeMinutes       = time between consecutive samples whose later
 *                         sample has I > activityThreshold, in minutes
 *   totalDuration       = last.timestamp - first.timestamp (seconds)
 *
 * An empty run yields all-zero metrics.
 */
class MetricsEngine {
  public:
    MetricsEngine() = default;
    explicit MetricsEngine(double activityThreshold) : activityThreshold_(activityThreshold) {}

    ActivityMetrics compute(const std::vector<Sample>& samples, int samplingRateHz) const;

    // Samples [first, last) of `samples`.
    ActivityMetrics compute_range(const std::vector<Sample>& samples,
                                  std::size_t first,
                                  std::size_t last,
                                  int samplingRateHz) const;

    double activity_threshold() const { return activityThreshold_; }

  private:
    double activityThreshold_{contract::DEFAULT_ACTIVITY_THRESHOLD};
};

}  // namespace actiscope
