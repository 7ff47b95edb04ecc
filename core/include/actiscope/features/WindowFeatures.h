#pragma once

#include "../ActivityTypes.h"
#include <cstddef>
#include <vector>

namespace actiscope {
namespace features {

/**
 * WindowFeatureExtractor: sliding-window reduction of raw samples
 *
 * Window length W = min(20, N), hop = max(1, W/2) (50% overlap). Only windows that
 * fit entirely inside the batch are produced; the remainder is dropped.
 * An empty batch yields no windows.
 *
 * Windows can be pulled one at a time through windowCount()/extractWindow()
 * or all at once through extract().
 */
class WindowFeatureExtractor {
public:
    WindowFeatureExtractor() = default;

    /**
     * Number of complete windows over the given samples
     */
    std::size_t windowCount(const std::vector<Sample>& samples) const;

    /**
     * Compute the feature vector of window `index`
     * @param samples Ordered samples of the batch
     * @param index Window index in [0, windowCount(samples))
     * @throws std::out_of_range if index is not a valid window
     */
    FeatureVector extractWindow(const std::vector<Sample>& samples, std::size_t index) const;

    /**
     * Feature vectors of every window, in time order
     */
    std::vector<FeatureVector> extract(const std::vector<Sample>& samples) const;
};

}  // namespace features
}  // namespace actiscope
