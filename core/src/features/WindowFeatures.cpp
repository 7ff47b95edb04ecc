#include "actiscope/features/WindowFeatures.h"
#include "actiscope/CoreContract.h"
#include "actiscope/Normalization.h"

#include <stdexcept>
#include <string>

namespace actiscope {
namespace features {

std::size_t WindowFeatureExtractor::windowCount(const std::vector<Sample>& samples) const {
    const std::size_t N = samples.size();
    const std::size_t W = contract::effective_window_size(N);
    if (W == 0 || N < W) return 0;
    const std::size_t H = contract::window_hop(W);
    return (N - W) / H + 1;
}

FeatureVector WindowFeatureExtractor::extractWindow(const std::vector<Sample>& samples,
                                                    std::size_t index) const {
    if (index >= windowCount(samples)) {
        throw std::out_of_range("window index " + std::to_string(index) + " out of range");
    }

    const std::size_t W = contract::effective_window_size(samples.size());
    const std::size_t first = index * contract::window_hop(W);

    std::vector<double> xs, ys, zs, mags;
    xs.reserve(W);
    ys.reserve(W);
    zs.reserve(W);
    mags.reserve(W);
    for (std::size_t k = first; k < first + W; ++k) {
        const Sample& s = samples[k];
        xs.push_back(s.x);
        ys.push_back(s.y);
        zs.push_back(s.z);
        mags.push_back(magnitude(s));
    }

    FeatureVector f;
    f.meanX = mean(xs);
    f.meanY = mean(ys);
    f.meanZ = mean(zs);
    f.varX = variance(xs);
    f.varY = variance(ys);
    f.varZ = variance(zs);
    f.meanMagnitude = mean(mags);
    f.startTime = samples[first].timestamp;
    f.endTime = samples[first + W - 1].timestamp;
    f.firstSample = first;
    f.sampleCount = W;
    return f;
}

std::vector<FeatureVector> WindowFeatureExtractor::extract(const std::vector<Sample>& samples) const {
    std::vector<FeatureVector> out;
    const std::size_t count = windowCount(samples);
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(extractWindow(samples, i));
    }
    return out;
}

}  // namespace features
}  // namespace actiscope
