#include "actiscope/features/WindowFeatures.h"
#include "Fixtures.h"
#include "TestSupport.h"

#include <stdexcept>
#include <vector>

using namespace actiscope;
using namespace actiscope_test;

// window layout (count, hop, trailing drop) and per-window statistics

int main() {
    features::WindowFeatureExtractor fx;

    // test 1 empty batch has no windows
    std::vector<Sample> empty;
    check("empty.windowCount", fx.windowCount(empty) == 0);
    check("empty.extract", fx.extract(empty).empty());

    // test 2 45 samples: W=20, hop=10 -> windows at 0,10,20; samples 40..44 dropped
    const auto s45 = constant_signal(45, 0.0, 0.0, 1.0);
    const auto w45 = fx.extract(s45);
    check("45.windowCount", w45.size() == 3);
    check("45.firstSample", w45.size() == 3 && w45[0].firstSample == 0 && w45[1].firstSample == 10 &&
                                w45[2].firstSample == 20);
    check_near("45.lastWindow.start", w45.back().startTime, 20.0);
    check_near("45.lastWindow.end", w45.back().endTime, 39.0);
    check("45.sampleCount", w45.back().sampleCount == 20);

    // test 3 exactly one window worth of samples
    check("20.windowCount", fx.windowCount(constant_signal(20, 0, 0, 1)) == 1);
    check("30.windowCount", fx.windowCount(constant_signal(30, 0, 0, 1)) == 2);

    // test 4 short batch shrinks the window to the batch length
    const auto w7 = fx.extract(constant_signal(7, 0.0, 0.0, 1.0));
    check("7.windowCount", w7.size() == 1);
    check("7.sampleCount", !w7.empty() && w7[0].sampleCount == 7);
    check_near("7.end", w7.empty() ? -1.0 : w7[0].endTime, 6.0);

    // test 5 single sample: one window of one sample
    const auto w1 = fx.extract(constant_signal(1, 0.0, 0.0, 1.0));
    check("1.windowCount", w1.size() == 1);

    // test 6 mean / population variance / magnitude
    // x = 1,2,3,4 -> mean 2.5, var 1.25; (0,3,4) has magnitude 5
    std::vector<Sample> data = {
        {0.0, 1.0, 3.0, 4.0},
        {0.5, 2.0, 3.0, 4.0},
        {1.0, 3.0, 3.0, 4.0},
        {1.5, 4.0, 3.0, 4.0},
    };
    const FeatureVector f = fx.extractWindow(data, 0);
    check_near("stats.meanX", f.meanX, 2.5);
    check_near("stats.varX", f.varX, 1.25);
    check_near("stats.meanY", f.meanY, 3.0);
    check_near("stats.varY", f.varY, 0.0);
    check_near("stats.varZ", f.varZ, 0.0);
    // magnitudes sqrt(26), sqrt(29), sqrt(34), sqrt(41)
    const double wantMag = (std::sqrt(26.0) + std::sqrt(29.0) + std::sqrt(34.0) + std::sqrt(41.0)) / 4.0;
    check_near("stats.meanMagnitude", f.meanMagnitude, wantMag);
    check_near("stats.startTime", f.startTime, 0.0);
    check_near("stats.endTime", f.endTime, 1.5);

    const FeatureVector g = fx.extractWindow(constant_signal(4, 0.0, 3.0, 4.0), 0);
    check_near("stats.constantMagnitude", g.meanMagnitude, 5.0);

    // test 7 out of range window index
    check_throws<std::out_of_range>("extractWindow.outOfRange", [&] { fx.extractWindow(data, 1); });

    // test 8 deterministic
    const auto again = fx.extract(s45);
    bool same = again.size() == w45.size();
    for (std::size_t i = 0; same && i < again.size(); ++i) {
        same = again[i].meanMagnitude == w45[i].meanMagnitude && again[i].varZ == w45[i].varZ;
    }
    check("extract.deterministic", same);

    return finish();
}
