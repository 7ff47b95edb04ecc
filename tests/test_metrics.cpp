#include "actiscope/MetricsEngine.h"
#include "Fixtures.h"
#include "TestSupport.h"

using namespace actiscope;
using namespace actiscope_test;

// intensity normalisation, consistency, active minutes and bounds

namespace {

bool within_bounds(const ActivityMetrics& m) {
    return m.avgIntensity >= 0.0 && m.avgIntensity <= 1.0 && m.peakIntensity >= 0.0 && m.peakIntensity <= 1.0 &&
           m.movementConsistency >= 0.0 && m.movementConsistency <= 1.0 && m.activeMinutes >= 0.0 &&
           m.totalDuration >= 0.0;
}

} // namespace

int main() {
    MetricsEngine engine;

    // test 1 empty -> zero metric
    const ActivityMetrics zero = engine.compute({}, 50);
    check_near("empty.avg", zero.avgIntensity, 0.0);
    check_near("empty.peak", zero.peakIntensity, 0.0);
    check_near("empty.consistency", zero.movementConsistency, 0.0);
    check_near("empty.active", zero.activeMinutes, 0.0);
    check_near("empty.duration", zero.totalDuration, 0.0);

    // test 2 one sample: no duration
    const ActivityMetrics one = engine.compute(constant_signal(1, 0.0, 0.0, 2.0), 50);
    check_near("single.duration", one.totalDuration, 0.0);
    check_near("single.active", one.activeMinutes, 0.0);
    check_near("single.avg", one.avgIntensity, 2.0 / 3.0);

    // test 3 saturated signal: |2.5 - 1| / 1.5 = 1
    const ActivityMetrics sat = engine.compute(constant_signal(4, 0.0, 0.0, 2.5, 0.0, 0.5), 2);
    check_near("saturated.avg", sat.avgIntensity, 1.0);
    check_near("saturated.peak", sat.peakIntensity, 1.0);
    check_near("saturated.consistency", sat.movementConsistency, 1.0);
    check_near("saturated.active", sat.activeMinutes, 1.5 / 60.0);
    check_near("saturated.duration", sat.totalDuration, 1.5);

    // beyond full scale is clamped
    const ActivityMetrics over = engine.compute(constant_signal(3, 0.0, 0.0, 6.0), 1);
    check_near("clamped.peak", over.peakIntensity, 1.0);

    // free fall reads 0 g: dynamic component 1 g
    const ActivityMetrics fall = engine.compute(constant_signal(3, 0.0, 0.0, 0.0), 1);
    check_near("freefall.avg", fall.avgIntensity, 1.0 / 1.5);

    // test 4 at rest there is no intensity and full consistency
    const ActivityMetrics rest = engine.compute(constant_signal(10, 0.0, 0.0, 1.0), 1);
    check_near("rest.avg", rest.avgIntensity, 0.0);
    check_near("rest.consistency", rest.movementConsistency, 1.0);
    check_near("rest.duration", rest.totalDuration, 9.0);

    // test 5 consistency over 1 s blocks at 2 Hz
    // blocks: [0,0] [2/3,2/3] -> means 0 and 2/3, cv = 1 -> consistency 0.5
    {
        auto s = concat(constant_signal(2, 0.0, 0.0, 1.0, 0.0, 0.5), constant_signal(2, 0.0, 0.0, 2.0, 1.0, 0.5));
        const ActivityMetrics m = engine.compute(s, 2);
        check_near("blocks.consistency", m.movementConsistency, 0.5);
        // only the two intervals ending on a moving sample count
        check_near("blocks.active", m.activeMinutes, 1.0 / 60.0);
    }

    // test 6 activity threshold is configurable
    {
        MetricsEngine strict(0.9);
        const ActivityMetrics m = strict.compute(constant_signal(5, 0.0, 0.0, 2.0), 1);
        check_near("threshold.strict.active", m.activeMinutes, 0.0);
        check_near("threshold.default.active", engine.compute(constant_signal(5, 0.0, 0.0, 2.0), 1).activeMinutes,
                   4.0 / 60.0);
        check_near("threshold.value", strict.activity_threshold(), 0.9);
    }

    // test 7 compute_range covers [first, last)
    {
        const auto s = concat(constant_signal(5, 0.0, 0.0, 1.0), constant_signal(5, 0.0, 0.0, 2.0, 5.0));
        const ActivityMetrics m = engine.compute_range(s, 5, 10, 1);
        check_near("range.avg", m.avgIntensity, 2.0 / 3.0);
        check_near("range.duration", m.totalDuration, 4.0);
        check_near("range.emptyRange", engine.compute_range(s, 3, 3, 1).totalDuration, 0.0);
    }

    // test 8 near-stationary signal stays low, everything in bounds
    const ActivityMetrics still = engine.compute(still_signal(30, 50), 50);
    check("still.avg<0.3", still.avgIntensity < 0.3);
    check("still.peak<0.5", still.peakIntensity < 0.5);
    check("still.bounds", within_bounds(still));

    const ActivityMetrics run = engine.compute(running_signal(30, 50), 50);
    check("running.bounds", within_bounds(run));
    check("running.moreIntense", run.avgIntensity > still.avgIntensity && run.peakIntensity > still.peakIntensity);
    check("running.active>0", run.activeMinutes > 0.0);
    check("running.active<=duration", run.activeMinutes * 60.0 <= run.totalDuration + 1e-9);

    check("gait.bounds", within_bounds(engine.compute(gait_signal(30, 50), 50)));
    check("stepping.bounds", within_bounds(engine.compute(stepping_signal(20, 50), 50)));

    return finish();
}
