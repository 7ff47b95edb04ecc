#include "actiscope/classification/WindowClassifier.h"
#include "actiscope/CoreContract.h"

namespace actiscope {
namespace classification {

namespace {

using namespace contract;

bool all_axes_below(const FeatureVector& f, double limit) {
    return f.varX < limit && f.varY < limit && f.varZ < limit;
}

double var_sum(const FeatureVector& f) {
    return f.varX + f.varY + f.varZ;
}

bool open_interval(double v, double lo, double hi) {
    return lo < v && v < hi;
}

} // namespace

WindowClassifier::WindowClassifier() {
    rules_ = {
        {[](const FeatureVector& f) {
             return f.meanMagnitude < REST_MAG_MAX && all_axes_below(f, STANDING_VAR_MAX);
         },
         ActivityType::Standing, CONFIDENCE_STANDING},
        {[](const FeatureVector& f) {
             return f.meanMagnitude < REST_MAG_MAX && all_axes_below(f, SITTING_VAR_MAX);
         },
         ActivityType::Sitting, CONFIDENCE_SITTING},
        {[](const FeatureVector& f) {
             return f.meanMagnitude < REST_MAG_MAX && all_axes_below(f, LYING_VAR_MAX);
         },
         ActivityType::Lying, CONFIDENCE_LYING},
        {[](const FeatureVector& f) {
             return open_interval(f.meanMagnitude, WALKING_MAG_MIN, WALKING_MAG_MAX) &&
                    open_interval(var_sum(f), WALKING_VAR_SUM_MIN, WALKING_VAR_SUM_MAX);
         },
         ActivityType::Walking, CONFIDENCE_WALKING},
        {[](const FeatureVector& f) {
             return f.meanMagnitude > RUNNING_MAG_MIN && var_sum(f) > RUNNING_VAR_SUM_MIN;
         },
         ActivityType::Running, CONFIDENCE_RUNNING},
        {[](const FeatureVector& f) {
             return open_interval(f.meanMagnitude, CYCLING_MAG_MIN, CYCLING_MAG_MAX) &&
                    open_interval(f.varX, CYCLING_VAR_MIN, CYCLING_VAR_MAX) &&
                    open_interval(f.varY, CYCLING_VAR_MIN, CYCLING_VAR_MAX);
         },
         ActivityType::Cycling, CONFIDENCE_CYCLING},
    };
}

WindowLabel WindowClassifier::classify(const FeatureVector& features) const {
    for (const auto& rule : rules_) {
        if (rule.matches(features)) {
            return WindowLabel{rule.type, rule.confidence};
        }
    }
    return WindowLabel{ActivityType::Unknown, CONFIDENCE_UNKNOWN};
}

}  // namespace classification
}  // namespace actiscope
