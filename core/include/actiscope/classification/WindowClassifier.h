#pragma once

#include "../ActivityTypes.h"

#include <functional>
#include <vector>

namespace actiscope {
namespace classification {

/**
 * WindowClassifier: fixed rule table over (mean_mag, var_x, var_y, var_z)
 *
 * Rules are evaluated top-down; the first rule whose predicate holds decides
 * the label and its confidence. A feature vector matching no rule is
 * Unknown with confidence 0.5.
 */
class WindowClassifier {
public:
    struct Rule {
        std::function<bool(const FeatureVector&)> matches;
        ActivityType type{ActivityType::Unknown};
        double confidence{0.0};
    };

    WindowClassifier();

    WindowLabel classify(const FeatureVector& features) const;

    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Rule> rules_;
};

}  // namespace classification
}  // namespace actiscope
