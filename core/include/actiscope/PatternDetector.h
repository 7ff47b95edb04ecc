#pragma once

#include "actiscope/ActivityTypes.h"

#include <vector>

namespace actiscope {

double segment_duration_seconds(const ActivitySegment& segment);

/**
 * Label with the largest summed segment duration.
 *
 * Ties go to the label whose running total reached the maximum first when
 * walking the segments in order (labels are ranked by first appearance and
 * a later label must be strictly longer to win). No segments => Unknown.
 */
ActivityType select_dominant_activity(const std::vector<ActivitySegment>& segments);

/**
 * PatternDetector: sedentary / active / mixed groupings over a segment timeline
 *
 * Checks are independent and emitted in that order. Pattern members are
 * indices into the input vector; a segment may belong to several patterns.
 */
class PatternDetector {
  public:
    std::vector<ActivityPattern> detect(const std::vector<ActivitySegment>& segments) const;
};

}  // namespace actiscope
