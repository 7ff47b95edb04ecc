#include "actiscope/PatternDetector.h"
#include "actiscope/CoreContract.h"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <set>
#include <utility>

namespace {

using actiscope::ActivityPattern;
using actiscope::ActivitySegment;
using actiscope::ActivityType;

bool is_one_of(ActivityType t, std::initializer_list<ActivityType> types) {
    return std::find(types.begin(), types.end(), t) != types.end();
}

double total_minutes(const std::vector<ActivitySegment>& segments, const std::vector<std::size_t>& indices) {
    double seconds = 0.0;
    for (std::size_t i : indices) seconds += actiscope::segment_duration_seconds(segments[i]);
    return seconds / 60.0;
}

std::optional<ActivityPattern> duration_pattern(const std::vector<ActivitySegment>& segments,
                                                std::initializer_list<ActivityType> types,
                                                double minMinutes,
                                                const char* patternType,
                                                const char* description) {
    std::vector<std::size_t> members;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (is_one_of(segments[i].type, types)) members.push_back(i);
    }
    if (members.empty()) return std::nullopt;

    const double minutes = total_minutes(segments, members);
    if (!(minutes > minMinutes)) return std::nullopt;

    ActivityPattern p;
    p.patternType = patternType;
    p.description = description;
    p.totalDuration = minutes;
    p.segmentIndices = std::move(members);
    return p;
}

} // namespace

namespace actiscope {

double segment_duration_seconds(const ActivitySegment& segment) {
    return segment.endTime - segment.startTime;
}

ActivityType select_dominant_activity(const std::vector<ActivitySegment>& segments) {
    if (segments.empty()) return ActivityType::Unknown;

    // Totals in first-appearance order.
    std::vector<std::pair<ActivityType, double>> totals;
    for (const auto& s : segments) {
        auto it = std::find_if(totals.begin(), totals.end(),
                               [&](const auto& entry) { return entry.first == s.type; });
        if (it == totals.end()) {
            totals.emplace_back(s.type, segment_duration_seconds(s));
        } else {
            it->second += segment_duration_seconds(s);
        }
    }

    auto best = totals.begin();
    for (auto it = totals.begin(); it != totals.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return best->first;
}

std::vector<ActivityPattern> PatternDetector::detect(const std::vector<ActivitySegment>& segments) const {
    std::vector<ActivityPattern> patterns;
    if (segments.empty()) return patterns;

    if (auto p = duration_pattern(segments,
                                  {ActivityType::Sitting, ActivityType::Standing, ActivityType::Lying},
                                  contract::SEDENTARY_MIN_MINUTES,
                                  "sedentary",
                                  "Extended period of low activity")) {
        patterns.push_back(std::move(*p));
    }

    if (auto p = duration_pattern(segments,
                                  {ActivityType::Walking, ActivityType::Running, ActivityType::Cycling},
                                  contract::ACTIVE_MIN_MINUTES,
                                  "active",
                                  "Period of sustained activity")) {
        patterns.push_back(std::move(*p));
    }

    if (segments.size() > contract::MIXED_MIN_SEGMENTS) {
        std::set<ActivityType> distinct;
        for (const auto& s : segments) distinct.insert(s.type);
        if (distinct.size() >= contract::MIXED_MIN_DISTINCT_LABELS) {
            ActivityPattern p;
            p.patternType = "mixed";
            p.description = "Varied activity with multiple transitions";
            p.segmentIndices.resize(segments.size());
            for (std::size_t i = 0; i < segments.size(); ++i) p.segmentIndices[i] = i;
            p.totalDuration = total_minutes(segments, p.segmentIndices);
            patterns.push_back(std::move(p));
        }
    }

    return patterns;
}

}  // namespace actiscope
