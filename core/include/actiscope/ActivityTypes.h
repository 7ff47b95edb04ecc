#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace actiscope {

// ========== Raw Input ==========
struct Sample {
    double timestamp{0.0};   // seconds, non-decreasing along a batch
    double x{0.0};           // g
    double y{0.0};           // g
    double z{0.0};           // g
};

struct AccelerationBatch {
    std::string dataType;                         // e.g. "acceleration"
    std::map<std::string, std::string> deviceInfo;
    int samplingRateHz{0};
    double startTime{0.0};
    std::vector<Sample> samples;
    std::optional<std::map<std::string, std::string>> metadata;
    std::optional<std::string> id;
};

// ========== Window Features ==========
// One per window; consumed immediately by the classifier.
struct FeatureVector {
    double meanX{0.0};
    double meanY{0.0};
    double meanZ{0.0};
    double varX{0.0};                  // population variance
    double varY{0.0};
    double varZ{0.0};
    double meanMagnitude{0.0};         // mean of sqrt(x^2+y^2+z^2)
    double startTime{0.0};             // first sample timestamp in window
    double endTime{0.0};               // last sample timestamp in window
    std::size_t firstSample{0};        // index of first sample in the batch
    std::size_t sampleCount{0};
};

// ========== Activity Labels ==========
// Declaration order is the public listing order.
enum class ActivityType {
    Walking,
    Running,
    Standing,
    Sitting,
    Lying,
    Cycling,
    Unknown
};

struct WindowLabel {
    ActivityType type{ActivityType::Unknown};
    double confidence{0.0};            // [0,1]
};

// ========== Metrics ==========
struct ActivityMetrics {
    double avgIntensity{0.0};          // [0,1]
    double peakIntensity{0.0};         // [0,1]
    double movementConsistency{0.0};   // [0,1]
    double activeMinutes{0.0};         // >= 0
    double totalDuration{0.0};         // seconds, >= 0
};

// ========== Segments / Patterns ==========
struct ActivitySegment {
    double startTime{0.0};
    double endTime{0.0};
    ActivityType type{ActivityType::Unknown};
    double confidence{0.0};
    ActivityMetrics metrics;
};

struct ActivityPattern {
    std::string patternType;                 // "sedentary" / "active" / "mixed"
    std::string description;
    double totalDuration{0.0};               // minutes
    std::vector<std::size_t> segmentIndices; // indices into RecognitionResult::segments
};

// ========== Request / Result ==========
struct RecognitionRequest {
    AccelerationBatch batch;
    bool includeMetrics{true};
    bool includePatterns{true};
    std::string userId;
};

struct RecognitionResult {
    std::string status;                       // "success"
    std::optional<std::string> message;
    std::vector<ActivitySegment> segments;
    std::vector<ActivityPattern> patterns;
    ActivityType dominantActivity{ActivityType::Unknown};
    std::optional<ActivityMetrics> overallMetrics;
};

}  // namespace actiscope
