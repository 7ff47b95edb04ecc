#pragma once

/**
 * CoreContract.h - ActiScope Core System Constants
 *
 * Contract-level constants of the activity inference pipeline. These values
 * define the observable output of the pipeline (segment boundaries, labels,
 * confidences, pattern emission) and should NOT be changed without
 * understanding the implications for:
 *   - Reproducibility of stored recognitions
 *   - Parity between recognitions produced by different versions
 *
 * VERSION: 1.0.0
 */

#include <cstddef>

namespace actiscope {
namespace contract {

// ============================================================================
// Sliding Window Constants
// ============================================================================

/**
 * WINDOW_MAX_SAMPLES - Upper bound of the feature window length
 *
 * Effective window: W = min(WINDOW_MAX_SAMPLES, sample_count)
 * Hop:              H = max(1, W / 2)   (50% overlap)
 *
 * Trailing samples that do not fill a whole window are dropped.
 */
constexpr std::size_t WINDOW_MAX_SAMPLES = 20;

inline std::size_t effective_window_size(std::size_t sampleCount) {
    return (sampleCount < WINDOW_MAX_SAMPLES) ? sampleCount : WINDOW_MAX_SAMPLES;
}

inline std::size_t window_hop(std::size_t windowSize) {
    const std::size_t hop = windowSize / 2;
    return (hop > 0) ? hop : 1;
}

// ============================================================================
// Window Classifier Thresholds
// ============================================================================
// Rules are evaluated top-down, first match wins. Magnitudes in g,
// variances in g^2.

constexpr double REST_MAG_MAX = 1.05;          // still postures: mean_mag < 1.05

constexpr double STANDING_VAR_MAX = 0.01;      // per axis
constexpr double SITTING_VAR_MAX = 0.02;       // per axis
constexpr double LYING_VAR_MAX = 0.05;         // per axis

constexpr double WALKING_MAG_MIN = 1.1;        // open interval (1.1, 1.5)
constexpr double WALKING_MAG_MAX = 1.5;
constexpr double WALKING_VAR_SUM_MIN = 0.05;   // open interval on var_x+var_y+var_z
constexpr double WALKING_VAR_SUM_MAX = 0.3;

constexpr double RUNNING_MAG_MIN = 1.5;        // mean_mag > 1.5
constexpr double RUNNING_VAR_SUM_MIN = 0.3;    // var_x+var_y+var_z > 0.3

constexpr double CYCLING_MAG_MIN = 1.1;        // open interval (1.1, 1.8)
constexpr double CYCLING_MAG_MAX = 1.8;
constexpr double CYCLING_VAR_MIN = 0.1;        // var_x and var_y in (0.1, 0.5)
constexpr double CYCLING_VAR_MAX = 0.5;

constexpr double CONFIDENCE_STANDING = 0.8;
constexpr double CONFIDENCE_SITTING = 0.8;
constexpr double CONFIDENCE_LYING = 0.7;
constexpr double CONFIDENCE_WALKING = 0.9;
constexpr double CONFIDENCE_RUNNING = 0.85;
constexpr double CONFIDENCE_CYCLING = 0.75;
constexpr double CONFIDENCE_UNKNOWN = 0.5;

// ============================================================================
// Segmentation Constants
// ============================================================================

/**
 * FINAL_SEGMENT_CONFIDENCE - Confidence reported for the segment that is
 * still open when the window sequence ends.
 *
 * It replaces the classifier confidence of the last window.
 */
constexpr double FINAL_SEGMENT_CONFIDENCE = 0.7;

// ============================================================================
// Intensity Normalization
// ============================================================================

/**
 * Instantaneous intensity of a sample:
 *
 *   I = clamp01( |sqrt(x^2 + y^2 + z^2) - GRAVITY_G| / INTENSITY_FULL_SCALE_G )
 *
 * A device at rest reads ~1 g and maps to I ~ 0. A dynamic component of
 * 1.5 g or more saturates at I = 1.
 */
constexpr double GRAVITY_G = 1.0;
constexpr double INTENSITY_FULL_SCALE_G = 1.5;

/**
 * DEFAULT_ACTIVITY_THRESHOLD - Intensity above which a sample interval
 * counts towards active_minutes. Overridable through EngineConfig.
 */
constexpr double DEFAULT_ACTIVITY_THRESHOLD = 0.3;

/**
 * Movement consistency: intensities are averaged per block of
 * CONSISTENCY_BLOCK_SECONDS worth of samples, then
 *
 *   C = 1 / (1 + stddev(block_means) / mean(block_means))
 *
 * C = 1 when the signal carries no intensity at all.
 */
constexpr double CONSISTENCY_BLOCK_SECONDS = 1.0;

constexpr double EPS = 1e-9;

// ============================================================================
// Pattern Thresholds
// ============================================================================

constexpr double SEDENTARY_MIN_MINUTES = 30.0;   // strictly greater than
constexpr double ACTIVE_MIN_MINUTES = 10.0;      // strictly greater than
constexpr std::size_t MIXED_MIN_SEGMENTS = 5;    // strictly greater than
constexpr std::size_t MIXED_MIN_DISTINCT_LABELS = 3;

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * CORE_CONTRACT_VERSION - Semantic version of this contract
 *
 * Stored with every recognition written by SQLiteStore.
 */
constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

} // namespace contract
} // namespace actiscope
