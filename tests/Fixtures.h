#pragma once

#include "actiscope/ActivityTypes.h"

#include <cmath>
#include <utility>
#include <vector>

// Synthetic accelerometer signals shared by the test programs.

namespace actiscope_test {

inline actiscope::AccelerationBatch make_batch(std::vector<actiscope::Sample> samples, int rateHz) {
    actiscope::AccelerationBatch batch;
    batch.dataType = "acceleration";
    batch.deviceInfo = {{"device_type", "test"}, {"model", "unit-test"}};
    batch.samplingRateHz = rateHz;
    batch.startTime = samples.empty() ? 0.0 : samples.front().timestamp;
    batch.samples = std::move(samples);
    batch.id = "test-batch";
    return batch;
}

// Device at rest, gravity on z with small quantized jitter.
inline std::vector<actiscope::Sample> still_signal(int seconds, int rateHz, double t0 = 0.0) {
    std::vector<actiscope::Sample> out;
    for (int i = 0; i < seconds * rateHz; ++i) {
        actiscope::Sample s;
        s.timestamp = t0 + static_cast<double>(i) / rateHz;
        s.x = 0.02 * (i % 5) + 0.01 * (i % 3);
        s.y = 0.02 * ((i / 10) % 3) + 0.01 * (i % 2);
        s.z = 1.0 + 0.01 * (i % 7);
        out.push_back(s);
    }
    return out;
}

// Gait: 2 s stride cycle (lateral sway on x) with 2.5 Hz step impacts on y/z.
inline std::vector<actiscope::Sample> gait_signal(int seconds, int rateHz, double t0 = 0.0) {
    const double kPi = 3.14159265358979323846;
    std::vector<actiscope::Sample> out;
    for (int i = 0; i < seconds * rateHz; ++i) {
        const double t = static_cast<double>(i) / rateHz;
        actiscope::Sample s;
        s.timestamp = t0 + t;
        s.x = 0.15 * std::sin(2.0 * kPi * 0.5 * t);
        s.y = 0.25 * std::sin(2.0 * kPi * 2.5 * t + kPi / 2.0);
        s.z = 1.2 + 0.30 * std::sin(2.0 * kPi * 2.5 * t);
        out.push_back(s);
    }
    return out;
}

// Sawtooth-style movement that alternates between walking-like and
// unclassifiable windows.
inline std::vector<actiscope::Sample> stepping_signal(int seconds, int rateHz, double t0 = 0.0) {
    std::vector<actiscope::Sample> out;
    for (int i = 0; i < seconds * rateHz; ++i) {
        const double tf = static_cast<double>(i) / rateHz;
        actiscope::Sample s;
        s.timestamp = t0 + tf;
        s.x = 0.1 * (i % 5) + 0.05 * std::fmod(tf, 2.0);
        s.y = 0.2 * ((i / 10) % 3) + 0.1 * std::fmod(tf, 1.5);
        s.z = 0.9 + 0.05 * (i % 7) + 0.05 * std::fmod(tf, 1.0);
        out.push_back(s);
    }
    return out;
}

// Vigorous movement with large swings on every axis.
inline std::vector<actiscope::Sample> running_signal(int seconds, int rateHz, double t0 = 0.0) {
    std::vector<actiscope::Sample> out;
    for (int i = 0; i < seconds * rateHz; ++i) {
        const double tf = static_cast<double>(i) / rateHz;
        actiscope::Sample s;
        s.timestamp = t0 + tf;
        s.x = 0.3 * (i % 5) + 0.2 * std::fmod(tf, 1.0);
        s.y = 0.4 * ((i / 10) % 3) + 0.3 * std::fmod(tf, 0.8);
        s.z = 0.9 + 0.15 * (i % 7) + 0.1 * std::fmod(tf, 0.5);
        out.push_back(s);
    }
    return out;
}

// n samples of a constant vector, one every dt seconds.
inline std::vector<actiscope::Sample> constant_signal(int n, double x, double y, double z,
                                                     double t0 = 0.0, double dt = 1.0) {
    std::vector<actiscope::Sample> out;
    for (int i = 0; i < n; ++i) out.push_back(actiscope::Sample{t0 + i * dt, x, y, z});
    return out;
}

inline std::vector<actiscope::Sample> concat(std::vector<actiscope::Sample> a,
                                             const std::vector<actiscope::Sample>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

} // namespace actiscope_test
