#include "actiscope/Normalization.h"
#include "actiscope/CoreContract.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace actiscope {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double variance(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const double m = mean(v);
    double acc = 0.0;
    for (double x : v) acc += (x - m) * (x - m);
    return acc / static_cast<double>(v.size());
}

double stddev(const std::vector<double>& v) {
    return std::sqrt(variance(v));
}

double magnitude(const Sample& s) {
    return std::sqrt(s.x * s.x + s.y * s.y + s.z * s.z);
}

double intensity01(const Sample& s) {
    const double dynamic = std::abs(magnitude(s) - contract::GRAVITY_G);
    return clamp01(dynamic / contract::INTENSITY_FULL_SCALE_G);
}

std::vector<double> block_means(const std::vector<double>& x, std::size_t block) {
    if (x.empty()) return {};
    if (block <= 1) return x;
    std::vector<double> out;
    out.reserve(x.size() / block + 1);
    for (std::size_t a = 0; a < x.size(); a += block) {
        const std::size_t b = std::min(x.size(), a + block);
        double acc = 0.0;
        for (std::size_t j = a; j < b; ++j) acc += x[j];
        out.push_back(acc / static_cast<double>(b - a));
    }
    return out;
}

} // namespace actiscope
