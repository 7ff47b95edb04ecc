#pragma once
#include <cstddef>
#include <vector>

#include "actiscope/ActivityTypes.h"

namespace actiscope {

// ---------- basic statistics ----------
double mean(const std::vector<double>& v);
double variance(const std::vector<double>& v);   // population variance (divides by N)
double stddev(const std::vector<double>& v);

// ---------- signal helpers ----------
double magnitude(const Sample& s);               // sqrt(x^2+y^2+z^2)

// |magnitude - 1g| scaled by the contract full scale, clamped to [0,1]
double intensity01(const Sample& s);

inline double clamp01(double x) { return (x < 0.0) ? 0.0 : (x > 1.0) ? 1.0 : x; }

// block means over consecutive, non-overlapping blocks (last block may be short)
std::vector<double> block_means(const std::vector<double>& x, std::size_t block);

} // namespace actiscope
