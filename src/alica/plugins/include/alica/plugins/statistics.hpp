#pragma once

#include <vector>

namespace alica::plugins {

//! Arithmetic mean. NaN for an empty sample.
double mean(const std::vector<double>& values);

//! Population variance. 0 for fewer than two values.
double variance(const std::vector<double>& values);

double stddev(const std::vector<double>& values);

//! Median. Mean of the two middle values for an even sample size, NaN for an empty sample.
double median(std::vector<double> values);

} // namespace alica::plugins
