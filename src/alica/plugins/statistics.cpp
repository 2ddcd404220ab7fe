#include "alica/plugins/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>

namespace alica::plugins {

double mean(const std::vector<double>& values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values) {
	if (values.size() < 2) {
		return 0.0;
	}

	const double m = mean(values);
	double sum     = 0.0;
	for (const double x: values) {
		sum += (x - m) * (x - m);
	}
	return sum / static_cast<double>(values.size());
}

double stddev(const std::vector<double>& values) {
	return std::sqrt(variance(values));
}

double median(std::vector<double> values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}

	const std::size_t n = values.size();
	const auto mid      = static_cast<std::ptrdiff_t>(n / 2);
	std::nth_element(values.begin(), values.begin() + mid, values.end());
	const double upper = values[n / 2];
	if (n % 2 != 0) {
		return upper;
	}

	// Lower middle value is the largest element of the left partition.
	const double lower = *std::max_element(values.begin(), values.begin() + mid);
	return 0.5 * (lower + upper);
}

} // namespace alica::plugins
