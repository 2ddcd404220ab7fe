#include "alica/plugins/thresholdController.hpp"

#include "alica/core/errors.hpp"

#include <cmath>
#include <format>

namespace alica::plugins {

ThresholdController::ThresholdController(const double low, const double high, const double setpoint)
    : m_low(low), m_high(high), m_setpoint(setpoint), m_output(low) {
	if (!std::isfinite(low) || !std::isfinite(high)) {
		throw core::ConfigurationError(std::format("Threshold controller levels must be finite, got {} and {}.", low, high));
	}
}

void ThresholdController::nextValue(const double signal, std::int64_t /*timestampMs*/) {
	if (!std::isfinite(signal)) {
		throw core::ControllerError(std::format("Signal {} is not finite.", signal));
	}
	m_output = signal < m_setpoint ? m_high : m_low;
}

} // namespace alica::plugins
