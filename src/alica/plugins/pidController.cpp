#include "alica/plugins/pidController.hpp"

#include "alica/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace alica::plugins {

void validate(const PidConfig& config) {
	if (!std::isfinite(config.kp) || !std::isfinite(config.ki) || !std::isfinite(config.kd)) {
		throw core::ConfigurationError("PID gains must be finite.");
	}
	if (!std::isfinite(config.outputMin) || !std::isfinite(config.outputMax) || config.outputMin > config.outputMax) {
		throw core::ConfigurationError(std::format("Invalid PID output range [{}, {}].", config.outputMin, config.outputMax));
	}
}

PidController::PidController(const PidConfig config, const double setpoint) : m_config(config), m_setpoint(setpoint), m_output(config.outputMin) {
	validate(m_config);
}

void PidController::nextValue(const double signal, const std::int64_t timestampMs) {
	if (!std::isfinite(signal)) {
		throw core::ControllerError(std::format("Signal {} is not finite.", signal));
	}

	const double error = m_setpoint - signal;
	const double dt    = m_lastTimestampMs ? static_cast<double>(timestampMs - *m_lastTimestampMs) / 1000.0 : 0.0;

	double derivative = 0.0;
	if (dt > 0.0) {
		m_integral += error * dt;
		if (m_config.ki != 0.0) {
			const double bound1 = m_config.outputMin / m_config.ki;
			const double bound2 = m_config.outputMax / m_config.ki;
			m_integral          = std::clamp(m_integral, std::min(bound1, bound2), std::max(bound1, bound2));
		}
		if (m_lastError) {
			derivative = (error - *m_lastError) / dt;
		}
	}

	const double output = m_config.kp * error + m_config.ki * m_integral + m_config.kd * derivative;
	m_output            = std::clamp(output, m_config.outputMin, m_config.outputMax);
	m_lastError         = error;
	m_lastTimestampMs   = timestampMs;
}

void PidController::reset() {
	m_integral = 0.0;
	m_output   = m_config.outputMin;
	m_lastError.reset();
	m_lastTimestampMs.reset();
}

} // namespace alica::plugins
