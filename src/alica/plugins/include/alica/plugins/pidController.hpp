#pragma once

#include "alica/core/controller.hpp"

#include <optional>

namespace alica::plugins {

//! PID gains and output range.
struct PidConfig {
	double kp{1.0};
	double ki{0.0};          //!< Per second.
	double kd{0.0};          //!< Seconds.
	double outputMin{0.0};   //!< Lower output bound, usually the minimal laser power.
	double outputMax{100.0}; //!< Upper output bound, usually the maximal laser power.
};

//! \throws ConfigurationError naming the first violated constraint.
void validate(const PidConfig& config);

/*! PID controller on the real time between two signal values.
 *  error = setpoint - signal. The integral is clamped so its contribution alone stays inside the output range (anti-windup).
 */
class PidController : public core::Controller {
public:
	//! \throws ConfigurationError if the configuration is invalid.
	explicit PidController(PidConfig config = {}, double setpoint = 0.0);

	//! \throws ControllerError if the signal is not finite.
	void nextValue(double signal, std::int64_t timestampMs) override;
	double getCurrentOutput() const override { return m_output; }

	void setSetpoint(double value) override { m_setpoint = value; }
	double getSetpoint() const override { return m_setpoint; }

	void reset() override; //!< Forget the integral and derivative history.

	std::string getName() const override { return "PidController"; }

private:
	const PidConfig m_config;
	double m_setpoint;
	double m_output;

	double m_integral{0.0};
	std::optional<double> m_lastError{};
	std::optional<std::int64_t> m_lastTimestampMs{};
};

} // namespace alica::plugins
