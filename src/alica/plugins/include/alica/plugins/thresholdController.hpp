#pragma once

#include "alica/core/controller.hpp"

namespace alica::plugins {

//! Two-level (bang-bang) controller. Outputs high while the signal is below the setpoint, low otherwise.
class ThresholdController : public core::Controller {
public:
	ThresholdController(double low, double high, double setpoint = 0.0);

	//! \throws ControllerError if the signal is not finite.
	void nextValue(double signal, std::int64_t timestampMs) override;
	double getCurrentOutput() const override { return m_output; }

	void setSetpoint(double value) override { m_setpoint = value; }
	double getSetpoint() const override { return m_setpoint; }

	void reset() override { m_output = m_low; }

	std::string getName() const override { return "ThresholdController"; }

private:
	const double m_low;
	const double m_high;
	double m_setpoint;
	double m_output;
};

} // namespace alica::plugins
