#pragma once

#include "alica/core/controller.hpp"

namespace alica::plugins {

//! Open loop. The output is the setpoint, the signal is ignored.
class ManualController : public core::Controller {
public:
	explicit ManualController(double setpoint = 0.0) : m_setpoint(setpoint) {}

	void nextValue(double /*signal*/, std::int64_t /*timestampMs*/) override {}
	double getCurrentOutput() const override { return m_setpoint; }

	void setSetpoint(double value) override { m_setpoint = value; }
	double getSetpoint() const override { return m_setpoint; }

	void reset() override {}

	std::string getName() const override { return "ManualController"; }

private:
	double m_setpoint;
};

} // namespace alica::plugins
