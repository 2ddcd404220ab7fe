#pragma once

#include <cstdint>
#include <string>

namespace alica::core {

/*! Control law mapping the analyzer signal to an actuator setpoint.
 *  Two-step protocol: nextValue() advances the internal state, getCurrentOutput() reads the result without recomputation.
 *  Implementations are not required to be thread-safe. The ControlLoop serialises every call through its own lock.
 */
class Controller {
public:
	virtual ~Controller() = default;

	//! Feed the next signal value.
	//! \throws ControllerError if no output can be computed.
	virtual void nextValue(double signal, std::int64_t timestampMs) = 0;

	virtual double getCurrentOutput() const = 0;

	virtual void setSetpoint(double value) = 0; //!< Target value of the analyzer signal.
	virtual double getSetpoint() const     = 0;

	//! Drop the history of previous signals. Called before every run, the setpoint is kept.
	virtual void reset() = 0;

	virtual std::string getName() const = 0;
};

} // namespace alica::core
